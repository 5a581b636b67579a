#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace RTE {

namespace {

void setError(std::string *errorOut, const std::string &message) {
    if (errorOut) {
        *errorOut = message;
    }
}

}  // namespace

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.find_first_not_of(" \t\r\n") == std::string::npos) {
        setError(errorOut, "Empty JSON document");
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        setError(errorOut, e.what());
        LOG_DEBUG("JsonUtils: Parse failed at byte {}: {}", e.byte, e.what());
        return std::nullopt;
    }
}

std::optional<json> JsonUtils::parseFile(const std::string &path, std::string *errorOut) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        setError(errorOut, ec ? ec.message() : "not a regular file");
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        setError(errorOut, "cannot open for reading");
        return std::nullopt;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parseJson(text, errorOut);
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    // Replace invalid UTF-8 from runner output instead of throwing on dump
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

const json *JsonUtils::findMember(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    const json *value = findMember(object, key);
    return (value && value->is_string()) ? value->get<std::string>() : defaultValue;
}

}  // namespace RTE
