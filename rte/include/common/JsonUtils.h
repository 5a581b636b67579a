#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace RTE {

using json = nlohmann::json;

/**
 * @brief nlohmann/json helpers shared by the config loader, the case loader and report output
 *
 * Parsing never throws; callers decide how a bad document is reported
 * (ConfigLoader and CaseLoader turn it into a ConfigError).
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON text
     * @param errorOut Receives the parser message on failure
     * @return Parsed value or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Read and parse a whole file
     * @param errorOut Receives "<reason>" for I/O failures or the parser message
     */
    static std::optional<json> parseFile(const std::string &path, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    /**
     * @brief Member of an object, nullptr when absent, null, or when object is not an object
     */
    static const json *findMember(const json &object, const std::string &key);

    static bool hasKey(const json &object, const std::string &key) { return findMember(object, key) != nullptr; }

    /**
     * @brief String member, or defaultValue when absent or not a string
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief JSON type name for diagnostics ("string", "number", "array", ...)
     */
    static std::string typeName(const json &value) { return value.type_name(); }
};

}  // namespace RTE
