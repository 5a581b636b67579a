#include "execution/StepCaptureLoader.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include <algorithm>
#include <system_error>

namespace RTE {

std::vector<StepCapture> StepCaptureLoader::load(const std::filesystem::path &captureDir) {
    std::vector<StepCapture> captures;

    std::error_code ec;
    if (!std::filesystem::is_directory(captureDir, ec)) {
        return captures;
    }

    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(captureDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json" && it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        LOG_WARN("StepCaptureLoader: Listing {} stopped early: {}", captureDir.string(), ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto &file : files) {
        std::string error;
        auto document = JsonUtils::parseFile(file.string(), &error);
        if (!document) {
            LOG_DEBUG("StepCaptureLoader: Skipping {}: {}", file.string(), Log::sanitize(error));
            continue;
        }

        auto capture = fromJson(*document, file.stem().string());
        if (!capture) {
            LOG_DEBUG("StepCaptureLoader: Skipping {}: not a JSON object", file.string());
            continue;
        }
        captures.push_back(std::move(*capture));
    }
    return captures;
}

std::optional<StepCapture> StepCaptureLoader::fromJson(const json &document, const std::string &fallbackName) {
    if (!document.is_object()) {
        return std::nullopt;
    }

    StepCapture capture;
    capture.name = JsonUtils::getString(document, "name", fallbackName);

    const json *screenshot = JsonUtils::findMember(document, "screenshot_path");
    if (screenshot && screenshot->is_string()) {
        capture.screenshotPath = screenshot->get<std::string>();
    }

    const json *networkCalls = JsonUtils::findMember(document, "network_calls");
    if (networkCalls && networkCalls->is_array()) {
        for (const auto &call : *networkCalls) {
            capture.networkCalls.push_back(JsonUtils::toCompactString(call));
        }
    }

    const json *console = JsonUtils::findMember(document, "console");
    if (console && console->is_array()) {
        for (const auto &line : *console) {
            capture.consoleLogs.push_back(line.is_string() ? line.get<std::string>() : JsonUtils::toCompactString(line));
        }
    }
    return capture;
}

}  // namespace RTE
