#pragma once

#include "common/JsonUtils.h"
#include "execution/ExecutionResult.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Reads the per-test capture files a runner left in a capture directory
 *
 * Every regular *.json file is one StepCapture, loaded in file name order.
 * Files that cannot be read, do not parse, or are not JSON objects are
 * skipped; a missing directory yields no captures.
 */
class StepCaptureLoader {
public:
    static std::vector<StepCapture> load(const std::filesystem::path &captureDir);

    /**
     * @brief Capture from one parsed document
     *
     * Recognized keys: name (defaults to fallbackName), screenshot_path,
     * network_calls (array of any JSON), console (array; non-strings are kept
     * as compact JSON). Members of the wrong type are ignored.
     *
     * @return nullopt when the document is not an object
     */
    static std::optional<StepCapture> fromJson(const json &document, const std::string &fallbackName);
};

}  // namespace RTE
