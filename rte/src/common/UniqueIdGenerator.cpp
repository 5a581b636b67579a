#include "common/UniqueIdGenerator.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace RTE {

std::atomic<uint64_t> UniqueIdGenerator::globalCounter_{0};
std::mt19937_64 UniqueIdGenerator::rng_{std::random_device{}()};
std::mutex UniqueIdGenerator::rngMutex_;

std::string UniqueIdGenerator::generateInvocationId(const std::string &suiteName) {
    // Underscores are reserved as field separators
    std::string prefix = slugify(suiteName, "suite");
    std::replace(prefix.begin(), prefix.end(), '_', '-');
    return generateBaseId(prefix);
}

std::string UniqueIdGenerator::generateRunId() {
    return generateBaseId("run");
}

bool UniqueIdGenerator::isGeneratedId(const std::string &id) {
    if (id.empty()) {
        return false;
    }

    // prefix_timestamp_counter_random
    return std::count(id.begin(), id.end(), '_') == 3;
}

std::string UniqueIdGenerator::generateBaseId(const std::string &prefix) {
    uint64_t globalCount = globalCounter_.fetch_add(1);
    uint64_t timestamp = getCurrentTimestamp();
    uint64_t randomComponent = getRandomComponent();

    std::ostringstream oss;
    oss << prefix << "_" << timestamp << "_" << globalCount << "_" << std::hex << randomComponent;

    std::string id = oss.str();
    LOG_TRACE("UniqueIdGenerator: Generated ID: {}", id);

    return id;
}

uint64_t UniqueIdGenerator::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

uint64_t UniqueIdGenerator::getRandomComponent() {
    std::lock_guard<std::mutex> lock(rngMutex_);
    // Lower 16 bits keep the ID short
    return rng_() & 0xFFFF;
}

}  // namespace RTE
