#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace RTE {

/**
 * @brief Process-wide generator for collision-free identifiers
 *
 * IDs have the form prefix_timestamp_counter_random. The global counter makes
 * IDs unique within the process; timestamp and random component keep them
 * distinct across processes sharing an output directory.
 */
class UniqueIdGenerator {
public:
    /**
     * @brief ID for one suite invocation (names its working directory)
     */
    static std::string generateInvocationId(const std::string &suiteName);

    /**
     * @brief ID for a whole test run
     */
    static std::string generateRunId();

    /**
     * @brief Check whether an ID has the generator's four-part shape
     */
    static bool isGeneratedId(const std::string &id);

private:
    static std::atomic<uint64_t> globalCounter_;
    static std::mt19937_64 rng_;
    static std::mutex rngMutex_;

    static std::string generateBaseId(const std::string &prefix);
    static uint64_t getCurrentTimestamp();
    static uint64_t getRandomComponent();
};

}  // namespace RTE
