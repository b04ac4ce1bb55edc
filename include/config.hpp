#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "result.hpp"
#include <cstddef>
#include <string>


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
/**
 * @brief Seed datasets a fresh engine can be initialized with.
 */
enum class DemoSize { EMPTY, SAMPLE, CAMPUS };

/// "empty", "sample" or "campus".
const char* demoSizeName(DemoSize size);

/**
 * @brief Tunables of one engine instance and its drivers.
 *
 * Defaults reproduce the reference behaviour; drivers override fields in
 * code or from "--key=value" arguments.
 */
struct EngineConfig {
    size_t logCapacity = 100; ///< Activity log bound.
    double capacityTolerance = 0.25; ///< Adjacency capacity rule.
    bool linkSameBuilding = true; ///< Adjacency building rule.
    unsigned idSeed = 0; ///< Booking id RNG seed, 0 = random_device.
    bool echoActivity = false; ///< Mirror activity entries to std::clog.
    DemoSize dataset = DemoSize::SAMPLE; ///< Dataset used at startup and on reset.
    int threads = 4; ///< Worker threads for the threaded driver.
    int batchSize = 256; ///< Rooms per OpenCL audit batch.
};

/**
 * @brief Apply a single "key=value" setting to @p config.
 *
 * Recognized keys: log-capacity, capacity-tolerance, link-same-building,
 * id-seed, echo, dataset, threads, batch-size.
 */
Result<bool> applyConfigOption(EngineConfig& config, const std::string& key, const std::string& value);

/**
 * @brief Build a configuration from "--key=value" command line arguments.
 *
 * Unknown keys and malformed values are reported as INVALID_REQUEST.
 */
Result<EngineConfig> parseConfigArgs(int argc, char** argv, EngineConfig defaults = EngineConfig());
