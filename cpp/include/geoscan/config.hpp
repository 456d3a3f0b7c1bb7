#pragma once

#include "geoscan/logging.hpp"
#include "geoscan/model.hpp"
#include "geoscan/params.hpp"

#include <cstdint>
#include <string>

namespace geoscan {

struct InferenceConfig {
    int layers = 0;
    TieBreak tie_break = TieBreak::NEAREST_CENTROID;
    uint32_t threads = 0;   // 0 = hardware concurrency
};

struct IndexConfig {
    uint64_t max_cells_per_polygon = 4000000;
};

struct PersistenceConfig {
    bool overwrite = false;
};

struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    std::string file;
};

struct Config {
    GeoscanParams model;
    InferenceConfig inference;
    IndexConfig index;
    PersistenceConfig persistence;
    LoggingConfig logging;
    std::string config_file;
};

/**
 * Load configuration: defaults, then the YAML file (if a path is given),
 * then GEOSCAN_LOG_LEVEL / GEOSCAN_LOG_FILE / GEOSCAN_THREADS from the
 * environment. Throws ConfigurationError for a missing or malformed file
 * and for values that fail validation.
 */
Config load_config(const std::string& config_file = "");

// Apply the logging section to the process logger
void apply_logging(const LoggingConfig& logging);

} // namespace geoscan
