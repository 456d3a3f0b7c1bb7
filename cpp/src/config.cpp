#include "geoscan/config.hpp"
#include "geoscan/error.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

namespace geoscan {

namespace {

template<typename T>
void read_if(const YAML::Node& node, const char* key, T& target, const std::string& section) {
    if (!node[key]) return;
    try {
        target = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for " + section + "." + key + ": " + e.what(),
                                 "load_config");
    }
}

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

void load_from_yaml(Config& config, const std::string& config_file) {
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(config_file);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Cannot parse " + config_file + ": " + e.what(), "load_config");
    }

    if (const auto model = yaml["model"]) {
        read_if(model, "epsilon", config.model.epsilon, "model");
        read_if(model, "min_pts", config.model.min_pts, "model");
        read_if(model, "latitude_col", config.model.latitude_col, "model");
        read_if(model, "longitude_col", config.model.longitude_col, "model");
        read_if(model, "prediction_col", config.model.prediction_col, "model");
    }

    if (const auto inference = yaml["inference"]) {
        read_if(inference, "layers", config.inference.layers, "inference");
        read_if(inference, "threads", config.inference.threads, "inference");
        std::string tie_break;
        read_if(inference, "tie_break", tie_break, "inference");
        if (!tie_break.empty()) {
            config.inference.tie_break = parse_tie_break(tie_break);
        }
    }

    if (const auto index = yaml["index"]) {
        read_if(index, "max_cells_per_polygon", config.index.max_cells_per_polygon, "index");
    }

    if (const auto persistence = yaml["persistence"]) {
        read_if(persistence, "overwrite", config.persistence.overwrite, "persistence");
    }

    if (const auto logging = yaml["logging"]) {
        std::string level;
        read_if(logging, "level", level, "logging");
        if (!level.empty()) {
            config.logging.level = parse_log_level(level);
        }
        read_if(logging, "file", config.logging.file, "logging");
    }
}

void load_from_env(Config& config) {
    if (const char* level = env_value("GEOSCAN_LOG_LEVEL")) {
        config.logging.level = parse_log_level(level);
    }
    if (const char* file = env_value("GEOSCAN_LOG_FILE")) {
        config.logging.file = file;
    }
    if (const char* threads = env_value("GEOSCAN_THREADS")) {
        try {
            size_t consumed = 0;
            long value = std::stol(threads, &consumed);
            if (consumed != std::string(threads).size() || value < 0) {
                throw std::invalid_argument(threads);
            }
            config.inference.threads = static_cast<uint32_t>(value);
        } catch (const std::exception&) {
            throw ConfigurationError(std::string("GEOSCAN_THREADS must be a non-negative integer, got '") +
                                     threads + "'", "load_config");
        }
    }
}

} // anonymous namespace

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    if (!config_file.empty()) {
        if (!std::filesystem::exists(config_file)) {
            throw ConfigurationError("Config file " + config_file + " does not exist", __func__);
        }
        load_from_yaml(config, config_file);
    }

    load_from_env(config);

    config.model.validate();
    if (config.inference.layers < 0) {
        throw ConfigurationError("inference.layers must be >= 0", __func__);
    }
    if (config.index.max_cells_per_polygon == 0) {
        throw ConfigurationError("index.max_cells_per_polygon must be positive", __func__);
    }
    return config;
}

void apply_logging(const LoggingConfig& logging) {
    Logger& logger = Logger::getInstance();
    logger.set_level(logging.level);
    logger.set_output_file(logging.file);
}

} // namespace geoscan
