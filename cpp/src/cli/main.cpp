// =============================================================================
// geoscan CLI - serve trained GEOSCAN models
// =============================================================================
//
// Usage:
//   geoscan [--config <yaml>] [-v] <command> [options]
//
// Commands:
//   import      Build a model from a GeoJSON shape and save it
//   info        Show model uid, parameters and precision
//   tiles       Print the (cluster, cell) tiles of a model
//   predict     Assign clusters to the rows of a CSV file
//   export      Print the model shape as GeoJSON
//   version     Show version information
//
// Examples:
//   geoscan import clusters.geojson models/geoscan --epsilon 100
//   geoscan predict models/geoscan points.csv out.csv --layers 1
//   geoscan tiles models/geoscan
//
// =============================================================================

#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "geoscan/config.hpp"
#include "geoscan/csv.hpp"
#include "geoscan/error.hpp"
#include "geoscan/geojson.hpp"
#include "geoscan/logging.hpp"
#include "geoscan/model.hpp"
#include "geoscan/persistence.hpp"
#include "geoscan/spatial_index.hpp"
#include "geoscan/thread_pool.hpp"

namespace geoscan::cli {
    int cmd_import(const std::vector<std::string>& args);
    int cmd_info(const std::vector<std::string>& args);
    int cmd_tiles(const std::vector<std::string>& args);
    int cmd_predict(const std::vector<std::string>& args);
    int cmd_export(const std::vector<std::string>& args);
    int cmd_version(const std::vector<std::string>& args);
    int cmd_help(const std::vector<std::string>& args);
}

// =============================================================================
// Version Info
// =============================================================================

#define GEOSCAN_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(const std::vector<std::string>& args);
};

static const Command g_commands[] = {
    {"import",  "Build a model from a GeoJSON shape and save it", geoscan::cli::cmd_import},
    {"info",    "Show model uid, parameters and precision", geoscan::cli::cmd_info},
    {"tiles",   "Print the (cluster, cell) tiles of a model", geoscan::cli::cmd_tiles},
    {"predict", "Assign clusters to the rows of a CSV file", geoscan::cli::cmd_predict},
    {"export",  "Print the model shape as GeoJSON", geoscan::cli::cmd_export},
    {"version", "Show version information", geoscan::cli::cmd_version},
    {"help",    "Show this help message", geoscan::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

static geoscan::Config g_config;

namespace geoscan::cli {

namespace {

// Pulls "--name value" pairs and bare flags out of an argument list
class Options {
public:
    explicit Options(const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg.rfind("--", 0) == 0 && arg.size() > 2) {
                std::string name = arg.substr(2);
                if (is_flag(name)) {
                    flags_.push_back(name);
                } else {
                    if (i + 1 >= args.size()) {
                        throw InvalidArgumentError("Option --" + name + " needs a value", "geoscan");
                    }
                    values_.emplace_back(name, args[++i]);
                }
            } else {
                positional_.push_back(arg);
            }
        }
    }

    const std::vector<std::string>& positional() const { return positional_; }

    bool flag(const std::string& name) const {
        for (const auto& f : flags_) {
            if (f == name) return true;
        }
        return false;
    }

    std::optional<std::string> value(const std::string& name) const {
        for (const auto& [key, val] : values_) {
            if (key == name) return val;
        }
        return std::nullopt;
    }

    std::optional<double> number(const std::string& name) const {
        auto v = value(name);
        if (!v) return std::nullopt;
        try {
            size_t consumed = 0;
            double d = std::stod(*v, &consumed);
            if (consumed == v->size()) return d;
        } catch (const std::exception&) {
        }
        throw InvalidArgumentError("Option --" + name + " expects a number, got '" + *v + "'", "geoscan");
    }

    std::optional<int> integer(const std::string& name) const {
        auto v = value(name);
        if (!v) return std::nullopt;
        try {
            size_t consumed = 0;
            int i = std::stoi(*v, &consumed);
            if (consumed == v->size()) return i;
        } catch (const std::exception&) {
        }
        throw InvalidArgumentError("Option --" + name + " expects an integer, got '" + *v + "'", "geoscan");
    }

private:
    static bool is_flag(const std::string& name) {
        return name == "overwrite";
    }

    std::vector<std::string> positional_;
    std::vector<std::string> flags_;
    std::vector<std::pair<std::string, std::string>> values_;
};

void require_args(const Options& opts, size_t count, const char* usage) {
    if (opts.positional().size() != count) {
        throw InvalidArgumentError(std::string("Usage: geoscan ") + usage, "geoscan");
    }
}

std::shared_ptr<const SpatialIndex> make_index() {
    return std::make_shared<const GridIndex>(g_config.index.max_cells_per_polygon);
}

GeoscanModel load_model(const std::string& path) {
    return GeoscanModel::load(path, make_index());
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw NotFoundError("Cannot open " + path, "geoscan");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // anonymous namespace

int cmd_help(const std::vector<std::string>&) {
    std::cout << "geoscan - GEOSCAN model serving toolkit\n";
    std::cout << "Version " << GEOSCAN_VERSION_STRING << "\n\n";
    std::cout << "Usage: geoscan [--config <yaml>] [-v] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nCommand Options:\n";
    std::cout << "  import <geojson> <model-dir> [--epsilon E] [--uid U] [--overwrite]\n";
    std::cout << "  info <model-dir>\n";
    std::cout << "  tiles <model-dir> [--layers N]\n";
    std::cout << "  predict <model-dir> <in.csv> <out.csv> [--layers N] [--tie-break nearest|lowest]\n";
    std::cout << "  export <model-dir>\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  GEOSCAN_LOG_LEVEL       trace, debug, info, warning, error, critical\n";
    std::cout << "  GEOSCAN_LOG_FILE        Also log to this file\n";
    std::cout << "  GEOSCAN_THREADS         Worker threads for predict (0 = all cores)\n";
    return 0;
}

int cmd_version(const std::vector<std::string>&) {
    std::cout << "geoscan " << GEOSCAN_VERSION_STRING << "\n";
    return 0;
}

int cmd_import(const std::vector<std::string>& args) {
    Options opts(args);
    require_args(opts, 2, "import <geojson> <model-dir> [--epsilon E] [--uid U] [--overwrite]");

    auto shape = std::make_shared<const Shape>(from_geojson(read_file(opts.positional()[0])));

    ParamOverrides overrides;
    overrides.epsilon = opts.number("epsilon");
    GeoscanParams params = overrides.apply(g_config.model);

    std::string uid = opts.value("uid").value_or(GeoscanModel::random_uid());
    GeoscanModel model(uid, shape, params, make_index());

    // Fail before writing anything if epsilon cannot be served
    int precision = model.precision();

    model.write()
        .overwrite(opts.flag("overwrite") || g_config.persistence.overwrite)
        .save(opts.positional()[1]);

    std::cout << "Saved " << model.uid() << " (" << shape->size() << " clusters, resolution "
              << precision << ") to " << opts.positional()[1] << "\n";
    return 0;
}

int cmd_info(const std::vector<std::string>& args) {
    Options opts(args);
    require_args(opts, 1, "info <model-dir>");

    GeoscanModel model = load_model(opts.positional()[0]);
    const auto& p = model.params();

    std::cout << "uid:            " << model.uid() << "\n";
    std::cout << "clusters:       " << model.shape().size() << "\n";
    std::cout << "epsilon:        " << p.epsilon << "\n";
    std::cout << "minPts:         " << p.min_pts << "\n";
    std::cout << "latitudeCol:    " << p.latitude_col << "\n";
    std::cout << "longitudeCol:   " << p.longitude_col << "\n";
    std::cout << "predictionCol:  " << p.prediction_col << "\n";

    int precision = model.precision();
    std::cout << "precision:      " << precision << " (cell diagonal "
              << model.index().cell_diagonal_m(precision) << " m)\n";
    return 0;
}

int cmd_tiles(const std::vector<std::string>& args) {
    Options opts(args);
    require_args(opts, 1, "tiles <model-dir> [--layers N]");

    GeoscanModel model = load_model(opts.positional()[0]);
    int layers = opts.integer("layers").value_or(g_config.inference.layers);

    ThreadPool pool(g_config.inference.threads);
    ExecutionContext ctx(pool);

    std::cout << model.params().prediction_col << ",cell\n";
    for (const auto& tile : model.get_tiles(model.precision(), layers, ctx)) {
        std::cout << tile.cluster_id << "," << tile.cell_id << "\n";
    }
    return 0;
}

int cmd_predict(const std::vector<std::string>& args) {
    Options opts(args);
    require_args(opts, 3, "predict <model-dir> <in.csv> <out.csv> [--layers N] [--tie-break nearest|lowest]");

    GeoscanModel model = load_model(opts.positional()[0]);

    TransformOptions options;
    options.layers = opts.integer("layers").value_or(g_config.inference.layers);
    options.tie_break = g_config.inference.tie_break;
    if (auto tb = opts.value("tie-break")) {
        options.tie_break = parse_tie_break(*tb);
    }

    Table input = read_csv_file(opts.positional()[1],
                                {model.params().latitude_col, model.params().longitude_col});

    ThreadPool pool(g_config.inference.threads);
    ExecutionContext ctx(pool);
    Table output = model.transform(input, ctx, options);

    write_csv_file(output, opts.positional()[2]);
    LOG_INFO("Wrote " + std::to_string(output.num_rows()) + " rows to " + opts.positional()[2]);
    return 0;
}

int cmd_export(const std::vector<std::string>& args) {
    Options opts(args);
    require_args(opts, 1, "export <model-dir>");

    GeoscanModel model = load_model(opts.positional()[0]);
    std::cout << model.to_geojson() << "\n";
    return 0;
}

} // namespace geoscan::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static int exit_code(geoscan::ErrorCode code) {
    switch (code) {
        case geoscan::ErrorCode::INVALID_ARGUMENT: return 2;
        case geoscan::ErrorCode::CONFIGURATION:
        case geoscan::ErrorCode::NO_PRECISION:     return 3;
        case geoscan::ErrorCode::NOT_FOUND:        return 4;
        case geoscan::ErrorCode::CORRUPT_DATA:     return 5;
        case geoscan::ErrorCode::IO_FAILURE:
        case geoscan::ErrorCode::ALREADY_EXISTS:   return 6;
        default:                                   return 1;
    }
}

int main(int argc, char* argv[]) {
    std::string config_file;
    bool verbose = false;
    std::vector<std::string> rest;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (rest.empty() && arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (rest.empty() && (arg == "-v" || arg == "--verbose")) {
            verbose = true;
        } else {
            rest.push_back(arg);
        }
    }

    if (rest.empty() || rest[0] == "-h" || rest[0] == "--help") {
        return geoscan::cli::cmd_help({});
    }

    try {
        g_config = geoscan::load_config(config_file);
        if (verbose) {
            g_config.logging.level = geoscan::LogLevel::DEBUG;
        }
        geoscan::apply_logging(g_config.logging);
        if (!g_config.config_file.empty()) {
            LOG_DEBUG("Configuration loaded from " + g_config.config_file);
        }

        const std::string name = rest[0];
        const std::vector<std::string> args(rest.begin() + 1, rest.end());

        for (const Command* cmd = g_commands; cmd->name; ++cmd) {
            if (name == cmd->name) {
                return cmd->handler(args);
            }
        }

        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'geoscan help' for usage.\n";
        return 1;

    } catch (const geoscan::GeoscanException& e) {
        LOG_ERROR(e.what());
        return exit_code(e.code());
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
