#include "geoscan/persistence.hpp"
#include "geoscan/error.hpp"
#include "geoscan/geojson.hpp"
#include "geoscan/logging.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <random>

namespace fs = std::filesystem;

namespace geoscan {

namespace {

std::string random_suffix() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
    return buf;
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Removes a scratch directory on scope exit unless released
class ScratchDirectory {
public:
    explicit ScratchDirectory(fs::path path) : path_(std::move(path)) {}
    ~ScratchDirectory() {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            LOG_WARNING("Could not remove scratch directory " + path_.string() + ": " + ec.message());
        }
    }
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const noexcept { return path_; }
    void release() noexcept { path_.clear(); }

private:
    fs::path path_;
};

fs::path normalize_target(const std::string& path) {
    if (path.empty()) {
        throw InvalidArgumentError("Model path must not be empty", "ModelWriter::save");
    }
    fs::path target = fs::path(path).lexically_normal();
    if (target.filename().empty()) {
        target = target.parent_path();
    }
    return target;
}

const boost::json::value& require_field(const boost::json::object& obj, const char* key) {
    const boost::json::value* v = obj.if_contains(key);
    if (!v) {
        throw CorruptDataError(std::string("Model metadata has no '") + key + "' field", "metadata_from_json");
    }
    return *v;
}

std::string require_string(const boost::json::object& obj, const char* key) {
    const auto& v = require_field(obj, key);
    if (!v.is_string()) {
        throw CorruptDataError(std::string("Model metadata field '") + key + "' must be a string",
                               "metadata_from_json");
    }
    return std::string(v.as_string());
}

int64_t require_integer(const boost::json::object& obj, const char* key) {
    const auto& v = require_field(obj, key);
    if (v.is_int64()) return v.as_int64();
    if (v.is_uint64() && v.as_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(v.as_uint64());
    }
    throw CorruptDataError(std::string("Model metadata field '") + key + "' must be an integer",
                           "metadata_from_json");
}

int require_int(const boost::json::object& obj, const char* key) {
    const int64_t v = require_integer(obj, key);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw CorruptDataError(std::string("Model metadata field '") + key + "' is out of range: " +
                               std::to_string(v), "metadata_from_json");
    }
    return static_cast<int>(v);
}

} // anonymous namespace

// =============================================================================
// Metadata
// =============================================================================

std::string metadata_to_json(const ModelMetadata& metadata) {
    boost::json::object params;
    params["epsilon"] = metadata.params.epsilon;
    params["minPts"] = metadata.params.min_pts;
    params["latitudeCol"] = metadata.params.latitude_col;
    params["longitudeCol"] = metadata.params.longitude_col;
    params["predictionCol"] = metadata.params.prediction_col;

    boost::json::object root;
    root["class"] = metadata.class_name;
    root["formatVersion"] = metadata.format_version;
    root["timestamp"] = metadata.timestamp_ms;
    root["uid"] = metadata.uid;
    root["paramMap"] = std::move(params);
    return boost::json::serialize(root);
}

ModelMetadata metadata_from_json(const std::string& text) {
    boost::json::parse_options options;
    options.numbers = boost::json::number_precision::precise;

    boost::system::error_code ec;
    boost::json::value root = boost::json::parse(text, ec, {}, options);
    if (ec) {
        throw CorruptDataError("Model metadata is not valid JSON: " + ec.message(), __func__);
    }
    if (!root.is_object()) {
        throw CorruptDataError("Model metadata must be a JSON object", __func__);
    }
    const auto& obj = root.as_object();

    ModelMetadata metadata;
    metadata.class_name = require_string(obj, "class");
    if (metadata.class_name != MODEL_CLASS_TAG) {
        throw CorruptDataError("Expected a " + std::string(MODEL_CLASS_TAG) + " but found " +
                               metadata.class_name, __func__);
    }

    metadata.format_version = require_int(obj, "formatVersion");
    if (metadata.format_version > MODEL_FORMAT_VERSION) {
        throw CorruptDataError("Unsupported model format version " +
                               std::to_string(metadata.format_version), __func__,
                               "Upgrade geoscan to read this model");
    }
    metadata.timestamp_ms = require_integer(obj, "timestamp");
    metadata.uid = require_string(obj, "uid");
    if (metadata.uid.empty()) {
        throw CorruptDataError("Model metadata has an empty uid", __func__);
    }

    const auto& param_value = require_field(obj, "paramMap");
    if (!param_value.is_object()) {
        throw CorruptDataError("Model metadata 'paramMap' must be an object", __func__);
    }
    const auto& params = param_value.as_object();

    const auto& epsilon = require_field(params, "epsilon");
    if (!epsilon.is_number()) {
        throw CorruptDataError("Model parameter 'epsilon' must be a number", __func__);
    }
    metadata.params.epsilon = epsilon.to_number<double>();
    metadata.params.min_pts = require_int(params, "minPts");
    metadata.params.latitude_col = require_string(params, "latitudeCol");
    metadata.params.longitude_col = require_string(params, "longitudeCol");
    metadata.params.prediction_col = require_string(params, "predictionCol");

    try {
        metadata.params.validate();
    } catch (const ConfigurationError& e) {
        throw CorruptDataError("Model parameters are invalid: " + e.message(), __func__);
    }
    return metadata;
}

// =============================================================================
// Text artifacts
// =============================================================================

void write_text_artifact(const std::string& dir, const std::vector<std::string>& records) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("Cannot create directory " + dir + ": " + ec.message(), __func__);
    }

    const fs::path part = fs::path(dir) / PART_FILE;
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IOError("Cannot open " + part.string() + " for writing", __func__);
        }
        for (const auto& record : records) {
            if (record.find('\n') != std::string::npos) {
                throw InvalidArgumentError("Text records must not contain newlines", __func__);
            }
            out << record << '\n';
        }
        out.flush();
        if (!out) {
            throw IOError("Failed writing " + part.string(), __func__);
        }
    }

    const fs::path success = fs::path(dir) / SUCCESS_FILE;
    std::ofstream marker(success, std::ios::binary | std::ios::trunc);
    if (!marker.is_open()) {
        throw IOError("Cannot create " + success.string(), __func__);
    }
}

std::vector<std::string> read_text_artifact(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw NotFoundError("Artifact " + dir + " does not exist", __func__);
    }

    std::vector<fs::path> parts;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        std::error_code type_ec;
        if (name.rfind("part-", 0) == 0 && it->is_regular_file(type_ec)) {
            parts.push_back(it->path());
        }
    }
    if (ec) {
        throw IOError("Cannot list " + dir + ": " + ec.message(), __func__);
    }
    std::sort(parts.begin(), parts.end());

    std::vector<std::string> records;
    for (const auto& part : parts) {
        std::ifstream in(part, std::ios::binary);
        if (!in.is_open()) {
            throw IOError("Cannot open " + part.string(), __func__);
        }
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                records.push_back(std::move(line));
            }
        }
        if (in.bad()) {
            throw IOError("Failed reading " + part.string(), __func__);
        }
    }
    return records;
}

// =============================================================================
// ModelWriter
// =============================================================================

ModelWriter::ModelWriter(GeoscanModel model) : model_(std::move(model)), overwrite_(false) {}

ModelWriter& ModelWriter::overwrite(bool enabled) noexcept {
    overwrite_ = enabled;
    return *this;
}

void ModelWriter::save(const std::string& path) const {
    const fs::path target = normalize_target(path);
    const fs::path parent = target.has_parent_path() ? target.parent_path() : fs::path(".");

    std::error_code ec;
    const bool exists = fs::exists(target, ec);
    if (ec) {
        throw IOError("Cannot access " + target.string() + ": " + ec.message(), __func__);
    }
    if (exists && !overwrite_) {
        throw AlreadyExistsError("Path " + target.string() + " already exists", __func__,
                                 "Use overwrite to replace it");
    }

    fs::create_directories(parent, ec);
    if (ec) {
        throw IOError("Cannot create " + parent.string() + ": " + ec.message(), __func__);
    }

    const std::string stem = target.filename().string();
    ScratchDirectory scratch(parent / ("." + stem + ".tmp-" + random_suffix()));

    ModelMetadata metadata;
    metadata.timestamp_ms = now_ms();
    metadata.uid = model_.uid();
    metadata.params = model_.params();

    write_text_artifact((scratch.path() / METADATA_DIR).string(), {metadata_to_json(metadata)});
    write_text_artifact((scratch.path() / DATA_DIR).string(), {model_.to_geojson()});

    if (exists) {
        ScratchDirectory backup(parent / ("." + stem + ".old-" + random_suffix()));
        fs::rename(target, backup.path(), ec);
        if (ec) {
            backup.release();
            throw IOError("Cannot move existing " + target.string() + " aside: " + ec.message(), __func__);
        }
        fs::rename(scratch.path(), target, ec);
        if (ec) {
            std::error_code restore_ec;
            fs::rename(backup.path(), target, restore_ec);
            if (restore_ec) {
                // Keep the old copy on disk rather than deleting the only version
                LOG_ERROR("Could not restore " + target.string() + " from " + backup.path().string() +
                          ": " + restore_ec.message());
            }
            backup.release();
            throw IOError("Cannot move model into " + target.string() + ": " + ec.message(), __func__);
        }
        scratch.release();
    } else {
        fs::rename(scratch.path(), target, ec);
        if (ec) {
            throw IOError("Cannot move model into " + target.string() + ": " + ec.message(), __func__);
        }
        scratch.release();
    }

    LOG_INFO("Saved model " + model_.uid() + " with " + std::to_string(model_.shape().size()) +
             " clusters to " + target.string());
}

// =============================================================================
// ModelReader
// =============================================================================

ModelReader::ModelReader(std::shared_ptr<const SpatialIndex> index) : index_(std::move(index)) {}

GeoscanModel ModelReader::load(const std::string& path) const {
    const fs::path root(path);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw NotFoundError("No model found at " + path, __func__);
    }

    const auto metadata_records = read_text_artifact((root / METADATA_DIR).string());
    if (metadata_records.size() != 1) {
        throw CorruptDataError("Expected one metadata record in " + path + ", found " +
                               std::to_string(metadata_records.size()), __func__);
    }
    const ModelMetadata metadata = metadata_from_json(metadata_records.front());

    const auto data_records = read_text_artifact((root / DATA_DIR).string());
    if (data_records.empty()) {
        throw CorruptDataError("Model data in " + path + " is empty", __func__,
                               "The model was not saved completely");
    }
    if (data_records.size() > 1) {
        throw CorruptDataError("Expected one GeoJSON record in " + path + ", found " +
                               std::to_string(data_records.size()), __func__);
    }

    auto shape = std::make_shared<const Shape>(from_geojson(data_records.front()));
    GeoscanModel model(metadata.uid, std::move(shape), metadata.params, index_);

    LOG_INFO("Loaded model " + model.uid() + " with " + std::to_string(model.shape().size()) +
             " clusters from " + path);
    return model;
}

} // namespace geoscan
