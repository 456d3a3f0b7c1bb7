// =============================================================================
// persistence.hpp - Model save / load
// =============================================================================
// A saved model is a directory with two text artifacts:
//
//   <path>/metadata/part-00000   one JSON line: class, uid, paramMap, ...
//   <path>/data/part-00000       one line: the shape as GeoJSON
//
// each followed by an empty _SUCCESS marker. Saving writes everything into
// a hidden sibling directory first and renames it into place, so a reader
// never sees a half-written model.
// =============================================================================

#pragma once

#include "geoscan/model.hpp"
#include "geoscan/params.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace geoscan {

constexpr const char* MODEL_CLASS_TAG = "geoscan.GeoscanModel";
constexpr int MODEL_FORMAT_VERSION = 1;

constexpr const char* METADATA_DIR = "metadata";
constexpr const char* DATA_DIR = "data";
constexpr const char* PART_FILE = "part-00000";
constexpr const char* SUCCESS_FILE = "_SUCCESS";

struct ModelMetadata {
    std::string class_name = MODEL_CLASS_TAG;
    int format_version = MODEL_FORMAT_VERSION;
    int64_t timestamp_ms = 0;
    std::string uid;
    GeoscanParams params;
};

std::string metadata_to_json(const ModelMetadata& metadata);

// Throws CorruptDataError on a malformed or foreign document
ModelMetadata metadata_from_json(const std::string& text);

/**
 * Write text records as a single-part artifact directory.
 * Throws IOError if anything cannot be written.
 */
void write_text_artifact(const std::string& dir, const std::vector<std::string>& records);

/**
 * Read every non-empty line of every part-* file, in part order.
 * Throws NotFoundError if the directory is missing.
 */
std::vector<std::string> read_text_artifact(const std::string& dir);

class ModelWriter {
public:
    explicit ModelWriter(GeoscanModel model);

    // Replace an existing model at the target path instead of failing
    ModelWriter& overwrite(bool enabled = true) noexcept;

    /**
     * Persist metadata and shape under `path`.
     * Throws AlreadyExistsError when `path` exists and overwrite is off,
     * IOError on any write failure. On failure nothing is left at `path`
     * except what was there before.
     */
    void save(const std::string& path) const;

private:
    GeoscanModel model_;
    bool overwrite_;
};

class ModelReader {
public:
    explicit ModelReader(std::shared_ptr<const SpatialIndex> index = nullptr);

    /**
     * Rebuild a model saved by ModelWriter.
     * Throws NotFoundError when the path or an artifact is missing and
     * CorruptDataError when an artifact is empty or malformed.
     */
    GeoscanModel load(const std::string& path) const;

private:
    std::shared_ptr<const SpatialIndex> index_;
};

} // namespace geoscan
