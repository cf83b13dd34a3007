#include "io/JsonIO.hpp"
#include "index/Errors.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace cardindex {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string optional_string(const json& j, const char* key, const std::string& where, const std::string& def) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static size_t optional_count(const json& j, const char* key, const std::string& where, size_t def) {
    if (!j.contains(key)) return def;
    const json& v = j.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a positive integer");
    }
    return (size_t)v.get<long long>();
}

static std::array<float, 3> optional_rgb(const json& j, const char* key, const std::string& where,
                                         const std::array<float, 3>& def) {
    if (!j.contains(key)) return def;
    const json& arr = j.at(key);
    if (!arr.is_array() || arr.size() != 3) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array of 3 numbers");
    }
    std::array<float, 3> out{};
    for (size_t i = 0; i < 3; ++i) {
        if (!arr.at(i).is_number()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a number";
            throw std::runtime_error(oss.str());
        }
        out[i] = arr.at(i).get<float>();
    }
    return out;
}

static PreprocessConfig parsePreprocess(const json& j, const std::string& where, const PreprocessConfig& base) {
    require_object(j, where);

    PreprocessConfig p = base;
    p.image_size = (int)optional_count(j, "image_size", where, (size_t)base.image_size);
    if (j.contains("crop_method")) {
        p.crop = parse_crop_method(optional_string(j, "crop_method", where, "none"));
    }
    p.mean = optional_rgb(j, "mean", where, base.mean);
    p.stdev = optional_rgb(j, "std", where, base.stdev);

    for (size_t i = 0; i < 3; ++i) {
        if (p.stdev[i] == 0.0f) throw std::runtime_error(where + ".std must not contain 0");
    }
    return p;
}

ScannerConfig loadScannerConfig(const std::string& path, const ScannerConfig& base) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    require_object(j, "root");

    ScannerConfig cfg = base;
    cfg.model_path = optional_string(j, "model_path", "root", base.model_path);
    cfg.embedding_dim = optional_count(j, "embedding_dim", "root", base.embedding_dim);
    cfg.images_dir = optional_string(j, "images_dir", "root", base.images_dir);
    cfg.output_path = optional_string(j, "output_path", "root", base.output_path);
    cfg.checkpoint_path = optional_string(j, "checkpoint_path", "root", base.checkpoint_path);
    cfg.checkpoint_interval = optional_count(j, "checkpoint_interval", "root", base.checkpoint_interval);
    cfg.workers = optional_count(j, "workers", "root", base.workers);

    if (j.contains("preprocessing")) {
        cfg.preprocess = parsePreprocess(j.at("preprocessing"), "root.preprocessing", base.preprocess);
    }

    return cfg;
}

EmbeddingIndex parseCheckpointJson(const std::string& text, size_t dim, CheckpointLoadReport* report) {
    ordered_json j;
    try {
        j = ordered_json::parse(text);
    } catch (const std::exception& e) {
        throw CheckpointReadError(std::string("failed to parse checkpoint JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw CheckpointReadError("checkpoint root must be an object of card id -> number array");
    }

    EmbeddingIndex idx(dim);
    CheckpointLoadReport rep;
    std::vector<float> vec(dim);

    for (auto it = j.begin(); it != j.end(); ++it) {
        const ordered_json& arr = it.value();
        if (!arr.is_array()) {
            rep.skipped.push_back(it.key() + ": not an array");
            continue;
        }
        if (arr.size() != dim) {
            rep.skipped.push_back(it.key() + ": " + std::to_string(arr.size()) + " components, expected " +
                                  std::to_string(dim));
            continue;
        }

        bool ok = true;
        for (size_t i = 0; i < dim; ++i) {
            if (!arr[i].is_number()) {
                ok = false;
                break;
            }
            const double d = arr[i].get<double>();
            if (!std::isfinite(d) || std::fabs(d) > (double)std::numeric_limits<float>::max()) {
                ok = false;
                break;
            }
            vec[i] = (float)d;
        }
        if (!ok) {
            rep.skipped.push_back(it.key() + ": non-numeric or non-finite component");
            continue;
        }

        idx.insert(it.key(), vec);
    }

    rep.loaded = idx.size();
    if (report) *report = std::move(rep);
    return idx;
}

std::string checkpointToJson(const EmbeddingIndex& index) {
    ordered_json j = ordered_json::object();
    for (size_t i = 0; i < index.size(); ++i) {
        const float* v = index.vector_at(i);
        j[index.id_at(i)] = std::vector<float>(v, v + index.dim());
    }
    return j.dump();
}

}  // namespace cardindex
