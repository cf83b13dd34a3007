#pragma once
#include "config/ScannerConfig.hpp"
#include "emb/ClipImageEmbedder.hpp"

#include <memory>
#include <string>

namespace cardindex {

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Throws std::runtime_error on a value that is not a positive integer.
size_t get_arg_count(int argc, char** argv, const std::string& key, size_t def);

// Defaults <- --config file <- individual flags
// (--model, --images, --out, --checkpoint, --checkpoint-interval, --workers).
ScannerConfig resolve_config(int argc, char** argv);

// Throws std::runtime_error if the model cannot be loaded.
std::shared_ptr<ClipImageEmbedder> make_embedder(const ScannerConfig& cfg);

}  // namespace cardindex
