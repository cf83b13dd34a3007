#pragma once
#include "config/ScannerConfig.hpp"
#include "index/EmbeddingIndex.hpp"

#include <string>
#include <vector>

namespace cardindex {

// Reads a JSON config file on top of the defaults in `base`. Missing keys keep
// their defaults; present keys with the wrong type throw std::runtime_error.
ScannerConfig loadScannerConfig(const std::string& path, const ScannerConfig& base = ScannerConfig{});

struct CheckpointLoadReport {
    size_t loaded = 0;
    std::vector<std::string> skipped; // "<card id>: <reason>"
};

// Checkpoint text is a JSON object { "<card id>": [dim floats], ... } in insertion order.
// Malformed entries (wrong length, non-numeric, NaN/inf or beyond float range)
// are skipped and listed in the report. Throws CheckpointReadError
// if the text is not JSON or the root is not an object.
EmbeddingIndex parseCheckpointJson(const std::string& text, size_t dim, CheckpointLoadReport* report = nullptr);

std::string checkpointToJson(const EmbeddingIndex& index);

}  // namespace cardindex
