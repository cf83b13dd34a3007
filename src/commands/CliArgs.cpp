#include "commands/CliArgs.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <stdexcept>

namespace cardindex {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

size_t get_arg_count(int argc, char** argv, const std::string& key, size_t def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    long long v = 0;
    size_t used = 0;
    try {
        v = std::stoll(s, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != s.size() || v <= 0) {
        throw std::runtime_error(key + " expects a positive integer, got '" + s + "'");
    }
    return (size_t)v;
}

ScannerConfig resolve_config(int argc, char** argv) {
    ScannerConfig cfg;

    const std::string config_path = get_arg(argc, argv, "--config", "");
    if (!config_path.empty()) cfg = loadScannerConfig(config_path, cfg);

    cfg.model_path = get_arg(argc, argv, "--model", cfg.model_path);
    cfg.images_dir = get_arg(argc, argv, "--images", cfg.images_dir);
    cfg.output_path = get_arg(argc, argv, "--out", cfg.output_path);
    cfg.checkpoint_path = get_arg(argc, argv, "--checkpoint", cfg.checkpoint_path);
    cfg.checkpoint_interval = get_arg_count(argc, argv, "--checkpoint-interval", cfg.checkpoint_interval);
    cfg.workers = get_arg_count(argc, argv, "--workers", cfg.workers);
    return cfg;
}

std::shared_ptr<ClipImageEmbedder> make_embedder(const ScannerConfig& cfg) {
    std::cout << "Loading model: " << cfg.model_path << "...\n";
    auto emb = std::make_shared<ClipImageEmbedder>(cfg.preprocess, cfg.embedding_dim);
    if (!emb->init(cfg.model_path)) {
        throw std::runtime_error("failed to init ClipImageEmbedder (check --model / model_path)");
    }
    std::cout << "Model loaded successfully\n";
    return emb;
}

}  // namespace cardindex
