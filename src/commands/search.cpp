#include "commands/search.hpp"
#include "commands/CliArgs.hpp"

#include "index/Errors.hpp"
#include "index/IndexCodec.hpp"
#include "scan/CardMatcher.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace cardindex;

// first argument that is neither a flag nor a flag's value
static std::string positional(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            ++i;
            continue;
        }
        return a;
    }
    return "";
}

int cmd_search(int argc, char** argv) {
    const std::string image_path = positional(argc, argv);
    if (image_path.empty()) {
        std::cerr << "error: no image path provided\n";
        return 2;
    }

    try {
        const ScannerConfig cfg = resolve_config(argc, argv);
        const std::string index_path = get_arg(argc, argv, "--embeddings", cfg.output_path);
        const size_t topk = get_arg_count(argc, argv, "--top", 10);
        const std::string timeout_s = get_arg(argc, argv, "--timeout-ms", "");
        const size_t timeout_ms = timeout_s.empty() ? 0 : get_arg_count(argc, argv, "--timeout-ms", 0);

        std::cout << "Searching for similar cards to: " << image_path << "\n\n";

        EmbeddingIndex index = read_index_file(index_path);
        std::cout << "Loaded " << index.size() << " embeddings (dim=" << index.dim() << ")\n\n";

        CardMatcher matcher(make_embedder(cfg), std::move(index));

        const auto t0 = std::chrono::steady_clock::now();
        std::vector<MatchResult> results;
        try {
            results = timeout_ms > 0
                          ? matcher.find_matches(image_path, topk, std::chrono::milliseconds((long long)timeout_ms))
                          : matcher.find_matches(image_path, topk);
        } catch (const QueryTimeout& e) {
            std::cerr << "search failed: " << e.what() << "\n";
            if (matcher.wait_abandoned(std::chrono::seconds(30)) > 0) {
                std::cerr << "warning: abandoned inference still running at exit\n";
            }
            return 1;
        }
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();

        if (results.empty()) {
            std::cout << "No matches (index is empty)\n";
            return 0;
        }

        std::cout << "Top " << results.size() << " similar cards:\n\n";
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << (i + 1) << ". " << results[i].card_id << "\n";
            std::cout << "   Score: " << std::fixed << std::setprecision(4) << results[i].score << "\n\n";
        }
        std::cout << "Matching time: " << ms << " ms\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "search failed: " << e.what() << "\n";
        return 1;
    }
}
