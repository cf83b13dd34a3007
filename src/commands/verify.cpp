#include "commands/verify.hpp"
#include "commands/CliArgs.hpp"

#include "cards/SourceEnumerator.hpp"
#include "index/IndexCheck.hpp"
#include "index/IndexCodec.hpp"
#include "index/Similarity.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

using namespace cardindex;

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

static void print_integrity(const IntegrityReport& r) {
    std::cout << "=== File Integrity Check ===\n";
    std::cout << "Total cards: " << r.count << "\n";
    std::cout << "Embedding dimension: " << r.dim << "\n";

    if (!r.dim_ok()) {
        std::cout << "Dimension check: WARNING (expected " << r.expected_dim << ", got " << r.dim << ")\n";
    } else {
        std::cout << "Dimension check: PASS\n";
    }

    if (!r.unique_ok()) {
        std::cout << "Uniqueness check: WARNING (" << r.duplicate_ids << " duplicate card ids)\n";
    } else {
        std::cout << "Uniqueness check: PASS\n";
    }

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Embedding norm range: " << r.min_norm << " - " << r.max_norm << "\n";
    std::cout << "Normalization check: " << (r.normalized_ok() ? "PASS" : "WARNING (expected ~1.0)") << "\n";
    std::cout << std::setprecision(2) << "File size: " << ((double)r.encoded_bytes / 1024.0 / 1024.0) << " MB\n\n";
}

static void print_distribution(const ScoreDistribution& d) {
    std::cout << "=== Score Distribution Test ===\n";
    if (d.samples == 0) {
        std::cout << "Not enough cards to sample pairs\n\n";
        return;
    }
    std::cout << "Sampled " << d.samples << " random card pairs\n";
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "  Min:    " << d.min << "\n";
    std::cout << "  P10:    " << d.p10 << "\n";
    std::cout << "  Median: " << d.median << "\n";
    std::cout << "  Mean:   " << d.mean << "\n";
    std::cout << "  P90:    " << d.p90 << "\n";
    std::cout << "  Max:    " << d.max << "\n";

    if (d.mean > 0.2f && d.mean < 0.8f && (d.max - d.min) > 0.3f) {
        std::cout << "Distribution looks reasonable: PASS\n\n";
    } else {
        std::cout << "Distribution might be unusual: CHECK\n\n";
    }
}

// Re-embeds a few indexed cards from their source images; a healthy index scores ~1.0.
static void self_similarity(const EmbeddingIndex& index, const ImageEmbedder& emb, const std::string& images_dir,
                            size_t samples) {
    std::cout << "=== Self-Similarity Test ===\n";
    if (index.empty()) {
        std::cout << "Index is empty, skipping\n\n";
        return;
    }

    std::mt19937 rng(7);
    std::uniform_int_distribution<size_t> pick(0, index.size() - 1);

    const size_t n = std::min(samples, index.size());
    for (size_t s = 0; s < n; ++s) {
        const size_t i = pick(rng);
        const std::string& id = index.id_at(i);

        auto path = find_card_image(images_dir, id);
        if (!path) {
            std::cout << "  " << id << ": image not found, skipping\n";
            continue;
        }

        try {
            std::vector<float> fresh = emb.embed(*path);
            normalize_embedding(fresh);
            if (fresh.size() != index.dim()) {
                std::cout << "  " << id << ": embedder returned " << fresh.size() << " components [FAIL]\n";
                continue;
            }
            const float score = dot(index.vector_at(i), fresh.data(), index.dim());
            const char* status = score > 0.99f ? "PASS" : (score > 0.95f ? "WARN" : "FAIL");
            std::cout << "  " << id << ": self-similarity = " << std::fixed << std::setprecision(4) << score
                      << " [" << status << "]\n";
        } catch (const std::exception& e) {
            std::cout << "  " << id << ": FAILED (" << e.what() << ")\n";
        }
    }
    std::cout << "\n";
}

int cmd_verify(int argc, char** argv) {
    try {
        const ScannerConfig cfg = resolve_config(argc, argv);
        std::string index_path = positional(argc, argv);
        if (index_path.empty()) index_path = cfg.output_path;

        const std::string test_image = get_arg(argc, argv, "--test-image", "");
        const bool check_images = has_flag(argc, argv, "--images");
        const size_t samples = get_arg_count(argc, argv, "--samples", 1000);

        std::cout << "=== Embeddings Verification Tool ===\n\n";
        std::cout << "Loading embeddings from: " << index_path << "\n\n";

        DecodeReport decoded;
        const EmbeddingIndex index = read_index_file(index_path, &decoded);

        print_integrity(check_integrity(index, cfg.embedding_dim, decoded));
        print_distribution(score_distribution(index, samples));

        if (!test_image.empty() || check_images) {
            auto emb = make_embedder(cfg);

            if (!test_image.empty()) {
                std::cout << "=== Similarity Search Test ===\n";
                std::cout << "Query image: " << test_image << "\n\n";
                std::vector<float> q = emb->embed(test_image);
                normalize_embedding(q);
                const auto results = find_similar(q, index, 10);
                std::cout << "Top " << results.size() << " matches:\n";
                for (size_t i = 0; i < results.size(); ++i) {
                    std::cout << "  " << (i + 1) << ". " << results[i].card_id << " (score: " << std::fixed
                              << std::setprecision(4) << results[i].score << ")\n";
                }
                std::cout << "\n";
            }

            if (check_images) self_similarity(index, *emb, cfg.images_dir, 5);
        }

        std::cout << "=== Verification Complete ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "verify failed: " << e.what() << "\n";
        return 1;
    }
}
