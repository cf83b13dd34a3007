#pragma once
#include "emb/ImageEmbedder.hpp"
#include "index/EmbeddingIndex.hpp"
#include "index/Similarity.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cardindex {

// Query side: the index is loaded once, each query image is embedded with the
// same generator used at build time and ranked against it.
class CardMatcher {
public:
    CardMatcher(std::shared_ptr<const ImageEmbedder> embedder, EmbeddingIndex index);

    // Throws IndexNotFound / CorruptIndexError.
    static CardMatcher from_file(std::shared_ptr<const ImageEmbedder> embedder, const std::string& index_path);

    std::vector<MatchResult> find_matches(const std::string& image_path, size_t topk) const;

    // Gives up with QueryTimeout once timeout has passed. The abandoned inference
    // keeps running on a detached thread and its result is dropped; call
    // wait_abandoned before process exit so it does not outlive library statics.
    std::vector<MatchResult> find_matches(const std::string& image_path, size_t topk,
                                          std::chrono::milliseconds timeout) const;

    // Embedding runs on its own thread; the matcher must outlive the future.
    std::future<std::vector<MatchResult>> find_matches_async(const std::string& image_path, size_t topk) const;

    // Waits up to budget for inferences abandoned by a timeout. Returns how many
    // are still running.
    size_t wait_abandoned(std::chrono::milliseconds budget) const;

    const EmbeddingIndex& index() const { return m_index; }

private:
    struct Abandoned {
        std::mutex mu;
        std::vector<std::shared_future<std::vector<float>>> pending;
    };

    std::shared_ptr<const ImageEmbedder> m_emb;
    EmbeddingIndex m_index;
    std::shared_ptr<Abandoned> m_abandoned = std::make_shared<Abandoned>();

    std::vector<float> embed_query(const std::string& image_path) const;
    std::future<std::vector<float>> embed_detached(const std::string& image_path) const;
};

}  // namespace cardindex
