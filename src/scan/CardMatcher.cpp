#include "scan/CardMatcher.hpp"
#include "index/Errors.hpp"
#include "index/IndexCodec.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace cardindex {

CardMatcher::CardMatcher(std::shared_ptr<const ImageEmbedder> embedder, EmbeddingIndex index)
    : m_emb(std::move(embedder)), m_index(std::move(index)) {
    if (!m_emb) throw std::invalid_argument("CardMatcher: embedder is null");
}

CardMatcher CardMatcher::from_file(std::shared_ptr<const ImageEmbedder> embedder, const std::string& index_path) {
    return CardMatcher(std::move(embedder), read_index_file(index_path));
}

std::vector<float> CardMatcher::embed_query(const std::string& image_path) const {
    std::vector<float> q = m_emb->embed(image_path);
    if (q.empty()) throw std::runtime_error("embedder returned no output for " + image_path);
    normalize_embedding(q);
    return q;
}

std::vector<MatchResult> CardMatcher::find_matches(const std::string& image_path, size_t topk) const {
    if (m_index.empty()) return {};
    return find_similar(embed_query(image_path), m_index, topk);
}

std::future<std::vector<float>> CardMatcher::embed_detached(const std::string& image_path) const {
    auto emb = m_emb;
    auto task = std::make_shared<std::packaged_task<std::vector<float>()>>(
        [emb, image_path]() { return emb->embed(image_path); });
    std::future<std::vector<float>> fut = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    return fut;
}

std::vector<MatchResult> CardMatcher::find_matches(const std::string& image_path, size_t topk,
                                                   std::chrono::milliseconds timeout) const {
    if (m_index.empty()) return {};

    std::future<std::vector<float>> fut = embed_detached(image_path);
    if (fut.wait_for(timeout) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(m_abandoned->mu);
            m_abandoned->pending.push_back(fut.share());
        }
        throw QueryTimeout("embedding " + image_path + " did not finish within " +
                           std::to_string(timeout.count()) + " ms");
    }

    std::vector<float> q = fut.get();
    if (q.empty()) throw std::runtime_error("embedder returned no output for " + image_path);
    normalize_embedding(q);
    return find_similar(q, m_index, topk);
}

size_t CardMatcher::wait_abandoned(std::chrono::milliseconds budget) const {
    std::lock_guard<std::mutex> lock(m_abandoned->mu);
    auto& pending = m_abandoned->pending;

    const auto deadline = std::chrono::steady_clock::now() + budget;
    pending.erase(std::remove_if(pending.begin(), pending.end(),
                                 [&deadline](const std::shared_future<std::vector<float>>& f) {
                                     return f.wait_until(deadline) == std::future_status::ready;
                                 }),
                  pending.end());
    return pending.size();
}

std::future<std::vector<MatchResult>> CardMatcher::find_matches_async(const std::string& image_path,
                                                                      size_t topk) const {
    return std::async(std::launch::async, [this, image_path, topk]() { return find_matches(image_path, topk); });
}

}  // namespace cardindex
