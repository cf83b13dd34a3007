#pragma once
#include "index/EmbeddingIndex.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cardindex {

struct MatchResult {
    std::string card_id;
    float score; // dot(query, vector); cosine similarity for unit vectors
};

// Brute-force top-k by dot product. Both sides are expected to be L2-normalized.
// Equal scores keep the index's insertion order and NaN scores rank last. k is clamped to index.size().
// Empty index -> empty result. Throws std::invalid_argument if a non-empty index
// and the query disagree on dimension.
std::vector<MatchResult> find_similar(const std::vector<float>& query, const EmbeddingIndex& index, size_t k);

float dot(const float* a, const float* b, size_t dim);

struct ScoreDistribution {
    size_t samples = 0;
    float min = 0, p10 = 0, median = 0, mean = 0, p90 = 0, max = 0;
};

// Dot products between random distinct pairs. Needs at least two entries, otherwise samples == 0.
ScoreDistribution score_distribution(const EmbeddingIndex& index, size_t samples, uint32_t seed = 42);

}  // namespace cardindex
