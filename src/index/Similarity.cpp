#include "index/Similarity.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

namespace cardindex {

float dot(const float* a, const float* b, size_t dim) {
    double s = 0.0;
    for (size_t i = 0; i < dim; ++i) s += (double)a[i] * (double)b[i];
    return (float)s;
}

std::vector<MatchResult> find_similar(const std::vector<float>& query, const EmbeddingIndex& index, size_t k) {
    std::vector<MatchResult> hits;
    if (index.empty() || k == 0) return hits;

    if (query.size() != index.dim()) {
        throw std::invalid_argument("find_similar: query has " + std::to_string(query.size()) +
                                    " components, index dim is " + std::to_string(index.dim()));
    }

    hits.reserve(index.size());
    for (size_t i = 0; i < index.size(); ++i) {
        hits.push_back({index.id_at(i), dot(query.data(), index.vector_at(i), index.dim())});
    }

    // stable: ties stay in index order. NaN scores sort last.
    auto rank = [](float s) { return std::isnan(s) ? -std::numeric_limits<float>::infinity() : s; };
    std::stable_sort(hits.begin(), hits.end(),
                     [&rank](const MatchResult& a, const MatchResult& b) { return rank(a.score) > rank(b.score); });

    if (hits.size() > k) hits.resize(k);
    return hits;
}

ScoreDistribution score_distribution(const EmbeddingIndex& index, size_t samples, uint32_t seed) {
    ScoreDistribution d;
    if (index.size() < 2 || samples == 0) return d;

    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, index.size() - 1);

    std::vector<float> scores;
    scores.reserve(samples);
    double sum = 0.0;
    for (size_t s = 0; s < samples; ++s) {
        const size_t a = pick(rng);
        size_t b = pick(rng);
        while (b == a) b = pick(rng);

        const float score = dot(index.vector_at(a), index.vector_at(b), index.dim());
        scores.push_back(score);
        sum += score;
    }

    std::sort(scores.begin(), scores.end());
    d.samples = scores.size();
    d.min = scores.front();
    d.max = scores.back();
    d.median = scores[scores.size() / 2];
    d.p10 = scores[(size_t)((double)scores.size() * 0.1)];
    d.p90 = scores[(size_t)((double)scores.size() * 0.9)];
    d.mean = (float)(sum / (double)scores.size());
    return d;
}

}  // namespace cardindex
