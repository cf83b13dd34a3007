#include "index/EmbeddingIndex.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cardindex {

void EmbeddingIndex::insert(const std::string& card_id, const std::vector<float>& vec) {
    if (vec.size() != m_dim) {
        throw std::invalid_argument("EmbeddingIndex: vector for '" + card_id + "' has " +
                                    std::to_string(vec.size()) + " components, expected " +
                                    std::to_string(m_dim));
    }
    insert(card_id, vec.data());
}

void EmbeddingIndex::insert(const std::string& card_id, const float* vec) {
    auto it = m_pos.find(card_id);
    if (it != m_pos.end()) {
        std::copy(vec, vec + m_dim, m_vecs.begin() + (std::ptrdiff_t)(it->second * m_dim));
        return;
    }

    m_pos.emplace(card_id, m_card_ids.size());
    m_card_ids.push_back(card_id);
    m_vecs.insert(m_vecs.end(), vec, vec + m_dim);
}

bool EmbeddingIndex::contains(const std::string& card_id) const {
    return m_pos.find(card_id) != m_pos.end();
}

bool EmbeddingIndex::erase(const std::string& card_id) {
    auto it = m_pos.find(card_id);
    if (it == m_pos.end()) return false;

    const size_t i = it->second;
    m_card_ids.erase(m_card_ids.begin() + (std::ptrdiff_t)i);
    m_vecs.erase(m_vecs.begin() + (std::ptrdiff_t)(i * m_dim),
                 m_vecs.begin() + (std::ptrdiff_t)((i + 1) * m_dim));

    m_pos.erase(it);
    for (auto& kv : m_pos) {
        if (kv.second > i) --kv.second;
    }
    return true;
}

void EmbeddingIndex::clear() {
    m_card_ids.clear();
    m_vecs.clear();
    m_pos.clear();
}

const float* EmbeddingIndex::find(const std::string& card_id) const {
    auto it = m_pos.find(card_id);
    if (it == m_pos.end()) return nullptr;
    return vector_at(it->second);
}

std::vector<float> EmbeddingIndex::vector_copy(size_t i) const {
    const float* v = vector_at(i);
    return std::vector<float>(v, v + m_dim);
}

bool EmbeddingIndex::approx_equal(const EmbeddingIndex& other, float tol) const {
    if (m_dim != other.m_dim || m_card_ids != other.m_card_ids) return false;
    for (size_t i = 0; i < m_vecs.size(); ++i) {
        if (std::fabs(m_vecs[i] - other.m_vecs[i]) > tol) return false;
    }
    return true;
}

}  // namespace cardindex
