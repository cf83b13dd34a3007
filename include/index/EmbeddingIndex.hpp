#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace cardindex {

// Ordered card_id -> vector map. Vectors are stored packed, vectors[i] belongs to ids[i].
// Iteration order is insertion order; re-inserting an id replaces its vector in place.
class EmbeddingIndex {
public:
    EmbeddingIndex() = default;
    explicit EmbeddingIndex(size_t dim) : m_dim(dim) {}

    // Throws std::invalid_argument if vec.size() != dim().
    void insert(const std::string& card_id, const std::vector<float>& vec);
    void insert(const std::string& card_id, const float* vec);

    bool contains(const std::string& card_id) const;
    bool erase(const std::string& card_id);
    void clear();

    // nullptr when absent
    const float* find(const std::string& card_id) const;

    const std::string& id_at(size_t i) const { return m_card_ids[i]; }
    const float* vector_at(size_t i) const { return &m_vecs[i * m_dim]; }
    std::vector<float> vector_copy(size_t i) const;

    const std::vector<std::string>& card_ids() const { return m_card_ids; }

    size_t dim() const { return m_dim; }
    size_t size() const { return m_card_ids.size(); }
    bool empty() const { return m_card_ids.empty(); }

    // Same ids in the same order with per-component difference <= tol.
    bool approx_equal(const EmbeddingIndex& other, float tol) const;

private:
    size_t m_dim = 0;
    std::vector<std::string> m_card_ids;
    std::vector<float> m_vecs; // packed: size = size()*dim()
    std::unordered_map<std::string, size_t> m_pos;
};

}  // namespace cardindex
