#pragma once
#include "index/EmbeddingIndex.hpp"
#include "index/IndexCodec.hpp"

namespace cardindex {

struct IntegrityReport {
    size_t count = 0;
    size_t dim = 0;
    size_t expected_dim = 0;
    uint32_t duplicate_ids = 0;
    double min_norm = 0.0;
    double max_norm = 0.0;
    size_t encoded_bytes = 0;

    bool dim_ok() const { return dim == expected_dim; }
    bool unique_ok() const { return duplicate_ids == 0; }
    // every vector has norm in (0.99, 1.01)
    bool normalized_ok() const { return count == 0 || (min_norm > 0.99 && max_norm < 1.01); }
};

IntegrityReport check_integrity(const EmbeddingIndex& index, size_t expected_dim, const DecodeReport& decoded);

}  // namespace cardindex
