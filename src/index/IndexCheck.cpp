#include "index/IndexCheck.hpp"
#include "emb/ImageEmbedder.hpp"

#include <algorithm>
#include <limits>

namespace cardindex {

IntegrityReport check_integrity(const EmbeddingIndex& index, size_t expected_dim, const DecodeReport& decoded) {
    IntegrityReport r;
    r.count = index.size();
    r.dim = index.dim();
    r.expected_dim = expected_dim;
    r.duplicate_ids = decoded.duplicate_ids;

    r.encoded_bytes = kIndexHeaderBytes;
    double lo = std::numeric_limits<double>::infinity();
    double hi = 0.0;
    for (size_t i = 0; i < index.size(); ++i) {
        const double n = l2_norm(index.vector_at(i), index.dim());
        lo = std::min(lo, n);
        hi = std::max(hi, n);
        r.encoded_bytes += 1 + index.id_at(i).size() + index.dim() * sizeof(float);
    }
    if (index.size() > 0) {
        r.min_norm = lo;
        r.max_norm = hi;
    }
    return r;
}

}  // namespace cardindex
