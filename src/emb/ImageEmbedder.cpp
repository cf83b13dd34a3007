#include "emb/ImageEmbedder.hpp"
#include <cmath>

namespace cardindex {

double l2_norm(const float* v, size_t dim) {
    double ss = 0.0;
    for (size_t i = 0; i < dim; ++i) ss += (double)v[i] * (double)v[i];
    return std::sqrt(ss);
}

void normalize_embedding(std::vector<float>& v) {
    const double norm = l2_norm(v.data(), v.size());
    if (norm <= 1e-12) return;
    if (std::fabs(norm - 1.0) <= 1e-6) return;

    const double inv = 1.0 / norm;
    for (float& x : v) x = (float)(x * inv);
}

}  // namespace cardindex
