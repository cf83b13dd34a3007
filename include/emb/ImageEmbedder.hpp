#pragma once
#include <string>
#include <vector>

namespace cardindex {

// Produces one embedding per card image. Implementations must be safe to call
// from several threads at once when the builder runs with workers > 1.
class ImageEmbedder {
public:
    virtual ~ImageEmbedder() = default;

    // Embedding for the image at image_path. May throw; the builder treats any
    // exception or empty/wrong-length output as a per-item failure.
    virtual std::vector<float> embed(const std::string& image_path) const = 0;

    virtual size_t dim() const = 0;
};

// Rescales v to unit length unless it is already unit length (within 1e-6)
// or its norm is ~0, in which case the zero vector is kept as is.
void normalize_embedding(std::vector<float>& v);

double l2_norm(const float* v, size_t dim);

}  // namespace cardindex
