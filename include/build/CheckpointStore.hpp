#pragma once
#include "index/EmbeddingIndex.hpp"
#include "io/JsonIO.hpp"

#include <mutex>
#include <string>

namespace cardindex {

// Durable partial index for long batch runs. The file is overwritten wholesale
// on every save (temp file + rename) and removed once the final index exists.
class CheckpointStore {
public:
    CheckpointStore(std::string path, size_t dim);

    bool exists() const;

    // Empty index when no checkpoint exists. Throws CheckpointReadError.
    EmbeddingIndex load(CheckpointLoadReport* report = nullptr) const;

    // Throws CheckpointWriteError.
    void save(const EmbeddingIndex& index);

    // Returns false if there was nothing to remove. Throws std::filesystem::filesystem_error.
    bool remove();

    const std::string& path() const { return m_path; }
    size_t saves() const { return m_saves; }

private:
    std::string m_path;
    size_t m_dim = 0;
    size_t m_saves = 0;
    std::mutex m_write_mu;
};

}  // namespace cardindex
