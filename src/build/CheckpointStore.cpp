#include "build/CheckpointStore.hpp"
#include "index/Errors.hpp"
#include "io/FileUtil.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cardindex {

CheckpointStore::CheckpointStore(std::string path, size_t dim) : m_path(std::move(path)), m_dim(dim) {}

bool CheckpointStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(m_path, ec);
}

EmbeddingIndex CheckpointStore::load(CheckpointLoadReport* report) const {
    if (!exists()) return EmbeddingIndex(m_dim);

    std::ifstream in(m_path);
    if (!in) throw CheckpointReadError("failed to open checkpoint: " + m_path);
    std::ostringstream ss;
    ss << in.rdbuf();

    CheckpointLoadReport rep;
    EmbeddingIndex idx = parseCheckpointJson(ss.str(), m_dim, &rep);

    for (const auto& s : rep.skipped) {
        std::cerr << "checkpoint: skipping malformed entry " << s << "\n";
    }

    if (report) *report = std::move(rep);
    return idx;
}

void CheckpointStore::save(const EmbeddingIndex& index) {
    std::lock_guard<std::mutex> lock(m_write_mu);

    const std::string text = checkpointToJson(index);
    std::string err;
    if (!write_file_durable(m_path, text.data(), text.size(), &err)) {
        throw CheckpointWriteError("checkpoint " + m_path + ": " + err);
    }

    ++m_saves;
    std::cout << "Checkpoint saved: " << index.size() << " cards\n";
}

bool CheckpointStore::remove() {
    return fs::remove(m_path);
}

}  // namespace cardindex
