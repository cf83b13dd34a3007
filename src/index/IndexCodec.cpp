#include "index/IndexCodec.hpp"
#include "index/Errors.hpp"
#include "io/FileUtil.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

namespace cardindex {

static void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back((uint8_t)(v & 0xff));
    out.push_back((uint8_t)((v >> 8) & 0xff));
    out.push_back((uint8_t)((v >> 16) & 0xff));
    out.push_back((uint8_t)((v >> 24) & 0xff));
}

static void put_f32(std::vector<uint8_t>& out, float f) {
    uint32_t bits = 0;
    std::memcpy(&bits, &f, sizeof(bits));
    put_u32(out, bits);
}

static uint32_t get_u32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static float get_f32(const uint8_t* p) {
    uint32_t bits = get_u32(p);
    float f = 0.0f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

std::vector<uint8_t> encode_index(const EmbeddingIndex& index, EncodeReport* report) {
    EncodeReport rep;

    std::vector<size_t> keep;
    keep.reserve(index.size());
    size_t total = kIndexHeaderBytes;
    for (size_t i = 0; i < index.size(); ++i) {
        const std::string& id = index.id_at(i);
        if (id.size() > kMaxCardIdBytes) {
            const SerializationLimitExceeded warn(id, id.size());
            std::cerr << "warning: " << warn.what() << " (skipped)\n";
            rep.skipped_ids.push_back(id);
            continue;
        }
        keep.push_back(i);
        total += 1 + id.size() + index.dim() * sizeof(float);
    }

    std::vector<uint8_t> out;
    out.reserve(total);

    rep.written = (uint32_t)keep.size();
    put_u32(out, rep.written);
    put_u32(out, (uint32_t)index.dim());

    for (size_t i : keep) {
        const std::string& id = index.id_at(i);
        out.push_back((uint8_t)id.size());
        out.insert(out.end(), id.begin(), id.end());

        const float* v = index.vector_at(i);
        for (size_t j = 0; j < index.dim(); ++j) put_f32(out, v[j]);
    }

    if (report) *report = std::move(rep);
    return out;
}

EmbeddingIndex decode_index(const uint8_t* data, size_t size, DecodeReport* report) {
    size_t off = 0;

    auto need = [&](size_t n, const char* what, uint32_t entry) {
        if (n > size - off) {
            throw CorruptIndexError("truncated embeddings data: need " + std::to_string(n) + " bytes for " +
                                    what + " of entry " + std::to_string(entry) + " at offset " +
                                    std::to_string(off) + ", have " + std::to_string(size - off));
        }
    };

    if (size < kIndexHeaderBytes) {
        throw CorruptIndexError("truncated embeddings header: " + std::to_string(size) + " bytes");
    }

    const uint32_t count = get_u32(data);
    const uint32_t dim = get_u32(data + 4);
    off = kIndexHeaderBytes;

    if (dim == 0 && count > 0) {
        throw CorruptIndexError("embeddings header has dim=0 with " + std::to_string(count) + " entries");
    }

    const uint64_t vec_bytes = (uint64_t)dim * sizeof(float);
    // smallest possible entry is a 1-byte id length plus one vector
    if (count > 0 && vec_bytes + 1 > (uint64_t)(size - kIndexHeaderBytes)) {
        throw CorruptIndexError("embeddings header claims " + std::to_string(count) + " entries of dim=" +
                                std::to_string(dim) + " but only " + std::to_string(size - kIndexHeaderBytes) +
                                " bytes follow");
    }

    EmbeddingIndex idx(dim);
    DecodeReport rep;
    rep.count = count;
    rep.dim = dim;

    std::vector<float> vec;

    for (uint32_t i = 0; i < count; ++i) {
        need(1, "id length", i);
        const size_t len = data[off];
        off += 1;

        need(len, "id", i);
        std::string id((const char*)data + off, len);
        off += len;

        need((size_t)vec_bytes, "vector", i);
        if (vec.empty()) vec.resize(dim);
        for (uint32_t j = 0; j < dim; ++j) {
            vec[j] = get_f32(data + off);
            off += sizeof(float);
        }

        if (idx.contains(id)) ++rep.duplicate_ids;
        idx.insert(id, vec);
    }

    if (off != size) {
        throw CorruptIndexError("embeddings data has " + std::to_string(size - off) +
                                " trailing bytes after " + std::to_string(count) + " entries");
    }

    if (report) *report = rep;
    return idx;
}

EmbeddingIndex decode_index(const std::vector<uint8_t>& buf, DecodeReport* report) {
    return decode_index(buf.data(), buf.size(), report);
}

EncodeReport write_index_file(const std::string& path, const EmbeddingIndex& index) {
    EncodeReport rep;
    const std::vector<uint8_t> buf = encode_index(index, &rep);

    std::string err;
    if (!write_file_durable(path, buf.data(), buf.size(), &err)) throw IndexWriteError(err);
    return rep;
}

static std::vector<uint8_t> read_all_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw IndexNotFound(path);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

EmbeddingIndex read_index_file(const std::string& path, DecodeReport* report) {
    if (!fs::exists(path)) throw IndexNotFound(path);
    const std::vector<uint8_t> buf = read_all_bytes(path);
    try {
        return decode_index(buf, report);
    } catch (const CorruptIndexError& e) {
        throw CorruptIndexError(path + ": " + e.what());
    }
}

std::optional<EmbeddingIndex> try_read_index_file(const std::string& path, DecodeReport* report) {
    if (!fs::exists(path)) return std::nullopt;
    return read_index_file(path, report);
}

}  // namespace cardindex
