#pragma once
#include "index/EmbeddingIndex.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cardindex {

// Binary layout (little-endian, no padding, no checksum):
//   u32 count
//   u32 dim
//   count x { u8 id_len, id_len bytes UTF-8 id, dim x f32 }
constexpr size_t kMaxCardIdBytes = 255;
constexpr size_t kIndexHeaderBytes = 8;

struct EncodeReport {
    uint32_t written = 0;
    std::vector<std::string> skipped_ids; // ids over kMaxCardIdBytes
};

struct DecodeReport {
    uint32_t count = 0;        // header count
    uint32_t dim = 0;
    uint32_t duplicate_ids = 0; // entries that overwrote an earlier id
};

// Oversized ids are skipped with a warning on stderr and excluded from count.
std::vector<uint8_t> encode_index(const EmbeddingIndex& index, EncodeReport* report = nullptr);

// Throws CorruptIndexError on truncation, dim == 0 with entries, or trailing bytes.
// Header fields are checked against the buffer size before anything is allocated.
EmbeddingIndex decode_index(const uint8_t* data, size_t size, DecodeReport* report = nullptr);
EmbeddingIndex decode_index(const std::vector<uint8_t>& buf, DecodeReport* report = nullptr);

// Encodes into one buffer, writes and fdatasyncs <path>.tmp, renames it over
// path and syncs the directory. Returns only once the file is on disk.
// Throws IndexWriteError.
EncodeReport write_index_file(const std::string& path, const EmbeddingIndex& index);

// Throws IndexNotFound / CorruptIndexError.
EmbeddingIndex read_index_file(const std::string& path, DecodeReport* report = nullptr);

// Empty when the file does not exist; a corrupt file still throws.
std::optional<EmbeddingIndex> try_read_index_file(const std::string& path, DecodeReport* report = nullptr);

}  // namespace cardindex
