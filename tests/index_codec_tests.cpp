#include <catch2/catch.hpp>

#include "index/Errors.hpp"
#include "index/IndexCodec.hpp"
#include "io/FileUtil.hpp"
#include "tests/common/test_util.hpp"

#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;
using namespace cardindex;
using namespace cardindex::test;

namespace {

EmbeddingIndex SampleIndex() {
    EmbeddingIndex idx(3);
    idx.insert("base1-4", std::vector<float>{1.0f, 0.0f, 0.0f});
    idx.insert("sv4pt5-1/2", std::vector<float>{0.0f, 0.6f, 0.8f});
    idx.insert("pokémon-7", std::vector<float>{-0.5f, 0.5f, 0.70710678f});
    return idx;
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((uint8_t)((v >> (8 * i)) & 0xff));
}

void PutEntry(std::vector<uint8_t>& out, const std::string& id, const std::vector<float>& v) {
    out.push_back((uint8_t)id.size());
    out.insert(out.end(), id.begin(), id.end());
    for (float f : v) {
        uint32_t bits = 0;
        std::memcpy(&bits, &f, sizeof(bits));
        PutU32(out, bits);
    }
}

}  // namespace

TEST_CASE("Encoded layout is little-endian count, dim, then entries", "[codec]") {
    EmbeddingIndex idx(2);
    idx.insert("a", std::vector<float>{1.0f, -2.0f});

    const std::vector<uint8_t> buf = encode_index(idx);
    const std::vector<uint8_t> expected = {
        0x01, 0x00, 0x00, 0x00,  // count
        0x02, 0x00, 0x00, 0x00,  // dim
        0x01, 'a',               // id
        0x00, 0x00, 0x80, 0x3f,  // 1.0f
        0x00, 0x00, 0x00, 0xc0,  // -2.0f
    };
    REQUIRE(buf == expected);
}

TEST_CASE("Decode restores ids, order and exact floats", "[codec]") {
    const EmbeddingIndex idx = SampleIndex();

    DecodeReport rep;
    const EmbeddingIndex back = decode_index(encode_index(idx), &rep);

    REQUIRE(rep.count == 3);
    REQUIRE(rep.dim == 3);
    REQUIRE(rep.duplicate_ids == 0);
    REQUIRE(back.card_ids() == idx.card_ids());
    REQUIRE(back.approx_equal(idx, 0.0f));
}

TEST_CASE("Header-only buffer decodes to an empty index", "[codec]") {
    std::vector<uint8_t> buf;
    PutU32(buf, 0);
    PutU32(buf, 512);

    const EmbeddingIndex idx = decode_index(buf);
    REQUIRE(idx.empty());
    REQUIRE(idx.dim() == 512);
}

TEST_CASE("Every truncation point is reported as corrupt", "[codec][corruption]") {
    const std::vector<uint8_t> full = encode_index(SampleIndex());

    for (size_t n = 0; n < full.size(); ++n) {
        INFO("truncated to " << n << " bytes");
        REQUIRE_THROWS_AS(decode_index(full.data(), n), CorruptIndexError);
    }
}

TEST_CASE("Trailing bytes are corrupt", "[codec][corruption]") {
    std::vector<uint8_t> buf = encode_index(SampleIndex());
    buf.push_back(0);
    REQUIRE_THROWS_AS(decode_index(buf), CorruptIndexError);
}

TEST_CASE("Zero dimension with entries is corrupt", "[codec][corruption]") {
    std::vector<uint8_t> buf;
    PutU32(buf, 1);
    PutU32(buf, 0);
    buf.push_back(1);
    buf.push_back('x');
    REQUIRE_THROWS_AS(decode_index(buf), CorruptIndexError);
}

TEST_CASE("Huge header count does not over-read", "[codec][corruption]") {
    std::vector<uint8_t> buf;
    PutU32(buf, 0xffffffffu);
    PutU32(buf, 4);
    PutEntry(buf, "a", {1, 0, 0, 0});
    REQUIRE_THROWS_AS(decode_index(buf), CorruptIndexError);
}

TEST_CASE("Oversized header dim fails before allocating", "[codec][corruption]") {
    // count=1, dim=2^30, one trailing byte
    const std::vector<uint8_t> huge_dim = {1, 0, 0, 0, 0, 0, 0, 0x40, 0};
    REQUIRE_THROWS_AS(decode_index(huge_dim), CorruptIndexError);

    std::vector<uint8_t> buf;
    PutU32(buf, 2);
    PutU32(buf, 0x7fffffffu);
    PutEntry(buf, "a", {});
    REQUIRE_THROWS_AS(decode_index(buf), CorruptIndexError);
}

TEST_CASE("Empty index with a huge dim decodes without allocating", "[codec]") {
    const std::vector<uint8_t> buf = {0, 0, 0, 0, 0xff, 0xff, 0xff, 0x7f};
    const EmbeddingIndex idx = decode_index(buf);
    REQUIRE(idx.empty());
    REQUIRE(idx.dim() == 0x7fffffffu);
}

TEST_CASE("512-dim unit vectors survive encode and decode", "[codec]") {
    constexpr size_t kDim = 512;
    EmbeddingIndex idx(kDim);
    for (int i = 0; i < 40; ++i) {
        const std::string id = "sv" + std::to_string(i) + "-" + std::to_string(i * 7) + "/ñ";
        std::vector<float> v = StemVector(id, kDim);
        normalize_embedding(v);
        idx.insert(id, v);
    }

    DecodeReport rep;
    const EmbeddingIndex back = decode_index(encode_index(idx), &rep);
    REQUIRE(rep.count == 40);
    REQUIRE(rep.dim == kDim);
    REQUIRE(back.approx_equal(idx, 1e-6f));
    for (size_t i = 0; i < back.size(); ++i) {
        REQUIRE(l2_norm(back.vector_at(i), kDim) == Approx(1.0).margin(1e-5));
    }
}

TEST_CASE("Id length limit counts UTF-8 bytes, not characters", "[codec]") {
    std::string wide;
    for (int i = 0; i < 128; ++i) wide += "\xc3\xa9"; // 128 x U+00E9, 256 bytes
    std::string fits;
    for (int i = 0; i < 127; ++i) fits += "\xc3\xa9"; // 254 bytes
    REQUIRE(wide.size() == 256);

    EmbeddingIndex idx(2);
    idx.insert("before", std::vector<float>{1.0f, 0.0f});
    idx.insert(wide, std::vector<float>{0.0f, 1.0f});
    idx.insert(fits, std::vector<float>{0.6f, 0.8f});

    EncodeReport enc;
    const std::vector<uint8_t> buf = encode_index(idx, &enc);
    REQUIRE(enc.written == 2);
    REQUIRE(enc.skipped_ids == std::vector<std::string>{wide});
    REQUIRE(buf[0] == 2);
    REQUIRE(buf[1] == 0);

    DecodeReport dec;
    const EmbeddingIndex back = decode_index(buf, &dec);
    REQUIRE(dec.count == 2);
    REQUIRE(back.card_ids() == std::vector<std::string>{"before", fits});
}

TEST_CASE("Durable write leaves only the final file", "[codec][file]") {
    const std::string dir = TempDir("card-index-durable");
    const std::string path = (fs::path(dir) / "deep" / "out.bin").string();
    const std::string payload = "payload";

    std::string err;
    REQUIRE(write_file_durable(path, payload.data(), payload.size(), &err));
    REQUIRE(err.empty());
    REQUIRE(ReadText(path) == payload);
    REQUIRE_FALSE(fs::exists(path + ".tmp"));
    REQUIRE(fsync_parent_dir(path));

    const std::string blocker = (fs::path(dir) / "blocker").string();
    TouchFile(blocker);
    REQUIRE_FALSE(write_file_durable((fs::path(blocker) / "x.bin").string(), payload.data(), payload.size(), &err));
    REQUIRE_FALSE(err.empty());

    fs::remove_all(dir);
}

TEST_CASE("Duplicate ids in a file collapse to the last vector", "[codec]") {
    std::vector<uint8_t> buf;
    PutU32(buf, 3);
    PutU32(buf, 2);
    PutEntry(buf, "dup", {1.0f, 0.0f});
    PutEntry(buf, "other", {0.5f, 0.5f});
    PutEntry(buf, "dup", {0.0f, 1.0f});

    DecodeReport rep;
    const EmbeddingIndex idx = decode_index(buf, &rep);

    REQUIRE(idx.size() == 2);
    REQUIRE(rep.duplicate_ids == 1);
    REQUIRE(idx.id_at(0) == "dup");
    REQUIRE(idx.find("dup")[0] == 0.0f);
    REQUIRE(idx.find("dup")[1] == 1.0f);
}

TEST_CASE("Ids over 255 bytes are skipped by the writer", "[codec]") {
    EmbeddingIndex idx(2);
    idx.insert("ok", std::vector<float>{1.0f, 0.0f});
    idx.insert(std::string(256, 'x'), std::vector<float>{0.0f, 1.0f});
    idx.insert(std::string(255, 'y'), std::vector<float>{0.6f, 0.8f});

    EncodeReport rep;
    const EmbeddingIndex back = decode_index(encode_index(idx, &rep));

    REQUIRE(rep.written == 2);
    REQUIRE(rep.skipped_ids.size() == 1);
    REQUIRE(rep.skipped_ids[0].size() == 256);
    REQUIRE(back.size() == 2);
    REQUIRE(back.contains("ok"));
    REQUIRE(back.contains(std::string(255, 'y')));
}

TEST_CASE("Index file write is atomic and creates parent directories", "[codec][file]") {
    const std::string dir = TempDir("card-index-codec");
    const std::string path = (fs::path(dir) / "public" / "embeddings.bin").string();

    write_index_file(path, SampleIndex());
    REQUIRE(fs::exists(path));
    REQUIRE_FALSE(fs::exists(path + ".tmp"));

    const EmbeddingIndex back = read_index_file(path);
    REQUIRE(back.approx_equal(SampleIndex(), 0.0f));

    // overwrite with a smaller index
    EmbeddingIndex one(3);
    one.insert("only", std::vector<float>{0.0f, 0.0f, 1.0f});
    write_index_file(path, one);
    REQUIRE(read_index_file(path).size() == 1);

    fs::remove_all(dir);
}

TEST_CASE("Missing and corrupt index files", "[codec][file]") {
    const std::string dir = TempDir("card-index-codec");
    const std::string path = (fs::path(dir) / "embeddings.bin").string();

    REQUIRE_THROWS_AS(read_index_file(path), IndexNotFound);
    REQUIRE_FALSE(try_read_index_file(path).has_value());

    WriteText(path, "abc");
    REQUIRE_THROWS_AS(read_index_file(path), CorruptIndexError);
    REQUIRE_THROWS_AS(try_read_index_file(path), CorruptIndexError);

    fs::remove_all(dir);
}

TEST_CASE("Writing into a path under a regular file fails", "[codec][file]") {
    const std::string dir = TempDir("card-index-codec");
    const std::string blocker = (fs::path(dir) / "blocker").string();
    TouchFile(blocker);

    REQUIRE_THROWS_AS(write_index_file((fs::path(blocker) / "embeddings.bin").string(), SampleIndex()),
                      IndexWriteError);

    fs::remove_all(dir);
}
