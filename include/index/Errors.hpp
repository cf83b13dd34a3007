#pragma once
#include <stdexcept>
#include <string>

namespace cardindex {

// Image directory is missing. Fatal to a build/update run.
class SourceNotFound : public std::runtime_error {
public:
    explicit SourceNotFound(const std::string& dir)
        : std::runtime_error("card images directory not found: " + dir), m_dir(dir) {}

    const std::string& dir() const { return m_dir; }

private:
    std::string m_dir;
};

// A single image could not be embedded. Caught and counted by the builder.
class EmbeddingFailure : public std::runtime_error {
public:
    EmbeddingFailure(const std::string& card_id, const std::string& why)
        : std::runtime_error(card_id + ": " + why), m_card_id(card_id) {}

    const std::string& card_id() const { return m_card_id; }

private:
    std::string m_card_id;
};

// Card id longer than the u8 length prefix allows. Reported by the writer, never thrown out of it.
class SerializationLimitExceeded : public std::runtime_error {
public:
    SerializationLimitExceeded(const std::string& card_id, size_t bytes)
        : std::runtime_error("card id too long (" + std::to_string(bytes) + " bytes): " + card_id),
          m_card_id(card_id), m_bytes(bytes) {}

    const std::string& card_id() const { return m_card_id; }
    size_t bytes() const { return m_bytes; }

private:
    std::string m_card_id;
    size_t m_bytes = 0;
};

class CorruptIndexError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IndexNotFound : public std::runtime_error {
public:
    explicit IndexNotFound(const std::string& path)
        : std::runtime_error("embeddings file not found: " + path) {}
};

class IndexWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CheckpointReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unsynced progress cannot be trusted after this; the run aborts.
class CheckpointWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class QueryTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace cardindex
