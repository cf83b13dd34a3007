#pragma once
#include "build/CheckpointStore.hpp"
#include "cards/SourceEnumerator.hpp"
#include "emb/ImageEmbedder.hpp"
#include "index/EmbeddingIndex.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace cardindex {

// What the merge starts from. Build, resume and update are the same merge
// against a different initial state.
enum class InitialState {
    Empty,      // forced rebuild; an existing checkpoint is discarded
    Checkpoint, // build / resume: checkpoint if present, else empty
    FinalIndex, // incremental update: existing index file, overlaid with a checkpoint if present
};

struct MergeOptions {
    size_t checkpoint_interval = 100; // attempted items between saves; 0 disables periodic saves
    size_t workers = 1;               // max concurrent embed calls
    bool prune_missing = false;       // drop ids that no longer have a source image
};

struct MergeStats {
    size_t source_images = 0;
    size_t duplicate_sources = 0; // images that decode to an id seen earlier in the scan
    size_t loaded = 0;            // entries in the initial state
    size_t pruned = 0;
    size_t to_process = 0;
    size_t processed = 0;
    size_t failed = 0;
    size_t checkpoints_written = 0;
    size_t skipped_oversized = 0; // ids left out of the index file
    size_t index_size = 0;        // entries in the merged state
    double elapsed_seconds = 0.0;
    std::vector<std::string> failed_ids;
};

struct IndexJob {
    std::string images_dir;
    std::string output_path;
    std::string checkpoint_path;
    size_t dim = 512;
    InitialState initial = InitialState::Checkpoint;
    MergeOptions opts;
};

const char* initial_state_str(InitialState s);

// Loads the state a merge starts from. Throws CorruptIndexError / CheckpointReadError,
// or std::runtime_error if an existing index has a different dimension.
EmbeddingIndex load_initial_state(InitialState initial, const std::string& output_path,
                                  CheckpointStore& checkpoint, size_t dim);

// Embeds every source image whose id is not in state and inserts the result.
// Per-item failures are logged and counted. If checkpoint is non-null the full
// state is saved every opts.checkpoint_interval attempted items (coordinator
// thread only). Results are merged in source order regardless of opts.workers.
MergeStats merge_new_images(EmbeddingIndex& state, const std::vector<CardImage>& sources,
                            const ImageEmbedder& embedder, const MergeOptions& opts,
                            CheckpointStore* checkpoint);

// scan -> load initial state -> merge -> write index file -> remove checkpoint.
// The checkpoint is only removed after the index file was written.
// Throws SourceNotFound, CorruptIndexError, CheckpointReadError,
// CheckpointWriteError, IndexWriteError.
MergeStats merge_and_persist(const IndexJob& job, const ImageEmbedder& embedder);

std::string format_elapsed(double seconds);

void print_summary(std::ostream& os, const MergeStats& st);

}  // namespace cardindex
