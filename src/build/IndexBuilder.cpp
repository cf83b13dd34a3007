#include "build/IndexBuilder.hpp"
#include "index/Errors.hpp"
#include "index/IndexCodec.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace cardindex {

const char* initial_state_str(InitialState s) {
    switch (s) {
        case InitialState::Empty: return "empty";
        case InitialState::Checkpoint: return "checkpoint";
        case InitialState::FinalIndex: return "final-index";
        default: return "unknown";
    }
}

static void overlay(EmbeddingIndex& dst, const EmbeddingIndex& src) {
    for (size_t i = 0; i < src.size(); ++i) dst.insert(src.id_at(i), src.vector_at(i));
}

static EmbeddingIndex load_checkpoint_state(CheckpointStore& checkpoint, size_t dim) {
    if (!checkpoint.exists()) {
        std::cout << "No checkpoint file found. Starting fresh.\n";
        return EmbeddingIndex(dim);
    }

    std::cout << "Loading checkpoint...\n";
    CheckpointLoadReport rep;
    EmbeddingIndex idx = checkpoint.load(&rep);
    std::cout << "Loaded " << rep.loaded << " embeddings from checkpoint";
    if (!rep.skipped.empty()) std::cout << " (" << rep.skipped.size() << " malformed entries skipped)";
    std::cout << "\n";
    return idx;
}

EmbeddingIndex load_initial_state(InitialState initial, const std::string& output_path,
                                  CheckpointStore& checkpoint, size_t dim) {
    switch (initial) {
        case InitialState::Empty: {
            if (checkpoint.exists()) {
                std::cout << "Discarding existing checkpoint: " << checkpoint.path() << "\n";
                checkpoint.remove();
            }
            return EmbeddingIndex(dim);
        }

        case InitialState::Checkpoint:
            return load_checkpoint_state(checkpoint, dim);

        case InitialState::FinalIndex: {
            std::cout << "Loading existing embeddings...\n";
            auto existing = try_read_index_file(output_path);
            EmbeddingIndex idx(dim);
            if (existing && !existing->empty()) {
                if (existing->dim() != dim) {
                    throw std::runtime_error("existing index " + output_path + " has dim=" +
                                             std::to_string(existing->dim()) + ", expected " + std::to_string(dim) +
                                             "; rebuild it with --force");
                }
                idx = std::move(*existing);
            }
            std::cout << "Existing embeddings: " << idx.size() << "\n";

            if (checkpoint.exists()) {
                EmbeddingIndex ck = load_checkpoint_state(checkpoint, dim);
                overlay(idx, ck);
            }
            return idx;
        }
    }
    throw std::logic_error("load_initial_state: unhandled initial state");
}

namespace {

struct EmbedOutcome {
    bool ok = false;
    std::vector<float> vec;
    std::string error;
};

// Any std::exception from the embedder becomes a per-item failure. Anything
// else propagates and aborts the run.
EmbedOutcome embed_one(const ImageEmbedder& embedder, const CardImage& img, size_t dim) {
    EmbedOutcome out;
    try {
        std::vector<float> v = embedder.embed(img.path);
        if (v.empty()) throw EmbeddingFailure(img.card_id, "embedder returned no output");
        if (v.size() != dim) {
            throw EmbeddingFailure(img.card_id, "embedder returned " + std::to_string(v.size()) +
                                                    " components, expected " + std::to_string(dim));
        }
        for (float x : v) {
            if (!std::isfinite(x)) throw EmbeddingFailure(img.card_id, "non-finite component");
        }
        normalize_embedding(v);
        out.vec = std::move(v);
        out.ok = true;
    } catch (const EmbeddingFailure& e) {
        out.error = e.what();
    } catch (const std::exception& e) {
        out.error = EmbeddingFailure(img.card_id, e.what()).what();
    }
    return out;
}

}  // namespace

MergeStats merge_new_images(EmbeddingIndex& state, const std::vector<CardImage>& sources,
                            const ImageEmbedder& embedder, const MergeOptions& opts,
                            CheckpointStore* checkpoint) {
    MergeStats st;
    st.source_images = sources.size();
    st.loaded = state.size();

    const auto t0 = std::chrono::steady_clock::now();

    std::unordered_set<std::string> seen;
    std::vector<const CardImage*> todo;
    for (const auto& img : sources) {
        if (!seen.insert(img.card_id).second) {
            ++st.duplicate_sources;
            std::cerr << "warning: duplicate image for card " << img.card_id << ", ignoring " << img.path << "\n";
            continue;
        }
        if (!state.contains(img.card_id)) todo.push_back(&img);
    }

    if (opts.prune_missing) {
        std::vector<std::string> stale;
        for (const auto& id : state.card_ids()) {
            if (seen.find(id) == seen.end()) stale.push_back(id);
        }
        for (const auto& id : stale) {
            state.erase(id);
            std::cout << "Pruned: " << id << "\n";
        }
        st.pruned = stale.size();
    }

    st.to_process = todo.size();
    std::cout << "Already processed: " << (seen.size() - todo.size()) << "\n";
    std::cout << "To process: " << todo.size() << "\n";

    const size_t workers = std::max<size_t>(1, opts.workers);
    const size_t dim = state.dim();
    size_t since_checkpoint = 0;

    for (size_t begin = 0; begin < todo.size(); begin += workers) {
        const size_t end = std::min(todo.size(), begin + workers);

        std::vector<EmbedOutcome> outcomes;
        outcomes.reserve(end - begin);
        if (workers == 1) {
            outcomes.push_back(embed_one(embedder, *todo[begin], dim));
        } else {
            std::vector<std::future<EmbedOutcome>> wave;
            wave.reserve(end - begin);
            for (size_t i = begin; i < end; ++i) {
                const CardImage* img = todo[i];
                wave.push_back(std::async(std::launch::async,
                                          [&embedder, img, dim]() { return embed_one(embedder, *img, dim); }));
            }
            for (auto& f : wave) outcomes.push_back(f.get());
        }

        for (size_t i = begin; i < end; ++i) {
            const CardImage& img = *todo[i];
            EmbedOutcome& r = outcomes[i - begin];

            std::cout << "[" << (i + 1) << "/" << todo.size() << "] " << img.card_id;
            if (r.ok) {
                state.insert(img.card_id, r.vec);
                ++st.processed;
                std::cout << " done\n";
            } else {
                ++st.failed;
                st.failed_ids.push_back(img.card_id);
                std::cout << " FAILED\n";
                std::cerr << "error: embedding failed: " << r.error << "\n";
            }

            ++since_checkpoint;
            if (checkpoint && opts.checkpoint_interval > 0 && since_checkpoint >= opts.checkpoint_interval) {
                checkpoint->save(state);
                ++st.checkpoints_written;
                since_checkpoint = 0;
            }
        }
    }

    st.index_size = state.size();
    st.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    return st;
}

MergeStats merge_and_persist(const IndexJob& job, const ImageEmbedder& embedder) {
    const auto t0 = std::chrono::steady_clock::now();

    std::cout << "Scanning for card images...\n";
    const std::vector<CardImage> sources = scan_card_images(job.images_dir);
    std::cout << "Found " << sources.size() << " card images\n";

    CheckpointStore checkpoint(job.checkpoint_path, job.dim);
    EmbeddingIndex state = load_initial_state(job.initial, job.output_path, checkpoint, job.dim);

    MergeStats st = merge_new_images(state, sources, embedder, job.opts, &checkpoint);

    std::cout << "Writing binary embeddings file...\n";
    const EncodeReport rep = write_index_file(job.output_path, state);
    st.skipped_oversized = rep.skipped_ids.size();
    std::cout << "Wrote " << job.output_path << " (" << rep.written << " cards)\n";

    // only now is it safe to drop the checkpoint
    if (checkpoint.remove()) {
        std::cout << "Checkpoint file removed.\n";
    }

    st.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    return st;
}

std::string format_elapsed(double seconds) {
    const long long s = (long long)seconds;
    if (s < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << seconds << "s";
        return oss.str();
    }
    const long long mins = s / 60;
    const long long secs = s % 60;
    if (mins < 60) return std::to_string(mins) + "m " + std::to_string(secs) + "s";
    return std::to_string(mins / 60) + "h " + std::to_string(mins % 60) + "m " + std::to_string(secs) + "s";
}

void print_summary(std::ostream& os, const MergeStats& st) {
    os << "\n";
    os << "Processed: " << st.processed << "\n";
    os << "Failed: " << st.failed << "\n";
    if (st.pruned > 0) os << "Pruned: " << st.pruned << "\n";
    if (st.skipped_oversized > 0) os << "Skipped (id too long): " << st.skipped_oversized << "\n";
    os << "Index size: " << st.index_size << "\n";
    os << "Elapsed: " << format_elapsed(st.elapsed_seconds) << "\n";
}

}  // namespace cardindex
