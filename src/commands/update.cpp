#include "commands/update.hpp"
#include "commands/CliArgs.hpp"

#include "build/IndexBuilder.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace cardindex;

int cmd_update(int argc, char** argv) {
    try {
        const ScannerConfig cfg = resolve_config(argc, argv);
        const bool prune = has_flag(argc, argv, "--prune");

        std::cout << "=== Incremental Embeddings Update ===\n\n";
        std::cout << "MODEL: " << cfg.model_path << "\n";
        std::cout << "IMAGES: " << cfg.images_dir << "\n";
        std::cout << "OUT: " << cfg.output_path << "\n";
        std::cout << "PRUNE: " << (prune ? "on" : "off") << "\n";
        std::cout << "START FROM: " << initial_state_str(InitialState::FinalIndex) << "\n\n";

        auto embedder = make_embedder(cfg);

        IndexJob job;
        job.images_dir = cfg.images_dir;
        job.output_path = cfg.output_path;
        job.checkpoint_path = cfg.checkpoint_path;
        job.dim = cfg.embedding_dim;
        job.initial = InitialState::FinalIndex;
        job.opts.checkpoint_interval = cfg.checkpoint_interval;
        job.opts.workers = cfg.workers;
        job.opts.prune_missing = prune;

        const MergeStats st = merge_and_persist(job, *embedder);
        if (st.to_process == 0 && st.pruned == 0) {
            std::cout << "No new cards found. Embeddings are up to date!\n";
        }
        print_summary(std::cout, st);

        std::cout << "\nDone!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "update failed: " << e.what() << "\n";
        return 1;
    }
}
