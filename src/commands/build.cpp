#include "commands/build.hpp"
#include "commands/CliArgs.hpp"

#include "build/IndexBuilder.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace cardindex;

// Full build. Resumes from the checkpoint when one exists unless --force is given.
int cmd_build(int argc, char** argv) {
    try {
        const ScannerConfig cfg = resolve_config(argc, argv);
        const bool force = has_flag(argc, argv, "--force");

        std::cout << "=== Embeddings Build ===\n\n";
        std::cout << "MODEL: " << cfg.model_path << "\n";
        std::cout << "DIM: " << cfg.embedding_dim << "\n";
        std::cout << "IMAGE_SIZE: " << cfg.preprocess.image_size << "\n";
        std::cout << "CROP: " << crop_method_str(cfg.preprocess.crop) << "\n";
        std::cout << "IMAGES: " << cfg.images_dir << "\n";
        std::cout << "OUT: " << cfg.output_path << "\n";
        std::cout << "CHECKPOINT: " << cfg.checkpoint_path << " (every " << cfg.checkpoint_interval << " images)\n";
        std::cout << "WORKERS: " << cfg.workers << "\n";
        std::cout << "FORCE: " << (force ? "on" : "off") << "\n";
        std::cout << "START FROM: " << initial_state_str(force ? InitialState::Empty : InitialState::Checkpoint)
                  << "\n\n";

        auto embedder = make_embedder(cfg);

        IndexJob job;
        job.images_dir = cfg.images_dir;
        job.output_path = cfg.output_path;
        job.checkpoint_path = cfg.checkpoint_path;
        job.dim = cfg.embedding_dim;
        job.initial = force ? InitialState::Empty : InitialState::Checkpoint;
        job.opts.checkpoint_interval = cfg.checkpoint_interval;
        job.opts.workers = cfg.workers;

        const MergeStats st = merge_and_persist(job, *embedder);
        if (st.source_images == 0) {
            std::cerr << "warning: no card images found in " << cfg.images_dir << "\n";
        }
        print_summary(std::cout, st);

        std::cout << "\nDone!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "build failed: " << e.what() << "\n";
        return 1;
    }
}
