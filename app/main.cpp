#include "commands/build.hpp"
#include "commands/search.hpp"
#include "commands/update.hpp"
#include "commands/verify.hpp"

#include <iostream>
#include <string>

static void print_usage() {
    std::cerr
        << "usage:\n"
        << "  card-index build [options]\n"
        << "  card-index update [options]\n"
        << "  card-index search <image> [options]\n"
        << "  card-index verify [embeddings.bin] [options]\n"
        << "  card-index help\n"
        << "\n"
        << "run `card-index <command> --help` for command options\n";
}

static void print_common_help() {
    std::cerr
        << "config:\n"
        << "  --config <path>              JSON config file (flags override it)\n"
        << "  --model <path>               default: models/mobileclip_s2/vision_model.onnx\n";
}

static void print_batch_help() {
    std::cerr
        << "  --images <dir>               default: card-images\n"
        << "  --out <path>                 default: public/embeddings.bin\n"
        << "  --checkpoint <path>          default: embeddings-checkpoint.json\n"
        << "  --checkpoint-interval <n>    default: 100\n"
        << "  --workers <n>                default: 1\n";
}

static int print_build_help() {
    std::cerr
        << "usage:\n"
        << "  card-index build [options]\n"
        << "\n"
        << "Embeds every card image and writes the binary index. Resumes from\n"
        << "the checkpoint file if one exists.\n"
        << "\n";
    print_common_help();
    std::cerr << "\ninputs/outputs:\n";
    print_batch_help();
    std::cerr << "  --force                      ignore and discard an existing checkpoint\n";
    return 0;
}

static int print_update_help() {
    std::cerr
        << "usage:\n"
        << "  card-index update [options]\n"
        << "\n"
        << "Embeds only images whose card id is not in the existing index.\n"
        << "\n";
    print_common_help();
    std::cerr << "\ninputs/outputs:\n";
    print_batch_help();
    std::cerr << "  --prune                      drop indexed cards whose image is gone\n";
    return 0;
}

static int print_search_help() {
    std::cerr
        << "usage:\n"
        << "  card-index search <image> [options]\n"
        << "\n";
    print_common_help();
    std::cerr
        << "\nsearch:\n"
        << "  --embeddings <path>          default: public/embeddings.bin\n"
        << "  --top <n>                    default: 10\n"
        << "  --timeout-ms <n>             give up on the query after n ms\n";
    return 0;
}

static int print_verify_help() {
    std::cerr
        << "usage:\n"
        << "  card-index verify [embeddings.bin] [options]\n"
        << "\n";
    print_common_help();
    std::cerr
        << "\nchecks:\n"
        << "  --samples <n>                random pairs for the score distribution, default: 1000\n"
        << "  --test-image <path>          run a top-10 search for this image\n"
        << "  --images <dir>               re-embed a few indexed cards and compare\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    const bool want_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "build" && want_help) return print_build_help();
    if (cmd == "update" && want_help) return print_update_help();
    if (cmd == "search" && want_help) return print_search_help();
    if (cmd == "verify" && want_help) return print_verify_help();

    if (cmd == "build") return cmd_build(argc - 1, argv + 1);
    if (cmd == "update") return cmd_update(argc - 1, argv + 1);
    if (cmd == "search") return cmd_search(argc - 1, argv + 1);
    if (cmd == "verify") return cmd_verify(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    print_usage();
    return 2;
}
