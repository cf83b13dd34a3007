#pragma once
#include <array>
#include <string>

namespace cardindex {

enum class CropMethod { None, Top, Center };

struct PreprocessConfig {
    int image_size = 256;                        // square model input
    CropMethod crop = CropMethod::None;
    std::array<float, 3> mean{{0.0f, 0.0f, 0.0f}}; // RGB, applied after scaling to [0,1]
    std::array<float, 3> stdev{{1.0f, 1.0f, 1.0f}};
};

struct ScannerConfig {
    std::string model_path = "models/mobileclip_s2/vision_model.onnx";
    size_t embedding_dim = 512;
    PreprocessConfig preprocess;

    std::string images_dir = "card-images";
    std::string output_path = "public/embeddings.bin";
    std::string checkpoint_path = "embeddings-checkpoint.json";

    size_t checkpoint_interval = 100; // attempted items between checkpoint saves
    size_t workers = 1;               // concurrent embedding calls
};

const char* crop_method_str(CropMethod m);

// "none" | "top" | "center"; throws std::runtime_error otherwise.
CropMethod parse_crop_method(const std::string& s);

}  // namespace cardindex
