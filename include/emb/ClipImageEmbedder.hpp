#pragma once
#include "config/ScannerConfig.hpp"
#include "emb/ImageEmbedder.hpp"

#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>

namespace cardindex {

// MobileCLIP-style vision encoder exported to ONNX: one NCHW float input,
// one [1, dim] (or [dim]) image embedding output.
class ClipImageEmbedder final : public ImageEmbedder {
public:
    explicit ClipImageEmbedder(PreprocessConfig pre = PreprocessConfig{}, size_t dim = 512);

    bool init(const std::string& model_path, int intra_op_threads = 1);

    // L2-normalized embedding. Throws std::runtime_error if the image cannot be
    // decoded or the model output is not dim floats.
    std::vector<float> embed(const std::string& image_path) const override;

    size_t dim() const override { return m_dim; }

private:
    PreprocessConfig m_pre;
    size_t m_dim = 512;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "card-index"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_name = "pixel_values";
    std::string m_out_name = "image_embeds";

    std::vector<float> preprocess(const cv::Mat& bgr) const;
    std::vector<float> run(const cv::Mat& bgr) const;
};

}  // namespace cardindex
