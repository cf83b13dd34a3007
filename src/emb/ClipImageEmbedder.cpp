#include "emb/ClipImageEmbedder.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace cardindex {

ClipImageEmbedder::ClipImageEmbedder(PreprocessConfig pre, size_t dim) : m_pre(std::move(pre)), m_dim(dim) {}

bool ClipImageEmbedder::init(const std::string& model_path, int intra_op_threads) {
    try {
        m_opts.SetIntraOpNumThreads(intra_op_threads);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        std::wstring wmodel(model_path.begin(), model_path.end());
        m_session = std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        auto in_name = m_session->GetInputNameAllocated(0, allocator);
        auto out_name = m_session->GetOutputNameAllocated(0, allocator);
        m_in_name = in_name.get();
        m_out_name = out_name.get();

        // fixed spatial dims in the model override the configured size
        auto shape = m_session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape(); // [1,3,H,W]
        if (shape.size() != 4) {
            std::cerr << "ClipImageEmbedder: expected NCHW input, model input has rank " << shape.size() << "\n";
            return false;
        }
        if (shape[2] > 0 && shape[2] == shape[3] && shape[2] != m_pre.image_size) {
            std::cerr << "ClipImageEmbedder: model expects " << shape[2] << "x" << shape[3]
                      << ", overriding image_size=" << m_pre.image_size << "\n";
            m_pre.image_size = (int)shape[2];
        }

        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "ClipImageEmbedder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << model_path << "\n";
        m_session.reset();
        return false;
    }
}

// crop to square (optional), resize, BGR->RGB, scale to [0,1], mean/std, HWC->CHW
std::vector<float> ClipImageEmbedder::preprocess(const cv::Mat& bgr) const {
    cv::Mat img = bgr;

    if (m_pre.crop != CropMethod::None && img.cols != img.rows) {
        const int side = std::min(img.cols, img.rows);
        const int x = (img.cols - side) / 2;
        const int y = (m_pre.crop == CropMethod::Top) ? 0 : (img.rows - side) / 2;
        img = img(cv::Rect(x, y, side, side));
    }

    const int S = m_pre.image_size;
    cv::Mat resized;
    cv::resize(img, resized, cv::Size(S, S), 0, 0, cv::INTER_AREA);

    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32FC3, 1.0 / 255.0);

    std::vector<cv::Mat> ch(3);
    cv::split(rgb, ch);

    const size_t plane = (size_t)S * (size_t)S;
    std::vector<float> chw(3 * plane);
    for (int c = 0; c < 3; ++c) {
        cv::Mat norm = (ch[c] - m_pre.mean[c]) / m_pre.stdev[c];
        if (!norm.isContinuous()) norm = norm.clone();
        std::memcpy(chw.data() + c * plane, norm.ptr<float>(0), plane * sizeof(float));
    }
    return chw;
}

std::vector<float> ClipImageEmbedder::run(const cv::Mat& bgr) const {
    if (!m_session) throw std::runtime_error("ClipImageEmbedder: not initialized");

    std::vector<float> input = preprocess(bgr);
    std::vector<int64_t> shape{1, 3, m_pre.image_size, m_pre.image_size};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
    Ort::Value in_val = Ort::Value::CreateTensor<float>(mem, input.data(), input.size(), shape.data(), shape.size());

    const char* in_names[1] = { m_in_name.c_str() };
    const char* out_names[1] = { m_out_name.c_str() };

    auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, &in_val, 1, out_names, 1);

    Ort::Value& out = outs[0];
    auto info = out.GetTensorTypeAndShapeInfo();
    const size_t n = info.GetElementCount();
    if (n != m_dim) {
        throw std::runtime_error("ClipImageEmbedder: model output has " + std::to_string(n) +
                                 " floats, expected " + std::to_string(m_dim));
    }

    const float* data = out.GetTensorData<float>();
    std::vector<float> v(data, data + n);
    normalize_embedding(v);
    return v;
}

std::vector<float> ClipImageEmbedder::embed(const std::string& image_path) const {
    cv::Mat bgr = cv::imread(image_path, cv::IMREAD_COLOR);
    if (bgr.empty()) throw std::runtime_error("failed to decode image: " + image_path);
    return run(bgr);
}

}  // namespace cardindex
