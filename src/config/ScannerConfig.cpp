#include "config/ScannerConfig.hpp"
#include <stdexcept>

namespace cardindex {

const char* crop_method_str(CropMethod m) {
    switch (m) {
        case CropMethod::Top: return "top";
        case CropMethod::Center: return "center";
        default: return "none";
    }
}

CropMethod parse_crop_method(const std::string& s) {
    if (s == "none") return CropMethod::None;
    if (s == "top") return CropMethod::Top;
    if (s == "center") return CropMethod::Center;
    throw std::runtime_error("unknown crop method: '" + s + "' (expected none, top or center)");
}

}  // namespace cardindex
