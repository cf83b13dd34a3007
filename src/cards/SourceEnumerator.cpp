#include "cards/SourceEnumerator.hpp"
#include "cards/CardIdCodec.hpp"
#include "index/Errors.hpp"

#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace cardindex {

static std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool is_supported_image_extension(const std::string& ext) {
    const std::string e = to_lower_copy(ext);
    return e == ".jpg" || e == ".jpeg" || e == ".png" || e == ".webp";
}

std::vector<CardImage> scan_card_images(const std::string& dir) {
    fs::path root(dir);
    if (!fs::exists(root) || !fs::is_directory(root)) throw SourceNotFound(dir);

    std::vector<CardImage> images;
    for (auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        const fs::path& p = entry.path();
        if (!is_supported_image_extension(p.extension().string())) continue;

        CardImage img;
        img.card_id = filename_to_card_id(p.stem().string());
        img.path = p.string();
        images.push_back(std::move(img));
    }

    return images;
}

std::optional<std::string> find_card_image(const std::string& dir, const std::string& card_id) {
    static const char* exts[] = {".webp", ".png", ".jpg", ".jpeg"};

    const std::string stem = card_id_to_filename(card_id);
    for (const char* ext : exts) {
        fs::path p = fs::path(dir) / (stem + ext);
        std::error_code ec;
        if (fs::is_regular_file(p, ec)) return p.string();
    }
    return std::nullopt;
}

}  // namespace cardindex
