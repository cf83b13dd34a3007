#pragma once
#include <optional>
#include <string>
#include <vector>

namespace cardindex {

struct CardImage {
    std::string card_id;
    std::string path;
};

// True for .jpg/.jpeg/.png/.webp, any case.
bool is_supported_image_extension(const std::string& ext);

// Lists supported images in dir (non-recursive), in directory iteration order.
// Throws SourceNotFound if dir does not exist or is not a directory.
std::vector<CardImage> scan_card_images(const std::string& dir);

// Path of dir/<encoded id>.{webp,png,jpg,jpeg}, first that exists.
std::optional<std::string> find_card_image(const std::string& dir, const std::string& card_id);

}  // namespace cardindex
