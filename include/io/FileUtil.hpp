#pragma once
#include <cstddef>
#include <string>

namespace cardindex {

// Writes data to <path>.tmp, fdatasyncs it, renames it over path, then fsyncs
// the parent directory. The parent directory is created if missing. On failure
// the temp file is removed, err (if given) describes the failing step, and
// false is returned.
bool write_file_durable(const std::string& path, const void* data, size_t len, std::string* err = nullptr);

bool fsync_parent_dir(const std::string& path);

}  // namespace cardindex
