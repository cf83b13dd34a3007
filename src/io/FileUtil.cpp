#include "io/FileUtil.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cardindex {

static bool fail(std::string* err, const std::string& what) {
    if (err) *err = what + ": " + std::strerror(errno);
    return false;
}

static bool write_full(int fd, const void* buf, size_t len) {
    const auto* p = static_cast<const uint8_t*>(buf);
    size_t rem = len;
    while (rem > 0) {
        ssize_t w = ::write(fd, p, rem);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (w == 0) return false;
        p += (size_t)w;
        rem -= (size_t)w;
    }
    return true;
}

bool fsync_parent_dir(const std::string& path) {
    fs::path p(path);
    const std::string dir = p.has_parent_path() ? p.parent_path().string() : std::string(".");
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

bool write_file_durable(const std::string& path, const void* data, size_t len, std::string* err) {
    const fs::path out_path(path);
    const std::string tmp = path + ".tmp";

    if (out_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            if (err) *err = "failed to create directory " + out_path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return fail(err, "failed to open " + tmp + " for writing");

    if (!write_full(fd, data, len)) {
        fail(err, "failed to write " + std::to_string(len) + " bytes to " + tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        return false;
    }
    if (::fdatasync(fd) != 0) {
        fail(err, "fdatasync failed for " + tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        return false;
    }
    if (::close(fd) != 0) {
        fail(err, "failed to close " + tmp);
        ::unlink(tmp.c_str());
        return false;
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        fail(err, "failed to move " + tmp + " to " + path);
        ::unlink(tmp.c_str());
        return false;
    }

    // the rename itself is only durable once the directory entry is synced
    if (!fsync_parent_dir(path)) return fail(err, "fsync of the directory holding " + path + " failed");
    return true;
}

}  // namespace cardindex
