#include "AtomicFile.hpp"
#include "ReefError.hpp"
#include "LogUtils.hpp"
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace AtomicFile {

namespace fs = std::filesystem;

static std::atomic<std::uint64_t> temp_counter{0};

static void write_all(int fd, const std::string& content, const fs::path& tmp_path) {
    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ReefError(ErrorCode::PersistFailure,
                            "write to " + tmp_path.string() + " failed: " + std::strerror(errno),
                            tmp_path.string());
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
}

void write(const fs::path& path, const std::string& content) {
    const fs::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw ReefError(ErrorCode::PersistFailure,
                            "cannot create directory " + parent.string() + ": " + ec.message(),
                            path.string());
        }
    }

    // Keep the permissions of the file being replaced
    mode_t mode = 0644;
    struct stat st {};
    if (::stat(path.c_str(), &st) == 0) {
        mode = st.st_mode & 07777;
    }

    // Unique per process and per call
    const fs::path tmp_path = path.string() + ".tmp." + std::to_string(::getpid()) + "." +
                              std::to_string(++temp_counter);
    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        throw ReefError(ErrorCode::PersistFailure,
                        "cannot open " + tmp_path.string() + ": " + std::strerror(errno),
                        path.string());
    }

    try {
        write_all(fd, content, tmp_path);
        if (::fsync(fd) != 0) {
            throw ReefError(ErrorCode::PersistFailure,
                            "fsync " + tmp_path.string() + " failed: " + std::strerror(errno),
                            path.string());
        }
    } catch (...) {
        ::close(fd);
        ::unlink(tmp_path.c_str());
        throw;
    }

    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tmp_path.c_str());
        throw ReefError(ErrorCode::PersistFailure,
                        "close " + tmp_path.string() + " failed: " + std::strerror(err),
                        path.string());
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp_path.c_str());
        throw ReefError(ErrorCode::PersistFailure,
                        "rename to " + path.string() + " failed: " + std::strerror(err),
                        path.string());
    }

    LogUtils::debug("Wrote {} bytes to {}", content.size(), path.string());
}

std::optional<std::string> read(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file for reading: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Error reading file: " + path.string());
    }
    return buffer.str();
}

}
