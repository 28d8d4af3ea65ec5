#include "modelfetch/output_file.hpp"
#include "modelfetch/errors.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>

namespace modelfetch {

namespace {

std::string systemError(const char* what, const std::string& path) {
    return fmt::format("{} {}: {}", what, path, std::strerror(errno));
}

} // namespace

void OutputFile::preallocate(const std::string& path, std::uint64_t size) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd == -1) {
        throw TransferError(systemError("Cannot create destination file", path));
    }

    if (::ftruncate(fd, static_cast<off_t>(size)) == -1) {
        const std::string message = systemError("Cannot resize destination file", path);
        ::close(fd);
        throw TransferError(message);
    }
    ::close(fd);
}

OutputFile::OutputFile(const std::string& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_WRONLY);
    if (fd_ == -1) {
        throw TransferError(systemError("Cannot open destination file", path));
    }
}

OutputFile::~OutputFile() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

void OutputFile::writeAt(std::uint64_t offset, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw TransferError(systemError("Failed to write output file", path_));
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
}

} // namespace modelfetch
