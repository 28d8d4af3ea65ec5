#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace modelfetch {

class DownloadError : public std::runtime_error {
public:
    explicit DownloadError(const std::string& message) : std::runtime_error(message) {}
};

// Bad or missing request parameters. Raised before any side effect.
class ValidationError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Destination already exists and the caller did not ask to override it.
class ConflictError : public DownloadError {
public:
    ConflictError(const std::string& message, std::string path)
        : DownloadError(message), path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class SizeUnknownError : public DownloadError {
public:
    SizeUnknownError() : DownloadError("Could not determine file size from server") {}
};

class TransferError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace modelfetch
