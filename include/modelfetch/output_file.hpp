#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace modelfetch {

/**
 * Write handle on a preallocated destination file. Each instance owns its own
 * descriptor and writes with pwrite, so concurrent writers never share a
 * file cursor.
 */
class OutputFile {
public:
    // Creates (or truncates) `path` and extends it to exactly `size` bytes.
    static void preallocate(const std::string& path, std::uint64_t size);

    explicit OutputFile(const std::string& path);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    void writeAt(std::uint64_t offset, const char* data, std::size_t size);

private:
    std::string path_;
    int fd_{-1};
};

} // namespace modelfetch
