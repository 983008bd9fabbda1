#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace streamdl {

// destination opened for read/write (created if missing, never truncated),
// written sequentially from the current position
class DestinationFile {
public:
    // throws IoError("file_open_failed: ...") if the file cannot be opened read/write
    explicit DestinationFile(const std::filesystem::path &path);
    ~DestinationFile();

    DestinationFile(const DestinationFile &) = delete;
    DestinationFile &operator=(const DestinationFile &) = delete;
    DestinationFile(DestinationFile &&other) noexcept;
    DestinationFile &operator=(DestinationFile &&other) noexcept;

    std::uint64_t length() const;
    std::uint64_t position() const;
    void seek(const std::uint64_t &offset);

    // writes all size bytes at the current position
    void write(const char *data, const std::size_t &size);

    void close();
    bool isOpen() const;

    const std::filesystem::path &getPath() const;

private:
    std::filesystem::path path;
    int fd = -1;
    std::uint64_t pos = 0;
};

}
