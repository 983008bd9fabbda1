#include "streamdl/destination_file.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <iostream>
#include <utility>

namespace streamdl {

DestinationFile::DestinationFile(const std::filesystem::path &path) : path(path) {
    do {
        this->fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    } while (this->fd < 0 && errno == EINTR);
    if (this->fd < 0) {
        throw IoError::fromErrno("file_open_failed", "path: " + path.string());
    }
}

DestinationFile::~DestinationFile() {
    try {
        this->close();
    } catch (const std::exception &e) {
        std::cerr << "Error closing destination file " << this->path << ": " << e.what() << std::endl;
    }
}

DestinationFile::DestinationFile(DestinationFile &&other) noexcept
    : path(std::move(other.path)), fd(std::exchange(other.fd, -1)), pos(other.pos) {
}

DestinationFile &DestinationFile::operator=(DestinationFile &&other) noexcept {
    if (this != &other) {
        if (this->fd >= 0) {
            ::close(this->fd);
        }
        this->path = std::move(other.path);
        this->fd = std::exchange(other.fd, -1);
        this->pos = other.pos;
    }
    return *this;
}

std::uint64_t DestinationFile::length() const {
    struct stat sb;
    if (::fstat(this->fd, &sb) < 0) {
        throw IoError::fromErrno("stat_failed", "path: " + this->path.string());
    }
    return static_cast<std::uint64_t>(sb.st_size);
}

std::uint64_t DestinationFile::position() const {
    return this->pos;
}

void DestinationFile::seek(const std::uint64_t &offset) {
    if (::lseek(this->fd, static_cast<off_t>(offset), SEEK_SET) < 0) {
        throw IoError::fromErrno("seek_failed", "path: " + this->path.string() + ", offset: " + std::to_string(offset));
    }
    this->pos = offset;
}

void DestinationFile::write(const char *data, const std::size_t &size) {
    std::size_t total_written = 0;
    while (total_written < size) {
        ssize_t written = ::write(this->fd, data + total_written, size - total_written);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw IoError::fromErrno("file_write_failed", "path: " + this->path.string());
        }
        total_written += static_cast<std::size_t>(written);
    }
    this->pos += total_written;
}

void DestinationFile::close() {
    if (this->fd < 0) {
        return;
    }
    int old = std::exchange(this->fd, -1);
    if (::close(old) < 0 && errno != EINTR) {
        throw IoError::fromErrno("close_failed", "path: " + this->path.string());
    }
}

bool DestinationFile::isOpen() const {
    return this->fd >= 0;
}

const std::filesystem::path &DestinationFile::getPath() const {
    return this->path;
}

}
