#include "streamdl/failure.hpp"

namespace streamdl {

Failure::Failure(const std::filesystem::path &file, const std::uint64_t &bytes_transferred, const IoError &error)
    : path(file), bytes(bytes_transferred), cause(error) {
}

const std::filesystem::path &Failure::file() const {
    return this->path;
}

std::uint64_t Failure::bytesTransferred() const {
    return this->bytes;
}

const IoError &Failure::error() const {
    return this->cause;
}

}
