#pragma once

#include "errors.hpp"

#include <cstdint>
#include <filesystem>

namespace streamdl {

// snapshot of a transfer taken at the moment it failed
class Failure {
public:
    Failure(const std::filesystem::path &file, const std::uint64_t &bytes_transferred, const IoError &error);

    const std::filesystem::path &file() const;
    std::uint64_t bytesTransferred() const;
    const IoError &error() const;

private:
    const std::filesystem::path path;
    const std::uint64_t bytes = 0;
    const IoError cause;
};

}
