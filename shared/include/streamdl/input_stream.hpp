#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace streamdl {

// source of bytes for a transfer
class InputStream {
public:
    virtual ~InputStream() = default;

    // reads at most size bytes into buffer, returns 0 at end of stream;
    // throws IoError on failure
    virtual std::size_t read(char *buffer, const std::size_t &size) = 0;

    // releases the underlying resource, safe to call more than once
    virtual void close() = 0;
};

// input stream over an owned POSIX file descriptor (file, pipe or socket)
class FdInputStream : public InputStream {
public:
    explicit FdInputStream(const int &fd);
    ~FdInputStream() override;

    FdInputStream(const FdInputStream &) = delete;
    FdInputStream &operator=(const FdInputStream &) = delete;

    std::size_t read(char *buffer, const std::size_t &size) override;
    void close() override;

    int getFD() const;

    static std::unique_ptr<FdInputStream> openFile(const std::string &path);
    static std::unique_ptr<FdInputStream> connectTcp(const std::string &host, const std::uint16_t &port);

private:
    int fd = -1;
};

}
