#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace streamdl {

class Failure;

// i/o failure while reading the input stream or touching the destination file
// message format: "<code>: <text>", e.g. "read_failed: Input/output error"
class IoError : public std::runtime_error {
public:
    IoError(const int &err, const std::string &msg);
    explicit IoError(const std::string &msg);

    // errno of the failed call, 0 if the error was not raised by a syscall
    int code() const noexcept;

    static IoError fromErrno(const std::string &what, const std::string &context = "");

private:
    int err = 0;
};

// raised on the caller's executor when a transfer fails and nobody listens
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const Failure &failure);

    const Failure &failure() const noexcept;

private:
    std::shared_ptr<const Failure> snapshot;
};

}
