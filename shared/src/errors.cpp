#include "streamdl/errors.hpp"
#include "streamdl/failure.hpp"

#include <cerrno>
#include <cstring>

namespace streamdl {

IoError::IoError(const int &err, const std::string &msg) : std::runtime_error(msg), err(err) {
}

IoError::IoError(const std::string &msg) : std::runtime_error(msg), err(0) {
}

int IoError::code() const noexcept {
    return this->err;
}

IoError IoError::fromErrno(const std::string &what, const std::string &context) {
    int saved = errno;
    std::string msg = what + ": " + std::strerror(saved);
    if (!context.empty()) {
        msg += " (" + context + ")";
    }
    return IoError(saved, msg);
}

TransferError::TransferError(const Failure &failure)
    : std::runtime_error("transfer_failed: Transfer to " + failure.file().string() + " failed after "
                         + std::to_string(failure.bytesTransferred()) + " bytes: " + failure.error().what()),
      snapshot(std::make_shared<const Failure>(failure)) {
}

const Failure &TransferError::failure() const noexcept {
    return *this->snapshot;
}

}
