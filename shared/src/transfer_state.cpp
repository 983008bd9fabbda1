#include "streamdl/transfer_state.hpp"

namespace streamdl {

TransferState::TransferState(const std::filesystem::path &file) : file(file) {
}

Status TransferState::getStatus() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->status;
}

bool TransferState::transition(const Status &to) {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!canTransition(this->status, to)) {
            return false;
        }
        this->status = to;
    }
    this->changed.notify_all();
    return true;
}

Status TransferState::awaitNotPaused() {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->changed.wait(lock, [this] { return this->status != Status::Paused; });
    return this->status;
}

std::uint64_t TransferState::getBytesTransferred() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->bytes_transferred;
}

void TransferState::startAt(const std::uint64_t &offset) {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (offset > this->bytes_transferred) {
        this->bytes_transferred = offset;
    }
}

void TransferState::addBytes(const std::uint64_t &count) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->bytes_transferred += count;
}

const std::filesystem::path &TransferState::getFile() const {
    return this->file;
}

void TransferState::markFinished() {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->finished = true;
    }
    this->changed.notify_all();
}

bool TransferState::isFinished() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->finished;
}

void TransferState::waitFinished() const {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->changed.wait(lock, [this] { return this->finished; });
}

bool TransferState::waitFinishedFor(const std::chrono::milliseconds &timeout) const {
    std::unique_lock<std::mutex> lock(this->mutex);
    return this->changed.wait_for(lock, timeout, [this] { return this->finished; });
}

}
