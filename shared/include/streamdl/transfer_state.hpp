#pragma once

#include "status.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>

namespace streamdl {

// state block shared by the engine thread and every Control handle;
// one mutex guards status, byte counter and the finished flag
class TransferState {
public:
    explicit TransferState(const std::filesystem::path &file);

    TransferState(const TransferState &) = delete;
    TransferState &operator=(const TransferState &) = delete;

    Status getStatus() const;

    // applies the edge if legal, returns false (and changes nothing) otherwise
    bool transition(const Status &to);

    // blocks while the transfer is paused, returns the status that ended the wait
    Status awaitNotPaused();

    // progress
    std::uint64_t getBytesTransferred() const;
    void startAt(const std::uint64_t &offset);
    void addBytes(const std::uint64_t &count);

    const std::filesystem::path &getFile() const;

    // engine thread exit
    void markFinished();
    bool isFinished() const;
    void waitFinished() const;
    bool waitFinishedFor(const std::chrono::milliseconds &timeout) const;

private:
    const std::filesystem::path file;

    mutable std::mutex mutex;
    mutable std::condition_variable changed;
    Status status = Status::Downloading;
    std::uint64_t bytes_transferred = 0;
    bool finished = false;
};

}
