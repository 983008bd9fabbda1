#pragma once

#include "transfer_state.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace streamdl {

// handle to a running transfer, returned by Download::start()
//
// The engine looks at the status only between chunk reads, so a pause or
// cancel issued while the input stream blocks in read() takes effect once
// that read returns.
class Control {
public:
    explicit Control(std::shared_ptr<TransferState> state);

    Status status() const;

    // Downloading -> Paused, no-op otherwise
    void pause();
    // Paused -> Downloading, no-op otherwise
    void resume();
    // Downloading|Paused -> Canceled, no-op otherwise; the engine deletes the file
    void cancel();

    // bytes written to the destination so far, usable as the resume offset of a new transfer
    std::uint64_t bytesTransferred() const;
    const std::filesystem::path &file() const;

    // block until the engine thread has released its resources and handed off the outcome;
    // the callbacks have been released by then. Must not be called from a callback run by an
    // InlineExecutor: the engine marks itself finished only after that callback returns.
    void wait() const;
    bool waitFor(const std::chrono::milliseconds &timeout) const;

private:
    std::shared_ptr<TransferState> state;
};

}
