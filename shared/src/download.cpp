#include "streamdl/download.hpp"
#include "streamdl/transfer_engine.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>

namespace streamdl {

Download::Download(const std::filesystem::path &file, std::unique_ptr<InputStream> input, std::shared_ptr<Executor> executor,
                   const std::uint64_t &skip_bytes)
    : file(file), input(std::move(input)), executor(std::move(executor)), seek_bytes(skip_bytes) {
    if (!this->input) {
        throw std::invalid_argument("no_input: Download requires an input stream");
    }
    if (!this->executor) {
        throw std::invalid_argument("no_executor: Download requires an executor for callbacks");
    }
}

Download &Download::setChunkSize(const std::size_t &chunk_size) {
    if (chunk_size > 0) {
        this->chunk_size = chunk_size;
    }
    return *this;
}

Download &Download::resumeBreakpoint() {
    this->resume = true;
    return *this;
}

Download &Download::setFilePointer(const std::uint64_t &offset) {
    this->seek_bytes = offset;
    return *this;
}

Download &Download::setOnSuccess(SuccessCallback callback) {
    this->on_success = std::move(callback);
    return *this;
}

Download &Download::setOnFailure(FailureCallback callback) {
    this->on_failure = std::move(callback);
    return *this;
}

Download &Download::applyOptions(const DownloadOptions &opts) {
    this->setChunkSize(opts.chunk_size);
    if (opts.resume_from_offset) {
        this->resumeBreakpoint();
    }
    if (opts.file_pointer) {
        this->setFilePointer(*opts.file_pointer);
    }
    return *this;
}

Control Download::start() {
    if (this->started) {
        throw std::runtime_error("already_started: Download to " + this->file.string() + " has already been started");
    }
    this->started = true;

    // open the destination before spawning anything
    std::optional<DestinationFile> destination;
    try {
        destination.emplace(this->file);
    } catch (const IoError &e) {
        std::cerr << "Cannot start transfer: " << e.what() << std::endl;
        try {
            this->input->close();
        } catch (const IoError &close_error) {
            std::cerr << "Error closing input stream: " << close_error.what() << std::endl;
        }
        throw;
    }

    auto state = std::make_shared<TransferState>(this->file);
    TransferEngine::Settings settings{this->chunk_size, this->resume, this->seek_bytes};
    auto dispatcher = std::make_unique<OutcomeDispatcher>(this->executor, std::move(this->on_success), std::move(this->on_failure));
    auto engine = std::make_unique<TransferEngine>(state, std::move(*destination), std::move(this->input), settings, std::move(dispatcher));

    std::thread([engine = std::move(engine)]() {
        engine->run();
    }).detach();

    return Control(state);
}

std::size_t Download::getChunkSize() const {
    return this->chunk_size;
}

std::uint64_t Download::getFilePointer() const {
    return this->seek_bytes;
}

bool Download::isResumeEnabled() const {
    return this->resume;
}

}
