#include "streamdl/transfer_engine.hpp"

#include <iostream>
#include <system_error>
#include <vector>

namespace streamdl {

TransferEngine::TransferEngine(std::shared_ptr<TransferState> state, DestinationFile destination, std::unique_ptr<InputStream> input,
                               const Settings &settings, std::unique_ptr<OutcomeDispatcher> dispatcher)
    : state(std::move(state)), destination(std::move(destination)), input(std::move(input)), settings(settings),
      dispatcher(std::move(dispatcher)) {
}

void TransferEngine::run() {
    std::cout << "Starting transfer to " << this->state->getFile() << " (chunk size " << this->settings.chunk_size << " bytes)" << std::endl;

    std::optional<Failure> failure = this->transfer();

    Status terminal = this->state->getStatus();
    if (terminal == Status::Canceled) {
        this->removeCanceledFile();
    }

    std::cout << "Transfer to " << this->state->getFile() << " ended with status " << terminal << " ("
              << this->state->getBytesTransferred() << " bytes)" << std::endl;

    // canceled transfers report nothing
    if (terminal == Status::Done) {
        this->dispatcher->success(this->state->getFile());
    } else if (terminal == Status::Error && failure) {
        this->dispatcher->failure(*failure);
    }

    // drop the callbacks before waiters are released
    this->dispatcher.reset();
    this->state->markFinished();
}

std::optional<Failure> TransferEngine::transfer() {
    // destination and input are closed when this scope ends, whatever the exit path
    DestinationFile file = std::move(this->destination);
    std::unique_ptr<InputStream> stream = std::move(this->input);

    try {
        this->seekResumeOffset(file);
        this->copy(file, *stream);
    } catch (const IoError &e) {
        return this->fail(e);
    } catch (const std::exception &e) {
        return this->fail(IoError("stream_failed: " + std::string(e.what())));
    }
    return std::nullopt;
}

void TransferEngine::seekResumeOffset(DestinationFile &file) {
    if (!this->settings.resume_from_offset || this->settings.offset == 0) {
        return;
    }

    std::uint64_t length = file.length();
    if (this->settings.offset <= length) {
        file.seek(this->settings.offset);
        this->state->startAt(this->settings.offset);
        std::cout << "Resuming transfer to " << this->state->getFile() << " at offset " << this->settings.offset << std::endl;
    } else {
        // never seek past what is already on disk
        file.seek(length);
        this->state->startAt(length);
        std::cout << "Resume offset " << this->settings.offset << " is past the end of " << this->state->getFile()
                  << ", resuming at " << length << std::endl;
    }
}

void TransferEngine::copy(DestinationFile &file, InputStream &stream) {
    std::vector<char> buffer(this->settings.chunk_size);

    while (true) {
        Status status = this->state->getStatus();
        if (status == Status::Canceled || status == Status::Done) {
            return;
        }
        if (status == Status::Paused) {
            this->state->awaitNotPaused();
            continue;
        }
        if (status != Status::Downloading) {
            return;
        }

        while (true) {
            std::size_t len = stream.read(buffer.data(), buffer.size());
            if (len == 0) {
                // a concurrent pause wins, the next read after resume() hits the end again
                this->state->transition(Status::Done);
                break;
            }
            file.write(buffer.data(), len);
            this->state->addBytes(len);

            status = this->state->getStatus();
            if (status == Status::Canceled || status == Status::Paused) {
                break;
            }
        }
    }
}

Failure TransferEngine::fail(const IoError &error) {
    std::cerr << "Transfer to " << this->state->getFile() << " failed: " << error.what() << std::endl;
    // no-op if the transfer was canceled in the meantime
    this->state->transition(Status::Error);
    return Failure(this->state->getFile(), this->state->getBytesTransferred(), error);
}

void TransferEngine::removeCanceledFile() {
    std::error_code ec;
    std::filesystem::remove(this->state->getFile(), ec);
    if (ec) {
        std::cerr << "Failed to remove canceled download " << this->state->getFile() << ": " << ec.message() << std::endl;
    }
}

}
