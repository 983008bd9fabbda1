#include "streamdl/control.hpp"

namespace streamdl {

Control::Control(std::shared_ptr<TransferState> state) : state(std::move(state)) {
}

Status Control::status() const {
    return this->state->getStatus();
}

void Control::pause() {
    this->state->transition(Status::Paused);
}

void Control::resume() {
    this->state->transition(Status::Downloading);
}

void Control::cancel() {
    this->state->transition(Status::Canceled);
}

std::uint64_t Control::bytesTransferred() const {
    return this->state->getBytesTransferred();
}

const std::filesystem::path &Control::file() const {
    return this->state->getFile();
}

void Control::wait() const {
    this->state->waitFinished();
}

bool Control::waitFor(const std::chrono::milliseconds &timeout) const {
    return this->state->waitFinishedFor(timeout);
}

}
