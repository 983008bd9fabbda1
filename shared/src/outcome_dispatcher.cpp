#include "streamdl/outcome_dispatcher.hpp"

#include <iostream>
#include <stdexcept>

namespace streamdl {

OutcomeDispatcher::OutcomeDispatcher(std::shared_ptr<Executor> executor, SuccessCallback on_success, FailureCallback on_failure)
    : executor(std::move(executor)), on_success(std::move(on_success)), on_failure(std::move(on_failure)) {
    if (!this->executor) {
        throw std::invalid_argument("no_executor: An executor is required to deliver transfer outcomes");
    }
}

bool OutcomeDispatcher::claim() {
    return !this->done.exchange(true);
}

void OutcomeDispatcher::success(const std::filesystem::path &file) {
    if (!this->claim()) {
        return;
    }
    if (!this->on_success) {
        return;
    }
    this->executor->execute([callback = this->on_success, file]() {
        callback(file);
    });
}

void OutcomeDispatcher::failure(const Failure &failure) {
    if (!this->claim()) {
        return;
    }
    if (this->on_failure) {
        this->executor->execute([callback = this->on_failure, failure]() {
            callback(failure);
        });
        return;
    }

    // nobody handles it -> escalate on the caller's execution context
    std::cerr << "Unhandled transfer failure for " << failure.file() << ": " << failure.error().what() << std::endl;
    this->executor->execute([failure]() {
        throw TransferError(failure);
    });
}

bool OutcomeDispatcher::delivered() const {
    return this->done.load();
}

}
