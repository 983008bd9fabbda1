#pragma once

#include "executor.hpp"
#include "failure.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>

namespace streamdl {

using SuccessCallback = std::function<void(const std::filesystem::path &)>;
using FailureCallback = std::function<void(const Failure &)>;

// hands the single terminal outcome of a transfer to the caller's executor
class OutcomeDispatcher {
public:
    OutcomeDispatcher(std::shared_ptr<Executor> executor, SuccessCallback on_success, FailureCallback on_failure);

    // dropped if no success callback is set
    void success(const std::filesystem::path &file);

    // without a failure callback the failure is thrown as TransferError on the executor
    void failure(const Failure &failure);

    bool delivered() const;

private:
    std::shared_ptr<Executor> executor;
    SuccessCallback on_success;
    FailureCallback on_failure;
    std::atomic<bool> done{false};

    bool claim();
};

}
