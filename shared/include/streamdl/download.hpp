#pragma once

#include "control.hpp"
#include "executor.hpp"
#include "input_stream.hpp"
#include "options.hpp"
#include "outcome_dispatcher.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace streamdl {

// copies an input stream into a file on a background thread
//
//   auto ctrl = Download(path, std::move(stream), executor)
//                   .resumeBreakpoint()
//                   .setOnSuccess([](const auto &file) { ... })
//                   .start();
class Download {
public:
    Download(const std::filesystem::path &file, std::unique_ptr<InputStream> input, std::shared_ptr<Executor> executor,
             const std::uint64_t &skip_bytes = 0);

    // size of each read/write; 0 is ignored
    Download &setChunkSize(const std::size_t &chunk_size);
    // continue an interrupted transfer at the file pointer instead of rewriting from 0
    Download &resumeBreakpoint();
    Download &setFilePointer(const std::uint64_t &offset);
    Download &setOnSuccess(SuccessCallback callback);
    Download &setOnFailure(FailureCallback callback);
    Download &applyOptions(const DownloadOptions &opts);

    // opens the destination and spawns the engine thread;
    // throws IoError if the destination cannot be opened for read/write
    Control start();

    std::size_t getChunkSize() const;
    std::uint64_t getFilePointer() const;
    bool isResumeEnabled() const;

private:
    const std::filesystem::path file;
    std::unique_ptr<InputStream> input;
    std::shared_ptr<Executor> executor;
    SuccessCallback on_success;
    FailureCallback on_failure;
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::uint64_t seek_bytes = 0;
    bool resume = false;
    bool started = false;
};

}
