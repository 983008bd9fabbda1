#pragma once

#include "destination_file.hpp"
#include "input_stream.hpp"
#include "outcome_dispatcher.hpp"
#include "transfer_state.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace streamdl {

// background loop of a single transfer; run() is called once on its own thread
class TransferEngine {
public:
    struct Settings {
        std::size_t chunk_size;
        bool resume_from_offset;
        std::uint64_t offset;
    };

    TransferEngine(std::shared_ptr<TransferState> state, DestinationFile destination, std::unique_ptr<InputStream> input,
                   const Settings &settings, std::unique_ptr<OutcomeDispatcher> dispatcher);

    void run();

private:
    std::shared_ptr<TransferState> state;
    DestinationFile destination;
    std::unique_ptr<InputStream> input;
    const Settings settings;
    std::unique_ptr<OutcomeDispatcher> dispatcher;

    // returns the failure snapshot if the transfer stopped on an i/o error
    std::optional<Failure> transfer();
    void seekResumeOffset(DestinationFile &file);
    void copy(DestinationFile &file, InputStream &stream);
    Failure fail(const IoError &error);
    void removeCanceledFile();
};

}
