#pragma once

#include <ostream>

namespace streamdl {

enum class Status {
    Downloading,
    Paused,
    Canceled,
    Done,
    Error
};

// Canceled, Done and Error accept no further transitions
bool isTerminal(const Status &status);

// legal edges:
//   Downloading -> Paused       (pause)
//   Paused -> Downloading       (resume)
//   Downloading|Paused -> Canceled (cancel)
//   Downloading -> Done         (end of stream)
//   Downloading|Paused -> Error (i/o failure)
bool canTransition(const Status &from, const Status &to);

const char *toString(const Status &status);
std::ostream &operator<<(std::ostream &os, const Status &status);

}
