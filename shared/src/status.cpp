#include "streamdl/status.hpp"

namespace streamdl {

bool isTerminal(const Status &status) {
    return status == Status::Canceled || status == Status::Done || status == Status::Error;
}

bool canTransition(const Status &from, const Status &to) {
    switch (to) {
        case Status::Paused:
            return from == Status::Downloading;
        case Status::Downloading:
            return from == Status::Paused;
        case Status::Canceled:
        case Status::Error:
            return from == Status::Downloading || from == Status::Paused;
        case Status::Done:
            return from == Status::Downloading;
    }
    return false;
}

const char *toString(const Status &status) {
    switch (status) {
        case Status::Downloading: return "DOWNLOADING";
        case Status::Paused: return "PAUSED";
        case Status::Canceled: return "CANCELED";
        case Status::Done: return "DONE";
        case Status::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::ostream &operator<<(std::ostream &os, const Status &status) {
    return os << toString(status);
}

}
