#pragma once

#include <string>

namespace streamdl {

constexpr const char *VERSION = "1.0.0";

inline std::string version() {
    return VERSION;
}

}
