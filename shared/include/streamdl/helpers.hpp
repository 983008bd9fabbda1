#pragma once

#include <cstdint>
#include <string>

namespace streamdl {

struct HostPort {
    std::string host;
    std::uint16_t port{};
};

// command line helpers
bool is_cmd(const std::string &msg, const std::string &cmd);

bool parse_host_port(const std::string &input, HostPort &out);
std::uint64_t parse_size(const std::string &str);

}
