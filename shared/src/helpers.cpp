#include "streamdl/helpers.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace streamdl {

bool is_cmd(const std::string &msg, const std::string &cmd) {
    return msg.starts_with(cmd) && (msg.size() == cmd.size() || msg[cmd.size()] == ' ');
}

bool parse_host_port(const std::string &input, HostPort &out) {
    auto colon = input.rfind(':');
    if (colon == std::string::npos) return false;
    std::string host = input.substr(0, colon);
    std::string port_str = input.substr(colon + 1);
    if (host.empty() || port_str.empty()) return false;
    char *end = nullptr;
    long p = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || p < 0 || p > 65535) return false;
    out.host = std::move(host);
    out.port = static_cast<std::uint16_t>(p);
    return true;
}

std::uint64_t parse_size(const std::string &str) {
    if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
        throw std::runtime_error("invalid_number: Expected a non-negative number, got '" + str + "'");
    }
    size_t idx = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(str, &idx);
    } catch (const std::out_of_range &) {
        throw std::runtime_error("invalid_number: Number out of range: " + str);
    }
    if (idx != str.size()) {
        throw std::runtime_error("invalid_number: Expected a non-negative number, got '" + str + "'");
    }
    return static_cast<std::uint64_t>(value);
}

}
