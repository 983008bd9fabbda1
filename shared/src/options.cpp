#include "streamdl/options.hpp"

#include <fstream>
#include <stdexcept>

namespace streamdl {

namespace {

std::uint64_t get_unsigned(const nlohmann::json &j, const char *key) {
    const nlohmann::json &value = j.at(key);
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<std::int64_t>() < 0)) {
        throw std::runtime_error(std::string("invalid_config: '") + key + "' must be a non-negative integer");
    }
    return value.get<std::uint64_t>();
}

}

DownloadOptions DownloadOptions::fromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        throw std::runtime_error("invalid_config: Download options must be a JSON object");
    }

    DownloadOptions opts;
    if (j.contains("chunkSize")) {
        std::uint64_t chunk_size = get_unsigned(j, "chunkSize");
        // zero is rejected -> keep the default
        if (chunk_size > 0) {
            opts.chunk_size = static_cast<std::size_t>(chunk_size);
        }
    }
    if (j.contains("resumeFromOffset")) {
        if (!j["resumeFromOffset"].is_boolean()) {
            throw std::runtime_error("invalid_config: 'resumeFromOffset' must be a boolean");
        }
        opts.resume_from_offset = j["resumeFromOffset"].get<bool>();
    }
    if (j.contains("filePointer")) {
        opts.file_pointer = get_unsigned(j, "filePointer");
    }
    return opts;
}

DownloadOptions DownloadOptions::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("config_open_failed: Could not open config file (path: " + path + ")");
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("invalid_config: " + std::string(e.what()));
    }
    return fromJson(j);
}

nlohmann::json DownloadOptions::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    j["chunkSize"] = this->chunk_size;
    j["resumeFromOffset"] = this->resume_from_offset;
    if (this->file_pointer) {
        j["filePointer"] = *this->file_pointer;
    }
    return j;
}

}
