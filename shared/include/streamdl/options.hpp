#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace streamdl {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192; // 8 KB read/write unit

// transfer options, as read from a JSON config:
//   { "chunkSize": 8192, "resumeFromOffset": false, "filePointer": 0 }
struct DownloadOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    bool resume_from_offset = false;
    std::optional<std::uint64_t> file_pointer;

    static DownloadOptions fromJson(const nlohmann::json &j);
    static DownloadOptions load(const std::string &path);

    nlohmann::json toJson() const;
};

}
