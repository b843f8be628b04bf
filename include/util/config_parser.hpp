#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace gssa::config {

inline constexpr const char* kDefaultConfigPath = "/etc/gssa/gssa.json";

// Values read from the JSON config file. Absent keys stay empty so callers
// can layer command line overrides and built-in defaults on top.
class GssaConfigFromFile {
public:
    std::optional<std::uint16_t> receiver_port;
    std::optional<std::string> receiver_bind_address;
    std::optional<std::string> receiver_route;
    std::optional<std::uint64_t> receiver_drain_grace_seconds;
    std::optional<std::uint64_t> receiver_body_limit_bytes;

    std::optional<std::string> log_level;
    std::optional<std::string> bundle_destination;

    // ConfigError with err == ENOENT when the file does not exist.
    Result LoadFile(const std::string& path);

    // As LoadFile, but a missing file is logged and leaves every value unset.
    Result LoadFileOrDefaults(const std::string& path);

    void Reset();
};

} // namespace gssa::config
