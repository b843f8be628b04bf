#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <filesystem>

namespace gssa::config {

void GssaConfigFromFile::Reset() {
    receiver_port.reset();
    receiver_bind_address.reset();
    receiver_route.reset();
    receiver_drain_grace_seconds.reset();
    receiver_body_limit_bytes.reset();
    log_level.reset();
    bundle_destination.reset();
}

Result GssaConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result::Fail(ErrorKind::ConfigError, "no config file found: " + path, ENOENT);
    }

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::ConfigError, err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::ConfigError, err + " in " + path);
    }

    return Result::Ok();
}

Result GssaConfigFromFile::LoadFileOrDefaults(const std::string& path) {
    auto r = LoadFile(path);
    if (!r.ok && r.err == ENOENT) {
        LogInfo("%s, using defaults", r.msg.c_str());
        return Result::Ok();
    }
    return r;
}

} // namespace gssa::config
