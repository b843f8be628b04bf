#include "util/config_json_utils.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

namespace gssa::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, std::string_view key, std::optional<std::string>& out,
                        std::string& err) {
    const auto* v = FindDotted(j, key);
    if (!v) return true;
    if (!v->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = v->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, std::string_view key, std::optional<std::uint64_t>& out,
                     std::string& err) {
    const auto* v = FindDotted(j, key);
    if (!v) return true;
    if (!(v->is_number_unsigned() || v->is_number_integer())) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    if (v->is_number_unsigned()) {
        out = v->get<std::uint64_t>();
        return true;
    }
    const auto n = v->get<long long>();
    if (n < 0) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(n);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

const nlohmann::json* FindDotted(const nlohmann::json& root, std::string_view dotted_key) {
    const nlohmann::json* cur = &root;
    while (true) {
        if (!cur->is_object()) return nullptr;
        const auto dot = dotted_key.find('.');
        const std::string level(dotted_key.substr(0, dot));
        auto it = cur->find(level);
        if (it == cur->end()) return nullptr;
        cur = &*it;
        if (dot == std::string_view::npos) return cur;
        dotted_key.remove_prefix(dot + 1);
    }
}

bool FillConfigFromJson(const nlohmann::json& j, GssaConfigFromFile& cfg, std::string& err) {
    {
        std::optional<std::uint64_t> port;
        if (!GetU64IfPresent(j, "receiver.port", port, err)) return false;
        if (port) {
            if (*port > std::numeric_limits<std::uint16_t>::max()) {
                err = "receiver.port out of range";
                return false;
            }
            cfg.receiver_port = static_cast<std::uint16_t>(*port);
        }
    }

    if (!GetStringIfPresent(j, "receiver.bind_address", cfg.receiver_bind_address, err)) return false;
    if (!GetStringIfPresent(j, "receiver.route", cfg.receiver_route, err)) return false;
    if (cfg.receiver_route && (cfg.receiver_route->empty() || cfg.receiver_route->front() != '/')) {
        err = "receiver.route must start with '/'";
        return false;
    }
    if (!GetU64IfPresent(j, "receiver.drain_grace_seconds", cfg.receiver_drain_grace_seconds, err)) return false;
    if (!GetU64IfPresent(j, "receiver.body_limit_bytes", cfg.receiver_body_limit_bytes, err)) return false;

    if (!GetStringIfPresent(j, "log.level", cfg.log_level, err)) return false;
    if (!GetStringIfPresent(j, "bundle.destination", cfg.bundle_destination, err)) return false;

    return true;
}

} // namespace gssa::config::detail
