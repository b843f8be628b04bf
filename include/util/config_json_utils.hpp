#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace gssa::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);

// Walks nested objects along a dotted key ("receiver.port").
// Returns nullptr when any level is missing or not an object.
const nlohmann::json* FindDotted(const nlohmann::json& root, std::string_view dotted_key);

bool FillConfigFromJson(const nlohmann::json& j, GssaConfigFromFile& cfg, std::string& err);

} // namespace gssa::config::detail
