#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string_view>
#include <variant>

namespace gssa {

// Goosefoot bundles carry their solver settings in input/settings.xml; the
// inspection layout expects a copy under settings/.
struct GoosefootMode {
    static constexpr std::string_view kName = "goosefoot";

    Result Finalize(const std::filesystem::path& destination_root) const;
};

using InspectionMode = std::variant<GoosefootMode>;

// InvalidArgument for names that are not a recognised mode.
Result ParseInspectionMode(std::string_view name, InspectionMode& out);

std::string_view ModeName(const InspectionMode& mode);

Result FinalizeMode(const InspectionMode& mode, const std::filesystem::path& destination_root);

} // namespace gssa
