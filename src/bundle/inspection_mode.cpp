#include "bundle/inspection_mode.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <string>
#include <type_traits>

namespace gssa {

namespace fs = std::filesystem;

Result GoosefootMode::Finalize(const fs::path& destination_root) const {
    const fs::path source = destination_root / "input" / "settings.xml";
    const fs::path settings_dir = destination_root / "settings";
    const fs::path target = settings_dir / "settings.xml";

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return Result::Fail(ErrorKind::MissingFileError,
                            "Could not find settings file: " + source.string(), ENOENT);
    }

    fs::create_directories(settings_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::ExtractionError,
                            "Cannot create " + settings_dir.string() + ": " + ec.message(), ec.value());
    }

    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result::Fail(ErrorKind::ExtractionError,
                            "Cannot copy " + source.string() + " to " + target.string() + ": " + ec.message(),
                            ec.value());
    }

    LogInfo("goosefoot: settings copied to %s", target.c_str());
    return Result::Ok();
}

Result ParseInspectionMode(std::string_view name, InspectionMode& out) {
    if (name == GoosefootMode::kName) {
        out = GoosefootMode{};
        return Result::Ok();
    }
    return Result::Fail(ErrorKind::InvalidArgument,
                        "Unknown inspection mode: " + std::string(name) + " (expected: goosefoot)");
}

std::string_view ModeName(const InspectionMode& mode) {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::kName; }, mode);
}

Result FinalizeMode(const InspectionMode& mode, const fs::path& destination_root) {
    return std::visit([&](const auto& m) { return m.Finalize(destination_root); }, mode);
}

} // namespace gssa
