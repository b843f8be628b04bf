#pragma once

#include "bundle/bundle_archive.hpp"
#include "bundle/inspection_mode.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gssa {

inline constexpr std::string_view kLegacyInputName = "input.final";
inline constexpr std::string_view kInputName = "input";

// Longest leading string shared by every non-directory member, cut back to
// the last '/' so that it always names a directory. Empty when there is no
// shared directory.
std::string CommonPrefix(const std::vector<ArchiveEntry>& entries);

// True when neither prefix + "input" nor prefix + "input.final" is a member.
bool InputLayoutMissing(const std::vector<ArchiveEntry>& entries, const std::string& prefix);

// Output path of a member relative to the destination: prefix removed, every
// "input.final" replaced by "input". nullopt for members that do not live
// under prefix (the prefix directory itself and its ancestors included).
std::optional<std::string> MapMemberPath(const std::string& member_path, const std::string& prefix);

// Fails with DestinationExistsError when destination exists and force is not
// set; with force the old tree is removed. Nothing is created here.
Result PrepareDestination(const std::filesystem::path& destination, bool force);

class BundleNormalizer {
public:
    struct Options {
        bool force = false;
        bool verbose = false;
        std::optional<InspectionMode> mode;
    };

    struct ExtractOptions {
        bool verbose = false;
        bool synthesize_input_dir = false;
    };

    BundleNormalizer() = default;
    explicit BundleNormalizer(Options opt) : opt_(std::move(opt)) {}

    Result ComputePrefix(const std::string& archive_path, std::string& out_prefix) const;

    Result DetectInputLayout(const std::string& archive_path,
                             const std::string& prefix,
                             bool& out_needs_input_dir) const;

    Result Extract(const std::string& archive_path,
                   const std::string& prefix,
                   const std::filesystem::path& destination,
                   const ExtractOptions& extract_opt) const;

    // Full inspection pipeline: prefix, layout, overwrite policy, extraction, finalize.
    Result Normalize(const std::string& archive_path, const std::filesystem::path& destination) const;

private:
    Options opt_{};
};

} // namespace gssa
