#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string>

namespace gssa {

class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

    // Joins a normalized relative path onto root and rejects the result when,
    // after resolving "." / ".." and any symlinks already on disk, it does not
    // stay inside root.
    Result ResolveUnder(const std::filesystem::path& root,
                        const std::string& relative,
                        std::filesystem::path& out) const;

    static bool IsSafeRelativePath(const std::string& p);

  private:
    bool safe_paths_only_ = true;
};

} // namespace gssa
