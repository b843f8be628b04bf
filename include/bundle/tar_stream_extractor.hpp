#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace gssa {

// Verbatim extraction of a bundle (no prefix stripping, no renaming) through
// libarchive's disk writer. Used for result archives.
class TarStreamExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        bool verbose = false;
        bool restore_permissions = true;
    };

    TarStreamExtractor() = default;
    explicit TarStreamExtractor(const Options& opt) : opt_(opt) {}

    Result ExtractToDir(IReader& tar_stream, const std::string& dst_dir, std::string_view tag) const;

    Result ExtractFileToDir(const std::string& archive_path, const std::string& dst_dir) const;

    std::size_t EntriesWritten() const { return entries_written_; }

  private:
    Options opt_{};
    mutable std::size_t entries_written_ = 0;
};

} // namespace gssa
