#pragma once

#include "io/file_reader.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gssa {

enum class EntryType {
    Regular,
    Directory,
    Other,
};

struct ArchiveEntry {
    // Normalized relative path; directories carry no trailing slash.
    std::string path;
    EntryType type = EntryType::Regular;
    std::uint64_t size = 0;

    bool is_directory() const { return type == EntryType::Directory; }
};

// Sequential, read-only view over a tar bundle on disk (optionally
// compressed, any filter libarchive knows).
class BundleArchive {
public:
    BundleArchive() = default;
    ~BundleArchive();

    BundleArchive(const BundleArchive&) = delete;
    BundleArchive& operator=(const BundleArchive&) = delete;

    Result Open(const std::string& path);

    // Move to the next member of any type. Returns Ok + eof=true at end of archive.
    Result Next(ArchiveEntry& out, bool& eof);

    // Stream the current member's data to writer. Must be called at most once per member.
    Result CopyCurrentTo(IWriter& writer);

    // Skip any remaining bytes of current entry.
    Result SkipCurrent();

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    std::unique_ptr<FileReader> source_;
    struct archive* ar_ = nullptr;
    bool in_entry_ = false;
};

// Opens the archive and collects every member. Pure inspection.
Result ListEntries(const std::string& archive_path, std::vector<ArchiveEntry>& out);

} // namespace gssa
