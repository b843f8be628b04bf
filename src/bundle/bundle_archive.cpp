#include "bundle/bundle_archive.hpp"

#include "bundle/tar_reader_adapter.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <vector>

namespace gssa {

namespace {

EntryType ClassifyEntry(struct archive_entry* e) {
    switch (archive_entry_filetype(e)) {
        case AE_IFREG:
            // Hardlinks are reported as regular files carrying a link target.
            return archive_entry_hardlink(e) ? EntryType::Other : EntryType::Regular;
        case AE_IFDIR:
            return EntryType::Directory;
        default:
            return EntryType::Other;
    }
}

} // namespace

BundleArchive::~BundleArchive() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result BundleArchive::Open(const std::string& path) {
    if (ar_) return Result::Fail(ErrorKind::ArchiveOpenError, "Bundle already opened: " + path_);
    path_ = path;

    source_ = std::make_unique<FileReader>();
    if (auto r = FileReader::Open(path, *source_); !r.ok) {
        return Result::Fail(ErrorKind::ArchiveOpenError, r.msg, r.err);
    }

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(ErrorKind::ArchiveOpenError, "archive_read_new failed");

    archive_read_support_filter_all(ar_);
    archive_read_support_format_tar(ar_);
    archive_read_support_format_gnutar(ar_);

    if (OpenArchiveFromReader(ar_, *source_) != ARCHIVE_OK) {
        std::string em = ArchiveErr(ar_);
        archive_read_free(ar_);
        ar_ = nullptr;
        return Result::Fail(ErrorKind::ArchiveOpenError, "Cannot open archive " + path + ": " + em);
    }

    return Result::Ok();
}

Result BundleArchive::Next(ArchiveEntry& out, bool& eof) {
    eof = false;
    if (!ar_) return Result::Fail(ErrorKind::ArchiveOpenError, "Bundle not opened");

    if (in_entry_) {
        if (auto r = SkipCurrent(); !r.ok) return r;
    }

    while (true) {
        struct archive_entry* entry = nullptr;
        const int r = archive_read_next_header(ar_, &entry);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r == ARCHIVE_WARN) {
            LogWarn("%s: %s", path_.c_str(), ArchiveErr(ar_).c_str());
        } else if (r != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::ArchiveOpenError,
                                "archive_read_next_header: " + ArchiveErr(ar_));
        }

        const char* name = archive_entry_pathname(entry);
        std::string path = StripTrailingSlashes(NormalizeTarPath(name ? name : ""));
        if (path.empty() || path == "." || path == "/") {
            (void)archive_read_data_skip(ar_);
            continue;
        }

        out.path = std::move(path);
        out.type = ClassifyEntry(entry);
        const la_int64_t size = archive_entry_size(entry);
        out.size = size > 0 ? static_cast<std::uint64_t>(size) : 0;

        in_entry_ = true;
        return Result::Ok();
    }
}

Result BundleArchive::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    in_entry_ = false;
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::ExtractionError, "archive_read_data_skip: " + ArchiveErr(ar_));
    }
    return Result::Ok();
}

Result BundleArchive::CopyCurrentTo(IWriter& writer) {
    if (!in_entry_) return Result::Fail(ErrorKind::ExtractionError, "No current entry");

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar_, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            in_entry_ = false;
            return Result::Fail(ErrorKind::ExtractionError, "archive_read_data: " + ArchiveErr(ar_));
        }
        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.ok) {
            in_entry_ = false;
            return wr;
        }
    }

    in_entry_ = false;
    return Result::Ok();
}

Result ListEntries(const std::string& archive_path, std::vector<ArchiveEntry>& out) {
    out.clear();

    BundleArchive archive;
    if (auto r = archive.Open(archive_path); !r.ok) return r;

    while (true) {
        ArchiveEntry entry;
        bool eof = false;
        if (auto r = archive.Next(entry, eof); !r.ok) return r;
        if (eof) break;
        out.push_back(std::move(entry));
    }
    return Result::Ok();
}

} // namespace gssa
