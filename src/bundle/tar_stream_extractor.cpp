#include "bundle/tar_stream_extractor.hpp"

#include "bundle/archive_path_policy.hpp"
#include "bundle/tar_reader_adapter.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace gssa {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

Result ExtractFail(std::string msg) { return Result::Fail(ErrorKind::ExtractionError, std::move(msg)); }

} // namespace

Result TarStreamExtractor::ExtractToDir(IReader& tar_stream,
                                        const std::string& dst_dir,
                                        std::string_view tag) const {
    namespace fs = std::filesystem;

    entries_written_ = 0;
    const fs::path base_dir(dst_dir);

    std::error_code ec;
    if (!fs::exists(base_dir, ec) || ec) {
        return ExtractFail("Destination directory does not exist: " + dst_dir);
    }
    if (!fs::is_directory(base_dir, ec) || ec) {
        return ExtractFail("Destination path is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::ArchiveOpenError, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (OpenArchiveFromReader(ar.get(), tar_stream) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::ArchiveOpenError, "archive_read_open2: " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return ExtractFail("archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (opt_.restore_permissions) flags |= ARCHIVE_EXTRACT_PERM;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    const LogLevel entry_level = opt_.verbose ? LogLevel::Info : LogLevel::Debug;

    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("[%.*s] %s", (int)tag.size(), tag.data(), ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return ExtractFail("archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        Logger::Instance().Log(entry_level, "[%.*s] %s", (int)tag.size(), tag.data(), rel.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return ExtractFail("archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return ExtractFail("archive_read_data_block: " + ArchiveErr(ar.get()));

            const int ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return ExtractFail("archive_write_data_block: " + ArchiveErr(aw.get()));
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return ExtractFail("archive_write_finish_entry: " + ArchiveErr(aw.get()));
        ++entries_written_;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return ExtractFail("archive_write_close: " + ArchiveErr(aw.get()));
    }

    LogInfo("[%.*s] extracted %zu entries into %s", (int)tag.size(), tag.data(), entries_written_,
            dst_dir.c_str());
    return Result::Ok();
}

Result TarStreamExtractor::ExtractFileToDir(const std::string& archive_path, const std::string& dst_dir) const {
    FileReader reader;
    if (auto r = FileReader::Open(archive_path, reader); !r.ok) {
        return Result::Fail(ErrorKind::ArchiveOpenError, r.msg, r.err);
    }
    return ExtractToDir(reader, dst_dir, std::filesystem::path(archive_path).filename().string());
}

} // namespace gssa
