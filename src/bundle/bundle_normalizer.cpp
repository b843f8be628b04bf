#include "bundle/bundle_normalizer.hpp"

#include "bundle/archive_path_policy.hpp"
#include "crypto/sha256.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>

namespace gssa {

namespace fs = std::filesystem;

std::string CommonPrefix(const std::vector<ArchiveEntry>& entries) {
    const std::string* first = nullptr;
    std::string::size_type len = 0;

    for (const auto& e : entries) {
        if (e.is_directory()) continue;
        if (!first) {
            first = &e.path;
            len = e.path.size();
            continue;
        }
        const auto limit = std::min(len, e.path.size());
        std::string::size_type i = 0;
        while (i < limit && (*first)[i] == e.path[i]) ++i;
        len = i;
    }

    if (!first) return {};

    // A bare file name is never a prefix: "bundle/a1", "bundle/a2" share "bundle/".
    const auto slash = first->rfind('/', len == 0 ? 0 : len - 1);
    if (len == 0 || slash == std::string::npos) return {};
    return first->substr(0, slash + 1);
}

bool InputLayoutMissing(const std::vector<ArchiveEntry>& entries, const std::string& prefix) {
    const std::string input = prefix + std::string(kInputName);
    const std::string legacy = prefix + std::string(kLegacyInputName);
    return std::none_of(entries.begin(), entries.end(), [&](const ArchiveEntry& e) {
        return e.path == input || e.path == legacy;
    });
}

std::optional<std::string> MapMemberPath(const std::string& member_path, const std::string& prefix) {
    if (!StartsWith(member_path, prefix)) return std::nullopt;
    std::string rel = member_path.substr(prefix.size());
    if (rel.empty()) return std::nullopt;
    return ReplaceAll(std::move(rel), kLegacyInputName, kInputName);
}

Result PrepareDestination(const fs::path& destination, bool force) {
    std::error_code ec;
    const bool exists = fs::exists(fs::symlink_status(destination, ec));
    if (ec) {
        return Result::Fail(ErrorKind::ExtractionError,
                            "Cannot stat " + destination.string() + ": " + ec.message(), ec.value());
    }
    if (!exists) return Result::Ok();

    if (!force) {
        return Result::Fail(ErrorKind::DestinationExistsError,
                            "Destination already exists: " + destination.string() +
                                " (use --force to overwrite)",
                            EEXIST);
    }

    LogInfo("Removing existing destination %s", destination.c_str());
    fs::remove_all(destination, ec);
    if (ec) {
        return Result::Fail(ErrorKind::ExtractionError,
                            "Cannot remove " + destination.string() + ": " + ec.message(), ec.value());
    }
    return Result::Ok();
}

Result BundleNormalizer::ComputePrefix(const std::string& archive_path, std::string& out_prefix) const {
    std::vector<ArchiveEntry> entries;
    if (auto r = ListEntries(archive_path, entries); !r.ok) return r;
    out_prefix = CommonPrefix(entries);
    LogDebug("Common prefix of %s: '%s' (%zu members)", archive_path.c_str(), out_prefix.c_str(),
             entries.size());
    return Result::Ok();
}

Result BundleNormalizer::DetectInputLayout(const std::string& archive_path,
                                           const std::string& prefix,
                                           bool& out_needs_input_dir) const {
    std::vector<ArchiveEntry> entries;
    if (auto r = ListEntries(archive_path, entries); !r.ok) return r;
    out_needs_input_dir = InputLayoutMissing(entries, prefix);
    return Result::Ok();
}

Result BundleNormalizer::Extract(const std::string& archive_path,
                                 const std::string& prefix,
                                 const fs::path& destination,
                                 const ExtractOptions& extract_opt) const {
    BundleArchive archive;
    if (auto r = archive.Open(archive_path); !r.ok) return r;

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        return Result::Fail(ErrorKind::ExtractionError,
                            "Cannot create " + destination.string() + ": " + ec.message(), ec.value());
    }

    if (extract_opt.synthesize_input_dir) {
        LogInfo("No input directory in %s, creating an empty one", archive_path.c_str());
        fs::create_directories(destination / kInputName, ec);
        if (ec) {
            return Result::Fail(ErrorKind::ExtractionError,
                                "Cannot create input directory: " + ec.message(), ec.value());
        }
    }

    const ArchivePathPolicy policy(/*safe_paths_only=*/true);
    const LogLevel member_level = extract_opt.verbose ? LogLevel::Info : LogLevel::Debug;

    std::size_t files = 0;
    std::size_t dirs = 0;

    while (true) {
        ArchiveEntry entry;
        bool eof = false;
        if (auto r = archive.Next(entry, eof); !r.ok) return r;
        if (eof) break;

        const auto mapped = MapMemberPath(entry.path, prefix);
        if (!mapped) {
            if (!StartsWith(prefix, entry.path + "/")) {
                LogWarn("Skipping member outside common prefix: %s", entry.path.c_str());
            }
            continue;
        }

        std::string rel;
        if (auto r = policy.NormalizeEntryPath(mapped->c_str(), rel); !r.ok) return r;
        if (rel.empty() || rel == ".") continue;

        fs::path target;
        if (auto r = policy.ResolveUnder(destination, rel, target); !r.ok) return r;

        if (entry.type == EntryType::Other) {
            LogWarn("Skipping non-regular member: %s", entry.path.c_str());
            continue;
        }

        Logger::Instance().Log(member_level, "%s -> %s", entry.path.c_str(), rel.c_str());

        if (entry.is_directory()) {
            fs::create_directories(target, ec);
            if (ec) {
                return Result::Fail(ErrorKind::ExtractionError,
                                    "Cannot create " + target.string() + ": " + ec.message(), ec.value());
            }
            ++dirs;
            continue;
        }

        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result::Fail(ErrorKind::ExtractionError,
                                "Cannot create " + target.parent_path().string() + ": " + ec.message(),
                                ec.value());
        }

        FileWriter writer;
        if (auto r = FileWriter::Open(target.string(), writer); !r.ok) return r;
        if (auto r = archive.CopyCurrentTo(writer); !r.ok) {
            return Result::Fail(ErrorKind::ExtractionError,
                                "Failed to extract " + entry.path + ": " + r.msg, r.err);
        }
        if (auto r = writer.Close(); !r.ok) return r;
        ++files;

        if (extract_opt.verbose) {
            std::string digest;
            if (auto r = Sha256HexFile(target.string(), digest); !r.ok) return r;
            LogInfo("%s sha256 %s", rel.c_str(), digest.c_str());
        }
    }

    LogInfo("Extracted %zu files and %zu directories into %s", files, dirs, destination.c_str());
    return Result::Ok();
}

Result BundleNormalizer::Normalize(const std::string& archive_path, const fs::path& destination) const {
    // Inspect first: a bundle that cannot be read must not cost the caller
    // an existing destination tree.
    std::vector<ArchiveEntry> entries;
    if (auto r = ListEntries(archive_path, entries); !r.ok) return r;

    const std::string prefix = CommonPrefix(entries);
    const bool needs_input_dir = InputLayoutMissing(entries, prefix);
    LogInfo("Bundle %s: %zu members, prefix '%s'", archive_path.c_str(), entries.size(), prefix.c_str());

    if (auto r = PrepareDestination(destination, opt_.force); !r.ok) return r;

    ExtractOptions extract_opt;
    extract_opt.verbose = opt_.verbose;
    extract_opt.synthesize_input_dir = needs_input_dir;
    if (auto r = Extract(archive_path, prefix, destination, extract_opt); !r.ok) return r;

    if (opt_.mode) {
        LogInfo("Finalizing for mode %.*s", (int)ModeName(*opt_.mode).size(), ModeName(*opt_.mode).data());
        if (auto r = FinalizeMode(*opt_.mode, destination); !r.ok) return r;
    }

    return Result::Ok();
}

} // namespace gssa
