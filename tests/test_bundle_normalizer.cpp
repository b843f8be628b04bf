#include "bundle/bundle_normalizer.hpp"
#include "crypto/sha256.hpp"
#include "testing.hpp"
#include "util/logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace gssa {
namespace {

namespace fs = std::filesystem;

ArchiveEntry File(std::string path) { return {std::move(path), EntryType::Regular, 0}; }
ArchiveEntry Dir(std::string path) { return {std::move(path), EntryType::Directory, 0}; }

// relative path -> sha256 ("<dir>" for directories)
std::map<std::string, std::string> Snapshot(const fs::path& root) {
    std::map<std::string, std::string> out;
    for (const auto& e : fs::recursive_directory_iterator(root)) {
        const auto rel = fs::relative(e.path(), root).string();
        if (e.is_directory()) {
            out[rel] = "<dir>";
        } else {
            std::string hex;
            EXPECT_TRUE(Sha256HexFile(e.path().string(), hex).ok);
            out[rel] = hex;
        }
    }
    return out;
}

class BundleNormalizerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        prev_level_ = Logger::Instance().Level();
        Logger::Instance().SetLevel(LogLevel::Debug);
    }

    void TearDown() override { Logger::Instance().SetLevel(prev_level_); }

    std::string Bundle(const std::vector<testutil::TarEntry>& entries) {
        return testutil::WriteTarFile(temp.Path() + "/bundle.tar", entries);
    }

    fs::path Dest() const { return fs::path(temp.Path()) / "out"; }

    testutil::TemporaryDirectory temp;

  private:
    LogLevel prev_level_{LogLevel::Info};
};

TEST(CommonPrefixTest, SharedDirectory) {
    EXPECT_EQ(CommonPrefix({File("bundle/input.final/settings.xml"), File("bundle/output/log.txt")}),
              "bundle/");
}

TEST(CommonPrefixTest, CutsBackToDirectoryBoundary) {
    EXPECT_EQ(CommonPrefix({File("bundle/a1.txt"), File("bundle/a2.txt")}), "bundle/");
    EXPECT_EQ(CommonPrefix({File("tmp/sim-1/x"), File("tmp/sim-2/y")}), "tmp/");
}

TEST(CommonPrefixTest, NestedPrefix) {
    EXPECT_EQ(CommonPrefix({File("tmp/abc/output/a"), File("tmp/abc/input/b")}), "tmp/abc/");
}

TEST(CommonPrefixTest, IgnoresDirectories) {
    EXPECT_EQ(CommonPrefix({Dir("bundle"), Dir("other"), File("bundle/x/a"), File("bundle/x/b")}),
              "bundle/x/");
}

TEST(CommonPrefixTest, EmptyWhenNothingShared) {
    EXPECT_EQ(CommonPrefix({File("a/x"), File("b/y")}), "");
    EXPECT_EQ(CommonPrefix({File("x"), File("y")}), "");
    EXPECT_EQ(CommonPrefix({Dir("only-dir")}), "");
    EXPECT_EQ(CommonPrefix({}), "");
}

TEST(CommonPrefixTest, SingleFileUsesItsDirectory) {
    EXPECT_EQ(CommonPrefix({File("bundle/output/log.txt")}), "bundle/output/");
}

TEST(CommonPrefixTest, StrippedPathsHaveNoLeadingSeparator) {
    const std::vector<ArchiveEntry> entries = {File("run/7/input/a"), File("run/7/output/b")};
    const auto prefix = CommonPrefix(entries);
    for (const auto& e : entries) {
        const auto mapped = MapMemberPath(e.path, prefix);
        ASSERT_TRUE(mapped.has_value());
        EXPECT_NE(mapped->front(), '/');
    }
}

TEST(MapMemberPathTest, StripsPrefixAndRenamesLegacyInput) {
    EXPECT_EQ(MapMemberPath("bundle/input.final/settings.xml", "bundle/"), "input/settings.xml");
    EXPECT_EQ(MapMemberPath("bundle/output/log.txt", "bundle/"), "output/log.txt");
    EXPECT_EQ(MapMemberPath("bundle/input.final", "bundle/"), "input");
}

TEST(MapMemberPathTest, ReplacesEveryOccurrenceAndNothingElse) {
    EXPECT_EQ(MapMemberPath("b/input.final/input.final.bak/input.finals", "b/"),
              "input/input.bak/inputs");
    EXPECT_EQ(MapMemberPath("b/input.fina/input_final", "b/"), "input.fina/input_final");
}

TEST(MapMemberPathTest, SkipsPrefixAndOutsiders) {
    EXPECT_FALSE(MapMemberPath("bundle/", "bundle/").has_value());
    EXPECT_FALSE(MapMemberPath("bundle", "bundle/").has_value());
    EXPECT_FALSE(MapMemberPath("elsewhere/x", "bundle/").has_value());
}

TEST(InputLayoutTest, DetectsPresentAndMissingInput) {
    EXPECT_FALSE(InputLayoutMissing({Dir("b/input.final"), File("b/input.final/s.xml")}, "b/"));
    EXPECT_FALSE(InputLayoutMissing({Dir("b/input"), File("b/output/x")}, "b/"));
    EXPECT_TRUE(InputLayoutMissing({File("b/output/x"), File("b/output/y")}, "b/"));
}

TEST_F(BundleNormalizerTest, EndToEndRenamesInputFinal) {
    const auto archive = Bundle({
        {"bundle/input.final/settings.xml", "<settings/>", AE_IFREG},
        {"bundle/output/log.txt", "log line\n", AE_IFREG},
    });

    BundleNormalizer normalizer;
    std::string prefix;
    ASSERT_TRUE(normalizer.ComputePrefix(archive, prefix).ok);
    EXPECT_EQ(prefix, "bundle/");

    auto res = normalizer.Normalize(archive, Dest());
    ASSERT_TRUE(res.ok) << res.msg;

    EXPECT_EQ(testutil::ReadFile(Dest() / "input" / "settings.xml"), "<settings/>");
    EXPECT_EQ(testutil::ReadFile(Dest() / "output" / "log.txt"), "log line\n");
    EXPECT_FALSE(fs::exists(Dest() / "input.final"));
    EXPECT_FALSE(fs::exists(Dest() / "bundle"));
}

TEST_F(BundleNormalizerTest, VerboseLogsDigestOfEachExtractedFile) {
    const auto archive = Bundle({
        {"case/input/settings.xml", "abc", AE_IFREG},
        {"case/output/log.txt", "log", AE_IFREG},
    });

    BundleNormalizer::Options opt;
    opt.verbose = true;

    ::testing::internal::CaptureStderr();
    auto res = BundleNormalizer(opt).Normalize(archive, Dest());
    const std::string log = ::testing::internal::GetCapturedStderr();
    ASSERT_TRUE(res.ok) << res.msg;

    EXPECT_NE(log.find("input/settings.xml sha256 "
                       "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
              std::string::npos)
        << log;
    EXPECT_NE(log.find("output/log.txt sha256 "), std::string::npos) << log;
}

TEST_F(BundleNormalizerTest, QuietExtractionSkipsDigests) {
    const auto archive = Bundle({{"case/input/settings.xml", "abc", AE_IFREG}});

    ::testing::internal::CaptureStderr();
    auto res = BundleNormalizer().Normalize(archive, Dest());
    const std::string log = ::testing::internal::GetCapturedStderr();
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(log.find("sha256"), std::string::npos) << log;
}

TEST_F(BundleNormalizerTest, SynthesizesMissingInputDirectory) {
    const auto archive = Bundle({
        {"sim/", "", AE_IFDIR},
        {"sim/output/", "", AE_IFDIR},
        {"sim/output/result.vtu", "data", AE_IFREG},
        {"sim/logs/run.log", "ok", AE_IFREG},
    });

    BundleNormalizer normalizer;
    bool needs_input = false;
    ASSERT_TRUE(normalizer.DetectInputLayout(archive, "sim/", needs_input).ok);
    EXPECT_TRUE(needs_input);

    auto res = normalizer.Normalize(archive, Dest());
    ASSERT_TRUE(res.ok) << res.msg;

    EXPECT_TRUE(fs::is_directory(Dest() / "input"));
    EXPECT_TRUE(fs::is_empty(Dest() / "input"));
    EXPECT_EQ(testutil::ReadFile(Dest() / "output" / "result.vtu"), "data");
    EXPECT_EQ(testutil::ReadFile(Dest() / "logs" / "run.log"), "ok");
}

TEST_F(BundleNormalizerTest, CreatesEmptyDirectoryMembers) {
    const auto archive = Bundle({
        {"b/input/", "", AE_IFDIR},
        {"b/output/empty/", "", AE_IFDIR},
        {"b/output/a.txt", "a", AE_IFREG},
    });

    ASSERT_TRUE(BundleNormalizer().Normalize(archive, Dest()).ok);
    EXPECT_TRUE(fs::is_directory(Dest() / "output" / "empty"));
    EXPECT_TRUE(fs::is_directory(Dest() / "input"));
}

TEST_F(BundleNormalizerTest, RefusesExistingDestinationWithoutForce) {
    const auto archive = Bundle({
        {"b/input/x", "new", AE_IFREG},
        {"b/output/y", "new", AE_IFREG},
    });
    fs::create_directories(Dest());
    testutil::WriteFile((Dest() / "keep.txt").string(), "old");
    const auto before = Snapshot(Dest());

    auto res = BundleNormalizer().Normalize(archive, Dest());
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::DestinationExistsError);
    EXPECT_EQ(Snapshot(Dest()), before);
}

TEST_F(BundleNormalizerTest, ForceReplacesExistingTree) {
    const auto archive = Bundle({
        {"b/input/x", "new", AE_IFREG},
        {"b/output/y", "new", AE_IFREG},
    });
    fs::create_directories(Dest());
    testutil::WriteFile((Dest() / "stale.txt").string(), "old");

    BundleNormalizer::Options opt;
    opt.force = true;
    auto res = BundleNormalizer(opt).Normalize(archive, Dest());
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_FALSE(fs::exists(Dest() / "stale.txt"));
    EXPECT_EQ(testutil::ReadFile(Dest() / "input" / "x"), "new");
}

TEST_F(BundleNormalizerTest, ForcedExtractionIsIdempotent) {
    const auto archive = Bundle({
        {"bundle/input.final/settings.xml", "<settings/>", AE_IFREG},
        {"bundle/output/log.txt", std::string(200000, 'z'), AE_IFREG},
        {"bundle/output/sub/", "", AE_IFDIR},
    });

    BundleNormalizer::Options opt;
    opt.force = true;
    BundleNormalizer normalizer(opt);

    ASSERT_TRUE(normalizer.Normalize(archive, Dest()).ok);
    const auto first = Snapshot(Dest());
    ASSERT_TRUE(normalizer.Normalize(archive, Dest()).ok);
    EXPECT_EQ(Snapshot(Dest()), first);
    EXPECT_FALSE(first.empty());
}

TEST_F(BundleNormalizerTest, UnreadableArchiveKeepsDestination) {
    const std::string archive = temp.Path() + "/broken.tar";
    testutil::WriteFile(archive, "definitely not a tar archive, but long enough to be read as one");
    fs::create_directories(Dest());
    testutil::WriteFile((Dest() / "keep.txt").string(), "old");

    BundleNormalizer::Options opt;
    opt.force = true;
    auto res = BundleNormalizer(opt).Normalize(archive, Dest());
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::ArchiveOpenError);
    EXPECT_EQ(testutil::ReadFile(Dest() / "keep.txt"), "old");
}

TEST_F(BundleNormalizerTest, RejectsPathEscape) {
    const auto archive = Bundle({
        {"b/output/ok.txt", "fine", AE_IFREG},
        {"b/output/../../../escape.txt", "boom", AE_IFREG},
    });

    auto res = BundleNormalizer().Normalize(archive, Dest());
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::ExtractionError);
    EXPECT_FALSE(fs::exists(fs::path(temp.Path()) / "escape.txt"));
    EXPECT_FALSE(fs::exists(fs::path(temp.Path()).parent_path() / "escape.txt"));
}

TEST_F(BundleNormalizerTest, SkipsSymlinkMembers) {
    const auto archive = Bundle({
        {"b/input/settings.xml", "<s/>", AE_IFREG},
        {"b/output/link", "", AE_IFLNK, "/etc/passwd"},
    });

    auto res = BundleNormalizer().Normalize(archive, Dest());
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_FALSE(fs::exists(fs::symlink_status(Dest() / "output" / "link")));
}

TEST_F(BundleNormalizerTest, GoosefootModeCopiesSettings) {
    const auto archive = Bundle({
        {"bundle/input.final/settings.xml", "<goosefoot/>", AE_IFREG},
        {"bundle/output/log.txt", "x", AE_IFREG},
    });

    BundleNormalizer::Options opt;
    opt.mode = GoosefootMode{};
    auto res = BundleNormalizer(opt).Normalize(archive, Dest());
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(testutil::ReadFile(Dest() / "settings" / "settings.xml"), "<goosefoot/>");
}

TEST_F(BundleNormalizerTest, GoosefootModeFailsWithoutSettings) {
    const auto archive = Bundle({
        {"bundle/output/log.txt", "x", AE_IFREG},
        {"bundle/output/err.txt", "y", AE_IFREG},
    });

    BundleNormalizer::Options opt;
    opt.mode = GoosefootMode{};
    auto res = BundleNormalizer(opt).Normalize(archive, Dest());
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::MissingFileError);
}

} // namespace
} // namespace gssa
