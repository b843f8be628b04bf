#include "io/file_reader.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cerrno>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class FileReaderTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FileReaderTests, OpenOK_AndTotalSizeMatches) {
    const std::string p = MakePath("in.bin");
    testutil::WriteFile(p, std::string(12345, 'q'));

    gssa::FileReader r;
    auto res = gssa::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(r.Path(), p);

    auto sz = r.TotalSize();
    ASSERT_TRUE(sz.has_value());
    EXPECT_EQ(*sz, 12345u);
}

TEST_F(FileReaderTests, OpenNonexistent_Fails) {
    gssa::FileReader r;
    auto res = gssa::FileReader::Open(MakePath("nope.bin"), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(FileReaderTests, OpenDirectory_Fails) {
    gssa::FileReader r;
    auto res = gssa::FileReader::Open(tmp.Path(), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, EISDIR);
}

TEST_F(FileReaderTests, ReadAllBytes_EqualsInput) {
    const std::string p = MakePath("in2.bin");
    std::string data(2 * 1024 * 1024 + 7, '\0');
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>((i * 13) & 0xFF);
    testutil::WriteFile(p, data);

    gssa::FileReader r;
    auto res = gssa::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    std::vector<std::uint8_t> out(data.size());
    size_t pos = 0;
    while (pos < out.size()) {
        std::span<std::uint8_t> buf(out.data() + pos, out.size() - pos);
        ssize_t n = r.Read(buf);
        ASSERT_GE(n, 0);
        if (n == 0)
            break;
        pos += static_cast<size_t>(n);
    }

    ASSERT_EQ(pos, data.size());
    EXPECT_EQ(std::string(out.begin(), out.end()), data);
}

} // namespace
