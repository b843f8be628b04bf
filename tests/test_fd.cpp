#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <utility>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        gssa::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, MoveTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    gssa::Fd a(fd);
    gssa::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_EQ(b.Get(), fd);

    EXPECT_EQ(b.Close(), 0);
    EXPECT_FALSE(b.Valid());
    EXPECT_EQ(b.Close(), 0);
}

} // namespace
