#include "io/temp_file.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <utility>

namespace {

TEST(TempFileTest, CreatedInRequestedDirectoryAndRemovedOnDestruct) {
    testutil::TemporaryDirectory tmp;
    std::string path;
    {
        otadump::TempFile f;
        auto r = otadump::TempFile::Create(tmp.Path(), "stage-", f);
        ASSERT_TRUE(r.ok) << r.msg;
        path = f.Path();
        EXPECT_EQ(path.rfind(tmp.Path() + "/stage-", 0), 0u);
        EXPECT_GE(f.GetFd(), 0);
        EXPECT_TRUE(testutil::FileExists(path));

        f.Close();
        EXPECT_TRUE(testutil::FileExists(path));
    }
    EXPECT_FALSE(testutil::FileExists(path));
}

TEST(TempFileTest, MoveKeepsSingleOwner) {
    testutil::TemporaryDirectory tmp;
    otadump::TempFile a;
    ASSERT_TRUE(otadump::TempFile::Create(tmp.Path(), "m-", a).ok);
    const std::string path = a.Path();

    otadump::TempFile b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_TRUE(b.Valid());
    EXPECT_EQ(b.Path(), path);
    EXPECT_TRUE(testutil::FileExists(path));
}

TEST(TempFileTest, MissingDirectoryFails) {
    otadump::TempFile f;
    auto r = otadump::TempFile::Create("/nonexistent/otadump", "x-", f);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, otadump::ErrorKind::Io);
    EXPECT_FALSE(f.Valid());
}

} // namespace
