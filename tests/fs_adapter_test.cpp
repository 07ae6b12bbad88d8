#include <gtest/gtest.h>

#include <chrono>
#include "adapters/fs.hpp"
#include "extensions/metadata.hpp"
#include "test_utils.hpp"

namespace fs = fxfer::adapters::fs;
using fxfer::test::TempDir;

TEST(FsAdapterTest, StrategyBySize)
{
    EXPECT_EQ(fs::select_strategy(0), fs::CopyStrategy::Buffered);
    EXPECT_EQ(fs::select_strategy(999'999), fs::CopyStrategy::Buffered);
    EXPECT_EQ(fs::select_strategy(1'000'000), fs::CopyStrategy::MMap);
    EXPECT_EQ(fs::select_strategy(100'000'000), fs::CopyStrategy::Uring);
}

class FsCopyStrategyTest : public ::testing::TestWithParam<fs::CopyStrategy> {};

TEST_P(FsCopyStrategyTest, ProducesIdenticalCopy)
{
    TempDir dir;
    const auto payload = fxfer::test::make_payload(3 * 65536 + 17);
    fxfer::test::write_file(dir / "src.bin", payload);

    // Маленький буфер, чтобы пройти несколько итераций цикла
    auto res = fs::copy_file(dir / "src.bin", dir / "dst.bin", GetParam(), 65536);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(fxfer::test::read_file(dir / "dst.bin"), payload);
}

TEST_P(FsCopyStrategyTest, CopiesEmptyFile)
{
    TempDir dir;
    fxfer::test::write_file(dir / "empty", "");

    auto res = fs::copy_file(dir / "empty", dir / "empty.copy", GetParam());
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_TRUE(std::filesystem::exists(dir / "empty.copy"));
    EXPECT_EQ(std::filesystem::file_size(dir / "empty.copy"), 0u);
}

TEST_P(FsCopyStrategyTest, TruncatesExistingDestination)
{
    TempDir dir;
    fxfer::test::write_file(dir / "src", "short");
    fxfer::test::write_file(dir / "dst", "a much longer previous content");

    ASSERT_TRUE(fs::copy_file(dir / "src", dir / "dst", GetParam()).has_value());
    EXPECT_EQ(fxfer::test::read_file(dir / "dst"), "short");
}

TEST_P(FsCopyStrategyTest, RefusesToCopyFileOntoItself)
{
    TempDir dir;
    // 2 MB: для MMap источник действительно отображается в память
    const auto payload = fxfer::test::make_payload(2 * 1024 * 1024, 7);
    fxfer::test::write_file(dir / "src.bin", payload);

    auto res = fs::copy_file(dir / "src.bin", dir / "src.bin", GetParam());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, fxfer::infra::ErrorCode::InvalidPath);
    EXPECT_EQ(fxfer::test::read_file(dir / "src.bin"), payload);
}

TEST_P(FsCopyStrategyTest, RefusesToCopyOntoHardLinkOfSource)
{
    TempDir dir;
    fxfer::test::write_file(dir / "src", "original");
    std::filesystem::create_hard_link(dir / "src", dir / "link");

    auto res = fs::copy_file(dir / "src", dir / "link", GetParam());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, fxfer::infra::ErrorCode::InvalidPath);
    EXPECT_EQ(fxfer::test::read_file(dir / "src"), "original");
}

INSTANTIATE_TEST_SUITE_P(AllStrategies, FsCopyStrategyTest,
    ::testing::Values(fs::CopyStrategy::Buffered, fs::CopyStrategy::MMap, fs::CopyStrategy::Uring));

TEST(FsAdapterTest, MissingSourceIsFilesystemError)
{
    TempDir dir;
    auto res = fs::copy_file(dir / "nope", dir / "dst");
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(res.error().is_filesystem_error());
    EXPECT_NE(res.error().message.find("nope"), std::string::npos);
}

TEST(FsAdapterTest, EnsureParentDirectoriesCreatesChain)
{
    TempDir dir;
    auto dst = dir / "a/b/c/file.txt";
    ASSERT_TRUE(fs::ensure_parent_directories(dst).has_value());
    EXPECT_TRUE(std::filesystem::is_directory(dir / "a/b/c"));
}

TEST(FsAdapterTest, EnsureParentDirectoriesFailsThroughRegularFile)
{
    TempDir dir;
    fxfer::test::write_file(dir / "blocker", "x");
    auto res = fs::ensure_parent_directories(dir / "blocker/sub/file.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(res.error().is_filesystem_error());
}

TEST(FsAdapterTest, UpToDateRequiresSameSizeAndNotOlder)
{
    TempDir dir;
    fxfer::test::write_file(dir / "src", "0123456789");
    EXPECT_FALSE(fs::is_up_to_date(dir / "src", dir / "dst"));

    fxfer::test::write_file(dir / "dst", "0123456789");
    auto t = std::filesystem::last_write_time(dir / "src");
    std::filesystem::last_write_time(dir / "dst", t);
    EXPECT_TRUE(fs::is_up_to_date(dir / "src", dir / "dst"));

    // Получатель старше источника
    std::filesystem::last_write_time(dir / "dst", t - std::chrono::hours(1));
    EXPECT_FALSE(fs::is_up_to_date(dir / "src", dir / "dst"));

    // Другой размер
    fxfer::test::write_file(dir / "dst", "012");
    std::filesystem::last_write_time(dir / "dst", t + std::chrono::hours(1));
    EXPECT_FALSE(fs::is_up_to_date(dir / "src", dir / "dst"));
}

TEST(MetadataTest, CopiesMtimeAndPermissions)
{
    TempDir dir;
    fxfer::test::write_file(dir / "src", "data");
    fxfer::test::write_file(dir / "dst", "data");

    using std::filesystem::perms;
    std::filesystem::permissions(dir / "src", perms::owner_read | perms::owner_write | perms::group_read,
                                 std::filesystem::perm_options::replace);
    auto when = std::filesystem::last_write_time(dir / "src") - std::chrono::hours(24);
    std::filesystem::last_write_time(dir / "src", when);

    auto res = fxfer::extensions::copy_metadata(dir / "src", dir / "dst");
    ASSERT_TRUE(res.has_value()) << res.error().message;

    EXPECT_EQ(std::filesystem::status(dir / "dst").permissions(),
              perms::owner_read | perms::owner_write | perms::group_read);
    EXPECT_EQ(std::filesystem::last_write_time(dir / "dst"), when);
}

TEST(MetadataTest, MissingDestinationFails)
{
    TempDir dir;
    fxfer::test::write_file(dir / "src", "data");
    EXPECT_FALSE(fxfer::extensions::copy_metadata(dir / "src", dir / "missing").has_value());
}
