#include <gtest/gtest.h>
#include <array>

#include "adapters/fs.hpp"
#include "adapters/storage/local_store.hpp"
#include "support/temp_dir.hpp"

using fxfer::adapters::storage::LocalStore;
using fxfer::infra::ErrorCode;
using fxfer::testing::TempDir;

namespace {

auto bytes(std::string_view s) -> std::span<const char> {
    return {s.data(), s.size()};
}

} // namespace

TEST(LocalStoreTest, OutOfOrderRangedWrites)
{
    TempDir tmp;
    LocalStore store(tmp.path());

    ASSERT_TRUE(store.mkdir("dir/sub").has_value());
    ASSERT_TRUE(store.touch("dir/sub/obj").has_value());
    ASSERT_TRUE(store.ranged_write("dir/sub/obj", 5, bytes("56789")).has_value());
    ASSERT_TRUE(store.ranged_write("dir/sub/obj", 0, bytes("01234")).has_value());

    auto info = store.info("dir/sub/obj");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->size, 10u);
    EXPECT_FALSE(info->is_directory());
    EXPECT_EQ(fxfer::testing::read_file(tmp / "dir/sub/obj"), "0123456789");

    auto part = store.ranged_read("dir/sub/obj", 3, 4);
    ASSERT_TRUE(part.has_value());
    EXPECT_EQ(std::string(part->begin(), part->end()), "3456");

    auto tail = store.ranged_read("dir/sub/obj", 8, 100);
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(tail->size(), 2u);
}

TEST(LocalStoreTest, TouchTruncates)
{
    TempDir tmp;
    LocalStore store(tmp.path());
    fxfer::testing::write_file(tmp / "obj", "old content");

    ASSERT_TRUE(store.touch("obj").has_value());
    EXPECT_EQ(store.info("obj")->size, 0u);
}

TEST(LocalStoreTest, ListIsSortedAndShallow)
{
    TempDir tmp;
    fxfer::testing::write_file(tmp / "b.txt", "b");
    fxfer::testing::write_file(tmp / "a.txt", "a");
    fxfer::testing::write_file(tmp / "c/deep.txt", "deep");
    LocalStore store(tmp.path());

    auto root = store.list("");
    ASSERT_TRUE(root.has_value());
    ASSERT_EQ(root->size(), 3u);
    EXPECT_EQ((*root)[0].path, "a.txt");
    EXPECT_EQ((*root)[1].path, "b.txt");
    EXPECT_EQ((*root)[2].path, "c");
    EXPECT_TRUE((*root)[2].is_directory());

    auto sub = store.list("c");
    ASSERT_TRUE(sub.has_value());
    ASSERT_EQ(sub->size(), 1u);
    EXPECT_EQ(sub->front().path, "c/deep.txt");
}

TEST(LocalStoreTest, MissingObject)
{
    TempDir tmp;
    LocalStore store(tmp.path());
    EXPECT_FALSE(store.exists("nope"));
    auto info = store.info("nope");
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code, ErrorCode::FileNotFound);
}

TEST(LocalStoreTest, RejectsEscapingPaths)
{
    TempDir tmp;
    LocalStore store(tmp.path() / "root");
    auto res = store.ranged_read("../secret", 0, 1);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidPath);
}

TEST(LocalStoreTest, RemoveRecursive)
{
    TempDir tmp;
    fxfer::testing::write_file(tmp / "tree/x/y.txt", "y");
    LocalStore store(tmp.path());

    EXPECT_FALSE(store.remove("tree").has_value());
    ASSERT_TRUE(store.remove("tree", true).has_value());
    EXPECT_FALSE(store.exists("tree"));
    EXPECT_FALSE(store.remove("", true).has_value());
}

TEST(LocalFileTest, PositionalIo)
{
    TempDir tmp;
    auto out = fxfer::adapters::fs::LocalFile::open_for_write(tmp / "f.bin", true);
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(out->resize(8).has_value());
    ASSERT_TRUE(out->write_at(4, bytes("WXYZ")).has_value());
    ASSERT_TRUE(out->write_at(0, bytes("abcd")).has_value());
    EXPECT_EQ(out->size().value(), 8u);

    auto in = fxfer::adapters::fs::LocalFile::open_for_read(tmp / "f.bin");
    ASSERT_TRUE(in.has_value());
    std::array<char, 6> buf{};
    auto n = in->read_at(2, buf);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 6u);
    EXPECT_EQ(std::string(buf.data(), 6), "cdWXYZ");

    auto missing = fxfer::adapters::fs::LocalFile::open_for_read(tmp / "none");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
}
