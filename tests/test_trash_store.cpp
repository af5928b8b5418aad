#include <gtest/gtest.h>

#include "adapters/trash/trash_store.hpp"
#include "test_utils.hpp"

using namespace ftool::adapters::trash;
using ftool::infra::ErrorCode;
using ftool::test::TempDir;
using ftool::test::read_file;
using ftool::test::write_file;

TEST(TrashStoreTest, WritesFileAndInfo)
{
    TempDir tmp;
    write_file(tmp / "docs" / "note.txt", "keep me");
    FreedesktopTrash trash(tmp / "Trash");

    auto res = trash.send(tmp / "docs" / "note.txt");
    ASSERT_TRUE(res) << res.error().message;

    EXPECT_FALSE(std::filesystem::exists(tmp / "docs" / "note.txt"));
    EXPECT_EQ(read_file(tmp / "Trash" / "files" / "note.txt"), "keep me");

    auto info = read_file(tmp / "Trash" / "info" / "note.txt.trashinfo");
    EXPECT_EQ(info.rfind("[Trash Info]\n", 0), 0u);
    EXPECT_NE(info.find("Path=" + encode_trash_path(tmp / "docs" / "note.txt") + "\n"), std::string::npos);
    EXPECT_NE(info.find("DeletionDate="), std::string::npos);
}

TEST(TrashStoreTest, NameCollisionsGetSuffix)
{
    TempDir tmp;
    write_file(tmp / "a" / "same", "1");
    write_file(tmp / "b" / "same", "2");
    write_file(tmp / "c" / "same", "3");
    FreedesktopTrash trash(tmp / "Trash");

    ASSERT_TRUE(trash.send(tmp / "a" / "same"));
    ASSERT_TRUE(trash.send(tmp / "b" / "same"));
    ASSERT_TRUE(trash.send(tmp / "c" / "same"));

    EXPECT_EQ(read_file(tmp / "Trash" / "files" / "same"), "1");
    EXPECT_EQ(read_file(tmp / "Trash" / "files" / "same.2"), "2");
    EXPECT_EQ(read_file(tmp / "Trash" / "files" / "same.3"), "3");
    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash" / "info" / "same.3.trashinfo"));
}

TEST(TrashStoreTest, OrphanedFileIsNotReplaced)
{
    TempDir tmp;
    write_file(tmp / "Trash" / "files" / "a.txt", "OLD-TRASHED");
    write_file(tmp / "work" / "a.txt", "NEW");
    FreedesktopTrash trash(tmp / "Trash");

    ASSERT_TRUE(trash.send(tmp / "work" / "a.txt"));

    EXPECT_EQ(read_file(tmp / "Trash" / "files" / "a.txt"), "OLD-TRASHED");
    EXPECT_EQ(read_file(tmp / "Trash" / "files" / "a.txt.2"), "NEW");
    EXPECT_FALSE(std::filesystem::exists(tmp / "Trash" / "info" / "a.txt.trashinfo"));
    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash" / "info" / "a.txt.2.trashinfo"));
}

TEST(TrashStoreTest, TrashesDirectories)
{
    TempDir tmp;
    write_file(tmp / "project" / "src" / "main.cpp", "int main() {}");
    FreedesktopTrash trash(tmp / "Trash");

    ASSERT_TRUE(trash.send(tmp / "project"));
    EXPECT_EQ(read_file(tmp / "Trash" / "files" / "project" / "src" / "main.cpp"), "int main() {}");
}

TEST(TrashStoreTest, NoRootMeansUnavailable)
{
    TempDir tmp;
    write_file(tmp / "x", "x");
    FreedesktopTrash trash{std::filesystem::path{}};

    auto res = trash.send(tmp / "x");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::TrashUnavailable);
    EXPECT_TRUE(std::filesystem::exists(tmp / "x"));
}

TEST(TrashStoreTest, MissingSource)
{
    TempDir tmp;
    FreedesktopTrash trash(tmp / "Trash");
    auto res = trash.send(tmp / "ghost");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::SourceNotFound);
}

TEST(TrashStoreTest, DefaultRoot)
{
    EXPECT_EQ(default_trash_root("/xdg", "/home/u"), std::filesystem::path("/xdg/Trash"));
    EXPECT_EQ(default_trash_root("", "/home/u"), std::filesystem::path("/home/u/.local/share/Trash"));
    EXPECT_EQ(default_trash_root(nullptr, "/home/u"), std::filesystem::path("/home/u/.local/share/Trash"));
    EXPECT_FALSE(default_trash_root(nullptr, nullptr));
}

TEST(TrashStoreTest, EncodesPath)
{
    EXPECT_EQ(encode_trash_path("/plain/path-1_2.txt"), "/plain/path-1_2.txt");
    EXPECT_EQ(encode_trash_path("/a b/100%"), "/a%20b/100%25");
    EXPECT_EQ(encode_trash_path("/\xC3\xA7"), "/%C3%A7");
}
