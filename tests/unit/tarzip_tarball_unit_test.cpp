/******************************************************************************\
 * tarzip_tarball_unit_test.cpp - Tarball extraction unit tests for tarzip
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <sys/types.h>
#include <sys/stat.h>

#include "TestArchives.hpp"

#include "tarzip_tarball_unit_test.hpp"

static constexpr auto TEMP_DIR_TEMPLATE = "/tmp/tarzip-tarball-test-XXXXXX";

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using tarzip::Tarball;

TarzipTarballUnitTest::TarzipTarballUnitTest()
    : temp_dir{TEMP_DIR_TEMPLATE}
    , tarball_path{temp_dir.get() + "/input.tar.gz"}
    , dest_path{temp_dir.get() + "/dest"}
{
    if (mkdir(dest_path.c_str(), S_IRWXU)) {
        throw std::runtime_error("failed to create " + dest_path);
    }
}

TarzipTarballUnitTest::~TarzipTarballUnitTest()
{}

// expect fn to throw std::runtime_error with a message containing substr
#define EXPECT_THROW_SUBSTR(fn, substr) \
    EXPECT_THROW({ \
        try { \
            fn; \
        } catch (std::exception const& ex) { \
            EXPECT_THAT(ex.what(), HasSubstr(substr)); \
            throw; \
        } \
    }, std::runtime_error)

// test that files, directories and links are unpacked with their contents
TEST_F(TarzipTarballUnitTest, extractTo)
{
    writeTarGz(tarball_path,
        { TarEntry::dir("docs")
        , TarEntry::file("docs/readme.txt", "read me")
        , TarEntry::dir("docs/empty")
        , TarEntry::file("notes.txt", "hello")
        , TarEntry::symlink("latest", "notes.txt")
    });

    auto tarball = Tarball{tarball_path};
    EXPECT_EQ(tarball.path(), tarball_path);
    EXPECT_EQ(tarball.extractTo(dest_path), 5u);

    EXPECT_THAT(listDir(dest_path), ElementsAre("docs", "latest", "notes.txt"));
    EXPECT_THAT(listDir(dest_path + "/docs"), ElementsAre("empty", "readme.txt"));
    EXPECT_EQ(readFile(dest_path + "/docs/readme.txt"), "read me");
    EXPECT_EQ(readFile(dest_path + "/notes.txt"), "hello");
    EXPECT_TRUE(tarzip::isDirectory((dest_path + "/docs/empty").c_str()));
    EXPECT_EQ(tarzip::cstr::readlink(dest_path + "/latest"), "notes.txt");
}

// test that hard link entries unpack as a second name for their target
TEST_F(TarzipTarballUnitTest, extractHardlink)
{
    writeTarGz(tarball_path,
        { TarEntry::dir("docs")
        , TarEntry::file("docs/a.txt", "hello")
        , TarEntry::hardlink("docs/b.txt", "docs/a.txt")
        , TarEntry::hardlink("c.txt", "./docs/a.txt")
    });

    EXPECT_EQ(Tarball{tarball_path}.extractTo(dest_path), 4u);
    EXPECT_EQ(readFile(dest_path + "/docs/b.txt"), "hello");
    EXPECT_EQ(readFile(dest_path + "/c.txt"), "hello");

    struct stat target, linked;
    ASSERT_EQ(stat((dest_path + "/docs/a.txt").c_str(), &target), 0);
    ASSERT_EQ(stat((dest_path + "/docs/b.txt").c_str(), &linked), 0);
    EXPECT_EQ(target.st_ino, linked.st_ino);
    EXPECT_EQ(target.st_nlink, 3u);
}

// test that hard links cannot point outside the destination
TEST_F(TarzipTarballUnitTest, extractHardlinkTraversal)
{
    writeFile(temp_dir.get() + "/outside.txt", "outside");
    writeTarGz(tarball_path, { TarEntry::hardlink("inside.txt", "../outside.txt") });

    EXPECT_THROW_SUBSTR(Tarball{tarball_path}.extractTo(dest_path), "leaves the extraction directory");
    EXPECT_THAT(listDir(dest_path), IsEmpty());
}

// test unpacking into a destination reached through a symlink and ..
TEST_F(TarzipTarballUnitTest, extractThroughIndirectDestination)
{
    writeTarGz(tarball_path,
        { TarEntry::dir("docs")
        , TarEntry::file("docs/readme.txt", "read me")
        , TarEntry::hardlink("readme.txt", "docs/readme.txt")
    });

    auto const linkPath = temp_dir.get() + "/dest-link";
    ASSERT_EQ(symlink("dest", linkPath.c_str()), 0);

    EXPECT_EQ(Tarball{tarball_path}.extractTo(linkPath + "/../dest-link"), 3u);
    EXPECT_EQ(readFile(dest_path + "/docs/readme.txt"), "read me");
    EXPECT_EQ(readFile(dest_path + "/readme.txt"), "read me");
}

// test that entries without parent directory entries still unpack
TEST_F(TarzipTarballUnitTest, extractImplicitDirectories)
{
    writeTarGz(tarball_path, { TarEntry::file("a/b/c.txt", "deep") });

    EXPECT_EQ(Tarball{tarball_path}.extractTo(dest_path), 1u);
    EXPECT_EQ(readFile(dest_path + "/a/b/c.txt"), "deep");
}

// test that "./" prefixed archives unpack directly below the destination
TEST_F(TarzipTarballUnitTest, extractDotPrefixed)
{
    writeTarGz(tarball_path,
        { TarEntry::dir("./")
        , TarEntry::file("./notes.txt", "hello")
    });

    // the root entry is not counted
    EXPECT_EQ(Tarball{tarball_path}.extractTo(dest_path), 1u);
    EXPECT_THAT(listDir(dest_path), ElementsAre("notes.txt"));
}

// test that an archive with no entries unpacks to nothing
TEST_F(TarzipTarballUnitTest, extractEmpty)
{
    writeTarGz(tarball_path, {});

    EXPECT_EQ(Tarball{tarball_path}.extractTo(dest_path), 0u);
    EXPECT_THAT(listDir(dest_path), IsEmpty());
}

// test that the owner keeps access to unpacked files and directories
TEST_F(TarzipTarballUnitTest, extractRestrictivePermissions)
{
    writeTarGz(tarball_path,
        { TarEntry::dir("locked", 0500)
        , TarEntry::file("locked/secret.txt", "secret", 0000)
    });

    Tarball{tarball_path}.extractTo(dest_path);

    struct stat st;
    ASSERT_EQ(stat((dest_path + "/locked").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & S_IRWXU, S_IRWXU);
    ASSERT_EQ(stat((dest_path + "/locked/secret.txt").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & (S_IRUSR | S_IWUSR), (mode_t)(S_IRUSR | S_IWUSR));
    EXPECT_EQ(st.st_mode & (S_IRWXG | S_IRWXO), 0u);
}

// test that entries escaping the destination are refused
TEST_F(TarzipTarballUnitTest, extractTraversal)
{
    writeTarGz(tarball_path,
        { TarEntry::file("ok.txt", "ok")
        , TarEntry::file("../evil.txt", "evil")
    });

    EXPECT_THROW_SUBSTR(Tarball{tarball_path}.extractTo(dest_path), "leaves the extraction directory");
    EXPECT_FALSE(tarzip::pathExists((temp_dir.get() + "/evil.txt").c_str()));
}

// test that absolute entries are refused
TEST_F(TarzipTarballUnitTest, extractAbsolute)
{
    auto const absPath = temp_dir.get() + "/absolute.txt";
    writeTarGz(tarball_path, { TarEntry::file(absPath, "abs") });

    EXPECT_THROW_SUBSTR(Tarball{tarball_path}.extractTo(dest_path), "absolute path in archive");
    EXPECT_FALSE(tarzip::pathExists(absPath.c_str()));
}

// test that device and pipe entries are refused
TEST_F(TarzipTarballUnitTest, extractUnsupportedType)
{
    writeTarGz(tarball_path, { TarEntry::fifo("pipe") });

    EXPECT_THROW_SUBSTR(Tarball{tarball_path}.extractTo(dest_path), "pipe: unsupported entry type");
}

// test that the archive stream can only be unpacked once
TEST_F(TarzipTarballUnitTest, extractTwice)
{
    writeTarGz(tarball_path, { TarEntry::file("notes.txt", "hello") });

    auto tarball = Tarball{tarball_path};
    tarball.extractTo(dest_path);
    EXPECT_THROW_SUBSTR(tarball.extractTo(dest_path), "was already extracted");
}

// test that an uncompressed tar is not accepted
TEST_F(TarzipTarballUnitTest, rejectUncompressed)
{
    writeTar(tarball_path, { TarEntry::file("notes.txt", "hello") });

    EXPECT_THROW_SUBSTR(Tarball{tarball_path}, "not in gzip format");
}

// test that files that are not archives at all are refused
TEST_F(TarzipTarballUnitTest, rejectGarbage)
{
    writeFile(tarball_path, "this is not an archive\n");

    EXPECT_THROW({
        auto tarball = Tarball{tarball_path};
        tarball.extractTo(dest_path);
    }, std::runtime_error);
}

// test that a truncated archive fails partway through extraction
TEST_F(TarzipTarballUnitTest, rejectTruncated)
{
    auto contents = std::string{};
    for (int i = 0; i < 20000; i++) {
        contents += "line " + std::to_string(i) + "\n";
    }
    writeTarGz(tarball_path, { TarEntry::file("big.txt", contents) });

    auto const whole = readFile(tarball_path);
    writeFile(tarball_path, whole.substr(0, whole.length() / 2));

    EXPECT_THROW({
        auto tarball = Tarball{tarball_path};
        tarball.extractTo(dest_path);
    }, std::runtime_error);
}

// test that a missing tarball is reported on open
TEST_F(TarzipTarballUnitTest, missingTarball)
{
    EXPECT_THROW_SUBSTR(Tarball{temp_dir.get() + "/missing.tar.gz"}, "is not a readable regular file");
}

// test entry path normalization
TEST_F(TarzipTarballUnitTest, normalizeEntryPath)
{
    EXPECT_EQ(Tarball::normalizeEntryPath("a/b.txt"),    "a/b.txt");
    EXPECT_EQ(Tarball::normalizeEntryPath("./a/b.txt"),  "a/b.txt");
    EXPECT_EQ(Tarball::normalizeEntryPath("a//./b/"),    "a/b");
    EXPECT_EQ(Tarball::normalizeEntryPath("dir/"),       "dir");
    EXPECT_EQ(Tarball::normalizeEntryPath("..data"),     "..data");
    EXPECT_EQ(Tarball::normalizeEntryPath("."),          "");
    EXPECT_EQ(Tarball::normalizeEntryPath("./"),         "");

    EXPECT_THROW(Tarball::normalizeEntryPath("/etc/passwd"), std::runtime_error);
    EXPECT_THROW(Tarball::normalizeEntryPath(".."),          std::runtime_error);
    EXPECT_THROW(Tarball::normalizeEntryPath("a/../../b"),   std::runtime_error);
    EXPECT_THROW(Tarball::normalizeEntryPath("a/.."),        std::runtime_error);
}
