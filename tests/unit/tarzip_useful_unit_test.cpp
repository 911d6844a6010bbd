/******************************************************************************\
 * tarzip_useful_unit_test.cpp - /useful unit tests for tarzip
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"
#include "tarzip_argv_defs.hpp"

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

#include <vector>

#include "useful/tarzip_log.h"

#include "TestArchives.hpp"

#include "tarzip_useful_unit_test.hpp"

using ::testing::HasSubstr;
using ::testing::StartsWith;

static constexpr auto TEMP_DIR_TEMPLATE = "/tmp/tarzip-useful-test-XXXXXX";

TarzipUsefulUnitTest::TarzipUsefulUnitTest()
    : temp_dir{TEMP_DIR_TEMPLATE}
{}

TarzipUsefulUnitTest::~TarzipUsefulUnitTest()
{}

/* IncomingArgv */

// test that every option and parameter is recognized
TEST_F(TarzipUsefulUnitTest, IncomingArgv_all)
{
    auto const args = TestArgv{"tarzip", "-d", "in", "--output=out", "-f", "-j", "4",
        "--fail-fast", "-n", "--quiet", "--report", "report.json", "--debug", "-h"};
    auto incomingArgv = tarzip::IncomingArgv<TarzipArgv>{args.argc(), args.argv()};

    auto expected = std::vector<std::pair<int, std::string>>
        { {TarzipArgv::Directory.val, "in"}
        , {TarzipArgv::Output.val,    "out"}
        , {TarzipArgv::Force.val,     ""}
        , {TarzipArgv::Jobs.val,      "4"}
        , {TarzipArgv::FailFast.val,  ""}
        , {TarzipArgv::DryRun.val,    ""}
        , {TarzipArgv::Quiet.val,     ""}
        , {TarzipArgv::Report.val,    "report.json"}
        , {TarzipArgv::Debug.val,     ""}
        , {TarzipArgv::Help.val,      ""}
    };

    for (auto&& [val, arg] : expected) {
        auto const [c, optarg] = incomingArgv.get_next();
        EXPECT_EQ(c, val);
        EXPECT_EQ(optarg, arg);
    }
    EXPECT_LT(incomingArgv.get_next().first, 0);
    EXPECT_EQ(incomingArgv.get_rest_argc(), 0);
}

// test that unknown flags and missing values are reported, not printed
TEST_F(TarzipUsefulUnitTest, IncomingArgv_errors)
{
    { auto const args = TestArgv{"tarzip", "-z"};
        auto incomingArgv = tarzip::IncomingArgv<TarzipArgv>{args.argc(), args.argv()};
        EXPECT_EQ(incomingArgv.get_next().first, '?');
    }
    { auto const args = TestArgv{"tarzip", "--no-such-option"};
        auto incomingArgv = tarzip::IncomingArgv<TarzipArgv>{args.argc(), args.argv()};
        EXPECT_EQ(incomingArgv.get_next().first, '?');
    }
    { auto const args = TestArgv{"tarzip", "-d"};
        auto incomingArgv = tarzip::IncomingArgv<TarzipArgv>{args.argc(), args.argv()};
        EXPECT_EQ(incomingArgv.get_next().first, ':');
    }
}

// test that parsing stops at the first positional argument
TEST_F(TarzipUsefulUnitTest, IncomingArgv_rest)
{
    auto const args = TestArgv{"tarzip", "-f", "extra", "-q"};
    auto incomingArgv = tarzip::IncomingArgv<TarzipArgv>{args.argc(), args.argv()};

    EXPECT_EQ(incomingArgv.get_next().first, TarzipArgv::Force.val);
    EXPECT_LT(incomingArgv.get_next().first, 0);
    ASSERT_EQ(incomingArgv.get_rest_argc(), 2);
    EXPECT_STREQ(incomingArgv.get_rest()[0], "extra");
}

/* Logger */

// test that an enabled logger writes timestamped lines to its file
TEST_F(TarzipUsefulUnitTest, Logger_enabled)
{
    auto const logPath = temp_dir.get() + "/" + TARZIP_LOG_NAME + ".42.log";

    { auto logger = tarzip::Logger{true, temp_dir.get(), TARZIP_LOG_NAME, 42};
        ASSERT_TRUE(logger.enabled());
        logger.write("converted %d of %s\n", 7, "archives");
    }

    auto const contents = readFile(logPath);
    EXPECT_THAT(contents, StartsWith("["));
    EXPECT_THAT(contents, HasSubstr("] converted 7 of archives\n"));
    EXPECT_THAT(contents, HasSubstr("log closed\n"));
}

// test that a disabled logger creates nothing
TEST_F(TarzipUsefulUnitTest, Logger_disabled)
{
    { auto logger = tarzip::Logger{false, temp_dir.get(), TARZIP_LOG_NAME, 43};
        EXPECT_FALSE(logger.enabled());
        logger.write("ignored\n");
    }

    EXPECT_TRUE(listDir(temp_dir.get()).empty());
}

// test that a logger for a missing directory stays disabled
TEST_F(TarzipUsefulUnitTest, Logger_missingDirectory)
{
    auto logger = tarzip::Logger{true, temp_dir.get() + "/missing", TARZIP_LOG_NAME, 44};
    EXPECT_FALSE(logger.enabled());
}

/* wrappers */

TEST_F(TarzipUsefulUnitTest, temp_dir_handle)
{
    auto path = std::string{};
    { auto const handle = tarzip::temp_dir_handle{temp_dir.get() + "/nested-XXXXXX"};
        path = handle.get();
        ASSERT_TRUE(tarzip::isDirectory(path.c_str()));
        writeFile(path + "/file", "data");
    }
    EXPECT_FALSE(tarzip::pathExists(path.c_str()));
}

TEST_F(TarzipUsefulUnitTest, mkstemp)
{
    auto const [path, rawFd] = tarzip::cstr::mkstemp(temp_dir.get() + "/.out.zip.XXXXXX");
    auto const fdHandle = tarzip::fd_handle{rawFd};

    EXPECT_THAT(path, StartsWith(temp_dir.get() + "/.out.zip."));
    EXPECT_NE(path, temp_dir.get() + "/.out.zip.XXXXXX");
    EXPECT_TRUE(tarzip::fileHasPerms(path.c_str(), R_OK | W_OK));

    EXPECT_THROW(tarzip::cstr::mkstemp(temp_dir.get() + "/missing/file.XXXXXX"), std::runtime_error);
}

TEST_F(TarzipUsefulUnitTest, pathChecks)
{
    auto const filePath = temp_dir.get() + "/file";
    auto const dirPath  = temp_dir.get() + "/dir";
    auto const linkPath = temp_dir.get() + "/link";
    auto const danglingPath = temp_dir.get() + "/dangling";

    writeFile(filePath, "");
    ASSERT_EQ(mkdir(dirPath.c_str(), S_IRWXU), 0);
    ASSERT_EQ(symlink("dir", linkPath.c_str()), 0);
    ASSERT_EQ(symlink("nowhere", danglingPath.c_str()), 0);

    EXPECT_TRUE(tarzip::dirHasPerms(dirPath.c_str(), R_OK | W_OK | X_OK));
    EXPECT_FALSE(tarzip::dirHasPerms(filePath.c_str(), R_OK));
    EXPECT_FALSE(tarzip::dirHasPerms(nullptr, R_OK));

    EXPECT_TRUE(tarzip::fileHasPerms(filePath.c_str(), R_OK));
    EXPECT_FALSE(tarzip::fileHasPerms(dirPath.c_str(), R_OK));

    // links are not followed
    EXPECT_TRUE(tarzip::pathExists(danglingPath.c_str()));
    EXPECT_TRUE(tarzip::isDirectory(dirPath.c_str()));
    EXPECT_FALSE(tarzip::isDirectory(linkPath.c_str()));
    EXPECT_FALSE(tarzip::pathExists((temp_dir.get() + "/missing").c_str()));

    EXPECT_EQ(tarzip::cstr::readlink(linkPath), "dir");
}

TEST_F(TarzipUsefulUnitTest, getenvOrDefault)
{
    unsetenv(TARZIP_JOBS_ENV_VAR);
    EXPECT_STREQ(tarzip::getenvOrDefault(TARZIP_JOBS_ENV_VAR, "1"), "1");

    setenv(TARZIP_JOBS_ENV_VAR, "8", 1);
    EXPECT_STREQ(tarzip::getenvOrDefault(TARZIP_JOBS_ENV_VAR, "1"), "8");
    unsetenv(TARZIP_JOBS_ENV_VAR);
}
