// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <cerrno>
#include <string>
#include <string_view>

#include <librendezvous/error.h>
#include <librendezvous/log.h>
#include <librendezvous/utils.h>

#include "test-fixtures.h"

#include "gtest/gtest.h"

using namespace std::literals;

namespace librendezvous::test
{

using UtilsTest = SandboxedTest;

TEST_F(UtilsTest, strvStrip)
{
    EXPECT_EQ(""sv, rv_strv_strip("              "sv));
    EXPECT_EQ("test test"sv, rv_strv_strip("    test test     "sv));
    EXPECT_EQ("test"sv, rv_strv_strip("   test     "sv));
    EXPECT_EQ("test"sv, rv_strv_strip("   test "sv));
    EXPECT_EQ("test"sv, rv_strv_strip(" test       "sv));
    EXPECT_EQ("test"sv, rv_strv_strip(" test "sv));
    EXPECT_EQ("test"sv, rv_strv_strip("\ttest\r\n"sv));
    EXPECT_EQ(""sv, rv_strv_strip(""sv));
}

TEST_F(UtilsTest, strvSep)
{
    auto sv = "wss://example.org"sv;
    EXPECT_EQ("wss"sv, rv_strv_sep(&sv, ':'));
    EXPECT_EQ("//example.org"sv, sv);
    EXPECT_EQ("//example.org"sv, rv_strv_sep(&sv, ':'));
    EXPECT_EQ(""sv, sv);
    EXPECT_EQ(""sv, rv_strv_sep(&sv, ':'));
}

TEST_F(UtilsTest, strvStartsWithContains)
{
    EXPECT_TRUE(rv_strv_starts_with("[::1]"sv, '['));
    EXPECT_FALSE(rv_strv_starts_with(""sv, '['));
    EXPECT_TRUE(rv_strv_starts_with("//host"sv, "//"sv));
    EXPECT_FALSE(rv_strv_starts_with("/"sv, "//"sv));
    EXPECT_TRUE(rv_strv_contains("abc"sv, 'b'));
    EXPECT_FALSE(rv_strv_contains("abc"sv, 'z'));
}

TEST_F(UtilsTest, strlower)
{
    EXPECT_EQ("warn"sv, rv_strlower("WaRn"sv));
    EXPECT_EQ(""sv, rv_strlower(""sv));
}

TEST_F(UtilsTest, strerror)
{
    EXPECT_NE(nullptr, rv_strerror(ENOENT));
    EXPECT_NE(nullptr, rv_strerror(-12345));
}

TEST_F(UtilsTest, fileRead)
{
    static auto constexpr Contents = "hello\nworld\0binary"sv;

    auto const path = createFileWithContents("file.txt"sv, Contents);

    auto error = rv_error{};
    auto const contents = rv_file_read(path, &error);
    ASSERT_TRUE(contents) << error;
    EXPECT_FALSE(error) << error;
    EXPECT_EQ(Contents, *contents);
}

TEST_F(UtilsTest, fileReadMissingFile)
{
    auto const path = sandboxDir() + "/does-not-exist.json";

    auto log = LogCapture{ RV_LOG_ERROR };

    auto error = rv_error{};
    EXPECT_FALSE(rv_file_read(path, &error));
    EXPECT_TRUE(error);
    EXPECT_EQ(ENOENT, error.code()) << error;

    ASSERT_EQ(1U, std::size(log.messages_));
    EXPECT_EQ(RV_LOG_ERROR, log.messages_.front().level);
    EXPECT_EQ("utils.cc"sv, log.messages_.front().file);
}

} // namespace librendezvous::test
