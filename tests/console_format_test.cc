#include "datachunk/console_format.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace datachunk {
namespace {

    static std::string escaped(std::string_view s, uint32_t max_bytes = 0)
    {
        std::string out;
        append_console_escaped_ascii(s, max_bytes, &out);
        return out;
    }


    TEST(ConsoleFormat, PlainAsciiPassesThrough)
    {
        std::string out;
        EXPECT_FALSE(append_console_escaped_ascii("readRDS", 0, &out));
        EXPECT_EQ(out, "readRDS");
    }


    TEST(ConsoleFormat, EscapesControlAndNonAscii)
    {
        EXPECT_EQ(escaped("a\"b\\c"), "a\\\"b\\\\c");
        EXPECT_EQ(escaped("x\ny\tz\r"), "x\\ny\\tz\\r");
        EXPECT_EQ(escaped(std::string_view("\x00\x7F", 2)), "\\x00\\x7F");
        EXPECT_EQ(escaped("caf\xC3\xA9"), "caf\\u{E9}");
        EXPECT_EQ(escaped("\xFF"), "\\xFF");
    }


    TEST(ConsoleFormat, Truncates)
    {
        std::string out;
        EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3, &out));
        EXPECT_EQ(out, "abc...");
        EXPECT_EQ(escaped("abc", 3), "abc");
    }


    TEST(ConsoleFormat, LineRangeIsOneBasedInclusive)
    {
        std::string out;
        append_line_range(LineRange { 5, 9 }, &out);
        EXPECT_EQ(out, "6-9");
    }


    TEST(ConsoleFormat, ByteSize)
    {
        std::string out;
        append_byte_size(512, &out);
        EXPECT_EQ(out, "512 B");
        out.clear();
        append_byte_size(1536, &out);
        EXPECT_EQ(out, "1.5 KiB");
        out.clear();
        append_byte_size(3ULL * 1024U * 1024U, &out);
        EXPECT_EQ(out, "3.0 MiB");
    }

}  // namespace
}  // namespace datachunk
