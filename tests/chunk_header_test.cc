#include "datachunk/chunk_header.h"
#include "datachunk/chunk_options.h"

#include <gtest/gtest.h>

#include <string>

namespace datachunk {
namespace {

    static ChunkHeader parse_ok(std::string_view line)
    {
        ChunkHeader header;
        ChunkError error;
        EXPECT_EQ(parse_chunk_header(line, &header, &error), ChunkStatus::Ok)
            << format_chunk_error(error);
        return header;
    }


    static ChunkError parse_fail(std::string_view line)
    {
        ChunkHeader header;
        ChunkError error;
        EXPECT_EQ(parse_chunk_header(line, &header, &error),
                  ChunkStatus::MalformedHeader)
            << line;
        return error;
    }


    TEST(ChunkOptions, SetKeepsInsertionOrder)
    {
        ChunkOptions o;
        EXPECT_TRUE(o.set("b", "1"));
        EXPECT_TRUE(o.set("a", "2"));
        EXPECT_FALSE(o.set("b", "3"));
        ASSERT_EQ(o.size(), 2U);
        EXPECT_EQ(o.entries()[0].key, "b");
        EXPECT_EQ(o.entries()[0].value, "3");
        ASSERT_NE(o.find("a"), nullptr);
        EXPECT_EQ(*o.find("a"), "2");
        EXPECT_TRUE(o.erase("b"));
        EXPECT_FALSE(o.contains("b"));
        EXPECT_FALSE(o.erase("b"));
        o.clear();
        EXPECT_TRUE(o.empty());
    }


    TEST(ChunkOptions, StringAndBoolReaders)
    {
        std::string s;
        EXPECT_TRUE(option_string_value("\"x,y\"", &s));
        EXPECT_EQ(s, "x,y");
        EXPECT_TRUE(option_string_value(" 'it\\'s' ", &s));
        EXPECT_EQ(s, "it's");
        EXPECT_TRUE(option_string_value("\"a\\\\b\\n\"", &s));
        EXPECT_EQ(s, "a\\b\n");
        EXPECT_FALSE(option_string_value("bare", &s));
        EXPECT_FALSE(option_string_value("\"a\"b\"", &s));
        EXPECT_FALSE(option_string_value("\"a\\\"", &s));

        bool b = false;
        EXPECT_TRUE(option_bool_value("TRUE", &b));
        EXPECT_TRUE(b);
        EXPECT_TRUE(option_bool_value("F", &b));
        EXPECT_FALSE(b);
        EXPECT_FALSE(option_bool_value("yes", &b));
    }


    TEST(ChunkOptions, QuoteRoundTrips)
    {
        const std::string raw = "C:\\data \"new\"\nfile";
        const std::string quoted = quote_option_string(raw);
        EXPECT_EQ(quoted, "\"C:\\\\data \\\"new\\\"\\nfile\"");
        std::string back;
        ASSERT_TRUE(option_string_value(quoted, &back));
        EXPECT_EQ(back, raw);
    }


    TEST(ChunkOptions, CanonicalRank)
    {
        EXPECT_EQ(canonical_option_keys().size(), 11U);
        EXPECT_EQ(canonical_option_rank("label"), 0);
        EXPECT_EQ(canonical_option_rank("eval"), 10);
        EXPECT_LT(canonical_option_rank("md5sum"),
                  canonical_option_rank("echo"));
        EXPECT_EQ(canonical_option_rank("fig.width"), -1);
    }


    TEST(ChunkHeader, FenceDetection)
    {
        FenceInfo fence;
        EXPECT_TRUE(is_chunk_header_line("```{data}", &fence));
        EXPECT_EQ(fence.backticks, 3U);
        EXPECT_TRUE(is_chunk_header_line("  ```` {data x}", &fence));
        EXPECT_EQ(fence.indent, 2U);
        EXPECT_EQ(fence.backticks, 4U);
        EXPECT_FALSE(is_chunk_header_line("``{data}", nullptr));
        EXPECT_FALSE(is_chunk_header_line("```r", nullptr));

        EXPECT_TRUE(is_plain_fence_line("```r", 3, nullptr));
        EXPECT_TRUE(is_plain_fence_line("```", 3, nullptr));
        EXPECT_FALSE(is_plain_fence_line("```{r}", 3, nullptr));
        EXPECT_FALSE(is_plain_fence_line("``` a`b", 3, nullptr));

        EXPECT_TRUE(is_closing_fence("```", 3));
        EXPECT_TRUE(is_closing_fence("  `````  ", 4));
        EXPECT_FALSE(is_closing_fence("```", 4));
        EXPECT_FALSE(is_closing_fence("``` x", 3));
    }


    TEST(ChunkHeader, ParsesLabelAndOptions)
    {
        const ChunkHeader h = parse_ok(
            "```{data mydata, format=\"binary\", encoding=\"base64\", "
            "output.var=\"df\", loader.function=read.csv}");
        EXPECT_EQ(h.engine, "data");
        EXPECT_EQ(h.label, "mydata");
        ASSERT_EQ(h.options.size(), 4U);
        EXPECT_EQ(*h.options.find("format"), "\"binary\"");
        EXPECT_EQ(*h.options.find("loader.function"), "read.csv");
    }


    TEST(ChunkHeader, QuotedCommaIsNotASeparator)
    {
        const ChunkHeader h = parse_ok("```{data key1=1, key2=\"x,y\"}");
        EXPECT_TRUE(h.label.empty());
        ASSERT_EQ(h.options.size(), 2U);
        EXPECT_EQ(*h.options.find("key1"), "1");
        std::string v;
        ASSERT_TRUE(option_string_value(*h.options.find("key2"), &v));
        EXPECT_EQ(v, "x,y");
    }


    TEST(ChunkHeader, ExpressionsPassThroughVerbatim)
    {
        const ChunkHeader h = parse_ok(
            "```{data, loader.ops=list(header=FALSE, sep=\";\"), "
            "eval=!file.exists(\"a,b.csv\")}");
        EXPECT_EQ(*h.options.find("loader.ops"),
                  "list(header=FALSE, sep=\";\")");
        EXPECT_EQ(*h.options.find("eval"), "!file.exists(\"a,b.csv\")");
    }


    TEST(ChunkHeader, LabelForms)
    {
        EXPECT_EQ(parse_ok("```{data}").label, "");
        EXPECT_EQ(parse_ok("```{data lbl}").label, "lbl");
        EXPECT_EQ(parse_ok("```{data,lbl}").label, "lbl");
        EXPECT_EQ(parse_ok("```{data \"my label\"}").label, "my label");
        EXPECT_EQ(parse_ok("```{r setup, include=FALSE}").engine, "r");
    }


    TEST(ChunkHeader, MalformedFragmentsAreNamed)
    {
        ChunkError e = parse_fail("```{data key1=1, key2=\"x,y}");
        EXPECT_EQ(e.message, "unbalanced quote");
        EXPECT_EQ(e.fragment, "key2=\"x,y");

        e = parse_fail("```{data a=list(1, 2}");
        EXPECT_EQ(e.message, "unbalanced bracket");

        e = parse_fail("```{data a=1, a=2}");
        EXPECT_EQ(e.message, "duplicate option");
        EXPECT_EQ(e.fragment, "a=2");

        parse_fail("```{data a=1,, b=2}");
        parse_fail("```{data lbl other}");
        parse_fail("```{data lbl, other}");
        parse_fail("```{data a=}");
        parse_fail("```{data bad key=1}");
        parse_fail("```{data a=1");
        parse_fail("```{}");
    }


    TEST(ChunkHeader, SerializeUsesCanonicalOrder)
    {
        ChunkOptions o;
        o.set("fig.width", "7");
        o.set("echo", "FALSE");
        o.set("zeta", "1");
        o.set("encoding", "\"base64\"");
        o.set("format", "\"binary\"");
        EXPECT_EQ(serialize_chunk_header("data", "mydata", o),
                  "{data mydata, format=\"binary\", encoding=\"base64\", "
                  "echo=FALSE, fig.width=7, zeta=1}");
        EXPECT_EQ(serialize_chunk_header("data", "", o).substr(0, 14),
                  "{data, format=");
        EXPECT_EQ(serialize_chunk_header("data", "", ChunkOptions {}),
                  "{data}");
        EXPECT_EQ(serialize_chunk_header("data", "x", ChunkOptions {}),
                  "{data x}");
    }


    TEST(ChunkHeader, SerializeThenParseIsStable)
    {
        const ChunkHeader h = parse_ok(
            "```{data lbl, zeta=1, eval=TRUE, format=\"text\", a=c(1,2)}");
        const std::string line = make_fence(3)
                                 + serialize_chunk_header(h.engine, h.label,
                                                          h.options);
        const ChunkHeader again = parse_ok(line);
        EXPECT_EQ(again.engine, h.engine);
        EXPECT_EQ(again.label, h.label);
        EXPECT_EQ(again.options.size(), h.options.size());
        for (const ChunkOption& e : h.options.entries()) {
            ASSERT_NE(again.options.find(e.key), nullptr);
            EXPECT_EQ(*again.options.find(e.key), e.value);
        }
        EXPECT_EQ(again.options.entries()[0].key, "format");
    }


    TEST(ChunkHeader, OptionListAppends)
    {
        ChunkOptions o;
        o.set("x", "1");
        ChunkError error;
        EXPECT_EQ(parse_chunk_option_list("max.echo=5, y=\"q\"", &o, &error),
                  ChunkStatus::Ok);
        EXPECT_EQ(o.size(), 3U);
        EXPECT_EQ(parse_chunk_option_list("x=2", &o, &error),
                  ChunkStatus::MalformedHeader);
        EXPECT_EQ(parse_chunk_option_list("bare", &o, &error),
                  ChunkStatus::MalformedHeader);
        EXPECT_EQ(parse_chunk_option_list("  ", &o, &error), ChunkStatus::Ok);
    }

}  // namespace
}  // namespace datachunk
