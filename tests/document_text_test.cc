#include "datachunk/document_text.h"

#include <gtest/gtest.h>

namespace datachunk {
namespace {

    TEST(DocumentText, SplitHandlesAllLineEndings)
    {
        DocumentLines lines;
        bool trailing = true;
        split_document_lines("a\nb\r\nc\rd", &lines, &trailing);
        EXPECT_EQ(lines, (DocumentLines { "a", "b", "c", "d" }));
        EXPECT_FALSE(trailing);

        split_document_lines("a\n\nb\n", &lines, &trailing);
        EXPECT_EQ(lines, (DocumentLines { "a", "", "b" }));
        EXPECT_TRUE(trailing);
    }


    TEST(DocumentText, EdgeCases)
    {
        DocumentLines lines;
        bool trailing = true;
        split_document_lines("", &lines, &trailing);
        EXPECT_TRUE(lines.empty());
        EXPECT_FALSE(trailing);

        split_document_lines("\n", &lines, &trailing);
        EXPECT_EQ(lines, (DocumentLines { "" }));
        EXPECT_TRUE(trailing);
        EXPECT_EQ(join_document_lines(lines, trailing), "\n");
    }


    TEST(DocumentText, JoinRestoresText)
    {
        for (const char* text : { "x", "x\n", "x\ny", "x\n\ny\n", "" }) {
            DocumentLines lines;
            bool trailing = false;
            split_document_lines(text, &lines, &trailing);
            EXPECT_EQ(join_document_lines(lines, trailing), text);
        }
    }

}  // namespace
}  // namespace datachunk
