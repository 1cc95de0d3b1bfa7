// =============================================================================
// Paragraph re-flow of plain-text book files
// =============================================================================

#include <gtest/gtest.h>
#include <sstream>
#include "reflow.h"
#include "serializer.h"

using namespace chaptext;

TEST(ReflowTest, JoinsBrokenLinesIntoParagraphs) {
    std::istringstream in(
        "CHAPTER 1: The Start\n"
        "\n\n"
        "Par one\n"
        "  broken   over lines.\n"
        "\n"
        "Par two.\n"
        "\n\n"
        "=====\n"
        "CHAPTER 2: Next\n"
        "\n"
        "Only par.\n");

    auto chapters = read_text_chapters(in);

    ASSERT_EQ(chapters.size(), 2u);
    EXPECT_EQ(chapters[0].header, "CHAPTER 1: The Start");
    EXPECT_EQ(chapters[0].pars, (std::vector<std::string>{"Par one broken over lines.", "Par two."}));
    EXPECT_EQ(chapters[1].header, "CHAPTER 2: Next");
    EXPECT_EQ(chapters[1].pars, std::vector<std::string>{"Only par."});
}

TEST(ReflowTest, WritesBookLayout) {
    std::string text = reflow_text(
        "PROLOGUE: Before\r\n\r\nA\r\nline.\r\n"
        "================================================================\r\n"
        "CHAPTER 1: One\r\n\r\nB.\r\n");

    std::string expected =
        "PROLOGUE: Before\n\n\nA line.\n"
        "\n\n" + CHAPTER_DELIM + "\n"
        "CHAPTER 1: One\n\n\nB.\n";
    EXPECT_EQ(text, expected);
}

TEST(ReflowTest, HeaderIsFirstNonBlankLine) {
    std::istringstream in("\n\nEPILOGUE: After\nText.\n");

    auto chapters = read_text_chapters(in);

    ASSERT_EQ(chapters.size(), 1u);
    EXPECT_EQ(chapters[0].header, "EPILOGUE: After");
    EXPECT_EQ(chapters[0].pars, std::vector<std::string>{"Text."});
}

TEST(ReflowTest, EmptyInput) {
    EXPECT_EQ(reflow_text(""), "");
    EXPECT_EQ(reflow_text("\n \n"), "");
}
