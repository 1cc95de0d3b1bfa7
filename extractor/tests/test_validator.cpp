// =============================================================================
// Chapter list validation tests
// =============================================================================

#include <gtest/gtest.h>
#include "chapter_error.h"
#include "validator.h"

using namespace chaptext;

namespace {

ErrorKind failure_kind(const std::vector<Chapter> &chapters) {
    try {
        validate_chapters(chapters);
    } catch (const ChapterError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "validation passed";
    return ErrorKind::EmptyNavigation;
}

}  // namespace

TEST(ValidatorTest, AcceptsOrderedCompleteChapters) {
    std::vector<Chapter> chapters = {
        Chapter("PROLOGUE", "Before", {"a."}),
        Chapter("1", "One", {"b."}),
        Chapter("2", "Two", {"c."}),
        Chapter("10", "Ten", {"d."}),
        Chapter("epilogue", "After", {"e."}),
    };
    EXPECT_NO_THROW(validate_chapters(chapters));
    EXPECT_NO_THROW(validate_chapters({}));
}

TEST(ValidatorTest, RepeatedNumberIsNotOutOfOrder) {
    EXPECT_NO_THROW(validate_chapters({Chapter("3", "A", {"a."}), Chapter("3", "B", {"b."})}));
}

TEST(ValidatorTest, OutOfOrder) {
    EXPECT_EQ(failure_kind({Chapter("2", "Two", {"a."}), Chapter("1", "One", {"b."})}),
              ErrorKind::OutOfOrder);
    EXPECT_EQ(failure_kind({Chapter("epilogue", "After", {"a."}), Chapter("1", "One", {"b."})}),
              ErrorKind::OutOfOrder);
    EXPECT_EQ(failure_kind({Chapter("1", "One", {"a."}), Chapter("prologue", "Before", {"b."})}),
              ErrorKind::OutOfOrder);
}

TEST(ValidatorTest, OutOfOrderNamesTheChapter) {
    try {
        validate_chapters({Chapter("10", "Ten", {"a."}), Chapter("9", "Nine", {"b."})});
        FAIL() << "expected ChapterError";
    } catch (const ChapterError &e) {
        EXPECT_NE(std::string(e.what()).find("Nine"), std::string::npos);
    }
}

TEST(ValidatorTest, IncompleteChapters) {
    EXPECT_EQ(failure_kind({Chapter("", "Title", {"a."})}), ErrorKind::IncompleteChapter);
    EXPECT_EQ(failure_kind({Chapter("1", "", {"a."})}), ErrorKind::IncompleteChapter);
    EXPECT_EQ(failure_kind({Chapter("1", "One", {})}), ErrorKind::IncompleteChapter);
}

TEST(ValidatorTest, IncompleteChapterNamesMissingField) {
    try {
        validate_chapters({Chapter("4", "Four", {})});
        FAIL() << "expected ChapterError";
    } catch (const ChapterError &e) {
        std::string message = e.what();
        EXPECT_NE(message.find("no paragraphs"), std::string::npos);
        EXPECT_NE(message.find("Four"), std::string::npos);
    }
}
