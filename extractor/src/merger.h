#pragma once

#include <string>
#include <vector>

#include "chapter.h"

namespace chaptext {

// Chapters read from one source document of a book
struct SourceChapters {
    std::string source;
    std::vector<Chapter> chapters;
};

// Append `addend` to `merged`. A chapter without a number continues the
// chapter before it (text split across a file boundary), so its paragraphs
// are added to the last merged chapter.
//
// Throws ChapterError(AmbiguousContinuation) if there is no such chapter,
// or ChapterError(IncompleteChapter) if the numberless chapter has a title.
void append_chapters(std::vector<Chapter> addend, std::vector<Chapter> &merged,
                     const std::string &source = "");

// Merge the chapters of all sources of one book, ordering sources by the
// natural order of their names.
std::vector<Chapter> merge_sources(std::vector<SourceChapters> sources);

}  // namespace chaptext
