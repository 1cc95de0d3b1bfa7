#pragma once

#include <vector>

#include "chapter.h"

namespace chaptext {

// Check that chapters are complete (number, title and at least one
// paragraph) and ordered prologue, numbered chapters, epilogue.
//
// Throws ChapterError (OutOfOrder, IncompleteChapter) on the first offender.
void validate_chapters(const std::vector<Chapter> &chapters);

}  // namespace chaptext
