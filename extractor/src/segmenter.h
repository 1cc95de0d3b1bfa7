#pragma once

#include <string>
#include <vector>

#include "block.h"
#include "chapter.h"

namespace chaptext {

// What to do with the block after a "Table of Contents" marker
enum class TocPolicy {
    DiscardNext,         // always drop it (loose HTML exports)
    DiscardBlacklisted,  // drop it only if it is front matter such as "Start"
};

struct SegmenterOptions {
    TocPolicy toc_policy = TocPolicy::DiscardBlacklisted;
};

// Split one document's blocks into chapters. The structured strategy (h2/h3
// heading pairs) is tried first; the linear scan is used when it finds
// nothing. `source` names the document in error messages.
//
// Throws ChapterError (AmbiguousContinuation, UnterminatedHeader).
std::vector<Chapter> segment_chapters(const std::vector<Block> &blocks,
                                      const SegmenterOptions &options = {},
                                      const std::string &source = "");

std::vector<Chapter> segment_structured(const std::vector<Block> &blocks);

std::vector<Chapter> segment_unstructured(const std::vector<Block> &blocks,
                                          const SegmenterOptions &options = {},
                                          const std::string &source = "");

// True if `text` starts the back matter of a book, either on its own
// ("The End of the First Book of ...") or split over two blocks ("The End"
// followed by "of the First Book of ...").
bool is_book_end(const std::string &text, const Block *following);

}  // namespace chaptext
