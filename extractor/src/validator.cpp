#include "validator.h"

#include <optional>

#include "chapter_error.h"

namespace chaptext {

static void validate_chapter(const Chapter &chapter) {
    if (chapter.seq.empty()) {
        throw ChapterError(ErrorKind::IncompleteChapter,
                           "Chapter titled \"" + chapter.title + "\" has no seq desc.");
    }
    if (chapter.title.empty()) {
        throw ChapterError(ErrorKind::IncompleteChapter,
                           "Chapter with seq desc \"" + chapter.seq + "\" has no title.");
    }
    if (chapter.pars.empty()) {
        throw ChapterError(ErrorKind::IncompleteChapter,
                           "Chapter with seq desc \"" + chapter.seq + "\" and title \"" +
                           chapter.title + "\" has no paragraphs.");
    }
}

void validate_chapters(const std::vector<Chapter> &chapters) {
    std::optional<SeqKey> prev_key;
    for (const auto &chapter : chapters) {
        SeqKey key = seq_sort_key(chapter.seq);
        if (prev_key && key < *prev_key) {
            throw ChapterError(ErrorKind::OutOfOrder,
                               "Chapter is out of order: " + describe_chapter(chapter));
        }
        validate_chapter(chapter);
        prev_key = std::move(key);
    }
}

}  // namespace chaptext
