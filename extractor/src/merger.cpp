#include "merger.h"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <utility>

#include "chapter_error.h"
#include "log.h"

namespace chaptext {

void append_chapters(std::vector<Chapter> addend, std::vector<Chapter> &merged,
                     const std::string &source) {
    for (auto &chapter : addend) {
        if (!chapter.seq.empty()) {
            merged.push_back(std::move(chapter));
            continue;
        }

        // A title without a number is a header that could not be read, not
        // continuation text
        if (!chapter.title.empty()) {
            throw ChapterError(ErrorKind::IncompleteChapter,
                               (source.empty() ? std::string() : source + ": ") +
                               "Chapter titled \"" + chapter.title + "\" has no seq desc.");
        }
        if (merged.empty()) {
            throw ChapterError(ErrorKind::AmbiguousContinuation,
                               (source.empty() ? std::string() : source + ": ") +
                               "headerless text has no preceding chapter to continue: " +
                               describe_chapter(chapter));
        }
        Chapter &last_chapter = merged.back();
        if (log_enabled(LogLevel::Debug)) {
            std::cerr << "  Continuing chapter \"" << last_chapter.seq << "\" with "
                      << chapter.pars.size() << " paragraph(s) from " << source << std::endl;
        }
        std::move(chapter.pars.begin(), chapter.pars.end(), std::back_inserter(last_chapter.pars));
    }
}

std::vector<Chapter> merge_sources(std::vector<SourceChapters> sources) {
    std::vector<std::pair<NaturalKey, size_t>> order;
    order.reserve(sources.size());
    for (size_t idx = 0; idx < sources.size(); idx++) {
        order.emplace_back(natural_key(sources[idx].source), idx);
    }
    std::stable_sort(order.begin(), order.end(), [](const auto &lhs, const auto &rhs) {
        return compare_natural_keys(lhs.first, rhs.first) < 0;
    });

    std::vector<Chapter> merged;
    for (const auto &entry : order) {
        SourceChapters &source = sources[entry.second];
        append_chapters(std::move(source.chapters), merged, source.source);
    }
    return merged;
}

}  // namespace chaptext
