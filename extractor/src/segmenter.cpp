#include "segmenter.h"

#include <iostream>
#include <regex>
#include <utility>

#include "chapter_error.h"
#include "log.h"

namespace chaptext {

static constexpr size_t MAX_NON_NUMERIC_SEQ_LENGTH = 8;  // "prologue", "epilogue"
static const std::string TOC_TITLE = "table of contents";

static const std::regex &chapter_header_pattern() {
    static const std::regex pattern("CHAPTER\\s*(\\d+)?:?", std::regex::icase);
    return pattern;
}

static const std::regex &single_book_end_pattern() {
    static const std::regex pattern("The\\s+End\\s+of\\s+the\\s+\\w+\\s+Book\\s+of", std::regex::icase);
    return pattern;
}

static const std::regex &split_book_end_first_pattern() {
    static const std::regex pattern("The\\s+End", std::regex::icase);
    return pattern;
}

static const std::regex &split_book_end_second_pattern() {
    static const std::regex pattern("of\\s+the\\s+\\w+\\s+Book\\s+of", std::regex::icase);
    return pattern;
}

// Match anchored at the start of the text only, the rest may be anything
static bool starts_with_match(const std::string &text, const std::regex &pattern,
                              std::smatch *match = nullptr) {
    std::smatch local;
    return std::regex_search(text, match ? *match : local, pattern,
                             std::regex_constants::match_continuous);
}

static std::string context_prefix(const std::string &source) {
    return source.empty() ? std::string() : source + ": ";
}

bool is_book_end(const std::string &text, const Block *following) {
    if (starts_with_match(text, single_book_end_pattern())) {
        return true;
    }
    if (!following || !starts_with_match(text, split_book_end_first_pattern())) {
        return false;
    }
    return starts_with_match(trim(following->text()), split_book_end_second_pattern());
}

static bool is_non_numeric_seq(const std::string &text) {
    if (text.size() > MAX_NON_NUMERIC_SEQ_LENGTH) return false;
    std::string lower = to_lower(text);
    return lower == "prologue" || lower == "epilogue";
}

static bool is_toc_header(const std::string &text) {
    if (text.size() > TOC_TITLE.size()) return false;
    return to_lower(text) == TOC_TITLE;
}

// "9" -> "10", "007" -> "8"; digits only, any length
static std::string increment_decimal(const std::string &digits) {
    size_t first = digits.find_first_not_of('0');
    std::string result = first == std::string::npos ? "0" : digits.substr(first);
    size_t idx = result.size();
    while (idx > 0) {
        idx--;
        if (result[idx] != '9') {
            result[idx]++;
            return result;
        }
        result[idx] = '0';
    }
    return "1" + result;
}

// Number of a header that has none of its own: the block after it, or the
// previous chapter's number plus one if that block is empty.
static std::string read_seq(BlockCursor &cursor, const Chapter &previous, const std::string &source) {
    const Block *seq_block = cursor.advance();
    if (!seq_block) {
        throw ChapterError(ErrorKind::UnterminatedHeader,
                           context_prefix(source) + "document ended before the number of the chapter after " +
                           describe_chapter(previous));
    }

    std::string seq = trim(seq_block->text());
    if (!seq.empty()) return seq;

    if (!is_numeric_seq(previous.seq)) {
        throw ChapterError(ErrorKind::AmbiguousContinuation,
                           context_prefix(source) + "cannot number the chapter following non-numeric chapter " +
                           describe_chapter(previous));
    }
    return increment_decimal(previous.seq);
}

// The title is the next block; a block holding only an image is the
// chapter's decorative header and is skipped.
static std::string read_title(BlockCursor &cursor, const std::string &seq, const std::string &source) {
    const Block *title_block = cursor.advance();
    std::string title = title_block ? normalize_spacing(title_block->text()) : std::string();
    while (title_block && title.empty() && title_block->contains_image()) {
        title_block = cursor.advance();
        if (title_block) title = normalize_spacing(title_block->text());
    }
    if (!title_block) {
        throw ChapterError(ErrorKind::UnterminatedHeader,
                           context_prefix(source) + "document ended before the title of chapter \"" + seq + "\"");
    }
    return title;
}

static void skip_toc_entry(BlockCursor &cursor, TocPolicy policy) {
    if (policy == TocPolicy::DiscardNext) {
        cursor.advance();
        return;
    }

    const Block *following = cursor.peek_nonblank();
    if (!following || !is_blacklisted_title(normalize_spacing(following->text()))) {
        return;
    }
    while (const Block *skipped = cursor.advance()) {
        if (skipped == following) break;
    }
}

std::vector<Chapter> segment_unstructured(const std::vector<Block> &blocks,
                                          const SegmenterOptions &options,
                                          const std::string &source) {
    std::vector<Chapter> chapters;
    Chapter current;
    BlockCursor cursor(blocks);

    while (const Block *block = cursor.advance()) {
        std::string text = trim(block->text());
        if (text.empty()) continue;

        std::smatch header_match;
        if (starts_with_match(text, chapter_header_pattern(), &header_match)) {
            std::string seq = header_match[1].matched ? header_match[1].str()
                                                      : read_seq(cursor, current, source);
            std::string title = read_title(cursor, seq, source);
            chapters.push_back(std::move(current));
            current = Chapter(std::move(seq), std::move(title));
        } else if (is_non_numeric_seq(text)) {
            std::string seq = to_lower(text);
            std::string title = read_title(cursor, seq, source);
            chapters.push_back(std::move(current));
            current = Chapter(std::move(seq), std::move(title));
        } else if (is_toc_header(text)) {
            skip_toc_entry(cursor, options.toc_policy);
        } else if (is_book_end(text, cursor.peek_nonblank())) {
            if (log_enabled(LogLevel::Debug)) {
                std::cerr << "  " << context_prefix(source) << "book end marker \"" << text << "\"" << std::endl;
            }
            break;
        } else {
            std::string par = normalize_spacing(text);
            if (!par.empty()) current.pars.push_back(std::move(par));
        }
    }
    chapters.push_back(std::move(current));

    std::vector<Chapter> result;
    for (auto &chapter : chapters) {
        if (!chapter.empty()) result.push_back(std::move(chapter));
    }
    return result;
}

// Index of the first block of `kind` in [from, until), or `until`
static size_t find_kind(const std::vector<Block> &blocks, BlockKind kind, size_t from, size_t until) {
    for (size_t idx = from; idx < until; idx++) {
        if (blocks[idx].kind() == kind) return idx;
    }
    return until;
}

static const Block *next_nonblank(const std::vector<Block> &blocks, size_t from) {
    BlockCursor cursor(blocks, from);
    return cursor.peek_nonblank();
}

// Chapter from a heading, its title block and the paragraphs up to the next
// heading. Returns true in `book_end` if the book's back matter was reached.
static Chapter parse_structured_chapter(const std::vector<Block> &blocks, size_t header_idx,
                                        size_t title_idx, bool &book_end) {
    std::string header_text = normalize_spacing(blocks[header_idx].text());
    std::smatch header_match;
    std::string seq;
    if (starts_with_match(header_text, chapter_header_pattern(), &header_match) && header_match[1].matched) {
        seq = header_match[1].str();
    } else {
        // e.g. "Prologue"
        seq = to_lower(header_text);
    }

    Chapter chapter(seq, normalize_spacing(blocks[title_idx].text()));
    for (size_t idx = title_idx + 1; idx < blocks.size(); idx++) {
        const Block &block = blocks[idx];
        if (block.kind() == BlockKind::Heading) break;
        if (block.kind() != BlockKind::Paragraph) continue;

        std::string text = trim(block.text());
        if (text.empty()) continue;
        if (is_book_end(text, next_nonblank(blocks, idx + 1))) {
            book_end = true;
            break;
        }
        chapter.pars.push_back(normalize_spacing(text));
    }
    return chapter;
}

std::vector<Chapter> segment_structured(const std::vector<Block> &blocks) {
    std::vector<size_t> headings;
    for (size_t idx = 0; idx < blocks.size(); idx++) {
        if (blocks[idx].kind() == BlockKind::Heading) headings.push_back(idx);
    }
    if (headings.empty()) return {};

    // Each heading should be followed by its title before the next heading
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < headings.size(); i++) {
        size_t until = i + 1 < headings.size() ? headings[i + 1] : blocks.size();
        size_t title_idx = find_kind(blocks, BlockKind::Subheading, headings[i] + 1, until);
        if (title_idx == until) {
            pairs.clear();
            break;
        }
        pairs.emplace_back(headings[i], title_idx);
    }

    if (pairs.empty()) {
        // No subheadings: headings come as number/title pairs. With an odd
        // count the last heading has no partner and is dropped.
        for (size_t i = 0; i + 1 < headings.size(); i += 2) {
            pairs.emplace_back(headings[i], headings[i + 1]);
        }
    }

    std::vector<Chapter> chapters;
    for (const auto &pair : pairs) {
        bool book_end = false;
        chapters.push_back(parse_structured_chapter(blocks, pair.first, pair.second, book_end));
        if (book_end) break;
    }
    return chapters;
}

std::vector<Chapter> segment_chapters(const std::vector<Block> &blocks,
                                      const SegmenterOptions &options,
                                      const std::string &source) {
    std::vector<Chapter> chapters = segment_structured(blocks);
    if (!chapters.empty()) {
        if (log_enabled(LogLevel::Debug)) {
            std::cerr << "  " << context_prefix(source) << "found " << chapters.size() << " structured chapter(s)" << std::endl;
        }
        return chapters;
    }
    chapters = segment_unstructured(blocks, options, source);
    if (log_enabled(LogLevel::Debug)) {
        std::cerr << "  " << context_prefix(source) << "found " << chapters.size() << " chapter(s) by linear scan" << std::endl;
    }
    return chapters;
}

}  // namespace chaptext
