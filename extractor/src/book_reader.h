#pragma once

#include <string>
#include <vector>

#include "chapter.h"
#include "html_document.h"
#include "segmenter.h"

namespace chaptext {

// A merged, validated book ready to be written
struct Book {
    std::string title;
    std::vector<Chapter> chapters;
    size_t source_count = 0;
};

struct HtmlSource {
    std::string path;
    HtmlDocument document;
};

// HTML files sharing one <title>
struct HtmlBookSources {
    std::string title;
    std::vector<HtmlSource> sources;
};

// Group parsed HTML files into books by their title; a file without one
// is its own book named after the file. Books come out sorted by title.
std::vector<HtmlBookSources> group_html_sources(std::vector<HtmlSource> sources);

// Segment, merge and validate the files of one HTML book. Files without any
// chapter text are skipped.
//
// Throws ChapterError for any segmentation, merge or validation failure.
Book read_html_book(const HtmlBookSources &book, const SegmenterOptions &options);

// Read one EPUB as one book following its navigation manifest.
//
// Throws ChapterError, or std::runtime_error for container problems and
// for books whose documents hold no chapter text.
Book read_epub_book(const std::string &epub_path, const SegmenterOptions &options);

}  // namespace chaptext
