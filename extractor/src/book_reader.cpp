#include "book_reader.h"

#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>

#include "epub_archive.h"
#include "merger.h"
#include "navigation.h"
#include "validator.h"
#include "log.h"

namespace fs = std::filesystem;

namespace chaptext {

std::vector<HtmlBookSources> group_html_sources(std::vector<HtmlSource> sources) {
    std::map<std::string, std::vector<HtmlSource>> by_title;
    for (auto &source : sources) {
        std::string title = source.document.title;
        if (title.empty()) {
            title = fs::path(source.path).stem().string();
            std::cerr << "Warning: No <title> in \"" << source.path << "\"; using \"" << title << "\"" << std::endl;
        }
        by_title[title].push_back(std::move(source));
    }

    std::vector<HtmlBookSources> books;
    for (auto &item : by_title) {
        books.push_back(HtmlBookSources{item.first, std::move(item.second)});
    }
    if (log_enabled(LogLevel::Info)) {
        std::cerr << "Read data for " << books.size() << " HTML book(s)" << std::endl;
    }
    return books;
}

Book read_html_book(const HtmlBookSources &book, const SegmenterOptions &options) {
    if (log_enabled(LogLevel::Debug)) {
        std::cerr << "  Parsing data for book titled \"" << book.title << "\"" << std::endl;
    }
    std::vector<SourceChapters> file_chapters;
    for (const auto &source : book.sources) {
        std::vector<Chapter> chapters = segment_chapters(source.document.blocks, options, source.path);
        if (chapters.empty()) {
            if (log_enabled(LogLevel::Info)) {
                std::cerr << "No chapter text in \"" << source.path << "\"; skipping it" << std::endl;
            }
            continue;
        }
        file_chapters.push_back(SourceChapters{source.path, std::move(chapters)});
    }

    Book result;
    result.title = book.title;
    result.source_count = file_chapters.size();
    result.chapters = merge_sources(std::move(file_chapters));
    validate_chapters(result.chapters);
    return result;
}

Book read_epub_book(const std::string &epub_path, const SegmenterOptions &options) {
    if (log_enabled(LogLevel::Info)) {
        std::cerr << "Reading \"" << epub_path << "\"" << std::endl;
    }
    EpubArchive archive(epub_path);
    EpubPackage package = read_epub_package(archive);

    Book result;
    result.title = package.title.empty() ? fs::path(epub_path).stem().string() : package.title;
    if (log_enabled(LogLevel::Debug)) {
        std::cerr << "  Parsing data for book titled \"" << result.title << "\"" << std::endl;
    }

    std::string nav_xml = archive.read(package.nav_path);
    std::vector<NavEntry> entries = package.nav_is_ncx ? parse_ncx_entries(nav_xml)
                                                       : parse_nav_document_entries(nav_xml);
    std::vector<ChapterDescriptor> descriptors = resolve_navigation(entries, result.title);

    std::string nav_dir = dirname_of(package.nav_path);
    for (const auto &desc : descriptors) {
        std::string doc_path = join_path(nav_dir, percent_decode(desc.src));
        if (log_enabled(LogLevel::Debug)) {
            std::cerr << "  Parsing document with HREF \"" << desc.src << "\"" << std::endl;
        }
        HtmlDocument document = parse_html_document(archive.read(doc_path));
        append_chapters(segment_chapters(document.blocks, options, doc_path), result.chapters, doc_path);
    }
    result.source_count = descriptors.size();
    if (log_enabled(LogLevel::Debug)) {
        std::cerr << "  Parsed " << result.chapters.size() << " chapter(s) for book titled \""
                  << result.title << "\"" << std::endl;
    }

    if (result.chapters.empty()) {
        throw std::runtime_error("No chapter text found in " + epub_path);
    }
    validate_chapters(result.chapters);
    return result;
}

}  // namespace chaptext
