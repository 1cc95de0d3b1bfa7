#pragma once

#include <string>
#include <utility>
#include <vector>

namespace chaptext {

// One entry of an EPUB navigation manifest
struct NavEntry {
    std::string label;
    std::string src;  // reference to a content document, may carry a #fragment
};

struct ChapterDescriptor {
    std::string seq;
    std::string name;
    std::string src;  // content document, fragment removed
};

// All navPoints of an NCX document in document order, nested ones included.
// Throws std::runtime_error if the XML can't be parsed.
std::vector<NavEntry> parse_ncx_entries(const std::string &ncx_xml);

// Links of the table of contents of an EPUB 3 navigation document
std::vector<NavEntry> parse_nav_document_entries(const std::string &nav_xhtml);

// "prologue:" -> "PROLOGUE", "12:" -> "12"
std::string normalize_chapter_seq(const std::string &token);

// "Chapter 12: The Long Night" -> {"12:", ...} normalized to {"12", "The Long Night"}
std::pair<std::string, std::string> parse_chapter_label(const std::string &label);

// Chapter descriptors in chapter order. Entries naming front matter are
// dropped, and entries pointing at the same document are joined first since
// some books list a chapter's number and its title as two entries.
//
// Throws ChapterError(EmptyNavigation) if no chapter remains.
std::vector<ChapterDescriptor> resolve_navigation(const std::vector<NavEntry> &entries,
                                                  const std::string &book = "");

}  // namespace chaptext
