#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace chaptext {

// One chapter of a plain-text book file: its header line as written and
// its paragraphs, each on a single line
struct TextChapter {
    std::string header;
    std::vector<std::string> pars;
};

// Read a plain-text book whose paragraphs are separated by blank lines and
// may be broken over several lines. Chapters are separated by a line of
// '='; the first non-blank line of each chapter is its header.
std::vector<TextChapter> read_text_chapters(std::istream &in);

// Write chapters in the same layout write_chapters() uses
void write_text_chapters(const std::vector<TextChapter> &chapters, std::ostream &out);

// read_text_chapters() followed by write_text_chapters()
std::string reflow_text(const std::string &text);

}  // namespace chaptext
