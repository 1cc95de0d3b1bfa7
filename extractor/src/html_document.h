#pragma once

#include <string>
#include <vector>

#include "block.h"

namespace chaptext {

struct HtmlDocument {
    std::string title;  // normalized <title> text, empty if the document has none
    std::vector<Block> blocks;
};

// Parse HTML (or XHTML) markup into its text-bearing blocks using Gumbo.
// Blocks are p, blockquote, h2 and h3 elements in document order; an element
// that wraps other block elements yields its nested blocks instead.
HtmlDocument parse_html_document(const std::string &html_content);

// Read and parse an HTML file. Throws std::runtime_error if it can't be read.
HtmlDocument read_html_file(const std::string &file_path);

}  // namespace chaptext
