#include "html_document.h"

#include <gumbo.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "chapter.h"

namespace chaptext {

static bool is_block_tag(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_P:
        case GUMBO_TAG_BLOCKQUOTE:
        case GUMBO_TAG_H2:
        case GUMBO_TAG_H3:
            return true;
        default:
            return false;
    }
}

static BlockKind block_kind(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_H2: return BlockKind::Heading;
        case GUMBO_TAG_H3: return BlockKind::Subheading;
        default:           return BlockKind::Paragraph;
    }
}

static const GumboVector &children_of(const GumboNode *node) {
    return node->v.element.children;
}

static GumboNode *child_at(const GumboVector &children, unsigned int idx) {
    return static_cast<GumboNode*>(children.data[idx]);
}

// Recursively collect the text below a Gumbo node, skipping script and style
static void collect_text(const GumboNode *node, std::string &out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE ||
        node->type == GUMBO_NODE_CDATA) {
        out += node->v.text.text;
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return;
    }

    GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE) {
        return;
    }
    // Line breaks separate words even though they carry no text
    if (tag == GUMBO_TAG_BR) {
        out += ' ';
        return;
    }

    const GumboVector &children = children_of(node);
    for (unsigned int idx = 0; idx < children.length; idx++) {
        collect_text(child_at(children, idx), out);
    }
}

static bool has_descendant(const GumboNode *node, bool (*pred)(GumboTag)) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return false;
    }
    const GumboVector &children = children_of(node);
    for (unsigned int idx = 0; idx < children.length; idx++) {
        const GumboNode *child = child_at(children, idx);
        if ((child->type == GUMBO_NODE_ELEMENT || child->type == GUMBO_NODE_TEMPLATE) &&
            pred(child->v.element.tag)) {
            return true;
        }
        if (has_descendant(child, pred)) return true;
    }
    return false;
}

static bool is_image_tag(GumboTag tag) {
    return tag == GUMBO_TAG_IMG || tag == GUMBO_TAG_IMAGE;
}

static void collect_blocks(const GumboNode *node, std::vector<Block> &blocks) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return;
    }

    GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_HEAD) {
        return;
    }

    if (is_block_tag(tag) && !has_descendant(node, is_block_tag)) {
        std::string text;
        collect_text(node, text);
        blocks.emplace_back(std::move(text), block_kind(tag), has_descendant(node, is_image_tag));
        return;
    }

    const GumboVector &children = children_of(node);
    for (unsigned int idx = 0; idx < children.length; idx++) {
        collect_blocks(child_at(children, idx), blocks);
    }
}

// Depth-first search for the first <title> element
static const GumboNode *find_title(const GumboNode *node) {
    if (node->type != GUMBO_NODE_ELEMENT) return nullptr;
    if (node->v.element.tag == GUMBO_TAG_TITLE) return node;

    const GumboVector &children = children_of(node);
    for (unsigned int idx = 0; idx < children.length; idx++) {
        const GumboNode *found = find_title(child_at(children, idx));
        if (found) return found;
    }
    return nullptr;
}

HtmlDocument parse_html_document(const std::string &html_content) {
    HtmlDocument document;
    GumboOutput *gumbo_output = gumbo_parse_with_options(
        &kGumboDefaultOptions, html_content.data(), html_content.size());
    if (!gumbo_output) {
        return document;
    }

    if (const GumboNode *title = find_title(gumbo_output->root)) {
        std::string raw_title;
        collect_text(title, raw_title);
        document.title = normalize_spacing(raw_title);
    }
    collect_blocks(gumbo_output->root, document.blocks);

    gumbo_destroy_output(&kGumboDefaultOptions, gumbo_output);
    return document;
}

HtmlDocument read_html_file(const std::string &file_path) {
    std::ifstream input_file(file_path, std::ios::binary);
    if (!input_file.is_open()) {
        throw std::runtime_error("Failed to open HTML file: " + file_path);
    }
    std::ostringstream raw_stream;
    raw_stream << input_file.rdbuf();

    return parse_html_document(raw_stream.str());
}

}  // namespace chaptext
