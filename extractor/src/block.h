#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace chaptext {

enum class BlockKind {
    Paragraph,   // p, blockquote
    Heading,     // h2: chapter number or "Prologue"
    Subheading,  // h3: chapter title
};

// A text-bearing block element of a markup document
class Block {
public:
    Block() = default;
    Block(std::string text, BlockKind kind = BlockKind::Paragraph, bool has_image = false)
        : text_(std::move(text)), kind_(kind), has_image_(has_image) {}

    // Raw text content, whitespace as found in the document
    const std::string &text() const { return text_; }
    BlockKind kind() const { return kind_; }
    bool contains_image() const { return has_image_; }

    // True if the block has nothing but whitespace
    bool blank() const;

private:
    std::string text_;
    BlockKind kind_ = BlockKind::Paragraph;
    bool has_image_ = false;
};

// Forward-only reader over a document's blocks. Consumed blocks cannot be
// revisited; blocks ahead may be inspected without consuming them.
class BlockCursor {
public:
    explicit BlockCursor(const std::vector<Block> &blocks, size_t start = 0)
        : blocks_(blocks), pos_(start) {}

    // Block `ahead` positions past the next one, or nullptr past the end
    const Block *peek(size_t ahead = 0) const;

    // Consume and return the next block, or nullptr when exhausted
    const Block *advance();

    // Next block with non-blank text, without consuming anything
    const Block *peek_nonblank() const;

    bool exhausted() const { return pos_ >= blocks_.size(); }
    size_t position() const { return pos_; }

private:
    const std::vector<Block> &blocks_;
    size_t pos_;
};

}  // namespace chaptext
