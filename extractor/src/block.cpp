#include "block.h"

#include <cctype>

namespace chaptext {

bool Block::blank() const {
    for (char c : text_) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

const Block *BlockCursor::peek(size_t ahead) const {
    size_t idx = pos_ + ahead;
    return idx < blocks_.size() ? &blocks_[idx] : nullptr;
}

const Block *BlockCursor::advance() {
    if (exhausted()) return nullptr;
    return &blocks_[pos_++];
}

const Block *BlockCursor::peek_nonblank() const {
    for (size_t idx = pos_; idx < blocks_.size(); idx++) {
        if (!blocks_[idx].blank()) return &blocks_[idx];
    }
    return nullptr;
}

}  // namespace chaptext
