#include "serializer.h"

#include <sstream>

namespace chaptext {

const std::string CHAPTER_DELIM(64, '=');

std::string seq_description(const std::string &seq) {
    if (is_prologue_seq(seq)) return "PROLOGUE";
    if (is_epilogue_seq(seq)) return "EPILOGUE";
    return "CHAPTER " + seq;
}

static void write_chapter(const Chapter &chapter, std::ostream &out) {
    out << seq_description(chapter.seq) << ": " << chapter.title << "\n";
    out << "\n\n";
    for (const auto &par : chapter.pars) {
        out << par << "\n";
    }
}

void write_chapters(const std::vector<Chapter> &chapters, std::ostream &out) {
    for (size_t idx = 0; idx < chapters.size(); idx++) {
        if (idx) {
            out << "\n\n" << CHAPTER_DELIM << "\n";
        }
        write_chapter(chapters[idx], out);
    }
}

std::string chapters_to_text(const std::vector<Chapter> &chapters) {
    std::ostringstream out;
    write_chapters(chapters, out);
    return out.str();
}

}  // namespace chaptext
