#include "reflow.h"

#include <sstream>

#include "chapter.h"
#include "serializer.h"

namespace chaptext {

static bool is_delimiter_line(const std::string &line) {
    return !line.empty() && line[0] == '=';
}

std::vector<TextChapter> read_text_chapters(std::istream &in) {
    std::vector<TextChapter> chapters;
    TextChapter current;
    bool expect_header = true;
    std::string par;

    auto flush_par = [&]() {
        if (!par.empty()) current.pars.push_back(par);
        par.clear();
    };

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) {
            flush_par();
            continue;
        }
        if (expect_header) {
            current.header = line;
            expect_header = false;
            continue;
        }
        if (is_delimiter_line(line)) {
            flush_par();
            chapters.push_back(std::move(current));
            current = TextChapter{};
            expect_header = true;
            continue;
        }
        if (!par.empty()) par += ' ';
        par += normalize_spacing(line);
    }
    flush_par();
    if (!current.header.empty() || !current.pars.empty()) {
        chapters.push_back(std::move(current));
    }
    return chapters;
}

void write_text_chapters(const std::vector<TextChapter> &chapters, std::ostream &out) {
    for (size_t idx = 0; idx < chapters.size(); idx++) {
        if (idx) {
            out << "\n\n" << CHAPTER_DELIM << "\n";
        }
        out << chapters[idx].header << "\n";
        out << "\n\n";
        for (const auto &par : chapters[idx].pars) {
            out << par << "\n";
        }
    }
}

std::string reflow_text(const std::string &text) {
    std::istringstream in(text);
    std::ostringstream out;
    write_text_chapters(read_text_chapters(in), out);
    return out.str();
}

}  // namespace chaptext
