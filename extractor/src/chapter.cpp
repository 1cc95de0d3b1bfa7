#include "chapter.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace chaptext {

static const std::set<std::string> TITLE_BLACKLIST = {
    "cover", "cover page", "title", "title page", "copyright", "copyright page",
    "dedication", "contents", "table of contents", "maps", "glossary",
    "about the author", "start"
};

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

std::string describe_chapter(const Chapter &chapter) {
    std::ostringstream out;
    out << "{seq=" << chapter.seq << ", title=" << chapter.title << ", pars=[";
    for (size_t i = 0; i < chapter.pars.size(); i++) {
        if (i) out << ", ";
        out << "\"" << chapter.pars[i] << "\"";
    }
    out << "]}";
    return out.str();
}

NaturalKey natural_key(const std::string &text) {
    // Always starts and ends with a text run, like a regex split on (\d+)
    NaturalKey parts;
    NaturalKeyPart current;
    for (char c : text) {
        if (is_digit(c) != current.numeric) {
            parts.push_back(std::move(current));
            current = NaturalKeyPart{};
            current.numeric = is_digit(c);
        }
        current.value.push_back(c);
    }
    parts.push_back(std::move(current));
    if (parts.back().numeric) {
        parts.push_back(NaturalKeyPart{});
    }

    for (auto &part : parts) {
        if (!part.numeric) continue;
        size_t first = part.value.find_first_not_of('0');
        part.value = first == std::string::npos ? "0" : part.value.substr(first);
    }
    return parts;
}

static int compare_parts(const NaturalKeyPart &lhs, const NaturalKeyPart &rhs) {
    if (lhs.numeric && rhs.numeric) {
        if (lhs.value.size() != rhs.value.size()) {
            return lhs.value.size() < rhs.value.size() ? -1 : 1;
        }
    } else if (lhs.numeric != rhs.numeric) {
        return lhs.numeric ? -1 : 1;
    }
    int cmp = lhs.value.compare(rhs.value);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

int compare_natural_keys(const NaturalKey &lhs, const NaturalKey &rhs) {
    size_t common = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i < common; i++) {
        int cmp = compare_parts(lhs[i], rhs[i]);
        if (cmp != 0) return cmp;
    }
    if (lhs.size() == rhs.size()) return 0;
    return lhs.size() < rhs.size() ? -1 : 1;
}

bool natural_less(const std::string &lhs, const std::string &rhs) {
    return compare_natural_keys(natural_key(lhs), natural_key(rhs)) < 0;
}

SeqKey seq_sort_key(const std::string &seq) {
    SeqKey result;
    if (is_prologue_seq(seq)) {
        result.group = -1;
    } else if (is_epilogue_seq(seq)) {
        result.group = 1;
    }
    // Designators compare in upper case: "epilogue" and "EPILOGUE" are equal
    std::string canonical;
    for (char ch : seq) canonical += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    result.key = natural_key(canonical);
    return result;
}

int compare_seq_keys(const SeqKey &lhs, const SeqKey &rhs) {
    if (lhs.group != rhs.group) {
        return lhs.group < rhs.group ? -1 : 1;
    }
    return compare_natural_keys(lhs.key, rhs.key);
}

bool is_prologue_seq(const std::string &seq) {
    return to_lower(seq) == "prologue";
}

bool is_epilogue_seq(const std::string &seq) {
    return to_lower(seq) == "epilogue";
}

bool is_numeric_seq(const std::string &seq) {
    return !seq.empty() && std::all_of(seq.begin(), seq.end(), is_digit);
}

std::string normalize_spacing(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (is_space(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

std::string trim(const std::string &text) {
    auto first = std::find_if_not(text.begin(), text.end(), is_space);
    auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string to_lower(const std::string &text) {
    std::string lower;
    lower.reserve(text.size());
    for (char ch : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return lower;
}

bool is_blacklisted_title(const std::string &normalized_text) {
    return TITLE_BLACKLIST.count(to_lower(normalized_text)) > 0;
}

}  // namespace chaptext
