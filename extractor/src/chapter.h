#pragma once

#include <string>
#include <utility>
#include <vector>

namespace chaptext {

struct Chapter {
    std::string seq;
    std::string title;
    std::vector<std::string> pars;

    Chapter() = default;
    Chapter(std::string seq_, std::string title_, std::vector<std::string> pars_ = {})
        : seq(std::move(seq_)), title(std::move(title_)), pars(std::move(pars_)) {}

    // True for the placeholder accumulator that holds nothing yet
    bool empty() const { return seq.empty() && title.empty() && pars.empty(); }

    bool operator==(const Chapter &other) const {
        return seq == other.seq && title == other.title && pars == other.pars;
    }
    bool operator!=(const Chapter &other) const { return !(*this == other); }
};

// "{seq=..., title=..., pars=[...]}" for log and error messages
std::string describe_chapter(const Chapter &chapter);

// One run of a natural key: either a digit run compared by magnitude or a
// text run compared bytewise.
struct NaturalKeyPart {
    bool numeric = false;
    std::string value;  // digit runs are stored without leading zeros
};

using NaturalKey = std::vector<NaturalKeyPart>;

// Split "ch10b" into ["ch", 10, "b"] so that "ch2" < "ch10"
NaturalKey natural_key(const std::string &text);
int compare_natural_keys(const NaturalKey &lhs, const NaturalKey &rhs);
bool natural_less(const std::string &lhs, const std::string &rhs);

// Ordering key of a chapter designator: prologues first, epilogues last,
// everything else by natural key.
struct SeqKey {
    int group = 0;
    NaturalKey key;
};

SeqKey seq_sort_key(const std::string &seq);
int compare_seq_keys(const SeqKey &lhs, const SeqKey &rhs);

inline bool operator<(const SeqKey &lhs, const SeqKey &rhs) {
    return compare_seq_keys(lhs, rhs) < 0;
}

bool is_prologue_seq(const std::string &seq);
bool is_epilogue_seq(const std::string &seq);
bool is_numeric_seq(const std::string &seq);

// Collapse every whitespace run into one space and trim both ends
std::string normalize_spacing(const std::string &text);
std::string trim(const std::string &text);
std::string to_lower(const std::string &text);

// Front-matter labels that never name a chapter
bool is_blacklisted_title(const std::string &normalized_text);

}  // namespace chaptext
