#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "chapter.h"

namespace chaptext {

// Line of 64 '=' between two chapters
extern const std::string CHAPTER_DELIM;

// "CHAPTER 3", "PROLOGUE" or "EPILOGUE"
std::string seq_description(const std::string &seq);

// Write chapters in the plain-text book layout: each chapter is its
// header line, two blank lines and one line per paragraph; chapters are
// separated by two blank lines and CHAPTER_DELIM.
void write_chapters(const std::vector<Chapter> &chapters, std::ostream &out);

std::string chapters_to_text(const std::vector<Chapter> &chapters);

}  // namespace chaptext
