#pragma once

#include <stdexcept>
#include <string>

namespace chaptext {

// Closed set of fatal conditions raised by the chapter engine. Each one
// aborts the book (or document) being processed.
enum class ErrorKind {
    AmbiguousContinuation,
    UnterminatedHeader,
    EmptyNavigation,
    IncompleteChapter,
    OutOfOrder,
};

const char *error_kind_name(ErrorKind kind);

class ChapterError : public std::runtime_error {
public:
    ChapterError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace chaptext
