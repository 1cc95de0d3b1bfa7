#include "chapter_error.h"

namespace chaptext {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AmbiguousContinuation: return "AmbiguousContinuation";
        case ErrorKind::UnterminatedHeader:    return "UnterminatedHeader";
        case ErrorKind::EmptyNavigation:       return "EmptyNavigation";
        case ErrorKind::IncompleteChapter:     return "IncompleteChapter";
        case ErrorKind::OutOfOrder:            return "OutOfOrder";
    }
    return "Unknown";
}

}  // namespace chaptext
