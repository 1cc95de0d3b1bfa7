#include <cstdio>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>
#include <sstream>
#include <vector>
#include <algorithm>
#include <set>

#include "book_reader.h"
#include "chapter.h"
#include "chapter_error.h"
#include "epub_archive.h"
#include "html_document.h"
#include "log.h"
#include "reflow.h"
#include "serializer.h"

namespace fs = std::filesystem;
using namespace chaptext;

// Turn a book title into a file name: no path components, no control chars
std::string sanitize_book_filename(const std::string &title) {
    std::string safe_name;
    for (char c : title) {
        bool unsafe = c == '/' || c == '\\' || (unsigned char)c < 0x20;
        safe_name += unsafe ? '_' : c;
    }
    if (safe_name.empty() || safe_name == "." || safe_name == "..") {
        return "untitled";
    }
    return safe_name;
}

// Helper to write extracted text to an output file
bool write_text_file(const std::string &output_path, const std::string &content) {
    std::ofstream output_file(output_path, std::ios::binary);
    if (!output_file.is_open()) {
        std::cerr << "  Failed to write output file: " << output_path << std::endl;
        return false;
    }
    output_file << content;
    output_file.close();
    return !output_file.fail();
}

// --- CLI helpers ---

// Escape a string for safe JSON output
std::string json_escape(const std::string &s) {
    std::ostringstream o;
    for (char c : s) {
        switch (c) {
            case '"':  o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if ('\x00' <= c && c <= '\x1f') {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", (int)(unsigned char)c);
                    o << buf;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

// Normalize a file extension to lowercase (e.g. ".HTML" -> ".html")
std::string normalize_ext(const std::string &ext) {
    return to_lower(ext);
}

static const std::set<std::string> HTML_EXTS = {".html", ".htm", ".xhtml"};

bool is_html_path(const fs::path &path) {
    return HTML_EXTS.count(normalize_ext(path.extension().string())) > 0;
}

bool is_epub_path(const fs::path &path) {
    return normalize_ext(path.extension().string()) == ".epub" || is_epub_file(path.string());
}

struct Inputs {
    std::vector<std::string> html_files;
    std::vector<std::string> epub_files;
};

void classify_input(const fs::path &path, bool want_html, bool want_epub, Inputs &inputs) {
    if (want_html && is_html_path(path)) {
        inputs.html_files.push_back(path.string());
    } else if (want_epub && is_epub_path(path)) {
        inputs.epub_files.push_back(path.string());
    }
}

// Walk files and directories (recursively, following directory symlinks)
Inputs collect_inputs(const std::vector<std::string> &paths, bool want_html, bool want_epub) {
    Inputs inputs;
    for (const auto &path : paths) {
        if (fs::is_directory(path)) {
            for (const auto &entry : fs::recursive_directory_iterator(
                     path, fs::directory_options::follow_directory_symlink)) {
                if (entry.is_regular_file()) classify_input(entry.path(), want_html, want_epub, inputs);
            }
        } else if (fs::is_regular_file(path)) {
            classify_input(path, want_html, want_epub, inputs);
        } else {
            std::cerr << "Warning: Input not found: " << path << std::endl;
        }
    }
    std::sort(inputs.html_files.begin(), inputs.html_files.end(), natural_less);
    std::sort(inputs.epub_files.begin(), inputs.epub_files.end(), natural_less);
    inputs.html_files.erase(std::unique(inputs.html_files.begin(), inputs.html_files.end()),
                            inputs.html_files.end());
    inputs.epub_files.erase(std::unique(inputs.epub_files.begin(), inputs.epub_files.end()),
                            inputs.epub_files.end());
    return inputs;
}

void emit_failure(const std::string &key, const std::string &name, const std::exception &e) {
    std::cout << "{\"success\":false,\"" << key << "\":\"" << json_escape(name)
              << "\",\"error\":\"" << json_escape(e.what()) << "\"";
    if (const auto *chapter_error = dynamic_cast<const ChapterError*>(&e)) {
        std::cout << ",\"kind\":\"" << error_kind_name(chapter_error->kind()) << "\"";
    }
    std::cout << "}" << std::endl;
}

// Serialize a book and write it to <outdir>/<title>.txt, emit JSON to stdout
// Returns true on success
bool write_book(const Book &book, const std::string &out_dir) {
    std::string text = chapters_to_text(book.chapters);
    std::string output_path = (fs::path(out_dir) / (sanitize_book_filename(book.title) + ".txt")).string();
    if (log_enabled(LogLevel::Info)) {
        std::cerr << "Writing book titled \"" << book.title << "\" to \"" << output_path << "\"" << std::endl;
    }

    if (!write_text_file(output_path, text)) {
        std::cout << "{\"success\":false,\"book\":\"" << json_escape(book.title)
                  << "\",\"error\":\"Failed to write " << json_escape(output_path) << "\"}" << std::endl;
        return false;
    }

    std::cout << "{\"success\":true";
    std::cout << ",\"book\":\"" << json_escape(book.title) << "\"";
    std::cout << ",\"output\":\"" << json_escape(output_path) << "\"";
    std::cout << ",\"chapters\":" << book.chapters.size();
    std::cout << ",\"sources\":" << book.source_count;
    std::cout << "}" << std::endl;
    return true;
}

// Re-flow plain-text book files into <outdir>/<file name>, one JSON line each.
// Returns the number of failures.
int reflow_files(const std::vector<std::string> &paths, const std::string &out_dir) {
    int failed = 0;
    for (const auto &path : paths) {
        std::ifstream input_file(path, std::ios::binary);
        if (!input_file.is_open()) {
            std::cerr << "Error: skipping \"" << path << "\": failed to open file\n";
            std::cout << "{\"success\":false,\"file\":\"" << json_escape(path)
                      << "\",\"error\":\"Failed to open file\"}" << std::endl;
            failed++;
            continue;
        }
        std::vector<TextChapter> chapters = read_text_chapters(input_file);

        std::ostringstream text;
        write_text_chapters(chapters, text);
        std::string output_path = (fs::path(out_dir) / fs::path(path).filename()).string();
        if (log_enabled(LogLevel::Info)) {
            std::cerr << "Re-flowing \"" << path << "\" to \"" << output_path << "\"" << std::endl;
        }
        if (!write_text_file(output_path, text.str())) {
            std::cout << "{\"success\":false,\"file\":\"" << json_escape(path)
                      << "\",\"error\":\"Failed to write " << json_escape(output_path) << "\"}" << std::endl;
            failed++;
            continue;
        }
        std::cout << "{\"success\":true,\"file\":\"" << json_escape(path)
                  << "\",\"output\":\"" << json_escape(output_path)
                  << "\",\"chapters\":" << chapters.size() << "}" << std::endl;
    }
    return failed;
}

void print_usage(const char *prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " [options] <path>... -o <out_dir>\n"
              << "  " << prog << " --reflow <text_file>... -o <out_dir>\n"
              << "\n"
              << "Paths may be HTML files, EPUB files or directories to search.\n"
              << "HTML files sharing a <title> are merged into one book; each EPUB is one book.\n"
              << "\n"
              << "Options:\n"
              << "  -o, --outdir <dir>        directory to write <book title>.txt files to\n"
              << "  -i, --info                log progress\n"
              << "  -d, --debug               log parsing details\n"
              << "      --toc-skip <policy>   after a table of contents marker, drop the next\n"
              << "                            block 'always' or only if 'blacklisted' front matter\n"
              << "                            (default: always for HTML, blacklisted for EPUB)\n"
              << "      --html-only           ignore EPUB inputs\n"
              << "      --epub-only           ignore HTML inputs\n"
              << "      --reflow              re-flow book text files: one paragraph per line,\n"
              << "                            paragraphs separated by blank lines in the input\n"
              << "\n"
              << "Output: one JSON line per book to stdout.\n"
              << "Logs/errors go to stderr.\n";
}

int main(int argc, char *argv[]) {
    if (argc < 2) { print_usage(argv[0]); return 1; }

    // Parse arguments
    std::vector<std::string> paths;
    std::string out_dir;
    std::string toc_skip;  // "", "always", "blacklisted"
    bool want_html = true;
    bool want_epub = true;
    bool info = false;
    bool debug = false;
    bool reflow = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-o" || arg == "--outdir") && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (arg == "-i" || arg == "--info") {
            info = true;
        } else if (arg == "-d" || arg == "--debug") {
            debug = true;
        } else if (arg == "--toc-skip" && i + 1 < argc) {
            toc_skip = argv[++i];
        } else if (arg == "--html-only") {
            want_epub = false;
        } else if (arg == "--epub-only") {
            want_html = false;
        } else if (arg == "--reflow") {
            reflow = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-') {
            paths.push_back(arg);
        } else {
            std::cerr << "Error: unknown or incomplete option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (info && debug) {
        std::cerr << "Error: --info and --debug are mutually exclusive\n";
        return 1;
    }
    if (!want_html && !want_epub) {
        std::cerr << "Error: --html-only and --epub-only are mutually exclusive\n";
        return 1;
    }
    if (toc_skip != "" && toc_skip != "always" && toc_skip != "blacklisted") {
        std::cerr << "Error: --toc-skip must be 'always' or 'blacklisted'\n";
        return 1;
    }
    if (paths.empty() || out_dir.empty()) { print_usage(argv[0]); return 1; }

    if (debug) {
        set_log_level(LogLevel::Debug);
    } else if (info) {
        set_log_level(LogLevel::Info);
    }

    if (reflow) {
        try {
            fs::create_directories(out_dir);
        } catch (const fs::filesystem_error &e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        int reflow_failed = reflow_files(paths, out_dir);
        std::cerr << "Finished: " << (paths.size() - reflow_failed) << " file(s) re-flowed, "
                  << reflow_failed << " failed\n";
        return reflow_failed > 0 ? 1 : 0;
    }

    SegmenterOptions html_options;
    html_options.toc_policy = TocPolicy::DiscardNext;
    SegmenterOptions epub_options;
    epub_options.toc_policy = TocPolicy::DiscardBlacklisted;
    if (!toc_skip.empty()) {
        TocPolicy policy = toc_skip == "always" ? TocPolicy::DiscardNext : TocPolicy::DiscardBlacklisted;
        html_options.toc_policy = policy;
        epub_options.toc_policy = policy;
    }

    std::cerr << "Will look for data under " << paths.size() << " path(s)\n";
    Inputs inputs;
    try {
        inputs = collect_inputs(paths, want_html, want_epub);
        fs::create_directories(out_dir);
    } catch (const fs::filesystem_error &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    if (log_enabled(LogLevel::Info)) {
        std::cerr << "Will read " << inputs.html_files.size() << " HTML file(s) and "
                  << inputs.epub_files.size() << " EPUB file(s)" << std::endl;
    }

    int written = 0, failed = 0;

    // --- EPUB: one book per file ---
    for (const auto &epub_path : inputs.epub_files) {
        try {
            Book book = read_epub_book(epub_path, epub_options);
            if (write_book(book, out_dir)) {
                written++;
            } else {
                failed++;
            }
        } catch (const std::exception &e) {
            std::cerr << "Error: skipping \"" << epub_path << "\": " << e.what() << "\n";
            emit_failure("file", epub_path, e);
            failed++;
        }
    }

    // --- HTML: files grouped into books by title ---
    std::vector<HtmlSource> html_sources;
    for (const auto &html_path : inputs.html_files) {
        if (log_enabled(LogLevel::Info)) {
            std::cerr << "Reading \"" << html_path << "\"" << std::endl;
        }
        try {
            html_sources.push_back(HtmlSource{html_path, read_html_file(html_path)});
        } catch (const std::exception &e) {
            std::cerr << "Error: skipping \"" << html_path << "\": " << e.what() << "\n";
            emit_failure("file", html_path, e);
            failed++;
        }
    }

    for (const auto &book_sources : group_html_sources(std::move(html_sources))) {
        try {
            Book book = read_html_book(book_sources, html_options);
            if (book.chapters.empty()) {
                if (log_enabled(LogLevel::Info)) {
                    std::cerr << "No chapters found for book titled \"" << book.title << "\"" << std::endl;
                }
                continue;
            }
            if (write_book(book, out_dir)) {
                written++;
            } else {
                failed++;
            }
        } catch (const std::exception &e) {
            std::cerr << "Error: skipping book titled \"" << book_sources.title << "\": " << e.what() << "\n";
            emit_failure("book", book_sources.title, e);
            failed++;
        }
    }

    // Summary line to stderr
    std::cerr << "Finished: " << written << " book(s) written, " << failed << " failed\n";
    return failed > 0 ? 1 : 0;
}
