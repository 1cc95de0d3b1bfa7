#pragma once

#include <zip.h>

#include <string>

namespace chaptext {

// Read-only handle on an EPUB (ZIP) container
class EpubArchive {
public:
    // Throws std::runtime_error if the file is not a readable ZIP archive
    explicit EpubArchive(const std::string &path);
    ~EpubArchive();

    EpubArchive(const EpubArchive &) = delete;
    EpubArchive &operator=(const EpubArchive &) = delete;

    bool has_entry(const std::string &name) const;

    // Contents of an entry. Throws std::runtime_error if it is missing,
    // unreadable or larger than MAX_ZIP_ENTRY_SIZE.
    std::string read(const std::string &name) const;

    const std::string &path() const { return path_; }

private:
    zip_t *archive_ = nullptr;
    std::string path_;
};

// Where an EPUB keeps its title and navigation manifest
struct EpubPackage {
    std::string title;     // dc:title, normalized
    std::string nav_path;  // archive path of the NCX or EPUB 3 nav document
    bool nav_is_ncx = true;
};

// Read META-INF/container.xml and the OPF package document it points to.
// Throws std::runtime_error if either is missing or malformed, or if the
// package has no navigation manifest.
EpubPackage read_epub_package(const EpubArchive &archive);

// True if `path` is a ZIP archive whose mimetype entry says EPUB
bool is_epub_file(const std::string &path);

// Directory part of an archive path ("OEBPS/toc.ncx" -> "OEBPS")
std::string dirname_of(const std::string &path);

// Resolve `rel` against `base`, collapsing "." and ".." segments
std::string join_path(const std::string &base, const std::string &rel);

// Decode %XX escapes of an href
std::string percent_decode(const std::string &href);

}  // namespace chaptext
