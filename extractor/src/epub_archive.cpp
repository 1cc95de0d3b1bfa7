#include "epub_archive.h"

#include <pugixml.hpp>

#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "chapter.h"
#include "log.h"

namespace chaptext {

// Maximum decompressed entry size (100 MB)
static constexpr zip_uint64_t MAX_ZIP_ENTRY_SIZE = 100 * 1024 * 1024;

static const char *EPUB_MIMETYPE = "application/epub+zip";
static const char *NCX_MEDIA_TYPE = "application/x-dtbncx+xml";

EpubArchive::EpubArchive(const std::string &path) : path_(path) {
    int zip_error = 0;
    archive_ = zip_open(path.c_str(), ZIP_RDONLY, &zip_error);
    if (!archive_) {
        zip_error_t error;
        zip_error_init_with_code(&error, zip_error);
        std::string msg = "Failed to open EPUB as ZIP: " + path + ": " + zip_error_strerror(&error);
        zip_error_fini(&error);
        throw std::runtime_error(msg);
    }
}

EpubArchive::~EpubArchive() {
    if (archive_) zip_close(archive_);
}

bool EpubArchive::has_entry(const std::string &name) const {
    return zip_name_locate(archive_, name.c_str(), 0) >= 0;
}

std::string EpubArchive::read(const std::string &name) const {
    zip_stat_t entry_stat;
    zip_stat_init(&entry_stat);
    if (zip_stat(archive_, name.c_str(), 0, &entry_stat) != 0) {
        throw std::runtime_error("No entry \"" + name + "\" in " + path_);
    }

    if (!(entry_stat.valid & ZIP_STAT_SIZE) || entry_stat.size > MAX_ZIP_ENTRY_SIZE) {
        throw std::runtime_error("Entry \"" + name + "\" in " + path_ + " is too large");
    }

    zip_file_t *zip_handle = zip_fopen(archive_, name.c_str(), 0);
    if (!zip_handle) {
        throw std::runtime_error("Failed to open entry \"" + name + "\" in " + path_);
    }

    std::string contents(entry_stat.size, '\0');
    zip_int64_t bytes_read = zip_fread(zip_handle, &contents[0], entry_stat.size);
    zip_fclose(zip_handle);

    if (bytes_read < 0 || (zip_uint64_t)bytes_read != entry_stat.size) {
        throw std::runtime_error("Incomplete read of entry \"" + name + "\" in " + path_);
    }
    return contents;
}

bool is_epub_file(const std::string &path) {
    int zip_error = 0;
    zip_t *archive = zip_open(path.c_str(), ZIP_RDONLY, &zip_error);
    if (!archive) return false;

    bool result = false;
    zip_file_t *zip_handle = zip_fopen(archive, "mimetype", 0);
    if (zip_handle) {
        char buffer[64] = {};
        zip_int64_t bytes_read = zip_fread(zip_handle, buffer, sizeof(buffer) - 1);
        zip_fclose(zip_handle);
        if (bytes_read > 0) {
            result = trim(std::string(buffer, static_cast<size_t>(bytes_read))) == EPUB_MIMETYPE;
        }
    }
    zip_close(archive);
    return result;
}

std::string dirname_of(const std::string &path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return std::string();
    return path.substr(0, pos);
}

std::string join_path(const std::string &base, const std::string &rel) {
    if (rel.empty()) return base;
    std::string combined = (base.empty() || rel[0] == '/') ? rel : base + "/" + rel;

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= combined.size()) {
        size_t end = combined.find('/', start);
        if (end == std::string::npos) end = combined.size();
        std::string part = combined.substr(start, end - start);
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        start = end + 1;
    }

    std::string result;
    for (size_t k = 0; k < parts.size(); k++) {
        if (k) result.push_back('/');
        result += parts[k];
    }
    return result;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string &href) {
    std::string decoded;
    decoded.reserve(href.size());
    for (size_t i = 0; i < href.size(); i++) {
        if (href[i] == '%' && i + 2 < href.size()) {
            int high = hex_value(href[i + 1]);
            int low = hex_value(href[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(href[i]);
    }
    return decoded;
}

struct ManifestItem {
    std::string href;
    std::string media_type;
    std::string properties;
};

static void load_xml(pugi::xml_document &doc, const std::string &xml, const std::string &what) {
    pugi::xml_parse_result parse_result = doc.load_buffer(xml.data(), xml.size());
    if (!parse_result) {
        throw std::runtime_error("Failed to parse " + what + ": " + parse_result.description());
    }
}

EpubPackage read_epub_package(const EpubArchive &archive) {
    pugi::xml_document container_doc;
    load_xml(container_doc, archive.read("META-INF/container.xml"), "container.xml");
    pugi::xpath_node rootfile = container_doc.select_node("//*[local-name()='rootfile']");
    std::string opf_path = rootfile ? rootfile.node().attribute("full-path").as_string() : "";
    if (opf_path.empty()) {
        throw std::runtime_error("No <rootfile> in container.xml of " + archive.path());
    }

    pugi::xml_document opf_doc;
    load_xml(opf_doc, archive.read(opf_path), opf_path);
    std::string opf_dir = dirname_of(opf_path);

    EpubPackage package;
    pugi::xpath_node title = opf_doc.select_node(
        "//*[local-name()='metadata']/*[local-name()='title']");
    if (title) {
        package.title = normalize_spacing(title.node().text().as_string());
    }

    std::unordered_map<std::string, ManifestItem> manifest;
    std::vector<std::string> manifest_order;
    for (const pugi::xpath_node &item : opf_doc.select_nodes(
             "//*[local-name()='manifest']/*[local-name()='item']")) {
        pugi::xml_node node = item.node();
        std::string id = node.attribute("id").as_string();
        std::string href = node.attribute("href").as_string();
        if (id.empty() || href.empty()) continue;
        manifest[id] = ManifestItem{href, node.attribute("media-type").as_string(),
                                    node.attribute("properties").as_string()};
        manifest_order.push_back(id);
    }

    // NCX: named by the spine, else found by media type
    const ManifestItem *ncx = nullptr;
    pugi::xpath_node spine = opf_doc.select_node("//*[local-name()='spine']");
    if (spine) {
        auto it = manifest.find(spine.node().attribute("toc").as_string());
        if (it != manifest.end()) ncx = &it->second;
    }
    const ManifestItem *nav_doc = nullptr;
    for (const auto &id : manifest_order) {
        const ManifestItem &item = manifest[id];
        if (!ncx && item.media_type == NCX_MEDIA_TYPE) ncx = &item;
        if (!nav_doc && (" " + item.properties + " ").find(" nav ") != std::string::npos) nav_doc = &item;
    }

    if (ncx) {
        package.nav_path = join_path(opf_dir, percent_decode(ncx->href));
        package.nav_is_ncx = true;
    } else if (nav_doc) {
        package.nav_path = join_path(opf_dir, percent_decode(nav_doc->href));
        package.nav_is_ncx = false;
    } else {
        throw std::runtime_error("No navigation manifest in " + archive.path());
    }
    if (log_enabled(LogLevel::Debug)) {
        std::cerr << "  Navigation manifest of " << archive.path() << ": " << package.nav_path << std::endl;
    }
    return package;
}

}  // namespace chaptext
