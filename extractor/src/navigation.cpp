#include "navigation.h"

#include <pugixml.hpp>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include "chapter.h"
#include "chapter_error.h"
#include "log.h"

namespace chaptext {

// Element name without its namespace prefix ("ncx:navPoint" -> "navPoint")
static const char *local_name(const pugi::xml_node &node) {
    const char *name = node.name();
    const char *colon = std::strrchr(name, ':');
    return colon ? colon + 1 : name;
}

static pugi::xml_node child_local(const pugi::xml_node &node, const char *name) {
    for (pugi::xml_node child : node.children()) {
        if (child.type() == pugi::node_element && std::strcmp(local_name(child), name) == 0) {
            return child;
        }
    }
    return pugi::xml_node();
}

static pugi::xml_attribute attribute_local(const pugi::xml_node &node, const char *name) {
    for (pugi::xml_attribute attr : node.attributes()) {
        const char *attr_name = attr.name();
        const char *colon = std::strrchr(attr_name, ':');
        if (std::strcmp(colon ? colon + 1 : attr_name, name) == 0) return attr;
    }
    return pugi::xml_attribute();
}

static void collect_xml_text(const pugi::xml_node &node, std::string &out) {
    for (pugi::xml_node child : node.children()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            out += child.value();
        } else if (child.type() == pugi::node_element) {
            collect_xml_text(child, out);
        }
    }
}

static void load_xml(pugi::xml_document &doc, const std::string &xml, const char *what) {
    pugi::xml_parse_result parse_result = doc.load_buffer(xml.data(), xml.size());
    if (!parse_result) {
        throw std::runtime_error(std::string("Failed to parse ") + what + ": " + parse_result.description());
    }
}

std::vector<NavEntry> parse_ncx_entries(const std::string &ncx_xml) {
    pugi::xml_document doc;
    load_xml(doc, ncx_xml, "NCX");

    std::vector<NavEntry> entries;
    for (const pugi::xpath_node &nav : doc.select_nodes("//*[local-name()='navPoint']")) {
        pugi::xml_node nav_point = nav.node();
        pugi::xml_node content = child_local(nav_point, "content");
        if (!content) continue;

        NavEntry entry;
        collect_xml_text(child_local(nav_point, "navLabel"), entry.label);
        entry.label = normalize_spacing(entry.label);
        entry.src = content.attribute("src").as_string();
        if (!entry.src.empty()) entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<NavEntry> parse_nav_document_entries(const std::string &nav_xhtml) {
    pugi::xml_document doc;
    load_xml(doc, nav_xhtml, "navigation document");

    pugi::xpath_node_set navs = doc.select_nodes("//*[local-name()='nav']");
    pugi::xml_node toc_nav;
    for (const pugi::xpath_node &nav : navs) {
        std::string nav_type = attribute_local(nav.node(), "type").as_string();
        if (nav_type.find("toc") != std::string::npos) {
            toc_nav = nav.node();
            break;
        }
    }
    if (!toc_nav && !navs.empty()) {
        toc_nav = navs.first().node();
    }

    std::vector<NavEntry> entries;
    if (!toc_nav) return entries;

    for (const pugi::xpath_node &link : toc_nav.select_nodes(".//*[local-name()='a']")) {
        NavEntry entry;
        collect_xml_text(link.node(), entry.label);
        entry.label = normalize_spacing(entry.label);
        entry.src = link.node().attribute("href").as_string();
        if (!entry.src.empty()) entries.push_back(std::move(entry));
    }
    return entries;
}

std::string normalize_chapter_seq(const std::string &token) {
    std::string seq = token;
    if (!seq.empty() && seq.back() == ':') {
        seq.pop_back();
    }

    std::string lower = to_lower(seq);
    if (lower.rfind("prologue", 0) == 0) return "PROLOGUE";
    if (lower.rfind("epilogue", 0) == 0) return "EPILOGUE";
    return seq;
}

std::pair<std::string, std::string> parse_chapter_label(const std::string &label) {
    std::vector<std::string> tokens;
    std::string normalized = normalize_spacing(label);
    size_t start = 0;
    while (start < normalized.size()) {
        size_t end = normalized.find(' ', start);
        if (end == std::string::npos) end = normalized.size();
        tokens.push_back(normalized.substr(start, end - start));
        start = end + 1;
    }

    size_t first = 0;
    if (!tokens.empty() && to_lower(tokens[0]) == "chapter") {
        first = 1;
    }
    if (first >= tokens.size()) {
        return {std::string(), std::string()};
    }

    std::string name;
    for (size_t idx = first + 1; idx < tokens.size(); idx++) {
        if (!name.empty()) name += ' ';
        name += tokens[idx];
    }
    return {normalize_chapter_seq(tokens[first]), name};
}

static std::string strip_fragment(const std::string &src) {
    return src.substr(0, src.find('#'));
}

std::vector<ChapterDescriptor> resolve_navigation(const std::vector<NavEntry> &entries,
                                                  const std::string &book) {
    // Labels per document, documents in order of first appearance
    std::vector<std::pair<std::string, std::vector<std::string>>> labels_by_src;
    for (const auto &entry : entries) {
        std::string label = normalize_spacing(entry.label);
        if (is_blacklisted_title(label)) continue;

        std::string src = strip_fragment(entry.src);
        auto it = std::find_if(labels_by_src.begin(), labels_by_src.end(),
                               [&](const auto &item) { return item.first == src; });
        if (it == labels_by_src.end()) {
            labels_by_src.emplace_back(src, std::vector<std::string>{label});
        } else {
            it->second.push_back(label);
        }
    }

    std::vector<ChapterDescriptor> descriptors;
    for (const auto &item : labels_by_src) {
        std::string joined_label;
        for (const auto &label : item.second) {
            joined_label += label + " ";
        }
        joined_label = normalize_spacing(joined_label);
        if (is_blacklisted_title(joined_label)) continue;

        auto parsed = parse_chapter_label(joined_label);
        if (parsed.first.empty()) {
            if (log_enabled(LogLevel::Debug)) {
                std::cerr << "  Skipping navigation entry without a chapter number: \"" << joined_label << "\"" << std::endl;
            }
            continue;
        }
        descriptors.push_back(ChapterDescriptor{parsed.first, parsed.second, item.first});
    }

    if (descriptors.empty()) {
        throw ChapterError(ErrorKind::EmptyNavigation,
                           (book.empty() ? std::string() : book + ": ") + "No navigation elements found!");
    }

    std::stable_sort(descriptors.begin(), descriptors.end(),
                     [](const ChapterDescriptor &lhs, const ChapterDescriptor &rhs) {
                         return seq_sort_key(lhs.seq) < seq_sort_key(rhs.seq);
                     });
    return descriptors;
}

}  // namespace chaptext
