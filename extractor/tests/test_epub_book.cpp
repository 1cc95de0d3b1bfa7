// =============================================================================
// EPUB container reading (libzip + pugixml) and the EPUB book pipeline
// =============================================================================

#include <gtest/gtest.h>
#include <zip.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "book_reader.h"
#include "chapter_error.h"
#include "epub_archive.h"

namespace fs = std::filesystem;
using namespace chaptext;

namespace {

const char *CONTAINER_XML = R"(<?xml version="1.0" encoding="UTF-8"?>
<container version="1.0" xmlns="urn:oasis:names:tc:opendocument:xmlns:container">
  <rootfiles>
    <rootfile full-path="OEBPS/content.opf" media-type="application/oebps-package+xml"/>
  </rootfiles>
</container>)";

const char *CONTENT_OPF = R"(<?xml version="1.0" encoding="UTF-8"?>
<package xmlns="http://www.idpf.org/2007/opf" version="2.0" unique-identifier="uid">
  <metadata xmlns:dc="http://purl.org/dc/elements/1.1/">
    <dc:title>Test   Book</dc:title>
  </metadata>
  <manifest>
    <item id="ncx" href="toc.ncx" media-type="application/x-dtbncx+xml"/>
    <item id="cover" href="cover.xhtml" media-type="application/xhtml+xml"/>
    <item id="prologue" href="text/prologue.xhtml" media-type="application/xhtml+xml"/>
    <item id="ch1" href="text/ch1.xhtml" media-type="application/xhtml+xml"/>
    <item id="ch2" href="text/ch2.xhtml" media-type="application/xhtml+xml"/>
    <item id="ch2b" href="text/ch2b.xhtml" media-type="application/xhtml+xml"/>
  </manifest>
  <spine toc="ncx">
    <itemref idref="cover"/>
    <itemref idref="prologue"/>
    <itemref idref="ch1"/>
    <itemref idref="ch2"/>
    <itemref idref="ch2b"/>
  </spine>
</package>)";

// Chapter 1 is listed before the prologue and chapter 2 is split over two
// documents, the second of which has no header of its own.
const char *TOC_NCX = R"(<?xml version="1.0" encoding="UTF-8"?>
<ncx xmlns="http://www.daisy.org/z3986/2005/ncx/" version="2005-1">
  <navMap>
    <navPoint id="n1"><navLabel><text>Cover</text></navLabel><content src="cover.xhtml"/></navPoint>
    <navPoint id="n2"><navLabel><text>Chapter 1</text></navLabel><content src="text/ch1.xhtml"/></navPoint>
    <navPoint id="n3"><navLabel><text>Chapter 2</text></navLabel><content src="text/ch2.xhtml"/></navPoint>
    <navPoint id="n4"><navLabel><text>Second</text></navLabel><content src="text/ch2.xhtml#title"/></navPoint>
    <navPoint id="n5"><navLabel><text>Chapter 2 Part Two</text></navLabel><content src="text/ch2%62.xhtml"/></navPoint>
    <navPoint id="n6"><navLabel><text>Prologue</text></navLabel><content src="text/prologue.xhtml"/></navPoint>
  </navMap>
</ncx>)";

std::string xhtml(const std::string &body) {
    return "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head><title>Test Book</title></head><body>" +
           body + "</body></html>";
}

}  // namespace

class EpubBookTest : public ::testing::Test {
protected:
    fs::path dir_;
    std::string epub_path_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("chaptext_epub_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
        epub_path_ = (dir_ / "book.epub").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Write a ZIP archive holding `entries` (name, contents)
    void write_zip(const std::string &path, const std::vector<std::pair<std::string, std::string>> &entries) {
        int zip_error = 0;
        zip_t *archive = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &zip_error);
        ASSERT_NE(archive, nullptr) << "zip_open failed with code " << zip_error;

        // zip_source_buffer does not copy; contents must outlive zip_close
        for (const auto &entry : entries) {
            zip_source_t *source = zip_source_buffer(archive, entry.second.data(), entry.second.size(), 0);
            ASSERT_NE(source, nullptr);
            if (zip_file_add(archive, entry.first.c_str(), source, ZIP_FL_OVERWRITE) < 0) {
                zip_source_free(source);
                zip_discard(archive);
                FAIL() << "zip_file_add failed for " << entry.first;
            }
        }
        ASSERT_EQ(zip_close(archive), 0);
    }

    std::vector<std::pair<std::string, std::string>> book_entries() {
        return {
            {"mimetype", "application/epub+zip"},
            {"META-INF/container.xml", CONTAINER_XML},
            {"OEBPS/content.opf", CONTENT_OPF},
            {"OEBPS/toc.ncx", TOC_NCX},
            {"OEBPS/cover.xhtml", xhtml("<p><img src=\"cover.png\"/></p>")},
            {"OEBPS/text/prologue.xhtml", xhtml("<h2>Prologue</h2><h3>Before</h3><p>Long ago.</p>")},
            {"OEBPS/text/ch1.xhtml", xhtml("<p>Chapter 1</p><p>The Beginning</p><p>It began.</p>")},
            {"OEBPS/text/ch2.xhtml", xhtml("<p>Chapter 2</p><p>Second</p><p>More.</p>")},
            {"OEBPS/text/ch2b.xhtml", xhtml("<p>Still   more.</p>")},
        };
    }
};

TEST_F(EpubBookTest, ReadsBookInChapterOrder) {
    auto entries = book_entries();
    write_zip(epub_path_, entries);
    ASSERT_FALSE(HasFatalFailure());

    SegmenterOptions options;
    Book book = read_epub_book(epub_path_, options);

    EXPECT_EQ(book.title, "Test Book");
    EXPECT_EQ(book.source_count, 4u);
    ASSERT_EQ(book.chapters.size(), 3u);
    EXPECT_EQ(book.chapters[0], Chapter("prologue", "Before", {"Long ago."}));
    EXPECT_EQ(book.chapters[1], Chapter("1", "The Beginning", {"It began."}));
    EXPECT_EQ(book.chapters[2], Chapter("2", "Second", {"More.", "Still more."}));
}

TEST_F(EpubBookTest, PackageLocatesNavigation) {
    auto entries = book_entries();
    write_zip(epub_path_, entries);
    ASSERT_FALSE(HasFatalFailure());

    EpubArchive archive(epub_path_);
    EpubPackage package = read_epub_package(archive);

    EXPECT_EQ(package.title, "Test Book");
    EXPECT_EQ(package.nav_path, "OEBPS/toc.ncx");
    EXPECT_TRUE(package.nav_is_ncx);
    EXPECT_TRUE(archive.has_entry("OEBPS/text/ch1.xhtml"));
    EXPECT_FALSE(archive.has_entry("OEBPS/text/ch3.xhtml"));
}

TEST_F(EpubBookTest, MissingEntryThrows) {
    auto entries = book_entries();
    write_zip(epub_path_, entries);
    ASSERT_FALSE(HasFatalFailure());

    EpubArchive archive(epub_path_);
    EXPECT_THROW(archive.read("OEBPS/missing.xhtml"), std::runtime_error);
}

TEST_F(EpubBookTest, NavigationWithoutChaptersFails) {
    auto entries = book_entries();
    entries[3].second = R"(<ncx><navMap>
        <navPoint><navLabel><text>Cover</text></navLabel><content src="cover.xhtml"/></navPoint>
        </navMap></ncx>)";
    write_zip(epub_path_, entries);
    ASSERT_FALSE(HasFatalFailure());

    try {
        read_epub_book(epub_path_, SegmenterOptions());
        FAIL() << "expected ChapterError";
    } catch (const ChapterError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::EmptyNavigation);
    }
}

TEST_F(EpubBookTest, BookWithoutChapterTextFails) {
    auto entries = book_entries();
    entries[3].second = R"(<ncx><navMap>
        <navPoint><navLabel><text>Chapter 1</text></navLabel><content src="text/ch1.xhtml"/></navPoint>
        </navMap></ncx>)";
    entries[6].second = xhtml("<p>Table of Contents</p><p>Start</p>");
    write_zip(epub_path_, entries);
    ASSERT_FALSE(HasFatalFailure());

    try {
        read_epub_book(epub_path_, SegmenterOptions());
        FAIL() << "expected an error";
    } catch (const ChapterError &e) {
        FAIL() << "unexpected ChapterError: " << e.what();
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string(e.what()).find("No chapter text"), std::string::npos);
    }
}

TEST_F(EpubBookTest, DetectsEpubByMimetype) {
    auto entries = book_entries();
    write_zip(epub_path_, entries);
    ASSERT_FALSE(HasFatalFailure());
    EXPECT_TRUE(is_epub_file(epub_path_));

    std::string zip_path = (dir_ / "other.zip").string();
    std::vector<std::pair<std::string, std::string>> other = {{"mimetype", "application/zip"}};
    write_zip(zip_path, other);
    ASSERT_FALSE(HasFatalFailure());
    EXPECT_FALSE(is_epub_file(zip_path));

    std::string text_path = (dir_ / "plain.txt").string();
    std::ofstream(text_path) << "not a zip";
    EXPECT_FALSE(is_epub_file(text_path));
}

TEST_F(EpubBookTest, NotAZipThrows) {
    std::string text_path = (dir_ / "broken.epub").string();
    std::ofstream(text_path) << "not a zip";
    EXPECT_THROW(EpubArchive archive(text_path), std::runtime_error);
}

// =============================================================================
// Archive path helpers
// =============================================================================

TEST(EpubPathTest, DirnameOf) {
    EXPECT_EQ(dirname_of("OEBPS/toc.ncx"), "OEBPS");
    EXPECT_EQ(dirname_of("OEBPS/text/ch1.xhtml"), "OEBPS/text");
    EXPECT_EQ(dirname_of("toc.ncx"), "");
}

TEST(EpubPathTest, JoinPath) {
    EXPECT_EQ(join_path("OEBPS", "text/ch1.xhtml"), "OEBPS/text/ch1.xhtml");
    EXPECT_EQ(join_path("OEBPS/nav", "../text/./ch1.xhtml"), "OEBPS/text/ch1.xhtml");
    EXPECT_EQ(join_path("", "ch1.xhtml"), "ch1.xhtml");
    EXPECT_EQ(join_path("OEBPS", "/text/ch1.xhtml"), "text/ch1.xhtml");
}

TEST(EpubPathTest, PercentDecode) {
    EXPECT_EQ(percent_decode("Chapter%201.xhtml"), "Chapter 1.xhtml");
    EXPECT_EQ(percent_decode("a%2Fb"), "a/b");
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("%zz"), "%zz");
}
