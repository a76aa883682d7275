#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <string>
#include <utility>
#include <vector>

#include "heading_detector.hpp"
#include "pdf_fixture.hpp"
#include "pdf_utils.hpp"

namespace {

struct LoadedOutlineItem {
    std::string title;
    int page;    // 0-based, as MuPDF reports it
    int depth;
};

void flatten_loaded(fz_outline* outline, int depth, std::vector<LoadedOutlineItem>& items) {
    for (; outline; outline = outline->next) {
        items.push_back({outline->title ? outline->title : "", outline->page.page, depth});
        flatten_loaded(outline->down, depth + 1, items);
    }
}

std::vector<LoadedOutlineItem> load_outline(const std::string& path) {
    std::vector<LoadedOutlineItem> items;
    PDF_Context pdf;
    if (!pdf.open(path)) {
        return items;
    }

    fz_outline* outline = nullptr;
    fz_var(outline);
    fz_try(pdf.ctx) {
        outline = fz_load_outline(pdf.ctx, pdf.doc);
        flatten_loaded(outline, 0, items);
    } fz_always(pdf.ctx) {
        fz_drop_outline(pdf.ctx, outline);
    } fz_catch(pdf.ctx) {
        items.clear();
    }
    return items;
}

TocForest sample_outline() {
    TocForest forest;
    forest.emplace_back("Chapter 1", 1, 1);
    forest.back().children.emplace_back("Section 1.1", 2, 3);
    return forest;
}

}

class PdfUtilsTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir_ = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("pdftoc-test-%%%%-%%%%");
        boost::filesystem::create_directories(dir_);
        sample_ = (dir_ / "sample.pdf").string();
        ASSERT_TRUE(write_sample_pdf(sample_));
    }

    void TearDown() override {
        boost::system::error_code ec;
        boost::filesystem::remove_all(dir_, ec);
    }

    boost::filesystem::path dir_;
    std::string sample_;
};

TEST_F(PdfUtilsTest, CountPages) {
    std::optional<unsigned int> pages = count_pdf_pages(sample_);
    ASSERT_TRUE(pages.has_value());
    EXPECT_EQ(pages.value(), 3U);
}

TEST_F(PdfUtilsTest, UnreadableInput) {
    std::string missing = (dir_ / "missing.pdf").string();
    EXPECT_FALSE(count_pdf_pages(missing).has_value());
    EXPECT_FALSE(extract_text_spans(missing).has_value());
    EXPECT_FALSE(write_pdf_outline(missing, sample_outline(), (dir_ / "out.pdf").string()));
    EXPECT_FALSE(boost::filesystem::exists(dir_ / "out.pdf"));
}

TEST_F(PdfUtilsTest, OpenChecksDocument) {
    PDF_Context pdf;
    ASSERT_TRUE(pdf.open(sample_));
    EXPECT_EQ(pdf.page_count, 3);
    EXPECT_FALSE(fz_needs_password(pdf.ctx, pdf.doc));

    std::string garbage = (dir_ / "garbage.pdf").string();
    {
        boost::filesystem::ofstream out(garbage);
        out << "this is not a pdf document";
    }
    EXPECT_FALSE(pdf.open(garbage));
    EXPECT_EQ(pdf.doc, nullptr);
    EXPECT_EQ(pdf.page_count, 0);
    EXPECT_FALSE(count_pdf_pages(garbage).has_value());
}

TEST_F(PdfUtilsTest, ExtractSpans) {
    std::optional<PDF_Span_Document> document = extract_text_spans(sample_);
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ(document->page_count, 3U);
    ASSERT_FALSE(document->spans.empty());

    bool found_chapter = false;
    unsigned int last_page = 1;
    for (const TextSpan& span : document->spans) {
        EXPECT_GE(span.page, last_page);
        EXPECT_LE(span.page, 3U);
        last_page = span.page;
        EXPECT_FALSE(span.text.empty());

        if (span.text == "Chapter 1") {
            found_chapter = true;
            EXPECT_EQ(span.page, 1U);
            EXPECT_NEAR(span.font_size, 24.0, 0.5);
            EXPECT_TRUE(span.bold);
        }
        if (span.text.rfind("Page 2 line", 0) == 0) {
            EXPECT_NEAR(span.font_size, 11.0, 0.5);
            EXPECT_FALSE(span.bold);
        }
    }
    EXPECT_TRUE(found_chapter);
}

TEST_F(PdfUtilsTest, DetectFromExtractedSpans) {
    std::optional<PDF_Span_Document> document = extract_text_spans(sample_);
    ASSERT_TRUE(document.has_value());

    TocForest forest = detect_headings(document->spans, document->page_count);
    EXPECT_EQ(forest, sample_outline());
}

TEST_F(PdfUtilsTest, WriteOutlineToNewFile) {
    std::string output = (dir_ / "sample_toc.pdf").string();
    ASSERT_TRUE(write_pdf_outline(sample_, sample_outline(), output));

    std::vector<LoadedOutlineItem> items = load_outline(output);
    ASSERT_EQ(items.size(), 2U);
    EXPECT_EQ(items[0].title, "Chapter 1");
    EXPECT_EQ(items[0].page, 0);
    EXPECT_EQ(items[0].depth, 0);
    EXPECT_EQ(items[1].title, "Section 1.1");
    EXPECT_EQ(items[1].page, 2);
    EXPECT_EQ(items[1].depth, 1);

    // the input stays untouched and no staging file is left behind
    EXPECT_TRUE(load_outline(sample_).empty());
    unsigned int files = 0;
    for (boost::filesystem::directory_iterator it(dir_), end; it != end; ++it) {
        ++files;
    }
    EXPECT_EQ(files, 2U);
}

TEST_F(PdfUtilsTest, ReplaceOutlineInPlace) {
    TocForest forest = sample_outline();
    forest.emplace_back("Appendix", 1, 3);
    ASSERT_TRUE(write_pdf_outline(sample_, forest, sample_));

    std::vector<LoadedOutlineItem> items = load_outline(sample_);
    ASSERT_EQ(items.size(), 3U);
    EXPECT_EQ(items[2].title, "Appendix");
    EXPECT_EQ(items[2].depth, 0);
    EXPECT_EQ(count_pdf_pages(sample_).value_or(0), 3U);

    // writing again replaces the outline instead of appending to it
    ASSERT_TRUE(write_pdf_outline(sample_, sample_outline(), sample_));
    EXPECT_EQ(load_outline(sample_).size(), 2U);
}

TEST_F(PdfUtilsTest, ShallowerEntryClimbsSeveralLevels) {
    TocForest forest;
    forest.emplace_back("Chapter 1", 1, 1);
    forest.back().children.emplace_back("Section 1.1", 2, 1);
    forest.back().children.back().children.emplace_back("Topic 1.1.1", 3, 2);
    forest.back().children.back().children.back().children.emplace_back("Detail", 4, 2);
    forest.back().children.emplace_back("Section 1.2", 2, 2);
    forest.emplace_back("Chapter 2", 1, 3);
    forest.back().children.emplace_back("Section 2.1", 2, 3);

    std::string output = (dir_ / "deep.pdf").string();
    ASSERT_TRUE(write_pdf_outline(sample_, forest, output));

    std::vector<LoadedOutlineItem> items = load_outline(output);
    ASSERT_EQ(items.size(), 7U);
    const char* titles[] = {"Chapter 1", "Section 1.1", "Topic 1.1.1", "Detail", "Section 1.2", "Chapter 2", "Section 2.1"};
    const int depths[] = {0, 1, 2, 3, 1, 0, 1};
    const int pages[] = {0, 0, 1, 1, 1, 2, 2};
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(items[i].title, titles[i]);
        EXPECT_EQ(items[i].depth, depths[i]) << titles[i];
        EXPECT_EQ(items[i].page, pages[i]) << titles[i];
    }
}
