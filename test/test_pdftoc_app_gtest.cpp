#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/log/core/core.hpp>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "logging.hpp"
#include "pdf_fixture.hpp"
#include "pdftoc_app.hpp"
#include "toc_text.hpp"

class PdftocAppTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir_ = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("pdftoc-app-%%%%-%%%%");
        boost::filesystem::create_directories(dir_);
        sample_ = (dir_ / "sample.pdf").string();
        default_output_ = (dir_ / "sample_toc.pdf").string();
        ASSERT_TRUE(write_sample_pdf(sample_));
        options_.input = sample_;
    }

    void TearDown() override {
        boost::system::error_code ec;
        boost::filesystem::remove_all(dir_, ec);
    }

    std::string write_toc_file(const std::string& text) {
        std::string path = (dir_ / "toc.txt").string();
        boost::filesystem::ofstream file(path, std::ios::out | std::ios::binary);
        file << text;
        return path;
    }

    int run(const std::string& editor_command = "true") {
        out_.str("");
        err_.str("");
        return run_pdftoc(options_, editor_command, out_, err_);
    }

    boost::filesystem::path dir_;
    std::string sample_;
    std::string default_output_;
    PDFTOC_Options options_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST(FindEntryBeyondTest, SearchesNestedEntries) {
    TocForest forest;
    forest.emplace_back("Chapter 1", 1, 1);
    forest.back().children.emplace_back("Section 1.1", 2, 2);
    forest.back().children.back().children.emplace_back("Too Far", 3, 5);
    forest.emplace_back("Chapter 2", 1, 3);

    const TocEntry* entry = find_entry_beyond(forest, 3);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->title, "Too Far");
    EXPECT_EQ(find_entry_beyond(forest, 5), nullptr);
    EXPECT_EQ(find_entry_beyond(TocForest(), 0), nullptr);
}

TEST_F(PdftocAppTest, DetectedOutlineIsWritten) {
    EXPECT_EQ(run(), EXIT_SUCCESS);
    EXPECT_TRUE(boost::filesystem::exists(default_output_));
    EXPECT_NE(out_.str().find("Wrote 2 bookmarks -> " + default_output_), std::string::npos);
}

TEST_F(PdftocAppTest, WrittenOutlineIsLogged) {
    std::ostringstream log;
    std::streambuf* console = std::clog.rdbuf(log.rdbuf());
    init_logging(boost::log::trivial::info);
    int status = run();
    boost::log::core::get()->remove_all_sinks();
    std::clog.rdbuf(console);

    EXPECT_EQ(status, EXIT_SUCCESS);
    EXPECT_NE(log.str().find("Outline of " + sample_ + " written to " + default_output_), std::string::npos);
}

TEST_F(PdftocAppTest, PreviewWritesNoFile) {
    options_.preview = true;
    EXPECT_EQ(run(), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "Chapter 1  (p. 1)\n  Section 1.1  (p. 3)\n");
    EXPECT_FALSE(boost::filesystem::exists(default_output_));
}

TEST_F(PdftocAppTest, ImportedTocIsWritten) {
    options_.toc_file = write_toc_file("Intro  (p. 1)\n  Details  (p. 2)\nEnd  (p. 3)\n");
    EXPECT_EQ(run(), EXIT_SUCCESS);
    EXPECT_TRUE(boost::filesystem::exists(default_output_));
    EXPECT_NE(out_.str().find("Wrote 3 bookmarks"), std::string::npos);
}

TEST_F(PdftocAppTest, PageBeyondDocumentIsRejected) {
    options_.toc_file = write_toc_file("Chapter 1  (p. 1)\n  Late Section  (p. 9)\n");
    EXPECT_EQ(run(), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("page 9"), std::string::npos);
    EXPECT_NE(err_.str().find("Late Section"), std::string::npos);
    EXPECT_FALSE(boost::filesystem::exists(default_output_));
}

TEST_F(PdftocAppTest, EmptyTocFileIsAnError) {
    options_.toc_file = write_toc_file("\n   \n");
    EXPECT_EQ(run(), EXIT_FAILURE);
    EXPECT_FALSE(boost::filesystem::exists(default_output_));
}

TEST_F(PdftocAppTest, MalformedTocFileThrows) {
    options_.toc_file = write_toc_file("Chapter 1  (p. one)\n");
    EXPECT_THROW(run(), TocParseError);
    EXPECT_FALSE(boost::filesystem::exists(default_output_));
}

TEST_F(PdftocAppTest, OutputOnInputNeedsReplace) {
    std::string before = read_text_file(sample_);
    options_.output = sample_;
    EXPECT_EQ(run(), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("--replace"), std::string::npos);
    EXPECT_EQ(read_text_file(sample_), before);

    options_.output.reset();
    options_.replace = true;
    EXPECT_EQ(run(), EXIT_SUCCESS);
    EXPECT_NE(read_text_file(sample_), before);
    EXPECT_FALSE(boost::filesystem::exists(default_output_));
}

TEST_F(PdftocAppTest, BlankedEditWritesNothing) {
    options_.edit = true;
    EXPECT_EQ(run("truncate -s 0"), EXIT_SUCCESS);
    EXPECT_NE(err_.str().find("Aborted"), std::string::npos);
    EXPECT_FALSE(boost::filesystem::exists(default_output_));
}

TEST_F(PdftocAppTest, UnchangedEditIsWritten) {
    options_.edit = true;
    EXPECT_EQ(run("true"), EXIT_SUCCESS);
    EXPECT_TRUE(boost::filesystem::exists(default_output_));
}

TEST_F(PdftocAppTest, MissingInputFails) {
    options_.input = (dir_ / "missing.pdf").string();
    EXPECT_EQ(run(), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("not found"), std::string::npos);
}
