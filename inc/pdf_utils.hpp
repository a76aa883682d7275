#pragma once

#include <optional>
#include <string>
#include <vector>

#include <mupdf/fitz.h>

#include "toc_types.hpp"

// font name fragments that mark a bold face when the font flags do not
#ifndef PDFTOC_BOLD_NAME_MARKERS
#define PDFTOC_BOLD_NAME_MARKERS {"Bold", "Black", "Heavy", "Semibold", "SemiBold"}
#endif

#ifndef PDFTOC_PDF_WRITE_OPTIONS
#define PDFTOC_PDF_WRITE_OPTIONS "garbage=4,compress"
#endif

// Owns a MuPDF context and, once opened, its document.
struct PDF_Context {
    fz_context* ctx = nullptr;
    fz_document* doc = nullptr;
    int page_count = 0;

    PDF_Context();
    ~PDF_Context();

    // disable copy constructor and copy assignment (non-copyable)
    PDF_Context(PDF_Context const&) = delete;
    PDF_Context& operator=(PDF_Context const&) = delete;

    // false, after logging the MuPDF message, if the file cannot be read
    bool open(const std::string& file_path);

    void close();
};

struct PDF_Span_Document {
    unsigned int page_count = 0;
    std::vector<TextSpan> spans;   // by page, top to bottom within a page
};

// return nullopt if cant read pdf document
std::optional<PDF_Span_Document> extract_text_spans(const std::string& file_path);

std::optional<unsigned int> count_pdf_pages(const std::string& file_path);

/* Replaces the document outline of input_path by the forest and saves the
 * result to output_path (which may be input_path). The file is written
 * beside the target first and renamed over it, a failure leaves the target
 * untouched. Returns false after logging on any error. */
bool write_pdf_outline(const std::string& input_path, const TocForest& forest, const std::string& output_path);
