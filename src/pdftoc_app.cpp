#include "pdftoc_app.hpp"
#include "editor_session.hpp"
#include "heading_detector.hpp"
#include "logging.hpp"
#include "pdf_utils.hpp"
#include "string_utils.hpp"
#include "toc_text.hpp"

#include <boost/filesystem.hpp>
#include <cstdlib>
#include <optional>
#include <utility>

const TocEntry* find_entry_beyond(const TocForest& forest, unsigned int page_count) {
    for (const TocEntry& entry : forest) {
        if (entry.page > page_count) {
            return &entry;
        }
        if (const TocEntry* child = find_entry_beyond(entry.children, page_count)) {
            return child;
        }
    }
    return nullptr;
}

int run_pdftoc(const PDFTOC_Options& options, const std::string& editor_command, std::ostream& out, std::ostream& err) {
    if (!boost::filesystem::exists(options.input)) {
        err << "Error: file not found: " << options.input << std::endl;
        return EXIT_FAILURE;
    }

    std::string output_path;
    if (!options.preview) {
        output_path = resolve_output_path(options);
        if (!options.replace && is_same_path(output_path, options.input)) {
            err << "Error: output " << output_path << " is the input file, pass --replace to overwrite it" << std::endl;
            return EXIT_FAILURE;
        }
    }

    TocForest toc;
    unsigned int page_count = 0;

    if (options.toc_file) {
        if (!boost::filesystem::exists(options.toc_file.value())) {
            err << "Error: TOC file not found: " << options.toc_file.value() << std::endl;
            return EXIT_FAILURE;
        }
        std::optional<unsigned int> pages = count_pdf_pages(options.input);
        if (!pages) {
            err << "Error: cannot read " << options.input << std::endl;
            return EXIT_FAILURE;
        }
        page_count = pages.value();

        std::optional<TocForest> imported = parse_toc(read_text_file(options.toc_file.value()));
        if (!imported) {
            err << "Error: TOC file is empty or contains no headings" << std::endl;
            return EXIT_FAILURE;
        }
        toc = std::move(imported.value());
    } else {
        std::optional<PDF_Span_Document> span_document = extract_text_spans(options.input);
        if (!span_document) {
            err << "Error: cannot read " << options.input << std::endl;
            return EXIT_FAILURE;
        }
        page_count = span_document->page_count;

        toc = detect_headings(span_document->spans, page_count, options.detection);
        if (toc.empty()) {
            err << "No headings detected." << std::endl;
            return EXIT_SUCCESS;
        }
    }

    if (options.preview) {
        if (options.preview_format == PDFTOC_Options::FORMAT::JSON) {
            out << format_toc_tree_json(toc) << std::endl;
        } else {
            write_toc_text(out, toc);
        }
        return EXIT_SUCCESS;
    }

    if (options.edit) {
        std::optional<TocForest> edited = parse_toc(edit_text_in_editor(serialize_toc(toc), editor_command));
        if (!edited) {
            err << "No headings after editing. Aborted." << std::endl;
            return EXIT_SUCCESS;
        }
        toc = std::move(edited.value());
    }

    if (const TocEntry* entry = find_entry_beyond(toc, page_count)) {
        err << "Error: page " << entry->page << " out of range (document has " << page_count
            << " pages): \"" << entry->title << "\"" << std::endl;
        return EXIT_FAILURE;
    }

    if (!write_pdf_outline(options.input, toc, output_path)) {
        err << "Error: cannot write " << output_path << std::endl;
        return EXIT_FAILURE;
    }

    LOG_INFO << "Outline of " << options.input << " written to " << output_path;
    out << "Wrote " << count_toc_entries(toc) << " bookmarks -> " << output_path << std::endl;
    return EXIT_SUCCESS;
}

