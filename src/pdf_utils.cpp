#include "pdf_utils.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <mupdf/pdf.h>

#include <algorithm>
#include <boost/filesystem.hpp>
#include <cstring>

PDF_Context::PDF_Context() {
    /* Create a context to hold the exception stack and various caches. */
    ctx = fz_new_context(nullptr, nullptr, FZ_STORE_UNLIMITED);
    if (!ctx) {
        LOG_CHANNEL_ERROR("pdf") << "cannot create mupdf context";
    }
}

PDF_Context::~PDF_Context() {
    close();
    if (ctx) {
        fz_drop_context(ctx);
    }
}

bool PDF_Context::open(const std::string& file_path) {
    if (!ctx) {
        return false;
    }
    close();

    /* Register the default file types to handle. */
    fz_try(ctx) {
        fz_register_document_handlers(ctx);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR("pdf") << "cannot register document handlers: " << fz_caught_message(ctx);
        return false;
    }

    /* Open the document. */
    fz_try(ctx) {
        doc = fz_open_document(ctx, file_path.c_str());
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR("pdf") << "cannot open document " << file_path << ": " << fz_caught_message(ctx);
        doc = nullptr;
        return false;
    }

    /* Accept documents encrypted with an empty user password only. */
    bool locked = false;
    fz_var(locked);
    fz_try(ctx) {
        locked = fz_needs_password(ctx, doc) && !fz_authenticate_password(ctx, doc, "");
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR("pdf") << "cannot check password of " << file_path << ": " << fz_caught_message(ctx);
        close();
        return false;
    }
    if (locked) {
        LOG_CHANNEL_ERROR("pdf") << "document " << file_path << " is password protected";
        close();
        return false;
    }

    /* Count the number of pages. */
    fz_try(ctx) {
        page_count = fz_count_pages(ctx, doc);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR("pdf") << "cannot count number of pages: " << fz_caught_message(ctx);
        close();
        return false;
    }

    return true;
}

void PDF_Context::close() {
    if (ctx && doc) {
        fz_drop_document(ctx, doc);
    }
    doc = nullptr;
    page_count = 0;
}

namespace {

bool is_bold_font(fz_context* ctx, fz_font* font) {
    if (!font) {
        return false;
    }
    if (fz_font_is_bold(ctx, font)) {
        return true;
    }
    const char* name = fz_font_name(ctx, font);
    if (!name) {
        return false;
    }
    for (const char* marker : PDFTOC_BOLD_NAME_MARKERS) {
        if (std::strstr(name, marker)) {
            return true;
        }
    }
    return false;
}

/* One span per run of characters sharing font and size inside a line. All
 * spans of a line take the line's top as their vertical position. */
void collect_page_spans(fz_context* ctx, fz_stext_page* text, unsigned int page, std::vector<TextSpan>& spans) {
    std::vector<TextSpan> page_spans;

    for (fz_stext_block* block = text->first_block; block; block = block->next) {
        if (block->type != FZ_STEXT_BLOCK_TEXT) { // only text blocks have lines, image blocks do not have lines
            continue;
        }

        for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            std::string run;
            fz_font* run_font = nullptr;
            float run_size = 0;

            auto flush_run = [&]() {
                if (count_non_whitespace(run) > 0) {
                    TextSpan span;
                    span.text = trim_copy(run);
                    span.font_size = run_size;
                    span.bold = is_bold_font(ctx, run_font);
                    span.page = page;
                    span.y = line->bbox.y0;
                    page_spans.push_back(std::move(span));
                }
                run.clear();
            };

            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                if (ch->font != run_font || ch->size != run_size) {
                    flush_run();
                    run_font = ch->font;
                    run_size = ch->size;
                }
                run += UnicodeToUTF8(ch->c);
            }
            flush_run();
        }
    }

    // content streams are not always written top to bottom
    std::stable_sort(page_spans.begin(), page_spans.end(), [](const TextSpan& a, const TextSpan& b) {
        return a.y < b.y;
    });
    spans.insert(spans.end(), page_spans.begin(), page_spans.end());
}

struct FlatOutlineEntry {
    std::string title;
    std::string uri;
    unsigned int depth;
};

void flatten_outline(const TocForest& entries, unsigned int depth, std::vector<FlatOutlineEntry>& flat) {
    for (const TocEntry& entry : entries) {
        flat.push_back({entry.title, "#page=" + std::to_string(entry.page), depth});
        flatten_outline(entry.children, depth + 1, flat);
    }
}

/* Drops the existing outline and inserts the entries in pre-order. The
 * iterator sits on the insertion point after each insert: a deeper entry
 * steps back onto the item just inserted and down into its children, a
 * shallower one climbs up and past the parent. */
bool replace_outline(fz_context* ctx, fz_document* doc, const std::vector<FlatOutlineEntry>& entries) {
    fz_outline_iterator* iter = nullptr;
    bool ok = true;
    fz_var(iter);

    fz_try(ctx) {
        iter = fz_new_outline_iterator(ctx, doc);
        while (fz_outline_iterator_item(ctx, iter)) {
            fz_outline_iterator_delete(ctx, iter);
        }

        unsigned int depth = 0;
        for (std::size_t i = 0; i < entries.size(); ++i) {
            const FlatOutlineEntry& entry = entries[i];
            if (entry.depth > depth) {
                fz_outline_iterator_prev(ctx, iter);
                fz_outline_iterator_down(ctx, iter);
                ++depth;
            }
            while (entry.depth < depth) {
                fz_outline_iterator_up(ctx, iter);
                fz_outline_iterator_next(ctx, iter);
                --depth;
            }

            fz_outline_item item;
            std::memset(&item, 0, sizeof(item));
            item.title = const_cast<char*>(entry.title.c_str());
            item.uri = const_cast<char*>(entry.uri.c_str());
            item.is_open = entry.depth == 0;
            fz_outline_iterator_insert(ctx, iter, &item);
        }
    } fz_always(ctx) {
        fz_drop_outline_iterator(ctx, iter);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR("pdf") << "cannot write outline: " << fz_caught_message(ctx);
        ok = false;
    }

    return ok;
}

}

std::optional<PDF_Span_Document> extract_text_spans(const std::string& file_path) {
    PDF_Context pdf;
    if (!pdf.open(file_path)) {
        return std::nullopt;
    }

    PDF_Span_Document span_document;
    span_document.page_count = static_cast<unsigned int>(pdf.page_count);

    fz_stext_options stext_options;
    std::memset(&stext_options, 0, sizeof(stext_options));
    stext_options.flags = FZ_STEXT_PRESERVE_WHITESPACE;

    for (int page_number = 0; page_number < pdf.page_count; ++page_number) {
        fz_stext_page* text = nullptr;
        fz_var(text);

        fz_try(pdf.ctx) {
            text = fz_new_stext_page_from_page_number(pdf.ctx, pdf.doc, page_number, &stext_options);
        } fz_catch(pdf.ctx) {
            LOG_CHANNEL_ERROR("pdf") << "cannot extract text of page " << page_number + 1 << ": " << fz_caught_message(pdf.ctx);
            return std::nullopt;
        }

        collect_page_spans(pdf.ctx, text, static_cast<unsigned int>(page_number + 1), span_document.spans);
        fz_drop_stext_page(pdf.ctx, text);
    }

    LOG_CHANNEL_DEBUG("pdf") << "Extracted " << span_document.spans.size() << " spans from "
                             << span_document.page_count << " pages of " << file_path;
    return span_document;
}

std::optional<unsigned int> count_pdf_pages(const std::string& file_path) {
    PDF_Context pdf;
    if (!pdf.open(file_path)) {
        return std::nullopt;
    }
    return static_cast<unsigned int>(pdf.page_count);
}

bool write_pdf_outline(const std::string& input_path, const TocForest& forest, const std::string& output_path) {
    std::vector<FlatOutlineEntry> entries;
    flatten_outline(forest, 0, entries);

    PDF_Context pdf;
    if (!pdf.open(input_path)) {
        return false;
    }

    pdf_document* pdf_doc = pdf_specifics(pdf.ctx, pdf.doc);
    if (!pdf_doc) {
        LOG_CHANNEL_ERROR("pdf") << input_path << " is not a PDF document";
        return false;
    }

    if (!replace_outline(pdf.ctx, pdf.doc, entries)) {
        return false;
    }

    boost::filesystem::path target(output_path);
    boost::filesystem::path staging = target.parent_path() / boost::filesystem::unique_path(".pdftoc-%%%%-%%%%.pdf");
    std::string staging_path = staging.string();
    bool saved = true;

    fz_try(pdf.ctx) {
        pdf_write_options write_options = pdf_default_write_options;
        pdf_parse_write_options(pdf.ctx, &write_options, PDFTOC_PDF_WRITE_OPTIONS);
        pdf_save_document(pdf.ctx, pdf_doc, staging_path.c_str(), &write_options);
    } fz_catch(pdf.ctx) {
        LOG_CHANNEL_ERROR("pdf") << "cannot save " << output_path << ": " << fz_caught_message(pdf.ctx);
        saved = false;
    }

    // the input may be the target, release it before the rename
    pdf.close();

    boost::system::error_code ec;
    if (saved) {
        boost::filesystem::rename(staging, target, ec);
        if (ec) {
            LOG_CHANNEL_ERROR("pdf") << "cannot move output into place at " << output_path << ": " << ec.message();
        }
    }
    if (!saved || ec) {
        boost::system::error_code remove_ec;
        boost::filesystem::remove(staging, remove_ec);
        return false;
    }

    LOG_CHANNEL_INFO("pdf") << "Wrote " << entries.size() << " outline entries to " << output_path;
    return true;
}
