#include "pdf_utils.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <vector>

namespace {

std::string lookup_metadata(fz_context* ctx, fz_document* doc, const char* key) {
    char buffer[PDF_METADATA_MAX_LENGTH];
    int length = -1;
    fz_var(length);

    fz_try(ctx) {
        length = fz_lookup_metadata(ctx, doc, key, buffer, sizeof(buffer));
    } fz_catch(ctx) {
        LOG_CHANNEL_DEBUG("pdf") << "cannot read metadata " << key << ": " << fz_caught_message(ctx);
        length = -1;
    }

    if (length <= 0) {
        return std::string();
    }
    return std::string(buffer);
}

PDF_Document_Info read_document_info(fz_context* ctx, fz_document* doc) {
    PDF_Document_Info document_info;
    document_info.title = trim_copy(lookup_metadata(ctx, doc, "info:Title"));
    return document_info;
}

float quad_top(const fz_quad& quad) {
    return std::min(quad.ul.y, quad.ur.y);
}

// Splits every structured-text line into runs of identical font and size.
void collect_page_spans(fz_context* ctx, fz_stext_page* text, unsigned int page, std::vector<PDF_Text_Span>& spans) {
    for (fz_stext_block* block = text->first_block; block; block = block->next) {
        if (block->type != FZ_STEXT_BLOCK_TEXT) { // image blocks do not have lines
            continue;
        }

        for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            std::string run_text;
            fz_font* run_font = nullptr;
            float run_size = 0;
            float run_top = 0;
            bool in_run = false;

            auto flush_run = [&]() {
                std::string trimmed_string = trim_copy(run_text);
                if (in_run && !trimmed_string.empty()) {
                    PDF_Text_Span span;
                    span.text = std::move(trimmed_string);
                    span.font_size = run_size;
                    span.font_name = strip_font_subset_prefix(run_font ? fz_font_name(ctx, run_font) : "");
                    span.page = page;
                    span.y_pos = run_top;
                    spans.push_back(std::move(span));
                }
                run_text.clear();
                in_run = false;
            };

            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                if (in_run && (ch->font != run_font || ch->size != run_size)) {
                    flush_run();
                }

                if (!in_run) {
                    run_font = ch->font;
                    run_size = ch->size;
                    run_top = quad_top(ch->quad);
                    in_run = true;
                }

                if (ch->c >= 0) {
                    run_text += UnicodeToUTF8(static_cast<unsigned int>(ch->c));
                }
                run_top = std::min(run_top, quad_top(ch->quad));
            }

            flush_run();
        }
    }
}

}

std::optional<PDF_Document> parse_pdf_file(const std::string& file_path,
                                           std::string& error_message,
                                           unsigned int page_limit) {
    PDF_Document pdf_document;
    int page_number, page_count = 0;
    fz_context* ctx = nullptr;
    fz_document* doc = nullptr;
    fz_var(doc);
    fz_var(page_count);

    /* Create a context to hold the exception stack and various caches. */
    ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
    if (!ctx) {
        error_message = "cannot create mupdf context";
        return std::nullopt;
    }

    /* Register the default file types to handle. */
    fz_try(ctx) {
        fz_register_document_handlers(ctx);
    } fz_catch(ctx) {
        error_message = std::string("cannot register document handlers: ") + fz_caught_message(ctx);
        fz_drop_context(ctx);
        return std::nullopt;
    }

    /* Open the document. */
    fz_try(ctx) {
        doc = fz_open_document(ctx, file_path.c_str());
    } fz_catch(ctx) {
        error_message = std::string("cannot open document: ") + fz_caught_message(ctx);
        fz_drop_context(ctx);
        return std::nullopt;
    }

    /* Count the number of pages. */
    fz_try(ctx) {
        page_count = fz_count_pages(ctx, doc);
    } fz_catch(ctx) {
        error_message = std::string("cannot count number of pages: ") + fz_caught_message(ctx);
        fz_drop_document(ctx, doc);
        fz_drop_context(ctx);
        return std::nullopt;
    }

    pdf_document.document_info = read_document_info(ctx, doc);
    pdf_document.page_count = static_cast<unsigned int>(page_count);

    if (page_limit > 0 && static_cast<unsigned int>(page_count) > page_limit) {
        page_count = static_cast<int>(page_limit);
    }

    fz_stext_options stext_options = {};
    stext_options.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE | FZ_STEXT_MEDIABOX_CLIP;

    for (page_number = 0; page_number < page_count; ++page_number) {
        fz_page* page = nullptr;
        fz_device* dev = nullptr;
        fz_stext_page* text = nullptr;
        bool page_failed = false;
        fz_var(page);
        fz_var(dev);
        fz_var(text);
        fz_var(page_failed);

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_number);
            fz_rect mediabox = fz_bound_page(ctx, page);
            text = fz_new_stext_page(ctx, mediabox);
            dev = fz_new_stext_device(ctx, text, &stext_options);
            fz_run_page(ctx, page, dev, fz_identity, nullptr);
            fz_close_device(ctx, dev);
        } fz_always(ctx) {
            fz_drop_device(ctx, dev);
            fz_drop_page(ctx, page);
        } fz_catch(ctx) {
            error_message = "render page " + std::to_string(page_number + 1) + " error: " + fz_caught_message(ctx);
            page_failed = true;
        }

        if (page_failed) {
            fz_drop_stext_page(ctx, text);
            fz_drop_document(ctx, doc);
            fz_drop_context(ctx);
            return std::nullopt;
        }

        try {
            collect_page_spans(ctx, text, static_cast<unsigned int>(page_number + 1), pdf_document.spans);
        } catch (...) {
            // release the MuPDF objects, the caller reports the error
            fz_drop_stext_page(ctx, text);
            fz_drop_document(ctx, doc);
            fz_drop_context(ctx);
            throw;
        }
        fz_drop_stext_page(ctx, text);
    }

    LOG_CHANNEL_DEBUG("pdf") << file_path << ": " << page_count << " page(s) read, " << pdf_document.spans.size() << " spans";

    /* Clean up. */
    fz_drop_document(ctx, doc);
    fz_drop_context(ctx);
    return pdf_document;
}

PDF_Outline_Result extract_pdf_outline(const std::string& file_path, const Outline_Config& config) {
    try {
        std::string error_message;
        std::optional<PDF_Document> pdf_document = parse_pdf_file(file_path, error_message, config.page_limit);
        if (!pdf_document) {
            LOG_CHANNEL_WARNING("pdf") << "Cannot read " << file_path << ": " << error_message;
            return make_open_failure_result(error_message);
        }

        PDF_Outline_Result result = make_outline_result(pdf_document->spans, pdf_document->document_info, config);
        result.page_count = pdf_document->page_count;
        LOG_CHANNEL_INFO("pdf") << file_path << ": " << status_name(result.status) << ", "
                                << result.outline.headings.size() << " heading(s)";
        return result;
    } catch (const std::exception& e) {
        LOG_CHANNEL_ERROR("pdf") << "Outline extraction failed for " << file_path << ": " << e.what();
        return make_open_failure_result(e.what());
    }
}
