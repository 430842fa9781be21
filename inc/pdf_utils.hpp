#pragma once

#include <string>
#include <optional>
#include <vector>

#include <mupdf/fitz.h>

#include "outline.hpp"

#ifndef PDF_METADATA_MAX_LENGTH
#define PDF_METADATA_MAX_LENGTH 1024
#endif

struct PDF_Document {
    PDF_Document_Info document_info;
    std::vector<PDF_Text_Span> spans;
    unsigned int page_count = 0;
};

/*
 * Reads every page (or the first `page_limit` ones, 0 meaning all) into styled text spans:
 * one span per run of characters sharing font and size inside a structured-text line, in
 * page -> block -> line -> run order. Runs that are blank after trimming are skipped.
 */
// return nullopt if cant read pdf document, reason is left in error_message
std::optional<PDF_Document> parse_pdf_file(const std::string& file_path,
                                           std::string& error_message,
                                           unsigned int page_limit = 0);

// Never throws, a document that can't be read yields an OPEN_FAILURE result.
PDF_Outline_Result extract_pdf_outline(const std::string& file_path, const Outline_Config& config);
