#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "outline.hpp"

std::string UnicodeToUTF8(unsigned int codepoint);

// Decodes UTF-8, malformed sequences become U+FFFD.
std::u32string to_code_points(const std::string& s);

bool is_unicode_space(char32_t c);

// decimal digit in any script (general category Nd)
bool is_unicode_digit(char32_t c);

// strips Unicode whitespace (NBSP, ideographic space, ...) from both ends
std::string trim_copy(const std::string& s);

// number of whitespace separated tokens
unsigned int count_words(const std::string& s);

// number of code points in a UTF-8 string
unsigned int utf8_length(const std::string& s);

// true when the text has at least one upper case letter and no lower or title case one,
// in any script
bool is_all_upper(const std::string& s);

// "ABCDEF+Helvetica-Bold" -> "Helvetica-Bold"
std::string strip_font_subset_prefix(const std::string& font_name);

// format of `extraction_timestamp`, e.g. 2025-01-31T08:15:00Z
std::string utc_timestamp_now();

nlohmann::ordered_json outline_to_json(const PDF_Outline_Result& result, bool include_telemetry);

nlohmann::ordered_json sections_to_json(const std::vector<PDF_Section_Content>& sections);

std::string format_pdf_outline(const PDF_Outline_Result& result, bool include_telemetry);

std::string format_pdf_sections(const std::vector<PDF_Section_Content>& sections);
