#include "string_utils.hpp"

#include <cstdint>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

std::string UnicodeToUTF8(unsigned int codepoint)
{
    std::string out;

    if (codepoint <= 0x7f) {
        out.append(1, static_cast<char>(codepoint));
    } else if (codepoint <= 0x7ff) {
        out.append(1, static_cast<char>(0xc0 | ((codepoint >> 6) & 0x1f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    } else if (codepoint <= 0xffff) {
        out.append(1, static_cast<char>(0xe0 | ((codepoint >> 12) & 0x0f)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 6) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    } else {
        out.append(1, static_cast<char>(0xf0 | ((codepoint >> 18) & 0x07)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 12) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 6) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    }
    return out;
}

std::u32string to_code_points(const std::string& s)
{
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t length = static_cast<int32_t>(s.size());
    int32_t i = 0;

    std::u32string code_points;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        code_points.push_back(c < 0 ? U'\ufffd' : static_cast<char32_t>(c));
    }
    return code_points;
}

bool is_unicode_space(char32_t c)
{
    // White_Space plus the ASCII separators 0x1c-0x1f, which text extraction treats as blanks
    return (c >= 0x1c && c <= 0x1f) || u_isUWhiteSpace(static_cast<UChar32>(c));
}

bool is_unicode_digit(char32_t c)
{
    return u_isdigit(static_cast<UChar32>(c));
}

std::string trim_copy(const std::string& s)
{
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t length = static_cast<int32_t>(s.size());
    int32_t i = 0;
    int32_t begin = -1;
    int32_t end = 0;

    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0 || !is_unicode_space(static_cast<char32_t>(c))) {
            if (begin < 0) {
                begin = start;
            }
            end = i;
        }
    }

    if (begin < 0) {
        return std::string();
    }
    return s.substr(static_cast<size_t>(begin), static_cast<size_t>(end - begin));
}

unsigned int count_words(const std::string& s)
{
    unsigned int count = 0;
    bool in_word = false;
    for (char32_t c : to_code_points(s)) {
        if (is_unicode_space(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}

unsigned int utf8_length(const std::string& s)
{
    return static_cast<unsigned int>(to_code_points(s).size());
}

bool is_all_upper(const std::string& s)
{
    bool has_cased = false;
    for (char32_t code_point : to_code_points(s)) {
        UChar32 c = static_cast<UChar32>(code_point);
        if (u_isULowercase(c) || u_istitle(c)) {
            return false;
        }
        if (u_isUUppercase(c)) {
            has_cased = true;
        }
    }
    return has_cased;
}

std::string strip_font_subset_prefix(const std::string& font_name)
{
    size_t pos = font_name.find('+');
    if (pos == std::string::npos) {
        return font_name;
    }
    return font_name.substr(pos + 1);
}

std::string utc_timestamp_now()
{
    boost::posix_time::ptime now = boost::posix_time::second_clock::universal_time();
    return boost::posix_time::to_iso_extended_string(now) + "Z";
}

nlohmann::ordered_json outline_to_json(const PDF_Outline_Result& result, bool include_telemetry)
{
    nlohmann::ordered_json json_pdf_outline;

    if (result.failed()) {
        json_pdf_outline["title"] = "";
        json_pdf_outline["outline"] = nlohmann::ordered_json::array();
        json_pdf_outline["error"] = result.error;
        return json_pdf_outline;
    }

    json_pdf_outline["title"] = result.outline.title;
    json_pdf_outline["outline"] = nlohmann::ordered_json::array();
    for (const PDF_Heading& heading : result.outline.headings) {
        nlohmann::ordered_json json_pdf_heading;
        json_pdf_heading["level"] = heading.level_label();
        json_pdf_heading["text"] = heading.text;
        json_pdf_heading["page"] = heading.page;
        json_pdf_outline["outline"].push_back(json_pdf_heading);
    }

    if (include_telemetry) {
        json_pdf_outline["extraction_timestamp"] = utc_timestamp_now();
        json_pdf_outline["total_headings"] = result.outline.headings.size();
        json_pdf_outline["page_count"] = result.page_count;
    }

    return json_pdf_outline;
}

nlohmann::ordered_json sections_to_json(const std::vector<PDF_Section_Content>& sections)
{
    nlohmann::ordered_json json_pdf_sections = nlohmann::ordered_json::array();
    for (const PDF_Section_Content& section : sections) {
        nlohmann::ordered_json json_pdf_section;
        json_pdf_section["heading_text"] = section.heading_text;
        json_pdf_section["heading_level"] = section.heading_level;
        json_pdf_section["page"] = section.page;
        json_pdf_section["content"] = section.content;
        json_pdf_sections.push_back(json_pdf_section);
    }
    return json_pdf_sections;
}

std::string format_pdf_outline(const PDF_Outline_Result& result, bool include_telemetry)
{
    // invalid UTF-8 coming out of a broken font is replaced instead of throwing
    return outline_to_json(result, include_telemetry).dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string format_pdf_sections(const std::vector<PDF_Section_Content>& sections)
{
    return sections_to_json(sections).dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}
