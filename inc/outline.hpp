#pragma once

#include <optional>
#include <string>
#include <vector>

#ifndef OUTLINE_OVERSIZED_WEIGHT
#define OUTLINE_OVERSIZED_WEIGHT 2
#endif

#ifndef OUTLINE_BOLD_WEIGHT
#define OUTLINE_BOLD_WEIGHT 1
#endif

#ifndef OUTLINE_NUMBERED_PREFIX_WEIGHT
#define OUTLINE_NUMBERED_PREFIX_WEIGHT 5
#endif

#ifndef OUTLINE_SHORT_TEXT_WEIGHT
#define OUTLINE_SHORT_TEXT_WEIGHT 1
#endif

#ifndef OUTLINE_ALL_CAPS_WEIGHT
#define OUTLINE_ALL_CAPS_WEIGHT 1
#endif

#ifndef OUTLINE_SCORE_THRESHOLD
#define OUTLINE_SCORE_THRESHOLD 4
#endif

#ifndef OUTLINE_SIZE_DELTA
#define OUTLINE_SIZE_DELTA 1.0
#endif

#ifndef OUTLINE_SHORT_TEXT_WORD_LIMIT
#define OUTLINE_SHORT_TEXT_WORD_LIMIT 15
#endif

#ifndef OUTLINE_ALL_CAPS_MIN_LENGTH
#define OUTLINE_ALL_CAPS_MIN_LENGTH 2
#endif

#ifndef OUTLINE_BODY_SIZE_CEILING
#define OUTLINE_BODY_SIZE_CEILING 20.0
#endif

#ifndef OUTLINE_DEFAULT_BODY_SIZE
#define OUTLINE_DEFAULT_BODY_SIZE 12.0
#endif

#ifndef OUTLINE_MAX_LEVELS
#define OUTLINE_MAX_LEVELS 3
#endif

#ifndef OUTLINE_DEFAULT_TITLE
#define OUTLINE_DEFAULT_TITLE "Untitled"
#endif

// Heuristic constants and per-run switches. The defaults reproduce the tuned baseline,
// every stage below takes the config explicitly so it can be exercised in isolation.
struct Outline_Config {
    int oversized_weight = OUTLINE_OVERSIZED_WEIGHT;
    int bold_weight = OUTLINE_BOLD_WEIGHT;
    int numbered_prefix_weight = OUTLINE_NUMBERED_PREFIX_WEIGHT;
    int short_text_weight = OUTLINE_SHORT_TEXT_WEIGHT;
    int all_caps_weight = OUTLINE_ALL_CAPS_WEIGHT;
    int score_threshold = OUTLINE_SCORE_THRESHOLD;

    double size_delta = OUTLINE_SIZE_DELTA;
    unsigned int short_text_word_limit = OUTLINE_SHORT_TEXT_WORD_LIMIT;
    unsigned int all_caps_min_length = OUTLINE_ALL_CAPS_MIN_LENGTH;
    double body_size_ceiling = OUTLINE_BODY_SIZE_CEILING;
    double default_body_size = OUTLINE_DEFAULT_BODY_SIZE;
    unsigned int max_levels = OUTLINE_MAX_LEVELS;
    std::string default_title = OUTLINE_DEFAULT_TITLE;

    // 0 means all pages
    unsigned int page_limit = 0;
    bool group_sections = false;
    bool include_telemetry = false;
    bool use_metadata_title = false;
};

struct PDF_Text_Span {
    std::string text;
    double font_size = 0;
    std::string font_name;
    unsigned int page = 0;  // 1-based
    double y_pos = 0;
};

struct PDF_Heading_Candidate {
    const PDF_Text_Span* span;
    int score;
};

struct PDF_Heading {
    unsigned int level;  // 1 == H1
    std::string text;
    unsigned int page;
    double y_pos;
    double font_size;

    std::string level_label() const;
};

struct PDF_Title_Info {
    std::string text;
    unsigned int page = 1;
};

struct PDF_Section_Content {
    std::string heading_text;
    std::string heading_level;
    unsigned int page;
    std::string content;
};

struct PDF_Outline {
    std::string title;
    std::vector<PDF_Heading> headings;
};

// metadata read from the PDF Info dictionary
struct PDF_Document_Info {
    std::string title;
};

struct PDF_Outline_Result {
    enum class STATUS {SUCCESS, NO_HEADINGS_FOUND, EMPTY_DOCUMENT, OPEN_FAILURE};

    STATUS status = STATUS::SUCCESS;
    PDF_Outline outline;
    std::vector<PDF_Section_Content> sections;
    std::string error;
    PDF_Document_Info document_info;
    unsigned int page_count = 0;  // pages in the file, not only the ones read

    bool failed() const { return status == STATUS::OPEN_FAILURE; }
};

const char* status_name(PDF_Outline_Result::STATUS status);

double estimate_body_font_size(const std::vector<PDF_Text_Span>& spans, const Outline_Config& config);

// first span on page 1 carrying the page's largest font size
std::optional<PDF_Title_Info> select_title(const std::vector<PDF_Text_Span>& spans);

bool has_numbered_prefix(const std::string& text);

int score_span(const PDF_Text_Span& span, double body_size, const Outline_Config& config);

/*
 * Scores every span against the heading rubric and keeps the ones reaching the threshold.
 * A span matching the title by text on page 1 is never a candidate.
 * Returned candidates point into `spans`, which must outlive them.
 */
std::vector<PDF_Heading_Candidate> score_heading_candidates(const std::vector<PDF_Text_Span>& spans,
                                                            double body_size,
                                                            const std::optional<PDF_Title_Info>& title,
                                                            const Outline_Config& config);

/*
 * Maps the largest `max_levels` distinct candidate font sizes to H1, H2, ... and drops the
 * rest. The result is in reading order, (page, y_pos) ascending, ties in extraction order.
 */
std::vector<PDF_Heading> classify_heading_levels(const std::vector<PDF_Heading_Candidate>& candidates,
                                                 const Outline_Config& config);

std::vector<PDF_Section_Content> group_text_into_sections(const std::vector<PDF_Text_Span>& spans,
                                                          const std::vector<PDF_Heading>& headings);

// Full pipeline over an already extracted span sequence. `fallback_title` replaces a missing
// heuristic title before the configured default does.
PDF_Outline build_outline(const std::vector<PDF_Text_Span>& spans,
                          const Outline_Config& config,
                          const std::optional<std::string>& fallback_title = std::nullopt);

// Classifies the outcome (empty document, no headings, success) and runs section grouping
// when the config asks for it.
PDF_Outline_Result make_outline_result(const std::vector<PDF_Text_Span>& spans,
                                       const PDF_Document_Info& document_info,
                                       const Outline_Config& config);

PDF_Outline_Result make_open_failure_result(const std::string& error_message);
