#include "outline.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <functional>
#include <set>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>

namespace {

// (page, y_pos) ordering shared by the classifier and the section grouper
bool precedes(unsigned int page_a, double y_a, unsigned int page_b, double y_b) {
    return page_a < page_b || (page_a == page_b && y_a < y_b);
}

}

std::string PDF_Heading::level_label() const {
    return "H" + std::to_string(level);
}

const char* status_name(PDF_Outline_Result::STATUS status) {
    switch (status) {
        case PDF_Outline_Result::STATUS::SUCCESS:
            return "success";
        case PDF_Outline_Result::STATUS::NO_HEADINGS_FOUND:
            return "no headings found";
        case PDF_Outline_Result::STATUS::EMPTY_DOCUMENT:
            return "empty document";
        case PDF_Outline_Result::STATUS::OPEN_FAILURE:
            return "open failure";
    }
    return "unknown";
}

double estimate_body_font_size(const std::vector<PDF_Text_Span>& spans, const Outline_Config& config) {
    if (spans.empty()) {
        return config.default_body_size;
    }

    std::vector<double> sizes;
    for (const PDF_Text_Span& span : spans) {
        if (span.font_size < config.body_size_ceiling) {
            sizes.push_back(span.font_size);
        }
    }
    if (sizes.empty()) { // every span is large, take them all
        for (const PDF_Text_Span& span : spans) {
            sizes.push_back(span.font_size);
        }
    }

    // counts kept in first-seen order so that ties go to the earliest size
    std::vector<std::pair<double, unsigned int>> size_counts;
    for (double size : sizes) {
        auto it = std::find_if(size_counts.begin(), size_counts.end(),
                               [size](const std::pair<double, unsigned int>& entry) { return entry.first == size; });
        if (it == size_counts.end()) {
            size_counts.emplace_back(size, 1);
        } else {
            ++it->second;
        }
    }

    auto mode = size_counts.begin();
    for (auto it = size_counts.begin(); it != size_counts.end(); ++it) {
        if (it->second > mode->second) {
            mode = it;
        }
    }
    return mode->first;
}

std::optional<PDF_Title_Info> select_title(const std::vector<PDF_Text_Span>& spans) {
    std::optional<double> largest = std::nullopt;
    for (const PDF_Text_Span& span : spans) {
        if (span.page == 1 && (!largest || span.font_size > largest.value())) {
            largest = span.font_size;
        }
    }
    if (!largest) {
        return std::nullopt;
    }

    for (const PDF_Text_Span& span : spans) {
        if (span.page == 1 && span.font_size == largest.value()) {
            PDF_Title_Info title;
            title.text = span.text;
            title.page = 1;
            return title;
        }
    }
    return std::nullopt;
}

bool has_numbered_prefix(const std::string& text) {
    // ^\s*(\d+(\.\d+)*\.?|[A-Z]\.)\s+ with Unicode whitespace and digits:
    // 1 / 1. / 1.2 / 1.2.3. / A. followed by whitespace
    std::u32string code_points = to_code_points(text);
    size_t n = code_points.size();
    size_t i = 0;

    while (i < n && is_unicode_space(code_points[i])) {
        ++i;
    }

    if (i < n && is_unicode_digit(code_points[i])) {
        while (i < n && is_unicode_digit(code_points[i])) {
            ++i;
        }
        while (i + 1 < n && code_points[i] == U'.' && is_unicode_digit(code_points[i + 1])) {
            ++i;
            while (i < n && is_unicode_digit(code_points[i])) {
                ++i;
            }
        }
        if (i < n && code_points[i] == U'.') {
            ++i;
        }
    } else if (i + 1 < n && code_points[i] >= U'A' && code_points[i] <= U'Z' && code_points[i + 1] == U'.') {
        i += 2;
    } else {
        return false;
    }

    return i < n && is_unicode_space(code_points[i]);
}

int score_span(const PDF_Text_Span& span, double body_size, const Outline_Config& config) {
    int score = 0;
    if (span.font_size > body_size + config.size_delta) {
        score += config.oversized_weight;
    }
    if (boost::algorithm::icontains(span.font_name, "bold")) {
        score += config.bold_weight;
    }
    if (has_numbered_prefix(span.text)) {
        score += config.numbered_prefix_weight;
    }
    if (count_words(span.text) < config.short_text_word_limit) {
        score += config.short_text_weight;
    }
    if (is_all_upper(span.text) && utf8_length(span.text) > config.all_caps_min_length) {
        score += config.all_caps_weight;
    }
    return score;
}

std::vector<PDF_Heading_Candidate> score_heading_candidates(const std::vector<PDF_Text_Span>& spans,
                                                            double body_size,
                                                            const std::optional<PDF_Title_Info>& title,
                                                            const Outline_Config& config) {
    std::vector<PDF_Heading_Candidate> candidates;
    for (const PDF_Text_Span& span : spans) {
        if (title && span.page == title->page && span.text == title->text) {
            continue;
        }

        int score = score_span(span, body_size, config);
        if (score >= config.score_threshold) {
            candidates.push_back(PDF_Heading_Candidate{&span, score});
        }
    }
    return candidates;
}

std::vector<PDF_Heading> classify_heading_levels(const std::vector<PDF_Heading_Candidate>& candidates,
                                                 const Outline_Config& config) {
    std::vector<double> level_sizes;
    for (const PDF_Heading_Candidate& candidate : candidates) {
        level_sizes.push_back(candidate.span->font_size);
    }
    std::sort(level_sizes.begin(), level_sizes.end(), std::greater<double>());
    level_sizes.erase(std::unique(level_sizes.begin(), level_sizes.end()), level_sizes.end());
    if (level_sizes.size() > config.max_levels) {
        level_sizes.resize(config.max_levels);
    }

    std::vector<PDF_Heading> headings;
    for (const PDF_Heading_Candidate& candidate : candidates) {
        auto it = std::find(level_sizes.begin(), level_sizes.end(), candidate.span->font_size);
        if (it == level_sizes.end()) { // below the last level
            continue;
        }

        PDF_Heading heading;
        heading.level = static_cast<unsigned int>(it - level_sizes.begin()) + 1;
        heading.text = candidate.span->text;
        heading.page = candidate.span->page;
        heading.y_pos = candidate.span->y_pos;
        heading.font_size = candidate.span->font_size;
        headings.push_back(std::move(heading));
    }

    std::stable_sort(headings.begin(), headings.end(), [](const PDF_Heading& a, const PDF_Heading& b) {
        return precedes(a.page, a.y_pos, b.page, b.y_pos);
    });
    return headings;
}

std::vector<PDF_Section_Content> group_text_into_sections(const std::vector<PDF_Text_Span>& spans,
                                                          const std::vector<PDF_Heading>& headings) {
    std::vector<PDF_Section_Content> sections;
    if (headings.empty()) {
        return sections;
    }

    std::set<std::pair<std::string, unsigned int>> heading_keys;
    for (const PDF_Heading& heading : headings) {
        heading_keys.emplace(heading.text, heading.page);
    }

    std::vector<std::string> contents(headings.size());
    for (const PDF_Text_Span& span : spans) {
        if (heading_keys.count(std::make_pair(span.text, span.page)) > 0) {
            continue;
        }

        // first heading at or after the span, the owning section is the one before it
        auto next = std::lower_bound(headings.begin(), headings.end(), span,
                                     [](const PDF_Heading& heading, const PDF_Text_Span& s) {
                                         return precedes(heading.page, heading.y_pos, s.page, s.y_pos);
                                     });
        if (next == headings.begin()) {
            continue;
        }
        if (next != headings.end() && !precedes(span.page, span.y_pos, next->page, next->y_pos)) {
            continue; // same position as the next heading
        }

        contents[static_cast<size_t>(next - headings.begin()) - 1] += span.text + "\n";
    }

    for (size_t i = 0; i < headings.size(); ++i) {
        PDF_Section_Content section;
        section.heading_text = headings[i].text;
        section.heading_level = headings[i].level_label();
        section.page = headings[i].page;
        section.content = trim_copy(contents[i]);
        sections.push_back(std::move(section));
    }
    return sections;
}

PDF_Outline build_outline(const std::vector<PDF_Text_Span>& spans,
                          const Outline_Config& config,
                          const std::optional<std::string>& fallback_title) {
    PDF_Outline outline;
    if (spans.empty()) {
        return outline;
    }

    double body_size = estimate_body_font_size(spans, config);
    std::optional<PDF_Title_Info> title = select_title(spans);
    std::vector<PDF_Heading_Candidate> candidates = score_heading_candidates(spans, body_size, title, config);
    outline.headings = classify_heading_levels(candidates, config);

    if (title) {
        outline.title = title->text;
    } else if (fallback_title && !fallback_title->empty()) {
        outline.title = fallback_title.value();
    } else {
        outline.title = config.default_title;
    }

    LOG_CHANNEL_DEBUG("outline") << "Body size " << body_size << ", " << spans.size() << " spans, "
                                 << candidates.size() << " candidates, " << outline.headings.size() << " headings";
    return outline;
}

PDF_Outline_Result make_outline_result(const std::vector<PDF_Text_Span>& spans,
                                       const PDF_Document_Info& document_info,
                                       const Outline_Config& config) {
    PDF_Outline_Result result;
    result.document_info = document_info;

    if (spans.empty()) {
        result.status = PDF_Outline_Result::STATUS::EMPTY_DOCUMENT;
        return result;
    }

    std::optional<std::string> fallback_title = std::nullopt;
    if (config.use_metadata_title && !document_info.title.empty()) {
        fallback_title = document_info.title;
    }

    result.outline = build_outline(spans, config, fallback_title);
    result.status = result.outline.headings.empty() ? PDF_Outline_Result::STATUS::NO_HEADINGS_FOUND
                                                    : PDF_Outline_Result::STATUS::SUCCESS;

    if (config.group_sections) {
        result.sections = group_text_into_sections(spans, result.outline.headings);
    }
    return result;
}

PDF_Outline_Result make_open_failure_result(const std::string& error_message) {
    PDF_Outline_Result result;
    result.status = PDF_Outline_Result::STATUS::OPEN_FAILURE;
    result.error = "Could not open PDF: " + error_message;
    return result;
}
