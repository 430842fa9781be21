#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>

#include "pdf_utils.hpp"

namespace fs = boost::filesystem;

namespace {

std::string stream_object(const std::string& content) {
    return "<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content + "\nendstream";
}

// Objects are numbered from 1 in order; object 1 is the catalog, `info_object` the Info dictionary.
std::string make_pdf(const std::vector<std::string>& objects, size_t info_object) {
    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }

    size_t xref_offset = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
    pdf += "0000000000 65535 f \n";
    for (size_t offset : offsets) {
        char entry[32];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
        pdf += entry;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R /Info " +
           std::to_string(info_object) + " 0 R >>\n";
    pdf += "startxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";
    return pdf;
}

// Two pages: a 24pt title, an 18pt numbered heading, a body line switching from Helvetica to
// Helvetica-Bold mid line and a blank line on page 1; a 14pt heading and a line in a subset
// tagged font on page 2.
std::string sample_report_pdf() {
    const std::string page_one =
        "BT /F2 24 Tf 72 740 Td (Sample Report) Tj ET\n"
        "BT /F2 18 Tf 72 700 Td (1. Introduction) Tj ET\n"
        "BT /F1 12 Tf 72 670 Td (Body text ) Tj /F2 12 Tf (Bold) Tj ET\n"
        "BT /F1 12 Tf 72 600 Td (\\240\\240) Tj ET";
    const std::string page_two =
        "BT /F2 14 Tf 72 740 Td (2. Next Steps) Tj ET\n"
        "BT /F3 12 Tf 72 710 Td (Second page) Tj ET";

    std::vector<std::string> objects = {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R 4 0 R] /Count 2 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
        "/Resources << /Font << /F1 5 0 R /F2 6 0 R >> >> /Contents 8 0 R >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
        "/Resources << /Font << /F2 6 0 R /F3 7 0 R >> >> /Contents 9 0 R >>",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>",
        "<< /Type /Font /Subtype /Type1 /BaseFont /ABCDEF+Helvetica /Encoding /WinAnsiEncoding >>",
        stream_object(page_one),
        stream_object(page_two),
        "<< /Title (  Metadata Title ) /Producer (pdf_outline tests) >>",
    };
    return make_pdf(objects, 10);
}

}

class PdfExtractionTest : public ::testing::Test {
protected:
    fs::path root;
    fs::path pdf_path;

    void SetUp() override {
        root = fs::temp_directory_path() / fs::unique_path("pdf_outline_extract_%%%%-%%%%-%%%%");
        fs::create_directories(root);
        pdf_path = root / "sample_report.pdf";

        std::ofstream out(pdf_path.string(), std::ios::binary);
        out << sample_report_pdf();
    }

    void TearDown() override {
        boost::system::error_code ec;
        fs::remove_all(root, ec);
    }
};

TEST_F(PdfExtractionTest, SpansFollowRunsInReadingOrder) {
    std::string error_message;
    std::optional<PDF_Document> document = parse_pdf_file(pdf_path.string(), error_message);
    ASSERT_TRUE(document.has_value()) << error_message;

    const std::vector<PDF_Text_Span>& spans = document->spans;
    std::vector<std::string> texts;
    std::vector<unsigned int> pages;
    for (const PDF_Text_Span& span : spans) {
        texts.push_back(span.text);
        pages.push_back(span.page);
    }
    // the font switch splits the body line in two, the blank line gives no span
    EXPECT_EQ(texts, std::vector<std::string>({"Sample Report", "1. Introduction", "Body text", "Bold",
                                               "2. Next Steps", "Second page"}));
    ASSERT_EQ(pages, std::vector<unsigned int>({1, 1, 1, 1, 2, 2}));

    EXPECT_NEAR(spans[0].font_size, 24, 0.01);
    EXPECT_NEAR(spans[1].font_size, 18, 0.01);
    EXPECT_NEAR(spans[2].font_size, 12, 0.01);
    EXPECT_NEAR(spans[3].font_size, 12, 0.01);
    EXPECT_NEAR(spans[4].font_size, 14, 0.01);

    EXPECT_TRUE(boost::algorithm::icontains(spans[1].font_name, "bold")) << spans[1].font_name;
    EXPECT_FALSE(boost::algorithm::icontains(spans[2].font_name, "bold")) << spans[2].font_name;
    EXPECT_TRUE(boost::algorithm::icontains(spans[3].font_name, "bold")) << spans[3].font_name;
    for (const PDF_Text_Span& span : spans) {
        EXPECT_EQ(span.font_name.find('+'), std::string::npos) << span.font_name;
    }

    // y_pos is the top of the run: above the baseline, below baseline - size * 1.25
    const double heading_baseline = 792 - 700;
    EXPECT_LT(spans[1].y_pos, heading_baseline);
    EXPECT_GT(spans[1].y_pos, heading_baseline - 18 * 1.25);
    EXPECT_LT(spans[0].y_pos, spans[1].y_pos);
    EXPECT_LT(spans[1].y_pos, spans[2].y_pos);
    EXPECT_NEAR(spans[2].y_pos, spans[3].y_pos, 2.0) << "same line";
    EXPECT_LT(spans[4].y_pos, spans[5].y_pos);

    EXPECT_EQ(document->page_count, 2u);
    EXPECT_EQ(document->document_info.title, "Metadata Title");
}

TEST_F(PdfExtractionTest, PageLimitStopsAfterFirstPages) {
    std::string error_message;
    std::optional<PDF_Document> document = parse_pdf_file(pdf_path.string(), error_message, 1);
    ASSERT_TRUE(document.has_value()) << error_message;

    ASSERT_EQ(document->spans.size(), 4u);
    for (const PDF_Text_Span& span : document->spans) {
        EXPECT_EQ(span.page, 1u) << span.text;
    }
    EXPECT_EQ(document->page_count, 2u) << "page count is the document's, not the limit";
}

TEST_F(PdfExtractionTest, OutlineOfSampleReport) {
    PDF_Outline_Result result = extract_pdf_outline(pdf_path.string(), Outline_Config());
    ASSERT_EQ(result.status, PDF_Outline_Result::STATUS::SUCCESS) << result.error;

    EXPECT_EQ(result.outline.title, "Sample Report");
    ASSERT_EQ(result.outline.headings.size(), 2u);
    EXPECT_EQ(result.outline.headings[0].text, "1. Introduction");
    EXPECT_EQ(result.outline.headings[0].level_label(), "H1");
    EXPECT_EQ(result.outline.headings[0].page, 1u);
    EXPECT_EQ(result.outline.headings[1].text, "2. Next Steps");
    EXPECT_EQ(result.outline.headings[1].level_label(), "H2");
    EXPECT_EQ(result.outline.headings[1].page, 2u);
    EXPECT_EQ(result.page_count, 2u);

    Outline_Config first_page_only;
    first_page_only.page_limit = 1;
    PDF_Outline_Result limited = extract_pdf_outline(pdf_path.string(), first_page_only);
    ASSERT_EQ(limited.outline.headings.size(), 1u);
    EXPECT_EQ(limited.outline.headings[0].text, "1. Introduction");
}

TEST_F(PdfExtractionTest, MissingFileIsAnOpenFailure) {
    std::string error_message;
    EXPECT_FALSE(parse_pdf_file((root / "missing.pdf").string(), error_message).has_value());
    EXPECT_FALSE(error_message.empty());

    PDF_Outline_Result result = extract_pdf_outline((root / "missing.pdf").string(), Outline_Config());
    EXPECT_EQ(result.status, PDF_Outline_Result::STATUS::OPEN_FAILURE);
    EXPECT_EQ(result.error.rfind("Could not open PDF: ", 0), 0u);
}
