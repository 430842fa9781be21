#include "batch_processor.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "pdf_utils.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace {

std::vector<boost::filesystem::path> list_pdf_files(const boost::filesystem::path& dir) {
    std::vector<boost::filesystem::path> pdf_files;
    for (const boost::filesystem::directory_entry& entry : boost::filesystem::directory_iterator(dir)) {
        if (boost::filesystem::is_regular_file(entry.status()) && entry.path().extension() == ".pdf") {
            pdf_files.push_back(entry.path());
        }
    }
    std::sort(pdf_files.begin(), pdf_files.end());
    return pdf_files;
}

bool write_text_file(const boost::filesystem::path& path, const std::string& content) {
    std::ofstream out(path.string(), std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
        return false;
    }
    out << content;
    out.close();
    return !out.fail();
}

}

std::vector<Batch_Job> collect_batch_jobs(const boost::filesystem::path& input_dir,
                                          const boost::filesystem::path& output_dir) {
    if (!boost::filesystem::is_directory(input_dir)) {
        throw std::runtime_error("Input directory does not exist: " + input_dir.string());
    }

    std::vector<Batch_Job> jobs;
    // "docs/" and "docs/." both name the folder "docs"
    boost::filesystem::path normalized = boost::filesystem::absolute(input_dir).lexically_normal();
    boost::filesystem::path input_name = normalized.filename();
    if (input_name == "." || input_name.empty()) {
        input_name = normalized.parent_path().filename();
    }
    if (input_name.empty() || input_name == "/") {
        input_name = OUTLINE_DEFAULT_INPUT_DIR;
    }

    std::vector<boost::filesystem::path> direct_pdfs = list_pdf_files(input_dir);
    if (!direct_pdfs.empty()) {
        LOG_CHANNEL_INFO("batch") << "Found " << direct_pdfs.size() << " PDFs directly in " << input_dir.string();
    }
    for (const boost::filesystem::path& pdf_path : direct_pdfs) {
        jobs.push_back(Batch_Job{pdf_path, output_dir / input_name});
    }

    std::vector<boost::filesystem::path> subfolders;
    for (const boost::filesystem::directory_entry& entry : boost::filesystem::directory_iterator(input_dir)) {
        if (boost::filesystem::is_directory(entry.status())) {
            subfolders.push_back(entry.path());
        }
    }
    std::sort(subfolders.begin(), subfolders.end());

    for (const boost::filesystem::path& folder : subfolders) {
        std::vector<boost::filesystem::path> pdf_files = list_pdf_files(folder);
        if (pdf_files.empty()) {
            LOG_CHANNEL_INFO("batch") << "No PDFs found in folder: " << folder.filename().string();
            continue;
        }
        LOG_CHANNEL_INFO("batch") << "Found " << pdf_files.size() << " PDFs in folder: " << folder.filename().string();
        for (const boost::filesystem::path& pdf_path : pdf_files) {
            jobs.push_back(Batch_Job{pdf_path, output_dir / folder.filename()});
        }
    }

    return jobs;
}

boost::filesystem::path outline_output_path(const Batch_Job& job) {
    return job.output_dir / (job.pdf_path.stem().string() + "_outline.json");
}

boost::filesystem::path sections_output_path(const Batch_Job& job) {
    return job.output_dir / (job.pdf_path.stem().string() + "_sections.json");
}

bool write_outline_files(const Batch_Job& job, const PDF_Outline_Result& result, const Outline_Config& config) {
    boost::system::error_code ec;
    boost::filesystem::create_directories(job.output_dir, ec);
    if (ec) {
        LOG_CHANNEL_ERROR("batch") << "Cannot create " << job.output_dir.string() << ": " << ec.message();
        return false;
    }

    boost::filesystem::path outline_path = outline_output_path(job);
    if (!write_text_file(outline_path, format_pdf_outline(result, config.include_telemetry))) {
        LOG_CHANNEL_ERROR("batch") << "Cannot write " << outline_path.string();
        return false;
    }
    LOG_CHANNEL_INFO("batch") << "Saved outline to " << outline_path.string();

    if (config.group_sections && !result.failed()) {
        boost::filesystem::path sections_path = sections_output_path(job);
        if (!write_text_file(sections_path, format_pdf_sections(result.sections))) {
            LOG_CHANNEL_ERROR("batch") << "Cannot write " << sections_path.string();
            return false;
        }
        LOG_CHANNEL_DEBUG("batch") << "Saved sections to " << sections_path.string();
    }
    return true;
}

Batch_Summary process_pdf_directory(const boost::filesystem::path& input_dir,
                                    const boost::filesystem::path& output_dir,
                                    const Outline_Config& config,
                                    unsigned int workers) {
    LOG_CHANNEL_INFO("batch") << "Input directory: " << boost::filesystem::absolute(input_dir).string();
    LOG_CHANNEL_INFO("batch") << "Output directory: " << boost::filesystem::absolute(output_dir).string();

    std::vector<Batch_Job> jobs = collect_batch_jobs(input_dir, output_dir);
    if (jobs.empty()) {
        LOG_CHANNEL_WARNING("batch") << "No PDF files found in " << input_dir.string();
    }

    std::atomic<unsigned int> written{0};
    std::atomic<unsigned int> failed{0};

    auto run_job = [&config, &written, &failed](const Batch_Job& job) {
        try {
            PDF_Outline_Result result = extract_pdf_outline(job.pdf_path.string(), config);
            if (result.failed()) {
                LOG_CHANNEL_ERROR("batch") << "Error processing " << job.pdf_path.filename().string() << ": " << result.error;
                ++failed;
            }
            // the error variant is still written so every input has an output file
            if (write_outline_files(job, result, config)) {
                ++written;
            } else if (!result.failed()) {
                ++failed;
            }
        } catch (const std::exception& e) {
            LOG_CHANNEL_ERROR("batch") << "Error processing " << job.pdf_path.filename().string() << ": " << e.what();
            ++failed;
        }
    };

    if (workers <= 1 || jobs.size() <= 1) {
        for (const Batch_Job& job : jobs) {
            run_job(job);
        }
    } else {
        boost::asio::thread_pool pool(std::min<size_t>(workers, jobs.size()));
        for (const Batch_Job& job : jobs) {
            boost::asio::post(pool, [&run_job, &job]() { run_job(job); });
        }
        pool.join();
    }

    Batch_Summary summary;
    summary.found = static_cast<unsigned int>(jobs.size());
    summary.written = written;
    summary.failed = failed;
    LOG_CHANNEL_INFO("batch") << "All tasks completed: " << summary.found << " found, " << summary.written
                              << " written, " << summary.failed << " failed";
    return summary;
}
