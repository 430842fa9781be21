#pragma once

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "outline.hpp"

struct Batch_Job {
    boost::filesystem::path pdf_path;
    boost::filesystem::path output_dir;
};

struct Batch_Summary {
    unsigned int found = 0;
    unsigned int written = 0;
    unsigned int failed = 0;  // unreadable PDFs plus output files that could not be written
};

/*
 * PDFs directly inside `input_dir` are written to `output_dir/<input_dir name>/`, PDFs in
 * each immediate subdirectory to `output_dir/<subdirectory name>/`. Jobs come out sorted
 * by path. Throws std::runtime_error when `input_dir` is not a directory.
 */
std::vector<Batch_Job> collect_batch_jobs(const boost::filesystem::path& input_dir,
                                          const boost::filesystem::path& output_dir);

// `<stem>_outline.json`, and `<stem>_sections.json` when sections are grouped
boost::filesystem::path outline_output_path(const Batch_Job& job);
boost::filesystem::path sections_output_path(const Batch_Job& job);

// Writes the outline (and sections) of one document, returns false if a file can't be written.
bool write_outline_files(const Batch_Job& job, const PDF_Outline_Result& result, const Outline_Config& config);

// Runs every job, `workers` documents at a time. One failing document never stops the others.
Batch_Summary process_pdf_directory(const boost::filesystem::path& input_dir,
                                    const boost::filesystem::path& output_dir,
                                    const Outline_Config& config,
                                    unsigned int workers);
