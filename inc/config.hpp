#pragma once

#include <string>

#include <boost/log/trivial.hpp>

#include "outline.hpp"

#ifndef OUTLINE_DEFAULT_INPUT_DIR
#define OUTLINE_DEFAULT_INPUT_DIR "input"
#endif

#ifndef OUTLINE_DEFAULT_OUTPUT_DIR
#define OUTLINE_DEFAULT_OUTPUT_DIR "output"
#endif

struct Application_Config {
    enum class MODE {SINGLE_FILE, BATCH, SERVE, HELP};

    MODE mode = MODE::HELP;
    Outline_Config outline;

    // SINGLE_FILE
    std::string pdf_path;

    // BATCH
    std::string input_dir = OUTLINE_DEFAULT_INPUT_DIR;
    std::string output_dir = OUTLINE_DEFAULT_OUTPUT_DIR;
    unsigned int workers = 1;

    // SERVE
    std::string address;
    unsigned short port = 0;
    unsigned int http_workers = 1;

    boost::log::trivial::severity_level log_level = boost::log::trivial::info;
};

/*
 * pdf_outline [options] <file.pdf>
 * pdf_outline [options] --batch <input_dir> <output_dir>
 * pdf_outline [options] --serve <address> <port> <number_of_workers>
 *
 * Throws std::invalid_argument on unknown options, missing operands or bad numbers.
 */
Application_Config parse_command_line(int argc, const char* const argv[]);

std::string usage(const std::string& program_name);
