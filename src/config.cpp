#include "config.hpp"
#include "logging.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

unsigned long parse_unsigned(const std::string& value, const std::string& what) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid " + what + " '" + value + "'");
    }
    try {
        return std::stoul(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " out of range '" + value + "'");
    }
}

bool starts_with(const std::string& arg, const std::string& prefix) {
    return arg.rfind(prefix, 0) == 0;
}

}

Application_Config parse_command_line(int argc, const char* const argv[]) {
    Application_Config config;
    std::vector<std::string> operands;
    bool batch = false;
    bool serve = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            config.mode = Application_Config::MODE::HELP;
            return config;
        } else if (arg == "--batch") {
            batch = true;
        } else if (arg == "--serve") {
            serve = true;
        } else if (arg == "--sections") {
            config.outline.group_sections = true;
        } else if (arg == "--telemetry") {
            config.outline.include_telemetry = true;
        } else if (arg == "--metadata-title") {
            config.outline.use_metadata_title = true;
        } else if (starts_with(arg, "--pages=")) {
            config.outline.page_limit = static_cast<unsigned int>(parse_unsigned(arg.substr(std::string("--pages=").size()), "page limit"));
        } else if (starts_with(arg, "--workers=")) {
            config.workers = static_cast<unsigned int>(parse_unsigned(arg.substr(std::string("--workers=").size()), "number of workers"));
            if (config.workers == 0) {
                throw std::invalid_argument("number of workers must be at least 1");
            }
        } else if (starts_with(arg, "--log-level=")) {
            config.log_level = parse_log_severity(arg.substr(std::string("--log-level=").size()));
        } else if (starts_with(arg, "--")) {
            throw std::invalid_argument("unknown option '" + arg + "'");
        } else {
            operands.push_back(arg);
        }
    }

    if (batch && serve) {
        throw std::invalid_argument("--batch and --serve are mutually exclusive");
    }

    if (batch) {
        if (operands.size() > 2) {
            throw std::invalid_argument("--batch takes <input_dir> <output_dir>");
        }
        config.mode = Application_Config::MODE::BATCH;
        if (operands.size() > 0) {
            config.input_dir = operands[0];
        }
        if (operands.size() > 1) {
            config.output_dir = operands[1];
        }
    } else if (serve) {
        if (operands.size() != 3) {
            throw std::invalid_argument("--serve takes <address> <port> <number_of_workers>");
        }
        config.mode = Application_Config::MODE::SERVE;
        config.address = operands[0];
        unsigned long port = parse_unsigned(operands[1], "port");
        if (port == 0 || port > 65535) {
            throw std::invalid_argument("port out of range '" + operands[1] + "'");
        }
        config.port = static_cast<unsigned short>(port);
        config.http_workers = static_cast<unsigned int>(parse_unsigned(operands[2], "number of workers"));
        if (config.http_workers == 0) {
            throw std::invalid_argument("number of workers must be at least 1");
        }
    } else if (operands.size() == 1) {
        config.mode = Application_Config::MODE::SINGLE_FILE;
        config.pdf_path = operands[0];
    } else if (operands.empty()) {
        config.mode = Application_Config::MODE::HELP;
    } else {
        throw std::invalid_argument("expected a single PDF file");
    }

    return config;
}

std::string usage(const std::string& program_name) {
    std::ostringstream os;
    os << "Usage: " << program_name << " [options] <file.pdf>\n"
       << "       " << program_name << " [options] --batch [<input_dir> [<output_dir>]]\n"
       << "       " << program_name << " [options] --serve <address> <port> <number_of_workers>\n"
       << "  For IPv4, try:\n"
       << "    " << program_name << " --serve 0.0.0.0 8080 4\n"
       << "Options:\n"
       << "  --pages=N          only read the first N pages\n"
       << "  --workers=N        documents processed in parallel in batch mode\n"
       << "  --sections         also write <stem>_sections.json with the text under each heading\n"
       << "  --telemetry        add extraction_timestamp and total_headings to the outline\n"
       << "  --metadata-title   use the PDF Title entry when no title can be derived\n"
       << "  --log-level=LEVEL  trace, debug, info, warning, error or fatal\n";
    return os.str();
}
