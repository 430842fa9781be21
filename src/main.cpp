#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include "batch_processor.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "logging.hpp"
#include "pdf_utils.hpp"
#include "string_utils.hpp"

int main(int argc, char* argv[]) {
    Application_Config config;
    try {
        config = parse_command_line(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage(argv[0]);
        return 2;
    }

    try {
        set_log_severity_threshold(config.log_level);

        switch (config.mode) {
            case Application_Config::MODE::HELP:
                std::cout << usage(argv[0]);
                return EXIT_SUCCESS;

            case Application_Config::MODE::SINGLE_FILE: {
                PDF_Outline_Result result = extract_pdf_outline(config.pdf_path, config.outline);
                if (config.outline.group_sections && !result.failed()) {
                    nlohmann::ordered_json json_output = outline_to_json(result, config.outline.include_telemetry);
                    json_output["sections"] = sections_to_json(result.sections);
                    std::cout << json_output.dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << std::endl;
                } else {
                    std::cout << format_pdf_outline(result, config.outline.include_telemetry) << std::endl;
                }
                return result.failed() ? EXIT_FAILURE : EXIT_SUCCESS;
            }

            case Application_Config::MODE::BATCH: {
                Batch_Summary summary = process_pdf_directory(config.input_dir, config.output_dir, config.outline, config.workers);
                return summary.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
            }

            case Application_Config::MODE::SERVE:
                run_http_server(config.address, config.port, config.http_workers, config.outline);
                LOG_INFO << "Server stopped";
                return EXIT_SUCCESS;
        }
    } catch (const std::exception& e) {
        LOG_FATAL << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
