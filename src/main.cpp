#include "rangefetch/command_line.hpp"
#include "rangefetch/curl_http_client.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"
#include "rangefetch/progress.hpp"
#include "rangefetch/range_downloader.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    const std::string program_name = argc > 0 ? argv[0] : "rangefetch";

    try {
        const auto command_line = rangefetch::parseCommandLine(argc, argv);
        if (command_line.show_help) {
            std::cout << rangefetch::usage(program_name);
            return 0;
        }
        rangefetch::log::setLevel(command_line.log_level);

        rangefetch::CurlHttpClient http;
        rangefetch::ConsoleProgressReporter reporter;
        rangefetch::RangeDownloader downloader{command_line.options, http, reporter};

        const auto summary = downloader.run();
        if (summary.started && summary.failedWorkers() > 0) {
            rangefetch::log::warn("{} worker(s) failed; {} may be incomplete",
                                  summary.failedWorkers(), command_line.options.destination);
        }
    } catch (const rangefetch::CommandLineError& ex) {
        std::cerr << ex.what() << "\n" << rangefetch::usage(program_name);
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
