#include "rangedl/config.hpp"
#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/downloader.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-t <threads>] [-o <file>] [-v] <url>"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -t, --threads <n>   Number of concurrent range requests (default: "
              << rangedl::kDefaultThreads << ")\n"
              << "  -o, --output <file> Output file name (default: last segment of the URL path)\n"
              << "  -v, --verbose       Print segment plan, progress and throughput\n"
              << "  -h, --help          Show this message" << std::endl;
}

std::size_t parseThreads(const std::string& text) {
    std::size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid thread count: " + text);
    }
    if (consumed != text.size() || text.front() == '-') {
        throw std::invalid_argument("Invalid thread count: " + text);
    }
    return static_cast<std::size_t>(value);
}
} // namespace

int main(int argc, char** argv) {
    rangedl::DownloadOptions options;
    int arg_index = 1;

    try {
        rangedl::detail::ensureCurlInitialized();

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-t" || option == "--threads") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                options.threads = parseThreads(argv[arg_index + 1]);
                arg_index += 2;
            } else if (option == "-o" || option == "--output") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                options.output = argv[arg_index + 1];
                arg_index += 2;
            } else if (option == "-v" || option == "--verbose") {
                options.verbose = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }

    if (argc - arg_index != 1) {
        printUsage(argv[0]);
        return 1;
    }
    options.url = argv[arg_index];

    try {
        rangedl::Downloader downloader(std::move(options));
        const std::string file_name = downloader.run();
        fmt::print("Downloaded successfully: {}\n", file_name);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
