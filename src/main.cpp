#include "chunkdl/download_engine.hpp"
#include "chunkdl/errors.hpp"
#include "chunkdl/progress_panel.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <url1> <file1> [<url2> <file2> ...]\n"
              << "       " << programName << " [options] -i <url1> [<url2> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -t <workers>     Chunks fetched in parallel per download (default: 4)\n"
              << "  -n <downloads>   Downloads running at the same time (default: 4)\n"
              << "  -j <threads>     Threads shared by all chunk transfers (default: 16)\n"
              << "  -r <retry>       Retries of a failed request (default: 2)\n"
              << "  -p <policy>      pipelined | fetch-then-write (default: pipelined)\n"
              << "  -i               Arguments are URLs only; file names come from the URL path\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseNumber(const std::string& option, const char* value, int min, int max) {
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
    if (parsed < min || parsed > max) {
        throw std::runtime_error("Value for " + option + " must be in [" + std::to_string(min) + ", " +
                                 std::to_string(max) + "]");
    }
    return parsed;
}

void printErrors(const std::vector<chunkdl::TaskResult>& results) {
    for (const auto& result : results) {
        if (result.ok()) {
            continue;
        }
        try {
            std::rethrow_exception(result.error);
        } catch (const chunkdl::DownloadError& ex) {
            std::cerr << result.task.url << ": " << chunkdl::toString(ex.kind()) << ": " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << result.task.url << ": " << ex.what() << std::endl;
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        spdlog::set_level(spdlog::level::warn);

        chunkdl::EngineOptions options;
        options.directory = std::filesystem::current_path();
        bool infer_names = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];
            const bool takes_value = option == "-d" || option == "-t" || option == "-n" || option == "-j" ||
                                     option == "-r" || option == "-p";
            if (takes_value && arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            if (option == "-d") {
                options.directory = argv[arg_index + 1];
                std::error_code ec;
                std::filesystem::create_directories(options.directory, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + options.directory.string() + " - " + ec.message());
                }
            } else if (option == "-t") {
                options.workers = static_cast<std::size_t>(parseNumber(option, argv[arg_index + 1], 1, 64));
            } else if (option == "-n") {
                options.max_active_tasks = static_cast<std::size_t>(parseNumber(option, argv[arg_index + 1], 1, 64));
            } else if (option == "-j") {
                options.pool_threads = static_cast<std::size_t>(parseNumber(option, argv[arg_index + 1], 1, 256));
            } else if (option == "-r") {
                options.retry = static_cast<std::uint32_t>(parseNumber(option, argv[arg_index + 1], 0, 100));
            } else if (option == "-p") {
                const auto policy = chunkdl::parseDownloadPolicy(argv[arg_index + 1]);
                if (!policy) {
                    throw std::runtime_error(std::string{"Unknown policy: "} + argv[arg_index + 1]);
                }
                options.policy = *policy;
            } else if (option == "-i") {
                infer_names = true;
            } else if (option == "-v") {
                spdlog::set_level(spdlog::level::debug);
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += takes_value ? 2 : 1;
        }

        const int remaining = argc - arg_index;
        if (remaining < 1 || (!infer_names && remaining % 2 != 0)) {
            printUsage(argv[0]);
            return 1;
        }

        std::vector<chunkdl::DownloadTask> tasks;
        for (int i = arg_index; i < argc; i += infer_names ? 1 : 2) {
            if (infer_names) {
                tasks.push_back(chunkdl::DownloadTask::fromUrl(argv[i]));
            } else {
                tasks.push_back(chunkdl::DownloadTask{argv[i], argv[i + 1]});
            }
        }

        chunkdl::DownloadEngine engine{options};
        std::atomic<bool> finished{false};
        std::exception_ptr failure;

        std::thread runner([&]() {
            try {
                engine.run(tasks);
            } catch (const std::exception&) {
                failure = std::current_exception();
            }
            finished.store(true);
        });

        chunkdl::ProgressPanel panel{std::cout};
        while (!finished.load()) {
            panel.draw(engine.progress());
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        runner.join();
        panel.draw(engine.progress());

        if (failure) {
            printErrors(engine.results());
            std::rethrow_exception(failure);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
