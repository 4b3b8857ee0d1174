#include "dsfetch/cancellation.hpp"
#include "dsfetch/config.hpp"
#include "dsfetch/curl_range_fetcher.hpp"
#include "dsfetch/detail/curl_utils.hpp"
#include "dsfetch/errors.hpp"
#include "dsfetch/logging.hpp"
#include "dsfetch/metadata_resolver.hpp"
#include "dsfetch/progress.hpp"
#include "dsfetch/transfer_orchestrator.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-f <keyword>] [-i] [-j <jobs>] [-c <config>] [-v|-q] <record-id-or-url>"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Download directory (default: ./Zenodo_<id>_<title>)\n"
              << "  -f <keyword>     Only download files whose name contains <keyword>\n"
              << "  -i               Match the filter keyword case-insensitively\n"
              << "  -j <jobs>        Files downloaded in parallel, 1-16 (default: 1)\n"
              << "  -c <config>      YAML configuration file\n"
              << "  -v               Verbose logging\n"
              << "  -q               Only log warnings and errors\n"
              << "  -h, --help       Show this message" << std::endl;
}

struct CliArgs {
    std::optional<std::filesystem::path> directory;
    std::string filter;
    bool ignore_case{false};
    std::optional<std::size_t> jobs;
    std::optional<std::filesystem::path> config_path;
    bool verbose{false};
    bool quiet{false};
    std::string record;
};

// Returns nullopt after printing usage; exit_code tells the caller what to return.
std::optional<CliArgs> parseArgs(int argc, char** argv, int& exit_code) {
    CliArgs args;
    int arg_index = 1;

    const auto needValue = [&](const std::string& option) -> const char* {
        if (arg_index + 1 >= argc) {
            std::cerr << "Missing value for " << option << std::endl;
            return nullptr;
        }
        return argv[arg_index + 1];
    };

    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = argv[arg_index];

        if (option == "-d" || option == "-f" || option == "-j" || option == "-c") {
            const char* value = needValue(option);
            if (!value) {
                printUsage(argv[0]);
                exit_code = kExitUsage;
                return std::nullopt;
            }
            if (option == "-d") {
                args.directory = value;
            } else if (option == "-f") {
                args.filter = value;
            } else if (option == "-c") {
                args.config_path = value;
            } else {
                int jobs = 0;
                try {
                    jobs = std::stoi(value);
                } catch (const std::exception&) {
                    throw dsfetch::ConfigError("Invalid job count: " + std::string(value));
                }
                if (jobs <= 0 || jobs > 16) {
                    throw dsfetch::ConfigError("Job count must be between 1 and 16.");
                }
                args.jobs = static_cast<std::size_t>(jobs);
            }
            arg_index += 2;
        } else if (option == "-i") {
            args.ignore_case = true;
            ++arg_index;
        } else if (option == "-v") {
            args.verbose = true;
            ++arg_index;
        } else if (option == "-q") {
            args.quiet = true;
            ++arg_index;
        } else if (option == "-h" || option == "--help") {
            printUsage(argv[0]);
            exit_code = EXIT_SUCCESS;
            return std::nullopt;
        } else {
            printUsage(argv[0]);
            exit_code = kExitUsage;
            return std::nullopt;
        }
    }

    if (argc - arg_index != 1) {
        printUsage(argv[0]);
        exit_code = kExitUsage;
        return std::nullopt;
    }
    args.record = argv[arg_index];
    return args;
}

void printSummary(const dsfetch::RunSummary& summary) {
    for (const auto& outcome : summary.outcomes) {
        if (outcome.kind == dsfetch::OutcomeKind::Skipped && outcome.reason == "filtered") {
            continue;
        }
        if (outcome.reason.empty()) {
            fmt::print("  {:<10} {} ({})\n", dsfetch::toString(outcome.kind), outcome.filename,
                       dsfetch::formatSize(outcome.bytes_written));
        } else {
            fmt::print("  {:<10} {}: {}\n", dsfetch::toString(outcome.kind), outcome.filename,
                       outcome.reason);
        }
    }
    fmt::print("Completed: {}  Skipped: {}  Failed: {}\n",
               summary.completed, summary.skipped, summary.failed);
}

} // namespace

int main(int argc, char** argv) {
    try {
        int exit_code = EXIT_SUCCESS;
        const auto args = parseArgs(argc, argv, exit_code);
        if (!args) {
            return exit_code;
        }

        dsfetch::setupLogging({args->verbose, args->quiet});
        dsfetch::detail::ensureCurlInitialized();

        dsfetch::TransferConfig config;
        if (args->config_path) {
            config = dsfetch::loadConfigFile(*args->config_path);
        } else if (const auto found = dsfetch::findConfigFile()) {
            spdlog::debug("Using config file {}", found->string());
            config = dsfetch::loadConfigFile(*found);
        }
        if (args->jobs) {
            config.jobs = *args->jobs;
        }
        if (args->ignore_case) {
            config.ignore_case = true;
        }

        const auto record_id = dsfetch::parseRecordId(args->record);
        if (!record_id) {
            spdlog::error("Cannot identify a record id in '{}'", args->record);
            return kExitUsage;
        }
        spdlog::info("Detected record id: {}", *record_id);

        // Outlives the signal watcher thread.
        static dsfetch::CancellationToken token;
        dsfetch::installSignalHandlers(token);
        dsfetch::CancellableSleeper sleeper;

        dsfetch::ZenodoResolver resolver(config, sleeper, token);
        const dsfetch::RecordMetadata record = resolver.resolve(*record_id);
        spdlog::info("Record '{}' lists {} files", record.title, record.files.size());

        dsfetch::RunOptions options;
        options.destination = args->directory
            ? *args->directory
            : std::filesystem::current_path() / dsfetch::outputDirectoryName(record.record_id, record.title);
        options.filter_keyword = args->filter;
        options.ignore_case = config.ignore_case;
        options.jobs = config.jobs;
        spdlog::info("Download directory: {}", options.destination.string());

        dsfetch::LogProgressObserver progress;
        dsfetch::CurlRangeFetcher fetcher(config);
        dsfetch::TransferOrchestrator orchestrator(fetcher, sleeper, token, config, options, &progress);

        const dsfetch::RunSummary summary = orchestrator.run(record.files);
        printSummary(summary);

        if (summary.cancelled) {
            spdlog::warn("Interrupted. Run again to resume.");
            return kExitCancelled;
        }
        if (summary.hasFailures()) {
            return kExitFailure;
        }
        if (summary.completed == 0) {
            spdlog::warn("No matching files found.");
        }
        return EXIT_SUCCESS;
    } catch (const dsfetch::ConfigError& ex) {
        spdlog::error("Configuration error: {}", ex.what());
        return kExitUsage;
    } catch (const std::exception& ex) {
        spdlog::error("Fatal error: {}", ex.what());
        return kExitFailure;
    }
}
