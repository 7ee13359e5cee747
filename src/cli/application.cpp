#include "cli/application.hpp"

#include "packaging/package.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

constexpr int kExitError = 1;
constexpr int kExitComponentsFailed = 2;

enum class Command {
    Pack,
    Unpack,
    Verify,
    Help
};

struct Options {
    Command command {Command::Help};
    std::filesystem::path input;
    std::filesystem::path output;
    auraseal::packaging::BuildOptions build {};
    auraseal::assembly::AssemblyOptions assembly {};
    auraseal::utils::LogLevel logLevel {auraseal::utils::LogLevel::Info};
};

void printUsage()
{
    std::cout << "Usage:\n"
              << "  auraseal pack -i <source_dir> -o <package_dir> [--parity <m>] [--part-size <n>] [-t <n>]\n"
              << "  auraseal unpack -i <package_dir> -o <dest_dir> [--min-coherence <x>] [--attempts <n>]\n"
              << "                  [--timeout-ms <n>] [-t <n>]\n"
              << "  auraseal verify -i <package_dir> [--min-coherence <x>] [--attempts <n>] [--timeout-ms <n>] [-t <n>]\n"
              << "  auraseal help\n"
              << "\n"
              << "Global flags:\n"
              << "  -v, --verbose   log part-level events\n"
              << "  -q, --quiet     log errors only\n"
              << "\n"
              << "Notes:\n"
              << "  - pack turns every file below the source directory into one component.\n"
              << "  - Components with at least two data parts get --parity parity parts (default 1).\n"
              << "  - unpack and verify exit with 2 when any component could not be assembled.\n";
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

Command parseCommand(const std::string& argument)
{
    const auto lowered = toLower(argument);
    if (lowered == "pack") {
        return Command::Pack;
    }
    if (lowered == "unpack") {
        return Command::Unpack;
    }
    if (lowered == "verify") {
        return Command::Verify;
    }
    if (lowered == "help" || lowered == "--help" || lowered == "-h") {
        return Command::Help;
    }
    throw std::invalid_argument("Unknown command: " + argument);
}

std::size_t parseCount(const std::string& value, const std::string& what)
{
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || value.front() == '-') {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + what + ": " + value);
    }
}

double parseRatio(const std::string& value, const std::string& what)
{
    double parsed = 0.0;
    try {
        std::size_t consumed = 0;
        parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + what + ": " + value);
    }
    if (!(parsed >= 0.0 && parsed <= 1.0)) {
        throw std::invalid_argument(what + " must lie within [0, 1]: " + value);
    }
    return parsed;
}

Options parseOptions(int argc, char** argv)
{
    Options options {};

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    options.command = parseCommand(argv[1]);
    if (options.command == Command::Help) {
        return options;
    }

    for (int index = 2; index < argc; ++index) {
        const std::string argument = argv[index];
        const bool hasValue = index + 1 < argc;

        if ((argument == "--input" || argument == "-i") && hasValue) {
            options.input = std::filesystem::path(argv[++index]);
        } else if ((argument == "--output" || argument == "-o") && hasValue) {
            options.output = std::filesystem::path(argv[++index]);
        } else if ((argument == "--threads" || argument == "-t") && hasValue) {
            const auto threads = parseCount(argv[++index], "thread count");
            options.build.threadCount = threads;
            options.assembly.threadCount = threads;
        } else if (argument == "--parity" && hasValue) {
            options.build.parityCount = parseCount(argv[++index], "parity count");
        } else if (argument == "--part-size" && hasValue) {
            options.build.maxPartSize = parseCount(argv[++index], "part size");
        } else if (argument == "--min-coherence" && hasValue) {
            options.assembly.minCoherence = parseRatio(argv[++index], "minimum coherence");
        } else if (argument == "--attempts" && hasValue) {
            options.assembly.maxFetchAttempts = parseCount(argv[++index], "attempt count");
        } else if (argument == "--timeout-ms" && hasValue) {
            options.assembly.partTimeout = std::chrono::milliseconds(parseCount(argv[++index], "timeout"));
        } else if (argument == "--verbose" || argument == "-v") {
            options.logLevel = auraseal::utils::LogLevel::Debug;
        } else if (argument == "--quiet" || argument == "-q") {
            options.logLevel = auraseal::utils::LogLevel::Error;
        } else if (argument == "--help" || argument == "-h") {
            options.command = Command::Help;
            return options;
        } else {
            throw std::invalid_argument("Unrecognized argument: " + argument);
        }
    }

    if (options.input.empty()) {
        throw std::invalid_argument("Missing required -i/--input argument");
    }
    if (options.output.empty() && options.command != Command::Verify) {
        throw std::invalid_argument("Missing required -o/--output argument");
    }
    if (options.assembly.maxFetchAttempts == 0U) {
        throw std::invalid_argument("--attempts must be at least 1");
    }
    return options;
}

void requireDirectory(const std::filesystem::path& path)
{
    if (!std::filesystem::is_directory(path)) {
        throw std::runtime_error("Input must be an existing directory: " + path.string());
    }
}

void printFailures(const auraseal::assembly::ComponentResult& result)
{
    std::cout << "  FAILED " << result.path << " [" << auraseal::assembly::toString(result.failure) << "] "
              << result.error << "\n";
}

int pack(const Options& options)
{
    requireDirectory(options.input);
    const auto manifest = auraseal::packaging::buildPackage(options.input, options.output, options.build);

    std::size_t parityParts = 0;
    for (const auto& record : manifest.records()) {
        parityParts += record.parity;
    }
    std::cout << "Packed " << manifest.size() << " components (" << parityParts << " parity parts) into "
              << options.output.string() << "\n";
    return 0;
}

int unpack(const Options& options)
{
    requireDirectory(options.input);
    const auto report = auraseal::packaging::installPackage(options.input, options.output, options.assembly);

    std::size_t recovered = 0;
    for (const auto& result : report.components) {
        recovered += result.recoveredParts;
        if (!result.ok()) {
            printFailures(result);
        }
    }
    std::cout << "Installed " << report.installed() << " of " << report.components.size() << " components ("
              << recovered << " parts recovered)\n";
    return report.ok() ? 0 : kExitComponentsFailed;
}

int verify(const Options& options)
{
    requireDirectory(options.input);
    const auto report = auraseal::packaging::verifyPackage(options.input, options.assembly);

    for (const auto& entry : report.components) {
        const auto& result = entry.result;
        if (!result.ok()) {
            printFailures(result);
        } else if (entry.hasParity && !entry.paritySetIntact) {
            std::cout << "  DEGRADED " << result.path << " parity set does not match its integrity record\n";
        } else {
            std::cout << "  OK " << result.path;
            if (result.recoveredParts > 0U) {
                std::cout << " (" << result.recoveredParts << " parts recovered)";
            }
            std::cout << "\n";
        }
    }
    std::cout << "Verified " << report.components.size() - report.failed() << " of " << report.components.size()
              << " components\n";
    return report.ok() ? 0 : kExitComponentsFailed;
}

} // namespace

namespace auraseal::cli {

int run(int argc, char** argv)
{
    try {
        const auto options = parseOptions(argc, argv);
        utils::Logger::instance().setLevel(options.logLevel);

        switch (options.command) {
        case Command::Pack:
            return pack(options);
        case Command::Unpack:
            return unpack(options);
        case Command::Verify:
            return verify(options);
        case Command::Help:
            printUsage();
            return 0;
        }

        printUsage();
        return kExitError;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}

} // namespace auraseal::cli
