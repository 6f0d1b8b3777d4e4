/**
 * @file cas_put.cpp
 * @brief CLI tool to store data under its content address
 *
 * Usage:
 *   cas_put [options] <dest_path> [input_file|-]
 *
 * Example:
 *   cas_put objects/a2b71d6ee8997eb87b25ab42d566c44f6a32871752c7c73eb5578cb1182f7be0 payload.bin
 *
 * Exit codes:
 *   0  destination created, or it already existed
 *   1  content mismatch or I/O failure (staging file removed)
 *   2  usage or configuration error
 *   3  another writer is staging the same destination
 */

#include "casfile/ContentAddressableFile.h"
#include "casfile/Debug.h"
#include "casfile/WriterOptions.h"
#include "casfile/config.h"

#include <cerrno>
#include <csignal>
#include <signal.h>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace CasFile;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CONFLICT = 3;

// Global flag for cancellation
volatile std::sig_atomic_t g_running = 1;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <dest_path> [input_file|-]\n";
    std::cout << "\nArguments:\n";
    std::cout << "  dest_path   Destination; its file name is the expected digest (hex)\n";
    std::cout << "  input_file  File to read, or - for stdin (default)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config FILE       Load writer options from a JSON file\n";
    std::cout << "  --suffix S          Staging suffix (default " << DEFAULT_TEMP_SUFFIX << ")\n";
    std::cout << "  --algorithm NAME    Digest algorithm (default " << DEFAULT_DIGEST_ALGORITHM << ")\n";
    std::cout << "  --verbose           Debug logging\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "\nSIGINT/SIGTERM interrupt a pending read and discard the staging file.\n";
}

// No SA_RESTART, so a read blocked on a pipe or terminal returns on the signal
void installSignalHandlers() {
    struct sigaction action{};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

struct Arguments {
    std::string configPath;
    std::string suffix;
    std::string algorithm;
    std::string destPath;
    std::string inputPath = "-";
    bool verbose = false;
    bool help = false;
};

bool parseArguments(int argc, char* argv[], Arguments& args, std::string& errorMsg) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto takeValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                errorMsg = "Missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--config") {
            if (!takeValue(args.configPath)) return false;
        } else if (arg == "--suffix") {
            if (!takeValue(args.suffix)) return false;
        } else if (arg == "--algorithm") {
            if (!takeValue(args.algorithm)) return false;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            errorMsg = "Unknown option: " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (args.help) {
        return true;
    }
    if (positional.empty() || positional.size() > 2) {
        errorMsg = "Expected <dest_path> [input_file|-]";
        return false;
    }
    args.destPath = positional[0];
    if (positional.size() == 2) {
        args.inputPath = positional[1];
    }
    return true;
}

void logStatus(const std::string& what, const Status& status) {
    LOG_ERROR(what << ": [" << status.code << "] " << status.message);
}

int discard(ContentAddressableFile& writer, int exitCode) {
    const Status status = writer.close();
    if (!status.ok()) {
        logStatus("Failed to remove staging file", status);
    }
    return exitCode;
}

}  // namespace

int main(int argc, char* argv[]) {
    Arguments args;
    std::string errorMsg;
    if (!parseArguments(argc, argv, args, errorMsg)) {
        std::cerr << "Error: " << errorMsg << "\n\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }
    if (args.help) {
        printUsage(argv[0]);
        return EXIT_OK;
    }
    g_logDebugEnabled = args.verbose;

    WriterOptions options;
    Status status;
    if (!args.configPath.empty()) {
        if (!WriterOptions::loadFromFile(args.configPath, options, status)) {
            logStatus("Invalid configuration", status);
            return EXIT_USAGE;
        }
        LOG_DEBUG("Loaded options from " << args.configPath << ": " << options.toJson().dump());
    }
    if (!args.suffix.empty()) {
        options.tempSuffix = args.suffix;
    }
    if (!args.algorithm.empty()) {
        options.digestAlgorithm = args.algorithm;
    }

    installSignalHandlers();

    std::ifstream file;
    std::istream* in = &std::cin;
    if (args.inputPath != "-") {
        file.open(args.inputPath, std::ios::binary);
        if (!file) {
            LOG_ERROR("Cannot open input: " << args.inputPath << ": " << std::strerror(errno));
            return EXIT_FAILED;
        }
        in = &file;
    }

    auto writer = ContentAddressableFile::open(args.destPath, options, status);
    if (!writer) {
        logStatus("Cannot stage " + args.destPath, status);
        if (status.kind == ErrorKind::Conflict) {
            return EXIT_CONFLICT;
        }
        if (status.kind == ErrorKind::InvalidArgument) {
            return EXIT_USAGE;
        }
        return EXIT_FAILED;
    }
    LOG_DEBUG("Staging " << writer->tempPath().string() << " (" << writer->digestAlgorithm() << ")");

    std::vector<char> buffer(BUFFER_SIZE);
    while (*in) {
        in->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in->gcount();
        if (!g_running) {
            // The read may have been cut short by the signal; this input is incomplete
            LOG_WARNING("Interrupted, discarding staging file");
            return discard(*writer, EXIT_FAILED);
        }
        if (got <= 0) {
            continue;
        }

        const size_t n = writer->write(reinterpret_cast<const uint8_t*>(buffer.data()),
                                       static_cast<size_t>(got), status);
        if (!status.ok()) {
            logStatus("Write failed after " + std::to_string(writer->bytesWritten()) + " bytes", status);
            return discard(*writer, EXIT_FAILED);
        }
        LOG_DEBUG("Wrote " << n << " bytes");
    }

    if (!g_running) {
        LOG_WARNING("Interrupted, discarding staging file");
        return discard(*writer, EXIT_FAILED);
    }

    if (in->bad()) {
        LOG_ERROR("Error reading input: " << args.inputPath);
        return discard(*writer, EXIT_FAILED);
    }

    const auto result = writer->accept();
    if (!result.status.ok()) {
        logStatus("Cannot publish " + args.destPath, result.status);
        return discard(*writer, EXIT_FAILED);
    }

    LOG_INFO((result.created ? "Created " : "Already present ") << writer->finalPath().string()
             << " (" << writer->bytesWritten() << " bytes)");
    std::cout << (result.created ? "created" : "exists") << "\n";
    return EXIT_OK;
}
