#include "chanarc/archive_driver.h"
#include "chanarc/archiver_config.h"
#include "chanarc/https_transport.h"
#include "chanarc/message_fetcher.h"
#include "chanarc/retry_policy.h"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace chanarc;

namespace {

std::atomic<bool> g_stop_requested(false);

void handleStopSignal(int) {
    g_stop_requested.store(true);
}

bool installSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handleStopSignal;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) != 0 ||
        sigaction(SIGTERM, &action, nullptr) != 0) {
        return false;
    }
    return true;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " --channel ID [options]\n"
              << "\n"
              << "Options:\n"
              << "  --token TOKEN      Authorization token (default: $CHANARC_TOKEN)\n"
              << "  --channel ID       Channel to archive\n"
              << "  --path FILE        Archive path (default: <channel>.zst)\n"
              << "  --batch N          Messages per request, 1-100 (default: 100)\n"
              << "  --level L          zstd level (default: 19)\n"
              << "  --skip-empty       Do not archive messages with empty content\n"
              << "  --help             Show this help\n";
}

/// @return 0 on success, 1 to exit cleanly (help), 2 on usage error
int parseArguments(int argc, char** argv, ArchiverConfig& config) {
    const char* env_token = std::getenv("CHANARC_TOKEN");
    if (env_token != nullptr) {
        config.token = env_token;
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 1;
        } else if (arg == "--skip-empty") {
            config.skip_empty_content = true;
            continue;
        }

        if (value == nullptr) {
            std::cerr << "Missing value for " << arg << std::endl;
            return 2;
        }

        if (arg == "--token") {
            config.token = value;
        } else if (arg == "--channel") {
            config.channel_id = value;
        } else if (arg == "--path") {
            config.archive_path = value;
        } else if (arg == "--batch") {
            if (!parseBatchSizeArg(value, config.batch_size)) {
                std::cerr << "Invalid batch size: " << value << std::endl;
                return 2;
            }
        } else if (arg == "--level") {
            if (!parseCompressionLevelArg(value, config.compression_level)) {
                std::cerr << "Invalid compression level: " << value << std::endl;
                return 2;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 2;
        }
        i++;
    }

    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    ArchiverConfig config;
    int parse_status = parseArguments(argc, argv, config);
    if (parse_status == 1) {
        return 0;
    }
    if (parse_status != 0) {
        printUsage(argv[0]);
        return 2;
    }

    std::string error;
    if (config.finalize(error) != ConfigResult::SUCCESS) {
        std::cerr << "Error: " << error << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    if (!installSignalHandlers()) {
        std::cerr << "Error: failed to install signal handlers: "
                  << std::strerror(errno) << std::endl;
        return 1;
    }

    HttpsTransportConfig transport_config;
    transport_config.host = config.api_host;
    transport_config.port = config.api_port;
    transport_config.authorization = config.token;
    transport_config.timeout = config.request_timeout;

    HttpsTransport transport(transport_config);
    MessageFetcher fetcher(&transport, config.channel_id, config.api_prefix);
    ThreadSleeper sleeper;

    std::cout << "[chanarc] Archiving channel " << config.channel_id
              << " to " << config.archive_path << std::endl;

    ArchiveDriver driver(config, &fetcher, &sleeper);
    driver.setStopFlag(&g_stop_requested);

    DriverResult result = driver.run();
    const Checkpoint& checkpoint = driver.getCheckpoint();
    const DriverStats& stats = driver.getStats();

    std::cout << "[chanarc] " << driverResultName(result)
              << ": TOTAL MESSAGES: " << checkpoint.total_messages
              << ", TOTAL UNCOMPRESSED SIZE: " << checkpoint.uncompressed_bytes << " bytes"
              << " (this run: " << stats.messages_written << " written, "
              << stats.malformed_skipped << " malformed, "
              << stats.retries << " retries)" << std::endl;

    if (result == DriverResult::SUCCESS || result == DriverResult::SUCCESS_INTERRUPTED) {
        return 0;
    }

    std::cerr << "[chanarc] Error: " << driver.getLastError() << std::endl;
    return 1;
}
