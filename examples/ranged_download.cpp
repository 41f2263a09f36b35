/**
 * @file ranged_download.cpp
 * @brief Download selected byte ranges of a file through a download session
 *
 * This example demonstrates:
 * - Building a session with the builder
 * - Requesting partial content with download_ranges
 * - Waiting for the transfer with start_and_wait_until_transferred()
 * - Finalizing on success and aborting on failure
 */

#include <kcenon/delivery_client/delivery_client.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace kcenon::delivery_client;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Parse "offset:length"; a length of "eof" reads to the end of file
 */
auto parse_range(const std::string& text, byte_range& out) -> bool {
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    try {
        out.offset = std::stoull(text.substr(0, colon));
        auto length = text.substr(colon + 1);
        out.length = (length == "eof") ? byte_range::to_end_of_file : std::stoull(length);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

/**
 * @brief Abort the download, reporting a failure to abort
 */
void abort_download(download_session& session) {
    auto abort_result = session.abort();
    if (!abort_result.has_value()) {
        std::cerr << "Abort failed: " << abort_result.error().message << std::endl;
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Ranged Download Example - Delivery Client" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <uri> <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -r, --range <off:len>   Request a byte range (repeatable, len may be 'eof')" << std::endl;
    std::cout << "  -s, --size <bytes>      Simulated file size (default: 1048576)" << std::endl;
    std::cout << "  -t, --timeout <sec>     Transfer wait budget (default: 60)" << std::endl;
    std::cout << "  --background            Run at background priority" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " https://example.com/a.iso /tmp/a.iso" << std::endl;
    std::cout << "  " << program << " -r 0:4096 -r 1048576:eof https://example.com/a.iso /tmp/a.iso" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string uri;
    std::string local_path;
    uint64_t size = 1024 * 1024;
    int timeout_seconds = 60;
    bool foreground = true;
    download_ranges ranges;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-r" || arg == "--range") {
            if (++i >= argc) {
                std::cerr << "Error: --range requires an argument" << std::endl;
                return 1;
            }
            byte_range range;
            if (!parse_range(argv[i], range)) {
                std::cerr << "Error: invalid range '" << argv[i] << "'" << std::endl;
                return 1;
            }
            ranges.add(range.offset, range.length);
        } else if (arg == "-s" || arg == "--size") {
            if (++i >= argc) {
                std::cerr << "Error: --size requires an argument" << std::endl;
                return 1;
            }
            size = std::stoull(argv[i]);
        } else if (arg == "-t" || arg == "--timeout") {
            if (++i >= argc) {
                std::cerr << "Error: --timeout requires an argument" << std::endl;
                return 1;
            }
            timeout_seconds = std::stoi(argv[i]);
        } else if (arg == "--background") {
            foreground = false;
        } else if (arg[0] != '-') {
            if (uri.empty()) {
                uri = arg;
            } else if (local_path.empty()) {
                local_path = arg;
            }
        }
    }

    if (uri.empty() || local_path.empty()) {
        std::cerr << "Error: Both uri and local_file are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    download_file file{uri, local_path, size};

    simulated_download_config config;
    config.total_bytes = size;
    config.steps = 16;

    auto session_result = download_session::builder()
        .with_file(file)
        .with_remote(std::make_unique<simulated_download>(config))
        .with_uri(uri)
        .with_foreground(foreground)
        .with_cost_policy(cost_policy::always)
        .build();

    if (!session_result.has_value()) {
        std::cerr << "Failed to create session: " << session_result.error().message << std::endl;
        return 1;
    }

    auto& session = session_result.value();

    std::cout << "Download " << session.id().to_string() << std::endl;
    std::cout << "  URI:    " << uri << std::endl;
    std::cout << "  Target: " << local_path << std::endl;
    if (ranges.empty()) {
        std::cout << "  Ranges: whole file" << std::endl;
    } else {
        for (const auto& range : ranges.ranges()) {
            std::cout << "  Range:  " << range.offset << " +";
            if (range.length == byte_range::to_end_of_file) {
                std::cout << " eof" << std::endl;
            } else {
                std::cout << " " << range.length << std::endl;
            }
        }
    }
    std::cout << std::endl;

    auto start_time = std::chrono::steady_clock::now();
    auto outcome = session.start_and_wait_until_transferred(
        ranges, std::chrono::seconds(timeout_seconds));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (!outcome.has_value()) {
        std::cerr << "Wait failed: " << outcome.error().message << std::endl;
        abort_download(session);
        return 1;
    }

    if (!outcome.value().reached()) {
        std::cerr << "Download ended early (" << to_string(outcome.value().reason)
                  << ", state " << to_string(outcome.value().status.state) << ")" << std::endl;
        if (session.is_status_error()) {
            std::cerr << "  Error:          0x" << std::hex << static_cast<uint32_t>(session.last_error_code())
                      << std::dec << std::endl;
            std::cerr << "  Extended error: " << session.last_extended_error_code() << std::endl;
        }
        abort_download(session);
        return 1;
    }

    auto finalize_result = session.finalize();
    if (!finalize_result.has_value()) {
        std::cerr << "Finalize failed: " << finalize_result.error().message << std::endl;
        return 1;
    }

    std::cout << "Transferred " << format_bytes(outcome.value().status.bytes_transferred)
              << " in " << elapsed.count() << " ms" << std::endl;
    return 0;
}
