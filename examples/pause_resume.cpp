/**
 * @file pause_resume.cpp
 * @brief Pause a running download, resume it and recover from a reported error
 *
 * This example demonstrates:
 * - start_and_wait_until_transferring() followed by pause()
 * - How a pause ends wait_until_transferred() early
 * - resume_and_wait_until_transferred() after a pause or a transfer error
 */

#include <kcenon/delivery_client/delivery_client.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

using namespace kcenon::delivery_client;
using namespace std::chrono_literals;

namespace {

void print_outcome(const std::string& label, const result<wait_outcome>& outcome) {
    std::cout << label << ": ";
    if (!outcome.has_value()) {
        std::cout << "failed (" << outcome.error().message << ")" << std::endl;
        return;
    }
    const auto& status = outcome.value().status;
    std::cout << to_string(outcome.value().reason)
              << ", state=" << to_string(status.state)
              << ", bytes=" << status.bytes_transferred << "/" << status.bytes_total
              << std::endl;
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

int main(int argc, char* argv[]) {
    bool inject_error = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [--inject-error]" << std::endl;
            return 0;
        } else if (arg == "--inject-error") {
            inject_error = true;
        }
    }

    download_file file{"https://download.example.com/update.cab", "/tmp/update.cab",
                       8 * 1024 * 1024};

    simulated_download_config config;
    config.total_bytes = *file.size;
    config.steps = 20;
    config.step_interval = 25ms;
    if (inject_error) {
        config.fail_with_error = to_raw(service_code::download_no_progress);
        config.fail_at_step = 5;
    }

    auto session_result = download_session::builder()
        .with_file(file)
        .with_remote(std::make_unique<simulated_download>(config))
        .with_no_progress_timeout(std::chrono::seconds(30))
        .build();

    if (!session_result.has_value()) {
        std::cerr << "Failed to create session: " << session_result.error().message << std::endl;
        return 1;
    }

    auto& session = session_result.value();

    auto transferring = session.start_and_wait_until_transferring();
    print_outcome("start", transferring);
    if (!transferring.has_value() || !transferring.value().reached()) {
        abort_download(session);
        return 1;
    }

    if (!inject_error) {
        auto pause_result = session.pause();
        if (!pause_result.has_value()) {
            std::cerr << "Pause failed: " << pause_result.error().message << std::endl;
            abort_download(session);
            return 1;
        }
    }

    // Ends early on the pause, or on the injected error
    print_outcome("first wait", session.wait_until_transferred(10s));

    if (session.is_status_error()) {
        std::cout << "Reported error 0x" << std::hex
                  << static_cast<uint32_t>(session.last_error_code()) << std::dec
                  << ", resuming" << std::endl;
    }

    auto resumed = session.resume_and_wait_until_transferred(30s);
    print_outcome("resume", resumed);
    if (!resumed.has_value() || !resumed.value().reached()) {
        abort_download(session);
        return 1;
    }

    auto finalize_result = session.finalize();
    if (!finalize_result.has_value()) {
        std::cerr << "Finalize failed: " << finalize_result.error().message << std::endl;
        return 1;
    }

    std::cout << "Download finalized" << std::endl;
    return 0;
}
