/**
 * @file log_handler.cpp
 * @brief Route clipxfer diagnostics through a custom log handler
 *
 * clipxfer logs through the AuraIO log pipeline, so one handler sees
 * both engine and paste messages. This example installs a handler that
 * timestamps every line, emits an application message through the same
 * pipeline, and runs a paste with a conflict so skip/replace decisions
 * show up in the log.
 *
 * Run: ./log_handler
 */

#include <clipxfer.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace fs = std::filesystem;

int main() {
    std::cout << "clipxfer Log Handler Example\n";
    std::cout << "============================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------

    clipxfer::set_log_handler([](clipxfer::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [myapp] " << clipxfer::log_level_name(level)
                  << ": " << msg << '\n';
    });

    // --- Step 2: Emit application-level messages -------------------------
    clipxfer::log_emit(clipxfer::LogLevel::Info, "log handler installed, preparing files");

    char work_template[] = "/tmp/clipxfer_log.XXXXXX";
    if (!mkdtemp(work_template)) {
        clipxfer::log_emit(clipxfer::LogLevel::Error, "failed to create temp directory");
        clipxfer::clear_log_handler();
        return 1;
    }
    fs::path work = work_template;

    int status = 0;
    try {
        fs::create_directory(work / "src");
        fs::create_directory(work / "dst");
        std::ofstream(work / "src" / "a.txt") << "new contents\n";
        std::ofstream(work / "src" / "b.txt") << "b\n";
        std::ofstream(work / "dst" / "a.txt") << "a much longer old version of a\n";

        // --- Step 3: Paste with a conflict -------------------------------
        // a.txt is smaller than the existing copy, so replace-if-larger skips it
        clipxfer::CancellationToken token;
        clipxfer::PasteExecutor executor(token, clipxfer::ProgressSender{});

        std::vector<fs::path> sources{work / "src" / "a.txt", work / "src" / "b.txt"};
        auto result = executor.execute(
            sources, work / "dst", false,
            clipxfer::fixed_policy(clipxfer::ConflictResolution::ReplaceIfLarger));

        clipxfer::log_emit(clipxfer::LogLevel::Notice,
                           "paste finished: " + std::to_string(result.successful_files.size()) +
                               " copied, " + std::to_string(result.skipped_files.size()) +
                               " skipped");

    } catch (const clipxfer::Error &e) {
        clipxfer::log_emit(clipxfer::LogLevel::Error, std::string("clipxfer error: ") + e.what());
        status = 1;
    } catch (const std::exception &e) {
        clipxfer::log_emit(clipxfer::LogLevel::Error, std::string("unexpected error: ") + e.what());
        status = 1;
    }

    std::error_code ec;
    fs::remove_all(work, ec);
    clipxfer::clear_log_handler();

    std::cout << "\n--- Summary ---\n";
    std::cout << "The handler captured engine and paste messages on stderr\n";
    std::cout << "with timestamps, severity levels, and an app prefix.\n";

    return status;
}
