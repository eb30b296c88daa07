/**
 * @file cancel_paste.cpp
 * @brief Demonstrates cancelling a paste from another thread
 *
 * Writes a large file, starts pasting it, and cancels once the first
 * bytes have arrived. The paste returns normally with cancelled set, the
 * receiver sees a Cancelled event and the partial destination is gone.
 *
 * Usage: ./cancel_paste [size_mb]
 */

#include <clipxfer.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

constexpr size_t DEFAULT_SIZE_MB = 256;

int main(int argc, char *argv[]) {
    size_t size_mb = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : DEFAULT_SIZE_MB;
    if (size_mb == 0) {
        std::cerr << "Usage: " << argv[0] << " [size_mb]\n";
        return 1;
    }

    char work_template[] = "/tmp/clipxfer_cancel.XXXXXX";
    if (!mkdtemp(work_template)) {
        std::cerr << "Failed to create temp directory\n";
        return 1;
    }
    fs::path work = work_template;
    fs::create_directory(work / "dst");

    int status = 0;
    try {
        {
            std::ofstream out(work / "big.bin", std::ios::binary);
            std::string block(1024 * 1024, 'x');
            for (size_t i = 0; i < size_mb; i++) {
                out.write(block.data(), static_cast<std::streamsize>(block.size()));
            }
        }

        auto [tx, rx] = clipxfer::make_progress_channel();
        clipxfer::CancellationToken token;
        clipxfer::PasteExecutor executor(token, tx, clipxfer::PasteOptions().fsync(false));

        std::vector<fs::path> sources{work / "big.bin"};
        clipxfer::PasteResult result;
        std::thread worker([&] {
            result = executor.execute(sources, work / "dst", false,
                                      clipxfer::fixed_policy(clipxfer::ConflictResolution::Replace));
        });

        std::cout << "Pasting " << size_mb << " MiB...\n";
        bool cancel_sent = false;
        while (true) {
            auto update = rx.recv_for(std::chrono::milliseconds(100));
            if (!update) continue;

            if (auto *bytes = std::get_if<clipxfer::progress::BytesTransferred>(&*update)) {
                if (!cancel_sent) {
                    std::cout << "First chunk arrived (" << clipxfer::format_bytes(bytes->total_transferred)
                              << "), cancelling\n";
                    token.cancel();
                    cancel_sent = true;
                }
            }
            if (clipxfer::is_terminal(*update)) {
                std::cout << "Terminal event: " << clipxfer::update_name(*update) << '\n';
                break;
            }
        }
        worker.join();

        std::cout << "cancelled=" << std::boolalpha << result.cancelled
                  << ", partial file left behind: " << fs::exists(work / "dst" / "big.bin") << '\n';

    } catch (const clipxfer::Error &e) {
        std::cerr << "clipxfer error: " << e.what() << "\n";
        status = 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    std::error_code ec;
    fs::remove_all(work, ec);
    return status;
}
