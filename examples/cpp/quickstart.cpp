/**
 * @file quickstart.cpp
 * @brief Minimal working example of a clipxfer copy/paste
 *
 * Creates a small file, puts it on the clipboard, pastes it into a
 * second directory on a worker thread and prints every progress event.
 *
 * Run: ./quickstart
 */

#include <clipxfer.hpp>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

int main() {
    char src_template[] = "/tmp/clipxfer_quickstart_src.XXXXXX";
    char dst_template[] = "/tmp/clipxfer_quickstart_dst.XXXXXX";
    if (!mkdtemp(src_template) || !mkdtemp(dst_template)) {
        std::cerr << "Failed to create temp directories\n";
        return 1;
    }
    fs::path src_dir = src_template;
    fs::path dst_dir = dst_template;

    const char *test_data = "Hello from clipxfer! This file travelled through io_uring.\n";

    int status = 0;
    try {
        // Create a test file with known content
        {
            std::ofstream out(src_dir / "hello.txt", std::ios::binary);
            if (!out) {
                std::cerr << "Failed to create test file\n";
                return 1;
            }
            out.write(test_data, static_cast<std::streamsize>(strlen(test_data)));
        }

        clipxfer::ClipboardManager clipboard;
        clipboard.copy({src_dir / "hello.txt"});

        auto rx = clipboard.setup_progress_channel();
        auto token = clipboard.start_paste();
        clipxfer::PasteExecutor executor(token, *clipboard.progress_sender());

        // Paste on a worker; this thread plays the UI
        clipxfer::PasteResult result;
        std::thread worker([&] {
            result = executor.execute(clipboard.paths(), dst_dir, clipboard.is_cut(),
                                      clipxfer::fixed_policy(clipxfer::ConflictResolution::KeepBoth));
        });

        clipxfer::PasteProgress progress;
        while (true) {
            auto update = rx.recv_for(std::chrono::milliseconds(100));
            if (!update) continue;
            progress.apply(*update);
            std::cout << clipxfer::update_name(*update) << ": " << progress.percentage() << "%\n";
            if (clipxfer::is_terminal(*update)) break;
        }
        worker.join();
        clipboard.complete_paste(false);

        std::ifstream in(dst_dir / "hello.txt");
        std::string line;
        std::getline(in, line);
        std::cout << "Pasted " << result.successful_files.size() << " file ("
                  << clipxfer::format_bytes(result.total_bytes_transferred) << "): " << line << '\n';

        std::cout << "Success!\n";

    } catch (const clipxfer::Error &e) {
        std::cerr << "clipxfer error: " << e.what() << "\n";
        status = 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    std::error_code ec;
    fs::remove_all(src_dir, ec);
    fs::remove_all(dst_dir, ec);
    return status;
}
