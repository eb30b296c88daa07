/**
 * @file clipxfer_cp.cpp
 * @brief clipxfer_cp - copy or move files into a directory with clipxfer
 *
 * Command-line front end for the clipxfer paste engine. It plays the part
 * a file manager's UI thread would: it loads the sources into a
 * ClipboardManager, runs the paste on a worker thread, drains progress
 * events into a progress bar and turns SIGINT into cancellation.
 *
 * Usage: clipxfer_cp [OPTIONS] SOURCE... DEST
 */

#include <clipxfer.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <getopt.h>
#include <limits.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

// ============================================================================
// Constants
// ============================================================================

static constexpr uint64_t PROGRESS_INTERVAL_MS = 200;
static constexpr auto DRAIN_TIMEOUT = std::chrono::milliseconds(50);
static constexpr int EXIT_INTERRUPTED = 130;

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::vector<std::filesystem::path> sources;
    std::filesystem::path dest;
    std::optional<clipxfer::ConflictResolution> policy;
    size_t chunk_size = clipxfer::PasteOptions::DEFAULT_CHUNK_SIZE;
    bool move = false;
    bool quiet = false;
    bool no_progress = false;
    bool no_fsync = false;
    bool preserve = false;
    bool verbose = false;
};

// ============================================================================
// Global state for signal handling
// ============================================================================

static volatile sig_atomic_t g_interrupted = 0;

// Set while the worker waits for an answer on stdin; the progress bar
// stays quiet meanwhile.
static std::atomic<bool> g_prompting{false};

static void sigint_handler(int /*sig*/) {
    g_interrupted = 1;
}

// ============================================================================
// Size parsing
// ============================================================================

static ssize_t parse_size(const char *str) {
    char *endp;
    double val = strtod(str, &endp);
    if (endp == str || val < 0) return -1;

    switch (*endp) {
    case 'G':
    case 'g':
        val *= 1024.0 * 1024.0 * 1024.0;
        break;
    case 'M':
    case 'm':
        val *= 1024.0 * 1024.0;
        break;
    case 'K':
    case 'k':
        val *= 1024.0;
        break;
    case '\0':
        break;
    default:
        return -1;
    }

    if (val > static_cast<double>(SSIZE_MAX)) return -1;
    return static_cast<ssize_t>(val);
}

// ============================================================================
// Progress display
// ============================================================================

class ProgressView {
  public:
    explicit ProgressView(const Config &config) : config_(config) {}

    void apply(const clipxfer::PasteProgressUpdate &update) {
        progress_.apply(update);

        if (config_.quiet) return;
        if (auto *conflict = std::get_if<clipxfer::progress::ConflictDetected>(&update)) {
            if (config_.verbose) {
                clear_line();
                fprintf(stderr, "clipxfer_cp: '%s' already exists\n",
                        conflict->destination.c_str());
            }
        } else if (auto *failed = std::get_if<clipxfer::progress::FileFailed>(&update)) {
            clear_line();
            fprintf(stderr, "clipxfer_cp: %s\n", failed->error.c_str());
        } else if (auto *cleanup = std::get_if<clipxfer::progress::CleanupFailed>(&update)) {
            clear_line();
            fprintf(stderr, "clipxfer_cp: %s\n", cleanup->error.c_str());
        }
    }

    void render(bool final) {
        if (config_.quiet || config_.no_progress) return;
        if (!final && (!isatty(STDERR_FILENO) || g_prompting.load())) return;

        auto now = std::chrono::steady_clock::now();
        if (!final && now - last_render_ < std::chrono::milliseconds(PROGRESS_INTERVAL_MS)) return;
        last_render_ = now;

        double pct = progress_.percentage();

        int bar_width = 30;
        int filled = static_cast<int>(pct / 100.0 * bar_width);
        if (filled > bar_width) filled = bar_width;

        char bar[64];
        int i;
        for (i = 0; i < filled && i < bar_width; i++) bar[i] = '=';
        if (filled < bar_width) {
            bar[filled] = '>';
            for (i = filled + 1; i < bar_width; i++) bar[i] = ' ';
        }
        bar[bar_width] = '\0';

        std::string eta;
        if (progress_.estimated_remaining.count() > 0) {
            eta = "ETA " + clipxfer::format_duration(progress_.estimated_remaining);
        }

        fprintf(stderr, "\r  %s / %s  [%s]  %3.0f%%  %zu/%zu files  %s  %s   ",
                clipxfer::format_bytes(progress_.bytes_transferred).c_str(),
                clipxfer::format_bytes(progress_.total_bytes).c_str(), bar, pct,
                progress_.completed_files, progress_.total_files,
                clipxfer::format_rate(progress_.speed_bytes_per_sec).c_str(), eta.c_str());
        drawn_ = true;

        if (final) {
            fprintf(stderr, "\n");
            drawn_ = false;
        }
    }

    [[nodiscard]] const clipxfer::PasteProgress &progress() const noexcept { return progress_; }

  private:
    void clear_line() {
        if (!drawn_) return;
        fprintf(stderr, "\r\033[K");
        drawn_ = false;
    }

    const Config &config_;
    clipxfer::PasteProgress progress_;
    std::chrono::steady_clock::time_point last_render_{};
    bool drawn_ = false;
};

// ============================================================================
// Conflict prompt
// ============================================================================

/**
 * Ask the user how to resolve one collision
 *
 * Runs on the worker thread; the main thread never reads stdin.
 */
static clipxfer::ConflictResolution prompt_conflict(const std::filesystem::path &source,
                                                    const std::filesystem::path &destination) {
    static std::mutex prompt_mutex;
    std::lock_guard<std::mutex> lock(prompt_mutex);

    if (!isatty(STDIN_FILENO)) return clipxfer::ConflictResolution::Skip;

    g_prompting = true;
    fprintf(stderr, "\r\033[K");

    clipxfer::ConflictResolution answer = clipxfer::ConflictResolution::Skip;
    while (true) {
        fprintf(stderr,
                "clipxfer_cp: '%s' already exists (pasting '%s')\n"
                "  [s]kip, [r]eplace, [k]eep both, replace if [n]ewer, replace if [l]arger? ",
                destination.c_str(), source.c_str());

        std::string line;
        if (!std::getline(std::cin, line) || g_interrupted) break;
        if (line.empty()) continue;

        bool valid = true;
        switch (line[0]) {
        case 's':
            answer = clipxfer::ConflictResolution::Skip;
            break;
        case 'r':
            answer = clipxfer::ConflictResolution::Replace;
            break;
        case 'k':
            answer = clipxfer::ConflictResolution::KeepBoth;
            break;
        case 'n':
            answer = clipxfer::ConflictResolution::ReplaceIfNewer;
            break;
        case 'l':
            answer = clipxfer::ConflictResolution::ReplaceIfLarger;
            break;
        default:
            valid = false;
            break;
        }
        if (valid) break;
    }

    g_prompting = false;
    return answer;
}

// ============================================================================
// CLI parsing
// ============================================================================

static void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s [OPTIONS] SOURCE... DEST\n"
            "\n"
            "Copy (or move) files and directories into the directory DEST.\n"
            "\n"
            "Options:\n"
            "  -m, --move            Move instead of copy (sources are removed\n"
            "                        once every source transferred)\n"
            "  -c, --conflict POLICY What to do when a destination exists:\n"
            "                        skip, replace, keep-both, replace-if-newer,\n"
            "                        replace-if-larger (default: ask)\n"
            "  -b, --block-size N    I/O block size (default: 64K). Suffixes: K, M, G\n"
            "  -q, --quiet           Suppress all output\n"
            "  --no-fsync            Skip per-file fdatasync\n"
            "  --no-progress         Disable progress bar\n"
            "  --preserve            Preserve timestamps (mtime, atime)\n"
            "  -v, --verbose         Log every file\n"
            "  -h, --help            Show this help\n",
            argv0);
}

static int parse_args(int argc, char **argv, Config &config) {
    static struct option long_opts[] = {{"move", no_argument, nullptr, 'm'},
                                        {"conflict", required_argument, nullptr, 'c'},
                                        {"block-size", required_argument, nullptr, 'b'},
                                        {"quiet", no_argument, nullptr, 'q'},
                                        {"no-fsync", no_argument, nullptr, 'F'},
                                        {"no-progress", no_argument, nullptr, 'P'},
                                        {"preserve", no_argument, nullptr, 'T'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "mc:b:qvh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'm':
            config.move = true;
            break;
        case 'c': {
            auto policy = clipxfer::parse_conflict_resolution(optarg);
            if (!policy) {
                fprintf(stderr, "clipxfer_cp: unknown conflict policy: %s\n", optarg);
                return -1;
            }
            config.policy = *policy;
        } break;
        case 'b': {
            ssize_t sz = parse_size(optarg);
            if (sz <= 0) {
                fprintf(stderr, "clipxfer_cp: invalid block size: %s\n", optarg);
                return -1;
            }
            config.chunk_size = static_cast<size_t>(sz);
        } break;
        case 'q':
            config.quiet = true;
            config.no_progress = true;
            break;
        case 'v':
            config.verbose = true;
            break;
        case 'F':
            config.no_fsync = true;
            break;
        case 'P':
            config.no_progress = true;
            break;
        case 'T':
            config.preserve = true;
            break;
        case 'h':
            print_usage(argv[0]);
            exit(0);
        default:
            print_usage(argv[0]);
            return -1;
        }
    }

    int remaining = argc - optind;
    if (remaining < 2) {
        fprintf(stderr, "clipxfer_cp: expected SOURCE... DEST arguments\n");
        print_usage(argv[0]);
        return -1;
    }

    for (int i = optind; i < argc - 1; i++) config.sources.emplace_back(argv[i]);
    config.dest = argv[argc - 1];
    return 0;
}

// ============================================================================
// Summary
// ============================================================================

static void print_summary(const Config &config, const clipxfer::PasteResult &result) {
    if (config.quiet) return;

    for (const auto &skipped : result.skipped_files) {
        fprintf(stderr, "clipxfer_cp: skipped '%s'\n", skipped.c_str());
    }

    auto secs = std::chrono::duration<double>(result.duration).count();
    uint64_t rate =
        secs > 0 ? static_cast<uint64_t>(static_cast<double>(result.total_bytes_transferred) / secs)
                 : 0;

    fprintf(stderr, "%s %zu item%s (%s) in %.2fs, %s; %zu skipped, %zu failed%s\n",
            config.move ? "Moved" : "Copied", result.successful_files.size(),
            result.successful_files.size() == 1 ? "" : "s",
            clipxfer::format_bytes(result.total_bytes_transferred).c_str(), secs,
            clipxfer::format_rate(rate).c_str(), result.skipped_files.size(),
            result.failed_files.size(), result.cancelled ? " (interrupted)" : "");

    if (config.move && !result.failed_files.empty()) {
        fprintf(stderr, "clipxfer_cp: sources kept because some items failed\n");
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    Config config;
    if (parse_args(argc, argv, config) != 0) return 1;

    auto threshold = config.verbose ? clipxfer::LogLevel::Debug : clipxfer::LogLevel::Warning;
    if (!config.quiet) {
        clipxfer::set_log_handler([threshold](clipxfer::LogLevel level, std::string_view msg) {
            if (static_cast<int>(level) > static_cast<int>(threshold)) return;
            fprintf(stderr, "\r\033[K[%s] %.*s\n", clipxfer::log_level_name(level),
                    static_cast<int>(msg.size()), msg.data());
        });
    }

    // Install SIGINT handler
    struct sigaction sa = {};
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    clipxfer::ClipboardManager clipboard;
    if (config.move) clipboard.cut(config.sources);
    else clipboard.copy(config.sources);

    clipxfer::PasteOptions opts;
    opts.chunk_size(config.chunk_size).fsync(!config.no_fsync).preserve_times(config.preserve);

    clipxfer::ConflictHandler handler =
        config.policy ? clipxfer::fixed_policy(*config.policy) : clipxfer::ConflictHandler(prompt_conflict);

    int status = 0;
    try {
        auto receiver = clipboard.setup_progress_channel();
        auto token = clipboard.start_paste();
        clipxfer::PasteExecutor executor(token, *clipboard.progress_sender(), opts);

        std::vector<std::filesystem::path> sources(clipboard.paths().begin(),
                                                   clipboard.paths().end());
        bool is_cut = clipboard.is_cut();

        std::optional<clipxfer::PasteResult> result;
        std::exception_ptr fatal;
        std::atomic<bool> worker_done{false};

        // Anything the paste throws is rethrown on this thread after join
        std::thread worker([&] {
            try {
                result = executor.execute(sources, config.dest, is_cut, handler);
            } catch (...) {
                fatal = std::current_exception();
            }
            worker_done = true;
        });

        ProgressView view(config);
        bool finished = false;
        while (!finished) {
            if (g_interrupted && clipboard.is_paste_active()) clipboard.cancel_paste();

            if (auto update = receiver.recv_for(DRAIN_TIMEOUT)) {
                view.apply(*update);
                finished = clipxfer::is_terminal(*update);
            } else if (worker_done) {
                // The engine threw before it could emit a terminal event
                finished = receiver.pending() == 0;
            }
            view.render(false);
        }
        worker.join();

        if (fatal) std::rethrow_exception(fatal);

        view.render(true);
        print_summary(config, *result);

        clipboard.complete_paste(is_cut && !result->cancelled && result->is_success());

        if (result->cancelled) status = EXIT_INTERRUPTED;
        else if (!result->is_success()) status = 1;

    } catch (const clipxfer::Error &e) {
        fprintf(stderr, "clipxfer_cp: %s\n", e.what());
        status = 1;
    } catch (const std::exception &e) {
        fprintf(stderr, "clipxfer_cp: error: %s\n", e.what());
        status = 1;
    }

    clipxfer::clear_log_handler();
    return status;
}
