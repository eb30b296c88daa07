/**
 * @file executor.cpp
 * @brief PasteExecutor implementation
 *
 * One execute() call builds a PasteRun: an AuraIO engine with a single
 * ring, one chunk-sized buffer, a SpeedTracker and the result being
 * filled in. Each chunk is a read followed by a write through the
 * engine; the token is checked before every chunk.
 */

#ifndef _GNU_SOURCE
#    define _GNU_SOURCE
#endif
#include <aura.hpp>

#include <clipxfer/error.hpp>
#include <clipxfer/executor.hpp>
#include <clipxfer/format.hpp>
#include <clipxfer/speed_tracker.hpp>

#include "log.hpp"

#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace clipxfer {

namespace {

constexpr int WAIT_TIMEOUT_MS = 100;

/// Thrown from inside a copy when the token fires; caught per source.
struct TransferCancelled {};

class UniqueFd {
  public:
    explicit UniqueFd(int fd = -1) noexcept : fd_(fd) {}
    ~UniqueFd() {
        if (fd_ >= 0) ::close(fd_);
    }

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

  private:
    int fd_;
};

struct SourceTotals {
    size_t files = 0;
    uint64_t bytes = 0;
};

SourceTotals count_source(const fs::path &source) {
    SourceTotals totals;
    std::error_code ec;
    auto st = fs::symlink_status(source, ec);
    if (ec) return totals;

    if (fs::is_regular_file(st)) {
        totals.files = 1;
        auto size = fs::file_size(source, ec);
        if (!ec) totals.bytes = size;
    } else if (fs::is_symlink(st)) {
        totals.files = 1;
    } else if (fs::is_directory(st)) {
        fs::recursive_directory_iterator it(source, fs::directory_options::skip_permission_denied,
                                            ec);
        for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code entry_ec;
            auto entry_st = it->symlink_status(entry_ec);
            if (entry_ec) continue;
            if (fs::is_regular_file(entry_st)) {
                totals.files++;
                auto size = it->file_size(entry_ec);
                if (!entry_ec) totals.bytes += size;
            } else if (fs::is_symlink(entry_st)) {
                totals.files++;
            }
        }
    }
    return totals;
}

/// True if @p inner lies strictly below @p outer
bool is_within(const fs::path &inner, const fs::path &outer) {
    std::error_code ec;
    fs::path a = fs::weakly_canonical(inner, ec);
    if (ec) return false;
    fs::path b = fs::weakly_canonical(outer, ec);
    if (ec) return false;

    fs::path rel = a.lexically_relative(b);
    return !rel.empty() && rel != fs::path(".") && *rel.begin() != fs::path("..");
}

// Newer/larger comparisons fail open: if either side cannot be
// stat'ed the source qualifies for replacement.

bool source_is_newer(const fs::path &source, const fs::path &dest) {
    struct stat s, d;
    if (::stat(source.c_str(), &s) != 0 || ::stat(dest.c_str(), &d) != 0) {
        detail::log(LogLevel::Warning, "cannot compare times of '%s' and '%s': %s; replacing",
                    source.c_str(), dest.c_str(), strerror(errno));
        return true;
    }
    if (s.st_mtim.tv_sec != d.st_mtim.tv_sec) return s.st_mtim.tv_sec > d.st_mtim.tv_sec;
    return s.st_mtim.tv_nsec > d.st_mtim.tv_nsec;
}

bool source_is_larger(const fs::path &source, const fs::path &dest) {
    struct stat s, d;
    if (::stat(source.c_str(), &s) != 0 || ::stat(dest.c_str(), &d) != 0) {
        detail::log(LogLevel::Warning, "cannot compare sizes of '%s' and '%s': %s; replacing",
                    source.c_str(), dest.c_str(), strerror(errno));
        return true;
    }
    return s.st_size > d.st_size;
}

std::string describe(int err, std::string_view what, const fs::path &path) {
    std::string context(what);
    context += " '";
    context += path.string();
    context += '\'';
    return Error(err, context).what();
}

// ============================================================================
// One paste
// ============================================================================

enum class Outcome { Transferred, Skipped, Failed, Cancelled };

class PasteRun {
  public:
    PasteRun(const aura::Options &engine_opts, const PasteOptions &options,
             const CancellationToken &token, const ProgressSender &sender, uint64_t total_bytes)
        : engine_(engine_opts), buffer_(engine_.allocate_buffer(options.chunk_size())),
          options_(options), token_(token), sender_(sender), total_bytes_(total_bytes) {}

    PasteResult run(std::span<const fs::path> sources, const std::vector<SourceTotals> &totals,
                    const fs::path &destination_dir, bool is_cut, const ConflictHandler &handler,
                    std::chrono::steady_clock::time_point start_time);

  private:
    Outcome paste_source(const fs::path &source, const fs::path &destination_dir,
                         const ConflictHandler &handler);
    void skip(const fs::path &source, std::string reason);
    void fail(const fs::path &source, std::string error);
    void remove_partial(const fs::path &destination);
    void delete_sources(const std::vector<fs::path> &sources);

    uint64_t copy_entry(const fs::path &src, const fs::path &dst);
    uint64_t copy_file(const fs::path &src, const fs::path &dst);
    uint64_t copy_directory(const fs::path &src, const fs::path &dst);
    void copy_symlink(const fs::path &src, const fs::path &dst);
    void write_all(int fd, size_t len, off_t offset, const fs::path &dst);

    template <typename Submit> ssize_t run_io(Submit &&submit);

    void check_cancelled() const {
        if (token_.is_cancelled()) throw TransferCancelled{};
    }

    void note_created(const fs::path &dst) {
        if (!created_top_ && dst == top_destination_) created_top_ = true;
    }

    aura::Engine engine_;
    aura::Buffer buffer_;
    const PasteOptions &options_;
    const CancellationToken &token_;
    const ProgressSender &sender_;

    SpeedTracker speed_;
    uint64_t total_bytes_;
    uint64_t bytes_transferred_ = 0;
    size_t completed_files_ = 0;
    PasteResult result_;

    fs::path top_destination_;
    bool created_top_ = false;
};

template <typename Submit> ssize_t PasteRun::run_io(Submit &&submit) {
    struct IoState {
        ssize_t result = 0;
        bool done = false;
    };
    // Heap state: a completion that lands after a failed wait must not
    // write into a dead stack frame.
    auto state = std::make_shared<IoState>();

    (void)submit([state](aura::Request &, ssize_t res) {
        state->result = res;
        state->done = true;
    });

    while (!state->done) {
        try {
            engine_.wait(WAIT_TIMEOUT_MS);
        } catch (const aura::Error &e) {
            if (e.code() != EINTR && e.code() != ETIME && e.code() != ETIMEDOUT) throw;
        }
    }
    return state->result;
}

PasteResult PasteRun::run(std::span<const fs::path> sources,
                          const std::vector<SourceTotals> &totals,
                          const fs::path &destination_dir, bool is_cut,
                          const ConflictHandler &handler,
                          std::chrono::steady_clock::time_point start_time) {
    std::vector<fs::path> transferred;

    for (size_t i = 0; i < sources.size(); i++) {
        if (token_.is_cancelled()) {
            result_.cancelled = true;
            break;
        }

        completed_files_ += totals[i].files;
        Outcome outcome = paste_source(sources[i], destination_dir, handler);

        if (outcome == Outcome::Cancelled) {
            result_.cancelled = true;
            break;
        }
        if (outcome == Outcome::Transferred) {
            transferred.push_back(sources[i]);
            sender_.send(progress::FileCompleted{sources[i], completed_files_});
        }
    }

    if (is_cut && !result_.cancelled && result_.failed_files.empty()) delete_sources(transferred);

    result_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (result_.cancelled) {
        detail::log(LogLevel::Notice, "paste cancelled after %zu of %zu sources",
                    result_.total_processed(), sources.size());
        sender_.send(progress::Cancelled{result_});
    } else {
        detail::log(LogLevel::Info, "paste done: %zu ok, %zu skipped, %zu failed, %s in %lld ms",
                    result_.successful_files.size(), result_.skipped_files.size(),
                    result_.failed_files.size(),
                    format_bytes(result_.total_bytes_transferred).c_str(),
                    static_cast<long long>(result_.duration.count()));
        sender_.send(progress::Completed{result_});
    }
    return std::move(result_);
}

Outcome PasteRun::paste_source(const fs::path &source, const fs::path &destination_dir,
                               const ConflictHandler &handler) {
    std::error_code ec;
    auto src_status = fs::symlink_status(source, ec);
    if (!fs::exists(src_status)) {
        fail(source, describe(ec ? ec.value() : ENOENT, "cannot stat", source));
        return Outcome::Failed;
    }

    fs::path destination = PasteExecutor::compute_destination(source, destination_dir);

    if (fs::is_directory(src_status) && is_within(destination, source)) {
        fail(source, "cannot copy a directory into itself");
        return Outcome::Failed;
    }

    auto dst_status = fs::symlink_status(destination, ec);
    if (fs::exists(dst_status)) {
        sender_.send(progress::ConflictDetected{source, destination});

        ConflictResolution resolution =
            handler ? handler(source, destination) : ConflictResolution::Skip;
        detail::log(LogLevel::Debug, "'%s' exists, resolving with %s", destination.c_str(),
                    conflict_resolution_name(resolution));

        switch (resolution) {
        case ConflictResolution::Skip:
            skip(source, "User chose to skip");
            return Outcome::Skipped;

        case ConflictResolution::KeepBoth:
            destination = PasteExecutor::unique_destination(destination);
            break;

        case ConflictResolution::Replace:
        case ConflictResolution::ReplaceIfNewer:
        case ConflictResolution::ReplaceIfLarger: {
            bool qualifies = true;
            if (resolution == ConflictResolution::ReplaceIfNewer) {
                qualifies = source_is_newer(source, destination);
            } else if (resolution == ConflictResolution::ReplaceIfLarger) {
                qualifies = source_is_larger(source, destination);
            }
            if (!qualifies) {
                skip(source, "Condition not met");
                return Outcome::Skipped;
            }

            if (fs::equivalent(source, destination, ec)) {
                fail(source, "source and destination are the same file");
                return Outcome::Failed;
            }
            if (is_within(source, destination)) {
                fail(source, "destination contains the source");
                return Outcome::Failed;
            }

            fs::remove_all(destination, ec);
            if (ec) {
                fail(source, describe(ec.value(), "cannot remove", destination));
                return Outcome::Failed;
            }
            break;
        }
        }
    }

    top_destination_ = destination;
    created_top_ = false;

    try {
        uint64_t bytes = copy_entry(source, destination);
        result_.successful_files.push_back(destination);
        result_.total_bytes_transferred += bytes;
        return Outcome::Transferred;
    } catch (const TransferCancelled &) {
        remove_partial(destination);
        return Outcome::Cancelled;
    } catch (const std::system_error &e) {
        remove_partial(destination);
        fail(source, e.what());
        return Outcome::Failed;
    }
}

void PasteRun::skip(const fs::path &source, std::string reason) {
    detail::log(LogLevel::Debug, "skipped '%s': %s", source.c_str(), reason.c_str());
    result_.skipped_files.push_back(source);
    sender_.send(progress::FileSkipped{source, std::move(reason), completed_files_});
}

void PasteRun::fail(const fs::path &source, std::string error) {
    detail::log(LogLevel::Error, "failed '%s': %s", source.c_str(), error.c_str());
    result_.failed_files.emplace_back(source, error);
    sender_.send(progress::FileFailed{source, std::move(error), completed_files_});
}

void PasteRun::remove_partial(const fs::path &destination) {
    if (!created_top_) return;
    std::error_code ec;
    fs::remove_all(destination, ec);
    if (ec) {
        detail::log(LogLevel::Warning, "cannot remove partial '%s': %s", destination.c_str(),
                    ec.message().c_str());
    }
}

void PasteRun::delete_sources(const std::vector<fs::path> &sources) {
    for (const auto &source : sources) {
        std::error_code ec;
        fs::remove_all(source, ec);
        if (!ec) continue;

        std::string msg = describe(ec.value(), "cannot remove", source);
        detail::log(LogLevel::Warning, "%s", msg.c_str());
        result_.cleanup_failures.emplace_back(source, msg);
        sender_.send(progress::CleanupFailed{source, std::move(msg)});
    }
}

// ============================================================================
// Copy primitives
// ============================================================================

uint64_t PasteRun::copy_entry(const fs::path &src, const fs::path &dst) {
    struct stat st;
    if (::lstat(src.c_str(), &st) != 0) throw_errno("cannot stat", src);

    if (S_ISDIR(st.st_mode)) return copy_directory(src, dst);
    if (S_ISREG(st.st_mode)) return copy_file(src, dst);
    if (S_ISLNK(st.st_mode)) {
        copy_symlink(src, dst);
        return 0;
    }
    throw Error(ENOTSUP, "unsupported file type '" + src.string() + "'");
}

uint64_t PasteRun::copy_file(const fs::path &src, const fs::path &dst) {
    UniqueFd src_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!src_fd.valid()) throw_errno("cannot open", src);

    struct stat st;
    if (fstat(src_fd.get(), &st) != 0) throw_errno("cannot stat", src);

    auto file_size = static_cast<uint64_t>(st.st_size);
    sender_.send(progress::FileStarted{src, file_size});
    detail::log(LogLevel::Debug, "copying '%s' -> '%s' (%s)", src.c_str(), dst.c_str(),
                format_bytes(file_size).c_str());

    mode_t mode = st.st_mode & 07777;
    UniqueFd dst_fd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode));
    if (!dst_fd.valid()) throw_errno("cannot create", dst);
    note_created(dst);

    // Creation mode was filtered through the umask
    if (fchmod(dst_fd.get(), mode) != 0) throw_errno("cannot set permissions on", dst);

    uint64_t copied = 0;
    off_t offset = 0;
    const size_t chunk = options_.chunk_size();

    while (true) {
        check_cancelled();

        ssize_t n = run_io([&](auto &&cb) {
            return engine_.read(src_fd.get(), buffer_, chunk, offset,
                                std::forward<decltype(cb)>(cb));
        });
        if (n < 0) throw Error(static_cast<int>(-n), "read error on '" + src.string() + "'");
        if (n == 0) break;

        write_all(dst_fd.get(), static_cast<size_t>(n), offset, dst);

        auto bytes = static_cast<uint64_t>(n);
        offset += n;
        copied += bytes;
        bytes_transferred_ += bytes;
        speed_.update(bytes);

        uint64_t remaining = total_bytes_ > bytes_transferred_ ? total_bytes_ - bytes_transferred_ : 0;
        sender_.send(progress::BytesTransferred{bytes, bytes_transferred_,
                                                speed_.speed_bytes_per_sec(),
                                                speed_.estimated_remaining(remaining)});
    }

    if (options_.preserve_times()) {
        struct timespec times[2] = {st.st_atim, st.st_mtim};
        if (futimens(dst_fd.get(), times) != 0) throw_errno("cannot set times on", dst);
    }

    if (options_.fsync()) {
        ssize_t rc = run_io([&](auto &&cb) {
            return engine_.fdatasync(dst_fd.get(), std::forward<decltype(cb)>(cb));
        });
        if (rc < 0) throw Error(static_cast<int>(-rc), "fsync failed for '" + dst.string() + "'");
    }

    return copied;
}

void PasteRun::write_all(int fd, size_t len, off_t offset, const fs::path &dst) {
    auto *base = static_cast<char *>(buffer_.data());
    size_t done = 0;

    while (done < len) {
        aura::BufferRef ref(base + done);
        ssize_t w = run_io([&](auto &&cb) {
            return engine_.write(fd, ref, len - done, offset + static_cast<off_t>(done),
                                 std::forward<decltype(cb)>(cb));
        });
        if (w < 0) throw Error(static_cast<int>(-w), "write error on '" + dst.string() + "'");
        if (w == 0) throw Error(EIO, "short write on '" + dst.string() + "'");
        done += static_cast<size_t>(w);
    }
}

uint64_t PasteRun::copy_directory(const fs::path &src, const fs::path &dst) {
    struct stat st;
    if (::lstat(src.c_str(), &st) != 0) throw_errno("cannot stat", src);

    mode_t mode = st.st_mode & 07777;
    // Owner keeps full access while the tree is filled; exact mode is set last
    if (::mkdir(dst.c_str(), mode | S_IRWXU) != 0) throw_errno("cannot create directory", dst);
    note_created(dst);

    uint64_t copied = 0;
    std::error_code ec;
    fs::directory_iterator it(src, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        check_cancelled();

        std::error_code entry_ec;
        auto entry_st = it->symlink_status(entry_ec);
        if (!entry_ec && !fs::is_directory(entry_st) && !fs::is_regular_file(entry_st) &&
            !fs::is_symlink(entry_st)) {
            detail::log(LogLevel::Notice, "skipping special file '%s'", it->path().c_str());
            continue;
        }
        copied += copy_entry(it->path(), dst / it->path().filename());
    }
    if (ec) throw_error_code("cannot read directory", src, ec);

    if (::chmod(dst.c_str(), mode) != 0) throw_errno("cannot set permissions on", dst);

    if (options_.preserve_times()) {
        struct timespec times[2] = {st.st_atim, st.st_mtim};
        if (utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0) throw_errno("cannot set times on", dst);
    }
    return copied;
}

void PasteRun::copy_symlink(const fs::path &src, const fs::path &dst) {
    sender_.send(progress::FileStarted{src, 0});

    std::error_code ec;
    fs::path target = fs::read_symlink(src, ec);
    if (ec) throw_error_code("cannot read link", src, ec);

    fs::create_symlink(target, dst, ec);
    if (ec) throw_error_code("cannot create link", dst, ec);
    note_created(dst);
}

} // namespace

// ============================================================================
// PasteExecutor
// ============================================================================

PasteExecutor::PasteExecutor(CancellationToken token, ProgressSender sender, PasteOptions options)
    : token_(std::move(token)), sender_(std::move(sender)), options_(options) {
    if (options_.chunk_size() == 0) throw Error(EINVAL, "chunk size must be > 0");
    if (options_.queue_depth() <= 0) throw Error(EINVAL, "queue depth must be > 0");
}

PasteResult PasteExecutor::execute(std::span<const fs::path> sources,
                                   const fs::path &destination_dir, bool is_cut,
                                   const ConflictHandler &conflict_handler) {
    auto start_time = std::chrono::steady_clock::now();

    std::error_code ec;
    if (!fs::is_directory(destination_dir, ec)) {
        throw Error(ec ? ec.value() : ENOTDIR,
                    "destination '" + destination_dir.string() + "' is not a directory");
    }

    std::vector<SourceTotals> totals;
    totals.reserve(sources.size());
    size_t total_files = 0;
    uint64_t total_bytes = 0;
    for (const auto &source : sources) {
        totals.push_back(count_source(source));
        total_files += totals.back().files;
        total_bytes += totals.back().bytes;
    }

    aura::Options engine_opts;
    engine_opts.queue_depth(options_.queue_depth())
        .single_thread(true)
        .ring_count(1)
        .ring_select(aura::RingSelect::ThreadLocal);

    std::unique_ptr<PasteRun> run;
    try {
        run = std::make_unique<PasteRun>(engine_opts, options_, token_, sender_, total_bytes);
    } catch (const aura::Error &e) {
        throw Error(e.code(), "cannot start I/O engine");
    }

    sender_.send(progress::Started{total_files, total_bytes});
    detail::log(LogLevel::Info, "%s %zu file%s (%s) into '%s'", is_cut ? "moving" : "copying",
                total_files, total_files == 1 ? "" : "s", format_bytes(total_bytes).c_str(),
                destination_dir.c_str());

    return run->run(sources, totals, destination_dir, is_cut, conflict_handler, start_time);
}

fs::path PasteExecutor::compute_destination(const fs::path &source,
                                            const fs::path &destination_dir) {
    fs::path name = source.filename();
    // "dir/" has an empty filename
    if (name.empty()) name = source.parent_path().filename();
    if (name.empty()) return destination_dir;
    return destination_dir / name;
}

fs::path PasteExecutor::unique_destination(const fs::path &destination) {
    fs::path parent = destination.parent_path();
    std::string stem = destination.stem().string();
    std::string ext = destination.extension().string();

    for (unsigned n = 1;; n++) {
        fs::path candidate = parent / (stem + " (" + std::to_string(n) + ")" + ext);
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(candidate, ec))) return candidate;
    }
}

} // namespace clipxfer
