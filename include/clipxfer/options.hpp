/**
 * @file options.hpp
 * @brief Options builder class for PasteExecutor
 */

#ifndef CLIPXFER_OPTIONS_HPP
#define CLIPXFER_OPTIONS_HPP

#include <cstddef>

namespace clipxfer {

/**
 * Paste executor configuration
 *
 * Uses builder pattern for fluent configuration.
 *
 * Example:
 * @code
 * clipxfer::PasteOptions opts;
 * opts.chunk_size(128 * 1024)
 *     .fsync(false)
 *     .preserve_times(true);
 *
 * clipxfer::PasteExecutor executor(token, sender, opts);
 * @endcode
 */
class PasteOptions {
  public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
    static constexpr int DEFAULT_QUEUE_DEPTH = 64;

    /**
     * Set the streaming buffer size
     * @param bytes Chunk size (default: 64 KiB, must be > 0)
     * @return Reference to this for chaining
     * @note Validated by PasteExecutor's constructor
     */
    PasteOptions &chunk_size(size_t bytes) noexcept {
        chunk_size_ = bytes;
        return *this;
    }

    /**
     * Flush each finished file with fdatasync
     * @param enable true to flush (default: true)
     * @return Reference to this for chaining
     */
    PasteOptions &fsync(bool enable = true) noexcept {
        fsync_ = enable;
        return *this;
    }

    /**
     * Copy access and modification times onto each destination file
     * @param enable true to preserve (default: false)
     * @return Reference to this for chaining
     */
    PasteOptions &preserve_times(bool enable = true) noexcept {
        preserve_times_ = enable;
        return *this;
    }

    /**
     * Set the I/O engine queue depth
     * @param depth Queue depth (default: 64, must be > 0)
     * @return Reference to this for chaining
     */
    PasteOptions &queue_depth(int depth) noexcept {
        queue_depth_ = depth;
        return *this;
    }

    [[nodiscard]] size_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] bool fsync() const noexcept { return fsync_; }
    [[nodiscard]] bool preserve_times() const noexcept { return preserve_times_; }
    [[nodiscard]] int queue_depth() const noexcept { return queue_depth_; }

  private:
    size_t chunk_size_ = DEFAULT_CHUNK_SIZE;
    bool fsync_ = true;
    bool preserve_times_ = false;
    int queue_depth_ = DEFAULT_QUEUE_DEPTH;
};

} // namespace clipxfer

#endif // CLIPXFER_OPTIONS_HPP
