/**
 * @file clipxfer.hpp
 * @brief Main header for clipxfer
 *
 * clipxfer is the file-transfer engine behind clipboard copy/cut/paste in
 * a file manager: it copies or moves files and directory trees, reports
 * progress as events, honours cooperative cancellation and resolves
 * name collisions with a caller-supplied policy. Data is moved through
 * AuraIO (io_uring).
 *
 * Example:
 * @code
 * #include <clipxfer.hpp>
 *
 * int main() {
 *     clipxfer::ClipboardManager clipboard;
 *     clipboard.copy({"/tmp/report.pdf"});
 *
 *     auto rx = clipboard.setup_progress_channel();
 *     auto token = clipboard.start_paste();
 *     clipxfer::PasteExecutor executor(token, *clipboard.progress_sender());
 *
 *     auto result = executor.execute(clipboard.paths(), "/home/me/Documents", clipboard.is_cut(),
 *                                    clipxfer::fixed_policy(clipxfer::ConflictResolution::KeepBoth));
 *     clipboard.complete_paste(clipboard.is_cut());
 *     return result.is_success() ? 0 : 1;
 * }
 * @endcode
 */

#ifndef CLIPXFER_HPP
#define CLIPXFER_HPP

#include <clipxfer/fwd.hpp>
#include <clipxfer/error.hpp>
#include <clipxfer/log.hpp>
#include <clipxfer/conflict.hpp>
#include <clipxfer/cancellation.hpp>
#include <clipxfer/speed_tracker.hpp>
#include <clipxfer/operation.hpp>
#include <clipxfer/progress.hpp>
#include <clipxfer/channel.hpp>
#include <clipxfer/options.hpp>
#include <clipxfer/executor.hpp>
#include <clipxfer/manager.hpp>
#include <clipxfer/format.hpp>

#endif // CLIPXFER_HPP
