/**
 * @file manager.cpp
 * @brief ClipboardManager implementation
 */

#include <clipxfer/manager.hpp>

#include "log.hpp"

#include <utility>

namespace clipxfer {

void ClipboardManager::copy(std::vector<std::filesystem::path> paths) {
    set_operation(ClipboardOperation::copy(std::move(paths)));
}

void ClipboardManager::cut(std::vector<std::filesystem::path> paths) {
    set_operation(ClipboardOperation::cut(std::move(paths)));
}

void ClipboardManager::clear() { archive_current(); }

void ClipboardManager::set_operation(ClipboardOperation operation) {
    archive_current();
    detail::log(LogLevel::Debug, "clipboard: %s %zu path%s", operation.is_cut() ? "cut" : "copy",
                operation.paths().size(), operation.paths().size() == 1 ? "" : "s");
    operation_ = std::move(operation);
}

void ClipboardManager::archive_current() {
    if (!operation_) return;
    history_.emplace_front(std::move(*operation_));
    operation_.reset();
    while (history_.size() > MAX_HISTORY) history_.pop_back();
}

std::span<const std::filesystem::path> ClipboardManager::paths() const noexcept {
    if (!operation_) return {};
    return operation_->paths();
}

bool ClipboardManager::contains_path(const std::filesystem::path &path) const {
    return operation_ && operation_->contains(path);
}

bool ClipboardManager::is_path_cut(const std::filesystem::path &path) const {
    return is_cut() && operation_->contains(path);
}

ProgressReceiver ClipboardManager::setup_progress_channel() {
    auto [sender, receiver] = make_progress_channel();
    progress_sender_ = std::move(sender);
    return receiver;
}

CancellationToken ClipboardManager::start_paste() {
    CancellationToken token;
    active_paste_ = token;
    return token;
}

void ClipboardManager::cancel_paste() {
    if (active_paste_) active_paste_->cancel();
}

bool ClipboardManager::is_paste_active() const noexcept {
    return active_paste_ && !active_paste_->is_cancelled();
}

void ClipboardManager::complete_paste(bool was_cut) {
    active_paste_.reset();
    progress_sender_.reset();
    if (was_cut) operation_.reset();
}

} // namespace clipxfer
