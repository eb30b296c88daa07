/**
 * @file fwd.hpp
 * @brief Forward declarations for clipxfer
 */

#ifndef CLIPXFER_FWD_HPP
#define CLIPXFER_FWD_HPP

namespace clipxfer {

class Error;
class CancellationToken;
class SpeedTracker;
class ClipboardOperation;
struct ClipboardEntry;
struct PasteProgress;
struct PasteResult;
class ProgressSender;
class ProgressReceiver;
class PasteOptions;
class PasteExecutor;
class ClipboardManager;

enum class ConflictResolution;

} // namespace clipxfer

#endif // CLIPXFER_FWD_HPP
