#ifndef __ARCHTUI_PTY_ERROR__
#define __ARCHTUI_PTY_ERROR__

#include "Headers.hpp"

namespace archtui {
enum class PtyErrorKind {
  DEVICE_ALLOCATION,
  SPAWN,
  HANDLE_ACQUISITION,
  WRITE,
  READ,
  RESIZE,
  NOT_RUNNING,
};

/**
 * @brief Failure of a PtySession operation.
 */
class PtyException : public std::runtime_error {
 public:
  PtyException(PtyErrorKind _kind, const string& detail)
      : std::runtime_error(describe(_kind, detail)), kind(_kind) {}

  PtyErrorKind getKind() const { return kind; }

  static string describe(PtyErrorKind kind, const string& detail) {
    string prefix;
    switch (kind) {
      case PtyErrorKind::DEVICE_ALLOCATION:
        prefix = "Failed to open PTY";
        break;
      case PtyErrorKind::SPAWN:
        prefix = "Failed to spawn command";
        break;
      case PtyErrorKind::HANDLE_ACQUISITION:
        prefix = "Failed to acquire PTY handle";
        break;
      case PtyErrorKind::WRITE:
        prefix = "Failed to write to PTY";
        break;
      case PtyErrorKind::READ:
        prefix = "Failed to read from PTY";
        break;
      case PtyErrorKind::RESIZE:
        prefix = "Failed to resize PTY";
        break;
      case PtyErrorKind::NOT_RUNNING:
        return "PTY is not running";
    }
    return detail.empty() ? prefix : prefix + ": " + detail;
  }

 protected:
  PtyErrorKind kind;
};
}  // namespace archtui

#endif  // __ARCHTUI_PTY_ERROR__
