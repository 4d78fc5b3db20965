#ifndef __ARCHTUI_CONSOLE__
#define __ARCHTUI_CONSOLE__

#include "Headers.hpp"
#include "RawFdUtils.hpp"

namespace archtui {
/**
 * @brief Size of the real terminal in character cells.
 */
struct TerminalSize {
  int rows = 0;
  int cols = 0;

  bool operator==(const TerminalSize& other) const {
    return rows == other.rows && cols == other.cols;
  }
  bool operator!=(const TerminalSize& other) const { return !(*this == other); }
};

/**
 * @brief Abstract console that embedded tools are painted onto.
 */
class Console {
 public:
  virtual ~Console() = default;

  /** @brief Returns the current console dimensions. */
  virtual TerminalSize getTerminalSize() = 0;
  /** @brief Prepares the console (raw mode, alternate screen). */
  virtual void setup() = 0;
  /** @brief Restores the console state saved by setup(). */
  virtual void teardown() = 0;
  /** @brief Descriptor that receives painted output. */
  virtual int getFd() = 0;
  /** @brief Descriptor that key presses are read from. */
  virtual int getInputFd() = 0;

  /** @brief Writes UTF-8 / escape sequences to the console. */
  virtual void write(const string& s) {
    RawFdUtils::writeAll(getFd(), s.data(), s.length());
  }
};
}  // namespace archtui

#endif  // __ARCHTUI_CONSOLE__
