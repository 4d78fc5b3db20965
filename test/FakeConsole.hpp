#ifndef __ARCHTUI_FAKE_CONSOLE__
#define __ARCHTUI_FAKE_CONSOLE__

#include "Console.hpp"
#include "RawFdUtils.hpp"

namespace archtui {
/**
 * @brief Console that records everything painted on it and reads "key
 * presses" from a pipe the test writes into.
 */
class FakeConsole : public Console {
 public:
  FakeConsole(int rows = 24, int cols = 80) : setupCount(0), teardownCount(0) {
    size.rows = rows;
    size.cols = cols;
    FATAL_FAIL(::pipe(inputPipe));
  }

  virtual ~FakeConsole() {
    RawFdUtils::closeIfOpen(&inputPipe[0]);
    RawFdUtils::closeIfOpen(&inputPipe[1]);
  }

  virtual void setup() {
    lock_guard<std::mutex> lock(consoleMutex);
    setupCount++;
  }

  virtual void teardown() {
    lock_guard<std::mutex> lock(consoleMutex);
    teardownCount++;
  }

  virtual TerminalSize getTerminalSize() {
    lock_guard<std::mutex> lock(consoleMutex);
    return size;
  }

  void setTerminalSize(int rows, int cols) {
    lock_guard<std::mutex> lock(consoleMutex);
    size.rows = rows;
    size.cols = cols;
  }

  virtual int getFd() { return -1; }

  virtual int getInputFd() { return inputPipe[0]; }

  virtual void write(const string& s) {
    lock_guard<std::mutex> lock(consoleMutex);
    output += s;
  }

  /** @brief Makes `keys` readable on the input descriptor. */
  void typeInput(const string& keys) {
    RawFdUtils::writeAll(inputPipe[1], keys.data(), keys.size());
  }

  /** @brief Closes the input side so the console reads end of file. */
  void closeInput() { RawFdUtils::closeIfOpen(&inputPipe[1]); }

  string getOutput() {
    lock_guard<std::mutex> lock(consoleMutex);
    return output;
  }

  int getSetupCount() {
    lock_guard<std::mutex> lock(consoleMutex);
    return setupCount;
  }

  int getTeardownCount() {
    lock_guard<std::mutex> lock(consoleMutex);
    return teardownCount;
  }

 protected:
  std::mutex consoleMutex;
  TerminalSize size;
  string output;
  int inputPipe[2];
  int setupCount;
  int teardownCount;
};
}  // namespace archtui

#endif  // __ARCHTUI_FAKE_CONSOLE__
