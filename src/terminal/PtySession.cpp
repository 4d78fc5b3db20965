#include "PtySession.hpp"

#include "InterruptHook.hpp"
#include "RawFdUtils.hpp"
#include "SubprocessUtils.hpp"

namespace archtui {
namespace {
/** @brief Polling interval of the reader so it notices stopReader. */
const int READER_POLL_MS = 100;
/** @brief How long the destructor waits for a killed child to be reaped. */
const int TEARDOWN_REAP_MS = 1000;
}  // namespace

PtySession::PtySession(int _cols, int _rows, size_t scrollbackLines,
                       shared_ptr<ProcessGuard> _guard,
                       const vector<pair<string, string>>& _environment)
    : emulator(max(1, _rows), max(1, _cols), scrollbackLines),
      cols(max(1, _cols)),
      rows(max(1, _rows)),
      guard(_guard),
      environment(_environment),
      masterFd(-1),
      writerFd(-1),
      childPid(-1),
      stopReader(false),
      running(false),
      reaped(false) {}

PtySession::~PtySession() {
  kill();
  stopReader = true;
  if (readerThread.joinable()) {
    readerThread.join();
  }

  if (childPid > 0) {
    std::lock_guard<std::mutex> lock(stateMutex);
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(TEARDOWN_REAP_MS);
    while (!reaped && std::chrono::steady_clock::now() < deadline) {
      reapLocked();
      if (!reaped) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
    if (!reaped) {
      // Stays registered, the guard's sweep will deal with it
      LOG(WARNING) << "Child " << childPid << " did not exit after SIGKILL";
    }
  }

  RawFdUtils::closeIfOpen(&writerFd);
  RawFdUtils::closeIfOpen(&masterFd);
}

vector<pair<string, string>> PtySession::defaultEnvironment() {
  return {{"TERM", "xterm-256color"}, {"COLORTERM", "truecolor"}};
}

void PtySession::spawnCommand(const string& path, const vector<string>& args) {
  if (childPid > 0) {
    throw PtyException(PtyErrorKind::SPAWN, "session already has a child");
  }

  // Everything the child needs is allocated before fork()
  shared_ptr<ExecArgs> execArgs;
  try {
    execArgs.reset(new ExecArgs(path, args, environment));
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Cannot spawn " << path << ": " << ex.what();
    throw PtyException(PtyErrorKind::SPAWN, ex.what());
  }

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_row = rows;
  win.ws_col = cols;
  int master = -1;
  int slave = -1;
  if (::openpty(&master, &slave, NULL, NULL, &win) == -1) {
    int localErrno = GetErrno();
    LOG(ERROR) << "openpty failed: " << strerror(localErrno);
    throw PtyException(PtyErrorKind::DEVICE_ALLOCATION, strerror(localErrno));
  }
  // Neither side of the PTY may leak into unrelated children
  FATAL_FAIL(::fcntl(master, F_SETFD, FD_CLOEXEC));

  // The child reports a failed exec through this pipe; a successful exec
  // closes it
  int errorPipe[2];
  if (::pipe2(errorPipe, O_CLOEXEC) == -1) {
    int localErrno = GetErrno();
    ::close(master);
    ::close(slave);
    throw PtyException(PtyErrorKind::SPAWN,
                       string("pipe() failed: ") + strerror(localErrno));
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    ::close(errorPipe[0]);
    InterruptHook::resetSignalsInChild();
    // login_tty() starts a new session (and process group) and makes the
    // slave our controlling terminal and stdio
    if (::login_tty(slave) == -1) {
      int err = errno;
      ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
      (void)ignored;
      _exit(127);
    }
    ::execve(execArgs->path(), execArgs->argv(), execArgs->envp());
    int err = errno;
    ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  ::close(slave);
  ::close(errorPipe[1]);
  if (pid < 0) {
    int localErrno = GetErrno();
    ::close(errorPipe[0]);
    ::close(master);
    LOG(ERROR) << "fork failed: " << strerror(localErrno);
    throw PtyException(PtyErrorKind::SPAWN,
                       string("fork() failed: ") + strerror(localErrno));
  }
  if (guard) {
    guard->registerChild(pid);
  }

  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(errorPipe[0]);
  if (rc == ssize_t(sizeof(childErrno))) {
    ::close(master);
    abandonChild(pid);
    LOG(ERROR) << "exec of " << path << " failed: " << strerror(childErrno);
    throw PtyException(PtyErrorKind::SPAWN, strerror(childErrno));
  }

  int writer = ::dup(master);
  if (writer == -1) {
    int localErrno = GetErrno();
    ::close(master);
    abandonChild(pid);
    throw PtyException(PtyErrorKind::HANDLE_ACQUISITION, strerror(localErrno));
  }
  FATAL_FAIL(::fcntl(writer, F_SETFD, FD_CLOEXEC));

  masterFd = master;
  writerFd = writer;
  childPid = pid;
  {
    std::lock_guard<std::mutex> lock(stateMutex);
    running = true;
    reaped = false;
    exitCode.reset();
  }
  stopReader = false;
  try {
    readerThread = std::thread(&PtySession::readerLoop, this);
  } catch (const std::system_error& ex) {
    RawFdUtils::closeIfOpen(&writerFd);
    RawFdUtils::closeIfOpen(&masterFd);
    childPid = -1;
    {
      std::lock_guard<std::mutex> lock(stateMutex);
      running = false;
    }
    abandonChild(pid);
    throw PtyException(PtyErrorKind::HANDLE_ACQUISITION,
                       string("cannot start reader thread: ") + ex.what());
  }
  LOG(INFO) << "Spawned " << path << " on a " << cols << "x" << rows
            << " PTY as PID " << pid;
}

void PtySession::abandonChild(pid_t pid) {
  if (::kill(-pid, SIGKILL) == -1) {
    ::kill(pid, SIGKILL);
  }
  int status;
  while (::waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
  }
  if (guard) {
    guard->unregisterChild(pid);
  }
}

void PtySession::readerLoop() {
  char buf[PTY_READ_CHUNK_SIZE];
  while (!stopReader) {
    if (!RawFdUtils::waitOnData(masterFd, READER_POLL_MS)) {
      continue;
    }
    ssize_t rc = ::read(masterFd, buf, sizeof(buf));
    if (rc > 0) {
      std::lock_guard<std::mutex> lock(outputMutex);
      pendingOutput.append(buf, rc);
      continue;
    }
    if (rc < 0) {
      int localErrno = GetErrno();
      if (localErrno == EINTR || localErrno == EAGAIN) {
        continue;
      }
      if (localErrno == EIO) {
        // Linux reports a closed slave side as EIO
        VLOG(1) << "PTY of PID " << childPid << " closed";
      } else {
        LOG(WARNING) << "Reading PTY of PID " << childPid
                     << " failed: " << strerror(localErrno);
      }
    } else {
      VLOG(1) << "PTY of PID " << childPid << " reached end of stream";
    }
    break;
  }
  std::lock_guard<std::mutex> lock(stateMutex);
  running = false;
}

bool PtySession::processOutput() {
  string output;
  {
    std::lock_guard<std::mutex> lock(outputMutex);
    output.swap(pendingOutput);
  }
  if (output.empty()) {
    return false;
  }
  emulator.process(output);
  string replies = emulator.takeReplies();
  if (!replies.empty() && writerFd >= 0) {
    try {
      RawFdUtils::writeAll(writerFd, replies.data(), replies.size());
    } catch (const std::runtime_error& ex) {
      LOG(WARNING) << "Cannot answer terminal query of PID " << childPid
                   << ": " << ex.what();
    }
  }
  return true;
}

void PtySession::sendInput(const string& bytes) {
  if (writerFd < 0) {
    throw PtyException(PtyErrorKind::NOT_RUNNING, "");
  }
  try {
    RawFdUtils::writeAll(writerFd, bytes.data(), bytes.size());
  } catch (const std::runtime_error& ex) {
    throw PtyException(PtyErrorKind::WRITE, ex.what());
  }
}

void PtySession::sendKey(const KeyEvent& event) {
  string bytes = KeyEncoder::encode(event);
  if (bytes.empty()) {
    return;
  }
  sendInput(bytes);
}

bool PtySession::isRunning() {
  std::lock_guard<std::mutex> lock(stateMutex);
  if (running) {
    reapLocked();
    if (reaped) {
      running = false;
    }
  }
  return running;
}

optional<int> PtySession::exitStatus() {
  std::lock_guard<std::mutex> lock(stateMutex);
  reapLocked();
  return exitCode;
}

void PtySession::reapLocked() {
  if (reaped || childPid <= 0) {
    return;
  }
  int status;
  pid_t rc = ::waitpid(childPid, &status, WNOHANG);
  if (rc == 0) {
    return;
  }
  if (rc == childPid) {
    exitCode = SubprocessUtils::exitCodeFromStatus(status);
    LOG(INFO) << "PID " << childPid << " exited with " << *exitCode;
  } else if (GetErrno() == EINTR) {
    return;
  } else {
    // Someone else (a termination sweep) reaped it, the code is lost
    VLOG(1) << "waitpid(" << childPid << ") failed: " << strerror(GetErrno());
  }
  reaped = true;
  running = false;
  if (guard) {
    guard->unregisterChild(childPid);
  }
}

void PtySession::resize(int _cols, int _rows) {
  cols = max(1, _cols);
  rows = max(1, _rows);
  emulator.setSize(rows, cols);
  if (masterFd < 0) {
    return;
  }
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_row = rows;
  win.ws_col = cols;
  if (::ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    int localErrno = GetErrno();
    LOG(WARNING) << "TIOCSWINSZ failed: " << strerror(localErrno);
    throw PtyException(PtyErrorKind::RESIZE, strerror(localErrno));
  }
}

void PtySession::kill() {
  if (childPid <= 0) {
    return;
  }
  // Holding stateMutex keeps the PID from being reaped, and so reused,
  // between the check and the signal
  std::lock_guard<std::mutex> lock(stateMutex);
  reapLocked();
  if (reaped) {
    return;
  }
  if (::kill(-childPid, SIGKILL) == -1 && ::kill(childPid, SIGKILL) == -1) {
    VLOG(1) << "kill(" << childPid << ") failed: " << strerror(GetErrno());
  }
}

void PtySession::render(Console* console, const Rect& area,
                        const string& title) {
  processOutput();
  TerminalRenderer::render(console, emulator.screen(), area, title);
}
}  // namespace archtui
