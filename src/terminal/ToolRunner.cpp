#include "ToolRunner.hpp"


namespace archtui {
namespace {
const int INPUT_BUFFER_SIZE = 1024;
const int EXIT_STATUS_WAIT_MS = 1000;
}  // namespace

ToolRunner::ToolRunner(shared_ptr<Console> _console,
                       shared_ptr<ProcessGuard> _guard,
                       const DashboardConfig& _config)
    : console(_console),
      guard(_guard),
      config(_config),
      shuttingDown(false),
      inputClosed(false) {}

int ToolRunner::run(const string& command, const vector<string>& args,
                    const string& title) {
  Rect inner = TerminalRenderer::innerArea(
      consoleArea(console->getTerminalSize()));
  shared_ptr<PtySession> session(
      new PtySession(inner.width, inner.height, config.scrollbackLines, guard,
                     config.terminalEnvironment()));
  try {
    session->spawnCommand(command, args);
  } catch (const PtyException& ex) {
    LOG(WARNING) << "Cannot run " << command
                 << " in a PTY, running it attached instead: " << ex.what();
    session.reset();
    return runAttached(command, args);
  }

  console->setup();
  int exitCode;
  try {
    exitCode = runLoop(session.get(), title);
  } catch (const std::exception&) {
    console->teardown();
    throw;
  }
  console->teardown();
  return exitCode;
}

int ToolRunner::runHeadless(const string& command,
                            const vector<string>& args) {
  SubprocessUtils subprocessUtils(guard);
  SubprocessResult result = subprocessUtils.SubprocessToStringInteractive(
      command, args, [](const string& chunk) {
        RawFdUtils::writeAll(STDOUT_FILENO, chunk.data(), chunk.size());
      });
  return result.exitCode;
}

int ToolRunner::runAttached(const string& command,
                            const vector<string>& args) {
  SubprocessUtils subprocessUtils(guard);
  return subprocessUtils.runAttached(command, args);
}

void ToolRunner::shutdown() {
  lock_guard<std::mutex> lock(shutdownMutex);
  shuttingDown = true;
}

bool ToolRunner::isShuttingDown() {
  lock_guard<std::mutex> lock(shutdownMutex);
  return shuttingDown;
}

int ToolRunner::runLoop(PtySession* session, const string& title) {
  TerminalSize lastSize = console->getTerminalSize();
  Rect area = consoleArea(lastSize);
  bool dirty = true;
  int inputFd = console->getInputFd();

  while (!isShuttingDown() && session->isRunning()) {
    fd_set rfd;
    timeval tv;
    FD_ZERO(&rfd);
    int maxfd = -1;
    if (!inputClosed) {
      FD_SET(inputFd, &rfd);
      maxfd = inputFd;
    }
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    select(maxfd + 1, &rfd, NULL, NULL, &tv);

    if (!inputClosed && FD_ISSET(inputFd, &rfd)) {
      forwardInput(session);
    }

    TerminalSize size = console->getTerminalSize();
    if (size != lastSize) {
      VLOG(1) << "Console resized to " << size.cols << "x" << size.rows;
      lastSize = size;
      area = consoleArea(size);
      Rect inner = TerminalRenderer::innerArea(area);
      try {
        session->resize(inner.width, inner.height);
      } catch (const PtyException& ex) {
        LOG(WARNING) << ex.what();
      }
      console->write("\x1b[0m\x1b[2J");
      dirty = true;
    }

    if (session->processOutput()) {
      dirty = true;
    }
    if (dirty) {
      session->render(console.get(), area, title);
      dirty = false;
    }
  }

  if (isShuttingDown()) {
    session->kill();
  }
  optional<int> exitCode = waitForExitStatus(session);
  session->render(console.get(), area, finishedTitle(title, exitCode));
  if (!isShuttingDown()) {
    waitForKey();
  }
  return exitCode ? *exitCode : 1;
}

void ToolRunner::forwardInput(PtySession* session) {
  char buf[INPUT_BUFFER_SIZE];
  ssize_t rc = ::read(console->getInputFd(), buf, sizeof(buf));
  if (rc < 0) {
    if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
      return;
    }
    throw std::runtime_error(string("Cannot read console input: ") +
                             strerror(GetErrno()));
  }
  if (rc == 0) {
    LOG(INFO) << "Console input closed";
    inputClosed = true;
    return;
  }
  for (const auto& event : keyDecoder.decode(buf, rc)) {
    try {
      session->sendKey(event);
    } catch (const PtyException& ex) {
      // The tool is on its way out; isRunning() will notice
      LOG(WARNING) << ex.what();
      return;
    }
  }
}

optional<int> ToolRunner::waitForExitStatus(PtySession* session) {
  for (int attempt = 0; attempt < 2; attempt++) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(EXIT_STATUS_WAIT_MS);
    while (std::chrono::steady_clock::now() < deadline) {
      optional<int> exitCode = session->exitStatus();
      if (exitCode) {
        return exitCode;
      }
      if (session->getPid() <= 0) {
        return nullopt;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    // The PTY closed but the child lingers
    LOG(WARNING) << "PID " << session->getPid()
                 << " still alive after its PTY closed, killing it";
    session->kill();
  }
  return nullopt;
}

void ToolRunner::waitForKey() {
  int inputFd = console->getInputFd();
  while (!inputClosed && !isShuttingDown()) {
    if (!RawFdUtils::waitOnData(inputFd, 100)) {
      continue;
    }
    char c;
    ssize_t rc = ::read(inputFd, &c, 1);
    if (rc < 0 && (GetErrno() == EINTR || GetErrno() == EAGAIN)) {
      continue;
    }
    return;
  }
}

string ToolRunner::finishedTitle(const string& title, optional<int> exitCode) {
  string status;
  if (!exitCode) {
    status = "finished";
  } else if (*exitCode > 128) {
    status = string("killed by ") + strsignal(*exitCode - 128);
  } else {
    status = "exited with " + to_string(*exitCode);
  }
  return title + " [" + status + ", press any key]";
}
}  // namespace archtui
