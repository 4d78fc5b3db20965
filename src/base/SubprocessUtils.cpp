#include "SubprocessUtils.hpp"

#include "InterruptHook.hpp"

extern char** environ;

namespace archtui {
ExecArgs::ExecArgs(const string& command, const vector<string>& args,
                   const vector<pair<string, string>>& envOverrides) {
  auto resolved = resolveExecutable(command);
  if (!resolved) {
    throw std::runtime_error("Command not found: " + command);
  }
  resolvedPath = *resolved;

  argvStorage.push_back(command);
  argvStorage.insert(argvStorage.end(), args.begin(), args.end());
  for (auto& arg : argvStorage) {
    argvPointers.push_back(&arg[0]);
  }
  argvPointers.push_back(NULL);

  for (char** env = environ; env && *env; env++) {
    string entry(*env);
    string name = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (const auto& it : envOverrides) {
      if (it.first == name) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      envStorage.push_back(entry);
    }
  }
  for (const auto& it : envOverrides) {
    envStorage.push_back(it.first + "=" + it.second);
  }
  for (auto& entry : envStorage) {
    envPointers.push_back(&entry[0]);
  }
  envPointers.push_back(NULL);
}

optional<string> ExecArgs::resolveExecutable(const string& command) {
  if (command.empty()) {
    return nullopt;
  }
  if (command.find('/') != string::npos) {
    if (::access(command.c_str(), X_OK) == 0) {
      return command;
    }
    return nullopt;
  }
  const char* pathEnv = ::getenv("PATH");
  string searchPath = pathEnv ? string(pathEnv) : string(_PATH_DEFPATH);
  for (auto dir : split(searchPath, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    string candidate = dir + "/" + command;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return nullopt;
}

int SubprocessUtils::exitCodeFromStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

int SubprocessUtils::waitForExit(pid_t pid) {
  int status = 0;
  while (true) {
    pid_t rc = ::waitpid(pid, &status, 0);
    if (rc == pid) {
      return exitCodeFromStatus(status);
    }
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    // Already reaped by a termination sweep
    LOG(WARNING) << "waitpid(" << pid << ") failed: " << strerror(GetErrno());
    return -1;
  }
}

SubprocessResult SubprocessUtils::SubprocessToStringInteractive(
    const string& command, const vector<string>& args,
    function<void(const string&)> onOutput) {
  ExecArgs execArgs(command, args);
  int link_client[2];
  char buf_client[4096];
  if (::pipe2(link_client, O_CLOEXEC) == -1) {
    throw std::runtime_error(string("pipe() failed: ") + strerror(GetErrno()));
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    InterruptHook::resetSignalsInChild();
    ::setpgid(0, 0);
    dup2(link_client[1], STDOUT_FILENO);
    dup2(link_client[1], STDERR_FILENO);
    execve(execArgs.path(), execArgs.argv(), execArgs.envp());
    static const char msg[] = "execve failed\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
  } else if (pid < 0) {
    int forkErrno = GetErrno();
    ::close(link_client[0]);
    ::close(link_client[1]);
    throw std::runtime_error(string("fork() failed: ") + strerror(forkErrno));
  }

  // Also set from the parent so the group exists before anyone signals it.
  ::setpgid(pid, pid);
  guard->registerChild(pid);
  LOG(INFO) << "Started " << command << " as PID " << pid;
  ::close(link_client[1]);

  SubprocessResult result;
  while (true) {
    ssize_t nbytes = ::read(link_client[0], buf_client, sizeof(buf_client));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    string chunk(buf_client, nbytes);
    result.output += chunk;
    if (onOutput) {
      onOutput(chunk);
    }
  }
  ::close(link_client[0]);

  result.exitCode = waitForExit(pid);
  guard->unregisterChild(pid);
  LOG(INFO) << command << " (PID " << pid << ") exited with "
            << result.exitCode;
  return result;
}

int SubprocessUtils::runAttached(const string& command,
                                 const vector<string>& args) {
  ExecArgs execArgs(command, args);
  bool interactive = ::isatty(STDIN_FILENO);

  pid_t pid = fork();
  if (pid == 0) {
    InterruptHook::resetSignalsInChild();
    ::setpgid(0, 0);
    if (interactive) {
      signal(SIGTTOU, SIG_IGN);
      tcsetpgrp(STDIN_FILENO, getpid());
      signal(SIGTTOU, SIG_DFL);
    }
    execve(execArgs.path(), execArgs.argv(), execArgs.envp());
    static const char msg[] = "execve failed\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
  } else if (pid < 0) {
    throw std::runtime_error(string("fork() failed: ") + strerror(GetErrno()));
  }

  ::setpgid(pid, pid);
  guard->registerChild(pid);
  LOG(INFO) << "Started " << command << " attached to the terminal as PID "
            << pid;

  sigset_t ttou, previous;
  sigemptyset(&ttou);
  sigaddset(&ttou, SIGTTOU);
  if (interactive) {
    pthread_sigmask(SIG_BLOCK, &ttou, &previous);
    tcsetpgrp(STDIN_FILENO, pid);
  }

  int exitCode = waitForExit(pid);
  guard->unregisterChild(pid);

  if (interactive) {
    if (tcsetpgrp(STDIN_FILENO, getpgrp()) == -1) {
      LOG(WARNING) << "Cannot reclaim terminal foreground: "
                   << strerror(GetErrno());
    }
    pthread_sigmask(SIG_SETMASK, &previous, NULL);
  }
  LOG(INFO) << command << " (PID " << pid << ") exited with " << exitCode;
  return exitCode;
}
}  // namespace archtui
