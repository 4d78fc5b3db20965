#ifndef __ARCHTUI_SUBPROCESS_UTILS__
#define __ARCHTUI_SUBPROCESS_UTILS__

#include "Headers.hpp"
#include "ProcessGuard.hpp"

namespace archtui {
/**
 * @brief argv/envp for execve(), built in the parent before fork().
 *
 * Nothing that allocates may run between fork() and exec() in a threaded
 * process, so the child only ever touches the pointers prepared here.
 */
class ExecArgs {
 public:
  /**
   * @brief Resolves `command` against PATH and copies the environment,
   * applying `envOverrides` (NAME -> value).
   * @throws std::runtime_error if the command cannot be found.
   */
  ExecArgs(const string& command, const vector<string>& args,
           const vector<pair<string, string>>& envOverrides = {});

  const char* path() const { return resolvedPath.c_str(); }
  char* const* argv() { return &argvPointers[0]; }
  char* const* envp() { return &envPointers[0]; }

  /**
   * @brief Looks `command` up the way execvp() would.
   * @return The executable path, or an empty optional if none matches.
   */
  static optional<string> resolveExecutable(const string& command);

 protected:
  string resolvedPath;
  vector<string> argvStorage;
  vector<char*> argvPointers;
  vector<string> envStorage;
  vector<char*> envPointers;
};

/**
 * @brief Exit code and combined stdout/stderr of a captured subprocess.
 */
struct SubprocessResult {
  int exitCode;
  string output;
};

/**
 * @brief Runs commands outside of a PTY, each in its own process group and
 * registered with a ProcessGuard for as long as it runs.
 */
class SubprocessUtils {
 public:
  explicit SubprocessUtils(shared_ptr<ProcessGuard> _guard) : guard(_guard) {}

  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with stdout and stderr captured through a pipe.
   * @param onOutput Optional callback invoked with each chunk as it arrives.
   * @return Exit code (128 + signal when killed) and the captured output.
   * @throws std::runtime_error if the pipe or fork fails or the command
   * cannot be found.
   */
  virtual SubprocessResult SubprocessToStringInteractive(
      const string& command, const vector<string>& args,
      function<void(const string&)> onOutput = nullptr);

  /**
   * @brief Runs a command attached directly to this process' terminal, with
   * the terminal foreground handed to its process group while it runs.
   * @return Exit code (128 + signal when killed).
   */
  virtual int runAttached(const string& command, const vector<string>& args);

  /** @brief Converts a waitpid() status to a shell-style exit code. */
  static int exitCodeFromStatus(int status);

 protected:
  shared_ptr<ProcessGuard> guard;

  /** @brief Blocks until `pid` exits, retrying on EINTR. */
  int waitForExit(pid_t pid);
};
}  // namespace archtui

#endif  // __ARCHTUI_SUBPROCESS_UTILS__
