#include "SignalSender.hpp"

namespace archtui {
int PosixSignalSender::sendSignal(pid_t pid, int signum) {
  if (pid <= 0) {
    return EINVAL;
  }
  // Children are group leaders, so the group signal also reaches anything
  // the tool itself spawned.
  if (::kill(-pid, signum) == 0) {
    return 0;
  }
  int groupErrno = GetErrno();
  if (groupErrno != ESRCH && groupErrno != EPERM) {
    return groupErrno;
  }
  VLOG(1) << "PID " << pid << " does not lead a process group ("
          << strerror(groupErrno) << "), signalling it directly";
  if (::kill(pid, signum) == 0) {
    return 0;
  }
  return GetErrno();
}

bool PosixSignalSender::isAlive(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  int status;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == pid) {
    VLOG(1) << "Reaped child process " << pid;
    return false;
  }
  if (::kill(pid, 0) == 0) {
    return true;
  }
  return GetErrno() == EPERM;
}
}  // namespace archtui
