#ifndef __ARCHTUI_PROCESS_GUARD__
#define __ARCHTUI_PROCESS_GUARD__

#include "Headers.hpp"
#include "ProcessRegistry.hpp"

namespace archtui {
/**
 * @brief Scoped handle that runs the registry's termination sweep when it is
 * destroyed, including during stack unwinding.
 *
 * Hold one for as long as children spawned through it may be running;
 * typically a single guard lives at application scope in main().
 */
class ProcessGuard {
 public:
  /** @brief Binds to the process-wide registry with the default 5s grace. */
  ProcessGuard();

  ProcessGuard(shared_ptr<ProcessRegistry> _registry,
               std::chrono::milliseconds _gracePeriod);

  ~ProcessGuard();

  ProcessGuard(const ProcessGuard&) = delete;
  ProcessGuard& operator=(const ProcessGuard&) = delete;

  void registerChild(pid_t pid) { registry->registerPid(pid); }

  void unregisterChild(pid_t pid) { registry->unregisterPid(pid); }

  size_t childCount() { return registry->count(); }

  shared_ptr<ProcessRegistry> getRegistry() { return registry; }

 protected:
  shared_ptr<ProcessRegistry> registry;
  std::chrono::milliseconds gracePeriod;
};
}  // namespace archtui

#endif  // __ARCHTUI_PROCESS_GUARD__
