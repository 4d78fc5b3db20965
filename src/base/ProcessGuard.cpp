#include "ProcessGuard.hpp"

namespace archtui {
ProcessGuard::ProcessGuard()
    : ProcessGuard(ProcessRegistry::global(),
                   std::chrono::milliseconds(GUARD_GRACE_PERIOD_MS)) {}

ProcessGuard::ProcessGuard(shared_ptr<ProcessRegistry> _registry,
                           std::chrono::milliseconds _gracePeriod)
    : registry(_registry), gracePeriod(_gracePeriod) {}

ProcessGuard::~ProcessGuard() {
  VLOG(1) << "ProcessGuard released, initiating cleanup";
  registry->terminateAll(gracePeriod);
}
}  // namespace archtui
