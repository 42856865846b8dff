#include "sandbox/sandbox.hpp"

#include "sandbox/unix.hpp"

namespace sandbox {

std::unique_ptr<Sandbox> CreateSandbox() {
  return std::unique_ptr<Sandbox>(new UnixSandbox());
}

}  // namespace sandbox
