#ifndef CONTAINER_MOCK_RUNTIME_HPP
#define CONTAINER_MOCK_RUNTIME_HPP

#include "container/runtime.hpp"
#include "gmock/gmock.h"

namespace container {

class MockRuntime : public Runtime {
 public:
  MOCK_METHOD1(HasImage, bool(const std::string& tag));
  MOCK_METHOD4(BuildImage,
               void(const std::string& tag, const std::string& dockerfile,
                    std::chrono::milliseconds timeout,
                    const util::CancellationToken* cancel));
  MOCK_METHOD1(Create, std::string(const ContainerSpec& spec));
  MOCK_METHOD1(Start, void(const std::string& container_id));
  MOCK_METHOD1(Exec, executor::CommandResult(const ExecRequest& request));
  MOCK_METHOD1(IsRunning, bool(const std::string& container_id));
  MOCK_METHOD1(Remove, void(const std::string& container_id));
};

}  // namespace container

#endif
