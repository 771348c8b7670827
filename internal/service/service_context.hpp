#pragma once

#include <memory>

namespace refinery::engine {
class Engineer;
}

namespace refinery::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<refinery::engine::Engineer> engineer;
};

} // namespace refinery::service
