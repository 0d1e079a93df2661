#pragma once

#include <chrono>
#include <memory>

namespace jobhub::core {
class JobManager;
}

namespace jobhub::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<jobhub::core::JobManager> manager;

  // Inactivity on an event stream before a ping is sent.
  std::chrono::seconds keepalive_interval{30};
};

} // namespace jobhub::service
