#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/jobs/job_handler.hpp"

namespace jobhub::jobs {

/*
  Maps a job type to its work function. Filled by the composition root
  before the manager starts; read-only afterwards.
*/
class HandlerRegistry {
 public:
  void Register(const std::string& type, std::shared_ptr<JobHandler> handler);

  bool Contains(const std::string& type) const;

  // Throws util::InvalidConfig for an unregistered type.
  std::shared_ptr<JobHandler> Get(const std::string& type) const;

  std::vector<std::string> Types() const;

 private:
  std::map<std::string, std::shared_ptr<JobHandler>> handlers_;
};

} // namespace jobhub::jobs
