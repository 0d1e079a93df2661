#include "handler_registry.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace jobhub::jobs {

void HandlerRegistry::Register(const std::string& type, std::shared_ptr<JobHandler> handler) {
  if (type.empty()) {
    throw std::runtime_error("handler type must not be empty");
  }
  if (!handler) {
    throw std::runtime_error("handler for type '" + type + "' is null");
  }
  if (!handlers_.emplace(type, std::move(handler)).second) {
    throw util::AlreadyExists("handler already registered for type: " + type);
  }
}

bool HandlerRegistry::Contains(const std::string& type) const {
  return handlers_.count(type) > 0;
}

std::shared_ptr<JobHandler> HandlerRegistry::Get(const std::string& type) const {
  auto it = handlers_.find(type);
  if (it == handlers_.end()) {
    throw util::InvalidConfig("unknown job type: " + type);
  }
  return it->second;
}

std::vector<std::string> HandlerRegistry::Types() const {
  std::vector<std::string> types;
  types.reserve(handlers_.size());
  for (const auto& [type, _] : handlers_) {
    types.push_back(type);
  }
  return types;
}

} // namespace jobhub::jobs
