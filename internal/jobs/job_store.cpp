#include "job_store.hpp"

#include "internal/util/errors.hpp"

namespace jobhub::jobs {

using jobhub::manager::v1::Job;

void JobStore::Insert(Job job) {
  auto id = job.id();
  if (!jobs_.emplace(id, std::move(job)).second) {
    throw util::AlreadyExists("job already exists: " + id);
  }
}

void JobStore::Put(Job job) {
  auto id   = job.id();
  jobs_[id] = std::move(job);
}

bool JobStore::Contains(const std::string& id) const {
  return jobs_.count(id) > 0;
}

Job* JobStore::Find(const std::string& id) {
  auto it = jobs_.find(id);
  return it == jobs_.end() ? nullptr : &it->second;
}

const Job* JobStore::Find(const std::string& id) const {
  auto it = jobs_.find(id);
  return it == jobs_.end() ? nullptr : &it->second;
}

Job& JobStore::Get(const std::string& id) {
  if (auto* job = Find(id)) {
    return *job;
  }
  throw util::NotFound("job not found: " + id);
}

const Job& JobStore::Get(const std::string& id) const {
  if (const auto* job = Find(id)) {
    return *job;
  }
  throw util::NotFound("job not found: " + id);
}

std::vector<Job> JobStore::List() const {
  std::vector<Job> jobs;
  jobs.reserve(jobs_.size());
  for (const auto& [_, job] : jobs_) {
    jobs.push_back(job);
  }
  return jobs;
}

std::vector<std::string> JobStore::Ids() const {
  std::vector<std::string> ids;
  ids.reserve(jobs_.size());
  for (const auto& [id, _] : jobs_) {
    ids.push_back(id);
  }
  return ids;
}

} // namespace jobhub::jobs
