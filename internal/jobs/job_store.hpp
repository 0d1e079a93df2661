#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "jobhub/manager/v1.hpp"

namespace jobhub::jobs {

/*
  In-memory job table keyed and ordered by id.

  Not synchronized: the owning manager serializes every access under its
  own lock, together with the in-flight bookkeeping.
*/
class JobStore {
 public:
  // Throws util::AlreadyExists when the id is taken.
  void Insert(jobhub::manager::v1::Job job);

  // Replaces or inserts.
  void Put(jobhub::manager::v1::Job job);

  bool Contains(const std::string& id) const;

  jobhub::manager::v1::Job*       Find(const std::string& id);
  const jobhub::manager::v1::Job* Find(const std::string& id) const;

  // Throws util::NotFound.
  jobhub::manager::v1::Job&       Get(const std::string& id);
  const jobhub::manager::v1::Job& Get(const std::string& id) const;

  std::vector<jobhub::manager::v1::Job> List() const;
  std::vector<std::string>              Ids() const;

  std::size_t Size() const {
    return jobs_.size();
  }

 private:
  std::map<std::string, jobhub::manager::v1::Job> jobs_;
};

} // namespace jobhub::jobs
