#include "job_definition.hpp"

#include <string>

#include "internal/schedule/schedule.hpp"
#include "internal/util/errors.hpp"

namespace jobhub::jobs {

using namespace jobhub::manager::v1;

Job FromDefinition(const JobDefinition& definition, util::TimePoint now) {
  Job job;
  job.set_id(definition.id());
  job.set_name(definition.name());
  job.set_description(definition.description());
  job.set_type(definition.type());
  job.set_category(definition.category());
  *job.mutable_tags()     = definition.tags();
  *job.mutable_schedule() = definition.schedule();
  *job.mutable_config()   = definition.config();
  job.set_enabled(definition.enabled());

  job.set_state(JOB_STATE_IDLE);
  *job.mutable_created_at() = util::ToProto(now);
  *job.mutable_updated_at() = util::ToProto(now);
  return job;
}

JobDefinition ToDefinition(const Job& job) {
  JobDefinition definition;
  definition.set_id(job.id());
  definition.set_name(job.name());
  definition.set_description(job.description());
  definition.set_type(job.type());
  definition.set_category(job.category());
  *definition.mutable_tags()     = job.tags();
  *definition.mutable_schedule() = job.schedule();
  *definition.mutable_config()   = job.config();
  definition.set_enabled(job.enabled());
  return definition;
}

void ApplyPatch(const JobPatch& patch, Job& job) {
  if (patch.has_name()) {
    job.set_name(patch.name());
  }
  if (patch.has_description()) {
    job.set_description(patch.description());
  }
  if (patch.has_type()) {
    job.set_type(patch.type());
  }
  if (patch.has_category()) {
    job.set_category(patch.category());
  }
  if (patch.replace_tags() || patch.tags_size() > 0) {
    *job.mutable_tags() = patch.tags();
  }
  if (patch.has_schedule()) {
    *job.mutable_schedule() = patch.schedule();
  }
  if (patch.has_config()) {
    *job.mutable_config() = patch.config();
  }
  if (patch.has_enabled()) {
    job.set_enabled(patch.enabled());
  }
}

void ValidateJob(const Job& job, const HandlerRegistry& handlers) {
  if (job.name().empty()) {
    throw util::InvalidConfig("job name is required");
  }
  if (job.type().empty()) {
    throw util::InvalidConfig("job type is required");
  }
  if (!handlers.Contains(job.type())) {
    std::string known;
    for (const auto& type : handlers.Types()) {
      known += known.empty() ? type : ", " + type;
    }
    throw util::InvalidConfig("unknown job type: " + job.type() + " (registered: " + known + ")");
  }
  schedule::ValidateSchedule(job.schedule());
  handlers.Get(job.type())->Validate(job.config());
}

} // namespace jobhub::jobs
