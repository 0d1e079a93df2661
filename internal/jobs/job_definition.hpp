#pragma once

#include "internal/jobs/handler_registry.hpp"
#include "internal/util/time.hpp"
#include "jobhub/manager/v1.hpp"

namespace jobhub::jobs {

// Fresh IDLE job from a definition; created_at/updated_at set to `now`.
jobhub::manager::v1::Job FromDefinition(const jobhub::manager::v1::JobDefinition& definition, util::TimePoint now);

jobhub::manager::v1::JobDefinition ToDefinition(const jobhub::manager::v1::Job& job);

// Overlays the fields present in `patch`; runtime fields are untouched.
void ApplyPatch(const jobhub::manager::v1::JobPatch& patch, jobhub::manager::v1::Job& job);

/*
  Throws util::InvalidConfig when:
    - name is empty
    - type has no registered handler
    - the schedule cannot produce run times
    - the handler rejects the config
*/
void ValidateJob(const jobhub::manager::v1::Job& job, const HandlerRegistry& handlers);

} // namespace jobhub::jobs
