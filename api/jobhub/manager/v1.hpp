#pragma once

#include "jobhub/manager/core/v1/job.pb.h"

#include "jobhub/manager/services/v1/job_service.pb.h"

namespace jobhub::manager::v1 {
using namespace ::jobhub::manager::core::v1;
using namespace ::jobhub::manager::services::v1;
}
