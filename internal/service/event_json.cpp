#include "event_json.hpp"

#include <stdexcept>
#include <string>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/model/job_state.hpp"
#include "internal/util/time.hpp"

namespace jobhub::service {

using namespace jobhub::manager::v1;

namespace {

void SetString(google::protobuf::Struct& object, const std::string& key, std::string_view value) {
  (*object.mutable_fields())[key].set_string_value(std::string(value));
}

std::string_view TypeName(EventType type) {
  switch (type) {
    case EVENT_TYPE_CONNECTED:
      return "connected";
    case EVENT_TYPE_JOB_UPDATE:
      return "job_update";
    case EVENT_TYPE_PING:
      return "ping";
    default:
      throw std::invalid_argument("event type is unspecified");
  }
}

} // namespace

std::string EncodeEventJson(const JobEvent& event) {
  google::protobuf::Struct object;
  SetString(object, "type", TypeName(event.type()));

  if (event.type() == EVENT_TYPE_JOB_UPDATE) {
    const auto& update = event.update();
    SetString(object, "jobId", update.job_id());
    SetString(object, "executionId", update.execution_id());
    SetString(object, "status", model::UpdateKindName(update.kind()));
    SetString(object, "message", update.message());
  }

  const auto& stamp = event.type() == EVENT_TYPE_JOB_UPDATE && util::IsSet(event.update().timestamp()) ? event.update().timestamp() : event.timestamp();
  SetString(object, "timestamp", util::FormatRfc3339(util::FromProto(stamp)));

  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(object, &out);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode event: " + status.ToString());
  }
  return out;
}

} // namespace jobhub::service
