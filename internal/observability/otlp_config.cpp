#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace jobhub::observability {

OtlpConfig OtlpConfigFrom(const jobhub::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == jobhub::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                     : OtlpTransport::kGrpc;
  return otlp_config;
}

} // namespace jobhub::observability
