#include "envelope.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::model {

ledger::v1::EventEnvelope ToEnvelope(const Event& event) {
  ledger::v1::EventEnvelope envelope;
  envelope.set_event_id(event.event_id);
  envelope.set_stream_id(event.stream_id);
  envelope.set_version(event.version);
  envelope.set_type(event.type);
  envelope.set_payload(event.payload);
  envelope.set_correlation_id(event.correlation_id);
  envelope.set_causation_id(event.causation_id);
  *envelope.mutable_occurred_at() = util::ToProto(util::FromUnixMillis(event.occurred_at_ms));
  return envelope;
}

Event FromEnvelope(const ledger::v1::EventEnvelope& envelope) {
  Event event;
  event.event_id       = envelope.event_id();
  event.stream_id      = envelope.stream_id();
  event.version        = envelope.version();
  event.type           = envelope.type();
  event.payload        = envelope.payload();
  event.correlation_id = envelope.correlation_id();
  event.causation_id   = envelope.causation_id();
  if (envelope.has_occurred_at()) {
    event.occurred_at_ms = util::ToUnixMillis(util::FromProto(envelope.occurred_at()));
  }
  return event;
}

std::string ToJson(const Event& event, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToEnvelope(event), &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to encode envelope: " + std::string(status.message()));
  }
  return json;
}

Event FromJson(const std::string& json) {
  ledger::v1::EventEnvelope                envelope;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &envelope, options);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid envelope: " + std::string(status.message()));
  }
  return FromEnvelope(envelope);
}

} // namespace ledger::model
