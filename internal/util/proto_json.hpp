#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace rollout::util {

/*
  Protobuf JSON mapping used for every operator-readable record on disk
  (session records, backup metadata). Field names keep their proto
  spelling so records grep the same as the .proto files.
*/

std::string ToJson(const google::protobuf::Message& message);

// Throws std::runtime_error on malformed input.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace rollout::util
