#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/parameter_set.hpp"

namespace mediacache::model {

/*
  Append-only audit entry, one per successful registration.

  output ---> produced by operation(inputs, parameters)
*/
struct OperationRecord {
  std::string              output_id;
  std::string              operation;
  std::vector<std::string> input_ids;
  ParameterSet             parameters;

  // event timestamp (epoch ms)
  int64_t timestamp_ms = 0;

  google::protobuf::Struct unknown_fields;
};

} // namespace mediacache::model
