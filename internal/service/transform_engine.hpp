#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/parameter_set.hpp"

namespace mediacache::service {

struct TransformInvocation {
  std::string                        operation;
  std::vector<std::filesystem::path> input_paths;
  std::filesystem::path              output_path;
  model::ParameterSet                parameters;
};

struct TransformResult {
  bool        success = false;
  std::string log;
};

/*
  External transformation engine (trimmer, analyzer, encoder...).

  Must write its output to invocation.output_path. Only success and a
  non-empty output file are checked; the log is passed through.
*/
class TransformEngine {
 public:
  virtual ~TransformEngine() = default;

  virtual TransformResult Run(const TransformInvocation& invocation) = 0;
};

} // namespace mediacache::service
