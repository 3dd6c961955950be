#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace mediacache::model {

/*
  Operation parameters.

  Keys are kept sorted and trimmed; values are JSON values. The same object
  feeds identifier hashing, persistence and the transformation request, so a
  setting always canonicalizes the same way.

  Canonical form (what gets hashed):
    - keys sorted, nested objects sorted recursively, no whitespace
    - numbers by value: integral and |x| < 2^53 prints as an integer
      (5 == 5.0), otherwise fixed notation with 6 fractional digits and
      trailing zeros removed; -0 prints as 0
    - NaN / +inf / -inf print as the strings "nan", "inf", "-inf"
*/
class ParameterSet {
 public:
  using Value = google::protobuf::Value;
  using Map   = std::map<std::string, Value>;

  ParameterSet() = default;

  static ParameterSet FromStruct(const google::protobuf::Struct& fields);

  // Throws util::InvalidArgument unless `json` is a JSON object.
  static ParameterSet FromJson(const std::string& json);

  ParameterSet& Set(std::string_view key, int value);
  ParameterSet& Set(std::string_view key, int64_t value);
  ParameterSet& Set(std::string_view key, double value);
  ParameterSet& Set(std::string_view key, bool value);
  ParameterSet& Set(std::string_view key, const char* value);
  ParameterSet& Set(std::string_view key, const std::string& value);
  ParameterSet& Set(std::string_view key, const Value& value);

  const Value* Find(std::string_view key) const;

  const Map& Entries() const {
    return entries_;
  }
  bool Empty() const {
    return entries_.empty();
  }
  std::size_t Size() const {
    return entries_.size();
  }

  std::string              Canonical() const;
  google::protobuf::Struct ToStruct() const;

  // Equal when the canonical forms match.
  bool operator==(const ParameterSet& other) const;
  bool operator!=(const ParameterSet& other) const {
    return !(*this == other);
  }

 private:
  Map entries_;
};

std::string CanonicalNumber(double value);
std::string CanonicalJson(const google::protobuf::Value& value);
std::string QuoteJson(std::string_view text);
std::string TrimKey(std::string_view key);

} // namespace mediacache::model
