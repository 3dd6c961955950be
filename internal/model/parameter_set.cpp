#include "parameter_set.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <vector>

#include "internal/util/errors.hpp"

namespace mediacache::model {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53
constexpr int    kFractionDigits  = 6;

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

void AppendCanonical(const google::protobuf::Value& value, std::string* out);

void AppendCanonicalStruct(const google::protobuf::Struct& fields, std::string* out) {
  std::vector<std::string> keys;
  keys.reserve(fields.fields_size());
  for (const auto& [key, unused] : fields.fields()) {
    keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());

  out->push_back('{');
  bool first = true;
  for (const auto& key : keys) {
    if (!first) {
      out->push_back(',');
    }
    first = false;
    out->append(QuoteJson(key));
    out->push_back(':');
    AppendCanonical(fields.fields().at(key), out);
  }
  out->push_back('}');
}

void AppendCanonical(const google::protobuf::Value& value, std::string* out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      out->append(value.bool_value() ? "true" : "false");
      return;
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::isfinite(number)) {
        out->append(CanonicalNumber(number));
      } else {
        out->append(QuoteJson(CanonicalNumber(number)));
      }
      return;
    }
    case google::protobuf::Value::kStringValue:
      out->append(QuoteJson(value.string_value()));
      return;
    case google::protobuf::Value::kListValue: {
      out->push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) {
          out->push_back(',');
        }
        first = false;
        AppendCanonical(item, out);
      }
      out->push_back(']');
      return;
    }
    case google::protobuf::Value::kStructValue:
      AppendCanonicalStruct(value.struct_value(), out);
      return;
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
    default:
      out->append("null");
      return;
  }
}

// Non-finite numbers cannot be persisted as JSON numbers; keep them as the
// strings they canonicalize to. Nested keys get the same trimming as top-level ones.
google::protobuf::Value Normalize(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue: {
      if (std::isfinite(value.number_value())) {
        return value;
      }
      google::protobuf::Value text;
      text.set_string_value(CanonicalNumber(value.number_value()));
      return text;
    }
    case google::protobuf::Value::kListValue: {
      google::protobuf::Value list;
      auto*                   items = list.mutable_list_value();
      for (const auto& item : value.list_value().values()) {
        *items->add_values() = Normalize(item);
      }
      return list;
    }
    case google::protobuf::Value::kStructValue: {
      google::protobuf::Value nested;
      auto*                   fields = nested.mutable_struct_value()->mutable_fields();
      for (const auto& [key, item] : value.struct_value().fields()) {
        (*fields)[TrimKey(key)] = Normalize(item);
      }
      return nested;
    }
    default:
      return value;
  }
}

} // namespace

std::string TrimKey(std::string_view key) {
  std::size_t begin = 0;
  std::size_t end   = key.size();
  while (begin < end && IsSpace(key[begin])) ++begin;
  while (end > begin && IsSpace(key[end - 1])) --end;
  return std::string(key.substr(begin, end - begin));
}

std::string CanonicalNumber(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? "inf" : "-inf";
  }

  if (std::trunc(value) == value && std::fabs(value) < kMaxExactInteger) {
    return std::to_string(static_cast<int64_t>(value));
  }

  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::fixed << std::setprecision(kFractionDigits) << value;
  std::string text = out.str();

  const auto dot = text.find('.');
  if (dot != std::string::npos) {
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();
  }
  if (text == "-0") {
    text = "0";
  }
  return text;
}

std::string QuoteJson(std::string_view text) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (char c : text) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      default: {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20) {
          out.append("\\u00");
          out.push_back(kHex[(byte >> 4) & 0x0F]);
          out.push_back(kHex[byte & 0x0F]);
        } else {
          out.push_back(c);
        }
      }
    }
  }
  out.push_back('"');
  return out;
}

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendCanonical(value, &out);
  return out;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

ParameterSet ParameterSet::FromStruct(const google::protobuf::Struct& fields) {
  ParameterSet params;
  for (const auto& [key, value] : fields.fields()) {
    params.Set(key, value);
  }
  return params;
}

ParameterSet ParameterSet::FromJson(const std::string& json) {
  google::protobuf::Struct fields;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &fields);
  if (!status.ok()) {
    throw util::InvalidArgument("parameters must be a JSON object: " + std::string(status.message()));
  }
  return FromStruct(fields);
}

ParameterSet& ParameterSet::Set(std::string_view key, int value) {
  return Set(key, static_cast<double>(value));
}

ParameterSet& ParameterSet::Set(std::string_view key, int64_t value) {
  return Set(key, static_cast<double>(value));
}

ParameterSet& ParameterSet::Set(std::string_view key, double value) {
  Value v;
  v.set_number_value(value);
  return Set(key, v);
}

ParameterSet& ParameterSet::Set(std::string_view key, bool value) {
  Value v;
  v.set_bool_value(value);
  return Set(key, v);
}

ParameterSet& ParameterSet::Set(std::string_view key, const char* value) {
  return Set(key, std::string(value));
}

ParameterSet& ParameterSet::Set(std::string_view key, const std::string& value) {
  Value v;
  v.set_string_value(value);
  return Set(key, v);
}

ParameterSet& ParameterSet::Set(std::string_view key, const Value& value) {
  entries_[TrimKey(key)] = Normalize(value);
  return *this;
}

const ParameterSet::Value* ParameterSet::Find(std::string_view key) const {
  auto it = entries_.find(TrimKey(key));
  return it == entries_.end() ? nullptr : &it->second;
}

// ------------------------------------------------------------
// Canonical form
// ------------------------------------------------------------

std::string ParameterSet::Canonical() const {
  // entries_ is already key-ordered
  std::string out;
  out.push_back('{');
  bool first = true;
  for (const auto& [key, value] : entries_) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out.append(QuoteJson(key));
    out.push_back(':');
    AppendCanonical(value, &out);
  }
  out.push_back('}');
  return out;
}

google::protobuf::Struct ParameterSet::ToStruct() const {
  google::protobuf::Struct fields;
  for (const auto& [key, value] : entries_) {
    (*fields.mutable_fields())[key] = value;
  }
  return fields;
}

bool ParameterSet::operator==(const ParameterSet& other) const {
  return Canonical() == other.Canonical();
}

} // namespace mediacache::model
