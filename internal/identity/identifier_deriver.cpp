#include "identifier_deriver.hpp"

#include "internal/util/digest.hpp"

namespace mediacache::identity {

namespace {

bool IsLowerAlnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool IsLowerHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

char ToLowerAscii(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string_view BaseName(std::string_view path) {
  const auto slash = path.find_last_of("/\\");
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

std::string NormalizeName(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char raw : name) {
    const char c = ToLowerAscii(raw);
    if (IsLowerAlnum(c)) {
      out.push_back(c);
    } else if (!out.empty() && out.back() != '_') {
      out.push_back('_');
    }
  }
  while (!out.empty() && out.back() == '_') {
    out.pop_back();
  }
  return out;
}

std::string SourceId(std::string_view filename) {
  return std::string(kSourcePrefix) + NormalizeName(BaseName(filename));
}

std::string OperationTag(std::string_view operation) {
  auto tag = NormalizeName(operation);
  if (tag.empty()) {
    return "op";
  }
  if (tag.compare(0, 3, "src") == 0) {
    return "op_" + tag;
  }
  return tag;
}

std::string CanonicalDerivation(const std::vector<std::string>& input_ids, std::string_view operation,
                                const model::ParameterSet& parameters) {
  std::string text = "{\"inputs\":[";
  for (std::size_t i = 0; i < input_ids.size(); ++i) {
    if (i) text.push_back(',');
    text.append(model::QuoteJson(input_ids[i]));
  }
  text.append("],\"operation\":");
  text.append(model::QuoteJson(model::TrimKey(operation)));
  text.append(",\"params\":");
  text.append(parameters.Canonical());
  text.push_back('}');
  return text;
}

std::string DerivedId(const std::vector<std::string>& input_ids, std::string_view operation, const model::ParameterSet& parameters) {
  const auto digest = util::Sha256Hex(CanonicalDerivation(input_ids, operation, parameters));
  return OperationTag(operation) + "_" + digest.substr(0, kDigestPrefixChars);
}

bool IsSourceId(std::string_view id) {
  return id.substr(0, kSourcePrefix.size()) == kSourcePrefix;
}

bool IsDerivedId(std::string_view id) {
  if (id.size() < kDigestPrefixChars + 2 || IsSourceId(id)) {
    return false;
  }
  const auto sep = id.size() - kDigestPrefixChars - 1;
  if (id[sep] != '_') {
    return false;
  }
  for (std::size_t i = sep + 1; i < id.size(); ++i) {
    if (!IsLowerHex(id[i])) {
      return false;
    }
  }
  for (std::size_t i = 0; i < sep; ++i) {
    if (!IsLowerAlnum(id[i]) && id[i] != '_') {
      return false;
    }
  }
  return true;
}

} // namespace mediacache::identity
