#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/parameter_set.hpp"

namespace mediacache::identity {

/*
  Deterministic identifiers.

  SourceId("clip.mp4")                          -> "src_clip_mp4"
  DerivedId({"src_clip_mp4"}, "trim", params)   -> "trim_<16 hex>"

  Source names: directory stripped, whole name lowercased (extension
  included), every byte outside [a-z0-9] becomes '_', runs collapse, edges
  are stripped. Derived IDs hash the ordered inputs, the operation and the
  canonical parameters with SHA-256; their tag never starts with "src" so
  the two namespaces cannot collide.
*/

inline constexpr std::string_view kSourcePrefix      = "src_";
inline constexpr std::size_t      kDigestPrefixChars = 16;

std::string SourceId(std::string_view filename);

std::string DerivedId(const std::vector<std::string>& input_ids, std::string_view operation, const model::ParameterSet& parameters);

// Text that DerivedId hashes.
std::string CanonicalDerivation(const std::vector<std::string>& input_ids, std::string_view operation,
                                const model::ParameterSet& parameters);

// Lowercase, non-alphanumerics to single '_', trimmed.
std::string NormalizeName(std::string_view name);

// Readable prefix of a derived ID for `operation`.
std::string OperationTag(std::string_view operation);

bool IsSourceId(std::string_view id);

// "<tag>_<16 lowercase hex>"
bool IsDerivedId(std::string_view id);

} // namespace mediacache::identity
