#pragma once
#include "../value.hpp"
#include <cstddef>
#include <string>
#include <unordered_set>

namespace crancache {

// Fixed charge per entry for the timestamp/ttl bookkeeping.
constexpr size_t kEntryMetadataBytes = 24;

// Charged instead of recursing into a container already on the walk path.
constexpr size_t kCircularReferenceUnits = 20;

// Estimated footprint of one cache entry:
// 2 * key length + 2 * serialized value length + metadata.
size_t estimate_entry_size(const std::string& key, const ValuePtr& value);

// 2 * length of the value's JSON text. Falls back to the recursive walk when
// the value cannot be serialized (cycle, invalid UTF-8).
size_t estimate_value_size(const ValuePtr& value);

// Character-unit estimate of a value graph. on_path holds the containers on
// the current recursion path; each is removed again on the way back up, so
// shared (diamond) substructures are counted once per occurrence while cycles
// terminate.
size_t estimate_size_recursive(const Value* value,
                               std::unordered_set<const Value*>& on_path);

} // namespace crancache
