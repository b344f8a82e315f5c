// Repository: simcore
// Component: Immutable Containers
// Purpose: Read-only list, record, mapping and set snapshots.
// Copyright (c) 2025 simcore

#include "simcore/snapshot/ImmutableContainers.hpp"

#include <algorithm>
#include <stdexcept>

namespace simcore::snapshot {

// =============================================================================
// ImmutableList
// =============================================================================

const ImmutableValue& ImmutableList::At(size_t index) const {
  if (index >= items_.size()) {
    throw std::out_of_range("ImmutableList index " + std::to_string(index) +
                            " out of range (size " + std::to_string(items_.size()) +
                            ")");
  }
  return items_[index];
}

void ImmutableList::ForEach(const Callback& callback) const {
  for (size_t i = 0; i < items_.size(); ++i) {
    callback(items_[i], i, *this);
  }
}

void ImmutableList::Set(size_t, const payload::Value&) const { RejectMutation("list", "set element"); }
void ImmutableList::Push(const payload::Value&) const { RejectMutation("list", "push"); }
void ImmutableList::Pop() const { RejectMutation("list", "pop"); }
void ImmutableList::Clear() const { RejectMutation("list", "clear"); }

// =============================================================================
// ImmutableRecord
// =============================================================================

const ImmutableValue& ImmutableRecord::Get(const std::string& key) const {
  const ImmutableValue* found = Find(key);
  return found ? *found : ImmutableValue::Null();
}

const ImmutableValue* ImmutableRecord::Find(const std::string& key) const {
  auto it = fields_.find(key);
  return it == fields_.end() ? nullptr : &it->second;
}

std::vector<std::string> ImmutableRecord::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(fields_.size());
  for (const auto& [key, value] : fields_) {
    keys.push_back(key);
  }
  return keys;
}

void ImmutableRecord::ForEach(const Callback& callback) const {
  for (const auto& [key, value] : fields_) {
    callback(value, key, *this);
  }
}

void ImmutableRecord::Set(const std::string&, const payload::Value&) const {
  RejectMutation("record", "set field");
}
void ImmutableRecord::Erase(const std::string&) const { RejectMutation("record", "erase field"); }
void ImmutableRecord::Clear() const { RejectMutation("record", "clear"); }

// =============================================================================
// ImmutableMap
// =============================================================================

const ImmutableValue* ImmutableMap::Get(const ImmutableValue& key) const {
  for (const auto& entry : entries_) {
    if (SameValueZero(entry.first, key)) return &entry.second;
  }
  return nullptr;
}

std::vector<ImmutableValue> ImmutableMap::Keys() const {
  std::vector<ImmutableValue> keys;
  keys.reserve(entries_.size());
  for (const auto& entry : entries_) {
    keys.push_back(entry.first);
  }
  return keys;
}

std::vector<ImmutableValue> ImmutableMap::Values() const {
  std::vector<ImmutableValue> values;
  values.reserve(entries_.size());
  for (const auto& entry : entries_) {
    values.push_back(entry.second);
  }
  return values;
}

void ImmutableMap::ForEach(const Callback& callback) const {
  for (const auto& entry : entries_) {
    callback(entry.second, entry.first, *this);
  }
}

void ImmutableMap::Set(const payload::Value&, const payload::Value&) const {
  RejectMutation("map", "set");
}
void ImmutableMap::Delete(const payload::Value&) const { RejectMutation("map", "delete"); }
void ImmutableMap::Clear() const { RejectMutation("map", "clear"); }

// =============================================================================
// ImmutableSet
// =============================================================================

bool ImmutableSet::Has(const ImmutableValue& value) const {
  return std::any_of(values_.begin(), values_.end(), [&](const ImmutableValue& member) {
    return SameValueZero(member, value);
  });
}

void ImmutableSet::ForEach(const Callback& callback) const {
  for (const auto& member : values_) {
    callback(member, member, *this);
  }
}

void ImmutableSet::Add(const payload::Value&) const { RejectMutation("set", "add"); }
void ImmutableSet::Delete(const payload::Value&) const { RejectMutation("set", "delete"); }
void ImmutableSet::Clear() const { RejectMutation("set", "clear"); }

}  // namespace simcore::snapshot
