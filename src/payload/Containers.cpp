// Repository: simcore
// Component: Payload Containers
// Purpose: Insertion-ordered mapping and set containers keyed by SameValueZero.
// Copyright (c) 2025 simcore

#include "simcore/payload/Containers.hpp"

#include <algorithm>

namespace simcore::payload {

MapContainer::MapContainer(std::initializer_list<Entry> entries) {
  for (const auto& entry : entries) {
    Set(entry.first, entry.second);
  }
}

bool MapContainer::Has(const Value& key) const { return Get(key) != nullptr; }

Value* MapContainer::Get(const Value& key) {
  for (auto& entry : entries_) {
    if (SameValueZero(entry.first, key)) return &entry.second;
  }
  return nullptr;
}

const Value* MapContainer::Get(const Value& key) const {
  for (const auto& entry : entries_) {
    if (SameValueZero(entry.first, key)) return &entry.second;
  }
  return nullptr;
}

void MapContainer::Set(Value key, Value value) {
  if (Value* existing = Get(key)) {
    *existing = std::move(value);
    return;
  }
  entries_.emplace_back(std::move(key), std::move(value));
}

bool MapContainer::Delete(const Value& key) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
    return SameValueZero(entry.first, key);
  });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

SetContainer::SetContainer(std::initializer_list<Value> values) {
  for (const auto& value : values) {
    Add(value);
  }
}

bool SetContainer::Has(const Value& value) const {
  return std::any_of(values_.begin(), values_.end(),
                     [&](const Value& member) { return SameValueZero(member, value); });
}

bool SetContainer::Add(Value value) {
  if (Has(value)) return false;
  values_.push_back(std::move(value));
  return true;
}

bool SetContainer::Delete(const Value& value) {
  auto it = std::find_if(values_.begin(), values_.end(), [&](const Value& member) {
    return SameValueZero(member, value);
  });
  if (it == values_.end()) return false;
  values_.erase(it);
  return true;
}

}  // namespace simcore::payload
