// Repository: simcore
// Component: Payload Containers
// Purpose: Insertion-ordered mapping and set containers keyed by SameValueZero.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_PAYLOAD_CONTAINERS_HPP_
#define SIMCORE_PAYLOAD_CONTAINERS_HPP_

#include <initializer_list>
#include <utility>
#include <vector>

#include "simcore/payload/Value.hpp"

namespace simcore::payload {

class MapContainer {
 public:
  using Entry = std::pair<Value, Value>;

  MapContainer() = default;
  MapContainer(std::initializer_list<Entry> entries);

  size_t Size() const { return entries_.size(); }
  bool Has(const Value& key) const;
  // nullptr when absent.
  Value* Get(const Value& key);
  const Value* Get(const Value& key) const;

  // Overwrites in place, keeping the original insertion position.
  void Set(Value key, Value value);
  bool Delete(const Value& key);
  void Clear() { entries_.clear(); }

  const std::vector<Entry>& Entries() const { return entries_; }
  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

 private:
  std::vector<Entry> entries_;
};

class SetContainer {
 public:
  SetContainer() = default;
  SetContainer(std::initializer_list<Value> values);

  size_t Size() const { return values_.size(); }
  bool Has(const Value& value) const;
  // Returns false if already present.
  bool Add(Value value);
  bool Delete(const Value& value);
  void Clear() { values_.clear(); }

  const std::vector<Value>& Values() const { return values_; }
  std::vector<Value>::const_iterator begin() const { return values_.begin(); }
  std::vector<Value>::const_iterator end() const { return values_.end(); }

 private:
  std::vector<Value> values_;
};

}  // namespace simcore::payload

#endif  // SIMCORE_PAYLOAD_CONTAINERS_HPP_
