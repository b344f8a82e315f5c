// Repository: simcore
// Component: Immutable Containers
// Purpose: Read-only list, record, mapping and set snapshots.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_SNAPSHOT_IMMUTABLE_CONTAINERS_HPP_
#define SIMCORE_SNAPSHOT_IMMUTABLE_CONTAINERS_HPP_

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "simcore/snapshot/ImmutableValue.hpp"

namespace simcore::snapshot {

// Callbacks passed to ForEach receive the wrapper itself as the container
// argument, never the backing store. ValueOf() likewise returns the wrapper.

class ImmutableList {
 public:
  explicit ImmutableList(SnapshotKey) {}

  using const_iterator = std::vector<ImmutableValue>::const_iterator;
  using Callback =
      std::function<void(const ImmutableValue&, size_t, const ImmutableList&)>;

  size_t Size() const { return items_.size(); }
  bool Empty() const { return items_.empty(); }
  // Throws std::out_of_range.
  const ImmutableValue& At(size_t index) const;

  const_iterator begin() const { return items_.begin(); }
  const_iterator end() const { return items_.end(); }

  void ForEach(const Callback& callback) const;
  const ImmutableList& ValueOf() const { return *this; }

  [[noreturn]] void Set(size_t index, const payload::Value& value) const;
  [[noreturn]] void Push(const payload::Value& value) const;
  [[noreturn]] void Pop() const;
  [[noreturn]] void Clear() const;

 private:
  friend class SnapshotBuilder;

  std::vector<ImmutableValue> items_;
};

class ImmutableRecord {
 public:
  explicit ImmutableRecord(SnapshotKey) {}

  using Fields = std::map<std::string, ImmutableValue>;
  using const_iterator = Fields::const_iterator;
  using Callback = std::function<void(const ImmutableValue&, const std::string&,
                                      const ImmutableRecord&)>;

  size_t Size() const { return fields_.size(); }
  bool Has(const std::string& key) const { return fields_.count(key) > 0; }
  // Null snapshot when absent.
  const ImmutableValue& Get(const std::string& key) const;
  // nullptr when absent.
  const ImmutableValue* Find(const std::string& key) const;
  std::vector<std::string> Keys() const;

  const_iterator begin() const { return fields_.begin(); }
  const_iterator end() const { return fields_.end(); }

  void ForEach(const Callback& callback) const;
  const ImmutableRecord& ValueOf() const { return *this; }

  [[noreturn]] void Set(const std::string& key, const payload::Value& value) const;
  [[noreturn]] void Erase(const std::string& key) const;
  [[noreturn]] void Clear() const;

 private:
  friend class SnapshotBuilder;

  Fields fields_;
};

class ImmutableMap {
 public:
  explicit ImmutableMap(SnapshotKey) {}

  using Entry = std::pair<ImmutableValue, ImmutableValue>;
  using const_iterator = std::vector<Entry>::const_iterator;
  using Callback = std::function<void(const ImmutableValue& value,
                                      const ImmutableValue& key,
                                      const ImmutableMap& map)>;

  size_t Size() const { return entries_.size(); }
  bool Has(const ImmutableValue& key) const { return Get(key) != nullptr; }
  // nullptr when absent.
  const ImmutableValue* Get(const ImmutableValue& key) const;
  std::vector<ImmutableValue> Keys() const;
  std::vector<ImmutableValue> Values() const;
  const std::vector<Entry>& Entries() const { return entries_; }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

  void ForEach(const Callback& callback) const;
  const ImmutableMap& ValueOf() const { return *this; }

  [[noreturn]] void Set(const payload::Value& key, const payload::Value& value) const;
  [[noreturn]] void Delete(const payload::Value& key) const;
  [[noreturn]] void Clear() const;

 private:
  friend class SnapshotBuilder;

  std::vector<Entry> entries_;
};

class ImmutableSet {
 public:
  explicit ImmutableSet(SnapshotKey) {}

  using const_iterator = std::vector<ImmutableValue>::const_iterator;
  // value and key are the same member, matching set iteration conventions.
  using Callback = std::function<void(const ImmutableValue& value,
                                      const ImmutableValue& key,
                                      const ImmutableSet& set)>;

  size_t Size() const { return values_.size(); }
  bool Has(const ImmutableValue& value) const;
  const std::vector<ImmutableValue>& Values() const { return values_; }

  const_iterator begin() const { return values_.begin(); }
  const_iterator end() const { return values_.end(); }

  void ForEach(const Callback& callback) const;
  const ImmutableSet& ValueOf() const { return *this; }

  [[noreturn]] void Add(const payload::Value& value) const;
  [[noreturn]] void Delete(const payload::Value& value) const;
  [[noreturn]] void Clear() const;

 private:
  friend class SnapshotBuilder;

  std::vector<ImmutableValue> values_;
};

}  // namespace simcore::snapshot

#endif  // SIMCORE_SNAPSHOT_IMMUTABLE_CONTAINERS_HPP_
