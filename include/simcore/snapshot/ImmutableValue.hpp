// Repository: simcore
// Component: Immutable Snapshot
// Purpose: Deeply read-only value graph produced from a payload at admission.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_SNAPSHOT_IMMUTABLE_VALUE_HPP_
#define SIMCORE_SNAPSHOT_IMMUTABLE_VALUE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "simcore/payload/Value.hpp"

namespace simcore::snapshot {

// Raised synchronously by every mutating operation on a snapshot.
class ImmutableSnapshotError : public std::logic_error {
 public:
  explicit ImmutableSnapshotError(const std::string& what) : std::logic_error(what) {}
};

// Throws ImmutableSnapshotError naming the rejected operation.
[[noreturn]] void RejectMutation(const char* target, const char* operation);

// Passkey for the wrapper constructors used with std::make_shared; only
// SnapshotBuilder can mint one.
class SnapshotKey {
 private:
  friend class SnapshotBuilder;
  SnapshotKey() {}
};

class ImmutableList;
class ImmutableRecord;
class ImmutableMap;
class ImmutableSet;
class ImmutableByteBuffer;
class ImmutableSharedByteBuffer;
class ImmutableNumericArray;
class ImmutableDate;
class ImmutablePattern;
class SnapshotBuilder;

namespace detail {
template <typename T>
struct IsSharedPtr : std::false_type {};
template <typename T>
struct IsSharedPtr<std::shared_ptr<T>> : std::true_type {};
}  // namespace detail

// =============================================================================
// ImmutableValue
// Handle onto one node of a snapshot. Kinds mirror payload::ValueKind; every
// container node is a dedicated wrapper exposing only read operations, and
// the wrappers' mutators throw ImmutableSnapshotError.
// =============================================================================

class ImmutableValue {
 public:
  using Storage = std::variant<std::monostate,
                               bool,
                               double,
                               std::string,
                               std::shared_ptr<const ImmutableList>,
                               std::shared_ptr<const ImmutableRecord>,
                               std::shared_ptr<const ImmutableMap>,
                               std::shared_ptr<const ImmutableSet>,
                               std::shared_ptr<const ImmutableByteBuffer>,
                               std::shared_ptr<const ImmutableSharedByteBuffer>,
                               std::shared_ptr<const ImmutableNumericArray>,
                               std::shared_ptr<const ImmutableDate>,
                               std::shared_ptr<const ImmutablePattern>>;

  // Primitive snapshots are constructible directly; they are values.
  ImmutableValue() = default;
  ImmutableValue(std::nullptr_t) {}
  ImmutableValue(bool value) : storage_(value) {}
  ImmutableValue(int value) : storage_(static_cast<double>(value)) {}
  ImmutableValue(int64_t value) : storage_(static_cast<double>(value)) {}
  ImmutableValue(double value) : storage_(value) {}
  ImmutableValue(const char* value) : storage_(std::string(value)) {}
  ImmutableValue(std::string value) : storage_(std::move(value)) {}

  payload::ValueKind kind() const {
    return static_cast<payload::ValueKind>(storage_.index());
  }

  bool IsNull() const { return kind() == payload::ValueKind::kNull; }
  bool IsBoolean() const { return kind() == payload::ValueKind::kBoolean; }
  bool IsNumber() const { return kind() == payload::ValueKind::kNumber; }
  bool IsString() const { return kind() == payload::ValueKind::kString; }

  // Kind mismatch throws std::bad_variant_access.
  bool AsBool() const { return std::get<bool>(storage_); }
  double AsNumber() const { return std::get<double>(storage_); }
  const std::string& AsString() const { return std::get<std::string>(storage_); }
  const ImmutableList& AsList() const;
  const ImmutableRecord& AsRecord() const;
  const ImmutableMap& AsMap() const;
  const ImmutableSet& AsSet() const;
  const ImmutableByteBuffer& AsByteBuffer() const;
  const ImmutableSharedByteBuffer& AsSharedByteBuffer() const;
  const ImmutableNumericArray& AsNumericArray() const;
  const ImmutableDate& AsDate() const;
  const ImmutablePattern& AsPattern() const;

  // Record field (null snapshot if absent) and list element shorthands.
  const ImmutableValue& Get(const std::string& key) const;
  const ImmutableValue& At(size_t index) const;

  // Node identity; nullptr for primitives.
  const void* Identity() const;

  // Calls visitor with the primitive or with a const reference to the wrapper.
  template <typename Visitor>
  decltype(auto) Visit(Visitor&& visitor) const {
    return std::visit(
        [&visitor](const auto& alt) -> decltype(auto) {
          using T = std::decay_t<decltype(alt)>;
          if constexpr (detail::IsSharedPtr<T>::value) {
            return visitor(*alt);
          } else {
            return visitor(alt);
          }
        },
        storage_);
  }

  // Explicit deep-copy escape: a fresh payload graph that shares nothing with
  // this snapshot. Shared nodes stay shared within the copy.
  payload::Value ToMutable() const;

  static const ImmutableValue& Null();

 private:
  friend class SnapshotBuilder;

  explicit ImmutableValue(Storage storage) : storage_(std::move(storage)) {}

  Storage storage_;
};

static_assert(std::variant_size_v<ImmutableValue::Storage> ==
                  std::variant_size_v<payload::Value::Storage>,
              "ImmutableValue must mirror every payload kind");

// Primitives by value (NaN equals NaN), nodes by identity.
bool SameValueZero(const ImmutableValue& a, const ImmutableValue& b);

// Deep comparison: same kind and same contents at every level. Containers
// compare in iteration order; buffers compare bytes; numeric arrays compare
// element type and elements; dates compare time; patterns compare source,
// flags and lastIndex.
bool StructurallyEqual(const ImmutableValue& a, const ImmutableValue& b);

}  // namespace simcore::snapshot

#endif  // SIMCORE_SNAPSHOT_IMMUTABLE_VALUE_HPP_
