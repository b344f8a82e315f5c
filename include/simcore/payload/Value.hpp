// Repository: simcore
// Component: Payload Value
// Purpose: Mutable, caller-owned payload value graph submitted with commands.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_PAYLOAD_VALUE_HPP_
#define SIMCORE_PAYLOAD_VALUE_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace simcore::payload {

class Value;
class MapContainer;
class SetContainer;
class ByteBuffer;
class SharedByteBuffer;
class NumericArray;
class Date;
class Pattern;

using List = std::vector<Value>;
using Record = std::map<std::string, Value>;

// Order matches Value::Storage alternatives.
enum class ValueKind {
  kNull = 0,
  kBoolean,
  kNumber,
  kString,
  kList,
  kRecord,
  kMap,
  kSet,
  kByteBuffer,
  kSharedByteBuffer,
  kNumericArray,
  kDate,
  kPattern,
};

const char* ValueKindToString(ValueKind kind);

// =============================================================================
// Value
// Closed tagged variant. Primitives are held inline; every container kind is
// held through a shared_ptr, so copying a Value aliases the container the same
// way two references to one object would.
// =============================================================================

class Value {
 public:
  using Storage = std::variant<std::monostate,
                               bool,
                               double,
                               std::string,
                               std::shared_ptr<List>,
                               std::shared_ptr<Record>,
                               std::shared_ptr<MapContainer>,
                               std::shared_ptr<SetContainer>,
                               std::shared_ptr<ByteBuffer>,
                               std::shared_ptr<SharedByteBuffer>,
                               std::shared_ptr<NumericArray>,
                               std::shared_ptr<Date>,
                               std::shared_ptr<Pattern>>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool value) : storage_(value) {}
  Value(int value) : storage_(static_cast<double>(value)) {}
  Value(int64_t value) : storage_(static_cast<double>(value)) {}
  Value(double value) : storage_(value) {}
  Value(const char* value) : storage_(std::string(value)) {}
  Value(std::string value) : storage_(std::move(value)) {}
  Value(List items);
  Value(Record fields);
  Value(std::shared_ptr<List> items);
  Value(std::shared_ptr<Record> fields);
  Value(std::shared_ptr<MapContainer> map);
  Value(std::shared_ptr<SetContainer> set);
  Value(std::shared_ptr<ByteBuffer> buffer);
  Value(std::shared_ptr<SharedByteBuffer> buffer);
  Value(std::shared_ptr<NumericArray> array);
  Value(std::shared_ptr<Date> date);
  Value(std::shared_ptr<Pattern> pattern);

  ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }

  bool IsNull() const { return kind() == ValueKind::kNull; }
  bool IsBoolean() const { return kind() == ValueKind::kBoolean; }
  bool IsNumber() const { return kind() == ValueKind::kNumber; }
  bool IsString() const { return kind() == ValueKind::kString; }
  bool IsContainer() const { return storage_.index() > 3; }

  // Accessors throw std::bad_variant_access on a kind mismatch. Container
  // accessors hand out the shared container itself.
  bool AsBool() const { return std::get<bool>(storage_); }
  double AsNumber() const { return std::get<double>(storage_); }
  const std::string& AsString() const { return std::get<std::string>(storage_); }
  List& AsList() const;
  Record& AsRecord() const;
  MapContainer& AsMap() const;
  SetContainer& AsSet() const;
  ByteBuffer& AsByteBuffer() const;
  SharedByteBuffer& AsSharedByteBuffer() const;
  NumericArray& AsNumericArray() const;
  Date& AsDate() const;
  Pattern& AsPattern() const;

  // Identity of the referenced container; nullptr for primitives. Two handles
  // onto the same shared memory report the same identity.
  const void* Identity() const;

  const Storage& storage() const { return storage_; }

 private:
  Storage storage_;
};

static_assert(std::variant_size_v<Value::Storage> ==
                  static_cast<size_t>(ValueKind::kPattern) + 1,
              "ValueKind must cover every Value alternative");

// Equality used for map keys and set members: primitives by value (NaN equals
// NaN, +0 equals -0), containers by identity.
bool SameValueZero(const Value& a, const Value& b);

}  // namespace simcore::payload

#endif  // SIMCORE_PAYLOAD_VALUE_HPP_
