// Repository: simcore
// Component: Payload Value
// Purpose: Mutable, caller-owned payload value graph submitted with commands.
// Copyright (c) 2025 simcore

#include "simcore/payload/Value.hpp"

#include <cmath>
#include <type_traits>

#include "simcore/payload/Buffers.hpp"
#include "simcore/payload/Containers.hpp"
#include "simcore/payload/Date.hpp"
#include "simcore/payload/Pattern.hpp"

namespace simcore::payload {

const char* ValueKindToString(ValueKind kind) {
  switch (kind) {
    case ValueKind::kNull:             return "null";
    case ValueKind::kBoolean:          return "boolean";
    case ValueKind::kNumber:           return "number";
    case ValueKind::kString:           return "string";
    case ValueKind::kList:             return "list";
    case ValueKind::kRecord:           return "record";
    case ValueKind::kMap:              return "map";
    case ValueKind::kSet:              return "set";
    case ValueKind::kByteBuffer:       return "byte_buffer";
    case ValueKind::kSharedByteBuffer: return "shared_byte_buffer";
    case ValueKind::kNumericArray:     return "numeric_array";
    case ValueKind::kDate:             return "date";
    case ValueKind::kPattern:          return "pattern";
  }
  return "unknown";
}

Value::Value(List items) : storage_(std::make_shared<List>(std::move(items))) {}
Value::Value(Record fields) : storage_(std::make_shared<Record>(std::move(fields))) {}
Value::Value(std::shared_ptr<List> items) : storage_(std::move(items)) {}
Value::Value(std::shared_ptr<Record> fields) : storage_(std::move(fields)) {}
Value::Value(std::shared_ptr<MapContainer> map) : storage_(std::move(map)) {}
Value::Value(std::shared_ptr<SetContainer> set) : storage_(std::move(set)) {}
Value::Value(std::shared_ptr<ByteBuffer> buffer) : storage_(std::move(buffer)) {}
Value::Value(std::shared_ptr<SharedByteBuffer> buffer) : storage_(std::move(buffer)) {}
Value::Value(std::shared_ptr<NumericArray> array) : storage_(std::move(array)) {}
Value::Value(std::shared_ptr<Date> date) : storage_(std::move(date)) {}
Value::Value(std::shared_ptr<Pattern> pattern) : storage_(std::move(pattern)) {}

List& Value::AsList() const { return *std::get<std::shared_ptr<List>>(storage_); }
Record& Value::AsRecord() const { return *std::get<std::shared_ptr<Record>>(storage_); }
MapContainer& Value::AsMap() const {
  return *std::get<std::shared_ptr<MapContainer>>(storage_);
}
SetContainer& Value::AsSet() const {
  return *std::get<std::shared_ptr<SetContainer>>(storage_);
}
ByteBuffer& Value::AsByteBuffer() const {
  return *std::get<std::shared_ptr<ByteBuffer>>(storage_);
}
SharedByteBuffer& Value::AsSharedByteBuffer() const {
  return *std::get<std::shared_ptr<SharedByteBuffer>>(storage_);
}
NumericArray& Value::AsNumericArray() const {
  return *std::get<std::shared_ptr<NumericArray>>(storage_);
}
Date& Value::AsDate() const { return *std::get<std::shared_ptr<Date>>(storage_); }
Pattern& Value::AsPattern() const { return *std::get<std::shared_ptr<Pattern>>(storage_); }

const void* Value::Identity() const {
  switch (kind()) {
    case ValueKind::kNull:
    case ValueKind::kBoolean:
    case ValueKind::kNumber:
    case ValueKind::kString:
      return nullptr;
    case ValueKind::kSharedByteBuffer:
      return AsSharedByteBuffer().StorageId();
    default:
      break;
  }
  return std::visit(
      [](const auto& alt) -> const void* {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, bool> ||
                      std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
          return nullptr;
        } else {
          return alt.get();
        }
      },
      storage_);
}

bool SameValueZero(const Value& a, const Value& b) {
  if (a.kind() != b.kind()) return false;
  switch (a.kind()) {
    case ValueKind::kNull:
      return true;
    case ValueKind::kBoolean:
      return a.AsBool() == b.AsBool();
    case ValueKind::kNumber: {
      const double x = a.AsNumber();
      const double y = b.AsNumber();
      if (std::isnan(x) && std::isnan(y)) return true;
      return x == y;
    }
    case ValueKind::kString:
      return a.AsString() == b.AsString();
    default:
      return a.Identity() == b.Identity();
  }
}

}  // namespace simcore::payload
