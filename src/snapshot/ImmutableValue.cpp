// Repository: simcore
// Component: Immutable Snapshot
// Purpose: Deeply read-only value graph produced from a payload at admission.
// Copyright (c) 2025 simcore

#include "simcore/snapshot/ImmutableValue.hpp"

#include <cmath>
#include <vector>

#include "simcore/snapshot/ImmutableBuffers.hpp"
#include "simcore/snapshot/ImmutableContainers.hpp"
#include "simcore/snapshot/ImmutableScalars.hpp"

namespace simcore::snapshot {

void RejectMutation(const char* target, const char* operation) {
  throw ImmutableSnapshotError(std::string("Cannot ") + operation + " on immutable " +
                               target + " snapshot");
}

const ImmutableList& ImmutableValue::AsList() const {
  return *std::get<std::shared_ptr<const ImmutableList>>(storage_);
}
const ImmutableRecord& ImmutableValue::AsRecord() const {
  return *std::get<std::shared_ptr<const ImmutableRecord>>(storage_);
}
const ImmutableMap& ImmutableValue::AsMap() const {
  return *std::get<std::shared_ptr<const ImmutableMap>>(storage_);
}
const ImmutableSet& ImmutableValue::AsSet() const {
  return *std::get<std::shared_ptr<const ImmutableSet>>(storage_);
}
const ImmutableByteBuffer& ImmutableValue::AsByteBuffer() const {
  return *std::get<std::shared_ptr<const ImmutableByteBuffer>>(storage_);
}
const ImmutableSharedByteBuffer& ImmutableValue::AsSharedByteBuffer() const {
  return *std::get<std::shared_ptr<const ImmutableSharedByteBuffer>>(storage_);
}
const ImmutableNumericArray& ImmutableValue::AsNumericArray() const {
  return *std::get<std::shared_ptr<const ImmutableNumericArray>>(storage_);
}
const ImmutableDate& ImmutableValue::AsDate() const {
  return *std::get<std::shared_ptr<const ImmutableDate>>(storage_);
}
const ImmutablePattern& ImmutableValue::AsPattern() const {
  return *std::get<std::shared_ptr<const ImmutablePattern>>(storage_);
}

const ImmutableValue& ImmutableValue::Get(const std::string& key) const {
  return AsRecord().Get(key);
}

const ImmutableValue& ImmutableValue::At(size_t index) const {
  return AsList().At(index);
}

const void* ImmutableValue::Identity() const {
  return std::visit(
      [](const auto& alt) -> const void* {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (detail::IsSharedPtr<T>::value) {
          return alt.get();
        } else {
          return nullptr;
        }
      },
      storage_);
}

const ImmutableValue& ImmutableValue::Null() {
  static const ImmutableValue kNull;
  return kNull;
}

bool SameValueZero(const ImmutableValue& a, const ImmutableValue& b) {
  if (a.kind() != b.kind()) return false;
  switch (a.kind()) {
    case payload::ValueKind::kNull:
      return true;
    case payload::ValueKind::kBoolean:
      return a.AsBool() == b.AsBool();
    case payload::ValueKind::kNumber: {
      const double x = a.AsNumber();
      const double y = b.AsNumber();
      if (std::isnan(x) && std::isnan(y)) return true;
      return x == y;
    }
    case payload::ValueKind::kString:
      return a.AsString() == b.AsString();
    case payload::ValueKind::kList:
    case payload::ValueKind::kRecord:
    case payload::ValueKind::kMap:
    case payload::ValueKind::kSet:
    case payload::ValueKind::kByteBuffer:
    case payload::ValueKind::kSharedByteBuffer:
    case payload::ValueKind::kNumericArray:
    case payload::ValueKind::kDate:
    case payload::ValueKind::kPattern:
      return a.Identity() == b.Identity();
  }
  return false;
}

bool StructurallyEqual(const ImmutableValue& a, const ImmutableValue& b) {
  if (a.kind() != b.kind()) return false;
  if (a.Identity() != nullptr && a.Identity() == b.Identity()) return true;
  switch (a.kind()) {
    case payload::ValueKind::kNull:
    case payload::ValueKind::kBoolean:
    case payload::ValueKind::kNumber:
    case payload::ValueKind::kString:
      return SameValueZero(a, b);
    case payload::ValueKind::kList: {
      const ImmutableList& left = a.AsList();
      const ImmutableList& right = b.AsList();
      if (left.Size() != right.Size()) return false;
      for (size_t i = 0; i < left.Size(); ++i) {
        if (!StructurallyEqual(left.At(i), right.At(i))) return false;
      }
      return true;
    }
    case payload::ValueKind::kRecord: {
      const ImmutableRecord& left = a.AsRecord();
      const ImmutableRecord& right = b.AsRecord();
      if (left.Size() != right.Size()) return false;
      for (const auto& [key, field] : left) {
        const ImmutableValue* other = right.Find(key);
        if (other == nullptr || !StructurallyEqual(field, *other)) return false;
      }
      return true;
    }
    case payload::ValueKind::kMap: {
      const auto& left = a.AsMap().Entries();
      const auto& right = b.AsMap().Entries();
      if (left.size() != right.size()) return false;
      for (size_t i = 0; i < left.size(); ++i) {
        if (!StructurallyEqual(left[i].first, right[i].first) ||
            !StructurallyEqual(left[i].second, right[i].second)) {
          return false;
        }
      }
      return true;
    }
    case payload::ValueKind::kSet: {
      const auto& left = a.AsSet().Values();
      const auto& right = b.AsSet().Values();
      if (left.size() != right.size()) return false;
      for (size_t i = 0; i < left.size(); ++i) {
        if (!StructurallyEqual(left[i], right[i])) return false;
      }
      return true;
    }
    case payload::ValueKind::kByteBuffer:
      return a.AsByteBuffer().ToBytes() == b.AsByteBuffer().ToBytes();
    case payload::ValueKind::kSharedByteBuffer:
      return a.AsSharedByteBuffer().ToBytes() == b.AsSharedByteBuffer().ToBytes();
    case payload::ValueKind::kNumericArray: {
      const ImmutableNumericArray& left = a.AsNumericArray();
      const ImmutableNumericArray& right = b.AsNumericArray();
      if (left.type() != right.type() || left.IsShared() != right.IsShared()) return false;
      const std::vector<double> x = left.ToVector();
      const std::vector<double> y = right.ToVector();
      if (x.size() != y.size()) return false;
      for (size_t i = 0; i < x.size(); ++i) {
        if (!SameValueZero(x[i], y[i])) return false;
      }
      return true;
    }
    case payload::ValueKind::kDate:
      return SameValueZero(a.AsDate().GetTime(), b.AsDate().GetTime());
    case payload::ValueKind::kPattern: {
      const ImmutablePattern& left = a.AsPattern();
      const ImmutablePattern& right = b.AsPattern();
      return left.Source() == right.Source() && left.Flags() == right.Flags() &&
             left.LastIndex() == right.LastIndex();
    }
  }
  return false;
}

}  // namespace simcore::snapshot
