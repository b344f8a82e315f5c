// Repository: simcore
// Component: Snapshot Builder
// Purpose: Recursive payload-to-snapshot conversion with identity tracking.
// Copyright (c) 2025 simcore

#include "snapshot/SnapshotBuilder.hpp"

#include <stdexcept>
#include <string>

#include "simcore/payload/Payload.hpp"
#include "simcore/snapshot/Snapshot.hpp"

namespace simcore::snapshot {

ImmutableValue Snapshot(const payload::Value& value) {
  SnapshotBuilder builder;
  return builder.Build(value);
}

ImmutableValue SnapshotBuilder::Build(const payload::Value& value) {
  using payload::ValueKind;
  switch (value.kind()) {
    case ValueKind::kNull:
      return ImmutableValue();
    case ValueKind::kBoolean:
      return ImmutableValue(value.AsBool());
    case ValueKind::kNumber:
      return ImmutableValue(value.AsNumber());
    case ValueKind::kString:
      return ImmutableValue(value.AsString());
    default:
      break;
  }

  const void* identity = value.Identity();
  auto found = seen_.find(identity);
  if (found != seen_.end()) {
    return found->second;
  }
  if (!in_progress_.insert(identity).second) {
    throw std::invalid_argument(std::string("Cannot snapshot cyclic payload: ") +
                                payload::ValueKindToString(value.kind()) +
                                " refers to itself");
  }
  ImmutableValue node = BuildNode(value);
  in_progress_.erase(identity);
  seen_.emplace(identity, node);
  return node;
}

ImmutableValue SnapshotBuilder::BuildNode(const payload::Value& value) {
  using payload::ValueKind;
  switch (value.kind()) {
    case ValueKind::kList: {
      auto list = std::make_shared<ImmutableList>(SnapshotKey());
      const payload::List& source = value.AsList();
      list->items_.reserve(source.size());
      for (const auto& item : source) {
        list->items_.push_back(Build(item));
      }
      return ImmutableValue(std::shared_ptr<const ImmutableList>(std::move(list)));
    }
    case ValueKind::kRecord: {
      auto record = std::make_shared<ImmutableRecord>(SnapshotKey());
      for (const auto& [key, field] : value.AsRecord()) {
        record->fields_.emplace(key, Build(field));
      }
      return ImmutableValue(std::shared_ptr<const ImmutableRecord>(std::move(record)));
    }
    case ValueKind::kMap: {
      auto map = std::make_shared<ImmutableMap>(SnapshotKey());
      for (const auto& [key, entry] : value.AsMap()) {
        ImmutableValue frozen_key = Build(key);
        map->entries_.emplace_back(std::move(frozen_key), Build(entry));
      }
      return ImmutableValue(std::shared_ptr<const ImmutableMap>(std::move(map)));
    }
    case ValueKind::kSet: {
      auto set = std::make_shared<ImmutableSet>(SnapshotKey());
      for (const auto& member : value.AsSet()) {
        set->values_.push_back(Build(member));
      }
      return ImmutableValue(std::shared_ptr<const ImmutableSet>(std::move(set)));
    }
    case ValueKind::kByteBuffer: {
      auto bytes = std::make_shared<const std::vector<uint8_t>>(value.AsByteBuffer().bytes());
      return ImmutableValue(std::shared_ptr<const ImmutableByteBuffer>(
          std::make_shared<ImmutableByteBuffer>(SnapshotKey(), std::move(bytes))));
    }
    case ValueKind::kSharedByteBuffer: {
      const payload::SharedByteBuffer& shared = value.AsSharedByteBuffer();
      auto bytes = std::make_shared<const std::vector<uint8_t>>(
          shared.data(), shared.data() + shared.ByteLength());
      return ImmutableValue(std::shared_ptr<const ImmutableSharedByteBuffer>(
          std::make_shared<ImmutableSharedByteBuffer>(SnapshotKey(), std::move(bytes))));
    }
    case ValueKind::kNumericArray: {
      const payload::NumericArray& array = value.AsNumericArray();
      // The backing buffer goes through Build() so a sibling reference to
      // the same buffer resolves to the same facade.
      ImmutableValue facade = array.IsShared() ? Build(payload::Value(array.shared_buffer()))
                                               : Build(payload::Value(array.buffer()));
      return ImmutableValue(std::shared_ptr<const ImmutableNumericArray>(
          std::make_shared<ImmutableNumericArray>(SnapshotKey(), array.type(), std::move(facade),
                                                  array.ByteOffset(), array.Length())));
    }
    case ValueKind::kDate:
      return ImmutableValue(std::shared_ptr<const ImmutableDate>(
          std::make_shared<ImmutableDate>(SnapshotKey(), value.AsDate())));
    case ValueKind::kPattern:
      return ImmutableValue(std::shared_ptr<const ImmutablePattern>(
          std::make_shared<ImmutablePattern>(SnapshotKey(), value.AsPattern())));
    case ValueKind::kNull:
    case ValueKind::kBoolean:
    case ValueKind::kNumber:
    case ValueKind::kString:
      break;
  }
  throw std::logic_error("SnapshotBuilder::BuildNode called with a primitive");
}

// =============================================================================
// ToMutable
// =============================================================================

namespace {

class MutableCopier {
 public:
  payload::Value Copy(const ImmutableValue& value) {
    const void* identity = value.Identity();
    if (identity == nullptr) {
      return CopyPrimitive(value);
    }
    auto found = copies_.find(identity);
    if (found != copies_.end()) return found->second;
    payload::Value copy = CopyNode(value);
    copies_.emplace(identity, copy);
    return copy;
  }

 private:
  static payload::Value CopyPrimitive(const ImmutableValue& value) {
    switch (value.kind()) {
      case payload::ValueKind::kBoolean: return payload::Value(value.AsBool());
      case payload::ValueKind::kNumber:  return payload::Value(value.AsNumber());
      case payload::ValueKind::kString:  return payload::Value(value.AsString());
      default:                           return payload::Value();
    }
  }

  payload::Value CopyNode(const ImmutableValue& value) {
    using payload::ValueKind;
    switch (value.kind()) {
      case ValueKind::kList: {
        payload::List items;
        for (const auto& item : value.AsList()) {
          items.push_back(Copy(item));
        }
        return payload::Value(std::move(items));
      }
      case ValueKind::kRecord: {
        payload::Record fields;
        for (const auto& [key, field] : value.AsRecord()) {
          fields.emplace(key, Copy(field));
        }
        return payload::Value(std::move(fields));
      }
      case ValueKind::kMap: {
        auto map = std::make_shared<payload::MapContainer>();
        for (const auto& [key, entry] : value.AsMap()) {
          map->Set(Copy(key), Copy(entry));
        }
        return payload::Value(std::move(map));
      }
      case ValueKind::kSet: {
        auto set = std::make_shared<payload::SetContainer>();
        for (const auto& member : value.AsSet()) {
          set->Add(Copy(member));
        }
        return payload::Value(std::move(set));
      }
      case ValueKind::kByteBuffer:
        return payload::Value(value.AsByteBuffer().ToByteBuffer());
      case ValueKind::kSharedByteBuffer:
        return payload::Value(value.AsSharedByteBuffer().ToSharedByteBuffer());
      case ValueKind::kNumericArray: {
        const ImmutableNumericArray& array = value.AsNumericArray();
        payload::Value buffer = Copy(array.Buffer());
        if (array.IsShared()) {
          return payload::Value(std::make_shared<payload::NumericArray>(
              array.type(), std::get<std::shared_ptr<payload::SharedByteBuffer>>(buffer.storage()),
              array.ByteOffset(), array.Length()));
        }
        return payload::Value(std::make_shared<payload::NumericArray>(
            array.type(), std::get<std::shared_ptr<payload::ByteBuffer>>(buffer.storage()),
            array.ByteOffset(), array.Length()));
      }
      case ValueKind::kDate:
        return payload::Value(std::make_shared<payload::Date>(value.AsDate().ToDate()));
      case ValueKind::kPattern:
        return payload::Value(std::make_shared<payload::Pattern>(value.AsPattern().ToPattern()));
      case ValueKind::kNull:
      case ValueKind::kBoolean:
      case ValueKind::kNumber:
      case ValueKind::kString:
        break;
    }
    return CopyPrimitive(value);
  }

  std::unordered_map<const void*, payload::Value> copies_;
};

}  // namespace

payload::Value ImmutableValue::ToMutable() const {
  MutableCopier copier;
  return copier.Copy(*this);
}

}  // namespace simcore::snapshot
