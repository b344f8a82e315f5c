// Repository: simcore
// Component: Immutable Buffers
// Purpose: Read-only byte buffer facades and numeric element views.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_SNAPSHOT_IMMUTABLE_BUFFERS_HPP_
#define SIMCORE_SNAPSHOT_IMMUTABLE_BUFFERS_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "simcore/payload/Buffers.hpp"
#include "simcore/snapshot/ImmutableValue.hpp"

namespace simcore::snapshot {

// =============================================================================
// Byte buffer facades
// The snapshot owns a private copy of the bytes taken at admission. Every
// escape (ToBytes, ToByteBuffer, ToUint8Array, ValueOf) hands back a fresh
// copy, so writes to an escaped buffer never reach the snapshot.
// =============================================================================

class ImmutableBufferBase {
 public:
  virtual ~ImmutableBufferBase() = default;

  // Distinguishes the facade from the mutable native buffer.
  virtual const char* TypeTag() const = 0;

  size_t ByteLength() const { return bytes_->size(); }
  // Throws std::out_of_range.
  uint8_t At(size_t index) const;

  std::vector<uint8_t> ToBytes() const { return *bytes_; }
  std::shared_ptr<payload::ByteBuffer> ToByteBuffer() const;
  payload::NumericArray ToUint8Array() const;

  [[noreturn]] void SetAt(size_t index, uint8_t value) const;
  [[noreturn]] void Fill(uint8_t value) const;
  [[noreturn]] void Resize(size_t byte_length) const;

  const void* Identity() const { return bytes_.get(); }

  // Range for slice-style bounds: NaN is 0, negatives count from the end,
  // both clamp to [0, length], and an end before begin yields an empty range.
  static std::pair<size_t, size_t> NormalizeRange(size_t length,
                                                  std::optional<double> begin,
                                                  std::optional<double> end);

 protected:
  explicit ImmutableBufferBase(std::shared_ptr<const std::vector<uint8_t>> bytes)
      : bytes_(std::move(bytes)) {}

  std::shared_ptr<const std::vector<uint8_t>> SliceBytes(std::optional<double> begin,
                                                         std::optional<double> end) const;

  std::shared_ptr<const std::vector<uint8_t>> bytes_;

 private:
  friend class ImmutableNumericArray;
};

class ImmutableByteBuffer final : public ImmutableBufferBase {
 public:
  static constexpr const char* kTypeTag = "ImmutableByteBufferSnapshot";

  ImmutableByteBuffer(SnapshotKey, std::shared_ptr<const std::vector<uint8_t>> bytes)
      : ImmutableByteBuffer(std::move(bytes)) {}

  const char* TypeTag() const override { return kTypeTag; }

  ImmutableByteBuffer Slice(std::optional<double> begin = std::nullopt,
                            std::optional<double> end = std::nullopt) const;

  std::shared_ptr<payload::ByteBuffer> ValueOf() const { return ToByteBuffer(); }

 private:
  friend class SnapshotBuilder;
  explicit ImmutableByteBuffer(std::shared_ptr<const std::vector<uint8_t>> bytes)
      : ImmutableBufferBase(std::move(bytes)) {}
};

class ImmutableSharedByteBuffer final : public ImmutableBufferBase {
 public:
  static constexpr const char* kTypeTag = "ImmutableSharedByteBufferSnapshot";

  ImmutableSharedByteBuffer(SnapshotKey, std::shared_ptr<const std::vector<uint8_t>> bytes)
      : ImmutableSharedByteBuffer(std::move(bytes)) {}

  const char* TypeTag() const override { return kTypeTag; }

  ImmutableSharedByteBuffer Slice(std::optional<double> begin = std::nullopt,
                                  std::optional<double> end = std::nullopt) const;

  // Fresh shared memory holding a copy of the bytes.
  std::shared_ptr<payload::SharedByteBuffer> ToSharedByteBuffer() const;
  std::shared_ptr<payload::SharedByteBuffer> ValueOf() const {
    return ToSharedByteBuffer();
  }

 private:
  friend class SnapshotBuilder;
  explicit ImmutableSharedByteBuffer(std::shared_ptr<const std::vector<uint8_t>> bytes)
      : ImmutableBufferBase(std::move(bytes)) {}
};

// =============================================================================
// ImmutableNumericArray
// Element view over a buffer facade. Callbacks receive this view as their
// array argument. Map, Filter and Slice build independent mutable arrays;
// Subarray stays read-only and shares the facade.
// =============================================================================

class ImmutableNumericArray {
 public:
  ImmutableNumericArray(SnapshotKey, payload::NumericElementType type, ImmutableValue buffer,
                        size_t byte_offset, size_t length)
      : ImmutableNumericArray(type, std::move(buffer), byte_offset, length) {}

  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = double;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = double;

    const_iterator(const ImmutableNumericArray* array, size_t index)
        : array_(array), index_(index) {}

    double operator*() const { return array_->At(index_); }
    const_iterator& operator++() {
      ++index_;
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator copy = *this;
      ++index_;
      return copy;
    }
    bool operator==(const const_iterator& other) const {
      return array_ == other.array_ && index_ == other.index_;
    }
    bool operator!=(const const_iterator& other) const { return !(*this == other); }

   private:
    const ImmutableNumericArray* array_;
    size_t index_;
  };

  using Callback = std::function<void(double, size_t, const ImmutableNumericArray&)>;
  using Mapper = std::function<double(double, size_t, const ImmutableNumericArray&)>;
  using Predicate = std::function<bool(double, size_t, const ImmutableNumericArray&)>;

  payload::NumericElementType type() const { return type_; }
  size_t Length() const { return length_; }
  size_t ByteOffset() const { return byte_offset_; }
  size_t ByteLength() const { return length_ * payload::NumericElementSize(type_); }
  bool IsShared() const;

  // Throws std::out_of_range.
  double At(size_t index) const;
  std::vector<double> ToVector() const;

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, length_); }

  // The read-only facade over the underlying bytes; the same node on every call.
  const ImmutableValue& Buffer() const { return buffer_; }

  ImmutableNumericArray Subarray(std::optional<double> begin = std::nullopt,
                                 std::optional<double> end = std::nullopt) const;
  payload::NumericArray Slice(std::optional<double> begin = std::nullopt,
                              std::optional<double> end = std::nullopt) const;

  void ForEach(const Callback& callback) const;
  payload::NumericArray Map(const Mapper& mapper) const;
  payload::NumericArray Filter(const Predicate& predicate) const;

  template <typename T, typename Fn>
  T Reduce(Fn&& fn, T initial) const {
    T accumulator = std::move(initial);
    for (size_t i = 0; i < length_; ++i) {
      accumulator = fn(std::move(accumulator), At(i), i, *this);
    }
    return accumulator;
  }

  bool Some(const Predicate& predicate) const;
  bool Every(const Predicate& predicate) const;
  std::optional<double> Find(const Predicate& predicate) const;
  // -1 when nothing matches.
  int64_t FindIndex(const Predicate& predicate) const;
  int64_t IndexOf(double value) const;
  // NaN-aware membership.
  bool Includes(double value) const;

  const ImmutableNumericArray& ValueOf() const { return *this; }

  [[noreturn]] void SetAt(size_t index, double value) const;
  [[noreturn]] void Set(const std::vector<double>& values, size_t offset = 0) const;
  [[noreturn]] void Fill(double value) const;
  [[noreturn]] void Sort() const;
  [[noreturn]] void Reverse() const;
  [[noreturn]] void CopyWithin(size_t target, size_t start, size_t end) const;

 private:
  friend class SnapshotBuilder;

  ImmutableNumericArray(payload::NumericElementType type, ImmutableValue buffer,
                        size_t byte_offset, size_t length);

  const std::vector<uint8_t>& Bytes() const;

  payload::NumericElementType type_;
  ImmutableValue buffer_;
  size_t byte_offset_;
  size_t length_;
};

}  // namespace simcore::snapshot

#endif  // SIMCORE_SNAPSHOT_IMMUTABLE_BUFFERS_HPP_
