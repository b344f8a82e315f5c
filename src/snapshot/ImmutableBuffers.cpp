// Repository: simcore
// Component: Immutable Buffers
// Purpose: Read-only byte buffer facades and numeric element views.
// Copyright (c) 2025 simcore

#include "simcore/snapshot/ImmutableBuffers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace simcore::snapshot {

namespace {

size_t RelativeIndex(double value, size_t length) {
  if (std::isnan(value)) return 0;
  const double len = static_cast<double>(length);
  const double integer = std::trunc(value);
  if (integer < 0) {
    return static_cast<size_t>(std::max(len + integer, 0.0));
  }
  return static_cast<size_t>(std::min(integer, len));
}

}  // namespace

// =============================================================================
// ImmutableBufferBase
// =============================================================================

std::pair<size_t, size_t> ImmutableBufferBase::NormalizeRange(size_t length,
                                                              std::optional<double> begin,
                                                              std::optional<double> end) {
  const size_t first = begin ? RelativeIndex(*begin, length) : 0;
  const size_t last = end ? RelativeIndex(*end, length) : length;
  return {first, std::max(first, last)};
}

uint8_t ImmutableBufferBase::At(size_t index) const {
  if (index >= bytes_->size()) {
    throw std::out_of_range(std::string(TypeTag()) + " index " + std::to_string(index) +
                            " out of range (byteLength " +
                            std::to_string(bytes_->size()) + ")");
  }
  return (*bytes_)[index];
}

std::shared_ptr<payload::ByteBuffer> ImmutableBufferBase::ToByteBuffer() const {
  return std::make_shared<payload::ByteBuffer>(*bytes_);
}

payload::NumericArray ImmutableBufferBase::ToUint8Array() const {
  return payload::NumericArray(payload::NumericElementType::kUint8, ToByteBuffer(), 0,
                               bytes_->size());
}

std::shared_ptr<const std::vector<uint8_t>> ImmutableBufferBase::SliceBytes(
    std::optional<double> begin, std::optional<double> end) const {
  const auto [first, last] = NormalizeRange(bytes_->size(), begin, end);
  return std::make_shared<const std::vector<uint8_t>>(
      bytes_->begin() + static_cast<std::ptrdiff_t>(first),
      bytes_->begin() + static_cast<std::ptrdiff_t>(last));
}

void ImmutableBufferBase::SetAt(size_t, uint8_t) const { RejectMutation(TypeTag(), "write byte"); }
void ImmutableBufferBase::Fill(uint8_t) const { RejectMutation(TypeTag(), "fill"); }
void ImmutableBufferBase::Resize(size_t) const { RejectMutation(TypeTag(), "resize"); }

ImmutableByteBuffer ImmutableByteBuffer::Slice(std::optional<double> begin,
                                               std::optional<double> end) const {
  return ImmutableByteBuffer(SliceBytes(begin, end));
}

ImmutableSharedByteBuffer ImmutableSharedByteBuffer::Slice(std::optional<double> begin,
                                                           std::optional<double> end) const {
  return ImmutableSharedByteBuffer(SliceBytes(begin, end));
}

std::shared_ptr<payload::SharedByteBuffer> ImmutableSharedByteBuffer::ToSharedByteBuffer()
    const {
  return std::make_shared<payload::SharedByteBuffer>(*bytes_);
}

// =============================================================================
// ImmutableNumericArray
// =============================================================================

ImmutableNumericArray::ImmutableNumericArray(payload::NumericElementType type,
                                             ImmutableValue buffer, size_t byte_offset,
                                             size_t length)
    : type_(type), buffer_(std::move(buffer)), byte_offset_(byte_offset), length_(length) {
  if (buffer_.kind() != payload::ValueKind::kByteBuffer &&
      buffer_.kind() != payload::ValueKind::kSharedByteBuffer) {
    throw std::invalid_argument("ImmutableNumericArray requires a buffer facade");
  }
  if (byte_offset_ + ByteLength() > Bytes().size()) {
    throw std::invalid_argument("ImmutableNumericArray range exceeds buffer length");
  }
}

bool ImmutableNumericArray::IsShared() const {
  return buffer_.kind() == payload::ValueKind::kSharedByteBuffer;
}

const std::vector<uint8_t>& ImmutableNumericArray::Bytes() const {
  const ImmutableBufferBase& base =
      IsShared() ? static_cast<const ImmutableBufferBase&>(buffer_.AsSharedByteBuffer())
                 : static_cast<const ImmutableBufferBase&>(buffer_.AsByteBuffer());
  return *base.bytes_;
}

double ImmutableNumericArray::At(size_t index) const {
  if (index >= length_) {
    throw std::out_of_range("ImmutableNumericArray index " + std::to_string(index) +
                            " out of range (length " + std::to_string(length_) + ")");
  }
  const size_t offset = byte_offset_ + index * payload::NumericElementSize(type_);
  return payload::ReadNumericElement(type_, Bytes().data() + offset);
}

std::vector<double> ImmutableNumericArray::ToVector() const {
  std::vector<double> out;
  out.reserve(length_);
  for (size_t i = 0; i < length_; ++i) {
    out.push_back(At(i));
  }
  return out;
}

ImmutableNumericArray ImmutableNumericArray::Subarray(std::optional<double> begin,
                                                      std::optional<double> end) const {
  const auto [first, last] = ImmutableBufferBase::NormalizeRange(length_, begin, end);
  return ImmutableNumericArray(type_, buffer_,
                               byte_offset_ + first * payload::NumericElementSize(type_),
                               last - first);
}

payload::NumericArray ImmutableNumericArray::Slice(std::optional<double> begin,
                                                   std::optional<double> end) const {
  const auto [first, last] = ImmutableBufferBase::NormalizeRange(length_, begin, end);
  payload::NumericArray out(type_, last - first);
  for (size_t i = first; i < last; ++i) {
    out.SetAt(i - first, At(i));
  }
  return out;
}

void ImmutableNumericArray::ForEach(const Callback& callback) const {
  for (size_t i = 0; i < length_; ++i) {
    callback(At(i), i, *this);
  }
}

payload::NumericArray ImmutableNumericArray::Map(const Mapper& mapper) const {
  payload::NumericArray out(type_, length_);
  for (size_t i = 0; i < length_; ++i) {
    out.SetAt(i, mapper(At(i), i, *this));
  }
  return out;
}

payload::NumericArray ImmutableNumericArray::Filter(const Predicate& predicate) const {
  std::vector<double> kept;
  for (size_t i = 0; i < length_; ++i) {
    const double value = At(i);
    if (predicate(value, i, *this)) kept.push_back(value);
  }
  return payload::NumericArray(type_, kept);
}

bool ImmutableNumericArray::Some(const Predicate& predicate) const {
  return FindIndex(predicate) >= 0;
}

bool ImmutableNumericArray::Every(const Predicate& predicate) const {
  for (size_t i = 0; i < length_; ++i) {
    if (!predicate(At(i), i, *this)) return false;
  }
  return true;
}

std::optional<double> ImmutableNumericArray::Find(const Predicate& predicate) const {
  const int64_t index = FindIndex(predicate);
  if (index < 0) return std::nullopt;
  return At(static_cast<size_t>(index));
}

int64_t ImmutableNumericArray::FindIndex(const Predicate& predicate) const {
  for (size_t i = 0; i < length_; ++i) {
    if (predicate(At(i), i, *this)) return static_cast<int64_t>(i);
  }
  return -1;
}

int64_t ImmutableNumericArray::IndexOf(double value) const {
  for (size_t i = 0; i < length_; ++i) {
    if (At(i) == value) return static_cast<int64_t>(i);
  }
  return -1;
}

bool ImmutableNumericArray::Includes(double value) const {
  for (size_t i = 0; i < length_; ++i) {
    const double element = At(i);
    if (element == value || (std::isnan(element) && std::isnan(value))) return true;
  }
  return false;
}

void ImmutableNumericArray::SetAt(size_t, double) const {
  RejectMutation("numeric array", "write element");
}
void ImmutableNumericArray::Set(const std::vector<double>&, size_t) const {
  RejectMutation("numeric array", "set");
}
void ImmutableNumericArray::Fill(double) const { RejectMutation("numeric array", "fill"); }
void ImmutableNumericArray::Sort() const { RejectMutation("numeric array", "sort"); }
void ImmutableNumericArray::Reverse() const { RejectMutation("numeric array", "reverse"); }
void ImmutableNumericArray::CopyWithin(size_t, size_t, size_t) const {
  RejectMutation("numeric array", "copyWithin");
}

}  // namespace simcore::snapshot
