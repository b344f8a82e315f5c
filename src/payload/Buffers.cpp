// Repository: simcore
// Component: Payload Buffers
// Purpose: Exclusive and shared-memory byte buffers plus typed element views.
// Copyright (c) 2025 simcore

#include "simcore/payload/Buffers.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>

namespace simcore::payload {

namespace {

void CheckIndex(size_t index, size_t length, const char* what) {
  if (index >= length) {
    throw std::out_of_range(std::string(what) + " index " + std::to_string(index) +
                            " out of range (length " + std::to_string(length) + ")");
  }
}

// ToInt32-style wrap: truncate toward zero, reduce modulo 2^bits.
template <typename T>
T WrapToInteger(double value) {
  if (!std::isfinite(value)) return 0;
  constexpr double kModulus = static_cast<double>(uint64_t{1} << (sizeof(T) * 8));
  double truncated = std::trunc(value);
  double wrapped = std::fmod(truncated, kModulus);
  if (wrapped < 0) wrapped += kModulus;
  return static_cast<T>(static_cast<uint64_t>(wrapped));
}

template <typename T>
double Load(const uint8_t* src) {
  T value;
  std::memcpy(&value, src, sizeof(T));
  return static_cast<double>(value);
}

template <typename T>
void Store(uint8_t* dst, T value) {
  std::memcpy(dst, &value, sizeof(T));
}

}  // namespace

// =============================================================================
// ByteBuffer / SharedByteBuffer
// =============================================================================

ByteBuffer::ByteBuffer(size_t byte_length) : bytes_(byte_length, 0) {}

ByteBuffer::ByteBuffer(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

uint8_t ByteBuffer::At(size_t index) const {
  CheckIndex(index, bytes_.size(), "ByteBuffer");
  return bytes_[index];
}

void ByteBuffer::SetAt(size_t index, uint8_t value) {
  CheckIndex(index, bytes_.size(), "ByteBuffer");
  bytes_[index] = value;
}

SharedByteBuffer::SharedByteBuffer(size_t byte_length)
    : storage_(std::make_shared<std::vector<uint8_t>>(byte_length, 0)) {}

SharedByteBuffer::SharedByteBuffer(std::vector<uint8_t> bytes)
    : storage_(std::make_shared<std::vector<uint8_t>>(std::move(bytes))) {}

SharedByteBuffer::SharedByteBuffer(std::shared_ptr<std::vector<uint8_t>> storage)
    : storage_(std::move(storage)) {}

std::shared_ptr<SharedByteBuffer> SharedByteBuffer::Share() const {
  return std::shared_ptr<SharedByteBuffer>(new SharedByteBuffer(storage_));
}

uint8_t SharedByteBuffer::At(size_t index) const {
  CheckIndex(index, storage_->size(), "SharedByteBuffer");
  return (*storage_)[index];
}

void SharedByteBuffer::SetAt(size_t index, uint8_t value) {
  CheckIndex(index, storage_->size(), "SharedByteBuffer");
  (*storage_)[index] = value;
}

// =============================================================================
// Element codec
// =============================================================================

const char* NumericElementTypeToString(NumericElementType type) {
  switch (type) {
    case NumericElementType::kInt8:    return "Int8";
    case NumericElementType::kUint8:   return "Uint8";
    case NumericElementType::kInt16:   return "Int16";
    case NumericElementType::kUint16:  return "Uint16";
    case NumericElementType::kInt32:   return "Int32";
    case NumericElementType::kUint32:  return "Uint32";
    case NumericElementType::kFloat32: return "Float32";
    case NumericElementType::kFloat64: return "Float64";
  }
  return "Unknown";
}

size_t NumericElementSize(NumericElementType type) {
  switch (type) {
    case NumericElementType::kInt8:
    case NumericElementType::kUint8:
      return 1;
    case NumericElementType::kInt16:
    case NumericElementType::kUint16:
      return 2;
    case NumericElementType::kInt32:
    case NumericElementType::kUint32:
    case NumericElementType::kFloat32:
      return 4;
    case NumericElementType::kFloat64:
      return 8;
  }
  return 1;
}

double ReadNumericElement(NumericElementType type, const uint8_t* src) {
  switch (type) {
    case NumericElementType::kInt8:    return Load<int8_t>(src);
    case NumericElementType::kUint8:   return Load<uint8_t>(src);
    case NumericElementType::kInt16:   return Load<int16_t>(src);
    case NumericElementType::kUint16:  return Load<uint16_t>(src);
    case NumericElementType::kInt32:   return Load<int32_t>(src);
    case NumericElementType::kUint32:  return Load<uint32_t>(src);
    case NumericElementType::kFloat32: return Load<float>(src);
    case NumericElementType::kFloat64: return Load<double>(src);
  }
  return 0;
}

void WriteNumericElement(NumericElementType type, uint8_t* dst, double value) {
  switch (type) {
    case NumericElementType::kInt8:
      Store(dst, static_cast<int8_t>(WrapToInteger<uint8_t>(value)));
      break;
    case NumericElementType::kUint8:
      Store(dst, WrapToInteger<uint8_t>(value));
      break;
    case NumericElementType::kInt16:
      Store(dst, static_cast<int16_t>(WrapToInteger<uint16_t>(value)));
      break;
    case NumericElementType::kUint16:
      Store(dst, WrapToInteger<uint16_t>(value));
      break;
    case NumericElementType::kInt32:
      Store(dst, static_cast<int32_t>(WrapToInteger<uint32_t>(value)));
      break;
    case NumericElementType::kUint32:
      Store(dst, WrapToInteger<uint32_t>(value));
      break;
    case NumericElementType::kFloat32:
      Store(dst, static_cast<float>(value));
      break;
    case NumericElementType::kFloat64:
      Store(dst, value);
      break;
  }
}

// =============================================================================
// NumericArray
// =============================================================================

NumericArray::NumericArray(NumericElementType type, size_t length)
    : type_(type),
      buffer_(std::make_shared<ByteBuffer>(length * NumericElementSize(type))),
      length_(length) {}

NumericArray::NumericArray(NumericElementType type, std::initializer_list<double> values)
    : NumericArray(type, std::vector<double>(values)) {}

NumericArray::NumericArray(NumericElementType type, const std::vector<double>& values)
    : NumericArray(type, values.size()) {
  for (size_t i = 0; i < values.size(); ++i) {
    SetAt(i, values[i]);
  }
}

NumericArray::NumericArray(NumericElementType type, std::shared_ptr<ByteBuffer> buffer,
                           size_t byte_offset, size_t length)
    : type_(type), buffer_(std::move(buffer)), byte_offset_(byte_offset), length_(length) {
  if (!buffer_) {
    throw std::invalid_argument("NumericArray requires a buffer");
  }
  CheckRange(buffer_->ByteLength());
}

NumericArray::NumericArray(NumericElementType type,
                           std::shared_ptr<SharedByteBuffer> buffer,
                           size_t byte_offset, size_t length)
    : type_(type),
      shared_buffer_(std::move(buffer)),
      byte_offset_(byte_offset),
      length_(length) {
  if (!shared_buffer_) {
    throw std::invalid_argument("NumericArray requires a buffer");
  }
  CheckRange(shared_buffer_->ByteLength());
}

void NumericArray::CheckRange(size_t buffer_length) const {
  const size_t element_size = NumericElementSize(type_);
  if (byte_offset_ % element_size != 0) {
    throw std::invalid_argument(std::string("start offset of ") +
                                NumericElementTypeToString(type_) +
                                "Array should be a multiple of " +
                                std::to_string(element_size));
  }
  if (byte_offset_ > buffer_length ||
      length_ > (buffer_length - byte_offset_) / element_size) {
    throw std::invalid_argument("NumericArray range exceeds buffer length " +
                                std::to_string(buffer_length));
  }
}

const uint8_t* NumericArray::ElementPtr(size_t index) const {
  CheckIndex(index, length_, "NumericArray");
  const uint8_t* base = buffer_ ? buffer_->data() : shared_buffer_->data();
  return base + byte_offset_ + index * NumericElementSize(type_);
}

uint8_t* NumericArray::MutableElementPtr(size_t index) {
  CheckIndex(index, length_, "NumericArray");
  uint8_t* base = buffer_ ? buffer_->data() : shared_buffer_->data();
  return base + byte_offset_ + index * NumericElementSize(type_);
}

double NumericArray::At(size_t index) const {
  return ReadNumericElement(type_, ElementPtr(index));
}

void NumericArray::SetAt(size_t index, double value) {
  WriteNumericElement(type_, MutableElementPtr(index), value);
}

std::vector<double> NumericArray::ToVector() const {
  std::vector<double> out;
  out.reserve(length_);
  for (size_t i = 0; i < length_; ++i) {
    out.push_back(At(i));
  }
  return out;
}

}  // namespace simcore::payload
