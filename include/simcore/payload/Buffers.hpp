// Repository: simcore
// Component: Payload Buffers
// Purpose: Exclusive and shared-memory byte buffers plus typed element views.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_PAYLOAD_BUFFERS_HPP_
#define SIMCORE_PAYLOAD_BUFFERS_HPP_

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <vector>

namespace simcore::payload {

// =============================================================================
// Byte buffers
// =============================================================================

// Exclusively owned bytes.
class ByteBuffer {
 public:
  ByteBuffer() = default;
  explicit ByteBuffer(size_t byte_length);
  explicit ByteBuffer(std::vector<uint8_t> bytes);

  size_t ByteLength() const { return bytes_.size(); }

  // Throw std::out_of_range past ByteLength().
  uint8_t At(size_t index) const;
  void SetAt(size_t index, uint8_t value);

  uint8_t* data() { return bytes_.data(); }
  const uint8_t* data() const { return bytes_.data(); }
  const std::vector<uint8_t>& bytes() const { return bytes_; }

 private:
  std::vector<uint8_t> bytes_;
};

// Handle onto memory that other handles may share. Copies of the handle
// (or handles made with Share()) see each other's writes.
class SharedByteBuffer {
 public:
  explicit SharedByteBuffer(size_t byte_length);
  explicit SharedByteBuffer(std::vector<uint8_t> bytes);

  std::shared_ptr<SharedByteBuffer> Share() const;

  size_t ByteLength() const { return storage_->size(); }
  uint8_t At(size_t index) const;
  void SetAt(size_t index, uint8_t value);

  uint8_t* data() { return storage_->data(); }
  const uint8_t* data() const { return storage_->data(); }

  // Identity of the underlying memory.
  const void* StorageId() const { return storage_.get(); }

 private:
  explicit SharedByteBuffer(std::shared_ptr<std::vector<uint8_t>> storage);

  std::shared_ptr<std::vector<uint8_t>> storage_;
};

// =============================================================================
// Numeric element views
// =============================================================================

enum class NumericElementType {
  kInt8,
  kUint8,
  kInt16,
  kUint16,
  kInt32,
  kUint32,
  kFloat32,
  kFloat64,
};

const char* NumericElementTypeToString(NumericElementType type);
size_t NumericElementSize(NumericElementType type);

// Native-endian element codec. Integer writes wrap modulo 2^bits; NaN and
// infinities store 0.
double ReadNumericElement(NumericElementType type, const uint8_t* src);
void WriteNumericElement(NumericElementType type, uint8_t* dst, double value);

// Typed element view over a ByteBuffer or a SharedByteBuffer.
class NumericArray {
 public:
  // Allocates a fresh zeroed ByteBuffer.
  NumericArray(NumericElementType type, size_t length);
  NumericArray(NumericElementType type, std::initializer_list<double> values);
  NumericArray(NumericElementType type, const std::vector<double>& values);

  // Views over existing memory. Throw std::invalid_argument if byte_offset is
  // not element-aligned or the range exceeds the buffer.
  NumericArray(NumericElementType type, std::shared_ptr<ByteBuffer> buffer,
               size_t byte_offset, size_t length);
  NumericArray(NumericElementType type, std::shared_ptr<SharedByteBuffer> buffer,
               size_t byte_offset, size_t length);

  NumericElementType type() const { return type_; }
  size_t Length() const { return length_; }
  size_t ByteOffset() const { return byte_offset_; }
  size_t ByteLength() const { return length_ * NumericElementSize(type_); }

  // Throw std::out_of_range past Length().
  double At(size_t index) const;
  void SetAt(size_t index, double value);

  std::vector<double> ToVector() const;

  bool IsShared() const { return shared_buffer_ != nullptr; }
  // Exactly one of these is non-null.
  const std::shared_ptr<ByteBuffer>& buffer() const { return buffer_; }
  const std::shared_ptr<SharedByteBuffer>& shared_buffer() const { return shared_buffer_; }

 private:
  void CheckRange(size_t buffer_length) const;
  const uint8_t* ElementPtr(size_t index) const;
  uint8_t* MutableElementPtr(size_t index);

  NumericElementType type_;
  std::shared_ptr<ByteBuffer> buffer_;
  std::shared_ptr<SharedByteBuffer> shared_buffer_;
  size_t byte_offset_ = 0;
  size_t length_ = 0;
};

}  // namespace simcore::payload

#endif  // SIMCORE_PAYLOAD_BUFFERS_HPP_
