// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/bytearray.h>
#include <zipcore/support/intops_p.h>

namespace zc {
namespace ByteArrayInternal {

// zc::ByteArray - Internals
// =========================

static constexpr size_t kMaximumCapacity = SIZE_MAX / 2u;

//! Returns a capacity that is suitable for successive appends.
static ZC_INLINE size_t expand_capacity(size_t n) noexcept {
  size_t expanded;

  if (n >= ZC_ALLOC_GROW_LIMIT)
    expanded = n + (n >> 2) + (n >> 3); // Makes the capacity 37.5% greater.
  else
    expanded = IntOps::grow_to_power_of_2(zc_max<size_t>(n, 63u) + ZC_ALLOC_OVERHEAD) - ZC_ALLOC_OVERHEAD;

  // If an overflow happened during any of the computation above `zc_max()` would cancel it and make it fitting.
  return zc_max(n, expanded);
}

static ZC_NOINLINE ZCResult realloc_to_capacity(ZCByteArrayCore* self, size_t capacity) noexcept {
  if (ZC_UNLIKELY(capacity > kMaximumCapacity))
    return zc_make_error(ZC_ERROR_ALLOC_FAILED);

  uint8_t* new_data = static_cast<uint8_t*>(realloc(self->data, zc_max<size_t>(capacity, 1u)));
  if (ZC_UNLIKELY(!new_data))
    return zc_make_error(ZC_ERROR_ALLOC_FAILED);

  self->data = new_data;
  self->capacity = capacity;
  return ZC_SUCCESS;
}

} // {ByteArrayInternal}
} // {zc}

// zc::ByteArray - API - Init & Destroy
// ====================================

ZC_API_IMPL ZCResult zc_byte_array_init(ZCByteArrayCore* self) noexcept {
  self->data = nullptr;
  self->size = 0;
  self->capacity = 0;
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_byte_array_init_move(ZCByteArrayCore* self, ZCByteArrayCore* other) noexcept {
  ZC_ASSERT(self != other);

  *self = *other;
  return zc_byte_array_init(other);
}

ZC_API_IMPL ZCResult zc_byte_array_destroy(ZCByteArrayCore* self) noexcept {
  free(self->data);
  return zc_byte_array_init(self);
}

// zc::ByteArray - API - Reset & Clear
// ===================================

ZC_API_IMPL ZCResult zc_byte_array_reset(ZCByteArrayCore* self) noexcept {
  return zc_byte_array_destroy(self);
}

ZC_API_IMPL ZCResult zc_byte_array_clear(ZCByteArrayCore* self) noexcept {
  self->size = 0;
  return ZC_SUCCESS;
}

// zc::ByteArray - API - Storage Management
// ========================================

ZC_API_IMPL ZCResult zc_byte_array_reserve(ZCByteArrayCore* self, size_t n) noexcept {
  using namespace zc::ByteArrayInternal;

  if (n <= self->capacity)
    return ZC_SUCCESS;

  return realloc_to_capacity(self, n);
}

ZC_API_IMPL ZCResult zc_byte_array_resize(ZCByteArrayCore* self, size_t n, uint8_t fill) noexcept {
  size_t size = self->size;

  if (n <= size) {
    self->size = n;
    return ZC_SUCCESS;
  }

  uint8_t* dst;
  ZC_PROPAGATE(zc_byte_array_modify_op(self, ZC_MODIFY_OP_APPEND_FIT, n - size, &dst));

  memset(dst, fill, n - size);
  return ZC_SUCCESS;
}

// zc::ByteArray - API - Modify Op
// ===============================

ZC_API_IMPL ZCResult zc_byte_array_modify_op(ZCByteArrayCore* self, ZCModifyOp op, size_t n, uint8_t** data_out) noexcept {
  using namespace zc::ByteArrayInternal;

  size_t index = zc_modify_op_is_append(op) ? self->size : size_t(0);
  size_t size_after = index + n;

  if (ZC_UNLIKELY(size_after < index)) {
    *data_out = nullptr;
    return zc_make_error(ZC_ERROR_ALLOC_FAILED);
  }

  if (size_after > self->capacity) {
    size_t capacity = zc_modify_op_does_grow(op) ? expand_capacity(size_after) : size_after;
    ZCResult result = realloc_to_capacity(self, capacity);

    if (ZC_UNLIKELY(result != ZC_SUCCESS)) {
      *data_out = nullptr;
      return result;
    }
  }

  self->size = size_after;
  *data_out = self->data + index;
  return ZC_SUCCESS;
}

// zc::ByteArray - API - Assign & Append
// =====================================

ZC_API_IMPL ZCResult zc_byte_array_assign_move(ZCByteArrayCore* self, ZCByteArrayCore* other) noexcept {
  if (self == other)
    return ZC_SUCCESS;

  ZCByteArrayCore tmp = *other;
  zc_byte_array_init(other);
  zc_byte_array_destroy(self);

  *self = tmp;
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_byte_array_assign_data(ZCByteArrayCore* self, const void* data, size_t n) noexcept {
  // The source can point to the array itself, which happens when a slice is assigned.
  if (ZC_UNLIKELY(data >= self->data && data < self->data + self->size)) {
    size_t offset = size_t(static_cast<const uint8_t*>(data) - self->data);
    if (ZC_UNLIKELY(n > self->size - offset))
      return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

    memmove(self->data, data, n);
    self->size = n;
    return ZC_SUCCESS;
  }

  uint8_t* dst;
  ZC_PROPAGATE(zc_byte_array_modify_op(self, ZC_MODIFY_OP_ASSIGN_FIT, n, &dst));

  if (n)
    memcpy(dst, data, n);
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_byte_array_append_data(ZCByteArrayCore* self, const void* data, size_t n) noexcept {
  if (!n)
    return ZC_SUCCESS;

  // Appending a part of the array to itself would be invalidated by realloc.
  if (ZC_UNLIKELY(data >= self->data && data < self->data + self->size)) {
    size_t offset = size_t(static_cast<const uint8_t*>(data) - self->data);
    uint8_t* dst;
    ZC_PROPAGATE(zc_byte_array_modify_op(self, ZC_MODIFY_OP_APPEND_GROW, n, &dst));
    memmove(dst, self->data + offset, n);
    return ZC_SUCCESS;
  }

  uint8_t* dst;
  ZC_PROPAGATE(zc_byte_array_modify_op(self, ZC_MODIFY_OP_APPEND_GROW, n, &dst));

  memcpy(dst, data, n);
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_byte_array_remove_range(ZCByteArrayCore* self, size_t start, size_t end) noexcept {
  size_t size = self->size;
  end = zc_min(end, size);

  if (ZC_UNLIKELY(start > end))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  size_t n = end - start;
  if (!n)
    return ZC_SUCCESS;

  memmove(self->data + start, self->data + end, size - end);
  self->size = size - n;
  return ZC_SUCCESS;
}

// zc::ByteArray - API - Equality
// ==============================

ZC_API_IMPL bool zc_byte_array_equals(const ZCByteArrayCore* a, const ZCByteArrayCore* b) noexcept {
  if (a->size != b->size)
    return false;

  return a->size == 0 || memcmp(a->data, b->data, a->size) == 0;
}
