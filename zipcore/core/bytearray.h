// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_CORE_BYTEARRAY_H_INCLUDED
#define ZIPCORE_CORE_BYTEARRAY_H_INCLUDED

#include <zipcore/core/api.h>

//! \addtogroup zc_containers
//! \{

//! \name ZCByteArray - C API
//! \{

//! Byte array [C API].
struct ZCByteArrayCore {
  //! Pointer to array data (owned, allocated by `malloc()`).
  uint8_t* data;
  //! Array size [in bytes].
  size_t size;
  //! Array capacity [in bytes].
  size_t capacity;
};

ZC_BEGIN_C_DECLS

ZC_API ZCResult ZC_CDECL zc_byte_array_init(ZCByteArrayCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_init_move(ZCByteArrayCore* self, ZCByteArrayCore* other) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_destroy(ZCByteArrayCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_reset(ZCByteArrayCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_clear(ZCByteArrayCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_reserve(ZCByteArrayCore* self, size_t n) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_resize(ZCByteArrayCore* self, size_t n, uint8_t fill) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_modify_op(ZCByteArrayCore* self, ZCModifyOp op, size_t n, uint8_t** data_out) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_assign_move(ZCByteArrayCore* self, ZCByteArrayCore* other) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_assign_data(ZCByteArrayCore* self, const void* data, size_t n) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_append_data(ZCByteArrayCore* self, const void* data, size_t n) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_byte_array_remove_range(ZCByteArrayCore* self, size_t start, size_t end) ZC_NOEXCEPT_C;
ZC_API bool ZC_CDECL zc_byte_array_equals(const ZCByteArrayCore* a, const ZCByteArrayCore* b) ZC_NOEXCEPT_C;

ZC_END_C_DECLS

//! \}

//! \name ZCByteArray - C++ API
//! \{
#ifdef __cplusplus

//! Byte array [C++ API].
//!
//! A growable buffer of bytes that owns its memory. Unlike most containers it's not copyable, use `assign_data()`
//! to make a deep copy. All modifying operations report allocation failures through `ZCResult`.
class ZCByteArray final : public ZCByteArrayCore {
public:
  //! \name Construction & Destruction
  //! \{

  ZC_INLINE_NODEBUG ZCByteArray() noexcept { zc_byte_array_init(this); }
  ZC_INLINE_NODEBUG ZCByteArray(ZCByteArray&& other) noexcept { zc_byte_array_init_move(this, &other); }
  ZC_INLINE_NODEBUG ZCByteArray(const ZCByteArray& other) = delete;
  ZC_INLINE_NODEBUG ~ZCByteArray() noexcept { zc_byte_array_destroy(this); }

  //! \}

  //! \name Overloaded Operators
  //! \{

  ZC_INLINE_NODEBUG ZCByteArray& operator=(ZCByteArray&& other) noexcept { zc_byte_array_assign_move(this, &other); return *this; }
  ZC_INLINE_NODEBUG ZCByteArray& operator=(const ZCByteArray& other) = delete;

  ZC_INLINE_NODEBUG bool operator==(const ZCByteArray& other) const noexcept { return equals(other); }
  ZC_INLINE_NODEBUG bool operator!=(const ZCByteArray& other) const noexcept { return !equals(other); }

  ZC_INLINE_NODEBUG const uint8_t& operator[](size_t index) const noexcept { ZC_ASSERT(index < size); return data[index]; }

  //! \}

  //! \name Common Functionality
  //! \{

  //! Resets the array into a default constructed state by clearing its content and releasing its memory.
  ZC_INLINE_NODEBUG ZCResult reset() noexcept { return zc_byte_array_reset(this); }

  ZC_INLINE_NODEBUG void swap(ZCByteArray& other) noexcept {
    ZCByteArrayCore tmp = *this;
    static_cast<ZCByteArrayCore&>(*this) = other;
    static_cast<ZCByteArrayCore&>(other) = tmp;
  }

  //! \}

  //! \name Accessors
  //! \{

  ZC_INLINE_NODEBUG bool is_empty() const noexcept { return size == 0; }

  //! Returns the array content as `ZCDataView`.
  ZC_INLINE_NODEBUG ZCDataView view() const noexcept { return ZCDataView{data, size}; }

  ZC_INLINE_NODEBUG bool equals(const ZCByteArray& other) const noexcept { return zc_byte_array_equals(this, &other); }

  //! \}

  //! \name Data Manipulation
  //! \{

  //! Clears the content of the array, the memory is kept for reuse.
  ZC_INLINE_NODEBUG ZCResult clear() noexcept { return zc_byte_array_clear(this); }

  //! Reserves the array capacity to hold at least `n` bytes.
  ZC_INLINE_NODEBUG ZCResult reserve(size_t n) noexcept { return zc_byte_array_reserve(this, n); }

  //! Resizes the array to `n` bytes, new bytes are initialized to `fill`.
  ZC_INLINE_NODEBUG ZCResult resize(size_t n, uint8_t fill = 0) noexcept { return zc_byte_array_resize(this, n, fill); }

  //! Truncates the array to at most `n` bytes.
  ZC_INLINE_NODEBUG ZCResult truncate(size_t n) noexcept { return n < size ? zc_byte_array_resize(this, n, 0) : ZCResult(ZC_SUCCESS); }

  //! Modify operation, see \ref ZCModifyOp. The pointer returned in `data_out` points to the first byte to be either
  //! assigned or appended and it points to an uninitialized memory. The caller is responsible for initializing it.
  ZC_INLINE_NODEBUG ZCResult modify_op(ZCModifyOp op, size_t n, uint8_t** data_out) noexcept {
    return zc_byte_array_modify_op(this, op, n, data_out);
  }

  ZC_INLINE_NODEBUG ZCResult assign_data(const void* src, size_t n) noexcept { return zc_byte_array_assign_data(this, src, n); }
  ZC_INLINE_NODEBUG ZCResult assign_data(const ZCDataView& view) noexcept { return zc_byte_array_assign_data(this, view.data, view.size); }

  ZC_INLINE_NODEBUG ZCResult append(uint8_t b) noexcept {
    uint8_t* dst;
    ZC_PROPAGATE(zc_byte_array_modify_op(this, ZC_MODIFY_OP_APPEND_GROW, 1, &dst));
    *dst = b;
    return ZC_SUCCESS;
  }

  ZC_INLINE_NODEBUG ZCResult append_data(const void* src, size_t n) noexcept { return zc_byte_array_append_data(this, src, n); }
  ZC_INLINE_NODEBUG ZCResult append_data(const ZCDataView& view) noexcept { return zc_byte_array_append_data(this, view.data, view.size); }

  //! Removes bytes in `[start, end)` range and moves the remaining bytes.
  ZC_INLINE_NODEBUG ZCResult remove_range(size_t start, size_t end) noexcept { return zc_byte_array_remove_range(this, start, end); }

  //! \}
};

#endif
//! \}

//! \}

#endif // ZIPCORE_CORE_BYTEARRAY_H_INCLUDED
