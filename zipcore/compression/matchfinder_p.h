// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_COMPRESSION_MATCHFINDER_P_H_INCLUDED
#define ZIPCORE_COMPRESSION_MATCHFINDER_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/compression/deflatedefs_p.h>
#include <zipcore/support/intops_p.h>
#include <zipcore/support/memops_p.h>
#include <zipcore/support/ptrops_p.h>

//! \cond INTERNAL

namespace zc::Compression::Deflate {

//! Position of a sequence relative to the current window base. Negative positions are out of the window.
typedef int16_t MFPos;

static constexpr uint32_t kMatchFinderWindowSize = kMaxWindowSize;
static constexpr MFPos kMatchFinderWindowSizeNeg = MFPos(0 - int(kMatchFinderWindowSize));

// The hash function: given a sequence prefix held in the low-order bits of a 32-bit value, multiply by a large
// constant and take the highest `num_bits` bits of the 32-bit product.
static ZC_INLINE uint32_t lz_hash(uint32_t seq, uint32_t num_bits) noexcept {
  return (seq * 0x1E35A7BDu) >> (32 - num_bits);
}

// Returns the number of bytes at `matchptr` that match the bytes at `strptr` up to a maximum of `max_len`.
// Initially, `start_len` bytes are known to match.
static ZC_INLINE uint32_t lz_extend(const uint8_t* strptr, const uint8_t* matchptr, uint32_t start_len, uint32_t max_len) noexcept {
  uint32_t len = start_len;

  if constexpr (MemOps::kUnalignedMemIO) {
    while (len + uint32_t(sizeof(ZCBitWord)) <= max_len) {
      ZCBitWord v_word = MemOps::loadu<ZCBitWord>(&matchptr[len]) ^ MemOps::loadu<ZCBitWord>(&strptr[len]);
      if (v_word != 0) {
        if constexpr (ZC_BYTE_ORDER == 1234)
          len += IntOps::ctz(v_word) >> 3;
        else
          len += IntOps::clz(v_word) >> 3;
        return len;
      }
      len += uint32_t(sizeof(ZCBitWord));
    }
  }

  while (len < max_len && matchptr[len] == strptr[len])
    len++;
  return len;
}

// Hash chain matchfinder
// ======================
//
// The main data structure is a hash table where each bucket contains a linked list (chain) of sequences whose
// first 4 bytes share the same hash code. Each sequence is identified by its starting position in the input.
//
// Length 3 matches are handled by a separate hash table without chains, which only remembers the most recent
// sequence. Lazy and greedy compressors only benefit from length 3 matches when their offsets are small.
//
// Positions are stored relative to a base pointer, which slides forward by a window size each time the current
// position reaches the end of the window. Sliding rebases all positions, saturating expired ones to `-32768`.

static constexpr uint32_t kHcMatchFinderHash3Order = 15;
static constexpr uint32_t kHcMatchFinderHash4Order = 16;

static constexpr size_t kHcMatchFinderTotalHashLength = (size_t(1) << kHcMatchFinderHash3Order) + (size_t(1) << kHcMatchFinderHash4Order);

struct alignas(64) HcMatchFinder {
  //! The hash table for finding length 3 matches.
  MFPos hash3_tab[size_t(1) << kHcMatchFinderHash3Order];
  //! The hash table, which contains the first nodes of the chains for length 4+ matches.
  MFPos hash4_tab[size_t(1) << kHcMatchFinderHash4Order];
  //! The next node of the node for the sequence at position `pos` is `next_tab[pos]`.
  MFPos next_tab[kMatchFinderWindowSize];

  //! Prepares the matchfinder for a new input buffer.
  //!
  //! Only hash tables are initialized, `next_tab` entries are always written before they are read.
  ZC_INLINE void init() noexcept {
    MFPos* data = hash3_tab;
    for (size_t i = 0; i < kHcMatchFinderTotalHashLength; i++) {
      data[i] = kMatchFinderWindowSizeNeg;
    }
  }

  //! Slides the window by `kMatchFinderWindowSize` bytes.
  //!
  //! Must be called just after each window size bytes have been run through the matchfinder. Positions that
  //! underflow are saturated to `-32768`, so once the window passes over a position it stays out of bounds.
  ZC_INLINE void slide_window() noexcept {
    MFPos* data = hash3_tab;
    size_t n = sizeof(HcMatchFinder) / sizeof(MFPos);

    // If the value was already negative, clear all bits except the sign bit, which changes the value to -32768.
    // Otherwise set the sign bit, which is equivalent to subtracting 32768.
    for (size_t i = 0; i < n; i++) {
      uint16_t v = uint16_t(data[i]);
      data[i] = MFPos(uint16_t((v & ~uint16_t(int16_t(v) >> 15)) | 0x8000u));
    }
  }

  //! Finds the longest match longer than `best_len` bytes.
  //!
  //! \param in_base_p Pointer to the place in the input the matchfinder stores positions relative to (can be updated).
  //! \param in_next The sequence being matched against.
  //! \param best_len Require a match longer than this length.
  //! \param max_len The maximum permissible match length at this position.
  //! \param nice_len Stop searching if a match of at least this length is found, must be `<= max_len`.
  //! \param max_search_depth Limit on the number of potential matches to consider, must be `>= 1`.
  //! \param next_hashes Precomputed hash codes of `in_next`, updated to contain hash codes of `in_next + 1`.
  //! \param offset_out Offset of the match found (only valid if the returned length is greater than `best_len`).
  //!
  //! Returns the length of the match found or `best_len` if no longer match was found.
  ZC_INLINE uint32_t longest_match(
    const uint8_t** ZC_RESTRICT in_base_p,
    const uint8_t* ZC_RESTRICT in_next,
    uint32_t best_len,
    const uint32_t max_len,
    const uint32_t nice_len,
    const uint32_t max_search_depth,
    uint32_t* ZC_RESTRICT next_hashes,
    uint32_t* ZC_RESTRICT offset_out) noexcept {

    uint32_t depth_remaining = max_search_depth;
    const uint8_t* best_matchptr = in_next;
    uint32_t cur_pos = uint32_t(in_next - *in_base_p);

    if (cur_pos == kMatchFinderWindowSize) {
      slide_window();
      *in_base_p += kMatchFinderWindowSize;
      cur_pos = 0;
    }

    const uint8_t* in_base = *in_base_p;
    MFPos cutoff = MFPos(int32_t(cur_pos) - int32_t(kMatchFinderWindowSize));

    // Can we read 4 bytes from 'in_next + 1'?
    if (ZC_LIKELY(max_len >= 5)) {
      const uint8_t* matchptr;

      uint32_t hash3 = next_hashes[0];
      uint32_t hash4 = next_hashes[1];

      MFPos cur_node3 = hash3_tab[hash3];
      MFPos cur_node4 = hash4_tab[hash4];

      // Replace the singleton node in 'hash3' bucket and prepend the current sequence to the 'hash4' chain.
      hash3_tab[hash3] = MFPos(cur_pos);
      hash4_tab[hash4] = MFPos(cur_pos);
      next_tab[cur_pos] = cur_node4;

      uint32_t next_hash_seq = MemOps::loadu_le<uint32_t>(in_next + 1);
      next_hashes[0] = lz_hash(next_hash_seq & 0xFFFFFFu, kHcMatchFinderHash3Order);
      next_hashes[1] = lz_hash(next_hash_seq, kHcMatchFinderHash4Order);

      if (best_len < 4) {
        if (cur_node3 <= cutoff)
          goto out;

        uint32_t seq4 = MemOps::readU32u(in_next);
        if (best_len < 3) {
          matchptr = &in_base[cur_node3];
          if (MemOps::readU24u(matchptr) == loaded_u32_to_u24(seq4)) {
            best_len = 3;
            best_matchptr = matchptr;
          }
        }

        if (cur_node4 <= cutoff)
          goto out;

        for (;;) {
          matchptr = &in_base[cur_node4];
          if (MemOps::readU32u(matchptr) == seq4)
            break;

          cur_node4 = next_tab[cur_node4 & MFPos(kMatchFinderWindowSize - 1)];
          if (cur_node4 <= cutoff || !--depth_remaining)
            goto out;
        }

        // Found a match of length >= 4, extend it to its full length.
        best_matchptr = matchptr;
        best_len = lz_extend(in_next, best_matchptr, 4, max_len);
        if (best_len >= nice_len)
          goto out;

        cur_node4 = next_tab[cur_node4 & MFPos(kMatchFinderWindowSize - 1)];
        if (cur_node4 <= cutoff || !--depth_remaining)
          goto out;
      }
      else {
        if (cur_node4 <= cutoff || best_len >= nice_len)
          goto out;
      }

      // Check for matches of length >= 5.
      for (;;) {
        for (;;) {
          matchptr = &in_base[cur_node4];

          // The byte that would extend the match length by 1 is the most important one to check.
          if constexpr (MemOps::kUnalignedMem32) {
            if ((MemOps::loadu<uint32_t>(matchptr + best_len - 3) == MemOps::loadu<uint32_t>(in_next + best_len - 3)) &&
                (MemOps::loadu<uint32_t>(matchptr) == MemOps::loadu<uint32_t>(in_next)))
              break;
          }
          else {
            if (matchptr[best_len] == in_next[best_len])
              break;
          }

          cur_node4 = next_tab[cur_node4 & MFPos(kMatchFinderWindowSize - 1)];
          if (cur_node4 <= cutoff || !--depth_remaining)
            goto out;
        }

        uint32_t len = lz_extend(in_next, matchptr, MemOps::kUnalignedMem32 ? 4u : 0u, max_len);
        if (len > best_len) {
          best_len = len;
          best_matchptr = matchptr;
          if (best_len >= nice_len)
            goto out;
        }

        cur_node4 = next_tab[cur_node4 & MFPos(kMatchFinderWindowSize - 1)];
        if (cur_node4 <= cutoff || !--depth_remaining)
          goto out;
      }
    }

  out:
    *offset_out = uint32_t(in_next - best_matchptr);
    return best_len;
  }

  //! Advances the matchfinder by `count` bytes without searching for matches and returns `in_next + count`.
  ZC_INLINE const uint8_t* skip_positions(
    const uint8_t** ZC_RESTRICT in_base_p,
    const uint8_t* in_next,
    const uint8_t* in_end,
    const uint32_t count,
    uint32_t* ZC_RESTRICT next_hashes) noexcept {

    if (ZC_UNLIKELY(count + 5 > PtrOps::bytes_until(in_next, in_end))) {
      return &in_next[count];
    }

    uint32_t remaining = count;
    uint32_t cur_pos = uint32_t(in_next - *in_base_p);

    uint32_t hash3 = next_hashes[0];
    uint32_t hash4 = next_hashes[1];

    do {
      if (cur_pos == kMatchFinderWindowSize) {
        slide_window();
        *in_base_p += kMatchFinderWindowSize;
        cur_pos = 0;
      }

      hash3_tab[hash3] = MFPos(cur_pos);
      next_tab[cur_pos] = hash4_tab[hash4];
      hash4_tab[hash4] = MFPos(cur_pos);

      uint32_t next_hash_seq = MemOps::loadu_le<uint32_t>(++in_next);
      hash3 = lz_hash(next_hash_seq & 0xFFFFFFu, kHcMatchFinderHash3Order);
      hash4 = lz_hash(next_hash_seq, kHcMatchFinderHash4Order);
      cur_pos++;
    } while (--remaining);

    next_hashes[0] = hash3;
    next_hashes[1] = hash4;
    return in_next;
  }
};

} // {zc::Compression::Deflate}

//! \endcond

#endif // ZIPCORE_COMPRESSION_MATCHFINDER_P_H_INCLUDED
