/*
 * basic_types.h - platform-independent size and index aliases used by iseg
 *
 *  Category      │ Purpose                         │ Types
 * ───────────────┼─────────────────────────────────┼───────────────────────
 *  Exact-width   │ Fixed bit size                  │ u8, u32, u64, i32, i64
 *  Native        │ Pointer-sized (register proxy)  │ reg, sreg
 *  Size-friendly │ API ergonomics for sizes        │ usize, isize
 *
 * reg is the unsigned word used for every length, offset and index in the
 * library. sreg is only used where an end-relative position is resolved and
 * may go negative before it is validated.
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#include <cstddef>   /* size_t, ptrdiff_t */
#include <cstdint>   /* integer types */

/* Exact-width integer types */
using u8  = std::uint8_t;   using i8  = std::int8_t;
using u16 = std::uint16_t;  using i16 = std::int16_t;
using u32 = std::uint32_t;  using i32 = std::int32_t;
using u64 = std::uint64_t;  using i64 = std::int64_t;

/* Native register-size types (match pointer size) */
using reg  = std::size_t;      /* unsigned native word (lengths, offsets, indices) */
using sreg = std::ptrdiff_t;   /* signed native word (differences, unresolved positions) */

/* Size-friendly aliases */
using usize = std::size_t;
using isize = std::ptrdiff_t;

static_assert(sizeof(reg)  == sizeof(void*), "reg must match pointer size");
static_assert(sizeof(sreg) == sizeof(void*), "sreg must match pointer size");
static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");

#endif /* BASIC_TYPES_H_ */
