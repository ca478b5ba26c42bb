/*
 * iseg_alloc.hpp
 *
 * Stateless allocators for backing buffers.
 *
 * immutable_segment<T, Alloc> takes a byte allocator and rebinds it twice:
 * once to T for the element block and once to the shared control block.
 * Allocation failure throws std::bad_alloc; there is no null-returning mode
 * because a segment has no way to report "not built".
 */

#ifndef ISEG_ALLOC_HPP_
#define ISEG_ALLOC_HPP_

#include <cstddef>     // std::size_t, std::byte, std::max_align_t
#include <cstdint>     // std::uintptr_t
#include <cstring>     // std::memcpy
#include <limits>      // std::numeric_limits
#include <new>         // std::bad_alloc, std::bad_array_new_length, std::align_val_t
#include <type_traits> // std::true_type

#include "basic_types.h"        // reg
#include "iseg_tools.hpp"

namespace iseg::alloc {

namespace detail {

#if defined(__cpp_aligned_new) && defined(__STDCPP_DEFAULT_NEW_ALIGNMENT__)
inline constexpr std::size_t kDefaultNewAlign = __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
inline constexpr std::size_t kDefaultNewAlign = alignof(std::max_align_t);
#endif

// Raw header stores the original pointer returned by ::operator new.
inline constexpr std::size_t kRawHeaderSize = sizeof(void*);

inline constexpr bool kUseAlignedNew =
#if defined(__cpp_aligned_new)
    (ISEG_ALLOC_PREFER_ALIGNED_NEW != 0);
#else
    false;
#endif

constexpr bool is_pow2(const std::size_t x) noexcept {
    return (x != 0u) && ((x & (x - 1u)) == 0u);
}

template<class T>
inline constexpr bool needs_overaligned_alloc = (alignof(T) > kDefaultNewAlign);

/*
 * Over-aligned allocation on top of plain ::operator new.
 * Allocates size + alignment - 1 + header bytes, aligns the payload and
 * stores the raw pointer right before it.
 */
[[nodiscard]] inline void* aligned_alloc_raw(std::size_t alignment, const std::size_t size)
{
    if (alignment < alignof(void*)) {
        alignment = alignof(void*);
    }

    const std::size_t padMax = alignment - 1u;
    if (ISEG_UNLIKELY(size > std::numeric_limits<std::size_t>::max() - padMax - kRawHeaderSize)) {
        throw std::bad_array_new_length{};
    }

    void* const raw = ::operator new(size + padMax + kRawHeaderSize);

    auto* const rawBytes = static_cast<std::byte*>(raw);
    const std::uintptr_t baseUp    = reinterpret_cast<std::uintptr_t>(rawBytes + kRawHeaderSize);
    const std::uintptr_t alignedUp = (baseUp + padMax) & ~static_cast<std::uintptr_t>(padMax);

    auto* const alignedPtr = rawBytes + (alignedUp - reinterpret_cast<std::uintptr_t>(raw));
    std::memcpy(alignedPtr - kRawHeaderSize, &raw, kRawHeaderSize);
    return static_cast<void*>(alignedPtr);
}

inline void aligned_free_raw(void* ptr) noexcept
{
    if (ISEG_UNLIKELY(!ptr)) {
        return;
    }

    void* raw = nullptr;
    std::memcpy(&raw, static_cast<std::byte*>(ptr) - kRawHeaderSize, kRawHeaderSize);
    ::operator delete(raw);
}

} // namespace detail

// ============================================================================
// basic_allocator<T>
// ============================================================================

template<class T>
class basic_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal                        = std::true_type;

    static_assert(detail::is_pow2(alignof(T)), "basic_allocator: alignof(T) must be pow2");

    basic_allocator() noexcept = default;

    template<class U>
    basic_allocator(const basic_allocator<U>&) noexcept {}

    [[nodiscard]] T* allocate(const size_type n)
    {
        if (ISEG_UNLIKELY(n == 0u)) {
            return nullptr;
        }
        if (ISEG_UNLIKELY(n > (std::numeric_limits<size_type>::max() / sizeof(T)))) {
            throw std::bad_array_new_length{};
        }

        const size_type bytes = n * sizeof(T);

        if constexpr (!detail::needs_overaligned_alloc<T>) {
            return static_cast<T*>(::operator new(bytes));
        } else if constexpr (detail::kUseAlignedNew) {
            return static_cast<T*>(::operator new(bytes, std::align_val_t(alignof(T))));
        } else {
            return static_cast<T*>(detail::aligned_alloc_raw(alignof(T), bytes));
        }
    }

    void deallocate(T* p, size_type /*n*/) noexcept
    {
        if (ISEG_UNLIKELY(!p)) {
            return;
        }

        if constexpr (!detail::needs_overaligned_alloc<T>) {
            ::operator delete(p);
        } else if constexpr (detail::kUseAlignedNew) {
            ::operator delete(p, std::align_val_t(alignof(T)));
        } else {
            detail::aligned_free_raw(p);
        }
    }

    template<class U>
    struct rebind {
        using other = basic_allocator<U>;
    };
};

template<class T1, class T2>
inline bool operator==(const basic_allocator<T1>&, const basic_allocator<T2>&) noexcept
{
    return true;
}

template<class T1, class T2>
inline bool operator!=(const basic_allocator<T1>& a, const basic_allocator<T2>& b) noexcept
{
    return !(a == b);
}

using default_alloc = basic_allocator<std::byte>;

} // namespace iseg::alloc

#endif /* ISEG_ALLOC_HPP_ */
