/*
 * iseg_bounds.hpp
 *
 * Positions and half-open ranges that may be measured from either end,
 * plus the bound checks shared by construction, slicing and search.
 *
 *   iseg::from_start(2)              -> element 2
 *   iseg::from_end(1)                -> last element
 *   iseg::range{1, iseg::from_end(2)} -> drop the first element and the last two
 */

#ifndef ISEG_BOUNDS_HPP_
#define ISEG_BOUNDS_HPP_

#include <limits>
#include <stdexcept>   // std::length_error

#include "basic_types.h"   // reg, sreg
#include "iseg_errors.hpp"
#include "iseg_tools.hpp"

namespace iseg {

class index
{
public:
    constexpr index() noexcept = default;

    // Implicit: a plain integer is an absolute position.
    constexpr index(const reg value, const bool from_end = false) noexcept
        : value_(value)
        , from_end_(from_end)
    {}

    [[nodiscard]] constexpr reg value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool is_from_end() const noexcept { return from_end_; }

    // Position relative to the start of a sequence of `length` elements.
    // May be negative or past the end; callers validate. Positions that do not fit
    // in sreg saturate: -1 before the start, max() past any end.
    [[nodiscard]] constexpr sreg resolve(const reg length) const noexcept {
        constexpr reg kMax = static_cast<reg>(std::numeric_limits<sreg>::max());
        if (from_end_) {
            if (value_ > length) {
                return sreg{-1};
            }
            const reg p = length - value_;
            return (p > kMax) ? std::numeric_limits<sreg>::max() : static_cast<sreg>(p);
        }
        return (value_ > kMax) ? std::numeric_limits<sreg>::max() : static_cast<sreg>(value_);
    }

    [[nodiscard]] friend constexpr bool operator==(const index& a, const index& b) noexcept {
        return a.value_ == b.value_ && a.from_end_ == b.from_end_;
    }
    [[nodiscard]] friend constexpr bool operator!=(const index& a, const index& b) noexcept {
        return !(a == b);
    }

private:
    reg  value_{0u};
    bool from_end_{false};
};

[[nodiscard]] constexpr index from_start(const reg value) noexcept { return index(value, false); }
[[nodiscard]] constexpr index from_end(const reg value) noexcept { return index(value, true); }

// Resolved (offset, length) pair.
struct span_bounds {
    reg offset{0u};
    reg length{0u};
};

namespace detail {

// offset <= source_length and length <= source_length - offset, in that order of blame.
ISEG_FORCEINLINE void check_span(const reg source_length, const reg offset, const reg length)
{
    if (ISEG_UNLIKELY(offset > source_length)) {
        throw_out_of_range(range_fault::starts_beyond_source);
    }
    if (ISEG_UNLIKELY(length > source_length - offset)) {
        throw_out_of_range(range_fault::extends_past_end);
    }
}

ISEG_FORCEINLINE void check_index(const reg length, const reg i)
{
    if (ISEG_UNLIKELY(i >= length)) {
        throw_out_of_range(range_fault::index);
    }
}

[[nodiscard]] inline reg checked_add(const reg a, const reg b)
{
    if (ISEG_UNLIKELY(a > std::numeric_limits<reg>::max() - b)) {
        throw std::length_error("iseg: combined length overflows size_type");
    }
    return a + b;
}

[[nodiscard]] inline reg checked_mul(const reg a, const reg b)
{
    if (ISEG_UNLIKELY(b != 0u && a > std::numeric_limits<reg>::max() / b)) {
        throw std::length_error("iseg: combined length overflows size_type");
    }
    return a * b;
}

} // namespace detail

class range
{
public:
    // Default: the whole sequence.
    constexpr range() noexcept = default;

    constexpr range(const index first, const index last) noexcept
        : first_(first)
        , last_(last)
    {}

    [[nodiscard]] static constexpr range all() noexcept { return range(); }
    [[nodiscard]] static constexpr range starting_at(const index first) noexcept {
        return range(first, from_end(0u));
    }
    [[nodiscard]] static constexpr range up_to(const index last) noexcept {
        return range(from_start(0u), last);
    }

    // [offset, offset + length), both measured from the start.
    [[nodiscard]] static range of_length(const reg offset, const reg length) {
        return range(from_start(offset), from_start(detail::checked_add(offset, length)));
    }

    [[nodiscard]] constexpr index first() const noexcept { return first_; }
    [[nodiscard]] constexpr index last() const noexcept { return last_; }

    [[nodiscard]] constexpr bool is_all() const noexcept {
        return first_ == from_start(0u) && last_ == from_end(0u);
    }

    // True when resolving needs the source length.
    [[nodiscard]] constexpr bool needs_length() const noexcept {
        return first_.is_from_end() || last_.is_from_end();
    }

    // Validates against a sequence of `length` elements.
    [[nodiscard]] span_bounds resolve(const reg length) const {
        const sreg b = first_.resolve(length);
        const sreg e = last_.resolve(length);
        if (ISEG_UNLIKELY(b < 0 || b > static_cast<sreg>(length))) {
            detail::throw_out_of_range(range_fault::starts_beyond_source);
        }
        if (ISEG_UNLIKELY(e < b || e > static_cast<sreg>(length))) {
            detail::throw_out_of_range(range_fault::extends_past_end);
        }
        return span_bounds{static_cast<reg>(b), static_cast<reg>(e - b)};
    }

    // Both bounds measured from the start: resolvable without the source length.
    // Only the ordering can be checked here; the source length is checked while reading.
    [[nodiscard]] span_bounds resolve_from_start() const {
        ISEG_ASSERT(!needs_length());
        if (ISEG_UNLIKELY(last_.value() < first_.value())) {
            detail::throw_out_of_range(range_fault::extends_past_end);
        }
        return span_bounds{first_.value(), static_cast<reg>(last_.value() - first_.value())};
    }

private:
    index first_{from_start(0u)};
    index last_{from_end(0u)};
};

} // namespace iseg

#endif /* ISEG_BOUNDS_HPP_ */
