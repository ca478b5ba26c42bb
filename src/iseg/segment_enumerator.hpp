/*
 * segment_enumerator.hpp
 *
 * Explicit cursor over an immutable_segment window.
 *
 *   auto e = seg.enumerate();
 *   while (e.move_next()) { use(e.current()); }
 *   e.reset();  // back before the first element of the same window
 *
 * The enumerator holds its own reference to the backing buffer, so it stays valid
 * after the segment it came from is destroyed or reassigned.
 */

#ifndef ISEG_SEGMENT_ENUMERATOR_HPP_
#define ISEG_SEGMENT_ENUMERATOR_HPP_

#include <utility>   // std::move

#include "basic_types.h"          // reg
#include "base/iseg_errors.hpp"
#include "base/iseg_tools.hpp"   // ISEG_FORCEINLINE, ISEG_UNLIKELY

namespace iseg {

template<class Segment>
class segment_enumerator
{
public:
    using segment_type    = Segment;
    using value_type      = typename Segment::value_type;
    using size_type       = typename Segment::size_type;
    using const_reference = typename Segment::const_reference;

    explicit segment_enumerator(Segment seg) noexcept
        : seg_(std::move(seg))
    {}

    // Advances; false once the window is exhausted (and on every later call).
    [[nodiscard]] bool move_next() noexcept
    {
        const size_type len = seg_.size();
        if (pos_ <= len) {
            ++pos_;
        }
        return pos_ <= len;
    }

    [[nodiscard]] const_reference current() const
    {
        if (ISEG_UNLIKELY(pos_ == 0u || pos_ > seg_.size())) {
            detail::throw_invalid_state("iseg::segment_enumerator: current() outside the window");
        }
        return seg_.data()[pos_ - 1u];
    }

    void reset() noexcept { pos_ = 0u; }

    [[nodiscard]] const Segment& segment() const noexcept { return seg_; }

private:
    Segment   seg_;
    size_type pos_{0u}; // 0 = before first, k = element k-1, size()+1 = past end
};

} // namespace iseg

#endif /* ISEG_SEGMENT_ENUMERATOR_HPP_ */
