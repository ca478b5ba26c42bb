/*
 * immutable_segment.hpp
 *
 * Immutable, zero-copy-sliceable view over a shared block of elements.
 *
 * Layout:
 *   buffer_  shared_ptr<const backing_buffer>  (null for the canonical empty value)
 *   start_   first element of the window inside the buffer
 *   len_     number of elements in the window
 *
 * Cost model:
 *   - slicing, indexing and enumeration are index arithmetic on the shared buffer
 *     (no allocation, O(1));
 *   - everything that produces a different sequence (append, prepend, insert,
 *     remove_all, concat, join) measures its inputs, allocates one destination of
 *     the final length and copies through the dispatcher in iseg_dispatch.hpp.
 *
 * A buffer is never written after a segment has been built over it. The only way
 * to wrap an existing buffer without copying is the private adopt constructor,
 * used for buffers this class has just filled.
 *
 * Concurrency:
 * - Distinct segment objects may be read and copied from any thread; the buffer
 *   reference count is atomic. Assigning to one object from two threads is a race.
 */

#ifndef ISEG_IMMUTABLE_SEGMENT_HPP_
#define ISEG_IMMUTABLE_SEGMENT_HPP_

#include <algorithm>        // std::search, std::copy_n
#include <cstddef>          // std::ptrdiff_t
#include <functional>       // std::function
#include <initializer_list>
#include <iterator>         // std::reverse_iterator, std::begin, std::end, std::size
#include <memory>           // std::shared_ptr
#include <tuple>            // std::tuple, std::apply
#include <type_traits>
#include <utility>          // std::move, std::exchange, std::swap
#include <vector>

#include "basic_types.h"            // reg, sreg
#include "base/iseg_alloc.hpp"
#include "base/iseg_bounds.hpp"
#include "base/iseg_buffer.hpp"
#include "base/iseg_dispatch.hpp"
#include "base/iseg_errors.hpp"
#include "base/iseg_sources.hpp"
#include "base/iseg_tools.hpp"     // ISEG_FORCEINLINE, ISEG_ASSERT, ISEG_HAS_SPAN
#include "segment_enumerator.hpp"

namespace iseg {

namespace detail {

template<class F>
struct is_std_function : std::false_type {};

template<class R, class... Args>
struct is_std_function<std::function<R(Args...)>> : std::true_type {};

// Null function pointers and empty std::function objects are rejected up front.
template<class F>
[[nodiscard]] bool is_null_callable(const F& f) noexcept
{
    if constexpr (std::is_pointer_v<F> || std::is_member_pointer_v<F> || is_std_function<F>::value) {
        return !f;
    } else {
        (void)f;
        return false;
    }
}

template<class F>
void require_callable(const F& f)
{
    if (ISEG_UNLIKELY(is_null_callable(f))) {
        throw_invalid_argument("iseg: null callable");
    }
}

template<class Source>
using element_of_t = std::remove_cv_t<std::remove_reference_t<decltype(*std::begin(std::declval<const Source&>()))>>;

} // namespace detail

/*
 * Forward declaration
 */
template<
    class T,
    typename Alloc = ::iseg::alloc::default_alloc
    >
class immutable_segment;

template<class T, typename Alloc>
class immutable_segment
{
public:
    using value_type             = T;
    using size_type              = reg;
    using difference_type        = std::ptrdiff_t;
    using reference              = const value_type&;
    using const_reference        = const value_type&;
    using pointer                = const value_type*;
    using const_pointer          = const value_type*;
    using iterator               = const_pointer;
    using const_iterator         = const_pointer;
    using reverse_iterator       = std::reverse_iterator<const_iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    using base_allocator_type    = Alloc;
    using enumerator             = segment_enumerator<immutable_segment>;

    // By-value comparer. An empty comparer means operator==.
    using value_comparer         = std::function<bool(T, T)>;

    static constexpr size_type npos = static_cast<size_type>(-1);

    // --------------------------------------------------------------------------
    // Static Assertions
    // --------------------------------------------------------------------------
    static_assert(!std::is_reference_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>,
                  "[iseg::immutable_segment]: T must be a non-cv object type.");
    static_assert(std::is_copy_constructible_v<T>,
                  "[iseg::immutable_segment]: T must be copy-constructible.");

private:
    using buffer_type    = detail::backing_buffer<T, Alloc>;
    using buffer_ptr     = detail::buffer_ptr<T, Alloc>;
    using builder_type   = detail::buffer_builder<T, Alloc>;

    template<class Source>
    using reader_type    = detail::source_reader<T, Alloc, Source>;

    template<class Source>
    static constexpr source_kind kind_of = source_kind_of_v<Source, T, Alloc>;

    template<class Source>
    static constexpr bool is_known_size =
        kind_of<Source> == source_kind::segment || kind_of<Source> == source_kind::contiguous ||
        kind_of<Source> == source_kind::random_access || kind_of<Source> == source_kind::sized;

    template<class Source>
    using enable_source_t = std::enable_if_t<is_source_v<Source, T>>;

    // Sources that are not themselves element values (a std::string is a value of
    // immutable_segment<std::string>, not a sequence to splice in).
    template<class Source>
    using enable_range_t = std::enable_if_t<is_source_v<Source, T> && !std::is_convertible_v<const Source&, T>>;

    template<class Eq>
    using enable_eq_t = std::enable_if_t<std::is_invocable_r_v<bool, Eq&, const T&, const T&>>;

    buffer_ptr buffer_{};
    size_type  start_{0u};
    size_type  len_{0u};

    // Adopt: wraps a buffer this class has just built. Never exposed.
    immutable_segment(detail::adopt_t, buffer_ptr buffer, const size_type start, const size_type length) noexcept
        : buffer_(std::move(buffer))
        , start_(start)
        , len_(length)
    {
        ISEG_ASSERT(!buffer_ ? (start_ == 0u && len_ == 0u) : (start_ + len_ <= buffer_->size()));
    }

    [[nodiscard]] static immutable_segment adopt(buffer_ptr buffer) noexcept {
        const size_type n = buffer ? buffer->size() : 0u;
        return immutable_segment(detail::adopt, std::move(buffer), 0u, n);
    }

    template<class Source>
    [[nodiscard]] static immutable_segment as_segment(const Source& src) {
        if constexpr (kind_of<Source> == source_kind::segment) {
            return src;
        } else {
            return immutable_segment(src);
        }
    }

public:
    // --------------------------------------------------------------------------
    // Ctors / Assignment
    // --------------------------------------------------------------------------
    immutable_segment() noexcept  = default;
    ~immutable_segment() noexcept = default;

    immutable_segment(const immutable_segment&)            = default;
    immutable_segment& operator=(const immutable_segment&) = default;

    // Moved-from segments are the canonical empty value.
    immutable_segment(immutable_segment&& other) noexcept
        : buffer_(std::move(other.buffer_))
        , start_(std::exchange(other.start_, 0u))
        , len_(std::exchange(other.len_, 0u))
    {}

    immutable_segment& operator=(immutable_segment&& other) noexcept
    {
        if (this != &other) {
            buffer_ = std::move(other.buffer_);
            start_  = std::exchange(other.start_, 0u);
            len_    = std::exchange(other.len_, 0u);
        }
        return *this;
    }

    // Raw buffer: always copied.
    immutable_segment(const_pointer src, const size_type count)
    {
        if (ISEG_UNLIKELY(src == nullptr && count != 0u)) {
            detail::throw_invalid_argument("iseg::immutable_segment: null buffer with non-zero length");
        }
        *this = adopt(detail::copy_block<T, Alloc>(src, count));
    }

    // Raw buffer, only [offset, offset + length) is copied.
    immutable_segment(const_pointer src, const size_type count, const size_type offset, const size_type length)
    {
        if (ISEG_UNLIKELY(src == nullptr && count != 0u)) {
            detail::throw_invalid_argument("iseg::immutable_segment: null buffer with non-zero length");
        }
        detail::check_span(count, offset, length);
        *this = adopt(detail::copy_block<T, Alloc>(src + offset, length));
    }

    immutable_segment(std::initializer_list<T> items)
        : immutable_segment(adopt(detail::copy_block<T, Alloc>(items.begin(), static_cast<size_type>(items.size()))))
    {}

    template<class Source, typename = enable_source_t<Source>,
             typename = std::enable_if_t<!std::is_same_v<Source, immutable_segment>>>
    explicit immutable_segment(const Source& src)
        : immutable_segment(adopt(detail::copy_all<T, Alloc>(src)))
    {}

    // Sub-range; bounds may be measured from either end.
    template<class Source, typename = enable_source_t<Source>>
    immutable_segment(const Source& src, const range& r)
    {
        if constexpr (kind_of<Source> == source_kind::segment) {
            *this = src.slice(r);
        } else {
            *this = adopt(detail::copy_range<T, Alloc>(src, r));
        }
    }

    template<class Source, typename = enable_source_t<Source>>
    immutable_segment(const Source& src, const size_type offset, const size_type length)
    {
        if constexpr (kind_of<Source> == source_kind::segment) {
            *this = src.slice(offset, length);
        } else if constexpr (is_known_size<Source>) {
            detail::check_span(static_cast<size_type>(std::size(src)), offset, length);
            *this = adopt(detail::copy_range<T, Alloc>(src, range(from_start(offset), from_start(offset + length))));
        } else {
            *this = adopt(detail::copy_bounded_pass<T, Alloc>(std::begin(src), std::end(src),
                                                              span_bounds{offset, length}));
        }
    }

    void swap(immutable_segment& other) noexcept
    {
        using std::swap;
        swap(buffer_, other.buffer_);
        swap(start_, other.start_);
        swap(len_, other.len_);
    }

    friend void swap(immutable_segment& a, immutable_segment& b) noexcept { a.swap(b); }

    // --------------------------------------------------------------------------
    // Observers
    // --------------------------------------------------------------------------
    [[nodiscard]] ISEG_FORCEINLINE size_type size() const noexcept { return len_; }
    [[nodiscard]] ISEG_FORCEINLINE size_type length() const noexcept { return len_; }
    [[nodiscard]] ISEG_FORCEINLINE bool empty() const noexcept { return len_ == 0u; }

    [[nodiscard]] ISEG_FORCEINLINE const_pointer data() const noexcept {
        return buffer_ ? buffer_->data() + start_ : nullptr;
    }

    // Same backing buffer (O(1) slicing results share storage).
    [[nodiscard]] bool shares_storage_with(const immutable_segment& other) const noexcept {
        return buffer_ && buffer_ == other.buffer_;
    }

#if ISEG_HAS_SPAN
    [[nodiscard]] std::span<const T> span() const noexcept { return {data(), static_cast<std::size_t>(len_)}; }
#endif /* ISEG_HAS_SPAN */

    // --------------------------------------------------------------------------
    // Iterators
    // --------------------------------------------------------------------------
    [[nodiscard]] const_iterator begin() const noexcept { return data(); }
    [[nodiscard]] const_iterator end() const noexcept { return data() + len_; }
    [[nodiscard]] const_iterator cbegin() const noexcept { return begin(); }
    [[nodiscard]] const_iterator cend() const noexcept { return end(); }

    [[nodiscard]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    [[nodiscard]] const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }
    [[nodiscard]] const_reverse_iterator crbegin() const noexcept { return rbegin(); }
    [[nodiscard]] const_reverse_iterator crend() const noexcept { return rend(); }

    [[nodiscard]] enumerator enumerate() const noexcept { return enumerator(*this); }

    // --------------------------------------------------------------------------
    // Element access
    // --------------------------------------------------------------------------
    [[nodiscard]] ISEG_FORCEINLINE const_reference operator[](const size_type i) const noexcept(ISEG_CHECKED_ACCESS == 0)
    {
#if ISEG_CHECKED_ACCESS
        detail::check_index(len_, i);
#else
        ISEG_ASSERT(i < len_);
#endif
        return data()[i];
    }

    [[nodiscard]] const_reference operator[](const index i) const { return at(i); }
    [[nodiscard]] immutable_segment operator[](const range& r) const { return slice(r); }

    [[nodiscard]] const_reference at(const size_type i) const
    {
        detail::check_index(len_, i);
        return data()[i];
    }

    [[nodiscard]] const_reference at(const index i) const
    {
        const sreg p = i.resolve(len_);
        if (ISEG_UNLIKELY(p < 0 || p >= static_cast<sreg>(len_))) {
            detail::throw_out_of_range(range_fault::index);
        }
        return data()[static_cast<size_type>(p)];
    }

    [[nodiscard]] value_type value_at(const size_type i) const { return at(i); }

    [[nodiscard]] const_pointer try_at(const size_type i) const noexcept {
        return (i < len_) ? data() + i : nullptr;
    }

    [[nodiscard]] const_reference front() const { return at(0u); }
    [[nodiscard]] const_reference back() const
    {
        if (ISEG_UNLIKELY(len_ == 0u)) {
            detail::throw_out_of_range(range_fault::index);
        }
        return data()[len_ - 1u];
    }

    // --------------------------------------------------------------------------
    // Slicing (O(1), shares the buffer)
    // --------------------------------------------------------------------------
    [[nodiscard]] immutable_segment slice(const size_type offset, const size_type length) const
    {
        detail::check_span(len_, offset, length);
        return immutable_segment(detail::adopt, buffer_, buffer_ ? start_ + offset : 0u, length);
    }

    [[nodiscard]] immutable_segment slice(const size_type offset) const
    {
        if (ISEG_UNLIKELY(offset > len_)) {
            detail::throw_out_of_range(range_fault::starts_beyond_source);
        }
        return slice(offset, len_ - offset);
    }

    [[nodiscard]] immutable_segment slice(const range& r) const
    {
        const span_bounds b = r.resolve(len_);
        return slice(b.offset, b.length);
    }

    // --------------------------------------------------------------------------
    // Copy out
    // --------------------------------------------------------------------------
    [[nodiscard]] std::vector<T> to_vector() const { return std::vector<T>(begin(), end()); }

    void copy_to(T* dest, const size_type dest_size, const size_type dest_offset) const
    {
        copy_to(dest, dest_size, dest_offset, len_);
    }

    void copy_to(T* dest, const size_type dest_size, const size_type dest_offset, const size_type length) const
    {
        if (ISEG_UNLIKELY(dest == nullptr && dest_size != 0u)) {
            detail::throw_invalid_argument("iseg::immutable_segment::copy_to: null destination");
        }
        if (ISEG_UNLIKELY(dest_offset > dest_size)) {
            detail::throw_out_of_range(range_fault::starts_beyond_source);
        }
        if (ISEG_UNLIKELY(length > len_ || length > dest_size - dest_offset)) {
            detail::throw_out_of_range(range_fault::extends_past_end);
        }
        std::copy_n(data(), length, dest + dest_offset);
    }

    // --------------------------------------------------------------------------
    // Derived segments (each allocates at most once)
    // --------------------------------------------------------------------------
    [[nodiscard]] immutable_segment append(const T& value) const
    {
        builder_type out(detail::checked_add(len_, 1u));
        out.append_copy(data(), len_);
        out.emplace_back(value);
        return adopt(out.release());
    }

    [[nodiscard]] immutable_segment append(T&& value) const
    {
        builder_type out(detail::checked_add(len_, 1u));
        out.append_copy(data(), len_);
        out.emplace_back(std::move(value));
        return adopt(out.release());
    }

    template<class Source, typename = enable_range_t<Source>>
    [[nodiscard]] immutable_segment append(const Source& src) const
    {
        if constexpr (kind_of<Source> == source_kind::segment) {
            if (len_ == 0u) {
                return src;
            }
        }
        return splice(len_, reader_type<Source>(src));
    }

    [[nodiscard]] immutable_segment append(std::initializer_list<T> items) const
    {
        return splice(len_, reader_type<std::initializer_list<T>>(items));
    }

    // The new element goes first into a fresh buffer; the source buffer is never touched.
    [[nodiscard]] immutable_segment prepend(const T& value) const
    {
        builder_type out(detail::checked_add(len_, 1u));
        out.emplace_back(value);
        out.append_copy(data(), len_);
        return adopt(out.release());
    }

    [[nodiscard]] immutable_segment prepend(T&& value) const
    {
        builder_type out(detail::checked_add(len_, 1u));
        out.emplace_back(std::move(value));
        out.append_copy(data(), len_);
        return adopt(out.release());
    }

    template<class Source, typename = enable_range_t<Source>>
    [[nodiscard]] immutable_segment prepend(const Source& src) const
    {
        if constexpr (kind_of<Source> == source_kind::segment) {
            if (len_ == 0u) {
                return src;
            }
        }
        return splice(0u, reader_type<Source>(src));
    }

    [[nodiscard]] immutable_segment prepend(std::initializer_list<T> items) const
    {
        return splice(0u, reader_type<std::initializer_list<T>>(items));
    }

    // pos == size() appends, pos == 0 prepends.
    [[nodiscard]] immutable_segment insert(const size_type pos, const T& value) const
    {
        check_insert_position(pos);
        if (pos == len_) {
            return append(value);
        }
        if (pos == 0u) {
            return prepend(value);
        }
        builder_type out(detail::checked_add(len_, 1u));
        out.append_copy(data(), pos);
        out.emplace_back(value);
        out.append_copy(data() + pos, len_ - pos);
        return adopt(out.release());
    }

    [[nodiscard]] immutable_segment insert(const index pos, const T& value) const
    {
        return insert(resolve_insert_position(pos), value);
    }

    template<class Source, typename = enable_range_t<Source>>
    [[nodiscard]] immutable_segment insert(const size_type pos, const Source& src) const
    {
        check_insert_position(pos);
        if (pos == len_) {
            return append(src);
        }
        return splice(pos, reader_type<Source>(src));
    }

    template<class Source, typename = enable_range_t<Source>>
    [[nodiscard]] immutable_segment insert(const index pos, const Source& src) const
    {
        return insert(resolve_insert_position(pos), src);
    }

    [[nodiscard]] immutable_segment insert(const size_type pos, std::initializer_list<T> items) const
    {
        check_insert_position(pos);
        return splice(pos, reader_type<std::initializer_list<T>>(items));
    }

    [[nodiscard]] immutable_segment insert(const index pos, std::initializer_list<T> items) const
    {
        return insert(resolve_insert_position(pos), items);
    }

    // Evaluates pred once per element, in order.
    template<class Pred>
    [[nodiscard]] immutable_segment remove_all(Pred pred) const
    {
        static_assert(std::is_invocable_r_v<bool, Pred&, const T&>,
                      "[iseg::immutable_segment::remove_all]: Pred must be callable as bool(const T&).");
        detail::require_callable(pred);

        const_pointer p = data();
        std::vector<bool, typename std::allocator_traits<Alloc>::template rebind_alloc<bool>> keep(len_);
        size_type kept = 0u;
        for (size_type i = 0u; i < len_; ++i) {
            const bool k = !static_cast<bool>(pred(p[i]));
            keep[i] = k;
            kept += k ? 1u : 0u;
        }

        if (kept == len_) {
            return *this;
        }
        if (kept == 0u) {
            return immutable_segment();
        }

        builder_type out(kept);
        for (size_type i = 0u; i < len_; ++i) {
            if (keep[i]) {
                out.emplace_back(p[i]);
            }
        }
        return adopt(out.release());
    }

    [[nodiscard]] immutable_segment clear() const noexcept { return immutable_segment(); }

    // --------------------------------------------------------------------------
    // Search. Results are relative to this segment; npos when absent.
    // --------------------------------------------------------------------------
    [[nodiscard]] size_type index_of(const T& item, const size_type start = 0u, const size_type count = npos,
                                     const value_comparer& comparer = value_comparer()) const
    {
        const span_bounds w = search_window(start, count);
        if (!comparer) {
            auto eq = default_equal();
            return find_item(item, w, eq);
        }
        auto eq = by_value(comparer);
        return find_item(item, w, eq);
    }

    template<class Eq, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of(by_ref_t, const T& item, Eq eq) const
    {
        return index_of(by_ref, item, 0u, npos, std::move(eq));
    }

    template<class Eq, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of(by_ref_t, const T& item, const size_type start, Eq eq) const
    {
        return index_of(by_ref, item, start, npos, std::move(eq));
    }

    template<class Eq, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of(by_ref_t, const T& item, const size_type start, const size_type count,
                                     Eq eq) const
    {
        detail::require_callable(eq);
        return find_item(item, search_window(start, count), eq);
    }

    // Earliest position holding any of the candidates.
    template<class Source, typename = enable_range_t<Source>>
    [[nodiscard]] size_type index_of_any(const Source& candidates, const size_type start = 0u,
                                         const size_type count = npos,
                                         const value_comparer& comparer = value_comparer()) const
    {
        const span_bounds w = search_window(start, count);
        return with_elements(candidates, [&](const_pointer c, const size_type cn) {
            if (!comparer) {
                auto eq = default_equal();
                return find_any(c, cn, w, eq);
            }
            auto eq = by_value(comparer);
            return find_any(c, cn, w, eq);
        });
    }

    [[nodiscard]] size_type index_of_any(std::initializer_list<T> candidates, const size_type start = 0u,
                                         const size_type count = npos,
                                         const value_comparer& comparer = value_comparer()) const
    {
        return index_of_any(window<T>(candidates.begin(), static_cast<size_type>(candidates.size())),
                            start, count, comparer);
    }

    template<class Source, class Eq, typename = enable_range_t<Source>, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of_any(by_ref_t, const Source& candidates, Eq eq) const
    {
        return index_of_any(by_ref, candidates, 0u, npos, std::move(eq));
    }

    template<class Source, class Eq, typename = enable_range_t<Source>, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of_any(by_ref_t, const Source& candidates, const size_type start,
                                         const size_type count, Eq eq) const
    {
        detail::require_callable(eq);
        const span_bounds w = search_window(start, count);
        return with_elements(candidates, [&](const_pointer c, const size_type cn) {
            return find_any(c, cn, w, eq);
        });
    }

    // First position where the whole needle lies inside [start, start + count).
    // An empty needle matches at start.
    template<class Source, typename = enable_range_t<Source>>
    [[nodiscard]] size_type index_of_sequence(const Source& needle, const size_type start = 0u,
                                              const size_type count = npos,
                                              const value_comparer& comparer = value_comparer()) const
    {
        const span_bounds w = search_window(start, count);
        return with_elements(needle, [&](const_pointer n, const size_type nn) {
            if (!comparer) {
                auto eq = default_equal();
                return find_sequence(n, nn, w, eq);
            }
            auto eq = by_value(comparer);
            return find_sequence(n, nn, w, eq);
        });
    }

    [[nodiscard]] size_type index_of_sequence(std::initializer_list<T> needle, const size_type start = 0u,
                                              const size_type count = npos,
                                              const value_comparer& comparer = value_comparer()) const
    {
        return index_of_sequence(window<T>(needle.begin(), static_cast<size_type>(needle.size())),
                                 start, count, comparer);
    }

    template<class Source, class Eq, typename = enable_range_t<Source>, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of_sequence(by_ref_t, const Source& needle, Eq eq) const
    {
        return index_of_sequence(by_ref, needle, 0u, npos, std::move(eq));
    }

    template<class Source, class Eq, typename = enable_range_t<Source>, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of_sequence(by_ref_t, const Source& needle, const size_type start,
                                              const size_type count, Eq eq) const
    {
        detail::require_callable(eq);
        const span_bounds w = search_window(start, count);
        return with_elements(needle, [&](const_pointer n, const size_type nn) {
            return find_sequence(n, nn, w, eq);
        });
    }

    // Earliest match among several needles; on a tie the first needle in caller order wins.
    template<class Needles>
    [[nodiscard]] size_type index_of_any_sequence(const Needles& needles, const size_type start = 0u,
                                                  const size_type count = npos,
                                                  const value_comparer& comparer = value_comparer()) const
    {
        const span_bounds w = search_window(start, count);
        if (!comparer) {
            auto eq = default_equal();
            return find_any_sequence(needles, w, eq);
        }
        auto eq = by_value(comparer);
        return find_any_sequence(needles, w, eq);
    }

    [[nodiscard]] size_type index_of_any_sequence(std::initializer_list<immutable_segment> needles,
                                                  const size_type start = 0u, const size_type count = npos,
                                                  const value_comparer& comparer = value_comparer()) const
    {
        return index_of_any_sequence<std::initializer_list<immutable_segment>>(needles, start, count, comparer);
    }

    template<class Needles, class Eq, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of_any_sequence(by_ref_t, const Needles& needles, Eq eq) const
    {
        return index_of_any_sequence(by_ref, needles, 0u, npos, std::move(eq));
    }

    template<class Needles, class Eq, typename = enable_eq_t<Eq>>
    [[nodiscard]] size_type index_of_any_sequence(by_ref_t, const Needles& needles, const size_type start,
                                                  const size_type count, Eq eq) const
    {
        detail::require_callable(eq);
        return find_any_sequence(needles, search_window(start, count), eq);
    }

    // Element-wise equality with any source; sized sources short-circuit on length.
    template<class Source, typename = enable_source_t<Source>>
    [[nodiscard]] bool sequence_equal(const Source& other, const value_comparer& comparer = value_comparer()) const
    {
        if (!comparer) {
            auto eq = default_equal();
            return equal_to_source(other, eq);
        }
        auto eq = by_value(comparer);
        return equal_to_source(other, eq);
    }

    template<class Source, class Eq, typename = enable_source_t<Source>, typename = enable_eq_t<Eq>>
    [[nodiscard]] bool sequence_equal(by_ref_t, const Source& other, Eq eq) const
    {
        detail::require_callable(eq);
        return equal_to_source(other, eq);
    }

    [[nodiscard]] friend bool operator==(const immutable_segment& a, const immutable_segment& b) {
        return a.sequence_equal(b);
    }
    [[nodiscard]] friend bool operator!=(const immutable_segment& a, const immutable_segment& b) {
        return !(a == b);
    }

    // --------------------------------------------------------------------------
    // Concatenation
    // --------------------------------------------------------------------------

    // Zero sources: empty. One source: that source (no copy for a segment).
    template<class... Sources>
    [[nodiscard]] static immutable_segment concat(const Sources&... srcs)
    {
        static_assert((is_source_v<Sources, T> && ...),
                      "[iseg::immutable_segment::concat]: every argument must be a source of T.");

        if constexpr (sizeof...(Sources) == 0u) {
            return immutable_segment();
        } else if constexpr (sizeof...(Sources) == 1u) {
            return as_segment(srcs...);
        } else {
            const std::tuple<reader_type<Sources>...> readers{reader_type<Sources>(srcs)...};

            size_type total = 0u;
            std::apply([&total](const auto&... r) {
                ((total = detail::checked_add(total, r.size())), ...);
            }, readers);

            builder_type out(total);
            std::apply([&out](const auto&... r) { (r.copy_into(out), ...); }, readers);
            return adopt(out.release());
        }
    }

    // Runtime list of sources of one type (std::vector<immutable_segment>, ...).
    template<class List>
    [[nodiscard]] static immutable_segment concat_all(const List& list)
    {
        return join_list(static_cast<const reader_type<window<T>>*>(nullptr), list);
    }

    [[nodiscard]] static immutable_segment concat_all(std::initializer_list<immutable_segment> list)
    {
        return concat_all<std::initializer_list<immutable_segment>>(list);
    }

    // The delimiter is one element when it converts to T, otherwise a source.
    // Zero sources: empty. One source: that source. Empty delimiter: concat.
    template<class Delimiter, class... Sources>
    [[nodiscard]] static immutable_segment join(const Delimiter& delimiter, const Sources&... srcs)
    {
        static_assert((is_source_v<Sources, T> && ...),
                      "[iseg::immutable_segment::join]: every joined argument must be a source of T.");

        if constexpr (sizeof...(Sources) == 0u) {
            return immutable_segment();
        } else if constexpr (sizeof...(Sources) == 1u) {
            return as_segment(srcs...);
        } else if constexpr (std::is_convertible_v<const Delimiter&, T>) {
            const T one(delimiter);
            return join_pack(window<T>(&one, 1u), srcs...);
        } else {
            static_assert(is_source_v<Delimiter, T>,
                          "[iseg::immutable_segment::join]: delimiter must be a T or a source of T.");
            return join_pack(delimiter, srcs...);
        }
    }

    template<class Delimiter, class List>
    [[nodiscard]] static immutable_segment join_all(const Delimiter& delimiter, const List& list)
    {
        if constexpr (std::is_convertible_v<const Delimiter&, T>) {
            const T one(delimiter);
            const window<T> w(&one, 1u);
            const reader_type<window<T>> d(w);
            return join_list(&d, list);
        } else {
            static_assert(is_source_v<Delimiter, T>,
                          "[iseg::immutable_segment::join_all]: delimiter must be a T or a source of T.");
            const reader_type<Delimiter> d(delimiter);
            return join_list(&d, list);
        }
    }

    template<class Delimiter>
    [[nodiscard]] static immutable_segment join_all(const Delimiter& delimiter,
                                                    std::initializer_list<immutable_segment> list)
    {
        return join_all<Delimiter, std::initializer_list<immutable_segment>>(delimiter, list);
    }

private:
    // --------------------------------------------------------------------------
    // Helpers
    // --------------------------------------------------------------------------
    void check_insert_position(const size_type pos) const
    {
        if (ISEG_UNLIKELY(pos > len_)) {
            detail::throw_out_of_range(range_fault::index);
        }
    }

    [[nodiscard]] size_type resolve_insert_position(const index pos) const
    {
        const sreg p = pos.resolve(len_);
        if (ISEG_UNLIKELY(p < 0 || p > static_cast<sreg>(len_))) {
            detail::throw_out_of_range(range_fault::index);
        }
        return static_cast<size_type>(p);
    }

    // Copies [0, pos) of this segment, then the reader, then [pos, size()).
    template<class Reader>
    [[nodiscard]] immutable_segment splice(const size_type pos, const Reader& reader) const
    {
        const size_type n = reader.size();
        if (n == 0u) {
            return *this;
        }
        builder_type out(detail::checked_add(len_, n));
        out.append_copy(data(), pos);
        reader.copy_into(out);
        out.append_copy(data() + pos, len_ - pos);
        return adopt(out.release());
    }

    [[nodiscard]] span_bounds search_window(const size_type start, const size_type count) const
    {
        if (ISEG_UNLIKELY(start > len_)) {
            detail::throw_out_of_range(range_fault::starts_beyond_source);
        }
        if (count == npos) {
            return span_bounds{start, len_ - start};
        }
        if (ISEG_UNLIKELY(count > len_ - start)) {
            detail::throw_out_of_range(range_fault::extends_past_end);
        }
        return span_bounds{start, count};
    }

    [[nodiscard]] static auto default_equal() noexcept {
        return [](const T& a, const T& b) -> bool { return a == b; };
    }

    [[nodiscard]] static auto by_value(const value_comparer& comparer) noexcept {
        return [&comparer](const T& a, const T& b) -> bool { return comparer(a, b); };
    }

    template<class Eq>
    [[nodiscard]] size_type find_item(const T& item, const span_bounds w, Eq& eq) const
    {
        const_pointer p = data();
        for (size_type i = w.offset; i < w.offset + w.length; ++i) {
            if (eq(p[i], item)) {
                return i;
            }
        }
        return npos;
    }

    // Calls f(pointer, count) over the source's elements. Segments and contiguous
    // sources are read in place; anything else is copied once into a temporary segment.
    template<class Source, class F>
    [[nodiscard]] static size_type with_elements(const Source& src, F&& f)
    {
        if constexpr (kind_of<Source> == source_kind::segment) {
            return f(src.data(), src.size());
        } else if constexpr (kind_of<Source> == source_kind::contiguous) {
            const_pointer p = std::data(src);
            return f(p, static_cast<size_type>(std::size(src)));
        } else {
            const immutable_segment copy(src);
            return f(copy.data(), copy.size());
        }
    }

    template<class Eq>
    [[nodiscard]] size_type find_any(const_pointer candidates, const size_type n, const span_bounds w, Eq& eq) const
    {
        const_pointer p = data();
        for (size_type i = w.offset; i < w.offset + w.length; ++i) {
            for (size_type k = 0u; k < n; ++k) {
                if (eq(p[i], candidates[k])) {
                    return i;
                }
            }
        }
        return npos;
    }

    template<class Eq>
    [[nodiscard]] size_type find_sequence(const_pointer needle, const size_type n, const span_bounds w, Eq& eq) const
    {
        if (n == 0u) {
            return w.offset;
        }
        if (n > w.length) {
            return npos;
        }
        const_pointer first = data() + w.offset;
        const_pointer last  = first + w.length;
        const_pointer hit   = std::search(first, last, needle, needle + n,
                                          [&eq](const T& a, const T& b) { return eq(a, b); });
        return (hit == last) ? npos : static_cast<size_type>(hit - data());
    }

    template<class Needles, class Eq>
    [[nodiscard]] size_type find_any_sequence(const Needles& needles, const span_bounds w, Eq& eq) const
    {
        size_type best = npos;
        for (const auto& needle : needles) {
            const size_type pos = with_elements(needle, [&](const_pointer n, const size_type nn) {
                return find_sequence(n, nn, w, eq);
            });
            if (pos < best) {
                best = pos;
            }
        }
        return best;
    }

    template<class Source, class Eq>
    [[nodiscard]] bool equal_to_source(const Source& other, Eq& eq) const
    {
        if constexpr (is_known_size<Source>) {
            if (static_cast<size_type>(std::size(other)) != len_) {
                return false;
            }
        }

        const_pointer p = data();
        size_type i = 0u;
        const auto last = std::end(other);
        for (auto it = std::begin(other); it != last; ++it, ++i) {
            if (i == len_ || !eq(p[i], *it)) {
                return false;
            }
        }
        return i == len_;
    }

    template<class Delimiter, class... Sources>
    [[nodiscard]] static immutable_segment join_pack(const Delimiter& delimiter, const Sources&... srcs)
    {
        const reader_type<Delimiter> d(delimiter);
        if (d.size() == 0u) {
            return concat(srcs...);
        }

        const std::tuple<reader_type<Sources>...> readers{reader_type<Sources>(srcs)...};

        size_type total = detail::checked_mul(d.size(), static_cast<size_type>(sizeof...(Sources) - 1u));
        std::apply([&total](const auto&... r) {
            ((total = detail::checked_add(total, r.size())), ...);
        }, readers);

        builder_type out(total);
        bool first = true;
        std::apply([&out, &d, &first](const auto&... r) {
            ((first ? void(first = false) : d.copy_into(out), r.copy_into(out)), ...);
        }, readers);
        return adopt(out.release());
    }

    // A null delimiter reader means plain concatenation.
    template<class DelimiterReader, class List>
    [[nodiscard]] static immutable_segment join_list(const DelimiterReader* delimiter, const List& list)
    {
        using element_type = std::remove_cv_t<std::remove_reference_t<decltype(*std::begin(list))>>;
        static_assert(std::is_lvalue_reference_v<decltype(*std::begin(list))>,
                      "[iseg::immutable_segment]: list elements must be addressable sources.");
        static_assert(is_source_v<element_type, T>,
                      "[iseg::immutable_segment]: list elements must be sources of T.");

        std::vector<reader_type<element_type>> readers;
        for (const auto& src : list) {
            readers.emplace_back(src);
        }

        if (readers.empty()) {
            return immutable_segment();
        }
        if (readers.size() == 1u) {
            return as_segment(*std::begin(list));
        }

        const size_type d_len = (delimiter != nullptr) ? delimiter->size() : 0u;
        size_type total = detail::checked_mul(d_len, static_cast<size_type>(readers.size() - 1u));
        for (const auto& r : readers) {
            total = detail::checked_add(total, r.size());
        }
        if (total == 0u) {
            return immutable_segment();
        }

        builder_type out(total);
        for (size_type i = 0u; i < readers.size(); ++i) {
            if (i != 0u && d_len != 0u) {
                delimiter->copy_into(out);
            }
            readers[i].copy_into(out);
        }
        return adopt(out.release());
    }
};

// Builds a segment of the source's element type (shares when it already is one).
template<class T, typename Alloc>
[[nodiscard]] immutable_segment<T, Alloc> to_segment(const immutable_segment<T, Alloc>& seg) noexcept
{
    return seg;
}

template<class Source, typename = std::enable_if_t<is_source_v<Source, detail::element_of_t<Source>>>>
[[nodiscard]] immutable_segment<detail::element_of_t<Source>> to_segment(const Source& src)
{
    return immutable_segment<detail::element_of_t<Source>>(src);
}

} // namespace iseg

#endif /* ISEG_IMMUTABLE_SEGMENT_HPP_ */
