/*
 * iseg_dispatch.hpp
 *
 * Copy dispatcher: one source_reader specialization per source_kind.
 *
 * Every reader exposes the same two operations:
 *   size()            number of elements the source contributes (measured once)
 *   copy_into(b)      appends exactly size() elements to a buffer_builder
 *
 * Callers measure every input first, allocate one destination for the final
 * length, then copy each input into its slot. Sources that are walked twice
 * (or whose walk disagrees with their size()) raise iseg::inconsistent_sequence
 * instead of leaving a partly built buffer behind.
 *
 * copy_range() builds a buffer from a sub-range of a non-segment source.
 */

#ifndef ISEG_DISPATCH_HPP_
#define ISEG_DISPATCH_HPP_

#include <iterator>     // std::begin, std::end, std::data, std::size, std::distance
#include <memory>       // std::allocator_traits
#include <type_traits>
#include <vector>

#include "basic_types.h"   // reg
#include "iseg_bounds.hpp"
#include "iseg_buffer.hpp"
#include "iseg_errors.hpp"
#include "iseg_sources.hpp"
#include "iseg_tools.hpp"

namespace iseg::detail {

template<class T, typename Alloc, class Source,
         source_kind Kind = source_kind_of_v<Source, T, Alloc>>
class source_reader;

// Walks [it, last) appending up to `expected` elements; the walk must produce exactly that many.
template<class T, typename Alloc, class It, class End>
void copy_exact(It it, const End last, const reg expected, buffer_builder<T, Alloc>& out,
                const bool check_longer)
{
    reg taken = 0u;
    for (; it != last && taken < expected; ++it, ++taken) {
        out.emplace_back(*it);
    }
    if (ISEG_UNLIKELY(taken < expected)) {
        throw_inconsistent(sequence_fault::shorter_on_second_pass);
    }
    if (check_longer && ISEG_UNLIKELY(it != last)) {
        throw_inconsistent(sequence_fault::longer_on_second_pass);
    }
}

// ---------------------------------------------------------------------------------------------
// segment: same element type and allocator; copy_into is used when combining.
// ---------------------------------------------------------------------------------------------
template<class T, typename Alloc, class Source>
class source_reader<T, Alloc, Source, source_kind::segment>
{
public:
    explicit source_reader(const Source& src) noexcept
        : src_(src)
    {}

    [[nodiscard]] reg size() const noexcept { return src_.size(); }

    void copy_into(buffer_builder<T, Alloc>& out) const {
        out.append_copy(src_.data(), src_.size());
    }

private:
    const Source& src_;
};

template<class T, typename Alloc, class Source>
class source_reader<T, Alloc, Source, source_kind::contiguous>
{
public:
    explicit source_reader(const Source& src)
        : ptr_(std::data(src))
        , n_(static_cast<reg>(std::size(src)))
    {
        if (ISEG_UNLIKELY(ptr_ == nullptr && n_ != 0u)) {
            throw_invalid_argument("iseg: contiguous source reports a null buffer");
        }
    }

    [[nodiscard]] reg size() const noexcept { return n_; }

    void copy_into(buffer_builder<T, Alloc>& out) const {
        out.append_copy(ptr_, n_);
    }

private:
    const T* ptr_;
    reg      n_;
};

template<class T, typename Alloc, class Source>
class source_reader<T, Alloc, Source, source_kind::random_access>
{
public:
    explicit source_reader(const Source& src)
        : src_(src)
        , n_(static_cast<reg>(std::size(src)))
    {}

    [[nodiscard]] reg size() const noexcept { return n_; }

    void copy_into(buffer_builder<T, Alloc>& out) const {
        auto it = std::begin(src_);
        for (reg i = 0u; i < n_; ++i) {
            out.emplace_back(it[static_cast<typename std::iterator_traits<decltype(it)>::difference_type>(i)]);
        }
    }

private:
    const Source& src_;
    reg           n_;
};

template<class T, typename Alloc, class Source>
class source_reader<T, Alloc, Source, source_kind::sized>
{
public:
    explicit source_reader(const Source& src)
        : src_(src)
        , n_(static_cast<reg>(std::size(src)))
    {}

    [[nodiscard]] reg size() const noexcept { return n_; }

    void copy_into(buffer_builder<T, Alloc>& out) const {
        copy_exact(std::begin(src_), std::end(src_), n_, out, ISEG_VERIFY_SIZED_SOURCES != 0);
    }

private:
    const Source& src_;
    reg           n_;
};

// Counted once in the constructor, then walked again by copy_into.
template<class T, typename Alloc, class Source>
class source_reader<T, Alloc, Source, source_kind::multi_pass>
{
public:
    explicit source_reader(const Source& src)
        : src_(src)
        , n_(static_cast<reg>(std::distance(std::begin(src), std::end(src))))
    {}

    [[nodiscard]] reg size() const noexcept { return n_; }

    void copy_into(buffer_builder<T, Alloc>& out) const {
        copy_exact(std::begin(src_), std::end(src_), n_, out, true);
    }

private:
    const Source& src_;
    reg           n_;
};

// Materialized once; never iterated again.
template<class T, typename Alloc, class Source>
class source_reader<T, Alloc, Source, source_kind::single_pass>
{
public:
    using items_type = std::vector<T, typename std::allocator_traits<Alloc>::template rebind_alloc<T>>;

    explicit source_reader(const Source& src)
    {
        const auto last = std::end(src);
        for (auto it = std::begin(src); it != last; ++it) {
            items_.emplace_back(*it);
        }
    }

    [[nodiscard]] reg size() const noexcept { return static_cast<reg>(items_.size()); }

    void copy_into(buffer_builder<T, Alloc>& out) const {
        out.append_copy(items_.data(), size());
    }

    [[nodiscard]] const items_type& items() const noexcept { return items_; }

private:
    items_type items_;
};

// ---------------------------------------------------------------------------------------------
// Whole-source and sub-range builds
// ---------------------------------------------------------------------------------------------

template<class T, typename Alloc, class Source>
[[nodiscard]] buffer_ptr<T, Alloc> copy_all(const Source& src)
{
    const source_reader<T, Alloc, Source> reader(src);
    buffer_builder<T, Alloc> out(reader.size());
    reader.copy_into(out);
    return out.release();
}

template<class T, typename Alloc>
[[nodiscard]] buffer_ptr<T, Alloc> copy_block(const T* src, const reg n)
{
    buffer_builder<T, Alloc> out(n);
    out.append_copy(src, n);
    return out.release();
}

// One bounded walk over a source of unknown length. Running dry while skipping means
// the offset lies beyond the source; running dry while taking means the span is too long.
template<class T, typename Alloc, class It, class End>
[[nodiscard]] buffer_ptr<T, Alloc> copy_bounded_pass(It it, const End last, const span_bounds b)
{
    for (reg skipped = 0u; skipped < b.offset; ++skipped, ++it) {
        if (ISEG_UNLIKELY(it == last)) {
            throw_out_of_range(range_fault::starts_beyond_source);
        }
    }

    if constexpr (is_forward_iter_v<It>) {
        // Check the span with a second cursor before allocating it.
        It probe = it;
        for (reg seen = 0u; seen < b.length; ++seen, ++probe) {
            if (ISEG_UNLIKELY(probe == last)) {
                throw_out_of_range(range_fault::extends_past_end);
            }
        }
        buffer_builder<T, Alloc> out(b.length);
        copy_exact(it, last, b.length, out, false);
        return out.release();
    } else {
        std::vector<T, typename std::allocator_traits<Alloc>::template rebind_alloc<T>> items;
        for (reg taken = 0u; taken < b.length; ++taken) {
            if (taken != 0u) {
                ++it;
            }
            if (ISEG_UNLIKELY(it == last)) {
                throw_out_of_range(range_fault::extends_past_end);
            }
            items.emplace_back(*it);
        }
        return copy_block<T, Alloc>(items.data(), b.length);
    }
}

template<class T, typename Alloc, class Source>
[[nodiscard]] buffer_ptr<T, Alloc> copy_range(const Source& src, const range& r)
{
    constexpr source_kind kind = source_kind_of_v<Source, T, Alloc>;
    static_assert(kind != source_kind::segment,
                  "[iseg::copy_range]: segments are sliced, not copied.");

    if constexpr (kind == source_kind::contiguous) {
        const source_reader<T, Alloc, Source> reader(src);
        const span_bounds b = r.resolve(reader.size());
        return copy_block<T, Alloc>(std::data(src) + b.offset, b.length);
    } else if constexpr (kind == source_kind::random_access) {
        const span_bounds b = r.resolve(static_cast<reg>(std::size(src)));
        auto it = std::begin(src);
        using diff_t = typename std::iterator_traits<decltype(it)>::difference_type;
        buffer_builder<T, Alloc> out(b.length);
        for (reg i = 0u; i < b.length; ++i) {
            out.emplace_back(it[static_cast<diff_t>(b.offset + i)]);
        }
        return out.release();
    } else if constexpr (kind == source_kind::sized) {
        if (r.is_all()) {
            return copy_all<T, Alloc>(src);
        }
        const span_bounds b = r.resolve(static_cast<reg>(std::size(src)));
        auto it = std::begin(src);
        const auto last = std::end(src);
        for (reg skipped = 0u; skipped < b.offset; ++skipped, ++it) {
            if (ISEG_UNLIKELY(it == last)) {
                throw_inconsistent(sequence_fault::shorter_on_second_pass);
            }
        }
        buffer_builder<T, Alloc> out(b.length);
        copy_exact(it, last, b.length, out, false);
        return out.release();
    } else if constexpr (kind == source_kind::multi_pass) {
        if (!r.needs_length()) {
            return copy_bounded_pass<T, Alloc>(std::begin(src), std::end(src), r.resolve_from_start());
        }
        const reg n = static_cast<reg>(std::distance(std::begin(src), std::end(src)));
        const span_bounds b = r.resolve(n);
        auto it = std::begin(src);
        const auto last = std::end(src);
        for (reg skipped = 0u; skipped < b.offset; ++skipped, ++it) {
            if (ISEG_UNLIKELY(it == last)) {
                throw_inconsistent(sequence_fault::shorter_on_second_pass);
            }
        }
        buffer_builder<T, Alloc> out(b.length);
        copy_exact(it, last, b.length, out, false);
        return out.release();
    } else {
        if (!r.needs_length()) {
            return copy_bounded_pass<T, Alloc>(std::begin(src), std::end(src), r.resolve_from_start());
        }
        const source_reader<T, Alloc, Source> reader(src);
        const span_bounds b = r.resolve(reader.size());
        return copy_block<T, Alloc>(reader.items().data() + b.offset, b.length);
    }
}

} // namespace iseg::detail

#endif /* ISEG_DISPATCH_HPP_ */
