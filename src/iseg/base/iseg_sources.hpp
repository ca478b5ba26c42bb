/*
 * iseg_sources.hpp
 *
 * Source capabilities understood by the copy dispatcher.
 *
 * A "source" is anything immutable_segment can be built from or combined with.
 * Its capability is classified once, at compile time, by source_kind_of_v and
 * never re-checked at run time:
 *
 *   segment        another immutable_segment with the same allocator  -> share, O(1)
 *   contiguous     std::data()/std::size() over T                     -> bulk copy
 *   random_access  std::size() + random-access iterators              -> indexed copy
 *   sized          std::size() + forward iterators                    -> one checked pass
 *   multi_pass     forward iterators, length unknown                  -> count + copy
 *   single_pass    input iterators only                               -> materialize
 *
 * Also here: window<T> (a fixed-length read-only memory window), sequence(first, last)
 * (iterator pair as a source) and the by_ref tag for low-overhead comparisons.
 */

#ifndef ISEG_SOURCES_HPP_
#define ISEG_SOURCES_HPP_

#include <cstddef>
#include <iterator>     // std::data, std::size, std::iterator_traits
#include <type_traits>
#include <utility>      // std::declval

#include "basic_types.h"   // reg
#include "iseg_errors.hpp"
#include "iseg_tools.hpp"

namespace iseg {

template<class T, typename Alloc>
class immutable_segment;

// Tag type selecting the by-reference comparison overloads.
// Use: seg.index_of(iseg::by_ref, item, eq);
struct by_ref_t { explicit constexpr by_ref_t() = default; };
inline constexpr by_ref_t by_ref{};

enum class source_kind : unsigned {
    segment,
    contiguous,
    random_access,
    sized,
    multi_pass,
    single_pass
};

// ---------------------------------------------------------------------------------------------
// window<T>: non-owning fixed-length read-only view of caller memory.
// Building a segment from it copies; the window itself never outlives the caller's buffer.
// ---------------------------------------------------------------------------------------------
template<class T>
class window
{
public:
    using value_type     = T;
    using size_type      = reg;
    using const_pointer  = const T*;
    using const_iterator = const T*;

    constexpr window() noexcept = default;

    window(const_pointer ptr, const size_type count)
        : ptr_(ptr)
        , count_(count)
    {
        if (ISEG_UNLIKELY(ptr == nullptr && count != 0u)) {
            detail::throw_invalid_argument("iseg::window: null buffer with non-zero length");
        }
    }

    template<reg N>
    constexpr window(const T (&arr)[N]) noexcept
        : ptr_(arr)
        , count_(N)
    {}

    [[nodiscard]] constexpr const_pointer data() const noexcept { return ptr_; }
    [[nodiscard]] constexpr size_type size() const noexcept { return count_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return count_ == 0u; }

    [[nodiscard]] constexpr const_iterator begin() const noexcept { return ptr_; }
    [[nodiscard]] constexpr const_iterator end() const noexcept { return ptr_ + count_; }

#if ISEG_HAS_SPAN
    [[nodiscard]] std::span<const T> span() const noexcept { return {ptr_, count_}; }
#endif /* ISEG_HAS_SPAN */

private:
    const_pointer ptr_{nullptr};
    size_type     count_{0u};
};

namespace detail {

template<class It>
using iter_category_t = typename std::iterator_traits<It>::iterator_category;

template<class It, class Tag, class = void>
struct iter_is : std::false_type {};

template<class It, class Tag>
struct iter_is<It, Tag, std::void_t<iter_category_t<It>>>
    : std::is_base_of<Tag, iter_category_t<It>> {};

template<class It>
inline constexpr bool is_input_iter_v = iter_is<It, std::input_iterator_tag>::value;

template<class It>
inline constexpr bool is_forward_iter_v = iter_is<It, std::forward_iterator_tag>::value;

template<class It>
inline constexpr bool is_random_iter_v = iter_is<It, std::random_access_iterator_tag>::value;

} // namespace detail

// ---------------------------------------------------------------------------------------------
// sequence_range<It>: iterator pair [first, last) usable as a source.
// Random-access pairs report size(); pointer pairs also report data().
// ---------------------------------------------------------------------------------------------
template<class It>
class sequence_range
{
    static_assert(detail::is_input_iter_v<It>,
                  "[iseg::sequence_range]: It must be at least an input iterator.");

public:
    using iterator  = It;
    using size_type = reg;

    sequence_range(It first, It last)
        : first_(first)
        , last_(last)
    {}

    [[nodiscard]] It begin() const { return first_; }
    [[nodiscard]] It end() const { return last_; }

    template<class I = It, typename = std::enable_if_t<detail::is_random_iter_v<I>>>
    [[nodiscard]] size_type size() const {
        return static_cast<size_type>(last_ - first_);
    }

    template<class I = It, typename = std::enable_if_t<std::is_pointer_v<I>>>
    [[nodiscard]] I data() const noexcept { return first_; }

private:
    It first_;
    It last_;
};

template<class It>
[[nodiscard]] sequence_range<It> sequence(It first, It last)
{
    return sequence_range<It>(first, last);
}

namespace detail {

template<class S>
using begin_t = decltype(std::begin(std::declval<const S&>()));

template<class S, class = void>
struct has_begin_end : std::false_type {};

template<class S>
struct has_begin_end<S, std::void_t<begin_t<S>, decltype(std::end(std::declval<const S&>()))>>
    : std::true_type {};

template<class S, class = void>
struct has_size : std::false_type {};

template<class S>
struct has_size<S, std::void_t<decltype(std::size(std::declval<const S&>()))>> : std::true_type {};

template<class S, class T, class = void>
struct has_data_of : std::false_type {};

template<class S, class T>
struct has_data_of<S, T, std::void_t<decltype(std::data(std::declval<const S&>()))>>
    : std::is_same<std::remove_cv_t<std::remove_pointer_t<decltype(std::data(std::declval<const S&>()))>>, T> {};

template<class S>
struct is_segment : std::false_type {};

template<class T, class A>
struct is_segment<::iseg::immutable_segment<T, A>> : std::true_type {};

template<class S, class T, class Alloc>
inline constexpr bool is_own_segment_v = std::is_same_v<S, ::iseg::immutable_segment<T, Alloc>>;

template<class S, class T, class = void>
struct elements_construct : std::false_type {};

template<class S, class T>
struct elements_construct<S, T, std::void_t<begin_t<S>>>
    : std::is_constructible<T, decltype(*std::declval<begin_t<S>>())> {};

template<class S, class T, class Alloc>
constexpr source_kind classify() noexcept
{
    if constexpr (is_own_segment_v<S, T, Alloc>) {
        return source_kind::segment;
    } else if constexpr (has_data_of<S, T>::value && has_size<S>::value) {
        return source_kind::contiguous;
    } else if constexpr (has_size<S>::value && is_random_iter_v<begin_t<S>>) {
        return source_kind::random_access;
    } else if constexpr (has_size<S>::value && is_forward_iter_v<begin_t<S>>) {
        return source_kind::sized;
    } else if constexpr (is_forward_iter_v<begin_t<S>>) {
        return source_kind::multi_pass;
    } else {
        return source_kind::single_pass;
    }
}

template<class S, class T, class = void>
struct is_source_impl : std::false_type {};

template<class S, class T>
struct is_source_impl<S, T, std::enable_if_t<has_begin_end<S>::value>>
    : std::bool_constant<is_input_iter_v<begin_t<S>> && elements_construct<S, T>::value> {};

} // namespace detail

// True when S can feed an immutable_segment<T, ...>.
template<class S, class T>
inline constexpr bool is_source_v = detail::is_source_impl<std::remove_cv_t<S>, T>::value;

// Capability of S as seen by immutable_segment<T, Alloc>.
template<class S, class T, typename Alloc>
inline constexpr source_kind source_kind_of_v = detail::classify<std::remove_cv_t<S>, T, Alloc>();

} // namespace iseg

#endif /* ISEG_SOURCES_HPP_ */
