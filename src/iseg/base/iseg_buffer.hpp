/*
 * iseg_buffer.hpp
 *
 * Backing storage of immutable_segment.
 *
 * backing_buffer<T, Alloc>
 *   Owns `size` fully constructed elements. Held as shared_ptr<const backing_buffer>,
 *   so it is never written after construction and is released with its last segment.
 *
 * buffer_builder<T, Alloc>
 *   One-shot writer: allocates the exact final capacity up front, constructs elements
 *   strictly in order, then hands the block to a backing_buffer. If anything throws
 *   before release(), the constructed prefix is destroyed and the block returned.
 */

#ifndef ISEG_BUFFER_HPP_
#define ISEG_BUFFER_HPP_

#include <cstring>      // std::memcpy
#include <memory>       // std::allocator_traits, std::allocate_shared, std::shared_ptr
#include <type_traits>
#include <utility>      // std::forward

#include "basic_types.h"   // reg
#include "iseg_tools.hpp"

namespace iseg::detail {

// Tag for the private "adopt a freshly built buffer" constructor.
struct adopt_t { explicit constexpr adopt_t() = default; };
inline constexpr adopt_t adopt{};

template<class T, typename Alloc>
class backing_buffer
{
public:
    using value_type     = T;
    using size_type      = reg;
    using allocator_type = typename std::allocator_traits<Alloc>::template rebind_alloc<T>;
    using alloc_traits   = std::allocator_traits<allocator_type>;
    using pointer        = typename alloc_traits::pointer;

    static_assert(std::is_same_v<pointer, T*>,
                  "[iseg::backing_buffer]: allocator must use raw pointers.");

    backing_buffer(pointer storage, const size_type size) noexcept
        : storage_(storage)
        , size_(size)
    {}

    ~backing_buffer() noexcept
    {
        if (!storage_) {
            return;
        }
        if constexpr (!std::is_trivially_destructible_v<T>) {
            std::destroy_n(storage_, size_);
        }
        allocator_type alloc{};
        alloc_traits::deallocate(alloc, storage_, size_);
    }

    backing_buffer(const backing_buffer&)            = delete;
    backing_buffer& operator=(const backing_buffer&) = delete;

    [[nodiscard]] const T* data() const noexcept { return storage_; }
    [[nodiscard]] size_type size() const noexcept { return size_; }

private:
    pointer   storage_{nullptr};
    size_type size_{0u};
};

template<class T, typename Alloc>
using buffer_ptr = std::shared_ptr<const backing_buffer<T, Alloc>>;

template<class T, typename Alloc>
class buffer_builder
{
public:
    using value_type     = T;
    using size_type      = reg;
    using buffer_type    = backing_buffer<T, Alloc>;
    using allocator_type = typename buffer_type::allocator_type;
    using alloc_traits   = typename buffer_type::alloc_traits;
    using pointer        = typename buffer_type::pointer;

    explicit buffer_builder(const size_type capacity)
        : cap_(capacity)
    {
        if (cap_ != 0u) {
            allocator_type alloc{};
            storage_ = alloc_traits::allocate(alloc, cap_);
        }
    }

    ~buffer_builder() noexcept { discard(); }

    buffer_builder(const buffer_builder&)            = delete;
    buffer_builder& operator=(const buffer_builder&) = delete;

    [[nodiscard]] size_type size() const noexcept { return size_; }
    [[nodiscard]] size_type capacity() const noexcept { return cap_; }
    [[nodiscard]] size_type remaining() const noexcept { return cap_ - size_; }
    [[nodiscard]] bool full() const noexcept { return size_ == cap_; }

    template<class... Args>
    void emplace_back(Args&&... args)
    {
        ISEG_ASSERT(size_ < cap_);
        allocator_type alloc{};
        alloc_traits::construct(alloc, storage_ + size_, std::forward<Args>(args)...);
        ++size_;
    }

    // Copies n contiguous elements; memcpy for trivially copyable T.
    void append_copy(const T* src, const size_type n)
    {
        ISEG_ASSERT(n <= remaining());
        if (n == 0u) {
            return;
        }
        if constexpr (std::is_trivially_copyable_v<T>) {
            std::memcpy(storage_ + size_, src, n * sizeof(T));
            size_ += n;
        } else {
            for (size_type i = 0u; i < n; ++i) {
                emplace_back(src[i]);
            }
        }
    }

    // Hands the block over. An empty result is the null buffer.
    [[nodiscard]] buffer_ptr<T, Alloc> release()
    {
        ISEG_ASSERT(full());
        if (size_ == 0u) {
            discard();
            return nullptr;
        }

        auto out = std::allocate_shared<buffer_type>(Alloc{}, storage_, size_);
        storage_ = nullptr;
        size_    = 0u;
        cap_     = 0u;
        return out;
    }

private:
    void discard() noexcept
    {
        if (!storage_) {
            return;
        }
        if constexpr (!std::is_trivially_destructible_v<T>) {
            std::destroy_n(storage_, size_);
        }
        allocator_type alloc{};
        alloc_traits::deallocate(alloc, storage_, cap_);
        storage_ = nullptr;
        size_    = 0u;
        cap_     = 0u;
    }

    pointer   storage_{nullptr};
    size_type size_{0u};
    size_type cap_{0u};
};

} // namespace iseg::detail

#endif /* ISEG_BUFFER_HPP_ */
