// ECSIG - Core Types Header
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// This file defines fundamental types used throughout ECSIG.

#ifndef ECSIG_CORE_TYPES_H
#define ECSIG_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <type_traits>
#include <vector>

namespace ecsig {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

// ============================================================================
// Span - Non-owning view of contiguous memory
// ============================================================================

template<typename T>
class Span {
public:
    using value_type = T;
    using pointer = T*;
    using const_pointer = const T*;
    using reference = T&;
    using const_reference = const T&;
    using iterator = pointer;
    using const_iterator = const_pointer;
    using size_type = std::size_t;
    
    constexpr Span() noexcept : data_(nullptr), size_(0) {}
    
    constexpr Span(pointer data, size_type size) noexcept 
        : data_(data), size_(size) {}
    
    template<size_t N>
    constexpr Span(std::array<T, N>& arr) noexcept 
        : data_(arr.data()), size_(N) {}
    
    template<size_t N>
    constexpr Span(const std::array<std::remove_const_t<T>, N>& arr) noexcept 
        : data_(arr.data()), size_(N) {}
    
    Span(std::vector<std::remove_const_t<T>>& vec) noexcept 
        : data_(vec.data()), size_(vec.size()) {}
    
    Span(const std::vector<std::remove_const_t<T>>& vec) noexcept 
        : data_(vec.data()), size_(vec.size()) {}
    
    /// Mutable spans convert to read-only spans
    template<typename U,
             typename = std::enable_if_t<std::is_same<const U, T>::value &&
                                         !std::is_same<U, T>::value>>
    constexpr Span(const Span<U>& other) noexcept
        : data_(other.data()), size_(other.size()) {}
    
    constexpr pointer data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }
    
    constexpr reference operator[](size_type idx) const { return data_[idx]; }
    
    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }
    
    constexpr Span subspan(size_type offset, size_type count) const {
        return Span(data_ + offset, count);
    }
    
    constexpr Span first(size_type count) const {
        return Span(data_, count);
    }
    
    constexpr Span last(size_type count) const {
        return Span(data_ + size_ - count, count);
    }
    
    /// Copy the viewed bytes out
    std::vector<std::remove_const_t<T>> ToVector() const {
        return std::vector<std::remove_const_t<T>>(data_, data_ + size_);
    }

private:
    pointer data_;
    size_type size_;
};

/// Byte-wise equality of two views
template<typename T, typename U>
bool SpanEqual(const Span<T>& a, const Span<U>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

} // namespace ecsig

#endif // ECSIG_CORE_TYPES_H
