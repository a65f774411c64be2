#pragma once
#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::utils {
//---------------------------------------------------------------------------
/// Growable raw buffer for request headers and response bodies.
/// Growing never value-initializes the new tail, the network layer overwrites it anyway.
template <typename T>
class DataVector {
    private:
    /// Current capacity in elements
    uint64_t _capacity;
    /// Current size in elements
    uint64_t _size;
    /// The data
    std::unique_ptr<T[]> _data;

    public:
    /// Constructor
    constexpr DataVector() : _capacity(0), _size(0), _data() {}
    /// Constructor with size
    explicit DataVector(uint64_t size) : DataVector() {
        resize(size);
    }
    /// Constructor that copies a range
    DataVector(const T* start, const T* end) : DataVector() {
        assert(end >= start);
        resize(static_cast<uint64_t>(end - start));
        if (_size)
            std::memcpy(_data.get(), start, _size * sizeof(T));
    }
    /// No copies, buffers can be large
    DataVector(const DataVector&) = delete;
    /// No copy assignment
    DataVector& operator=(const DataVector&) = delete;
    /// Move constructor
    DataVector(DataVector&& rhs) noexcept : _capacity(rhs._capacity), _size(rhs._size), _data(std::move(rhs._data)) {
        rhs._capacity = 0;
        rhs._size = 0;
    }

    /// Get the data
    [[nodiscard]] T* data() { return _data.get(); }
    /// Get the const data
    [[nodiscard]] const T* cdata() const { return _data.get(); }
    /// Get the size
    [[nodiscard]] uint64_t size() const { return _size; }
    /// Get the capacity
    [[nodiscard]] uint64_t capacity() const { return _capacity; }
    /// Is the vector empty
    [[nodiscard]] bool empty() const { return !_size; }
    /// Get a view of the elements [offset, offset + length)
    [[nodiscard]] std::span<const T> view(uint64_t offset, uint64_t length) const {
        assert(offset + length <= _size);
        return std::span<const T>(_data.get() + offset, length);
    }

    /// Clear the size, keeps the memory
    void clear() { _size = 0; }

    /// Increase the capacity, keeps the content
    void reserve(uint64_t cap) {
        if (_capacity >= cap)
            return;
        auto swap = std::unique_ptr<T[]>(new T[cap]);
        if (_data && _size)
            std::memcpy(swap.get(), _data.get(), _size * sizeof(T));
        _data.swap(swap);
        _capacity = cap;
    }

    /// Change the number of elements
    void resize(uint64_t size) {
        if (size > _capacity)
            reserve(size);
        _size = size;
    }
};
//---------------------------------------------------------------------------
} // namespace memrun::utils
