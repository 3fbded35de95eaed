// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file min_heap.hpp
 * @brief Binary min-heap of (cell index, distance) entries
 * @details There is no decrease-key. When a cell's distance improves the
 *          caller pushes a new entry and skips the superseded one when it is
 *          popped (lazy deletion).
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace seedgrow::services {

/**
 * @brief Min-heap keyed by distance, carrying a grid cell index
 *
 * @tparam Distance Ordered key type (float for the solver)
 */
template <typename Distance>
class IndexedMinHeap {
public:
    struct Entry {
        std::size_t index = 0;
        Distance distance{};
    };

    IndexedMinHeap() = default;

    /// Pre-size the backing storage
    void reserve(std::size_t capacity) {
        entries_.reserve(capacity);
    }

    void push(std::size_t index, Distance distance) {
        entries_.push_back(Entry{index, distance});
        siftUp(entries_.size() - 1);
    }

    /**
     * @brief Remove and return the entry with the smallest distance
     * @return Entry, or nullopt when empty
     */
    [[nodiscard]] std::optional<Entry> pop() {
        if (entries_.empty()) {
            return std::nullopt;
        }

        Entry top = entries_.front();
        Entry last = entries_.back();
        entries_.pop_back();

        if (!entries_.empty()) {
            entries_.front() = last;
            siftDown(0);
        }
        return top;
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    void clear() noexcept { entries_.clear(); }

private:
    void siftUp(std::size_t k) {
        while (k > 0) {
            const std::size_t parent = (k - 1) / 2;
            if (entries_[parent].distance <= entries_[k].distance) {
                break;
            }
            std::swap(entries_[parent], entries_[k]);
            k = parent;
        }
    }

    void siftDown(std::size_t k) {
        const std::size_t n = entries_.size();
        for (;;) {
            const std::size_t left = 2 * k + 1;
            const std::size_t right = left + 1;
            std::size_t smallest = k;

            if (left < n && entries_[left].distance < entries_[smallest].distance) {
                smallest = left;
            }
            if (right < n && entries_[right].distance < entries_[smallest].distance) {
                smallest = right;
            }
            if (smallest == k) {
                break;
            }
            std::swap(entries_[k], entries_[smallest]);
            k = smallest;
        }
    }

    std::vector<Entry> entries_;
};

} // namespace seedgrow::services
