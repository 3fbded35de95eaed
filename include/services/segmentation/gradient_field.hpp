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
 * @file gradient_field.hpp
 * @brief Sobel gradient magnitude of 8-bit slices with an explicit cache
 * @details The 2D cost-distance grow re-runs on the same slice every time the
 *          user moves the seed or a slider. The gradient only depends on the
 *          slice, so it is memoized in a GradientFieldCache keyed by a stable
 *          GridKey (caller-supplied handle or content hash).
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "segmentation_types.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace seedgrow::services {

/// Fields kept by a GradientFieldCache unless configured otherwise
inline constexpr std::size_t kDefaultGradientCacheCapacity = 16;

/**
 * @brief Gradient magnitude per pixel, same layout as the source grid
 */
struct GradientField {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> magnitude;

    [[nodiscard]] std::uint8_t operator[](std::size_t index) const noexcept {
        return magnitude[index];
    }

    [[nodiscard]] std::uint8_t at(int x, int y) const noexcept {
        return magnitude[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                         static_cast<std::size_t>(x)];
    }
};

/**
 * @brief 3x3 Sobel magnitude, (|gx| + |gy|) / 4 rounded and clamped to [0, 255]
 *
 * Border rows and columns are left at 0.
 */
[[nodiscard]] GradientField computeSobelMagnitude(const GrayView2D& gray);

/**
 * @brief Stable identity of a grid for cache lookups
 */
class GridKey {
public:
    enum class Source {
        Handle,   ///< Caller-supplied identifier
        Content   ///< FNV-1a hash of pixels and dimensions
    };

    [[nodiscard]] static GridKey fromHandle(std::uint64_t handle) noexcept {
        return GridKey(Source::Handle, handle);
    }

    [[nodiscard]] static GridKey fromContent(const GrayView2D& gray) noexcept;

    [[nodiscard]] Source source() const noexcept { return source_; }
    [[nodiscard]] std::uint64_t value() const noexcept { return value_; }

    [[nodiscard]] bool operator==(const GridKey& other) const noexcept {
        return source_ == other.source_ && value_ == other.value_;
    }

    struct Hash {
        [[nodiscard]] std::size_t operator()(const GridKey& key) const noexcept {
            return static_cast<std::size_t>(key.value_ ^
                (key.source_ == Source::Handle ? 0x9e3779b97f4a7c15ULL : 0ULL));
        }
    };

private:
    GridKey(Source source, std::uint64_t value) noexcept
        : source_(source), value_(value) {}

    Source source_;
    std::uint64_t value_;
};

/**
 * @brief Thread-safe memoization of gradient fields
 *
 * Entries are validated against the requested dimensions; a size mismatch
 * recomputes and replaces the entry. At most capacity() fields are kept;
 * inserting beyond that evicts the least recently used entry.
 *
 * @example
 * @code
 * GradientFieldCache cache(8);
 * auto key = GridKey::fromHandle(sliceId);
 * auto grad = cache.getOrCompute(key, slice);   // computes
 * auto again = cache.getOrCompute(key, slice);  // reuses
 * cache.invalidate(key);                        // slice pixels changed
 * @endcode
 */
class GradientFieldCache {
public:
    /**
     * @brief Construct cache with a capacity
     * @param capacity Maximum number of fields kept; values below 1 are raised to 1
     */
    explicit GradientFieldCache(std::size_t capacity = kDefaultGradientCacheCapacity);
    ~GradientFieldCache() = default;

    GradientFieldCache(const GradientFieldCache&) = delete;
    GradientFieldCache& operator=(const GradientFieldCache&) = delete;

    /**
     * @brief Return the cached field for key, computing it on a miss
     */
    [[nodiscard]] std::shared_ptr<const GradientField> getOrCompute(
        const GridKey& key,
        const GrayView2D& gray
    );

    /**
     * @brief Drop the entry for key
     * @return true if an entry was removed
     */
    bool invalidate(const GridKey& key);

    /// Drop every entry
    void clear();

    /**
     * @brief Change the capacity, evicting least recently used entries to fit
     */
    void setCapacity(std::size_t capacity);

    [[nodiscard]] std::size_t capacity() const;

    /**
     * @brief Check if key is cached, without touching its recency
     */
    [[nodiscard]] bool contains(const GridKey& key) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t hitCount() const;
    [[nodiscard]] std::size_t missCount() const;

private:
    struct Entry {
        std::shared_ptr<const GradientField> field;
        std::list<GridKey>::iterator order;
    };

    void evictIfNeeded(std::size_t reserve);
    void touch(Entry& entry);

    mutable std::mutex mutex_;
    std::size_t capacity_;
    std::unordered_map<GridKey, Entry, GridKey::Hash> entries_;
    std::list<GridKey> accessOrder_;  // Front = most recent
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace seedgrow::services
