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

#include "services/segmentation/gradient_field.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace seedgrow::services {

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

std::uint64_t fnvMix(std::uint64_t hash, std::uint64_t byte) noexcept {
    hash ^= byte;
    return hash * kFnvPrime;
}

std::uint64_t fnvMixInt(std::uint64_t hash, int value) noexcept {
    auto v = static_cast<std::uint32_t>(value);
    for (int shift = 0; shift < 32; shift += 8) {
        hash = fnvMix(hash, (v >> shift) & 0xffU);
    }
    return hash;
}

} // anonymous namespace

GradientField computeSobelMagnitude(const GrayView2D& gray) {
    const int w = gray.width;
    const int h = gray.height;

    GradientField field;
    field.width = w;
    field.height = h;
    field.magnitude.assign(static_cast<std::size_t>(std::max(0, w)) *
                           static_cast<std::size_t>(std::max(0, h)), 0);

    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) {
            const int i00 = gray.at(x - 1, y - 1);
            const int i01 = gray.at(x, y - 1);
            const int i02 = gray.at(x + 1, y - 1);
            const int i10 = gray.at(x - 1, y);
            const int i12 = gray.at(x + 1, y);
            const int i20 = gray.at(x - 1, y + 1);
            const int i21 = gray.at(x, y + 1);
            const int i22 = gray.at(x + 1, y + 1);

            const int gx = -i00 - 2 * i10 - i20 + i02 + 2 * i12 + i22;
            const int gy = -i00 - 2 * i01 - i02 + i20 + 2 * i21 + i22;

            const double mag = static_cast<double>(std::abs(gx) + std::abs(gy)) / 4.0;
            const double rounded = std::floor(mag + 0.5);
            field.magnitude[static_cast<std::size_t>(y) * static_cast<std::size_t>(w) +
                            static_cast<std::size_t>(x)] =
                static_cast<std::uint8_t>(std::clamp(rounded, 0.0, 255.0));
        }
    }

    return field;
}

GridKey GridKey::fromContent(const GrayView2D& gray) noexcept {
    std::uint64_t hash = kFnvOffset;
    hash = fnvMixInt(hash, gray.width);
    hash = fnvMixInt(hash, gray.height);
    for (std::uint8_t px : gray.pixels) {
        hash = fnvMix(hash, px);
    }
    return GridKey(Source::Content, hash);
}

GradientFieldCache::GradientFieldCache(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

std::shared_ptr<const GradientField> GradientFieldCache::getOrCompute(
    const GridKey& key,
    const GrayView2D& gray
) {
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() &&
            it->second.field->width == gray.width &&
            it->second.field->height == gray.height) {
            ++hits_;
            touch(it->second);
            return it->second.field;
        }
        ++misses_;
    }

    // Computed outside the lock; a racing caller may compute the same key twice
    auto field = std::make_shared<const GradientField>(computeSobelMagnitude(gray));

    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        it->second.field = field;
        touch(it->second);
        return field;
    }

    evictIfNeeded(1);
    accessOrder_.push_front(key);
    entries_.emplace(key, Entry{field, accessOrder_.begin()});
    return field;
}

bool GradientFieldCache::invalidate(const GridKey& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    accessOrder_.erase(it->second.order);
    entries_.erase(it);
    return true;
}

void GradientFieldCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    accessOrder_.clear();
}

void GradientFieldCache::setCapacity(std::size_t capacity) {
    std::lock_guard lock(mutex_);
    capacity_ = std::max<std::size_t>(capacity, 1);
    evictIfNeeded(0);
}

std::size_t GradientFieldCache::capacity() const {
    std::lock_guard lock(mutex_);
    return capacity_;
}

bool GradientFieldCache::contains(const GridKey& key) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(key);
}

void GradientFieldCache::evictIfNeeded(std::size_t reserve) {
    // Already holding mutex
    while (entries_.size() + reserve > capacity_ && !accessOrder_.empty()) {
        entries_.erase(accessOrder_.back());
        accessOrder_.pop_back();
    }
}

void GradientFieldCache::touch(Entry& entry) {
    // Already holding mutex
    accessOrder_.splice(accessOrder_.begin(), accessOrder_, entry.order);
}

std::size_t GradientFieldCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::size_t GradientFieldCache::hitCount() const {
    std::lock_guard lock(mutex_);
    return hits_;
}

std::size_t GradientFieldCache::missCount() const {
    std::lock_guard lock(mutex_);
    return misses_;
}

} // namespace seedgrow::services
