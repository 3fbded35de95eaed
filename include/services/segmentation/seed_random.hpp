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
 * @file seed_random.hpp
 * @brief Injectable deterministic random source for seed sampling
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstdint>

namespace seedgrow::services {

/**
 * @brief Stream of uniform doubles in [0, 1)
 *
 * Seed sampling takes this interface so tests can supply fixed sequences.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    [[nodiscard]] virtual double nextUniform() = 0;
};

/**
 * @brief 32-bit integer finalizer used to derive PRNG seeds
 */
[[nodiscard]] std::uint32_t mixU32(std::uint32_t x) noexcept;

/**
 * @brief mulberry32 generator
 *
 * Small, fast and reproducible across platforms. Not for cryptographic use.
 */
class Mulberry32 final : public RandomSource {
public:
    explicit Mulberry32(std::uint32_t seed) noexcept : state_(seed) {}

    [[nodiscard]] double nextUniform() override;

    [[nodiscard]] std::uint32_t nextU32() noexcept;

private:
    std::uint32_t state_;
};

} // namespace seedgrow::services
