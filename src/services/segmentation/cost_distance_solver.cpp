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

#include "services/segmentation/cost_distance_solver.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace seedgrow::services {

SolverDomain::SolverDomain(std::array<int, 3> gridDims,
                           std::array<int, 3> lo,
                           std::array<int, 3> hi) noexcept
    : grid_(gridDims) {
    for (std::size_t axis = 0; axis < 3; ++axis) {
        const int last = std::max(0, grid_[axis] - 1);
        lo_[axis] = std::clamp(std::min(lo[axis], hi[axis]), 0, last);
        hi_[axis] = std::clamp(std::max(lo[axis], hi[axis]), 0, last);
        extent_[axis] = hi_[axis] - lo_[axis] + 1;
    }
}

SolverDomain SolverDomain::fullGrid(std::array<int, 3> gridDims) noexcept {
    return SolverDomain(gridDims, {0, 0, 0},
                        {gridDims[0] - 1, gridDims[1] - 1, gridDims[2] - 1});
}

std::array<int, 3> SolverDomain::fromLocal(std::size_t local) const noexcept {
    const std::size_t plane = static_cast<std::size_t>(extent_[0]) *
                              static_cast<std::size_t>(extent_[1]);
    const std::size_t z = local / plane;
    const std::size_t rest = local - z * plane;
    const std::size_t y = rest / static_cast<std::size_t>(extent_[0]);
    const std::size_t x = rest - y * static_cast<std::size_t>(extent_[0]);
    return {
        static_cast<int>(x) + lo_[0],
        static_cast<int>(y) + lo_[1],
        static_cast<int>(z) + lo_[2]
    };
}

std::vector<NeighborOffset> makeNeighborhood2D(bool allowDiagonal) {
    std::vector<NeighborOffset> offsets = {
        {-1, 0, 0, 1.0},
        {1, 0, 0, 1.0},
        {0, -1, 0, 1.0},
        {0, 1, 0, 1.0},
    };
    if (allowDiagonal) {
        const double diagonal = std::sqrt(2.0);
        offsets.push_back({-1, -1, 0, diagonal});
        offsets.push_back({1, -1, 0, diagonal});
        offsets.push_back({-1, 1, 0, diagonal});
        offsets.push_back({1, 1, 0, diagonal});
    }
    return offsets;
}

std::vector<NeighborOffset> makeNeighborhood3D(Connectivity3D connectivity) {
    if (connectivity == Connectivity3D::Six) {
        return {
            {-1, 0, 0, 1.0},
            {1, 0, 0, 1.0},
            {0, -1, 0, 1.0},
            {0, 1, 0, 1.0},
            {0, 0, -1, 1.0},
            {0, 0, 1, 1.0},
        };
    }

    std::vector<NeighborOffset> offsets;
    offsets.reserve(26);
    for (int dz = -1; dz <= 1; ++dz) {
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                if (dx == 0 && dy == 0 && dz == 0) {
                    continue;
                }
                const int axes = std::abs(dx) + std::abs(dy) + std::abs(dz);
                offsets.push_back({dx, dy, dz, std::sqrt(static_cast<double>(axes))});
            }
        }
    }
    return offsets;
}

} // namespace seedgrow::services
