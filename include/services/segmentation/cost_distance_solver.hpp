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
 * @file cost_distance_solver.hpp
 * @brief Multi-source Dijkstra over a box-shaped grid domain
 * @details Shared by the 2D slice grow (nz = 1) and the 3D volume grow. The
 *          step cost is supplied by the caller as a callable so the same loop
 *          serves both cost models. Distances are stored as float; candidate
 *          distances are rounded to float before the improvement test so a
 *          rounding mismatch can never re-queue a cell forever.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "min_heap.hpp"
#include "segmentation_types.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <vector>

namespace seedgrow::services {

/**
 * @brief Inclusive box of reachable cells inside a grid of size dims
 */
class SolverDomain {
public:
    SolverDomain(std::array<int, 3> gridDims, std::array<int, 3> lo, std::array<int, 3> hi) noexcept;

    /// Domain covering the whole grid
    [[nodiscard]] static SolverDomain fullGrid(std::array<int, 3> gridDims) noexcept;

    [[nodiscard]] bool contains(int x, int y, int z) const noexcept {
        return x >= lo_[0] && x <= hi_[0] &&
               y >= lo_[1] && y <= hi_[1] &&
               z >= lo_[2] && z <= hi_[2];
    }

    [[nodiscard]] std::size_t cellCount() const noexcept {
        return static_cast<std::size_t>(extent_[0]) *
               static_cast<std::size_t>(extent_[1]) *
               static_cast<std::size_t>(extent_[2]);
    }

    [[nodiscard]] std::size_t toLocal(int x, int y, int z) const noexcept {
        return (static_cast<std::size_t>(z - lo_[2]) * static_cast<std::size_t>(extent_[1]) +
                static_cast<std::size_t>(y - lo_[1])) * static_cast<std::size_t>(extent_[0]) +
               static_cast<std::size_t>(x - lo_[0]);
    }

    [[nodiscard]] std::array<int, 3> fromLocal(std::size_t local) const noexcept;

    [[nodiscard]] std::size_t toGlobal(int x, int y, int z) const noexcept {
        return (static_cast<std::size_t>(z) * static_cast<std::size_t>(grid_[1]) +
                static_cast<std::size_t>(y)) * static_cast<std::size_t>(grid_[0]) +
               static_cast<std::size_t>(x);
    }

    [[nodiscard]] const std::array<int, 3>& gridDims() const noexcept { return grid_; }
    [[nodiscard]] const std::array<int, 3>& lower() const noexcept { return lo_; }
    [[nodiscard]] const std::array<int, 3>& upper() const noexcept { return hi_; }

private:
    std::array<int, 3> grid_;
    std::array<int, 3> lo_;
    std::array<int, 3> hi_;
    std::array<int, 3> extent_;
};

/**
 * @brief One neighbour offset with its Euclidean step length
 */
struct NeighborOffset {
    int dx = 0;
    int dy = 0;
    int dz = 0;
    double length = 1.0;
};

/// 4- or 8-neighbourhood in the z = 0 plane
[[nodiscard]] std::vector<NeighborOffset> makeNeighborhood2D(bool allowDiagonal);

/// 6- or 26-neighbourhood
[[nodiscard]] std::vector<NeighborOffset> makeNeighborhood3D(Connectivity3D connectivity);

/**
 * @brief A directed step handed to the cost callable
 */
struct GridStep {
    std::size_t fromIndex = 0;   ///< Global index of the source cell
    std::size_t toIndex = 0;     ///< Global index of the target cell
    int toX = 0;
    int toY = 0;
    int toZ = 0;
    double length = 1.0;
};

/**
 * @brief Termination and scheduling controls
 */
struct SolverOptions {
    /// Stop once the smallest queued distance exceeds this budget
    double maxCost = std::numeric_limits<double>::infinity();

    /// Cap on finalized cells recorded in the discovery order
    std::size_t maxVoxels = std::numeric_limits<std::size_t>::max();

    /// Record finalized cells (global index) in discovery order
    bool recordOrder = false;

    /// Run the callbacks every N finalized cells; 0 disables them
    std::size_t yieldEvery = 0;

    YieldCallback onYield;
    GrowProgressCallback onProgress;

    /// Polled every iteration; cancellation aborts the run
    std::optional<CancellationToken> cancelToken;
};

/**
 * @brief Solver output
 */
struct SolverOutcome {
    /// Distance per domain cell (local indexing), +inf where unreached
    std::vector<float> distance;

    /// Finalized global indices in discovery order (when recordOrder)
    std::vector<std::uint32_t> order;

    /// Number of seeds actually placed in the domain
    std::size_t seedCount = 0;

    /// Number of finalized cells
    std::size_t processed = 0;

    bool hitMaxVoxels = false;
};

/**
 * @brief Run multi-source Dijkstra from seeds over the domain
 *
 * @tparam StepCostFn Callable double(const GridStep&); +inf forbids the step
 * @param domain Reachable box
 * @param seeds Seed cells as grid coordinates; cells outside the domain are skipped
 * @param neighborhood Neighbour offsets
 * @param stepCost Non-negative cost of a step
 * @param options Budgets, callbacks and cancellation
 * @return Outcome, or Cancelled when the token fires during the run
 */
template <typename StepCostFn>
[[nodiscard]] std::expected<SolverOutcome, SegmentationError> solveCostDistance(
    const SolverDomain& domain,
    std::span<const std::array<int, 3>> seeds,
    std::span<const NeighborOffset> neighborhood,
    StepCostFn&& stepCost,
    const SolverOptions& options
) {
    constexpr float kInf = std::numeric_limits<float>::infinity();

    const std::size_t cellCount = domain.cellCount();

    SolverOutcome outcome;
    outcome.distance.assign(cellCount, kInf);
    std::vector<std::uint8_t> finalized(cellCount, 0);

    IndexedMinHeap<float> heap;
    heap.reserve(std::min<std::size_t>(cellCount, 1u << 16));

    for (const auto& s : seeds) {
        if (!domain.contains(s[0], s[1], s[2])) {
            continue;
        }
        const std::size_t local = domain.toLocal(s[0], s[1], s[2]);
        if (outcome.distance[local] == 0.0f) {
            continue;
        }
        outcome.distance[local] = 0.0f;
        heap.push(local, 0.0f);
        ++outcome.seedCount;
    }

    const std::size_t orderCap = std::min(options.maxVoxels, cellCount);
    if (options.recordOrder) {
        outcome.order.reserve(std::min<std::size_t>(orderCap, 1u << 20));
    }

    auto cancelled = [&options]() {
        return options.cancelToken.has_value() && options.cancelToken->isCancelled();
    };

    while (!heap.empty()) {
        if (cancelled()) {
            return std::unexpected(SegmentationError{
                SegmentationError::Code::Cancelled,
                "Cost-distance solve cancelled"
            });
        }

        const auto entry = heap.pop();
        if (!entry) {
            break;
        }

        const std::size_t local = entry->index;
        const float d = entry->distance;

        // Superseded by a later, smaller push
        if (d != outcome.distance[local] || finalized[local] != 0) {
            continue;
        }

        if (static_cast<double>(d) > options.maxCost) {
            break;
        }

        finalized[local] = 1;

        const auto cell = domain.fromLocal(local);
        const std::size_t global = domain.toGlobal(cell[0], cell[1], cell[2]);

        if (options.recordOrder) {
            if (outcome.order.size() >= orderCap) {
                outcome.hitMaxVoxels = true;
                break;
            }
            outcome.order.push_back(static_cast<std::uint32_t>(global));
        }

        ++outcome.processed;
        if (options.yieldEvery > 0 && outcome.processed % options.yieldEvery == 0) {
            if (options.onProgress) {
                options.onProgress(outcome.processed, outcome.order.size());
            }
            if (options.onYield) {
                options.onYield();
            }
        }

        for (const auto& offset : neighborhood) {
            const int nx = cell[0] + offset.dx;
            const int ny = cell[1] + offset.dy;
            const int nz = cell[2] + offset.dz;
            if (!domain.contains(nx, ny, nz)) {
                continue;
            }

            const std::size_t neighborLocal = domain.toLocal(nx, ny, nz);
            if (finalized[neighborLocal] != 0) {
                continue;
            }

            GridStep step;
            step.fromIndex = global;
            step.toIndex = domain.toGlobal(nx, ny, nz);
            step.toX = nx;
            step.toY = ny;
            step.toZ = nz;
            step.length = offset.length;

            const double cost = stepCost(step);
            if (!std::isfinite(cost)) {
                continue;
            }

            const float candidate = static_cast<float>(static_cast<double>(d) + cost);
            if (candidate < outcome.distance[neighborLocal]) {
                outcome.distance[neighborLocal] = candidate;
                heap.push(neighborLocal, candidate);
            }
        }
    }

    return outcome;
}

} // namespace seedgrow::services
