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

#include "services/segmentation/mask_operations.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <string>

#include <itkBinaryDilateImageFilter.h>
#include <itkBinaryErodeImageFilter.h>
#include <itkConnectedComponentImageFilter.h>
#include <itkExceptionObject.h>
#include <itkFlatStructuringElement.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>
#include <itkRelabelComponentImageFilter.h>

namespace seedgrow::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MaskOperations");
    return logger;
}

using ComponentLabelVolume = itk::Image<std::uint32_t, 3>;

bool hasPositiveDims(const std::array<int, 3>& dims) noexcept {
    return dims[0] > 0 && dims[1] > 0 && dims[2] > 0;
}

using BoxElement = itk::FlatStructuringElement<3>;

BoxElement unitBox() {
    BoxElement::RadiusType radius;
    radius.Fill(1);
    return BoxElement::Box(radius);
}

template <typename FilterType>
std::expected<BinaryMask3D::Pointer, SegmentationError>
runMorphology(BinaryMask3D::Pointer mask, typename FilterType::Pointer filter) {
    if (!mask) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Null mask pointer"
        });
    }

    try {
        filter->SetInput(mask);
        filter->SetKernel(unitBox());
        filter->SetForegroundValue(1);
        filter->SetBackgroundValue(0);
        filter->Update();

        BinaryMask3D::Pointer output = filter->GetOutput();
        output->DisconnectPipeline();
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception: {}", e.GetDescription());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

std::size_t voxelCount(const std::array<int, 3>& dims) noexcept {
    return static_cast<std::size_t>(dims[0]) * static_cast<std::size_t>(dims[1]) *
           static_cast<std::size_t>(dims[2]);
}

} // anonymous namespace

std::expected<BinaryMask3D::Pointer, SegmentationError>
indicesToMask(std::span<const std::uint32_t> indices, const std::array<int, 3>& dims) {
    if (!hasPositiveDims(dims)) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Mask dimensions must be positive"
        });
    }

    const std::size_t total = voxelCount(dims);
    auto mask = allocateMask3D(dims);
    auto* buffer = mask->GetBufferPointer();

    for (std::uint32_t index : indices) {
        if (index >= total) {
            return std::unexpected(SegmentationError{
                SegmentationError::Code::InvalidInput,
                "Voxel index " + std::to_string(index) + " outside volume of " +
                std::to_string(total) + " voxels"
            });
        }
        buffer[index] = 1;
    }
    return mask;
}

std::vector<std::uint32_t> maskToIndices(const BinaryMask3D* mask) {
    std::vector<std::uint32_t> indices;
    if (!mask) {
        return indices;
    }

    const auto region = mask->GetBufferedRegion();
    itk::ImageRegionConstIterator<BinaryMask3D> it(mask, region);
    std::uint32_t index = 0;
    for (it.GoToBegin(); !it.IsAtEnd(); ++it, ++index) {
        if (it.Get() != 0) {
            indices.push_back(index);
        }
    }
    return indices;
}

std::expected<LargestComponentResult, SegmentationError>
keepLargestConnectedComponent3D(std::span<const std::uint8_t> mask,
                                const std::array<int, 3>& dims,
                                Connectivity3D connectivity) {
    const std::size_t total = hasPositiveDims(dims) ? voxelCount(dims) : 0;
    if (total == 0 || mask.size() != total) {
        getLogger()->error("Mask length mismatch (expected {}, got {})", total, mask.size());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Mask length mismatch (expected " + std::to_string(total) +
            ", got " + std::to_string(mask.size()) + ")"
        });
    }

    auto image = allocateMask3D(dims);
    std::copy(mask.begin(), mask.end(), image->GetBufferPointer());
    return keepLargestConnectedComponent3D(image, connectivity);
}

std::expected<LargestComponentResult, SegmentationError>
keepLargestConnectedComponent3D(BinaryMask3D::Pointer mask, Connectivity3D connectivity) {
    if (!mask) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Null mask pointer"
        });
    }

    try {
        using ConnectedFilter = itk::ConnectedComponentImageFilter<BinaryMask3D, ComponentLabelVolume>;
        auto connected = ConnectedFilter::New();
        connected->SetInput(mask);
        connected->SetBackgroundValue(0);
        connected->SetFullyConnected(connectivity == Connectivity3D::TwentySix);

        // Largest component becomes label 1
        using RelabelFilter = itk::RelabelComponentImageFilter<ComponentLabelVolume, ComponentLabelVolume>;
        auto relabel = RelabelFilter::New();
        relabel->SetInput(connected->GetOutput());
        relabel->Update();

        LargestComponentResult result;
        result.mask = BinaryMask3D::New();
        result.mask->CopyInformation(mask);
        result.mask->SetRegions(mask->GetLargestPossibleRegion());
        result.mask->Allocate(true);

        if (relabel->GetNumberOfObjects() == 0) {
            getLogger()->debug("Mask is empty; nothing to keep");
            return result;
        }
        result.keptSize = static_cast<std::size_t>(relabel->GetSizeOfObjectInPixels(1));

        itk::ImageRegionConstIterator<ComponentLabelVolume> labelIt(
            relabel->GetOutput(), relabel->GetOutput()->GetLargestPossibleRegion());
        itk::ImageRegionIterator<BinaryMask3D> outIt(
            result.mask, result.mask->GetLargestPossibleRegion());
        for (labelIt.GoToBegin(), outIt.GoToBegin(); !labelIt.IsAtEnd(); ++labelIt, ++outIt) {
            if (labelIt.Get() == 1) {
                outIt.Set(1);
            }
        }

        getLogger()->debug("Kept largest of {} components ({} voxels)",
            relabel->GetNumberOfObjects(), result.keptSize);
        return result;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception: {}", e.GetDescription());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

std::expected<BinaryMask3D::Pointer, SegmentationError>
dilateMask3D(BinaryMask3D::Pointer mask) {
    using FilterType = itk::BinaryDilateImageFilter<BinaryMask3D, BinaryMask3D, BoxElement>;
    return runMorphology<FilterType>(mask, FilterType::New());
}

std::expected<BinaryMask3D::Pointer, SegmentationError>
erodeMask3D(BinaryMask3D::Pointer mask) {
    using FilterType = itk::BinaryErodeImageFilter<BinaryMask3D, BinaryMask3D, BoxElement>;
    auto filter = FilterType::New();
    filter->SetBoundaryToForeground(false);
    return runMorphology<FilterType>(mask, filter);
}

} // namespace seedgrow::services
