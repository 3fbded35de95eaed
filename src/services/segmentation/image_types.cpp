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

#include "services/segmentation/image_types.hpp"

#include <cstddef>

namespace seedgrow::services {

std::expected<GrayView2D, SegmentationError>
makeGrayView(const GrayImage2D* image) {
    if (!image) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Input image is null"
        });
    }

    const auto size = image->GetBufferedRegion().GetSize();
    const std::size_t count = size[0] * size[1];
    if (count == 0 || image->GetBufferPointer() == nullptr) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Input image has no buffered pixels"
        });
    }

    GrayView2D view;
    view.pixels = std::span<const std::uint8_t>(image->GetBufferPointer(), count);
    view.width = static_cast<int>(size[0]);
    view.height = static_cast<int>(size[1]);
    return view;
}

std::expected<VolumeView, SegmentationError>
makeVolumeView(const IntensityVolume* image) {
    if (!image) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Input volume is null"
        });
    }

    const auto size = image->GetBufferedRegion().GetSize();
    const std::size_t count = size[0] * size[1] * size[2];
    if (count == 0 || image->GetBufferPointer() == nullptr) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Input volume has no buffered voxels"
        });
    }

    VolumeView view;
    view.voxels = std::span<const float>(image->GetBufferPointer(), count);
    view.dims = {
        static_cast<int>(size[0]),
        static_cast<int>(size[1]),
        static_cast<int>(size[2])
    };
    return view;
}

GrayImage2D::Pointer allocateGrayImage(int width, int height, unsigned char value) {
    auto image = GrayImage2D::New();

    GrayImage2D::SizeType size;
    size[0] = static_cast<itk::SizeValueType>(width);
    size[1] = static_cast<itk::SizeValueType>(height);

    GrayImage2D::IndexType start;
    start.Fill(0);

    GrayImage2D::RegionType region;
    region.SetSize(size);
    region.SetIndex(start);

    image->SetRegions(region);
    image->Allocate();
    image->FillBuffer(value);
    return image;
}

IntensityVolume::Pointer allocateVolume(int nx, int ny, int nz, float value) {
    auto image = IntensityVolume::New();

    IntensityVolume::SizeType size;
    size[0] = static_cast<itk::SizeValueType>(nx);
    size[1] = static_cast<itk::SizeValueType>(ny);
    size[2] = static_cast<itk::SizeValueType>(nz);

    IntensityVolume::IndexType start;
    start.Fill(0);

    IntensityVolume::RegionType region;
    region.SetSize(size);
    region.SetIndex(start);

    image->SetRegions(region);
    image->Allocate();
    image->FillBuffer(value);
    return image;
}

BinaryMask3D::Pointer allocateMask3D(const std::array<int, 3>& dims) {
    auto mask = BinaryMask3D::New();

    BinaryMask3D::RegionType region;
    BinaryMask3D::SizeType size;
    for (unsigned int d = 0; d < 3; ++d) {
        size[d] = static_cast<itk::SizeValueType>(dims[d]);
    }
    region.SetSize(size);

    mask->SetRegions(region);
    mask->Allocate(true);
    return mask;
}

} // namespace seedgrow::services
