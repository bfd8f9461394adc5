#pragma once

#include <yquad/atlas-region.h>
#include <yquad/result.hpp>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <string>

namespace yquad {

//-----------------------------------------------------------------------------
// AtlasTexture - a 2D-array texture holding equally sized atlas pages
//
// The texture atlas is RGBA8, the stencil atlas R8. Producers upload pixel
// rectangles into a page and describe them to the frame builder through
// region(), which normalizes the rectangle against the page size.
//-----------------------------------------------------------------------------
class AtlasTexture {
public:
    using Ptr = std::shared_ptr<AtlasTexture>;

    struct Stats {
        uint32_t pageWidth;
        uint32_t pageHeight;
        uint32_t pageCount;
        uint64_t uploadedBytes;
    };

    static Result<Ptr> create(WGPUDevice device, uint32_t atlasId, TexelFormat format,
                              uint32_t pageWidth, uint32_t pageHeight,
                              uint32_t pageCount, const std::string& label) noexcept;

    virtual ~AtlasTexture() = default;

    // Tightly packed rows of width * bytesPerTexel()
    virtual Result<void> upload(WGPUQueue queue, uint32_t page, uint32_t x, uint32_t y,
                                uint32_t width, uint32_t height, const uint8_t* pixels) = 0;

    virtual Result<AtlasRegion> region(uint32_t page, uint32_t x, uint32_t y,
                                       uint32_t width, uint32_t height) const = 0;

    // 2D-array view over all pages
    virtual WGPUTextureView view() const = 0;
    virtual WGPUTexture texture() const = 0;

    virtual uint32_t atlasId() const = 0;
    virtual TexelFormat format() const = 0;
    virtual uint32_t bytesPerTexel() const = 0;
    virtual Stats getStats() const = 0;

protected:
    AtlasTexture() = default;
};

WGPUTextureFormat toWGPUFormat(TexelFormat format);

} // namespace yquad
