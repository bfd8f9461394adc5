#pragma once

#include <yquad/result.hpp>
#include <glm/glm.hpp>
#include <cstdint>

namespace yquad {

//-----------------------------------------------------------------------------
// Texel formats an atlas can hold
//-----------------------------------------------------------------------------
enum class TexelFormat : uint32_t {
    RGBA8Unorm = 0,  // texture atlas
    R8Unorm = 1,     // single-channel stencil atlas
};

const char* texelFormatName(TexelFormat format);

//-----------------------------------------------------------------------------
// AtlasRegion - a normalized sub-rectangle on one page of an atlas array
//-----------------------------------------------------------------------------
struct AtlasRegion {
    uint32_t atlasId = 0;
    TexelFormat format = TexelFormat::RGBA8Unorm;
    uint32_t page = 0;
    glm::vec2 offset{0.0f};  // normalized, offset + size <= 1
    glm::vec2 size{1.0f};

    // Normalize a pixel rectangle on a pageWidth x pageHeight page.
    // Fails when the rectangle is empty or leaves the page.
    static Result<AtlasRegion> fromPixels(uint32_t atlasId, TexelFormat format,
                                          uint32_t page, uint32_t x, uint32_t y,
                                          uint32_t width, uint32_t height,
                                          uint32_t pageWidth,
                                          uint32_t pageHeight) noexcept;

    // offset and size within [0,1] and offset + size <= 1
    bool isNormalized() const noexcept;
};

} // namespace yquad
