#include <yquad/atlas-region.h>
#include <string>

namespace yquad {

const char* texelFormatName(TexelFormat format) {
    switch (format) {
        case TexelFormat::RGBA8Unorm: return "rgba8unorm";
        case TexelFormat::R8Unorm: return "r8unorm";
    }
    return "unknown";
}

Result<AtlasRegion> AtlasRegion::fromPixels(uint32_t atlasId, TexelFormat format,
                                            uint32_t page, uint32_t x, uint32_t y,
                                            uint32_t width, uint32_t height,
                                            uint32_t pageWidth,
                                            uint32_t pageHeight) noexcept {
    if (pageWidth == 0 || pageHeight == 0) {
        return Err<AtlasRegion>("AtlasRegion: page size is zero");
    }
    if (width == 0 || height == 0) {
        return Err<AtlasRegion>("AtlasRegion: empty rectangle");
    }
    if (uint64_t(x) + width > pageWidth || uint64_t(y) + height > pageHeight) {
        return Err<AtlasRegion>("AtlasRegion: rectangle " + std::to_string(x) + "," +
                                std::to_string(y) + " " + std::to_string(width) + "x" +
                                std::to_string(height) + " exceeds page " +
                                std::to_string(pageWidth) + "x" + std::to_string(pageHeight));
    }

    AtlasRegion region;
    region.atlasId = atlasId;
    region.format = format;
    region.page = page;
    float pw = static_cast<float>(pageWidth);
    float ph = static_cast<float>(pageHeight);
    region.offset = glm::vec2(static_cast<float>(x) / pw, static_cast<float>(y) / ph);
    region.size = glm::vec2(static_cast<float>(width) / pw, static_cast<float>(height) / ph);
    return Ok(region);
}

bool AtlasRegion::isNormalized() const noexcept {
    // Tolerate float rounding from pixel normalization
    constexpr float eps = 1e-6f;
    if (offset.x < 0.0f || offset.y < 0.0f) return false;
    if (size.x < 0.0f || size.y < 0.0f) return false;
    return offset.x + size.x <= 1.0f + eps && offset.y + size.y <= 1.0f + eps;
}

} // namespace yquad
