#include <yquad/atlas-texture.h>
#include <yquad/wgpu-compat.h>
#include <ytrace/ytrace.hpp>

namespace yquad {

WGPUTextureFormat toWGPUFormat(TexelFormat format) {
    switch (format) {
        case TexelFormat::RGBA8Unorm: return WGPUTextureFormat_RGBA8Unorm;
        case TexelFormat::R8Unorm: return WGPUTextureFormat_R8Unorm;
    }
    return WGPUTextureFormat_Undefined;
}

class AtlasTextureImpl : public AtlasTexture {
public:
    AtlasTextureImpl(WGPUDevice device, uint32_t atlasId, TexelFormat format,
                     uint32_t pageWidth, uint32_t pageHeight, uint32_t pageCount,
                     std::string label) noexcept
        : _device(device)
        , _atlasId(atlasId)
        , _format(format)
        , _pageWidth(pageWidth)
        , _pageHeight(pageHeight)
        , _pageCount(pageCount)
        , _label(std::move(label)) {}

    ~AtlasTextureImpl() override {
        if (_view) wgpuTextureViewRelease(_view);
        if (_texture) {
            wgpuTextureDestroy(_texture);
            wgpuTextureRelease(_texture);
        }
    }

    Result<void> init() noexcept {
        if (!_device) {
            return Err<void>("AtlasTexture: null device");
        }
        if (_pageWidth == 0 || _pageHeight == 0 || _pageCount == 0) {
            return Err<void>("AtlasTexture: empty atlas " + _label);
        }

        size_t atlasBytes = static_cast<size_t>(_pageWidth) * _pageHeight * _pageCount * bytesPerTexel();
        yinfo("GPU_ALLOC AtlasTexture {}: {}x{}x{} {} = {} bytes ({:.2f} MB)",
              _label, _pageWidth, _pageHeight, _pageCount, texelFormatName(_format),
              atlasBytes, atlasBytes / (1024.0 * 1024.0));

        WGPUTextureDescriptor texDesc = {};
        texDesc.label = WGPU_STR(_label.c_str());
        texDesc.size.width = _pageWidth;
        texDesc.size.height = _pageHeight;
        texDesc.size.depthOrArrayLayers = _pageCount;
        texDesc.mipLevelCount = 1;
        texDesc.sampleCount = 1;
        texDesc.dimension = WGPUTextureDimension_2D;
        texDesc.format = toWGPUFormat(_format);
        texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;

        _texture = wgpuDeviceCreateTexture(_device, &texDesc);
        if (!_texture) {
            return Err<void>("Failed to create atlas texture " + _label);
        }

        // Always an array view, even with a single page
        WGPUTextureViewDescriptor viewDesc = {};
        viewDesc.format = texDesc.format;
        viewDesc.dimension = WGPUTextureViewDimension_2DArray;
        viewDesc.baseMipLevel = 0;
        viewDesc.mipLevelCount = 1;
        viewDesc.baseArrayLayer = 0;
        viewDesc.arrayLayerCount = _pageCount;
        viewDesc.aspect = WGPUTextureAspect_All;

        _view = wgpuTextureCreateView(_texture, &viewDesc);
        if (!_view) {
            return Err<void>("Failed to create atlas texture view " + _label);
        }
        return Ok();
    }

    Result<void> upload(WGPUQueue queue, uint32_t page, uint32_t x, uint32_t y,
                        uint32_t width, uint32_t height, const uint8_t* pixels) override {
        if (!pixels) {
            return Err<void>("AtlasTexture::upload: null pixels");
        }
        if (page >= _pageCount) {
            return Err<void>("AtlasTexture::upload: page " + std::to_string(page) +
                             " out of range for " + _label);
        }
        if (uint64_t(x) + width > _pageWidth || uint64_t(y) + height > _pageHeight) {
            return Err<void>("AtlasTexture::upload: rectangle exceeds page of " + _label);
        }

        WGPUTexelCopyTextureInfo destination = {};
        destination.texture = _texture;
        destination.mipLevel = 0;
        destination.origin = {x, y, page};
        destination.aspect = WGPUTextureAspect_All;

        WGPUTexelCopyBufferLayout dataLayout = {};
        dataLayout.offset = 0;
        dataLayout.bytesPerRow = width * bytesPerTexel();
        dataLayout.rowsPerImage = height;

        WGPUExtent3D writeSize = {width, height, 1};

        size_t totalBytes = static_cast<size_t>(width) * height * bytesPerTexel();
        wgpuQueueWriteTexture(queue, &destination, pixels, totalBytes, &dataLayout, &writeSize);
        _uploadedBytes += totalBytes;

        ydebug("AtlasTexture {}: uploaded {}x{} to page {} at ({}, {})",
               _label, width, height, page, x, y);
        return Ok();
    }

    Result<AtlasRegion> region(uint32_t page, uint32_t x, uint32_t y,
                               uint32_t width, uint32_t height) const override {
        if (page >= _pageCount) {
            return Err<AtlasRegion>("AtlasTexture::region: page out of range for " + _label);
        }
        return AtlasRegion::fromPixels(_atlasId, _format, page, x, y, width, height,
                                       _pageWidth, _pageHeight);
    }

    WGPUTextureView view() const override { return _view; }
    WGPUTexture texture() const override { return _texture; }
    uint32_t atlasId() const override { return _atlasId; }
    TexelFormat format() const override { return _format; }

    uint32_t bytesPerTexel() const override {
        return _format == TexelFormat::R8Unorm ? 1u : 4u;
    }

    Stats getStats() const override {
        return Stats{
            .pageWidth = _pageWidth,
            .pageHeight = _pageHeight,
            .pageCount = _pageCount,
            .uploadedBytes = _uploadedBytes
        };
    }

private:
    WGPUDevice _device;
    uint32_t _atlasId;
    TexelFormat _format;
    uint32_t _pageWidth;
    uint32_t _pageHeight;
    uint32_t _pageCount;
    std::string _label;

    WGPUTexture _texture = nullptr;
    WGPUTextureView _view = nullptr;
    uint64_t _uploadedBytes = 0;
};

Result<AtlasTexture::Ptr> AtlasTexture::create(WGPUDevice device, uint32_t atlasId,
                                               TexelFormat format, uint32_t pageWidth,
                                               uint32_t pageHeight, uint32_t pageCount,
                                               const std::string& label) noexcept {
    auto impl = std::make_shared<AtlasTextureImpl>(device, atlasId, format, pageWidth,
                                                   pageHeight, pageCount, label);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to create AtlasTexture", res);
    }
    return Ok(std::move(impl));
}

} // namespace yquad
