#pragma once

#include <yquad/frame-builder.h>
#include <yquad/gpu-records.h>
#include <yquad/result.hpp>
#include <webgpu/webgpu.h>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace yquad {

//-----------------------------------------------------------------------------
// QuadRenderer - GPU-driven culling and instanced atlas compositing
//
// Per frame, in one command encoder:
//   clear counter -> cull pass -> command pass -> render pass (DrawIndirect)
// The visible count never round-trips through the CPU; readbackCullResult()
// exists for diagnostics and tests only.
//-----------------------------------------------------------------------------
class QuadRenderer {
public:
    using Ptr = std::shared_ptr<QuadRenderer>;

    // Render pipelines are created per target format and cached
    static constexpr size_t MAX_CACHED_PIPELINES = 3;

    struct Options {
        std::string shaderDir;     // holds quad-cull/command/draw.wgsl
        bool cullEnabled = true;   // false draws every instance
        bool validate = true;      // validateFrame() before upload
    };

    struct FrameTarget {
        WGPUTextureView view = nullptr;
        WGPUTextureFormat format = WGPUTextureFormat_Undefined;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    struct AtlasViews {
        WGPUTextureView texture = nullptr;  // RGBA8 2D array
        WGPUTextureView stencil = nullptr;  // R8 2D array
    };

    struct CullReadback {
        uint32_t visibleCount = 0;
        std::vector<uint32_t> visibleIndices;
        DrawIndirectArgs args;
    };

    struct Stats {
        uint64_t frames;
        uint32_t lastInstanceCount;
        uint32_t lastStencilCount;
        uint32_t instanceCapacity;
        uint32_t stencilCapacity;
        size_t cachedPipelines;
    };

    static Result<Ptr> create(WGPUDevice device, WGPUQueue queue, const Options& options) noexcept;

    virtual ~QuadRenderer() = default;

    // Clears `target` to `clearColor` and draws `frame`. An empty frame only
    // clears.
    virtual Result<void> render(const FrameTarget& target, const FrameData& frame,
                                const AtlasViews& atlases,
                                const std::array<double, 4>& clearColor) = 0;

    // Counter, visible list and indirect args of the last rendered frame
    virtual Result<CullReadback> readbackCullResult() = 0;

    virtual void setCullingEnabled(bool enabled) = 0;
    virtual bool cullingEnabled() const = 0;

    virtual Stats getStats() const = 0;

protected:
    QuadRenderer() = default;
};

} // namespace yquad
