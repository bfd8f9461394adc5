#pragma once

#include <yquad/gpu-records.h>
#include <yquad/render-node.h>
#include <yquad/result.hpp>
#include <vector>

namespace yquad {

//-----------------------------------------------------------------------------
// FrameData - the two record arrays consumed by one frame
//-----------------------------------------------------------------------------
struct FrameData {
    std::vector<InstanceRecord> instances;
    std::vector<StencilRecord> stencils;

    bool empty() const { return instances.empty(); }
};

//-----------------------------------------------------------------------------
// FrameBuilder - flattens a RenderNode tree into FrameData
//
// Depth-first, parents before children. All texture regions must come from
// one atlas of `textureFormat`, all stencil regions from one atlas of
// `stencilFormat`.
//-----------------------------------------------------------------------------
class FrameBuilder {
public:
    // |det| at or below this disables stencil masking
    static constexpr float INVERTIBLE_EPSILON = 1e-10f;

    static Result<FrameData> build(const RenderNode& root,
                                   TexelFormat textureFormat = TexelFormat::RGBA8Unorm,
                                   TexelFormat stencilFormat = TexelFormat::R8Unorm) noexcept;

private:
    struct State;
    static Result<void> visit(const RenderNode& node, const glm::mat4& transform,
                              uint32_t currentStencil, State& state) noexcept;
};

// Destination pixels [0,w]x[0,h] (Y down) -> clip space [-1,1]^2 (Y up)
glm::mat4 makeNormalizeMatrix(float width, float height);

// Host-side contract check: stencil refs in range, atlas rectangles inside
// [0,1], visible-index capacity large enough.
Result<void> validateFrame(const FrameData& frame, size_t visibleCapacity) noexcept;

// Fill `record` with transform, its inverse and the invertible flag
void setStencilTransform(StencilRecord& record, const glm::mat4& transform);

} // namespace yquad
