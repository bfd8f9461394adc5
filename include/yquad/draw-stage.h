#pragma once

#include <yquad/frame-builder.h>
#include <yquad/gpu-records.h>
#include <array>
#include <functional>
#include <vector>

namespace yquad {

//-----------------------------------------------------------------------------
// Host emulation of quad-draw.wgsl
//
// The instance is drawn as a 4-vertex triangle strip; the strip order is
// (0,0) (0,1) (1,0) (1,1) and the unit coordinate doubles as the UV.
//-----------------------------------------------------------------------------

// Values passed from vertex to fragment stage (the WGSL VertexOutput)
struct VertexOutput {
    glm::vec4 position{0.0f};   // clip space
    glm::vec2 uv{0.0f};         // texture atlas UV
    uint32_t atlasPage = 0;
    glm::vec2 atlasMin{0.0f};
    glm::vec2 atlasMax{0.0f};
    glm::vec2 stencilUv{0.0f};
    uint32_t stencilPage = 0;
    glm::vec2 stencilMin{0.0f};
    glm::vec2 stencilMax{0.0f};
    uint32_t useStencil = 0;    // 1 only with an invertible stencil
};

using QuadStrip = std::array<VertexOutput, QUAD_VERTEX_COUNT>;

// Unit coordinate of strip vertex `vertexIndex` (0..3)
glm::vec2 stripVertex(uint32_t vertexIndex);

// One vertex invocation. `instanceSlot` indexes `visible`.
VertexOutput vertexStage(const FrameData& frame, const glm::mat4& normalize,
                         const std::vector<uint32_t>& visible,
                         uint32_t vertexIndex, uint32_t instanceSlot);

// Varyings at unit coordinate `at` inside the quad (bilinear over the strip)
VertexOutput interpolateStrip(const QuadStrip& strip, glm::vec2 at);

using TextureSampler = std::function<glm::vec4(uint32_t page, glm::vec2 uv)>;
using StencilSampler = std::function<float(uint32_t page, glm::vec2 uv)>;

// Clamp UVs to their atlas rectangles, sample, mask by the stencil channel
glm::vec4 fragmentStage(const VertexOutput& in, const TextureSampler& texture,
                        const StencilSampler& stencil);

} // namespace yquad
