#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>

namespace yquad {

//=============================================================================
// GPU record layouts
//
// These structs are uploaded verbatim into storage/uniform buffers and read by
// quad-cull.wgsl, quad-command.wgsl and quad-draw.wgsl. Field order, padding
// and size must match the WGSL struct declarations byte for byte.
//=============================================================================

// Invocations per culling workgroup (@workgroup_size in quad-cull.wgsl)
constexpr uint32_t CULL_WORKGROUP_SIZE = 64;

// Vertices per instance (triangle strip quad)
constexpr uint32_t QUAD_VERTEX_COUNT = 4;

//-----------------------------------------------------------------------------
// InstanceRecord - one textured widget quad (96 bytes)
//-----------------------------------------------------------------------------
struct alignas(16) InstanceRecord {
    glm::mat4 transform{1.0f};     // unit quad -> destination space
    uint32_t atlasPage = 0;
    uint32_t _pad0 = 0;
    glm::vec2 atlasOffset{0.0f};   // normalized UV rect origin
    glm::vec2 atlasSize{1.0f};     // normalized UV rect extent
    uint32_t stencilRef = 0;       // 0 = none, else stencil index + 1
    uint32_t _pad1 = 0;
};

static_assert(sizeof(InstanceRecord) == 96, "InstanceRecord must be 96 bytes");
static_assert(offsetof(InstanceRecord, transform) == 0);
static_assert(offsetof(InstanceRecord, atlasPage) == 64);
static_assert(offsetof(InstanceRecord, atlasOffset) == 72);
static_assert(offsetof(InstanceRecord, atlasSize) == 80);
static_assert(offsetof(InstanceRecord, stencilRef) == 88);

//-----------------------------------------------------------------------------
// StencilRecord - one clipping polygon (176 bytes)
//-----------------------------------------------------------------------------
struct alignas(16) StencilRecord {
    glm::mat4 transform{1.0f};         // unit quad -> destination space
    uint32_t transformInvertible = 1;  // computed on the host
    uint32_t _pad0[3] = {0, 0, 0};
    glm::mat4 inverseTransform{1.0f};  // valid only when transformInvertible
    uint32_t atlasPage = 0;
    uint32_t _pad1 = 0;
    glm::vec2 atlasOffset{0.0f};
    glm::vec2 atlasSize{1.0f};
    uint32_t _pad2[2] = {0, 0};
};

static_assert(sizeof(StencilRecord) == 176, "StencilRecord must be 176 bytes");
static_assert(offsetof(StencilRecord, transform) == 0);
static_assert(offsetof(StencilRecord, transformInvertible) == 64);
static_assert(offsetof(StencilRecord, inverseTransform) == 80);
static_assert(offsetof(StencilRecord, atlasPage) == 144);
static_assert(offsetof(StencilRecord, atlasOffset) == 152);
static_assert(offsetof(StencilRecord, atlasSize) == 160);

//-----------------------------------------------------------------------------
// FrameUniforms - per-frame constants shared by all three passes (80 bytes)
//-----------------------------------------------------------------------------
struct alignas(16) FrameUniforms {
    glm::mat4 normalize{1.0f};  // destination pixels -> clip space
    uint32_t instanceCount = 0;
    uint32_t cullEnabled = 1;   // 0 = append every instance
    uint32_t stencilCount = 1;  // live records in the stencil buffer, >= 1
    uint32_t _pad = 0;
};

static_assert(sizeof(FrameUniforms) == 80, "FrameUniforms must be 80 bytes");
static_assert(offsetof(FrameUniforms, instanceCount) == 64);
static_assert(offsetof(FrameUniforms, cullEnabled) == 68);
static_assert(offsetof(FrameUniforms, stencilCount) == 72);

//-----------------------------------------------------------------------------
// DrawIndirectArgs - argument record for DrawIndirect (16 bytes)
//-----------------------------------------------------------------------------
struct DrawIndirectArgs {
    uint32_t vertexCount = 0;
    uint32_t instanceCount = 0;
    uint32_t firstVertex = 0;
    uint32_t firstInstance = 0;
};

static_assert(sizeof(DrawIndirectArgs) == 16, "DrawIndirectArgs must be 16 bytes");

} // namespace yquad
