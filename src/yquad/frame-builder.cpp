#include <yquad/frame-builder.h>
#include <ytrace/ytrace.hpp>
#include <cmath>
#include <optional>
#include <string>

namespace yquad {

struct FrameBuilder::State {
    TexelFormat textureFormat;
    TexelFormat stencilFormat;
    std::optional<uint32_t> textureAtlasId;
    std::optional<uint32_t> stencilAtlasId;
    FrameData frame;
};

//=============================================================================
// Helpers
//=============================================================================

static Result<void> checkRegion(const AtlasRegion& region, TexelFormat expected,
                                std::optional<uint32_t>& atlasId, const char* what) {
    if (region.format != expected) {
        return Err(std::string(what) + " format mismatch: got " +
                   texelFormatName(region.format) + ", atlas is " +
                   texelFormatName(expected));
    }
    if (!atlasId) {
        atlasId = region.atlasId;
    } else if (*atlasId != region.atlasId) {
        return Err(std::string(what) + " atlas id mismatch: " +
                   std::to_string(region.atlasId) + " vs " + std::to_string(*atlasId));
    }
    if (!region.isNormalized()) {
        return Err(std::string(what) + " region is not normalized");
    }
    return Ok();
}

void setStencilTransform(StencilRecord& record, const glm::mat4& transform) {
    record.transform = transform;
    float det = glm::determinant(transform);
    if (std::isfinite(det) && std::fabs(det) > FrameBuilder::INVERTIBLE_EPSILON) {
        record.transformInvertible = 1;
        record.inverseTransform = glm::inverse(transform);
    } else {
        record.transformInvertible = 0;
        record.inverseTransform = glm::mat4(1.0f);
    }
}

//=============================================================================
// FrameBuilder
//=============================================================================

Result<FrameData> FrameBuilder::build(const RenderNode& root, TexelFormat textureFormat,
                                      TexelFormat stencilFormat) noexcept {
    State state{textureFormat, stencilFormat, std::nullopt, std::nullopt, {}};
    if (auto res = visit(root, glm::mat4(1.0f), 0, state); !res) {
        return Err<FrameData>("FrameBuilder::build failed", res);
    }
    ydebug("FrameBuilder::build: {} instances, {} stencils",
           state.frame.instances.size(), state.frame.stencils.size());
    return Ok(std::move(state.frame));
}

Result<void> FrameBuilder::visit(const RenderNode& node, const glm::mat4& transform,
                                 uint32_t currentStencil, State& state) noexcept {
    if (const auto& stencil = node.stencil()) {
        if (auto res = checkRegion(stencil->region, state.stencilFormat,
                                   state.stencilAtlasId, "stencil"); !res) {
            return res;
        }
        StencilRecord rec;
        setStencilTransform(rec, transform * stencil->transform);
        if (!rec.transformInvertible) {
            ydebug("FrameBuilder: stencil {} is not invertible, masking disabled",
                   state.frame.stencils.size());
        }
        rec.atlasPage = stencil->region.page;
        rec.atlasOffset = stencil->region.offset;
        rec.atlasSize = stencil->region.size;
        state.frame.stencils.push_back(rec);
        currentStencil = static_cast<uint32_t>(state.frame.stencils.size());
    }

    if (const auto& texture = node.texture()) {
        if (auto res = checkRegion(texture->region, state.textureFormat,
                                   state.textureAtlasId, "texture"); !res) {
            return res;
        }
        InstanceRecord rec;
        rec.transform = transform * texture->transform;
        rec.atlasPage = texture->region.page;
        rec.atlasOffset = texture->region.offset;
        rec.atlasSize = texture->region.size;
        rec.stencilRef = currentStencil;
        state.frame.instances.push_back(rec);
    }

    for (const auto& child : node.children()) {
        if (auto res = visit(child.node, transform * child.transform, currentStencil, state); !res) {
            return res;
        }
    }
    return Ok();
}

//=============================================================================
// Free functions
//=============================================================================

glm::mat4 makeNormalizeMatrix(float width, float height) {
    // glm is column-major: m[col][row]
    glm::mat4 m(1.0f);
    m[0][0] = 2.0f / width;
    m[1][1] = -2.0f / height;
    m[3][0] = -1.0f;
    m[3][1] = 1.0f;
    return m;
}

Result<void> validateFrame(const FrameData& frame, size_t visibleCapacity) noexcept {
    if (visibleCapacity < frame.instances.size()) {
        return Err("visible-index capacity " + std::to_string(visibleCapacity) +
                   " < instance count " + std::to_string(frame.instances.size()));
    }

    const size_t stencilCount = frame.stencils.size();
    for (size_t i = 0; i < frame.instances.size(); ++i) {
        const auto& inst = frame.instances[i];
        if (inst.stencilRef != 0 && inst.stencilRef > stencilCount) {
            return Err("instance " + std::to_string(i) + ": stencil_ref " +
                       std::to_string(inst.stencilRef) + " out of range (" +
                       std::to_string(stencilCount) + " stencils)");
        }
        AtlasRegion r{0, TexelFormat::RGBA8Unorm, inst.atlasPage, inst.atlasOffset, inst.atlasSize};
        if (!r.isNormalized()) {
            return Err("instance " + std::to_string(i) + ": atlas rectangle outside [0,1]");
        }
    }

    for (size_t i = 0; i < stencilCount; ++i) {
        const auto& st = frame.stencils[i];
        AtlasRegion r{0, TexelFormat::R8Unorm, st.atlasPage, st.atlasOffset, st.atlasSize};
        if (!r.isNormalized()) {
            return Err("stencil " + std::to_string(i) + ": atlas rectangle outside [0,1]");
        }
    }
    return Ok();
}

} // namespace yquad
