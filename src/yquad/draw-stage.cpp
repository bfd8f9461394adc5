#include <yquad/draw-stage.h>
#include <yquad/cull-kernel.h>

namespace yquad {

glm::vec2 stripVertex(uint32_t vertexIndex) {
    return glm::vec2(static_cast<float>((vertexIndex >> 1) & 1u),
                     static_cast<float>(vertexIndex & 1u));
}

VertexOutput vertexStage(const FrameData& frame, const glm::mat4& normalize,
                         const std::vector<uint32_t>& visible,
                         uint32_t vertexIndex, uint32_t instanceSlot) {
    const InstanceRecord& inst = frame.instances[visible[instanceSlot]];
    const glm::vec2 unit = stripVertex(vertexIndex);
    const glm::vec4 destination = inst.transform * glm::vec4(unit, 0.0f, 1.0f);

    VertexOutput out;
    out.position = normalize * destination;
    out.uv = inst.atlasOffset + inst.atlasSize * unit;
    out.atlasPage = inst.atlasPage;
    out.atlasMin = inst.atlasOffset;
    out.atlasMax = inst.atlasOffset + inst.atlasSize;

    if (inst.stencilRef != 0 && !frame.stencils.empty()) {
        bool clamped = false;
        uint32_t si = resolveStencilIndex(inst.stencilRef, frame.stencils.size(), clamped);
        const StencilRecord& st = frame.stencils[si];

        // Destination point back into the stencil's unit quad
        glm::vec4 local = st.inverseTransform * destination;
        glm::vec2 stencilUnit = glm::vec2(local.x, local.y) / local.w;

        out.stencilUv = st.atlasOffset + st.atlasSize * stencilUnit;
        out.stencilPage = st.atlasPage;
        out.stencilMin = st.atlasOffset;
        out.stencilMax = st.atlasOffset + st.atlasSize;
        out.useStencil = st.transformInvertible != 0 ? 1u : 0u;
    }
    return out;
}

VertexOutput interpolateStrip(const QuadStrip& strip, glm::vec2 at) {
    // strip: 0=(0,0) 1=(0,1) 2=(1,0) 3=(1,1)
    auto lerp2 = [&](auto member) {
        auto a = strip[0].*member;
        auto b = strip[1].*member;
        auto c = strip[2].*member;
        auto d = strip[3].*member;
        auto left = a + (b - a) * at.y;
        auto right = c + (d - c) * at.y;
        return left + (right - left) * at.x;
    };

    VertexOutput out = strip[0];
    out.position = lerp2(&VertexOutput::position);
    out.uv = lerp2(&VertexOutput::uv);
    out.stencilUv = lerp2(&VertexOutput::stencilUv);
    return out;
}

glm::vec4 fragmentStage(const VertexOutput& in, const TextureSampler& texture,
                        const StencilSampler& stencil) {
    glm::vec2 uv = glm::clamp(in.uv, in.atlasMin, in.atlasMax);
    glm::vec2 suv = glm::clamp(in.stencilUv, in.stencilMin, in.stencilMax);

    glm::vec4 color = texture(in.atlasPage, uv);
    float mask = 1.0f;
    if (in.useStencil != 0) {
        mask = stencil(in.stencilPage, suv);
    }
    return color * mask;
}

} // namespace yquad
