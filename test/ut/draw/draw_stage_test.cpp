//=============================================================================
// Draw Stage Unit Tests
//
// Vertex stage geometry and UVs, stencil UV projection, fragment clamping
// and masking against host samplers.
//=============================================================================

#include <boost/ut.hpp>
#include <yquad/draw-stage.h>
#include <yquad/frame-builder.h>
#include <glm/gtc/matrix_transform.hpp>
#include <vector>

using namespace boost::ut;
using namespace yquad;

static glm::mat4 rectTransform(float x, float y, float w, float h) {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), glm::vec3(x, y, 0.0f));
    return glm::scale(m, glm::vec3(w, h, 1.0f));
}

static bool near2(glm::vec2 a, glm::vec2 b, float eps = 1e-4f) {
    return glm::all(glm::lessThan(glm::abs(a - b), glm::vec2(eps)));
}

static QuadStrip drawStrip(const FrameData& frame, const glm::mat4& normalize, uint32_t index = 0) {
    std::vector<uint32_t> visible = {index};
    QuadStrip strip;
    for (uint32_t v = 0; v < QUAD_VERTEX_COUNT; ++v) {
        strip[v] = vertexStage(frame, normalize, visible, v, 0);
    }
    return strip;
}

// Instance at (10,20) 100x50 on a 200x100 target, atlas rect (0.5,0.25)+(0.25,0.5)
static FrameData singleInstanceFrame() {
    FrameData frame;
    InstanceRecord inst;
    inst.transform = rectTransform(10.0f, 20.0f, 100.0f, 50.0f);
    inst.atlasPage = 2;
    inst.atlasOffset = {0.5f, 0.25f};
    inst.atlasSize = {0.25f, 0.5f};
    frame.instances.push_back(inst);
    return frame;
}

static const glm::vec4 TEXEL(1.0f, 0.5f, 0.25f, 1.0f);

static glm::vec4 constantTexture(uint32_t, glm::vec2) {
    return TEXEL;
}

suite vertex_stage_tests = [] {

    "strip vertex order"_test = [] {
        expect(stripVertex(0) == glm::vec2(0.0f, 0.0f));
        expect(stripVertex(1) == glm::vec2(0.0f, 1.0f));
        expect(stripVertex(2) == glm::vec2(1.0f, 0.0f));
        expect(stripVertex(3) == glm::vec2(1.0f, 1.0f));
    };

    "positions are normalized destination corners"_test = [] {
        FrameData frame = singleInstanceFrame();
        auto strip = drawStrip(frame, makeNormalizeMatrix(200.0f, 100.0f));
        expect(near2(glm::vec2(strip[0].position), {-0.9f, 0.6f}));
        expect(near2(glm::vec2(strip[3].position), {0.1f, -0.4f}));
        expect(strip[0].position.w == 1.0_f);
    };

    "uv follows the unit coordinate inside the atlas rect"_test = [] {
        FrameData frame = singleInstanceFrame();
        auto strip = drawStrip(frame, glm::mat4(1.0f));
        expect(near2(strip[0].uv, {0.5f, 0.25f}));
        expect(near2(strip[1].uv, {0.5f, 0.75f}));
        expect(near2(strip[2].uv, {0.75f, 0.25f}));
        expect(near2(strip[3].uv, {0.75f, 0.75f}));
        expect(strip[0].atlasPage == 2_u);
        expect(strip[0].useStencil == 0_u);
    };

    "visible slot selects the instance"_test = [] {
        FrameData frame = singleInstanceFrame();
        InstanceRecord second;
        second.transform = rectTransform(0.0f, 0.0f, 2.0f, 2.0f);
        frame.instances.push_back(second);

        std::vector<uint32_t> visible = {1, 0};
        auto v = vertexStage(frame, glm::mat4(1.0f), visible, 3, 0);
        expect(near2(glm::vec2(v.position), {2.0f, 2.0f}));
    };

    "stencil uv is projected through the inverse"_test = [] {
        FrameData frame = singleInstanceFrame();
        frame.instances[0].stencilRef = 1;

        // Stencil covers the left half of the instance
        StencilRecord st;
        setStencilTransform(st, rectTransform(10.0f, 20.0f, 50.0f, 50.0f));
        st.atlasOffset = {0.5f, 0.0f};
        st.atlasSize = {0.5f, 1.0f};
        frame.stencils.push_back(st);

        auto strip = drawStrip(frame, makeNormalizeMatrix(200.0f, 100.0f));
        expect(strip[0].useStencil == 1_u);
        expect(near2(strip[0].stencilUv, {0.5f, 0.0f}));
        // Right edge of the instance is two stencil widths out
        expect(near2(strip[2].stencilUv, {1.5f, 0.0f}));
        expect(near2(strip[0].stencilMax, {1.0f, 1.0f}));
    };

    "interpolation is bilinear over the strip"_test = [] {
        FrameData frame = singleInstanceFrame();
        auto strip = drawStrip(frame, glm::mat4(1.0f));
        auto center = interpolateStrip(strip, {0.5f, 0.5f});
        expect(near2(center.uv, {0.625f, 0.5f}));
        expect(near2(glm::vec2(center.position), {60.0f, 45.0f}));
    };
};

suite fragment_stage_tests = [] {

    "non-invertible stencil leaves the texture unmasked"_test = [] {
        FrameData frame = singleInstanceFrame();
        frame.instances[0].stencilRef = 1;
        StencilRecord st;
        setStencilTransform(st, rectTransform(10.0f, 20.0f, 100.0f, 0.0f));
        frame.stencils.push_back(st);
        expect(st.transformInvertible == 0_u);

        auto strip = drawStrip(frame, glm::mat4(1.0f));
        expect(strip[0].useStencil == 0_u);

        auto in = interpolateStrip(strip, {0.5f, 0.5f});
        auto zeroStencil = [](uint32_t, glm::vec2) { return 0.0f; };
        glm::vec4 out = fragmentStage(in, constantTexture, zeroStencil);
        expect(out == TEXEL);
    };

    "invertible stencil multiplies the sample"_test = [] {
        FrameData frame = singleInstanceFrame();
        frame.instances[0].stencilRef = 1;
        StencilRecord st;
        setStencilTransform(st, frame.instances[0].transform);
        st.atlasPage = 4;
        st.atlasOffset = {0.5f, 0.0f};
        st.atlasSize = {0.5f, 0.5f};
        frame.stencils.push_back(st);

        auto in = interpolateStrip(drawStrip(frame, glm::mat4(1.0f)), {0.5f, 0.5f});

        uint32_t sampledPage = 0;
        glm::vec2 sampledUv(0.0f);
        auto halfStencil = [&](uint32_t page, glm::vec2 uv) {
            sampledPage = page;
            sampledUv = uv;
            return 0.5f;
        };
        glm::vec4 out = fragmentStage(in, constantTexture, halfStencil);
        expect(out == TEXEL * 0.5f);
        expect(sampledPage == 4_u);
        expect(near2(sampledUv, {0.75f, 0.25f}));
    };

    "uvs are clamped to their atlas rectangles"_test = [] {
        FrameData frame = singleInstanceFrame();
        frame.instances[0].stencilRef = 1;
        StencilRecord st;
        setStencilTransform(st, rectTransform(10.0f, 20.0f, 50.0f, 50.0f));
        st.atlasOffset = {0.0f, 0.0f};
        st.atlasSize = {0.5f, 0.5f};
        frame.stencils.push_back(st);

        auto strip = drawStrip(frame, glm::mat4(1.0f));
        // Past the far corner, both UVs leave their rectangles
        auto in = interpolateStrip(strip, {1.5f, 1.5f});

        glm::vec2 textureUv(0.0f), stencilUv(0.0f);
        auto texture = [&](uint32_t, glm::vec2 uv) { textureUv = uv; return TEXEL; };
        auto stencil = [&](uint32_t, glm::vec2 uv) { stencilUv = uv; return 1.0f; };
        (void)fragmentStage(in, texture, stencil);

        expect(near2(textureUv, {0.75f, 0.75f}));
        expect(near2(stencilUv, {0.5f, 0.5f}));
    };

    "instance without stencil never samples the mask"_test = [] {
        FrameData frame = singleInstanceFrame();
        auto in = interpolateStrip(drawStrip(frame, glm::mat4(1.0f)), {0.2f, 0.7f});
        bool stencilSampled = false;
        auto stencil = [&](uint32_t, glm::vec2) { stencilSampled = true; return 0.0f; };
        glm::vec4 out = fragmentStage(in, constantTexture, stencil);
        expect(out == TEXEL);
        expect(!stencilSampled);
    };
};
