//=============================================================================
// FrameBuilder / AtlasRegion / RenderNode Unit Tests
//=============================================================================

#include <boost/ut.hpp>
#include <yquad/frame-builder.h>
#include <yquad/render-node.h>
#include <yquad/atlas-region.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

using namespace boost::ut;
using namespace yquad;

static AtlasRegion textureRegion(uint32_t page = 0, uint32_t atlasId = 1) {
    auto r = AtlasRegion::fromPixels(atlasId, TexelFormat::RGBA8Unorm, page, 0, 0, 64, 64, 256, 256);
    return *r;
}

static AtlasRegion stencilRegion(uint32_t x = 0, uint32_t atlasId = 2) {
    auto r = AtlasRegion::fromPixels(atlasId, TexelFormat::R8Unorm, 0, x, 0, 64, 64, 128, 64);
    return *r;
}

static glm::mat4 scaled(float w, float h) {
    return glm::scale(glm::mat4(1.0f), glm::vec3(w, h, 1.0f));
}

static bool near(const glm::vec4& a, const glm::vec4& b, float eps = 1e-4f) {
    return glm::all(glm::lessThan(glm::abs(a - b), glm::vec4(eps)));
}

suite atlas_region_tests = [] {

    "fromPixels normalizes against the page"_test = [] {
        auto r = AtlasRegion::fromPixels(3, TexelFormat::RGBA8Unorm, 1, 64, 128, 32, 64, 256, 256);
        expect(r.has_value());
        expect(r->atlasId == 3_u);
        expect(r->page == 1_u);
        expect(r->offset.x == 0.25_f);
        expect(r->offset.y == 0.5_f);
        expect(r->size.x == 0.125_f);
        expect(r->size.y == 0.25_f);
        expect(r->isNormalized());
    };

    "fromPixels rejects bad rectangles"_test = [] {
        expect(!AtlasRegion::fromPixels(0, TexelFormat::R8Unorm, 0, 0, 0, 0, 10, 64, 64).has_value());
        expect(!AtlasRegion::fromPixels(0, TexelFormat::R8Unorm, 0, 60, 0, 10, 10, 64, 64).has_value());
        expect(!AtlasRegion::fromPixels(0, TexelFormat::R8Unorm, 0, 0, 0, 10, 10, 0, 64).has_value());
    };

    "isNormalized rejects rectangles leaving [0,1]"_test = [] {
        AtlasRegion r;
        r.offset = {0.8f, 0.0f};
        r.size = {0.5f, 0.5f};
        expect(!r.isNormalized());
        r.offset = {-0.1f, 0.0f};
        r.size = {0.5f, 0.5f};
        expect(!r.isNormalized());
    };
};

suite render_node_tests = [] {

    "count includes every descendant"_test = [] {
        RenderNode root;
        RenderNode child;
        child.addChild(RenderNode(), glm::mat4(1.0f));
        root.addChild(std::move(child), glm::mat4(1.0f));
        root.addChild(RenderNode(), glm::mat4(1.0f));
        expect(root.count() == 4_u);
    };
};

suite frame_builder_tests = [] {

    "empty tree builds an empty frame"_test = [] {
        auto frame = FrameBuilder::build(RenderNode());
        expect(frame.has_value());
        expect(frame->empty());
        expect(frame->stencils.empty());
    };

    "texture without stencil has ref 0"_test = [] {
        RenderNode root;
        root.withTexture(textureRegion(1), scaled(10.0f, 20.0f));
        auto frame = FrameBuilder::build(root);
        expect(frame.has_value());
        expect(frame->instances.size() == 1_u);
        expect(frame->instances[0].stencilRef == 0_u);
        expect(frame->instances[0].atlasPage == 1_u);
        expect(frame->instances[0].atlasSize.x == 0.25_f);
    };

    "stencil applies to descendants until replaced"_test = [] {
        RenderNode grandchild;
        grandchild.withStencil(stencilRegion(64), scaled(5.0f, 5.0f))
                  .withTexture(textureRegion(), scaled(5.0f, 5.0f));

        RenderNode child;
        child.withTexture(textureRegion(), scaled(8.0f, 8.0f));
        child.addChild(std::move(grandchild), glm::mat4(1.0f));

        RenderNode sibling;
        sibling.withTexture(textureRegion(), scaled(3.0f, 3.0f));

        RenderNode root;
        root.withStencil(stencilRegion(0), scaled(100.0f, 100.0f))
            .withTexture(textureRegion(), scaled(100.0f, 100.0f));
        root.addChild(std::move(child), glm::mat4(1.0f));
        root.addChild(std::move(sibling), glm::mat4(1.0f));

        auto frame = FrameBuilder::build(root);
        expect(frame.has_value());
        expect(frame->stencils.size() == 2_u);
        expect(frame->instances.size() == 4_u);
        // Depth-first: root, child, grandchild, sibling
        expect(frame->instances[0].stencilRef == 1_u);
        expect(frame->instances[1].stencilRef == 1_u);
        expect(frame->instances[2].stencilRef == 2_u);
        expect(frame->instances[3].stencilRef == 1_u);
        expect(frame->stencils[1].atlasOffset.x == 0.5_f);
    };

    "child transforms compose onto the parent"_test = [] {
        RenderNode child;
        child.withTexture(textureRegion(), scaled(5.0f, 5.0f));

        RenderNode root;
        root.addChild(std::move(child), glm::translate(glm::mat4(1.0f), glm::vec3(10.0f, 0.0f, 0.0f)));
        RenderNode top;
        top.addChild(std::move(root), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 7.0f, 0.0f)));

        auto frame = FrameBuilder::build(top);
        expect(frame.has_value());
        glm::vec4 corner = frame->instances[0].transform * glm::vec4(1.0f, 1.0f, 0.0f, 1.0f);
        expect(near(corner, glm::vec4(15.0f, 12.0f, 0.0f, 1.0f)));
    };

    "stencil inverse maps back to the unit quad"_test = [] {
        glm::mat4 placement = glm::translate(glm::mat4(1.0f), glm::vec3(30.0f, 40.0f, 0.0f));
        placement = glm::rotate(placement, 0.3f, glm::vec3(0.0f, 0.0f, 1.0f));
        placement = glm::scale(placement, glm::vec3(50.0f, 20.0f, 1.0f));

        RenderNode root;
        root.withStencil(stencilRegion(), placement);
        auto frame = FrameBuilder::build(root);
        expect(frame.has_value());

        const StencilRecord& st = frame->stencils[0];
        expect(st.transformInvertible == 1_u);
        glm::vec4 p = st.transform * glm::vec4(0.25f, 0.75f, 0.0f, 1.0f);
        expect(near(st.inverseTransform * p, glm::vec4(0.25f, 0.75f, 0.0f, 1.0f)));
    };

    "zero-area stencil is not invertible"_test = [] {
        RenderNode root;
        root.withStencil(stencilRegion(), scaled(40.0f, 0.0f))
            .withTexture(textureRegion(), scaled(40.0f, 40.0f));
        auto frame = FrameBuilder::build(root);
        expect(frame.has_value());
        expect(frame->stencils[0].transformInvertible == 0_u);
        expect(frame->stencils[0].inverseTransform == glm::mat4(1.0f));
        expect(frame->instances[0].stencilRef == 1_u);
    };

    "tiny determinant counts as singular"_test = [] {
        StencilRecord rec;
        setStencilTransform(rec, scaled(1e-6f, 1e-6f));
        expect(rec.transformInvertible == 0_u);
        setStencilTransform(rec, scaled(1e-3f, 1e-3f));
        expect(rec.transformInvertible == 1_u);
    };

    "texture format mismatch fails"_test = [] {
        RenderNode root;
        root.withTexture(stencilRegion(), scaled(1.0f, 1.0f));
        expect(!FrameBuilder::build(root).has_value());
    };

    "stencil format mismatch fails"_test = [] {
        RenderNode root;
        root.withStencil(textureRegion(), scaled(1.0f, 1.0f));
        expect(!FrameBuilder::build(root).has_value());
    };

    "textures from two atlases fail"_test = [] {
        RenderNode a;
        a.withTexture(textureRegion(0, 1), scaled(1.0f, 1.0f));
        RenderNode b;
        b.withTexture(textureRegion(0, 9), scaled(1.0f, 1.0f));
        RenderNode root;
        root.addChild(std::move(a), glm::mat4(1.0f));
        root.addChild(std::move(b), glm::mat4(1.0f));

        auto frame = FrameBuilder::build(root);
        expect(!frame.has_value());
        expect(error_msg(frame).find("atlas id") != std::string::npos);
    };

    "unnormalized region fails"_test = [] {
        AtlasRegion bad = textureRegion();
        bad.offset = {0.9f, 0.0f};
        RenderNode root;
        root.withTexture(bad, scaled(1.0f, 1.0f));
        expect(!FrameBuilder::build(root).has_value());
    };
};

suite normalize_matrix_tests = [] {

    "pixel corners map to clip corners"_test = [] {
        glm::mat4 n = makeNormalizeMatrix(800.0f, 600.0f);
        expect(near(n * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), glm::vec4(-1.0f, 1.0f, 0.0f, 1.0f)));
        expect(near(n * glm::vec4(800.0f, 600.0f, 0.0f, 1.0f), glm::vec4(1.0f, -1.0f, 0.0f, 1.0f)));
        expect(near(n * glm::vec4(400.0f, 300.0f, 0.0f, 1.0f), glm::vec4(0.0f, 0.0f, 0.0f, 1.0f)));
    };
};

suite validate_frame_tests = [] {

    "valid frame passes"_test = [] {
        RenderNode root;
        root.withStencil(stencilRegion(), scaled(10.0f, 10.0f))
            .withTexture(textureRegion(), scaled(10.0f, 10.0f));
        auto frame = FrameBuilder::build(root);
        expect(validateFrame(*frame, 1).has_value());
    };

    "capacity below instance count fails"_test = [] {
        FrameData frame;
        frame.instances.resize(3);
        expect(!validateFrame(frame, 2).has_value());
        expect(validateFrame(frame, 3).has_value());
    };

    "stencil ref past the stencil list fails"_test = [] {
        FrameData frame;
        frame.instances.resize(1);
        frame.instances[0].stencilRef = 1;
        expect(!validateFrame(frame, 1).has_value());
        frame.stencils.resize(1);
        expect(validateFrame(frame, 1).has_value());
    };

    "atlas rectangle outside [0,1] fails"_test = [] {
        FrameData frame;
        frame.stencils.resize(1);
        frame.stencils[0].atlasSize = {1.5f, 1.0f};
        expect(!validateFrame(frame, 0).has_value());
    };

    "record defaults"_test = [] {
        InstanceRecord inst;
        StencilRecord st;
        FrameUniforms uniforms;
        expect(inst.transform == glm::mat4(1.0f));
        expect(inst.stencilRef == 0_u);
        expect(st.transformInvertible == 1_u);
        expect(uniforms.cullEnabled == 1_u);
        expect(uniforms.stencilCount == 1_u);
    };
};
