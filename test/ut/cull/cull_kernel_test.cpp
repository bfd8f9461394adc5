//=============================================================================
// CullKernel Unit Tests
//
// Host emulation of the culling and indirect-command kernels: visibility
// scenarios, compaction (no duplicates, no gaps, counter == list length),
// set equality across runs, stencil clamping and dispatch preconditions.
//=============================================================================

#include <boost/ut.hpp>
#include <yquad/cull-kernel.h>
#include <yquad/frame-builder.h>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <atomic>
#include <random>
#include <set>
#include <vector>

using namespace boost::ut;
using namespace yquad;

static glm::mat4 rectTransform(float x, float y, float w, float h) {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), glm::vec3(x, y, 0.0f));
    return glm::scale(m, glm::vec3(w, h, 1.0f));
}

static InstanceRecord instanceAt(const glm::mat4& transform, uint32_t stencilRef = 0) {
    InstanceRecord rec;
    rec.transform = transform;
    rec.stencilRef = stencilRef;
    return rec;
}

static StencilRecord stencilAt(const glm::mat4& transform) {
    StencilRecord rec;
    setStencilTransform(rec, transform);
    return rec;
}

// Random clip-space frame: about half the instances off screen, a third stenciled
static FrameData randomFrame(uint32_t count, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> pos(-3.0f, 3.0f);
    std::uniform_real_distribution<float> ext(0.05f, 1.0f);

    FrameData frame;
    for (int i = 0; i < 8; ++i) {
        frame.stencils.push_back(stencilAt(rectTransform(pos(rng), pos(rng), ext(rng) * 2, ext(rng) * 2)));
    }
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t ref = (i % 3 == 0) ? 1 + (i / 3) % 8 : 0;
        frame.instances.push_back(instanceAt(rectTransform(pos(rng), pos(rng), ext(rng), ext(rng)), ref));
    }
    return frame;
}

struct CullRun {
    Result<CullStats> stats;
    std::vector<uint32_t> visible;
};

static CullRun runKernel(const FrameData& frame, const CullParams& params, uint32_t threads) {
    CullKernel kernel(threads);
    std::vector<uint32_t> visible(frame.instances.size());
    std::atomic<uint32_t> counter{0};
    auto stats = kernel.run(frame, params, visible, counter);
    if (stats) {
        visible.resize(stats->visibleCount);
    }
    return {std::move(stats), std::move(visible)};
}

suite cull_scenario_tests = [] {

    "unit square at origin is visible once"_test = [] {
        FrameData frame;
        frame.instances.push_back(instanceAt(glm::mat4(1.0f)));

        auto run = runKernel(frame, CullParams{}, 1);
        expect(run.stats.has_value());
        expect(run.stats->visibleCount == 1_u);
        expect(run.visible.size() == 1_u);
        expect(run.visible[0] == 0_u);
    };

    "quad beyond x=2 is culled"_test = [] {
        FrameData frame;
        frame.instances.push_back(instanceAt(rectTransform(2.5f, -0.5f, 1.0f, 1.0f)));

        auto run = runKernel(frame, CullParams{}, 1);
        expect(run.stats.has_value());
        expect(run.stats->visibleCount == 0_u);
        expect(run.visible.empty());
    };

    "disjoint stencil culls an on-screen instance"_test = [] {
        FrameData frame;
        frame.stencils.push_back(stencilAt(rectTransform(0.3f, 0.3f, 0.5f, 0.5f)));
        frame.instances.push_back(instanceAt(rectTransform(-0.9f, -0.9f, 0.5f, 0.5f), 1));

        bool clamped = false;
        expect(!isInstanceVisible(frame, CullParams{}, 0, clamped));
        expect(!clamped);

        auto run = runKernel(frame, CullParams{}, 1);
        expect(run.stats->visibleCount == 0_u);
    };

    "overlapping stencil keeps the instance"_test = [] {
        FrameData frame;
        frame.stencils.push_back(stencilAt(rectTransform(-0.5f, -0.5f, 0.8f, 0.8f)));
        frame.instances.push_back(instanceAt(rectTransform(-0.9f, -0.9f, 0.6f, 0.6f), 1));

        auto run = runKernel(frame, CullParams{}, 1);
        expect(run.stats->visibleCount == 1_u);
    };

    "off-screen stencil culls an instance it overlaps"_test = [] {
        FrameData frame;
        frame.stencils.push_back(stencilAt(rectTransform(1.5f, 0.0f, 1.0f, 1.0f)));
        frame.instances.push_back(instanceAt(rectTransform(0.5f, 0.0f, 1.5f, 0.5f), 1));

        bool clamped = false;
        expect(!isInstanceVisible(frame, CullParams{}, 0, clamped));
    };

    "normalize matrix is applied before the viewport test"_test = [] {
        // 100x100 pixel quad at (50,50) on a 200x200 target
        FrameData frame;
        frame.instances.push_back(instanceAt(rectTransform(50.0f, 50.0f, 100.0f, 100.0f)));
        frame.instances.push_back(instanceAt(rectTransform(300.0f, 50.0f, 100.0f, 100.0f)));

        CullParams params;
        params.normalize = makeNormalizeMatrix(200.0f, 200.0f);
        auto run = runKernel(frame, params, 1);
        expect(run.stats->visibleCount == 1_u);
        expect(run.visible[0] == 0_u);
    };

    "without a stencil visibility is the viewport test"_test = [] {
        FrameData frame = randomFrame(400, 7);
        for (auto& inst : frame.instances) {
            inst.stencilRef = 0;
        }
        const CullParams params;
        for (uint32_t i = 0; i < frame.instances.size(); ++i) {
            bool clamped = false;
            bool expected = overlaps(transformQuad(params.normalize * frame.instances[i].transform),
                                     clipViewportQuad());
            expect(isInstanceVisible(frame, params, i, clamped) == expected) << "instance" << i;
        }
    };

    "disabled culling appends every instance"_test = [] {
        FrameData frame;
        frame.instances.push_back(instanceAt(rectTransform(5.0f, 5.0f, 1.0f, 1.0f)));
        frame.instances.push_back(instanceAt(glm::mat4(1.0f)));
        frame.instances.push_back(instanceAt(rectTransform(-9.0f, 0.0f, 1.0f, 1.0f)));

        CullParams params;
        params.cullEnabled = false;
        auto run = runKernel(frame, params, 2);
        expect(run.stats->visibleCount == 3_u);
        std::sort(run.visible.begin(), run.visible.end());
        expect(run.visible == std::vector<uint32_t>{0, 1, 2});
    };

    "empty frame dispatches nothing"_test = [] {
        FrameData frame;
        auto run = runKernel(frame, CullParams{}, 4);
        expect(run.stats.has_value());
        expect(run.stats->workgroups == 0_u);
        expect(run.stats->visibleCount == 0_u);
    };
};

suite cull_compaction_tests = [] {

    "visible list is exactly the visible set"_test = [] {
        FrameData frame = randomFrame(2000, 42);
        const CullParams params;

        std::set<uint32_t> expected;
        for (uint32_t i = 0; i < frame.instances.size(); ++i) {
            bool clamped = false;
            if (isInstanceVisible(frame, params, i, clamped)) {
                expected.insert(i);
            }
        }

        auto run = runKernel(frame, params, 8);
        expect(run.stats.has_value());
        expect(run.stats->instanceCount == 2000_u);
        expect(run.stats->workgroups == 32_u);
        expect(run.stats->visibleCount == run.visible.size());

        std::set<uint32_t> got(run.visible.begin(), run.visible.end());
        expect(got.size() == run.visible.size()) << "duplicate indices";
        expect(got == expected);
    };

    "two runs produce set-equal lists"_test = [] {
        FrameData frame = randomFrame(5000, 3);
        auto first = runKernel(frame, CullParams{}, 8);
        auto second = runKernel(frame, CullParams{}, 3);
        expect(first.stats.has_value() && second.stats.has_value());
        expect(first.stats->visibleCount == second.stats->visibleCount);

        std::sort(first.visible.begin(), first.visible.end());
        std::sort(second.visible.begin(), second.visible.end());
        expect(first.visible == second.visible);
    };

    "thread count does not change the result"_test = [] {
        FrameData frame = randomFrame(777, 11);
        auto serial = runKernel(frame, CullParams{}, 1);
        auto parallel = runKernel(frame, CullParams{}, 16);
        std::sort(serial.visible.begin(), serial.visible.end());
        std::sort(parallel.visible.begin(), parallel.visible.end());
        expect(serial.visible == parallel.visible);
    };

    "slots past the count are untouched"_test = [] {
        FrameData frame;
        frame.instances.push_back(instanceAt(glm::mat4(1.0f)));
        frame.instances.push_back(instanceAt(rectTransform(4.0f, 4.0f, 1.0f, 1.0f)));

        CullKernel kernel(1);
        std::vector<uint32_t> visible(2, 0xFFFFFFFFu);
        std::atomic<uint32_t> counter{0};
        auto stats = kernel.run(frame, CullParams{}, visible, counter);
        expect(stats.has_value());
        expect(counter.load() == 1_u);
        expect(visible[0] == 0_u);
        expect(visible[1] == 0xFFFFFFFFu);
    };
};

suite cull_contract_tests = [] {

    "counter must be zeroed"_test = [] {
        FrameData frame;
        frame.instances.push_back(instanceAt(glm::mat4(1.0f)));

        CullKernel kernel(1);
        std::vector<uint32_t> visible(1);
        std::atomic<uint32_t> counter{5};
        auto stats = kernel.run(frame, CullParams{}, visible, counter);
        expect(!stats.has_value());
        expect(counter.load() == 5_u);
    };

    "visible buffer must hold every instance"_test = [] {
        FrameData frame = randomFrame(10, 1);
        CullKernel kernel(1);
        std::vector<uint32_t> visible(9);
        std::atomic<uint32_t> counter{0};
        expect(!kernel.run(frame, CullParams{}, visible, counter).has_value());
    };

    "out-of-range stencil ref is clamped and counted"_test = [] {
        FrameData frame;
        frame.stencils.push_back(stencilAt(rectTransform(-1.0f, -1.0f, 2.0f, 2.0f)));
        frame.instances.push_back(instanceAt(rectTransform(-0.5f, -0.5f, 0.5f, 0.5f), 5));

        auto run = runKernel(frame, CullParams{}, 1);
        expect(run.stats.has_value());
        expect(run.stats->clampedStencilRefs == 1_u);
        // Clamped to the only stencil, which covers the instance
        expect(run.stats->visibleCount == 1_u);
        expect(!validateFrame(frame, 1).has_value());
    };

    "resolveStencilIndex"_test = [] {
        bool clamped = true;
        expect(resolveStencilIndex(1, 3, clamped) == 0_u);
        expect(!clamped);
        expect(resolveStencilIndex(3, 3, clamped) == 2_u);
        expect(!clamped);
        expect(resolveStencilIndex(4, 3, clamped) == 2_u);
        expect(clamped);
        expect(resolveStencilIndex(1, 0, clamped) == 0_u);
        expect(clamped);
    };

    "stencil ref without stencils uses the default record"_test = [] {
        FrameData frame;
        frame.instances.push_back(instanceAt(rectTransform(-0.6f, -0.6f, 0.5f, 0.5f), 1));

        bool clamped = false;
        // Default identity stencil covers [0,1]^2 and does not overlap the instance
        expect(!isInstanceVisible(frame, CullParams{}, 0, clamped));
        expect(clamped);
        expect(defaultStencilRecord().transformInvertible == 0_u);
    };
};

suite indirect_args_tests = [] {

    "args carry the visible count"_test = [] {
        auto args = writeIndirectArgs(17);
        expect(args.vertexCount == 4_u);
        expect(args.instanceCount == 17_u);
        expect(args.firstVertex == 0_u);
        expect(args.firstInstance == 0_u);
    };

    "instance count matches the compacted list"_test = [] {
        FrameData frame = randomFrame(300, 5);
        auto run = runKernel(frame, CullParams{}, 4);
        auto args = writeIndirectArgs(run.stats->visibleCount);
        expect(args.instanceCount == run.visible.size());
        expect(args.vertexCount == QUAD_VERTEX_COUNT);
    };
};
