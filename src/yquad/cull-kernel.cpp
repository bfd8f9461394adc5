#include <yquad/cull-kernel.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <string>
#include <thread>

namespace yquad {

const StencilRecord& defaultStencilRecord() {
    static const StencilRecord rec = [] {
        StencilRecord r;
        r.transformInvertible = 0;
        return r;
    }();
    return rec;
}

uint32_t resolveStencilIndex(uint32_t stencilRef, size_t stencilCount, bool& clamped) {
    clamped = false;
    uint32_t index = stencilRef - 1;
    uint32_t last = stencilCount == 0 ? 0 : static_cast<uint32_t>(stencilCount - 1);
    if (index > last || stencilCount == 0) {
        clamped = true;
        return last;
    }
    return index;
}

bool isInstanceVisible(const FrameData& frame, const CullParams& params,
                       uint32_t index, bool& clampedStencil) {
    clampedStencil = false;
    if (!params.cullEnabled) {
        return true;
    }

    const InstanceRecord& inst = frame.instances[index];
    const QuadCorners viewport = clipViewportQuad();
    const QuadCorners instQuad = transformQuad(params.normalize * inst.transform);

    if (!overlaps(instQuad, viewport)) {
        return false;
    }
    if (inst.stencilRef == 0) {
        return true;
    }

    uint32_t si = resolveStencilIndex(inst.stencilRef, frame.stencils.size(), clampedStencil);
    const StencilRecord& stencil =
        frame.stencils.empty() ? defaultStencilRecord() : frame.stencils[si];
    const QuadCorners stencilQuad = transformQuad(params.normalize * stencil.transform);

    return overlaps(stencilQuad, viewport) && overlaps(instQuad, stencilQuad);
}

//=============================================================================
// CullKernel
//=============================================================================

CullKernel::CullKernel(uint32_t threads) : _threads(threads) {
    if (_threads == 0) {
        _threads = std::max(1u, std::thread::hardware_concurrency());
    }
}

Result<CullStats> CullKernel::run(const FrameData& frame, const CullParams& params,
                                  std::vector<uint32_t>& visible,
                                  std::atomic<uint32_t>& counter) const {
    const uint32_t n = static_cast<uint32_t>(frame.instances.size());
    if (visible.size() < n) {
        return Err<CullStats>("CullKernel::run: visible buffer holds " +
                              std::to_string(visible.size()) + " slots, need " +
                              std::to_string(n));
    }
    if (counter.load(std::memory_order_acquire) != 0) {
        return Err<CullStats>("CullKernel::run: counter was not zeroed before dispatch");
    }

    CullStats stats;
    stats.instanceCount = n;
    stats.workgroups = (n + CULL_WORKGROUP_SIZE - 1) / CULL_WORKGROUP_SIZE;

    std::atomic<uint32_t> nextWorkgroup{0};
    std::atomic<uint32_t> clamped{0};

    auto worker = [&]() {
        for (;;) {
            uint32_t wg = nextWorkgroup.fetch_add(1, std::memory_order_relaxed);
            if (wg >= stats.workgroups) break;
            uint32_t begin = wg * CULL_WORKGROUP_SIZE;
            uint32_t end = std::min(n, begin + CULL_WORKGROUP_SIZE);
            for (uint32_t i = begin; i < end; ++i) {
                bool clampedRef = false;
                if (isInstanceVisible(frame, params, i, clampedRef)) {
                    uint32_t slot = counter.fetch_add(1, std::memory_order_relaxed);
                    visible[slot] = i;
                }
                if (clampedRef) {
                    clamped.fetch_add(1, std::memory_order_relaxed);
                }
            }
        }
    };

    const uint32_t workers = std::min(_threads, std::max(1u, stats.workgroups));
    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (uint32_t t = 0; t < workers; ++t) {
            pool.emplace_back(worker);
        }
        // Barrier: every invocation retires before the count is read
        for (auto& th : pool) {
            th.join();
        }
    }

    stats.visibleCount = counter.load(std::memory_order_acquire);
    stats.clampedStencilRefs = clamped.load();
    if (stats.clampedStencilRefs > 0) {
        ywarn("CullKernel: {} instance(s) referenced an out-of-range stencil",
              stats.clampedStencilRefs);
    }
    return Ok(stats);
}

DrawIndirectArgs writeIndirectArgs(uint32_t visibleCount) {
    DrawIndirectArgs args;
    args.vertexCount = QUAD_VERTEX_COUNT;
    args.instanceCount = visibleCount;
    args.firstVertex = 0;
    args.firstInstance = 0;
    return args;
}

} // namespace yquad
