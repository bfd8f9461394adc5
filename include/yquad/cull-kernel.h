#pragma once

#include <yquad/frame-builder.h>
#include <yquad/gpu-records.h>
#include <yquad/overlap.h>
#include <yquad/result.hpp>
#include <atomic>
#include <cstdint>
#include <vector>

namespace yquad {

//-----------------------------------------------------------------------------
// Per-dispatch parameters (the FrameUniforms of the GPU path)
//-----------------------------------------------------------------------------
struct CullParams {
    glm::mat4 normalize{1.0f};
    bool cullEnabled = true;
};

struct CullStats {
    uint32_t instanceCount = 0;
    uint32_t visibleCount = 0;
    uint32_t workgroups = 0;
    uint32_t clampedStencilRefs = 0;  // out-of-range refs seen by the kernel
};

// Identity stencil bound when a frame has no stencils. Not invertible, so it
// never masks.
const StencilRecord& defaultStencilRecord();

// Stencil index used by the kernel for `stencilRef` (clamped to the last
// stencil). Sets `clamped` when the ref was out of range.
uint32_t resolveStencilIndex(uint32_t stencilRef, size_t stencilCount, bool& clamped);

// Visibility predicate for one instance, identical to quad-cull.wgsl
bool isInstanceVisible(const FrameData& frame, const CullParams& params,
                       uint32_t index, bool& clampedStencil);

//-----------------------------------------------------------------------------
// CullKernel - host emulation of quad-cull.wgsl
//
// Invocations are grouped into workgroups of CULL_WORKGROUP_SIZE and the
// workgroups are spread over worker threads. Visible indices are appended
// through `counter` with fetch_add, so order in `visible` is unspecified.
// The caller zeroes `counter` (a non-zero counter is rejected); `visible`
// must hold at least one slot per instance.
//-----------------------------------------------------------------------------
class CullKernel {
public:
    // threads == 0 selects std::thread::hardware_concurrency()
    explicit CullKernel(uint32_t threads = 0);

    Result<CullStats> run(const FrameData& frame, const CullParams& params,
                          std::vector<uint32_t>& visible,
                          std::atomic<uint32_t>& counter) const;

    uint32_t threads() const { return _threads; }

private:
    uint32_t _threads;
};

// quad-command.wgsl: {4, visibleCount, 0, 0}
DrawIndirectArgs writeIndirectArgs(uint32_t visibleCount);

} // namespace yquad
