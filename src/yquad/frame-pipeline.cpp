#include <yquad/frame-pipeline.h>
#include <ytrace/ytrace.hpp>
#include <string>

namespace yquad {

const char* frameStageName(FrameStage stage) {
    switch (stage) {
        case FrameStage::Idle: return "Idle";
        case FrameStage::Ready: return "Ready";
        case FrameStage::Culled: return "Culled";
        case FrameStage::Commanded: return "Commanded";
        case FrameStage::Drawn: return "Drawn";
    }
    return "Unknown";
}

//=============================================================================
// StageTracker
//=============================================================================

Result<void> StageTracker::advance(FrameStage from, FrameStage to) {
    if (_stage != from) {
        return Err(std::string("stage order violation: ") + frameStageName(to) +
                   " requires " + frameStageName(from) + ", frame is " +
                   frameStageName(_stage));
    }
    _stage = to;
    return Ok();
}

Result<void> StageTracker::beginFrame() {
    if (_stage != FrameStage::Idle && _stage != FrameStage::Drawn) {
        return Err(std::string("frame already in progress (") + frameStageName(_stage) +
                   "), reset before beginning a new one");
    }
    _stage = FrameStage::Ready;
    return Ok();
}

//=============================================================================
// CpuFramePipeline
//=============================================================================

CpuFramePipeline::CpuFramePipeline() : CpuFramePipeline(Options{}) {}

CpuFramePipeline::CpuFramePipeline(const Options& options)
    : _options(options)
    , _kernel(options.threads) {}

Result<void> CpuFramePipeline::begin(const FrameData& frame, const glm::mat4& normalize) {
    if (_visible.size() < frame.instances.size()) {
        _visible.resize(frame.instances.size());
    }
    if (_options.validate) {
        if (auto res = validateFrame(frame, _visible.size()); !res) {
            yerror("CpuFramePipeline::begin: {}", error_msg(res));
            return Err("CpuFramePipeline::begin: invalid frame", res);
        }
    }
    if (auto res = _tracker.beginFrame(); !res) {
        return res;
    }

    _frame = &frame;
    _normalize = normalize;
    _counter.store(0, std::memory_order_release);
    _args = DrawIndirectArgs{};
    return Ok();
}

Result<CullStats> CpuFramePipeline::cull() {
    if (auto res = _tracker.advance(FrameStage::Ready, FrameStage::Culled); !res) {
        return Err<CullStats>("CpuFramePipeline::cull", res);
    }

    CullParams params;
    params.normalize = _normalize;
    params.cullEnabled = _options.cullEnabled;

    auto stats = _kernel.run(*_frame, params, _visible, _counter);
    if (!stats) {
        _tracker.reset();
        return Err<CullStats>("CpuFramePipeline::cull: kernel failed", stats);
    }
    if (stats->clampedStencilRefs > 0) {
        yerror("CpuFramePipeline::cull: {} out-of-range stencil refs were clamped",
               stats->clampedStencilRefs);
    }
    ydebug("CpuFramePipeline::cull: {}/{} visible in {} workgroups",
           stats->visibleCount, stats->instanceCount, stats->workgroups);
    return stats;
}

Result<DrawIndirectArgs> CpuFramePipeline::command() {
    if (auto res = _tracker.advance(FrameStage::Culled, FrameStage::Commanded); !res) {
        return Err<DrawIndirectArgs>("CpuFramePipeline::command", res);
    }
    _args = writeIndirectArgs(_counter.load(std::memory_order_acquire));
    return Ok(_args);
}

Result<DrawList> CpuFramePipeline::draw() {
    if (auto res = _tracker.advance(FrameStage::Commanded, FrameStage::Drawn); !res) {
        return Err<DrawList>("CpuFramePipeline::draw", res);
    }

    DrawList list;
    list.args = _args;
    list.instanceIndices.reserve(_args.instanceCount);
    list.quads.reserve(_args.instanceCount);
    for (uint32_t slot = 0; slot < _args.instanceCount; ++slot) {
        QuadStrip strip;
        for (uint32_t v = 0; v < _args.vertexCount; ++v) {
            strip[v] = vertexStage(*_frame, _normalize, _visible, v, slot);
        }
        list.instanceIndices.push_back(_visible[slot]);
        list.quads.push_back(strip);
    }
    _frame = nullptr;
    return Ok(std::move(list));
}

void CpuFramePipeline::reset() {
    _tracker.reset();
    _frame = nullptr;
}

Result<DrawList> CpuFramePipeline::runFrame(const FrameData& frame, const glm::mat4& normalize) {
    if (auto res = begin(frame, normalize); !res) {
        return Err<DrawList>("CpuFramePipeline::runFrame", res);
    }
    if (auto res = cull(); !res) {
        return Err<DrawList>("CpuFramePipeline::runFrame", res);
    }
    if (auto res = command(); !res) {
        return Err<DrawList>("CpuFramePipeline::runFrame", res);
    }
    return draw();
}

std::vector<uint32_t> CpuFramePipeline::visibleIndices() const {
    uint32_t count = visibleCount();
    return std::vector<uint32_t>(_visible.begin(), _visible.begin() + count);
}

} // namespace yquad
