#pragma once

#include <yquad/cull-kernel.h>
#include <yquad/draw-stage.h>
#include <yquad/frame-builder.h>
#include <yquad/result.hpp>
#include <atomic>
#include <vector>

namespace yquad {

//-----------------------------------------------------------------------------
// Frame stages
//
// Idle -> Ready -> Culled -> Commanded -> Drawn. A frame can be abandoned
// with reset() at any stage; a new frame begins from Idle or Drawn.
//-----------------------------------------------------------------------------
enum class FrameStage : uint8_t {
    Idle,
    Ready,      // records bound, counter zeroed
    Culled,     // visible list and counter final
    Commanded,  // indirect args written
    Drawn,
};

const char* frameStageName(FrameStage stage);

class StageTracker {
public:
    FrameStage stage() const { return _stage; }

    // Fails unless the current stage is `from`
    Result<void> advance(FrameStage from, FrameStage to);

    // Idle or Drawn -> Ready
    Result<void> beginFrame();

    void reset() { _stage = FrameStage::Idle; }

private:
    FrameStage _stage = FrameStage::Idle;
};

//-----------------------------------------------------------------------------
// DrawList - what the instanced draw produced on the host
//-----------------------------------------------------------------------------
struct DrawList {
    DrawIndirectArgs args;
    std::vector<uint32_t> instanceIndices;  // per drawn slot
    std::vector<QuadStrip> quads;           // vertex stage output per slot
};

//-----------------------------------------------------------------------------
// CpuFramePipeline - runs cull, command and draw on host threads
//
// The frame passed to begin() is borrowed and must stay alive and unmodified
// until the frame is drawn or reset.
//-----------------------------------------------------------------------------
class CpuFramePipeline {
public:
    struct Options {
        uint32_t threads = 0;   // 0 = hardware concurrency
        bool cullEnabled = true;
        bool validate = true;
    };

    CpuFramePipeline();
    explicit CpuFramePipeline(const Options& options);

    Result<void> begin(const FrameData& frame, const glm::mat4& normalize);
    Result<CullStats> cull();
    Result<DrawIndirectArgs> command();
    Result<DrawList> draw();
    void reset();

    // begin + cull + command + draw
    Result<DrawList> runFrame(const FrameData& frame, const glm::mat4& normalize);

    FrameStage stage() const { return _tracker.stage(); }
    uint32_t visibleCount() const { return _counter.load(std::memory_order_acquire); }

    // The first visibleCount() entries of the visible-index buffer
    std::vector<uint32_t> visibleIndices() const;

    const DrawIndirectArgs& indirectArgs() const { return _args; }

private:
    Options _options;
    CullKernel _kernel;
    StageTracker _tracker;

    const FrameData* _frame = nullptr;
    glm::mat4 _normalize{1.0f};
    std::vector<uint32_t> _visible;
    std::atomic<uint32_t> _counter{0};
    DrawIndirectArgs _args;
};

} // namespace yquad
