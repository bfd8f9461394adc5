#include <yquad/quad-renderer.h>
#include <yquad/cull-kernel.h>
#include <yquad/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace yquad {

namespace {

// maxComputeWorkgroupsPerDimension in the default limits
constexpr uint32_t MAX_WORKGROUPS_PER_DIMENSION = 65535;

constexpr uint32_t MIN_INSTANCE_CAPACITY = 64;

Result<std::string> loadShaderSource(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<std::string>("cannot open shader " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Ok(buffer.str());
}

} // namespace

//=============================================================================
// QuadRendererImpl
//=============================================================================

class QuadRendererImpl : public QuadRenderer {
public:
    QuadRendererImpl(WGPUDevice device, WGPUQueue queue, Options options) noexcept
        : _device(device)
        , _queue(queue)
        , _options(std::move(options)) {}

    ~QuadRendererImpl() override {
        for (auto& [format, pipeline] : _pipelineCache) {
            wgpuRenderPipelineRelease(pipeline);
        }
        _pipelineCache.clear();

        if (_atlasBindGroup) wgpuBindGroupRelease(_atlasBindGroup);
        releaseDataBindGroups();

        if (_instanceBuffer) wgpuBufferRelease(_instanceBuffer);
        if (_stencilBuffer) wgpuBufferRelease(_stencilBuffer);
        if (_visibleBuffer) wgpuBufferRelease(_visibleBuffer);
        if (_counterBuffer) wgpuBufferRelease(_counterBuffer);
        if (_indirectBuffer) wgpuBufferRelease(_indirectBuffer);
        if (_uniformBuffer) wgpuBufferRelease(_uniformBuffer);
        if (_sampler) wgpuSamplerRelease(_sampler);

        if (_cullPipeline) wgpuComputePipelineRelease(_cullPipeline);
        if (_commandPipeline) wgpuComputePipelineRelease(_commandPipeline);
        if (_cullPipelineLayout) wgpuPipelineLayoutRelease(_cullPipelineLayout);
        if (_commandPipelineLayout) wgpuPipelineLayoutRelease(_commandPipelineLayout);
        if (_drawPipelineLayout) wgpuPipelineLayoutRelease(_drawPipelineLayout);
        if (_cullLayout) wgpuBindGroupLayoutRelease(_cullLayout);
        if (_commandLayout) wgpuBindGroupLayoutRelease(_commandLayout);
        if (_drawDataLayout) wgpuBindGroupLayoutRelease(_drawDataLayout);
        if (_atlasLayout) wgpuBindGroupLayoutRelease(_atlasLayout);

        if (_cullModule) wgpuShaderModuleRelease(_cullModule);
        if (_commandModule) wgpuShaderModuleRelease(_commandModule);
        if (_drawModule) wgpuShaderModuleRelease(_drawModule);
    }

    Result<void> init() noexcept {
        if (!_device || !_queue) {
            return Err<void>("QuadRenderer: null device or queue");
        }

        auto cull = createShaderModule("quad-cull.wgsl", "QuadCullShader");
        if (!cull) return Err<void>("QuadRenderer: cull shader", cull);
        _cullModule = *cull;

        auto command = createShaderModule("quad-command.wgsl", "QuadCommandShader");
        if (!command) return Err<void>("QuadRenderer: command shader", command);
        _commandModule = *command;

        auto draw = createShaderModule("quad-draw.wgsl", "QuadDrawShader");
        if (!draw) return Err<void>("QuadRenderer: draw shader", draw);
        _drawModule = *draw;

        if (auto res = createBindGroupLayouts(); !res) return res;
        if (auto res = createComputePipelines(); !res) return res;
        if (auto res = createSampler(); !res) return res;
        if (auto res = createFixedBuffers(); !res) return res;

        yinfo("QuadRenderer: initialized (shaders from {}, culling {})",
              _options.shaderDir, _options.cullEnabled ? "on" : "off");
        return Ok();
    }

    //=========================================================================
    // Frame
    //=========================================================================

    Result<void> render(const FrameTarget& target, const FrameData& frame,
                        const AtlasViews& atlases,
                        const std::array<double, 4>& clearColor) override {
        if (!target.view || target.width == 0 || target.height == 0) {
            return Err<void>("QuadRenderer::render: invalid target");
        }

        const uint32_t instanceCount = static_cast<uint32_t>(frame.instances.size());
        const uint32_t stencilCount = static_cast<uint32_t>(frame.stencils.size());
        const WGPUColor clear = {clearColor[0], clearColor[1], clearColor[2], clearColor[3]};

        if (frame.empty()) {
            _lastInstanceCount = 0;
            _lastStencilCount = 0;
            ++_frames;
            return encodeClearOnly(target.view, clear);
        }

        if (!atlases.texture || !atlases.stencil) {
            return Err<void>("QuadRenderer::render: atlas views are required");
        }

        const uint32_t workgroups = (instanceCount + CULL_WORKGROUP_SIZE - 1) / CULL_WORKGROUP_SIZE;
        if (workgroups > MAX_WORKGROUPS_PER_DIMENSION) {
            return Err<void>("QuadRenderer::render: " + std::to_string(instanceCount) +
                             " instances exceed the dispatch limit");
        }

        auto pipeline = getRenderPipeline(target.format);
        if (!pipeline) {
            return Err<void>("QuadRenderer::render: no pipeline for target format", pipeline);
        }

        if (auto res = ensureCapacity(instanceCount, std::max(1u, stencilCount)); !res) {
            return Err<void>("QuadRenderer::render: buffer growth failed", res);
        }

        if (_options.validate) {
            if (auto res = validateFrame(frame, _instanceCapacity); !res) {
                yerror("QuadRenderer::render: {}", error_msg(res));
                return Err<void>("QuadRenderer::render: invalid frame", res);
            }
        }

        if (auto res = updateAtlasBindGroup(atlases); !res) {
            return res;
        }

        // Upload
        FrameUniforms uniforms;
        uniforms.normalize = makeNormalizeMatrix(static_cast<float>(target.width),
                                                 static_cast<float>(target.height));
        uniforms.instanceCount = instanceCount;
        uniforms.cullEnabled = _options.cullEnabled ? 1u : 0u;
        uniforms.stencilCount = std::max(1u, stencilCount);
        wgpuQueueWriteBuffer(_queue, _uniformBuffer, 0, &uniforms, sizeof(uniforms));

        wgpuQueueWriteBuffer(_queue, _instanceBuffer, 0, frame.instances.data(),
                             frame.instances.size() * sizeof(InstanceRecord));
        if (stencilCount > 0) {
            wgpuQueueWriteBuffer(_queue, _stencilBuffer, 0, frame.stencils.data(),
                                 frame.stencils.size() * sizeof(StencilRecord));
        } else {
            const StencilRecord& fallback = defaultStencilRecord();
            wgpuQueueWriteBuffer(_queue, _stencilBuffer, 0, &fallback, sizeof(StencilRecord));
        }

        WGPUCommandEncoderDescriptor encDesc = {};
        encDesc.label = WGPU_STR("QuadFrameEncoder");
        WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, &encDesc);
        if (!encoder) {
            return Err<void>("QuadRenderer: failed to create command encoder");
        }

        // Counter starts every frame at zero
        wgpuCommandEncoderClearBuffer(encoder, _counterBuffer, 0, sizeof(uint32_t));

        // Cull pass
        {
            WGPUComputePassDescriptor passDesc = {};
            passDesc.label = WGPU_STR("QuadCullPass");
            WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
            wgpuComputePassEncoderSetPipeline(pass, _cullPipeline);
            wgpuComputePassEncoderSetBindGroup(pass, 0, _cullBindGroup, 0, nullptr);
            wgpuComputePassEncoderDispatchWorkgroups(pass, workgroups, 1, 1);
            wgpuComputePassEncoderEnd(pass);
            wgpuComputePassEncoderRelease(pass);
        }

        // Command pass; the pass boundary orders it after every cull invocation
        {
            WGPUComputePassDescriptor passDesc = {};
            passDesc.label = WGPU_STR("QuadCommandPass");
            WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
            wgpuComputePassEncoderSetPipeline(pass, _commandPipeline);
            wgpuComputePassEncoderSetBindGroup(pass, 0, _commandBindGroup, 0, nullptr);
            wgpuComputePassEncoderDispatchWorkgroups(pass, 1, 1, 1);
            wgpuComputePassEncoderEnd(pass);
            wgpuComputePassEncoderRelease(pass);
        }

        // Draw pass
        {
            WGPURenderPassColorAttachment colorAttachment = {};
            colorAttachment.view = target.view;
            colorAttachment.loadOp = WGPULoadOp_Clear;
            colorAttachment.storeOp = WGPUStoreOp_Store;
            colorAttachment.clearValue = clear;
            colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;

            WGPURenderPassDescriptor passDesc = {};
            passDesc.label = WGPU_STR("QuadDrawPass");
            passDesc.colorAttachmentCount = 1;
            passDesc.colorAttachments = &colorAttachment;

            WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
            if (!pass) {
                wgpuCommandEncoderRelease(encoder);
                return Err<void>("QuadRenderer: failed to begin render pass");
            }
            wgpuRenderPassEncoderSetPipeline(pass, *pipeline);
            wgpuRenderPassEncoderSetBindGroup(pass, 0, _drawDataBindGroup, 0, nullptr);
            wgpuRenderPassEncoderSetBindGroup(pass, 1, _atlasBindGroup, 0, nullptr);
            wgpuRenderPassEncoderDrawIndirect(pass, _indirectBuffer, 0);
            wgpuRenderPassEncoderEnd(pass);
            wgpuRenderPassEncoderRelease(pass);
        }

        if (auto res = submit(encoder, "QuadFrameCommands"); !res) {
            return res;
        }

        _lastInstanceCount = instanceCount;
        _lastStencilCount = stencilCount;
        ++_frames;
        ydebug("QuadRenderer::render: {} instances, {} stencils, {} workgroups",
               instanceCount, stencilCount, workgroups);
        return Ok();
    }

    Result<CullReadback> readbackCullResult() override {
        if (_frames == 0) {
            return Err<CullReadback>("QuadRenderer::readbackCullResult: nothing rendered yet");
        }

        // [args 16][counter 4][visible n*4]
        const uint64_t argsOffset = 0;
        const uint64_t counterOffset = sizeof(DrawIndirectArgs);
        const uint64_t visibleOffset = counterOffset + sizeof(uint32_t);
        const uint64_t visibleBytes = uint64_t(_lastInstanceCount) * sizeof(uint32_t);
        const uint64_t totalBytes = visibleOffset + visibleBytes;

        auto readback = createBuffer("QuadCullReadback", totalBytes,
                                     WGPUBufferUsage_MapRead | WGPUBufferUsage_CopyDst);
        if (!readback) {
            return Err<CullReadback>("QuadRenderer::readbackCullResult", readback);
        }
        WGPUBuffer buffer = *readback;

        WGPUCommandEncoderDescriptor encDesc = {};
        encDesc.label = WGPU_STR("QuadReadbackEncoder");
        WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, &encDesc);
        if (!encoder) {
            wgpuBufferRelease(buffer);
            return Err<CullReadback>("QuadRenderer: failed to create command encoder");
        }
        wgpuCommandEncoderCopyBufferToBuffer(encoder, _indirectBuffer, 0, buffer, argsOffset,
                                             sizeof(DrawIndirectArgs));
        wgpuCommandEncoderCopyBufferToBuffer(encoder, _counterBuffer, 0, buffer, counterOffset,
                                             sizeof(uint32_t));
        if (visibleBytes > 0) {
            wgpuCommandEncoderCopyBufferToBuffer(encoder, _visibleBuffer, 0, buffer, visibleOffset,
                                                 visibleBytes);
        }
        if (auto res = submit(encoder, "QuadReadbackCommands"); !res) {
            wgpuBufferRelease(buffer);
            return Err<CullReadback>("QuadRenderer::readbackCullResult", res);
        }

        // Map synchronously
        struct MapCtx { bool done = false; WGPUMapAsyncStatus status = WGPUMapAsyncStatus_Error; };
        MapCtx mapCtx;
        WGPUBufferMapCallbackInfo cbInfo = {};
        cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
        cbInfo.callback = [](WGPUMapAsyncStatus status, WGPUStringView, void* ud1, void*) {
            auto* ctx = static_cast<MapCtx*>(ud1);
            ctx->status = status;
            ctx->done = true;
        };
        cbInfo.userdata1 = &mapCtx;

        wgpuBufferMapAsync(buffer, WGPUMapMode_Read, 0, totalBytes, cbInfo);
        while (!mapCtx.done) {
            WGPU_DEVICE_TICK(_device);
        }

        if (mapCtx.status != WGPUMapAsyncStatus_Success) {
            wgpuBufferRelease(buffer);
            return Err<CullReadback>("QuadRenderer::readbackCullResult: map failed (status " +
                                     std::to_string(static_cast<int>(mapCtx.status)) + ")");
        }

        const auto* mapped = static_cast<const uint8_t*>(
            wgpuBufferGetConstMappedRange(buffer, 0, totalBytes));
        if (!mapped) {
            wgpuBufferUnmap(buffer);
            wgpuBufferRelease(buffer);
            return Err<CullReadback>("QuadRenderer::readbackCullResult: no mapped range");
        }

        CullReadback result;
        std::memcpy(&result.args, mapped + argsOffset, sizeof(DrawIndirectArgs));
        std::memcpy(&result.visibleCount, mapped + counterOffset, sizeof(uint32_t));
        uint32_t count = std::min(result.visibleCount, _lastInstanceCount);
        result.visibleIndices.resize(count);
        if (count > 0) {
            std::memcpy(result.visibleIndices.data(), mapped + visibleOffset,
                        count * sizeof(uint32_t));
        }

        wgpuBufferUnmap(buffer);
        wgpuBufferRelease(buffer);
        return Ok(std::move(result));
    }

    void setCullingEnabled(bool enabled) override { _options.cullEnabled = enabled; }
    bool cullingEnabled() const override { return _options.cullEnabled; }

    Stats getStats() const override {
        return Stats{
            .frames = _frames,
            .lastInstanceCount = _lastInstanceCount,
            .lastStencilCount = _lastStencilCount,
            .instanceCapacity = _instanceCapacity,
            .stencilCapacity = _stencilCapacity,
            .cachedPipelines = _pipelineCache.size()
        };
    }

private:
    //=========================================================================
    // Setup
    //=========================================================================

    Result<WGPUShaderModule> createShaderModule(const char* file, const char* label) {
        std::string path = _options.shaderDir + "/" + file;
        yinfo("QuadRenderer: loading shader {}", path);

        auto source = loadShaderSource(path);
        if (!source) {
            return Err<WGPUShaderModule>("QuadRenderer: shader source", source);
        }

        WGPUShaderSourceWGSL wgslDesc = {};
        wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
        WGPU_SHADER_CODE(wgslDesc, *source);

        WGPUShaderModuleDescriptor moduleDesc = {};
        moduleDesc.nextInChain = &wgslDesc.chain;
        moduleDesc.label = WGPU_STR(label);

        WGPUShaderModule module = wgpuDeviceCreateShaderModule(_device, &moduleDesc);
        if (!module) {
            return Err<WGPUShaderModule>(std::string("failed to compile ") + file);
        }
        return Ok(module);
    }

    Result<void> createBindGroupLayouts() {
        // Cull: uniforms, instances, stencils, visible (rw), counter (rw)
        {
            std::array<WGPUBindGroupLayoutEntry, 5> entries = {};
            const WGPUBufferBindingType types[5] = {
                WGPUBufferBindingType_Uniform,
                WGPUBufferBindingType_ReadOnlyStorage,
                WGPUBufferBindingType_ReadOnlyStorage,
                WGPUBufferBindingType_Storage,
                WGPUBufferBindingType_Storage,
            };
            for (uint32_t i = 0; i < entries.size(); ++i) {
                entries[i].binding = i;
                entries[i].visibility = WGPUShaderStage_Compute;
                entries[i].buffer.type = types[i];
            }

            WGPUBindGroupLayoutDescriptor layoutDesc = {};
            layoutDesc.label = WGPU_STR("QuadCullLayout");
            layoutDesc.entryCount = entries.size();
            layoutDesc.entries = entries.data();
            _cullLayout = wgpuDeviceCreateBindGroupLayout(_device, &layoutDesc);
            if (!_cullLayout) {
                return Err<void>("QuadRenderer: failed to create cull bind group layout");
            }
        }

        // Command: counter (read), indirect args (rw)
        {
            std::array<WGPUBindGroupLayoutEntry, 2> entries = {};
            entries[0].binding = 0;
            entries[0].visibility = WGPUShaderStage_Compute;
            entries[0].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;

            entries[1].binding = 1;
            entries[1].visibility = WGPUShaderStage_Compute;
            entries[1].buffer.type = WGPUBufferBindingType_Storage;

            WGPUBindGroupLayoutDescriptor layoutDesc = {};
            layoutDesc.label = WGPU_STR("QuadCommandLayout");
            layoutDesc.entryCount = entries.size();
            layoutDesc.entries = entries.data();
            _commandLayout = wgpuDeviceCreateBindGroupLayout(_device, &layoutDesc);
            if (!_commandLayout) {
                return Err<void>("QuadRenderer: failed to create command bind group layout");
            }
        }

        // Draw group 0: uniforms, instances, stencils, visible (all read-only)
        {
            std::array<WGPUBindGroupLayoutEntry, 4> entries = {};
            for (uint32_t i = 0; i < entries.size(); ++i) {
                entries[i].binding = i;
                entries[i].visibility = WGPUShaderStage_Vertex;
                entries[i].buffer.type = i == 0 ? WGPUBufferBindingType_Uniform
                                                : WGPUBufferBindingType_ReadOnlyStorage;
            }

            WGPUBindGroupLayoutDescriptor layoutDesc = {};
            layoutDesc.label = WGPU_STR("QuadDrawDataLayout");
            layoutDesc.entryCount = entries.size();
            layoutDesc.entries = entries.data();
            _drawDataLayout = wgpuDeviceCreateBindGroupLayout(_device, &layoutDesc);
            if (!_drawDataLayout) {
                return Err<void>("QuadRenderer: failed to create draw data bind group layout");
            }
        }

        // Draw group 1: sampler, texture atlas, stencil atlas
        {
            std::array<WGPUBindGroupLayoutEntry, 3> entries = {};
            entries[0].binding = 0;
            entries[0].visibility = WGPUShaderStage_Fragment;
            entries[0].sampler.type = WGPUSamplerBindingType_Filtering;

            for (uint32_t i = 1; i < 3; ++i) {
                entries[i].binding = i;
                entries[i].visibility = WGPUShaderStage_Fragment;
                entries[i].texture.sampleType = WGPUTextureSampleType_Float;
                entries[i].texture.viewDimension = WGPUTextureViewDimension_2DArray;
                entries[i].texture.multisampled = false;
            }

            WGPUBindGroupLayoutDescriptor layoutDesc = {};
            layoutDesc.label = WGPU_STR("QuadAtlasLayout");
            layoutDesc.entryCount = entries.size();
            layoutDesc.entries = entries.data();
            _atlasLayout = wgpuDeviceCreateBindGroupLayout(_device, &layoutDesc);
            if (!_atlasLayout) {
                return Err<void>("QuadRenderer: failed to create atlas bind group layout");
            }
        }

        WGPUPipelineLayoutDescriptor plDesc = {};
        plDesc.bindGroupLayoutCount = 1;
        plDesc.bindGroupLayouts = &_cullLayout;
        _cullPipelineLayout = wgpuDeviceCreatePipelineLayout(_device, &plDesc);

        plDesc.bindGroupLayouts = &_commandLayout;
        _commandPipelineLayout = wgpuDeviceCreatePipelineLayout(_device, &plDesc);

        WGPUBindGroupLayout drawLayouts[2] = {_drawDataLayout, _atlasLayout};
        plDesc.bindGroupLayoutCount = 2;
        plDesc.bindGroupLayouts = drawLayouts;
        _drawPipelineLayout = wgpuDeviceCreatePipelineLayout(_device, &plDesc);

        if (!_cullPipelineLayout || !_commandPipelineLayout || !_drawPipelineLayout) {
            return Err<void>("QuadRenderer: failed to create pipeline layouts");
        }
        return Ok();
    }

    Result<void> createComputePipelines() {
        WGPUComputePipelineDescriptor pipelineDesc = {};
        pipelineDesc.label = WGPU_STR("QuadCullPipeline");
        pipelineDesc.layout = _cullPipelineLayout;
        pipelineDesc.compute.module = _cullModule;
        pipelineDesc.compute.entryPoint = WGPU_STR("cull_main");
        _cullPipeline = wgpuDeviceCreateComputePipeline(_device, &pipelineDesc);
        if (!_cullPipeline) {
            return Err<void>("QuadRenderer: failed to create cull pipeline");
        }

        pipelineDesc.label = WGPU_STR("QuadCommandPipeline");
        pipelineDesc.layout = _commandPipelineLayout;
        pipelineDesc.compute.module = _commandModule;
        pipelineDesc.compute.entryPoint = WGPU_STR("command_main");
        _commandPipeline = wgpuDeviceCreateComputePipeline(_device, &pipelineDesc);
        if (!_commandPipeline) {
            return Err<void>("QuadRenderer: failed to create command pipeline");
        }

        ydebug("QuadRenderer: compute pipelines created");
        return Ok();
    }

    Result<void> createSampler() {
        WGPUSamplerDescriptor samplerDesc = {};
        samplerDesc.label = WGPU_STR("QuadAtlasSampler");
        samplerDesc.minFilter = WGPUFilterMode_Linear;
        samplerDesc.magFilter = WGPUFilterMode_Linear;
        samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
        samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
        samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
        samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
        samplerDesc.lodMinClamp = 0.0f;
        samplerDesc.lodMaxClamp = 32.0f;
        samplerDesc.maxAnisotropy = 1;

        _sampler = wgpuDeviceCreateSampler(_device, &samplerDesc);
        if (!_sampler) {
            return Err<void>("QuadRenderer: failed to create atlas sampler");
        }
        return Ok();
    }

    Result<void> createFixedBuffers() {
        auto uniforms = createBuffer("QuadFrameUniforms", sizeof(FrameUniforms),
                                     WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst);
        if (!uniforms) return Err<void>("QuadRenderer", uniforms);
        _uniformBuffer = *uniforms;

        auto counter = createBuffer("QuadVisibleCounter", sizeof(uint32_t),
                                    WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst |
                                    WGPUBufferUsage_CopySrc);
        if (!counter) return Err<void>("QuadRenderer", counter);
        _counterBuffer = *counter;

        auto indirect = createBuffer("QuadDrawIndirect", sizeof(DrawIndirectArgs),
                                     WGPUBufferUsage_Storage | WGPUBufferUsage_Indirect |
                                     WGPUBufferUsage_CopyDst | WGPUBufferUsage_CopySrc);
        if (!indirect) return Err<void>("QuadRenderer", indirect);
        _indirectBuffer = *indirect;

        return Ok();
    }

    Result<WGPUBuffer> createBuffer(const char* label, uint64_t size, WGPUBufferUsage usage) {
        WGPUBufferDescriptor bufDesc = {};
        bufDesc.label = WGPU_STR(label);
        bufDesc.size = size;
        bufDesc.usage = usage;
        bufDesc.mappedAtCreation = false;

        WGPUBuffer buffer = wgpuDeviceCreateBuffer(_device, &bufDesc);
        if (!buffer) {
            yerror("GPU_ALLOC QuadRenderer: failed to create {} ({} bytes)", label, size);
            return Err<WGPUBuffer>(std::string("failed to create buffer ") + label);
        }
        ydebug("GPU_ALLOC QuadRenderer: {} = {} bytes", label, size);
        return Ok(buffer);
    }

    //=========================================================================
    // Render pipeline cache
    //=========================================================================

    Result<WGPURenderPipeline> getRenderPipeline(WGPUTextureFormat format) {
        auto it = std::find_if(_pipelineCache.begin(), _pipelineCache.end(),
                               [format](const auto& entry) { return entry.first == format; });
        if (it != _pipelineCache.end()) {
            // Most recently used lives at the back
            auto entry = *it;
            _pipelineCache.erase(it);
            _pipelineCache.push_back(entry);
            return Ok(entry.second);
        }

        auto created = createRenderPipeline(format);
        if (!created) {
            return created;
        }

        if (_pipelineCache.size() >= MAX_CACHED_PIPELINES) {
            ydebug("QuadRenderer: evicting pipeline for format {}",
                   static_cast<int>(_pipelineCache.front().first));
            wgpuRenderPipelineRelease(_pipelineCache.front().second);
            _pipelineCache.erase(_pipelineCache.begin());
        }
        _pipelineCache.emplace_back(format, *created);
        return created;
    }

    Result<WGPURenderPipeline> createRenderPipeline(WGPUTextureFormat format) {
        WGPURenderPipelineDescriptor pipelineDesc = {};
        pipelineDesc.label = WGPU_STR("QuadDrawPipeline");
        pipelineDesc.layout = _drawPipelineLayout;

        // Vertex state: no vertex buffers, geometry comes from storage
        pipelineDesc.vertex.module = _drawModule;
        pipelineDesc.vertex.entryPoint = WGPU_STR("vs_main");
        pipelineDesc.vertex.bufferCount = 0;

        // Fragment state with alpha blending
        WGPUBlendState blend = {};
        blend.color.srcFactor = WGPUBlendFactor_SrcAlpha;
        blend.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
        blend.color.operation = WGPUBlendOperation_Add;
        blend.alpha.srcFactor = WGPUBlendFactor_One;
        blend.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
        blend.alpha.operation = WGPUBlendOperation_Add;

        WGPUColorTargetState colorTarget = {};
        colorTarget.format = format;
        colorTarget.blend = &blend;
        colorTarget.writeMask = WGPUColorWriteMask_All;

        WGPUFragmentState fragState = {};
        fragState.module = _drawModule;
        fragState.entryPoint = WGPU_STR("fs_main");
        fragState.targetCount = 1;
        fragState.targets = &colorTarget;
        pipelineDesc.fragment = &fragState;

        pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleStrip;
        pipelineDesc.primitive.stripIndexFormat = WGPUIndexFormat_Undefined;
        pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
        pipelineDesc.primitive.cullMode = WGPUCullMode_None;

        pipelineDesc.multisample.count = 1;
        pipelineDesc.multisample.mask = 0xFFFFFFFF;

        WGPURenderPipeline pipeline = wgpuDeviceCreateRenderPipeline(_device, &pipelineDesc);
        if (!pipeline) {
            return Err<WGPURenderPipeline>("QuadRenderer: failed to create render pipeline for format " +
                                           std::to_string(static_cast<int>(format)));
        }
        yinfo("QuadRenderer: render pipeline created for format {}", static_cast<int>(format));
        return Ok(pipeline);
    }

    //=========================================================================
    // Buffers and bind groups
    //=========================================================================

    Result<void> ensureCapacity(uint32_t instances, uint32_t stencils) {
        bool stale = !_cullBindGroup;

        if (instances > _instanceCapacity) {
            uint32_t newCap = std::max(instances, _instanceCapacity == 0
                                                      ? MIN_INSTANCE_CAPACITY
                                                      : _instanceCapacity * 2);
            auto inst = createBuffer("QuadInstances", uint64_t(newCap) * sizeof(InstanceRecord),
                                     WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst);
            if (!inst) return Err<void>("QuadRenderer::ensureCapacity", inst);
            auto vis = createBuffer("QuadVisibleIndices", uint64_t(newCap) * sizeof(uint32_t),
                                    WGPUBufferUsage_Storage | WGPUBufferUsage_CopySrc);
            if (!vis) {
                wgpuBufferRelease(*inst);
                return Err<void>("QuadRenderer::ensureCapacity", vis);
            }

            if (_instanceBuffer) wgpuBufferRelease(_instanceBuffer);
            if (_visibleBuffer) wgpuBufferRelease(_visibleBuffer);
            _instanceBuffer = *inst;
            _visibleBuffer = *vis;
            yinfo("QuadRenderer: instance capacity {} -> {}", _instanceCapacity, newCap);
            _instanceCapacity = newCap;
            stale = true;
        }

        if (stencils > _stencilCapacity) {
            uint32_t newCap = std::max(stencils, _stencilCapacity == 0 ? 16u : _stencilCapacity * 2);
            auto st = createBuffer("QuadStencils", uint64_t(newCap) * sizeof(StencilRecord),
                                   WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst);
            if (!st) return Err<void>("QuadRenderer::ensureCapacity", st);

            if (_stencilBuffer) wgpuBufferRelease(_stencilBuffer);
            _stencilBuffer = *st;
            yinfo("QuadRenderer: stencil capacity {} -> {}", _stencilCapacity, newCap);
            _stencilCapacity = newCap;
            stale = true;
        }

        if (stale) {
            return rebuildDataBindGroups();
        }
        return Ok();
    }

    void releaseDataBindGroups() {
        if (_cullBindGroup) {
            wgpuBindGroupRelease(_cullBindGroup);
            _cullBindGroup = nullptr;
        }
        if (_commandBindGroup) {
            wgpuBindGroupRelease(_commandBindGroup);
            _commandBindGroup = nullptr;
        }
        if (_drawDataBindGroup) {
            wgpuBindGroupRelease(_drawDataBindGroup);
            _drawDataBindGroup = nullptr;
        }
    }

    static WGPUBindGroupEntry bufferEntry(uint32_t binding, WGPUBuffer buffer, uint64_t size) {
        WGPUBindGroupEntry entry = {};
        entry.binding = binding;
        entry.buffer = buffer;
        entry.offset = 0;
        entry.size = size;
        return entry;
    }

    Result<void> rebuildDataBindGroups() {
        releaseDataBindGroups();

        const uint64_t instanceBytes = uint64_t(_instanceCapacity) * sizeof(InstanceRecord);
        const uint64_t stencilBytes = uint64_t(_stencilCapacity) * sizeof(StencilRecord);
        const uint64_t visibleBytes = uint64_t(_instanceCapacity) * sizeof(uint32_t);

        std::array<WGPUBindGroupEntry, 5> cullEntries = {
            bufferEntry(0, _uniformBuffer, sizeof(FrameUniforms)),
            bufferEntry(1, _instanceBuffer, instanceBytes),
            bufferEntry(2, _stencilBuffer, stencilBytes),
            bufferEntry(3, _visibleBuffer, visibleBytes),
            bufferEntry(4, _counterBuffer, sizeof(uint32_t)),
        };
        WGPUBindGroupDescriptor bgDesc = {};
        bgDesc.label = WGPU_STR("QuadCullBindGroup");
        bgDesc.layout = _cullLayout;
        bgDesc.entryCount = cullEntries.size();
        bgDesc.entries = cullEntries.data();
        _cullBindGroup = wgpuDeviceCreateBindGroup(_device, &bgDesc);

        std::array<WGPUBindGroupEntry, 2> commandEntries = {
            bufferEntry(0, _counterBuffer, sizeof(uint32_t)),
            bufferEntry(1, _indirectBuffer, sizeof(DrawIndirectArgs)),
        };
        bgDesc.label = WGPU_STR("QuadCommandBindGroup");
        bgDesc.layout = _commandLayout;
        bgDesc.entryCount = commandEntries.size();
        bgDesc.entries = commandEntries.data();
        _commandBindGroup = wgpuDeviceCreateBindGroup(_device, &bgDesc);

        std::array<WGPUBindGroupEntry, 4> drawEntries = {
            bufferEntry(0, _uniformBuffer, sizeof(FrameUniforms)),
            bufferEntry(1, _instanceBuffer, instanceBytes),
            bufferEntry(2, _stencilBuffer, stencilBytes),
            bufferEntry(3, _visibleBuffer, visibleBytes),
        };
        bgDesc.label = WGPU_STR("QuadDrawDataBindGroup");
        bgDesc.layout = _drawDataLayout;
        bgDesc.entryCount = drawEntries.size();
        bgDesc.entries = drawEntries.data();
        _drawDataBindGroup = wgpuDeviceCreateBindGroup(_device, &bgDesc);

        if (!_cullBindGroup || !_commandBindGroup || !_drawDataBindGroup) {
            releaseDataBindGroups();
            return Err<void>("QuadRenderer: failed to create data bind groups");
        }
        return Ok();
    }

    Result<void> updateAtlasBindGroup(const AtlasViews& atlases) {
        if (_atlasBindGroup && atlases.texture == _boundAtlases.texture &&
            atlases.stencil == _boundAtlases.stencil) {
            return Ok();
        }
        if (_atlasBindGroup) {
            wgpuBindGroupRelease(_atlasBindGroup);
            _atlasBindGroup = nullptr;
        }

        std::array<WGPUBindGroupEntry, 3> entries = {};
        entries[0].binding = 0;
        entries[0].sampler = _sampler;
        entries[1].binding = 1;
        entries[1].textureView = atlases.texture;
        entries[2].binding = 2;
        entries[2].textureView = atlases.stencil;

        WGPUBindGroupDescriptor bgDesc = {};
        bgDesc.label = WGPU_STR("QuadAtlasBindGroup");
        bgDesc.layout = _atlasLayout;
        bgDesc.entryCount = entries.size();
        bgDesc.entries = entries.data();
        _atlasBindGroup = wgpuDeviceCreateBindGroup(_device, &bgDesc);
        if (!_atlasBindGroup) {
            return Err<void>("QuadRenderer: failed to create atlas bind group");
        }
        _boundAtlases = atlases;
        return Ok();
    }

    //=========================================================================
    // Submission
    //=========================================================================

    Result<void> encodeClearOnly(WGPUTextureView view, const WGPUColor& clear) {
        WGPUCommandEncoderDescriptor encDesc = {};
        encDesc.label = WGPU_STR("QuadClearEncoder");
        WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, &encDesc);
        if (!encoder) {
            return Err<void>("QuadRenderer: failed to create command encoder");
        }

        // Readback of an empty frame reports zero visible instances
        const DrawIndirectArgs args = writeIndirectArgs(0);
        wgpuQueueWriteBuffer(_queue, _indirectBuffer, 0, &args, sizeof(args));
        wgpuCommandEncoderClearBuffer(encoder, _counterBuffer, 0, sizeof(uint32_t));

        WGPURenderPassColorAttachment colorAttachment = {};
        colorAttachment.view = view;
        colorAttachment.loadOp = WGPULoadOp_Clear;
        colorAttachment.storeOp = WGPUStoreOp_Store;
        colorAttachment.clearValue = clear;
        colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;

        WGPURenderPassDescriptor passDesc = {};
        passDesc.label = WGPU_STR("QuadClearPass");
        passDesc.colorAttachmentCount = 1;
        passDesc.colorAttachments = &colorAttachment;

        WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
        if (!pass) {
            wgpuCommandEncoderRelease(encoder);
            return Err<void>("QuadRenderer: failed to begin clear pass");
        }
        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);

        return submit(encoder, "QuadClearCommands");
    }

    Result<void> submit(WGPUCommandEncoder encoder, const char* label) {
        WGPUCommandBufferDescriptor cmdDesc = {};
        cmdDesc.label = WGPU_STR(label);
        WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
        wgpuCommandEncoderRelease(encoder);
        if (!cmdBuffer) {
            return Err<void>(std::string("QuadRenderer: failed to finish ") + label);
        }
        wgpuQueueSubmit(_queue, 1, &cmdBuffer);
        wgpuCommandBufferRelease(cmdBuffer);
        return Ok();
    }

    WGPUDevice _device;
    WGPUQueue _queue;
    Options _options;

    WGPUShaderModule _cullModule = nullptr;
    WGPUShaderModule _commandModule = nullptr;
    WGPUShaderModule _drawModule = nullptr;

    WGPUBindGroupLayout _cullLayout = nullptr;
    WGPUBindGroupLayout _commandLayout = nullptr;
    WGPUBindGroupLayout _drawDataLayout = nullptr;
    WGPUBindGroupLayout _atlasLayout = nullptr;
    WGPUPipelineLayout _cullPipelineLayout = nullptr;
    WGPUPipelineLayout _commandPipelineLayout = nullptr;
    WGPUPipelineLayout _drawPipelineLayout = nullptr;

    WGPUComputePipeline _cullPipeline = nullptr;
    WGPUComputePipeline _commandPipeline = nullptr;
    std::vector<std::pair<WGPUTextureFormat, WGPURenderPipeline>> _pipelineCache;

    WGPUSampler _sampler = nullptr;

    WGPUBuffer _uniformBuffer = nullptr;
    WGPUBuffer _counterBuffer = nullptr;
    WGPUBuffer _indirectBuffer = nullptr;
    WGPUBuffer _instanceBuffer = nullptr;
    WGPUBuffer _stencilBuffer = nullptr;
    WGPUBuffer _visibleBuffer = nullptr;
    uint32_t _instanceCapacity = 0;
    uint32_t _stencilCapacity = 0;

    WGPUBindGroup _cullBindGroup = nullptr;
    WGPUBindGroup _commandBindGroup = nullptr;
    WGPUBindGroup _drawDataBindGroup = nullptr;
    WGPUBindGroup _atlasBindGroup = nullptr;
    AtlasViews _boundAtlases;

    uint64_t _frames = 0;
    uint32_t _lastInstanceCount = 0;
    uint32_t _lastStencilCount = 0;
};

//=============================================================================
// Factory
//=============================================================================

Result<QuadRenderer::Ptr> QuadRenderer::create(WGPUDevice device, WGPUQueue queue,
                                               const Options& options) noexcept {
    auto impl = std::make_shared<QuadRendererImpl>(device, queue, options);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to create QuadRenderer", res);
    }
    return Ok(std::move(impl));
}

} // namespace yquad
