#include <yquad/webgpu-context.h>
#include <yquad/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <glfw3webgpu.h>

namespace yquad {

Result<WebGPUContext::Ptr> WebGPUContext::create(GLFWwindow* window, uint32_t width, uint32_t height) noexcept {
    if (!window) {
        return Err<Ptr>("WebGPUContext::create: null window");
    }
    auto ctx = Ptr(new WebGPUContext(window, width, height));
    if (auto res = ctx->init(); !res) {
        return Err<Ptr>("Failed to initialize WebGPUContext", res);
    }
    return Ok(std::move(ctx));
}

Result<WebGPUContext::Ptr> WebGPUContext::createHeadless() noexcept {
    auto ctx = Ptr(new WebGPUContext(nullptr, 0, 0));
    if (auto res = ctx->init(); !res) {
        return Err<Ptr>("Failed to initialize headless WebGPUContext", res);
    }
    return Ok(std::move(ctx));
}

WebGPUContext::WebGPUContext(GLFWwindow* window, uint32_t width, uint32_t height) noexcept
    : window_(window), width_(width), height_(height) {}

WebGPUContext::~WebGPUContext() {
    if (currentTextureView_) wgpuTextureViewRelease(currentTextureView_);
    if (queue_) wgpuQueueRelease(queue_);
    if (device_) wgpuDeviceRelease(device_);
    if (adapter_) wgpuAdapterRelease(adapter_);
    if (surface_) wgpuSurfaceRelease(surface_);
    if (instance_) wgpuInstanceRelease(instance_);
}

Result<void> WebGPUContext::init() noexcept {
    WGPUInstanceDescriptor instanceDesc = {};
    instance_ = wgpuCreateInstance(&instanceDesc);
    if (!instance_) {
        return Err<void>("Failed to create WebGPU instance");
    }

    if (window_) {
        surface_ = glfwCreateWindowWGPUSurface(instance_, window_);
        if (!surface_) {
            return Err<void>("Failed to create WebGPU surface");
        }
    }

    if (auto res = requestAdapterAndDevice(); !res) {
        return res;
    }

    if (surface_) {
        // Desktop wgpu-native: get preferred surface format
        WGPUSurfaceCapabilities caps = {};
        wgpuSurfaceGetCapabilities(surface_, adapter_, &caps);
        if (caps.formatCount > 0) {
            surfaceFormat_ = caps.formats[0];
        }
        wgpuSurfaceCapabilitiesFreeMembers(caps);

        configureSurface(width_, height_);
    } else {
        surfaceFormat_ = WGPUTextureFormat_RGBA8Unorm;
    }

    yinfo("WebGPU initialized ({}), surface format {}",
          surface_ ? "windowed" : "headless", static_cast<int>(surfaceFormat_));
    return Ok();
}

Result<void> WebGPUContext::requestAdapterAndDevice() noexcept {
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = surface_;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    WGPURequestAdapterCallbackInfo adapterCallbackInfo = {};
    adapterCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                                      WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestAdapterStatus_Success) {
            *static_cast<WGPUAdapter*>(userdata1) = adapter;
        } else {
            yerror("Failed to get WebGPU adapter: {}", wgpuLabel(message));
        }
    };
    adapterCallbackInfo.userdata1 = &adapter_;
    wgpuInstanceRequestAdapter(instance_, &adapterOpts, adapterCallbackInfo);

    if (!adapter_) {
        return Err<void>("Failed to get WebGPU adapter");
    }

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = WGPU_STR("yquad device");
    deviceDesc.requiredFeatureCount = 0;
    deviceDesc.requiredLimits = nullptr;
    deviceDesc.defaultQueue.label = WGPU_STR("default queue");
    deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const*, WGPUErrorType type,
                                                         WGPUStringView message, void*, void*) {
        yerror("WebGPU error ({}): {}", static_cast<int>(type), wgpuLabel(message));
    };

    WGPURequestDeviceCallbackInfo deviceCallbackInfo = {};
    deviceCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                                     WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestDeviceStatus_Success) {
            *static_cast<WGPUDevice*>(userdata1) = device;
        } else {
            yerror("Failed to get WebGPU device: {}", wgpuLabel(message));
        }
    };
    deviceCallbackInfo.userdata1 = &device_;
    wgpuAdapterRequestDevice(adapter_, &deviceDesc, deviceCallbackInfo);

    if (!device_) {
        return Err<void>("Failed to get WebGPU device");
    }

    queue_ = wgpuDeviceGetQueue(device_);
    if (!queue_) {
        return Err<void>("Failed to get WebGPU queue");
    }
    return Ok();
}

void WebGPUContext::configureSurface(uint32_t width, uint32_t height) noexcept {
    WGPUSurfaceConfiguration config = {};
    config.device = device_;
    config.format = surfaceFormat_;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.viewFormatCount = 0;
    config.viewFormats = nullptr;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.presentMode = WGPUPresentMode_Fifo;
    config.width = width;
    config.height = height;
    wgpuSurfaceConfigure(surface_, &config);
}

void WebGPUContext::resize(uint32_t width, uint32_t height) noexcept {
    if (width == 0 || height == 0) return;
    width_ = width;
    height_ = height;
    if (surface_) {
        configureSurface(width, height);
    }
}

Result<WGPUTextureView> WebGPUContext::getCurrentTextureView() noexcept {
    if (!surface_) {
        return Err<WGPUTextureView>("headless context has no surface");
    }

    // Return cached view if already acquired this frame
    if (currentTextureView_) {
        return Ok(currentTextureView_);
    }

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(surface_, &surfaceTexture);

    // v27: Success was split into SuccessOptimal and SuccessSuboptimal
    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        return Err<WGPUTextureView>("Failed to get surface texture (status " +
                                    std::to_string(static_cast<int>(surfaceTexture.status)) + ")");
    }

    currentTexture_ = surfaceTexture.texture;

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = surfaceFormat_;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;

    currentTextureView_ = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);
    if (!currentTextureView_) {
        return Err<WGPUTextureView>("Failed to create texture view");
    }
    return Ok(currentTextureView_);
}

void WebGPUContext::present() noexcept {
    if (currentTextureView_) {
        wgpuTextureViewRelease(currentTextureView_);
        currentTextureView_ = nullptr;
    }
    if (surface_ && currentTexture_) {
        wgpuSurfacePresent(surface_);
    }
    if (currentTexture_) {
        wgpuTextureRelease(currentTexture_);
        currentTexture_ = nullptr;
    }
}

} // namespace yquad
