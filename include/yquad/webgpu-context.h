#pragma once

#include <yquad/result.hpp>
#include <webgpu/webgpu.h>
#include <GLFW/glfw3.h>
#include <memory>

namespace yquad {

//-----------------------------------------------------------------------------
// WebGPUContext - instance, adapter, device and queue, plus the window surface
//
// A headless context has no surface; it renders into offscreen textures and
// is used by the GPU checks.
//-----------------------------------------------------------------------------
class WebGPUContext {
public:
    using Ptr = std::shared_ptr<WebGPUContext>;

    static Result<Ptr> create(GLFWwindow* window, uint32_t width, uint32_t height) noexcept;
    static Result<Ptr> createHeadless() noexcept;

    ~WebGPUContext();

    // Non-copyable
    WebGPUContext(const WebGPUContext&) = delete;
    WebGPUContext& operator=(const WebGPUContext&) = delete;

    void resize(uint32_t width, uint32_t height) noexcept;

    WGPUInstance getInstance() const noexcept { return instance_; }
    WGPUDevice getDevice() const noexcept { return device_; }
    WGPUQueue getQueue() const noexcept { return queue_; }
    WGPUSurface getSurface() const noexcept { return surface_; }
    WGPUTextureFormat getSurfaceFormat() const noexcept { return surfaceFormat_; }
    bool isHeadless() const noexcept { return surface_ == nullptr; }
    uint32_t width() const noexcept { return width_; }
    uint32_t height() const noexcept { return height_; }

    // Acquired once per frame; released by present()
    Result<WGPUTextureView> getCurrentTextureView() noexcept;
    void present() noexcept;

private:
    WebGPUContext(GLFWwindow* window, uint32_t width, uint32_t height) noexcept;

    Result<void> init() noexcept;
    Result<void> requestAdapterAndDevice() noexcept;
    void configureSurface(uint32_t width, uint32_t height) noexcept;

    GLFWwindow* window_ = nullptr;

    WGPUInstance instance_ = nullptr;
    WGPUAdapter adapter_ = nullptr;
    WGPUDevice device_ = nullptr;
    WGPUQueue queue_ = nullptr;
    WGPUSurface surface_ = nullptr;
    WGPUTextureFormat surfaceFormat_ = WGPUTextureFormat_BGRA8Unorm;

    uint32_t width_ = 0;
    uint32_t height_ = 0;

    // Cached texture view for current frame (to avoid double-acquire)
    WGPUTextureView currentTextureView_ = nullptr;
    WGPUTexture currentTexture_ = nullptr;
};

} // namespace yquad
