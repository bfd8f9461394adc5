#pragma once

#include <yquad/atlas-texture.h>
#include <yquad/config.h>
#include <yquad/frame-builder.h>
#include <yquad/quad-renderer.h>
#include <yquad/result.hpp>
#include <yquad/webgpu-context.h>
#include <GLFW/glfw3.h>
#include <memory>
#include <vector>

namespace yquad::demo {

//-----------------------------------------------------------------------------
// DemoApp - scrolling widget wall drawn through the GPU culling pipeline
//
// Widgets are laid out in a grid much taller than the window, so most of
// them are culled on any given frame. Keys: C toggles culling, Esc quits.
//-----------------------------------------------------------------------------
class DemoApp {
public:
    using Ptr = std::shared_ptr<DemoApp>;

    static Result<Ptr> create(int argc, char* argv[]) noexcept;

    ~DemoApp();

    DemoApp(const DemoApp&) = delete;
    DemoApp& operator=(const DemoApp&) = delete;

    Result<void> run() noexcept;

private:
    DemoApp() = default;

    Result<void> parseArgs(int argc, char* argv[]) noexcept;
    Result<void> init() noexcept;
    Result<void> createAtlases() noexcept;
    Result<void> buildWidgets() noexcept;

    Result<void> renderFrame() noexcept;
    RenderNode buildScene(float scroll) const;
    void logCullStats() noexcept;

    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void framebufferSizeCallback(GLFWwindow* window, int width, int height);

    struct Widget {
        AtlasRegion face;
        AtlasRegion badge;
        int stencil;  // index into _stencilRegions, -1 = none
        glm::vec2 position;
    };

    Config::Ptr _config;
    GLFWwindow* _window = nullptr;
    WebGPUContext::Ptr _ctx;
    AtlasTexture::Ptr _textureAtlas;
    AtlasTexture::Ptr _stencilAtlas;
    QuadRenderer::Ptr _renderer;

    std::vector<AtlasRegion> _tileRegions;
    std::vector<AtlasRegion> _stencilRegions;
    std::vector<Widget> _widgets;

    uint32_t _width = 1280;
    uint32_t _height = 800;
    uint32_t _columns = 48;
    uint32_t _rows = 32;
    uint32_t _statsInterval = 120;
    std::array<double, 4> _clearColor = {0.08, 0.08, 0.1, 1.0};

    uint64_t _frame = 0;
    double _lastFpsTime = 0.0;
    uint32_t _fpsFrames = 0;
};

} // namespace yquad::demo
