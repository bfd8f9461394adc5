#include "demo-app.h"

#include <yquad/render-node.h>
#include <ytrace/ytrace.hpp>
#include <args.hxx>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace yquad::demo {

namespace {

constexpr uint32_t TEXTURE_ATLAS_ID = 1;
constexpr uint32_t STENCIL_ATLAS_ID = 2;

constexpr uint32_t TILE_SIZE = 64;
constexpr uint32_t TEXTURE_PAGE_SIZE = 256;
constexpr uint32_t TEXTURE_PAGES = 2;
constexpr uint32_t STENCIL_PAGE_WIDTH = 128;
constexpr uint32_t STENCIL_PAGE_HEIGHT = 64;

constexpr float WIDGET_WIDTH = 160.0f;
constexpr float WIDGET_HEIGHT = 110.0f;
constexpr float CELL_WIDTH = 180.0f;
constexpr float CELL_HEIGHT = 130.0f;
constexpr float BADGE_SIZE = 32.0f;
constexpr float SCROLL_SPEED = 90.0f;  // pixels per second

// Widget that gets a zero-height stencil placement
constexpr size_t DEGENERATE_WIDGET = 5;

glm::mat4 placeRect(glm::vec2 position, glm::vec2 size) {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), glm::vec3(position, 0.0f));
    return glm::scale(m, glm::vec3(size, 1.0f));
}

// Diagonal gradient with a darker one-pixel frame
std::vector<uint8_t> makeTile(uint32_t index) {
    const float hue = static_cast<float>(index) / static_cast<float>(TEXTURE_PAGES * 16);
    const glm::vec3 base(0.5f + 0.5f * std::cos(6.2831f * hue),
                         0.5f + 0.5f * std::cos(6.2831f * (hue + 0.33f)),
                         0.5f + 0.5f * std::cos(6.2831f * (hue + 0.66f)));

    std::vector<uint8_t> pixels(TILE_SIZE * TILE_SIZE * 4);
    for (uint32_t y = 0; y < TILE_SIZE; ++y) {
        for (uint32_t x = 0; x < TILE_SIZE; ++x) {
            bool frame = x == 0 || y == 0 || x == TILE_SIZE - 1 || y == TILE_SIZE - 1;
            float t = static_cast<float>(x + y) / static_cast<float>(2 * TILE_SIZE);
            glm::vec3 c = frame ? base * 0.4f : base * (0.6f + 0.4f * t);
            uint8_t* p = &pixels[(y * TILE_SIZE + x) * 4];
            p[0] = static_cast<uint8_t>(std::clamp(c.r, 0.0f, 1.0f) * 255.0f);
            p[1] = static_cast<uint8_t>(std::clamp(c.g, 0.0f, 1.0f) * 255.0f);
            p[2] = static_cast<uint8_t>(std::clamp(c.b, 0.0f, 1.0f) * 255.0f);
            p[3] = 255;
        }
    }
    return pixels;
}

// Coverage of a rounded rectangle (radius in texels), antialiased over one texel
std::vector<uint8_t> makeRoundedRectMask(float radius) {
    std::vector<uint8_t> pixels(TILE_SIZE * TILE_SIZE);
    const float half = TILE_SIZE * 0.5f;
    for (uint32_t y = 0; y < TILE_SIZE; ++y) {
        for (uint32_t x = 0; x < TILE_SIZE; ++x) {
            glm::vec2 p(x + 0.5f - half, y + 0.5f - half);
            glm::vec2 q = glm::abs(p) - glm::vec2(half - radius);
            float dist = glm::length(glm::max(q, glm::vec2(0.0f))) +
                         std::min(std::max(q.x, q.y), 0.0f) - radius;
            float coverage = std::clamp(0.5f - dist, 0.0f, 1.0f);
            pixels[y * TILE_SIZE + x] = static_cast<uint8_t>(coverage * 255.0f);
        }
    }
    return pixels;
}

} // namespace

//=============================================================================
// Lifecycle
//=============================================================================

Result<DemoApp::Ptr> DemoApp::create(int argc, char* argv[]) noexcept {
    auto app = Ptr(new DemoApp());
    if (auto res = app->parseArgs(argc, argv); !res) {
        return Err<Ptr>("Failed to parse arguments", res);
    }
    if (auto res = app->init(); !res) {
        return Err<Ptr>("Failed to initialize demo", res);
    }
    return Ok(std::move(app));
}

DemoApp::~DemoApp() {
    // GPU objects go before the window their surface belongs to
    _renderer.reset();
    _textureAtlas.reset();
    _stencilAtlas.reset();
    _ctx.reset();
    if (_window) {
        glfwDestroyWindow(_window);
        glfwTerminate();
    }
}

Result<void> DemoApp::parseArgs(int argc, char* argv[]) noexcept {
    args::ArgumentParser parser("yquad-demo - GPU culled quad compositing");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path",
                                            {'c', "config"});
    args::ValueFlag<uint32_t> widthArg(parser, "width", "Window width in pixels",
                                       {'W', "width"});
    args::ValueFlag<uint32_t> heightArg(parser, "height", "Window height in pixels",
                                        {'H', "height"});
    args::Flag noCullFlag(parser, "no-cull", "Draw every instance (culling off)",
                          {"no-cull"});
    args::ValueFlag<uint32_t> columnsArg(parser, "columns", "Widget grid columns",
                                         {"columns"});
    args::ValueFlag<uint32_t> rowsArg(parser, "rows", "Widget grid rows", {"rows"});
    args::ValueFlag<std::string> shaderDirArg(parser, "path", "Directory with the WGSL shaders",
                                              {"shader-dir"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return Err<void>("Help requested");
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return Err<void>(std::string("Parse error: ") + e.what());
    }

    // Build command line overrides for config
    YAML::Node cmdOverrides;
    if (widthArg) {
        cmdOverrides["window"]["width"] = args::get(widthArg);
    }
    if (heightArg) {
        cmdOverrides["window"]["height"] = args::get(heightArg);
    }
    if (noCullFlag) {
        cmdOverrides["culling"]["enabled"] = false;
    }
    if (columnsArg) {
        cmdOverrides["demo"]["columns"] = args::get(columnsArg);
    }
    if (rowsArg) {
        cmdOverrides["demo"]["rows"] = args::get(rowsArg);
    }
    if (shaderDirArg) {
        cmdOverrides["shaders"]["dir"] = args::get(shaderDirArg);
    }

    std::string configPath = configFile ? args::get(configFile) : "";
    auto configResult = Config::create(configPath, cmdOverrides);
    if (!configResult) {
        return Err<void>("Failed to create config", configResult);
    }
    _config = *configResult;

    _width = _config->windowWidth();
    _height = _config->windowHeight();
    if (_width == 0) _width = 1280;
    if (_height == 0) _height = 800;
    _columns = _config->get<uint32_t>(Config::KEY_DEMO_COLUMNS, 48);
    _rows = _config->get<uint32_t>(Config::KEY_DEMO_ROWS, 32);
    _statsInterval = _config->get<uint32_t>(Config::KEY_DEMO_STATS_INTERVAL, 120);
    _clearColor = _config->clearColor();

    if (!_config->loadedPath().empty()) {
        yinfo("Config loaded from {}", _config->loadedPath());
    }
    return Ok();
}

Result<void> DemoApp::init() noexcept {
    if (!glfwInit()) {
        return Err<void>("Failed to initialize GLFW");
    }

    // No OpenGL context, WebGPU owns the surface
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    _window = glfwCreateWindow(static_cast<int>(_width), static_cast<int>(_height),
                               "yquad - GPU culled compositing", nullptr, nullptr);
    if (!_window) {
        glfwTerminate();
        return Err<void>("Failed to create window");
    }

    // Framebuffer may differ from the window size on HiDPI displays
    int fbWidth = 0, fbHeight = 0;
    glfwGetFramebufferSize(_window, &fbWidth, &fbHeight);
    if (fbWidth > 0 && fbHeight > 0) {
        _width = static_cast<uint32_t>(fbWidth);
        _height = static_cast<uint32_t>(fbHeight);
    }

    auto ctxResult = WebGPUContext::create(_window, _width, _height);
    if (!ctxResult) {
        return Err<void>("Failed to initialize WebGPU", ctxResult);
    }
    _ctx = *ctxResult;

    if (auto res = createAtlases(); !res) {
        return res;
    }
    if (auto res = buildWidgets(); !res) {
        return res;
    }

    QuadRenderer::Options options;
    options.shaderDir = _config->shaderDir();
    options.cullEnabled = _config->cullingEnabled();
    options.validate = _config->validateRecords();

    auto rendererResult = QuadRenderer::create(_ctx->getDevice(), _ctx->getQueue(), options);
    if (!rendererResult) {
        return Err<void>("Failed to create quad renderer", rendererResult);
    }
    _renderer = *rendererResult;

    glfwSetWindowUserPointer(_window, this);
    glfwSetKeyCallback(_window, keyCallback);
    glfwSetFramebufferSizeCallback(_window, framebufferSizeCallback);

    yinfo("Demo: {}x{} widgets ({} instances), window {}x{}, culling {}",
          _columns, _rows, _widgets.size() * 2, _width, _height,
          options.cullEnabled ? "on" : "off");
    return Ok();
}

//=============================================================================
// Content
//=============================================================================

Result<void> DemoApp::createAtlases() noexcept {
    auto textureResult = AtlasTexture::create(_ctx->getDevice(), TEXTURE_ATLAS_ID,
                                              TexelFormat::RGBA8Unorm, TEXTURE_PAGE_SIZE,
                                              TEXTURE_PAGE_SIZE, TEXTURE_PAGES, "DemoTextureAtlas");
    if (!textureResult) {
        return Err<void>("Failed to create texture atlas", textureResult);
    }
    _textureAtlas = *textureResult;

    auto stencilResult = AtlasTexture::create(_ctx->getDevice(), STENCIL_ATLAS_ID,
                                              TexelFormat::R8Unorm, STENCIL_PAGE_WIDTH,
                                              STENCIL_PAGE_HEIGHT, 1, "DemoStencilAtlas");
    if (!stencilResult) {
        return Err<void>("Failed to create stencil atlas", stencilResult);
    }
    _stencilAtlas = *stencilResult;

    WGPUQueue queue = _ctx->getQueue();
    const uint32_t tilesPerRow = TEXTURE_PAGE_SIZE / TILE_SIZE;
    const uint32_t tilesPerPage = tilesPerRow * tilesPerRow;

    for (uint32_t i = 0; i < TEXTURE_PAGES * tilesPerPage; ++i) {
        uint32_t page = i / tilesPerPage;
        uint32_t x = (i % tilesPerRow) * TILE_SIZE;
        uint32_t y = ((i % tilesPerPage) / tilesPerRow) * TILE_SIZE;

        auto pixels = makeTile(i);
        if (auto res = _textureAtlas->upload(queue, page, x, y, TILE_SIZE, TILE_SIZE,
                                             pixels.data()); !res) {
            return Err<void>("Failed to upload tile " + std::to_string(i), res);
        }
        auto region = _textureAtlas->region(page, x, y, TILE_SIZE, TILE_SIZE);
        if (!region) {
            return Err<void>("Failed to describe tile " + std::to_string(i), region);
        }
        _tileRegions.push_back(*region);
    }

    // Stencil page: rounded rect, then a circle
    const float radii[2] = {12.0f, TILE_SIZE * 0.5f};
    for (uint32_t i = 0; i < 2; ++i) {
        auto mask = makeRoundedRectMask(radii[i]);
        if (auto res = _stencilAtlas->upload(queue, 0, i * TILE_SIZE, 0, TILE_SIZE, TILE_SIZE,
                                             mask.data()); !res) {
            return Err<void>("Failed to upload stencil mask", res);
        }
        auto region = _stencilAtlas->region(0, i * TILE_SIZE, 0, TILE_SIZE, TILE_SIZE);
        if (!region) {
            return Err<void>("Failed to describe stencil mask", region);
        }
        _stencilRegions.push_back(*region);
    }

    yinfo("Demo: {} tiles, {} stencil masks uploaded", _tileRegions.size(),
          _stencilRegions.size());
    return Ok();
}

Result<void> DemoApp::buildWidgets() noexcept {
    if (_tileRegions.empty() || _stencilRegions.empty()) {
        return Err<void>("Demo atlases are empty");
    }

    _widgets.clear();
    _widgets.reserve(size_t(_columns) * _rows);
    for (uint32_t row = 0; row < _rows; ++row) {
        for (uint32_t col = 0; col < _columns; ++col) {
            size_t index = _widgets.size();
            Widget widget;
            widget.face = _tileRegions[index % _tileRegions.size()];
            widget.badge = _tileRegions[(index * 7 + 3) % _tileRegions.size()];
            // Two thirds share the rounded rect, every fifth gets the circle
            if (index % 5 == 0) {
                widget.stencil = 1;
            } else if (index % 3 != 0) {
                widget.stencil = 0;
            } else {
                widget.stencil = -1;
            }
            widget.position = glm::vec2(col * CELL_WIDTH + 20.0f, row * CELL_HEIGHT + 20.0f);
            _widgets.push_back(widget);
        }
    }
    return Ok();
}

RenderNode DemoApp::buildScene(float scroll) const {
    RenderNode root;
    const glm::mat4 scrolled = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, -scroll, 0.0f));
    const glm::vec2 size(WIDGET_WIDTH, WIDGET_HEIGHT);

    for (size_t i = 0; i < _widgets.size(); ++i) {
        const Widget& widget = _widgets[i];

        RenderNode node;
        node.withTexture(widget.face, placeRect(widget.position, size));
        if (widget.stencil >= 0) {
            glm::vec2 stencilSize = i == DEGENERATE_WIDGET ? glm::vec2(WIDGET_WIDTH, 0.0f) : size;
            node.withStencil(_stencilRegions[widget.stencil],
                             placeRect(widget.position, stencilSize));
        }

        // Badge straddles the top-right corner and is clipped by the widget stencil
        RenderNode badge;
        badge.withTexture(widget.badge, placeRect(glm::vec2(0.0f), glm::vec2(BADGE_SIZE)));
        glm::vec2 badgePos = widget.position + glm::vec2(WIDGET_WIDTH - BADGE_SIZE * 0.75f,
                                                         -BADGE_SIZE * 0.25f);
        node.addChild(std::move(badge),
                      glm::translate(glm::mat4(1.0f), glm::vec3(badgePos, 0.0f)));

        root.addChild(std::move(node), scrolled);
    }
    return root;
}

//=============================================================================
// Main loop
//=============================================================================

Result<void> DemoApp::run() noexcept {
    yinfo("Starting render loop (C toggles culling, Esc quits)");
    _lastFpsTime = glfwGetTime();

    while (!glfwWindowShouldClose(_window)) {
        glfwPollEvents();
        if (auto res = renderFrame(); !res) {
            return Err<void>("Frame " + std::to_string(_frame) + " failed", res);
        }

        ++_fpsFrames;
        double now = glfwGetTime();
        if (now - _lastFpsTime >= 1.0) {
            ydebug("Demo: {:.1f} fps", _fpsFrames / (now - _lastFpsTime));
            _fpsFrames = 0;
            _lastFpsTime = now;
        }
    }

    yinfo("Shutting down after {} frames", _frame);
    return Ok();
}

Result<void> DemoApp::renderFrame() noexcept {
    const float contentHeight = _rows * CELL_HEIGHT + 20.0f;
    const float range = std::max(contentHeight - static_cast<float>(_ctx->height()), 1.0f);
    const float scroll = std::fmod(static_cast<float>(glfwGetTime()) * SCROLL_SPEED, range);

    auto frame = FrameBuilder::build(buildScene(scroll));
    if (!frame) {
        return Err<void>("Failed to build frame", frame);
    }

    auto viewResult = _ctx->getCurrentTextureView();
    if (!viewResult) {
        // Surface is lost or outdated during resizes; try again next frame
        ywarn("Demo: skipping frame: {}", error_msg(viewResult));
        return Ok();
    }

    QuadRenderer::FrameTarget target;
    target.view = *viewResult;
    target.format = _ctx->getSurfaceFormat();
    target.width = _ctx->width();
    target.height = _ctx->height();

    QuadRenderer::AtlasViews atlases;
    atlases.texture = _textureAtlas->view();
    atlases.stencil = _stencilAtlas->view();

    auto res = _renderer->render(target, *frame, atlases, _clearColor);
    _ctx->present();
    if (!res) {
        return res;
    }

    ++_frame;
    if (_statsInterval > 0 && _frame % _statsInterval == 0) {
        logCullStats();
    }
    return Ok();
}

void DemoApp::logCullStats() noexcept {
    auto readback = _renderer->readbackCullResult();
    if (!readback) {
        yerror("Demo: culling readback failed: {}", error_msg(readback));
        return;
    }
    auto stats = _renderer->getStats();
    yinfo("Demo: frame {}: {} of {} instances visible ({} stencils), draw {}x{}",
          _frame, readback->visibleCount, stats.lastInstanceCount, stats.lastStencilCount,
          readback->args.vertexCount, readback->args.instanceCount);
}

//=============================================================================
// Callbacks
//=============================================================================

void DemoApp::keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    auto* app = static_cast<DemoApp*>(glfwGetWindowUserPointer(window));
    if (!app || action != GLFW_PRESS) return;

    if (key == GLFW_KEY_ESCAPE) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    } else if (key == GLFW_KEY_C) {
        bool enabled = !app->_renderer->cullingEnabled();
        app->_renderer->setCullingEnabled(enabled);
        yinfo("Demo: culling {}", enabled ? "on" : "off");
    }
}

void DemoApp::framebufferSizeCallback(GLFWwindow* window, int width, int height) {
    if (width == 0 || height == 0) return;
    auto* app = static_cast<DemoApp*>(glfwGetWindowUserPointer(window));
    if (!app || !app->_ctx) return;

    app->_ctx->resize(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    ydebug("Demo: resize -> {}x{}", width, height);
}

} // namespace yquad::demo
