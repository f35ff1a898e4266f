// Michadame Application - Implementation
// Window, WebGPU setup and the render loop

#include "app.h"

#include <michadame/crt/frame_texture.h>
#include <michadame/crt/render_graph.h>
#include <michadame/effects/gpu_common.h>
#include <michadame/storage/viewer_config.h>
#include <michadame/video/capture_pipeline.h>
#include <webgpu/webgpu.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace michadame {

using effects::gpu::toStringView;

// -----------------------------------------------------------------------------
// WebGPU Initialization Helpers
// -----------------------------------------------------------------------------

static std::string messageText(WGPUStringView message, const char* fallback) {
    if (!message.data) {
        return fallback;
    }
    size_t len = message.length == WGPU_STRLEN ? strlen(message.data) : message.length;
    return std::string(message.data, len);
}

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    bool done = false;
};

static void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                                  WGPUStringView message, void* userdata1, void* userdata2) {
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        std::cerr << "Failed to request adapter: " << messageText(message, "unknown error")
                  << std::endl;
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    bool done = false;
};

static void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                                 WGPUStringView message, void* userdata1, void* userdata2) {
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        std::cerr << "Failed to request device: " << messageText(message, "unknown error")
                  << std::endl;
    }
    data->done = true;
}

static void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                         WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "WebGPU Device Lost: " << messageText(message, "unknown") << std::endl;
}

static void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                          WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "WebGPU Error: " << messageText(message, "unknown") << std::endl;
}

// The composite pass applies its own output gamma, so an sRGB surface would
// encode twice
static WGPUTextureFormat chooseSurfaceFormat(const WGPUSurfaceCapabilities& caps) {
    for (size_t i = 0; i < caps.formatCount; ++i) {
        if (caps.formats[i] == WGPUTextureFormat_BGRA8Unorm ||
            caps.formats[i] == WGPUTextureFormat_RGBA8Unorm) {
            return caps.formats[i];
        }
    }
    if (caps.formatCount > 0) {
        std::cerr << "Warning: no linear surface format, output gamma will be doubled" << std::endl;
        return caps.formats[0];
    }
    return WGPUTextureFormat_BGRA8Unorm;
}

static bool mapKey(int key, ViewerKey& out) {
    switch (key) {
        case GLFW_KEY_F:      out = ViewerKey::ToggleFullscreen; return true;
        case GLFW_KEY_ESCAPE: out = ViewerKey::LeaveFullscreen;  return true;
        case GLFW_KEY_C:      out = ViewerKey::ToggleCrt;        return true;
        case GLFW_KEY_G:      out = ViewerKey::TogglePixelate;   return true;
        case GLFW_KEY_R:      out = ViewerKey::ResetShader;      return true;
        case GLFW_KEY_Q:      out = ViewerKey::Quit;             return true;
        default:              return false;
    }
}

// -----------------------------------------------------------------------------
// Application State
// -----------------------------------------------------------------------------

struct Application::Impl {
    // Owned objects
    std::unique_ptr<storage::ConfigStore> store;
    std::unique_ptr<video::CaptureSession> session;
    std::unique_ptr<crt::RenderGraph> graph;
    std::unique_ptr<crt::FrameTexture> frameTexture;

    // WebGPU objects
    WGPUInstance instance = nullptr;
    WGPUAdapter adapter = nullptr;
    WGPUSurface surface = nullptr;
    WGPUDevice device = nullptr;
    WGPUQueue queue = nullptr;
    WGPUTextureFormat surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    WGPUSurfaceConfigurationExtras configExtras = {};
    WGPUSurfaceConfiguration config = {};

    // Window
    bool glfwReady = false;
    GLFWwindow* window = nullptr;
    int width = 0;
    int height = 0;

    // Fullscreen state machine: `viewer.fullscreen` is requested, `appliedFullscreen` is current
    ViewerState viewer;
    FullscreenState appliedFullscreen = FullscreenState::Windowed;
    int windowedX = 0, windowedY = 0;
    int windowedWidth = 1280, windowedHeight = 720;

    // FPS counters
    double lastFpsTime = 0.0;
    int frameCount = 0;
    int videoFrameCount = 0;
    bool reportedCaptureError = false;
};

static void applyFullscreen(Application::Impl& app) {
    if (app.viewer.fullscreen == app.appliedFullscreen) {
        return;
    }

    if (app.viewer.fullscreen == FullscreenState::Fullscreen) {
        // Save windowed position and size
        glfwGetWindowPos(app.window, &app.windowedX, &app.windowedY);
        glfwGetWindowSize(app.window, &app.windowedWidth, &app.windowedHeight);

        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        const GLFWvidmode* mode = monitor ? glfwGetVideoMode(monitor) : nullptr;
        if (!mode) {
            std::cerr << "Fullscreen unavailable: no primary monitor" << std::endl;
            app.viewer.fullscreen = FullscreenState::Windowed;
            return;
        }
        glfwSetWindowMonitor(app.window, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
    } else {
        glfwSetWindowMonitor(app.window, nullptr, app.windowedX, app.windowedY,
                             app.windowedWidth, app.windowedHeight, 0);
    }
    app.appliedFullscreen = app.viewer.fullscreen;
}

static void configureSurface(Application::Impl& app) {
    app.config.width = static_cast<uint32_t>(app.width);
    app.config.height = static_cast<uint32_t>(app.height);
    wgpuSurfaceConfigure(app.surface, &app.config);
}

static void clearTarget(WGPUCommandEncoder encoder, WGPUTextureView view) {
    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = view;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {0.0, 0.0, 0.0, 1.0};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.label = toStringView("Clear");
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
}

// -----------------------------------------------------------------------------
// Main Loop
// -----------------------------------------------------------------------------

static bool mainLoopIteration(Application::Impl& app) {
    glfwPollEvents();

    if (app.viewer.quitRequested) {
        return false;
    }

    applyFullscreen(app);

    // Handle window resize
    int fbWidth = 0, fbHeight = 0;
    glfwGetFramebufferSize(app.window, &fbWidth, &fbHeight);
    if (fbWidth != app.width || fbHeight != app.height) {
        app.width = fbWidth;
        app.height = fbHeight;
        if (app.width > 0 && app.height > 0) {
            configureSurface(app);
        }
    }
    if (app.width <= 0 || app.height <= 0) {
        // Minimized
        glfwWaitEventsTimeout(0.05);
        return true;
    }

    // Upload the newest decoded frame, if any arrived since last iteration
    if (auto frame = app.session->frames().tryTake()) {
        if (*frame && app.frameTexture->update(app.device, app.queue, **frame)) {
            app.videoFrameCount++;
        }
    }

    if (!app.reportedCaptureError &&
        app.session->state() == video::CaptureSession::State::Failed) {
        std::cerr << "Capture stopped: " << app.session->lastError().value_or("unknown error")
                  << std::endl;
        app.reportedCaptureError = true;
    }

    // Get current texture
    WGPUSurfaceTexture surfaceTexture;
    wgpuSurfaceGetCurrentTexture(app.surface, &surfaceTexture);
    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfaceTexture.texture) {
            wgpuTextureRelease(surfaceTexture.texture);
        }
        if (surfaceTexture.status == WGPUSurfaceGetCurrentTextureStatus_Outdated ||
            surfaceTexture.status == WGPUSurfaceGetCurrentTextureStatus_Lost) {
            configureSurface(app);
        }
        return true;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = app.surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = toStringView("Frame Encoder");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(app.device, &encoderDesc);

    if (app.frameTexture->valid()) {
        const storage::ViewerConfig& cfg = app.store->config();
        crt::Extent target{static_cast<uint32_t>(app.width), static_cast<uint32_t>(app.height)};
        app.graph->render(encoder, view, app.frameTexture->view(), app.frameTexture->size(),
                          target, cfg.shader, cfg.pixelateEnabled, cfg.crtEnabled);
    } else {
        clearTarget(encoder, view);
    }

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(app.queue, 1, &cmdBuffer);

    wgpuSurfacePresent(app.surface);
    wgpuDevicePoll(app.device, false, nullptr);

    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);
    wgpuTextureViewRelease(view);
    wgpuTextureRelease(surfaceTexture.texture);

    // FPS counter and title update
    app.frameCount++;
    double currentTime = glfwGetTime();
    if (currentTime - app.lastFpsTime >= 1.0) {
        std::string title = "Michadame (" + std::to_string(app.frameCount) + " fps, video " +
                            std::to_string(app.videoFrameCount) + " fps)";
        glfwSetWindowTitle(app.window, title.c_str());
        app.frameCount = 0;
        app.videoFrameCount = 0;
        app.lastFpsTime = currentTime;
    }

    return true;
}

// -----------------------------------------------------------------------------
// Application
// -----------------------------------------------------------------------------

Application::~Application() {
    shutdown();
}

int Application::init(const AppConfig& config) {
    if (m_initialized) {
        return 0;  // Already initialized
    }

    m_impl = new Impl();

    // Load settings and apply command-line overrides
    std::string configPath = config.configPath.empty() ? storage::defaultConfigPath()
                                                       : config.configPath;
    m_impl->store = std::make_unique<storage::ConfigStore>(configPath);
    if (applyOverrides(m_impl->store->config(), config.overrides)) {
        m_impl->store->markDirty();
    }

    // Validate the capture request before touching the GPU
    video::CaptureConfig captureConfig;
    try {
        captureConfig = m_impl->store->config().captureConfig();
        captureConfig.validate();
    } catch (const video::CaptureError& e) {
        std::cerr << "Invalid capture settings: " << e.what() << std::endl;
        return 1;
    }

    // Initialize GLFW
    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return 1;
    }
    m_impl->glfwReady = true;

    // No OpenGL context - we're using WebGPU
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

    m_impl->window = glfwCreateWindow(config.windowWidth, config.windowHeight,
                                      "Michadame", nullptr, nullptr);
    if (!m_impl->window) {
        std::cerr << "Failed to create window" << std::endl;
        return 1;
    }
    m_impl->windowedWidth = config.windowWidth;
    m_impl->windowedHeight = config.windowHeight;

    // Create WebGPU instance
    WGPUInstanceDescriptor instanceDesc = {};
    m_impl->instance = wgpuCreateInstance(&instanceDesc);
    if (!m_impl->instance) {
        std::cerr << "Failed to create WebGPU instance" << std::endl;
        return 1;
    }

    // Create surface from GLFW window
    m_impl->surface = glfwCreateWindowWGPUSurface(m_impl->instance, m_impl->window);
    if (!m_impl->surface) {
        std::cerr << "Failed to create surface" << std::endl;
        return 1;
    }

    // Request adapter
    std::cout << "Requesting adapter..." << std::endl;
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = m_impl->surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo adapterCallback = {};
    adapterCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallback.callback = onAdapterRequestEnded;
    adapterCallback.userdata1 = &adapterData;

    wgpuInstanceRequestAdapter(m_impl->instance, &adapterOpts, adapterCallback);

    // wgpu-native completes the request synchronously with AllowSpontaneous
    while (!adapterData.done) {
    }

    if (!adapterData.adapter) {
        std::cerr << "Failed to get adapter" << std::endl;
        return 1;
    }
    m_impl->adapter = adapterData.adapter;

    // Request device
    std::cout << "Requesting device..." << std::endl;
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("Michadame Device");
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &deviceData;

    wgpuAdapterRequestDevice(m_impl->adapter, &deviceDesc, deviceCallback);

    while (!deviceData.done) {
    }

    if (!deviceData.device) {
        std::cerr << "Failed to get device" << std::endl;
        return 1;
    }
    m_impl->device = deviceData.device;
    m_impl->queue = wgpuDeviceGetQueue(m_impl->device);

    // Configure surface
    glfwGetFramebufferSize(m_impl->window, &m_impl->width, &m_impl->height);

    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_impl->surface, m_impl->adapter, &capabilities);
    m_impl->surfaceFormat = chooseSurfaceFormat(capabilities);
    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    m_impl->configExtras = {};
    m_impl->configExtras.chain.sType = static_cast<WGPUSType>(WGPUSType_SurfaceConfigurationExtras);
    m_impl->configExtras.desiredMaximumFrameLatency = 2;

    m_impl->config = {};
    m_impl->config.nextInChain = &m_impl->configExtras.chain;
    m_impl->config.device = m_impl->device;
    m_impl->config.format = m_impl->surfaceFormat;
    m_impl->config.presentMode = WGPUPresentMode_Fifo;
    m_impl->config.alphaMode = WGPUCompositeAlphaMode_Auto;
    m_impl->config.usage = WGPUTextureUsage_RenderAttachment;
    configureSurface(*m_impl);

    std::cout << "WebGPU initialized, window " << m_impl->width << "x" << m_impl->height
              << std::endl;

    // Render graph
    try {
        m_impl->graph = std::make_unique<crt::RenderGraph>(m_impl->device, m_impl->queue,
                                                           m_impl->surfaceFormat);
    } catch (const std::runtime_error& e) {
        std::cerr << "Failed to build render graph: " << e.what() << std::endl;
        return 1;
    }
    m_impl->frameTexture = std::make_unique<crt::FrameTexture>();

    // Keyboard shortcuts
    glfwSetWindowUserPointer(m_impl->window, m_impl);
    glfwSetKeyCallback(m_impl->window, [](GLFWwindow* w, int key, int scancode, int action, int mods) {
        auto* app = static_cast<Application::Impl*>(glfwGetWindowUserPointer(w));
        ViewerKey viewerKey;
        if (!app || action != GLFW_PRESS || !mapKey(key, viewerKey)) {
            return;
        }
        if (handleViewerKey(viewerKey, app->viewer, app->store->config())) {
            app->store->markDirty();
        }
    });

    if (config.startFullscreen) {
        m_impl->viewer.fullscreen = FullscreenState::Fullscreen;
    }

    // Start capture
    m_impl->session = std::make_unique<video::CaptureSession>();
    m_impl->session->start(captureConfig);

    m_impl->lastFpsTime = glfwGetTime();
    m_initialized = true;
    return 0;
}

int Application::run() {
    if (!m_initialized || !m_impl) {
        return 1;
    }

    while (!glfwWindowShouldClose(m_impl->window)) {
        if (!mainLoopIteration(*m_impl)) {
            break;
        }
    }

    return 0;
}

void Application::shutdown() {
    if (!m_impl) {
        return;
    }

    std::cout << "Shutting down..." << std::endl;

    // Capture threads go first so nothing publishes into a dying loop
    if (m_impl->session) {
        m_impl->session->stop();
    }

    // GPU resources must be released before the device
    if (m_impl->frameTexture) {
        m_impl->frameTexture->release();
    }
    if (m_impl->graph) {
        m_impl->graph->destroy();
    }
    if (m_impl->device) {
        effects::gpu::releaseSamplers(m_impl->device);
    }

    // WebGPU cleanup
    if (m_impl->surface && m_impl->device) {
        wgpuSurfaceUnconfigure(m_impl->surface);
    }
    if (m_impl->queue) {
        wgpuQueueRelease(m_impl->queue);
    }
    if (m_impl->device) {
        wgpuDeviceRelease(m_impl->device);
    }
    if (m_impl->adapter) {
        wgpuAdapterRelease(m_impl->adapter);
    }
    if (m_impl->surface) {
        wgpuSurfaceRelease(m_impl->surface);
    }
    if (m_impl->instance) {
        wgpuInstanceRelease(m_impl->instance);
    }
    if (m_impl->window) {
        glfwDestroyWindow(m_impl->window);
    }
    if (m_impl->glfwReady) {
        glfwTerminate();
    }

    // Saves the config if a toggle or parameter changed
    delete m_impl;
    m_impl = nullptr;
    m_initialized = false;
}

} // namespace michadame
