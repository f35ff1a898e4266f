// Michadame CRT - Frame Texture Upload

#include <michadame/crt/frame_texture.h>
#include <michadame/effects/gpu_common.h>
#include <iostream>

namespace michadame::crt {

using effects::gpu::toStringView;

void expandRGB24toRGBA(const uint8_t* src, uint8_t* dst, size_t pixelCount) {
    for (size_t i = 0; i < pixelCount; i++) {
        dst[i * 4 + 0] = src[i * 3 + 0];
        dst[i * 4 + 1] = src[i * 3 + 1];
        dst[i * 4 + 2] = src[i * 3 + 2];
        dst[i * 4 + 3] = 255;
    }
}

FrameTexture::~FrameTexture() {
    release();
}

void FrameTexture::release() {
    effects::gpu::release(m_view);
    if (m_texture) {
        wgpuTextureDestroy(m_texture);
        effects::gpu::release(m_texture);
    }
    m_size = {};
}

bool FrameTexture::createTexture(WGPUDevice device, Extent size) {
    release();

    WGPUTextureDescriptor desc = {};
    desc.label = toStringView("CaptureFrame");
    desc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
    desc.dimension = WGPUTextureDimension_2D;
    desc.size = {size.width, size.height, 1};
    desc.format = WGPUTextureFormat_RGBA8Unorm;
    desc.mipLevelCount = 1;
    desc.sampleCount = 1;

    m_texture = wgpuDeviceCreateTexture(device, &desc);
    if (!m_texture) {
        std::cerr << "[FrameTexture] Failed to create texture" << std::endl;
        return false;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.label = toStringView("CaptureFrameView");
    viewDesc.format = WGPUTextureFormat_RGBA8Unorm;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    m_view = wgpuTextureCreateView(m_texture, &viewDesc);
    if (!m_view) {
        std::cerr << "[FrameTexture] Failed to create texture view" << std::endl;
        release();
        return false;
    }

    m_size = size;
    std::cout << "[FrameTexture] Allocated " << size.width << "x" << size.height << std::endl;
    return true;
}

bool FrameTexture::update(WGPUDevice device, WGPUQueue queue, const video::DecodedFrame& frame) {
    Extent size{frame.width, frame.height};
    if (size.empty() || frame.rgb.size() < frame.expectedSize()) {
        std::cerr << "[FrameTexture] Ignoring malformed frame " << frame.width << "x"
                  << frame.height << " (" << frame.rgb.size() << " bytes)" << std::endl;
        return false;
    }

    if (size != m_size || !m_texture) {
        if (!createTexture(device, size)) {
            return false;
        }
    }

    size_t pixelCount = static_cast<size_t>(size.width) * size.height;
    m_staging.resize(pixelCount * 4);
    expandRGB24toRGBA(frame.rgb.data(), m_staging.data(), pixelCount);

    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = m_texture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, 0};
    destination.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferLayout dataLayout = {};
    dataLayout.offset = 0;
    dataLayout.bytesPerRow = size.width * 4;
    dataLayout.rowsPerImage = size.height;

    WGPUExtent3D writeSize = {size.width, size.height, 1};

    wgpuQueueWriteTexture(queue, &destination, m_staging.data(),
                          m_staging.size(), &dataLayout, &writeSize);
    return true;
}

} // namespace michadame::crt
