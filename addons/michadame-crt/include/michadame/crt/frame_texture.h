#pragma once

/**
 * @file frame_texture.h
 * @brief GPU texture holding the most recent decoded frame
 */

#include <michadame/crt/render_layout.h>
#include <michadame/video/decoded_frame.h>
#include <webgpu/webgpu.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace michadame::crt {

/**
 * @brief Expand packed RGB24 to RGBA8 with opaque alpha.
 * @param dst Must hold pixelCount * 4 bytes
 */
void expandRGB24toRGBA(const uint8_t* src, uint8_t* dst, size_t pixelCount);

/**
 * @brief RGBA8 texture fed from decoded frames on the render thread.
 *
 * The texture is recreated whenever the frame size changes.
 */
class FrameTexture {
public:
    FrameTexture() = default;
    ~FrameTexture();

    FrameTexture(const FrameTexture&) = delete;
    FrameTexture& operator=(const FrameTexture&) = delete;

    /**
     * @brief Upload a frame.
     * @return false if the frame is malformed or the texture could not be created
     */
    bool update(WGPUDevice device, WGPUQueue queue, const video::DecodedFrame& frame);

    WGPUTextureView view() const { return m_view; }
    Extent size() const { return m_size; }
    bool valid() const { return m_view != nullptr; }

    void release();

private:
    bool createTexture(WGPUDevice device, Extent size);

    WGPUTexture m_texture = nullptr;
    WGPUTextureView m_view = nullptr;
    Extent m_size;
    std::vector<uint8_t> m_staging;
};

} // namespace michadame::crt
