#pragma once

#include "fine2d/core/error.hpp"
#include "fine2d/graphics/color.hpp"
#include "fine2d/graphics/draw_command.hpp"

#include <cstdint>

namespace fine2d {

/**
 * @brief One flushed batch as seen by the device
 *
 * Pointers stay valid only for the duration of RenderDevice::submit().
 * Indices are already rebased onto this batch's vertex array.
 */
struct BatchData {
    const DrawState& state;
    const Vertex* vertices;
    uint32_t vertexCount;
    const uint32_t* indices;
    uint32_t indexCount;
};

/**
 * @brief GPU-side consumer of batches
 *
 * Implementations either return an error Status or throw (DeviceError);
 * the Batcher turns both into ErrorKind::DeviceResourceError. Each
 * submit() is exactly one draw call.
 */
class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    /// Start recording a frame; the screen canvas is the initial target
    virtual Status beginFrame() = 0;

    /// Draw one batch into the current target
    virtual Status submit(const BatchData& batch) = 0;

    /// Redirect subsequent batches to another canvas
    virtual Status setCanvas(CanvasHandle canvas) = 0;

    /// Fill the current target with one color
    virtual Status clear(const Color& color) = 0;

    /// Reallocate the virtual screen canvas. Only called between frames.
    virtual Status resizeScreen(uint32_t width, uint32_t height) = 0;

    /// Finish recording into canvases. Called after the trailing flush.
    virtual Status endFrame() = 0;

    /// Hard upper bound on vertices per submit, 0 if unbounded
    virtual uint32_t maxVertices() const { return 0; }
};

} // namespace fine2d
