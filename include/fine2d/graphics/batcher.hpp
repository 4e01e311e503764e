#pragma once

#include "fine2d/core/error.hpp"
#include "fine2d/graphics/draw_command.hpp"
#include "fine2d/graphics/draw_state_tracker.hpp"
#include "fine2d/graphics/geometry_buffer.hpp"
#include "fine2d/graphics/render_device.hpp"

#include <cstdint>

namespace fine2d {

/// Default ceiling: 2048 quads
constexpr uint32_t DEFAULT_VERTEX_CAPACITY = 2048 * 4;

/// Counters for the current frame, reset by beginFrame()
struct BatchStats {
    uint32_t flushes = 0;       // Draw calls handed to the device
    uint32_t vertices = 0;      // Vertices flushed
    uint32_t indices = 0;       // Indices flushed
    uint32_t commands = 0;      // Commands accepted by draw()
    uint32_t canvasSwitches = 0;
    uint32_t clears = 0;
};

/**
 * @brief Accumulates draw commands into as few device draw calls as possible
 *
 * Before each draw the open batch is flushed if the incoming command's
 * signature (texture, shader, blend, scissor) differs, or if its vertices
 * would push the batch past the capacity ceiling. Geometry is never
 * reordered. presentFrame() always performs the trailing flush.
 *
 * @code
 * Batcher batcher(device, 8192);
 * batcher.beginFrame();
 * batcher.draw(toDrawCommand(sprite));
 * Status status = batcher.presentFrame();
 * @endcode
 */
class Batcher {
public:
    explicit Batcher(RenderDevice& device, uint32_t vertexCapacity = DEFAULT_VERTEX_CAPACITY);

    // Non-copyable
    Batcher(const Batcher&) = delete;
    Batcher& operator=(const Batcher&) = delete;

    /// Reset the open batch and per-frame stats, start a device frame
    Status beginFrame();

    /**
     * @brief Append one command to the open batch
     *
     * May flush first. A command with more vertices than the ceiling is
     * rejected with CapacityExceededButUnflushable and the open batch is
     * left untouched. Explicit indices must form whole triangles and stay
     * below the command's vertex count, or the command is rejected with
     * InvalidConfiguration, again without touching the batch. If a required
     * flush fails the command is dropped and the device error is returned.
     */
    Status draw(const DrawCommand& command);

    /// Submit the open batch as one draw call. No-op when empty.
    Status flush();

    /// Trailing flush and end of the device frame
    Status presentFrame();

    /// Same as presentFrame()
    Status endFrame() { return presentFrame(); }

    /// Switch render target; flushes the open batch first
    Status setCanvas(CanvasHandle canvas);
    CanvasHandle canvas() const { return canvas_; }

    /// Fill the current target; earlier draws are flushed so order holds
    Status clear(const Color& color);

    /// Change the ceiling. Flushes the open batch if it no longer fits.
    Status setCapacity(uint32_t vertexCapacity);
    uint32_t capacity() const { return capacity_; }

    const BatchStats& stats() const { return stats_; }
    bool inFrame() const { return inFrame_; }
    uint32_t pendingVertices() const { return buffer_.vertexCount(); }

private:
    template<typename F>
    Status guarded(const char* operation, F&& call);

    RenderDevice& device_;
    GeometryBuffer buffer_;
    DrawStateTracker tracker_;
    CanvasHandle canvas_;
    BatchStats stats_;
    uint32_t capacity_;
    bool inFrame_ = false;
};

} // namespace fine2d
