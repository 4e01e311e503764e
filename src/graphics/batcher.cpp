#include "fine2d/graphics/batcher.hpp"
#include "fine2d/core/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace fine2d {

namespace {

uint32_t clampToDevice(uint32_t requested, const RenderDevice& device) {
    uint32_t deviceMax = device.maxVertices();
    if (deviceMax != 0 && requested > deviceMax) {
        FINE2D_WARN(LogCategory::Batch,
            "Vertex capacity " + std::to_string(requested) +
            " exceeds device limit, clamped to " + std::to_string(deviceMax));
        return deviceMax;
    }
    return requested;
}

} // anonymous namespace

Batcher::Batcher(RenderDevice& device, uint32_t vertexCapacity)
    : device_(device), capacity_(clampToDevice(vertexCapacity, device)) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Batcher: vertex capacity must be greater than zero");
    }
    buffer_.reserve(capacity_);
}

template<typename F>
Status Batcher::guarded(const char* operation, F&& call) {
    try {
        Status status = call();
        if (!status) {
            FINE2D_ERROR(LogCategory::Batch,
                std::string(operation) + " failed: " + status.error().describe());
        }
        return status;
    } catch (const std::exception& e) {
        FINE2D_ERROR(LogCategory::Batch, std::string(operation) + " threw: " + e.what());
        return makeError(ErrorKind::DeviceResourceError,
                         std::string(operation) + ": " + e.what());
    }
}

Status Batcher::beginFrame() {
    if (inFrame_) {
        FINE2D_WARN(LogCategory::Batch, "beginFrame() called twice without presentFrame()");
    }

    buffer_.clear();
    tracker_.reset();
    stats_ = BatchStats{};
    canvas_ = CanvasHandle::screen();
    inFrame_ = true;

    return guarded("Device beginFrame", [this] { return device_.beginFrame(); });
}

Status Batcher::draw(const DrawCommand& command) {
    uint32_t incoming = command.vertexCount();
    if (incoming == 0) {
        return ok();
    }

    if (incoming > capacity_) {
        FINE2D_ERROR(LogCategory::Batch,
            "Draw command with " + std::to_string(incoming) +
            " vertices exceeds capacity " + std::to_string(capacity_));
        return makeError(ErrorKind::CapacityExceededButUnflushable,
            "command has " + std::to_string(incoming) + " vertices, ceiling is " +
            std::to_string(capacity_));
    }

    // Checked before any flush so a rejected command leaves the batch as it was
    if (!command.indices.empty()) {
        if (command.indices.size() % 3 != 0) {
            FINE2D_ERROR(LogCategory::Batch,
                "Draw command index count " + std::to_string(command.indices.size()) +
                " is not a multiple of 3");
            return makeError(ErrorKind::InvalidConfiguration,
                "index count " + std::to_string(command.indices.size()) +
                " does not form whole triangles");
        }
        for (uint32_t index : command.indices) {
            if (index >= incoming) {
                FINE2D_ERROR(LogCategory::Batch,
                    "Draw command index " + std::to_string(index) +
                    " out of range for " + std::to_string(incoming) + " vertices");
                return makeError(ErrorKind::InvalidConfiguration,
                    "index " + std::to_string(index) + " out of range, command has " +
                    std::to_string(incoming) + " vertices");
            }
        }
    }

    if (tracker_.requiresFlush(command.state)) {
        Status status = flush();
        if (!status) {
            return status;
        }
    }

    if (buffer_.vertexCount() + incoming > capacity_) {
        Status status = flush();
        if (!status) {
            return status;
        }
    }

    tracker_.bind(command.state);
    buffer_.append(command.vertices, command.indices);
    stats_.commands++;
    return ok();
}

Status Batcher::flush() {
    if (buffer_.empty()) {
        tracker_.reset();
        return ok();
    }

    BatchData batch{
        *tracker_.current(),
        buffer_.vertices().data(),
        buffer_.vertexCount(),
        buffer_.indices().data(),
        buffer_.indexCount()
    };

    FINE2D_TRACE(LogCategory::Batch,
        "Flush " + std::to_string(batch.vertexCount) + " vertices, " +
        std::to_string(batch.indexCount) + " indices [" + batch.state.describe() + "]");

    Status status = guarded("Batch submit", [this, &batch] { return device_.submit(batch); });

    if (status) {
        stats_.flushes++;
        stats_.vertices += batch.vertexCount;
        stats_.indices += batch.indexCount;
    }

    // The batch is gone either way
    buffer_.clear();
    tracker_.reset();
    return status;
}

Status Batcher::presentFrame() {
    Status flushStatus = flush();
    inFrame_ = false;

    Status endStatus = guarded("Device endFrame", [this] { return device_.endFrame(); });

    if (!flushStatus) {
        return flushStatus;
    }
    return endStatus;
}

Status Batcher::setCanvas(CanvasHandle canvas) {
    if (canvas == canvas_) {
        return ok();
    }

    Status status = flush();
    if (!status) {
        return status;
    }

    status = guarded("Device setCanvas", [this, canvas] { return device_.setCanvas(canvas); });
    if (!status) {
        return status;
    }

    canvas_ = canvas;
    stats_.canvasSwitches++;
    FINE2D_TRACE(LogCategory::Batch, "Canvas switched to " + std::to_string(canvas.id));
    return ok();
}

Status Batcher::clear(const Color& color) {
    Status status = flush();
    if (!status) {
        return status;
    }

    status = guarded("Device clear", [this, &color] { return device_.clear(color); });
    if (status) {
        stats_.clears++;
    }
    return status;
}

Status Batcher::setCapacity(uint32_t vertexCapacity) {
    if (vertexCapacity == 0) {
        return makeError(ErrorKind::InvalidConfiguration, "vertex capacity must be greater than zero");
    }

    uint32_t clamped = clampToDevice(vertexCapacity, device_);
    if (buffer_.vertexCount() > clamped) {
        Status status = flush();
        if (!status) {
            return status;
        }
    }

    capacity_ = clamped;
    buffer_.reserve(capacity_);
    FINE2D_DEBUG(LogCategory::Batch, "Vertex capacity set to " + std::to_string(capacity_));
    return ok();
}

} // namespace fine2d
