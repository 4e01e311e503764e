/**
 * @file test_doubles.hpp
 * @brief Recording render device and scripted platform for GPU-free tests
 */

#pragma once

#include <fine2d/engine/platform.hpp>
#include <fine2d/graphics/render_device.hpp>

#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fine2d {
namespace testing {

/// Copy of one submitted batch
struct RecordedBatch {
    DrawState state;
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    CanvasHandle canvas;
};

/**
 * @brief RenderDevice that records everything it is asked to draw
 *
 * failNextSubmit / throwNextSubmit make the next submit() fail with a
 * returned error or a thrown DeviceError respectively.
 */
class RecordingDevice : public RenderDevice {
public:
    Status beginFrame() override {
        frames++;
        canvas = CanvasHandle::screen();
        return ok();
    }

    Status submit(const BatchData& batch) override {
        if (failNextSubmit) {
            failNextSubmit = false;
            failedSubmits++;
            return makeError(ErrorKind::DeviceResourceError, "submit rejected");
        }
        if (throwNextSubmit) {
            throwNextSubmit = false;
            failedSubmits++;
            throw DeviceError("Failed to map vertex ring", -2);
        }

        RecordedBatch recorded;
        recorded.state = batch.state;
        recorded.vertices.assign(batch.vertices, batch.vertices + batch.vertexCount);
        recorded.indices.assign(batch.indices, batch.indices + batch.indexCount);
        recorded.canvas = canvas;
        batches.push_back(std::move(recorded));
        return ok();
    }

    Status setCanvas(CanvasHandle target) override {
        canvas = target;
        canvasSwitches++;
        return ok();
    }

    Status clear(const Color& color) override {
        clears.push_back({canvas, color});
        clearsBeforeBatch.push_back(batches.size());
        return ok();
    }

    Status resizeScreen(uint32_t width, uint32_t height) override {
        screenSize = glm::uvec2(width, height);
        return ok();
    }

    Status endFrame() override {
        endedFrames++;
        return ok();
    }

    uint32_t maxVertices() const override { return deviceLimit; }

    /// All vertices ever submitted, in submission order
    std::vector<Vertex> allVertices() const {
        std::vector<Vertex> out;
        for (const auto& b : batches) {
            out.insert(out.end(), b.vertices.begin(), b.vertices.end());
        }
        return out;
    }

    std::vector<RecordedBatch> batches;
    std::vector<std::pair<CanvasHandle, Color>> clears;
    std::vector<size_t> clearsBeforeBatch;     // batches.size() at each clear
    CanvasHandle canvas;
    glm::uvec2 screenSize{0, 0};
    int frames = 0;
    int endedFrames = 0;
    int canvasSwitches = 0;
    int failedSubmits = 0;
    bool failNextSubmit = false;
    bool throwNextSubmit = false;
    uint32_t deviceLimit = 0;
};

/**
 * @brief Platform that replays a script of per-frame event lists
 *
 * Frame i of the script is returned by the i-th pollEvents(). Once the
 * script runs out, a Quit event is emitted so loops always terminate.
 */
class ScriptedPlatform : public Platform {
public:
    explicit ScriptedPlatform(glm::uvec2 size = {1280, 720}) : size_(size) {}

    void addFrame(std::vector<PlatformEvent> events) { script_.push_back(std::move(events)); }

    /// Queue n frames with no events
    void addIdleFrames(int n) {
        for (int i = 0; i < n; i++) {
            script_.push_back({});
        }
    }

    std::vector<PlatformEvent> pollEvents() override {
        polls++;
        if (script_.empty()) {
            return {event::Quit{}};
        }
        std::vector<PlatformEvent> events = std::move(script_.front());
        script_.pop_front();
        for (const auto& ev : events) {
            if (auto* resized = std::get_if<event::Resized>(&ev)) {
                size_ = {resized->width, resized->height};
            }
        }
        return events;
    }

    glm::uvec2 windowSize() const override { return size_; }

    Status bindViewport(const Rect& viewport, const Color& color) override {
        lastViewport = viewport;
        lastLetterbox = color;
        viewportBinds++;
        return ok();
    }

    Status present() override {
        if (failPresent) {
            return makeError(ErrorKind::PlatformError, "surface lost");
        }
        presents++;
        return ok();
    }

    int polls = 0;
    int presents = 0;
    int viewportBinds = 0;
    bool failPresent = false;
    std::optional<Rect> lastViewport;
    Color lastLetterbox;

private:
    glm::uvec2 size_;
    std::deque<std::vector<PlatformEvent>> script_;
};

/// A quad command with the given texture id, positioned by index
inline DrawCommand quadCommand(uint32_t textureId, float x, BlendMode blend = BlendMode::Alpha) {
    DrawCommand cmd;
    cmd.state.texture = TextureHandle{textureId, 16, 16};
    cmd.state.blend = blend;
    Color white = Color::WHITE;
    cmd.vertices = {
        Vertex(x, 0.0f, 0.0f, 0.0f, white),
        Vertex(x, 16.0f, 0.0f, 1.0f, white),
        Vertex(x + 16.0f, 16.0f, 1.0f, 1.0f, white),
        Vertex(x + 16.0f, 0.0f, 1.0f, 0.0f, white),
    };
    cmd.indices = {0, 1, 2, 2, 3, 0};
    return cmd;
}

} // namespace testing
} // namespace fine2d
