/**
 * @file test_batcher.cpp
 * @brief Batcher tests - flush policy, ordering, capacity and failure handling
 *
 * This test verifies:
 * - Same-signature commands merge into one draw call in submission order
 * - Signature changes and the capacity ceiling force flushes
 * - Oversized commands are rejected without disturbing the open batch
 * - Device failures surface as DeviceResourceError and reset the batch
 * - Canvas switches and clears flush
 */

#include <fine2d/core/logging.hpp>
#include <fine2d/graphics/batcher.hpp>
#include <fine2d/graphics/drawable.hpp>

#include "test_doubles.hpp"

#include <iostream>
#include <cassert>

using namespace fine2d;
using namespace fine2d::testing;

void test_same_signature_single_flush() {
    std::cout << "Testing: Same-signature commands share one flush... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);

    assert(batcher.beginFrame());
    for (int i = 0; i < 10; i++) {
        assert(batcher.draw(quadCommand(1, static_cast<float>(i) * 20.0f)));
    }
    assert(device.batches.empty());
    assert(batcher.pendingVertices() == 40);
    assert(batcher.presentFrame());

    assert(device.batches.size() == 1);
    assert(batcher.stats().flushes == 1);
    assert(batcher.stats().commands == 10);
    assert(device.batches[0].vertices.size() == 40);
    assert(device.batches[0].indices.size() == 60);

    // Submission order survives: quad i starts at x = 20 * i
    for (int i = 0; i < 10; i++) {
        assert(device.batches[0].vertices[i * 4].position.x == static_cast<float>(i) * 20.0f);
    }

    std::cout << "PASSED\n";
}

void test_indices_rebased() {
    std::cout << "Testing: Indices are rebased onto the batch... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);

    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f)));
    assert(batcher.draw(quadCommand(1, 20.0f)));
    assert(batcher.presentFrame());

    const auto& indices = device.batches[0].indices;
    std::vector<uint32_t> expected = {0, 1, 2, 2, 3, 0, 4, 5, 6, 6, 7, 4};
    assert(indices == expected);

    // Commands without indices become a plain triangle list
    DrawCommand tri;
    tri.state.texture = TextureHandle{1, 16, 16};
    tri.vertices = {Vertex(0, 0, 0, 0, Color::WHITE), Vertex(1, 0, 1, 0, Color::WHITE),
                    Vertex(0, 1, 0, 1, Color::WHITE)};
    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f)));
    assert(batcher.draw(tri));
    assert(batcher.presentFrame());

    const auto& listIndices = device.batches[1].indices;
    assert(listIndices.size() == 9);
    assert(listIndices[6] == 4 && listIndices[7] == 5 && listIndices[8] == 6);

    std::cout << "PASSED\n";
}

void test_alternating_signatures() {
    std::cout << "Testing: Alternating signatures flush each time... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);

    const int n = 12;
    assert(batcher.beginFrame());
    for (int i = 0; i < n; i++) {
        assert(batcher.draw(quadCommand(i % 2 == 0 ? 1 : 2, static_cast<float>(i))));
    }
    assert(batcher.presentFrame());

    assert(device.batches.size() == static_cast<size_t>(n));
    assert(batcher.stats().flushes == static_cast<uint32_t>(n));
    for (int i = 0; i < n; i++) {
        assert(device.batches[i].state.texture.id == (i % 2 == 0 ? 1u : 2u));
    }

    std::cout << "PASSED\n";
}

void test_blend_and_scissor_split_batches() {
    std::cout << "Testing: Blend and scissor changes split batches... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);

    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f, BlendMode::Alpha)));
    assert(batcher.draw(quadCommand(1, 0.0f, BlendMode::Additive)));

    DrawCommand clipped = quadCommand(1, 0.0f, BlendMode::Additive);
    clipped.state.scissor = IRect(0, 0, 32, 32);
    assert(batcher.draw(clipped));
    assert(batcher.draw(clipped));
    assert(batcher.presentFrame());

    assert(device.batches.size() == 3);
    assert(device.batches[0].state.blend == BlendMode::Alpha);
    assert(device.batches[1].state.blend == BlendMode::Additive);
    assert(!device.batches[1].state.scissor.has_value());
    assert(device.batches[2].state.scissor == IRect(0, 0, 32, 32));
    assert(device.batches[2].vertices.size() == 8);

    std::cout << "PASSED\n";
}

void test_transforms_never_flush() {
    std::cout << "Testing: Position, rotation and scale never flush... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);
    TextureHandle texture{3, 32, 32};

    assert(batcher.beginFrame());
    for (int i = 0; i < 5; i++) {
        Sprite sprite;
        sprite.texture = texture;
        sprite.params.at({i * 10.0f, i * 5.0f})
                     .rotated(0.3f * i)
                     .scaled({1.0f + i, 2.0f - i});
        assert(batcher.draw(toDrawCommand(sprite)));
    }
    assert(batcher.presentFrame());
    assert(device.batches.size() == 1);

    std::cout << "PASSED\n";
}

void test_capacity_ceiling() {
    std::cout << "Testing: 100 sprites under a 64-vertex ceiling flush 7 times... ";

    RecordingDevice device;
    Batcher batcher(device, 64);

    assert(batcher.beginFrame());
    for (int i = 0; i < 100; i++) {
        assert(batcher.draw(quadCommand(1, static_cast<float>(i))));
    }
    assert(batcher.presentFrame());

    assert(device.batches.size() == 7);
    for (size_t i = 0; i < 6; i++) {
        assert(device.batches[i].vertices.size() == 64);
    }
    assert(device.batches[6].vertices.size() == 16);

    // Order preserved across flush boundaries
    auto all = device.allVertices();
    assert(all.size() == 400);
    for (int i = 0; i < 100; i++) {
        assert(all[i * 4].position.x == static_cast<float>(i));
    }

    std::cout << "PASSED\n";
}

void test_oversized_command_rejected() {
    std::cout << "Testing: Oversized command is rejected untouched... ";

    RecordingDevice device;
    Batcher batcher(device, 8);

    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f)));

    DrawCommand big;
    big.state.texture = TextureHandle{1, 16, 16};
    big.vertices.resize(12);

    Status status = batcher.draw(big);
    assert(!status);
    assert(status.error().kind == ErrorKind::CapacityExceededButUnflushable);

    // The open batch is still there and still flushes normally
    assert(batcher.pendingVertices() == 4);
    assert(device.batches.empty());
    assert(batcher.presentFrame());
    assert(device.batches.size() == 1);
    assert(device.batches[0].vertices.size() == 4);

    std::cout << "PASSED\n";
}

void test_bad_indices_rejected() {
    std::cout << "Testing: Out-of-range or partial-triangle indices are rejected... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);

    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f)));

    // Index 5 would land on a vertex of the quad already in the batch
    DrawCommand mesh;
    mesh.state.texture = TextureHandle{2, 16, 16};
    mesh.vertices = {
        Vertex(0.0f, 0.0f, 0.0f, 0.0f, Color::WHITE),
        Vertex(8.0f, 0.0f, 1.0f, 0.0f, Color::WHITE),
        Vertex(0.0f, 8.0f, 0.0f, 1.0f, Color::WHITE),
    };
    mesh.indices = {0, 1, 5};

    Status status = batcher.draw(mesh);
    assert(!status);
    assert(status.error().kind == ErrorKind::InvalidConfiguration);

    mesh.indices = {0, 1};
    status = batcher.draw(mesh);
    assert(!status);
    assert(status.error().kind == ErrorKind::InvalidConfiguration);

    // No flush happened despite the texture change and the quad is intact
    assert(device.batches.empty());
    assert(batcher.pendingVertices() == 4);
    assert(batcher.stats().commands == 1);

    mesh.indices = {0, 1, 2};
    assert(batcher.draw(mesh));
    assert(batcher.presentFrame());
    assert(device.batches.size() == 2);
    assert(device.batches[0].indices == std::vector<uint32_t>({0, 1, 2, 2, 3, 0}));
    assert(device.batches[1].indices == std::vector<uint32_t>({0, 1, 2}));

    std::cout << "PASSED\n";
}

void test_failed_flush_resets_batch() {
    std::cout << "Testing: Failed flush surfaces the error and resets... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);

    // Failure during presentFrame
    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f)));
    device.failNextSubmit = true;
    Status status = batcher.presentFrame();
    assert(!status);
    assert(status.error().kind == ErrorKind::DeviceResourceError);
    assert(batcher.pendingVertices() == 0);
    assert(!batcher.inFrame());
    assert(device.endedFrames == 1);

    // Thrown device error during a signature-change flush inside draw()
    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f)));
    device.throwNextSubmit = true;
    status = batcher.draw(quadCommand(2, 0.0f));
    assert(!status);
    assert(status.error().kind == ErrorKind::DeviceResourceError);
    assert(batcher.pendingVertices() == 0);

    // The batcher is usable again afterwards
    assert(batcher.draw(quadCommand(2, 0.0f)));
    assert(batcher.presentFrame());
    assert(device.batches.size() == 1);
    assert(device.batches[0].state.texture.id == 2);
    assert(device.failedSubmits == 2);

    std::cout << "PASSED\n";
}

void test_empty_frame() {
    std::cout << "Testing: Empty frame makes no draw calls... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);

    assert(batcher.beginFrame());
    assert(batcher.flush());
    assert(batcher.endFrame());

    assert(device.batches.empty());
    assert(device.frames == 1);
    assert(device.endedFrames == 1);
    assert(batcher.stats().flushes == 0);

    std::cout << "PASSED\n";
}

void test_canvas_switch_flushes() {
    std::cout << "Testing: Canvas switch flushes the open batch... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);
    CanvasHandle offscreen{7};

    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f)));
    assert(batcher.setCanvas(offscreen));
    assert(device.batches.size() == 1);
    assert(device.batches[0].canvas == CanvasHandle::screen());

    assert(batcher.draw(quadCommand(1, 0.0f)));
    assert(batcher.setCanvas(offscreen));         // Same target: nothing happens
    assert(device.canvasSwitches == 1);

    assert(batcher.setCanvas(CanvasHandle::screen()));
    assert(device.batches.size() == 2);
    assert(device.batches[1].canvas == offscreen);
    assert(batcher.stats().canvasSwitches == 2);

    assert(batcher.presentFrame());

    // beginFrame starts on the screen again
    assert(batcher.beginFrame());
    assert(batcher.canvas() == CanvasHandle::screen());
    assert(batcher.presentFrame());

    std::cout << "PASSED\n";
}

void test_clear_keeps_paint_order() {
    std::cout << "Testing: Clear flushes earlier draws first... ";

    RecordingDevice device;
    Batcher batcher(device, 1024);
    CanvasHandle offscreen{3};

    assert(batcher.beginFrame());
    assert(batcher.draw(quadCommand(1, 0.0f)));
    assert(batcher.setCanvas(offscreen));
    assert(batcher.clear(Color::TRANSPARENT));
    assert(batcher.draw(quadCommand(1, 0.0f)));
    assert(batcher.clear(Color::RED));          // Wipes the quad just drawn
    assert(batcher.presentFrame());

    assert(device.clears.size() == 2);
    assert(device.clears[0].first == offscreen);
    assert(device.clears[0].second == Color::TRANSPARENT);
    assert(device.clearsBeforeBatch[0] == 1);
    assert(device.clearsBeforeBatch[1] == 2);
    assert(device.batches.size() == 2);
    assert(batcher.stats().clears == 2);

    std::cout << "PASSED\n";
}

void test_set_capacity() {
    std::cout << "Testing: Capacity changes and device limit... ";

    RecordingDevice device;
    device.deviceLimit = 32;
    Batcher batcher(device, 1024);
    assert(batcher.capacity() == 32);

    assert(batcher.beginFrame());
    for (int i = 0; i < 6; i++) {
        assert(batcher.draw(quadCommand(1, 0.0f)));
    }
    assert(batcher.pendingVertices() == 24);

    // Shrinking below the open batch flushes it first
    assert(batcher.setCapacity(16));
    assert(device.batches.size() == 1);
    assert(batcher.capacity() == 16);

    Status status = batcher.setCapacity(0);
    assert(!status);
    assert(status.error().kind == ErrorKind::InvalidConfiguration);
    assert(batcher.capacity() == 16);

    assert(batcher.presentFrame());

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - Batcher Tests\n";
    std::cout << "========================================\n\n";

    Logger::global().setMinLevel(LogLevel::Fatal);

    try {
        test_same_signature_single_flush();
        test_indices_rebased();
        test_alternating_signatures();
        test_blend_and_scissor_split_batches();
        test_transforms_never_flush();
        test_capacity_ceiling();
        test_oversized_command_rejected();
        test_bad_indices_rejected();
        test_failed_flush_resets_batch();
        test_empty_frame();
        test_canvas_switch_flushes();
        test_clear_keeps_paint_order();
        test_set_capacity();

        std::cout << "\n========================================\n";
        std::cout << "All Batcher tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
