#include "fine2d/graphics/geometry_buffer.hpp"

namespace fine2d {

GeometryBuffer::GeometryBuffer(uint32_t reserveVertices) {
    reserve(reserveVertices);
}

void GeometryBuffer::append(const std::vector<Vertex>& vertices,
                            const std::vector<uint32_t>& indices) {
    uint32_t base = vertexCount();

    vertices_.insert(vertices_.end(), vertices.begin(), vertices.end());

    if (indices.empty()) {
        for (uint32_t i = 0; i < vertices.size(); i++) {
            indices_.push_back(base + i);
        }
    } else {
        for (uint32_t index : indices) {
            indices_.push_back(base + index);
        }
    }
}

void GeometryBuffer::clear() {
    // Keeps capacity; the buffer is reused every batch
    vertices_.clear();
    indices_.clear();
}

void GeometryBuffer::reserve(uint32_t vertexCount) {
    vertices_.reserve(vertexCount);
    // Quads are the common case: 6 indices per 4 vertices
    indices_.reserve(vertexCount / 2 * 3);
}

} // namespace fine2d
