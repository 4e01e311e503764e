#pragma once

#include "fine2d/graphics/vertex.hpp"

#include <cstdint>
#include <vector>

namespace fine2d {

/**
 * @brief Growable CPU staging area for one open batch
 *
 * Vertices and indices are appended in submission order. Indices passed to
 * append() are relative to the appended vertices and get rebased onto the
 * running vertex count.
 */
class GeometryBuffer {
public:
    GeometryBuffer() = default;
    explicit GeometryBuffer(uint32_t reserveVertices);

    /// Append vertices with command-local indices (empty = triangle list)
    void append(const std::vector<Vertex>& vertices, const std::vector<uint32_t>& indices);

    void clear();

    bool empty() const { return vertices_.empty(); }
    uint32_t vertexCount() const { return static_cast<uint32_t>(vertices_.size()); }
    uint32_t indexCount() const { return static_cast<uint32_t>(indices_.size()); }

    const std::vector<Vertex>& vertices() const { return vertices_; }
    const std::vector<uint32_t>& indices() const { return indices_; }

    /// Grow the backing storage without changing contents
    void reserve(uint32_t vertexCount);

private:
    std::vector<Vertex> vertices_;
    std::vector<uint32_t> indices_;
};

} // namespace fine2d
