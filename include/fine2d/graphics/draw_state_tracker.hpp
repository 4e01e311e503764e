#pragma once

#include "fine2d/graphics/draw_command.hpp"

#include <optional>

namespace fine2d {

/**
 * @brief Remembers the signature of the open batch
 *
 * Only texture, shader, blend and scissor participate. Transform
 * differences never reach here because they are baked into vertices.
 */
class DrawStateTracker {
public:
    /// True if a batch is open and its signature differs from next
    bool requiresFlush(const DrawState& next) const {
        return current_.has_value() && *current_ != next;
    }

    void bind(const DrawState& state) { current_ = state; }

    /// Forget the open signature (after a flush)
    void reset() { current_.reset(); }

    bool hasState() const { return current_.has_value(); }
    const std::optional<DrawState>& current() const { return current_; }

private:
    std::optional<DrawState> current_;
};

} // namespace fine2d
