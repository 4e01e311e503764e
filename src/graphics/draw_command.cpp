#include "fine2d/graphics/draw_command.hpp"

namespace fine2d {

const char* blendModeToString(BlendMode mode) {
    switch (mode) {
        case BlendMode::Alpha:              return "Alpha";
        case BlendMode::PremultipliedAlpha: return "PremultipliedAlpha";
        case BlendMode::Additive:           return "Additive";
        case BlendMode::Multiply:           return "Multiply";
    }
    return "Unknown";
}

std::string DrawState::describe() const {
    std::string s = "texture=" + std::to_string(texture.id) +
                    " shader=" + std::to_string(shader.id) +
                    " blend=" + blendModeToString(blend);
    if (scissor) {
        s += " scissor=" + std::to_string(scissor->x) + "," + std::to_string(scissor->y) +
             " " + std::to_string(scissor->width) + "x" + std::to_string(scissor->height);
    }
    return s;
}

} // namespace fine2d
