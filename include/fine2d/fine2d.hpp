#pragma once

// fine2d - Main include file
// Core (CPU side) plus the Vulkan backend

// Foundation
#include "fine2d/core/types.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

// Drawing model
#include "fine2d/graphics/color.hpp"
#include "fine2d/graphics/rectangle.hpp"
#include "fine2d/graphics/vertex.hpp"
#include "fine2d/graphics/draw_params.hpp"
#include "fine2d/graphics/draw_command.hpp"
#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/animation.hpp"
#include "fine2d/graphics/batcher.hpp"
#include "fine2d/graphics/render_device.hpp"

// Engine
#include "fine2d/engine/config.hpp"
#include "fine2d/engine/frame_clock.hpp"
#include "fine2d/engine/canvas_scaler.hpp"
#include "fine2d/engine/frame_orchestrator.hpp"
#include "fine2d/engine/platform.hpp"
#include "fine2d/engine/audio_params.hpp"
#include "fine2d/engine/context.hpp"

// Vulkan backend
#include "fine2d/graphics/vulkan_renderer.hpp"
#include "fine2d/engine/glfw_platform.hpp"
