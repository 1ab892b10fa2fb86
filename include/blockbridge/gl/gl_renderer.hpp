// blockbridge GL Translation
// gl_renderer.hpp - Replays recorded command lists into a render pass

#pragma once

#include "command.hpp"
#include "frame_arena.hpp"
#include "pipeline_catalog.hpp"
#include "texture_directory.hpp"

#include <blockbridge/graphics/command_buffer.hpp>
#include <blockbridge/graphics/device.hpp>

#include <array>
#include <cstdint>
#include <memory>

namespace blockbridge::gl {

struct ReplayStats {
    size_t commands = 0;
    size_t draws = 0;           // Includes the draw issued for each clear
    size_t pipeline_binds = 0;  // Explicit selects, clears and rebinds before draws
    size_t clears = 0;
    size_t fallback_textures = 0;
};

// Full-screen quad for a clear, two triangles of (x, y, r, g, b)
[[nodiscard]] std::array<float, 30> clear_quad_vertices(float r, float g, float b);

// Render-thread only. Holds the shared fallback texture for its lifetime.
class GlRenderer {
public:
    GlRenderer(graphics::GraphicsDevice& device, const PipelineCatalog& catalog, const TextureDirectory& textures);
    ~GlRenderer();

    // Non-copyable
    GlRenderer(const GlRenderer&) = delete;
    GlRenderer& operator=(const GlRenderer&) = delete;

    // Replay commands in order into an open pass. Transient objects go to arena,
    // which the caller resets once the pass has been submitted.
    void render(const CommandList& commands, graphics::CommandBuffer& pass, FrameArena& arena);

    // Opaque black 1x1 texture bound for unknown or empty texture ids; created on first use
    [[nodiscard]] const BindableTexture& fallback_texture();

    [[nodiscard]] const ReplayStats& last_stats() const { return stats_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    ReplayStats stats_;
};

}  // namespace blockbridge::gl
