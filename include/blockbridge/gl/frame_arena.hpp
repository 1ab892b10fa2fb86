// blockbridge GL Translation
// frame_arena.hpp - Owner of transient GPU objects for one render pass

#pragma once

#include <blockbridge/core/settings.hpp>
#include <blockbridge/graphics/buffer.hpp>
#include <blockbridge/graphics/pipeline.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace blockbridge::gl {

struct BindableTexture;

struct FrameArenaStats {
    size_t buffers = 0;
    size_t bind_groups = 0;
    size_t textures = 0;  // Shared textures retained for the pass
    size_t buffer_bytes = 0;
};

// Keeps buffers, bind groups and bound textures alive until the pass that uses them is over.
// Objects are released together by reset() or destruction, never individually.
class FrameArena {
public:
    explicit FrameArena(size_t reserve = 256);
    explicit FrameArena(const core::BridgeSettings& settings);
    ~FrameArena();

    // Non-copyable, non-movable
    FrameArena(const FrameArena&) = delete;
    FrameArena& operator=(const FrameArena&) = delete;
    FrameArena(FrameArena&&) = delete;
    FrameArena& operator=(FrameArena&&) = delete;

    // Take ownership; the returned pointer stays valid until reset()
    graphics::Buffer* keep(std::unique_ptr<graphics::Buffer> buffer);
    graphics::BindGroup* keep(std::unique_ptr<graphics::BindGroup> group);
    const BindableTexture* keep(std::shared_ptr<const BindableTexture> texture);

    // Release everything (call once the pass has been submitted)
    void reset();

    [[nodiscard]] FrameArenaStats stats() const { return stats_; }
    [[nodiscard]] size_t buffer_capacity() const { return buffers_.capacity(); }
    [[nodiscard]] bool empty() const { return buffers_.empty() && bind_groups_.empty() && textures_.empty(); }

private:
    std::vector<std::unique_ptr<graphics::Buffer>> buffers_;
    std::vector<std::unique_ptr<graphics::BindGroup>> bind_groups_;
    std::vector<std::shared_ptr<const BindableTexture>> textures_;
    FrameArenaStats stats_;
};

}  // namespace blockbridge::gl
