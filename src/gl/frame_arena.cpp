// blockbridge GL Translation
// frame_arena.cpp - FrameArena implementation

#include <blockbridge/gl/frame_arena.hpp>
#include <blockbridge/gl/texture_directory.hpp>

#include <stdexcept>

namespace blockbridge::gl {

FrameArena::FrameArena(size_t reserve) {
    buffers_.reserve(reserve);
    bind_groups_.reserve(reserve / 2);
}

FrameArena::FrameArena(const core::BridgeSettings& settings)
    : FrameArena(static_cast<size_t>(settings.frame_arena_reserve)) {}

FrameArena::~FrameArena() = default;

graphics::Buffer* FrameArena::keep(std::unique_ptr<graphics::Buffer> buffer) {
    if (!buffer) {
        throw std::runtime_error("device returned a null transient buffer");
    }
    stats_.buffer_bytes += buffer->get_size();
    ++stats_.buffers;
    buffers_.push_back(std::move(buffer));
    return buffers_.back().get();
}

graphics::BindGroup* FrameArena::keep(std::unique_ptr<graphics::BindGroup> group) {
    if (!group) {
        throw std::runtime_error("device returned a null transient bind group");
    }
    ++stats_.bind_groups;
    bind_groups_.push_back(std::move(group));
    return bind_groups_.back().get();
}

const BindableTexture* FrameArena::keep(std::shared_ptr<const BindableTexture> texture) {
    if (!texture) {
        throw std::runtime_error("cannot retain a null texture");
    }
    ++stats_.textures;
    textures_.push_back(std::move(texture));
    return textures_.back().get();
}

void FrameArena::reset() {
    // Bind groups reference buffers, release them first
    textures_.clear();
    bind_groups_.clear();
    buffers_.clear();
    stats_ = FrameArenaStats{};
}

}  // namespace blockbridge::gl
