// blockbridge GL Translation
// texture_directory.hpp - Legacy texture ids to bindable GPU textures

#pragma once

#include <blockbridge/graphics/device.hpp>
#include <blockbridge/graphics/pipeline.hpp>
#include <blockbridge/graphics/sampler.hpp>
#include <blockbridge/graphics/texture.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace blockbridge::gl {

// Texture, sampler and the bind group that exposes both at the texture slot
struct BindableTexture {
    std::unique_ptr<graphics::Texture> texture;
    std::unique_ptr<graphics::Sampler> sampler;
    std::unique_ptr<graphics::BindGroup> bind_group;

    // Throws std::runtime_error if the device refuses any of the three objects
    [[nodiscard]] static std::shared_ptr<const BindableTexture> create(graphics::GraphicsDevice& device,
                                                                       const graphics::BindGroupLayout& layout,
                                                                       const graphics::TextureDesc& desc);
};

// Maps legacy texture ids (glGenTextures names) to bindable textures.
// An id may be allocated but empty. Thread-safe.
class TextureDirectory {
public:
    // Ids are handed out from first_id upward and wrap back to 1 after INT32_MAX
    explicit TextureDirectory(int32_t first_id = 1);
    ~TextureDirectory();

    // Non-copyable
    TextureDirectory(const TextureDirectory&) = delete;
    TextureDirectory& operator=(const TextureDirectory&) = delete;

    // Returns a fresh positive id with no texture attached. Throws std::runtime_error
    // once every positive id is taken.
    [[nodiscard]] int32_t allocate();

    // Replace whatever texture the id held; allocates the id if needed
    void attach(int32_t id, std::shared_ptr<const BindableTexture> texture);

    // Keep the id, drop its texture
    void detach(int32_t id);

    // Forget the id entirely; returns false if it was unknown
    bool remove(int32_t id);

    // Null if the id is unknown or empty
    [[nodiscard]] std::shared_ptr<const BindableTexture> resolve(int32_t id) const;

    [[nodiscard]] bool contains(int32_t id) const;
    [[nodiscard]] size_t size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace blockbridge::gl
