// blockbridge GL Translation
// texture_directory.cpp - TextureDirectory implementation

#include <blockbridge/core/logger.hpp>
#include <blockbridge/gl/texture_directory.hpp>

#include <limits>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

namespace blockbridge::gl {

std::shared_ptr<const BindableTexture> BindableTexture::create(graphics::GraphicsDevice& device,
                                                               const graphics::BindGroupLayout& layout,
                                                               const graphics::TextureDesc& desc) {
    auto bindable = std::make_shared<BindableTexture>();

    bindable->texture = device.create_texture(desc);
    if (!bindable->texture) {
        throw std::runtime_error(fmt::format("failed to create texture '{}'", desc.debug_name));
    }

    graphics::SamplerDesc sampler_desc;
    sampler_desc.debug_name = desc.debug_name + "_sampler";
    bindable->sampler = device.create_sampler(sampler_desc);
    if (!bindable->sampler) {
        throw std::runtime_error(fmt::format("failed to create sampler for '{}'", desc.debug_name));
    }

    graphics::BindGroupDesc group_desc;
    group_desc.layout = &layout;
    group_desc.entries = {graphics::BindGroupEntry{0, nullptr, bindable->texture.get(), nullptr},
                          graphics::BindGroupEntry{1, nullptr, nullptr, bindable->sampler.get()}};
    group_desc.debug_name = desc.debug_name + "_bind_group";
    bindable->bind_group = device.create_bind_group(group_desc);
    if (!bindable->bind_group) {
        throw std::runtime_error(fmt::format("failed to create bind group for '{}'", desc.debug_name));
    }

    return bindable;
}

// ============================================================================
// TextureDirectory Implementation
// ============================================================================

namespace {

constexpr int32_t MAX_TEXTURE_ID = std::numeric_limits<int32_t>::max();

int32_t id_after(int32_t id) {
    return id >= MAX_TEXTURE_ID ? 1 : id + 1;
}

}  // namespace

struct TextureDirectory::Impl {
    std::unordered_map<int32_t, std::shared_ptr<const BindableTexture>> textures;
    int32_t next_id = 1;
    mutable std::shared_mutex mutex;
};

TextureDirectory::TextureDirectory(int32_t first_id) : impl_(std::make_unique<Impl>()) {
    impl_->next_id = first_id > 0 ? first_id : 1;
}

TextureDirectory::~TextureDirectory() = default;

int32_t TextureDirectory::allocate() {
    std::unique_lock<std::shared_mutex> lock(impl_->mutex);
    if (impl_->textures.size() >= static_cast<size_t>(MAX_TEXTURE_ID)) {
        throw std::runtime_error("texture id space exhausted");
    }
    while (impl_->textures.contains(impl_->next_id)) {
        impl_->next_id = id_after(impl_->next_id);
    }
    int32_t id = impl_->next_id;
    impl_->next_id = id_after(id);
    impl_->textures.emplace(id, nullptr);
    return id;
}

void TextureDirectory::attach(int32_t id, std::shared_ptr<const BindableTexture> texture) {
    std::unique_lock<std::shared_mutex> lock(impl_->mutex);
    impl_->textures[id] = std::move(texture);
}

void TextureDirectory::detach(int32_t id) {
    std::unique_lock<std::shared_mutex> lock(impl_->mutex);
    auto it = impl_->textures.find(id);
    if (it != impl_->textures.end()) {
        it->second.reset();
    }
}

bool TextureDirectory::remove(int32_t id) {
    std::unique_lock<std::shared_mutex> lock(impl_->mutex);
    return impl_->textures.erase(id) > 0;
}

std::shared_ptr<const BindableTexture> TextureDirectory::resolve(int32_t id) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mutex);
    auto it = impl_->textures.find(id);
    if (it == impl_->textures.end()) {
        return nullptr;
    }
    return it->second;
}

bool TextureDirectory::contains(int32_t id) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mutex);
    return impl_->textures.contains(id);
}

size_t TextureDirectory::size() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mutex);
    return impl_->textures.size();
}

}  // namespace blockbridge::gl
