// blockbridge GL Translation
// gl_renderer.cpp - Command list replay

#include <blockbridge/core/logger.hpp>
#include <blockbridge/gl/gl_renderer.hpp>

#include <glm/gtc/type_ptr.hpp>

#include <variant>

namespace blockbridge::gl {

using core::log_category::GL;

std::array<float, 30> clear_quad_vertices(float r, float g, float b) {
    // clang-format off
    return {
        -1.0f, -1.0f, r, g, b,
        -1.0f,  1.0f, r, g, b,
         1.0f,  1.0f, r, g, b,
        -1.0f, -1.0f, r, g, b,
         1.0f,  1.0f, r, g, b,
         1.0f, -1.0f, r, g, b,
    };
    // clang-format on
}

struct GlRenderer::Impl {
    graphics::GraphicsDevice& device;
    const PipelineCatalog& catalog;
    const TextureDirectory& textures;
    std::shared_ptr<const BindableTexture> fallback;

    Impl(graphics::GraphicsDevice& dev, const PipelineCatalog& cat, const TextureDirectory& tex)
        : device(dev), catalog(cat), textures(tex) {}
};

namespace {

// Per-replay state; lives for one render() call
class Replay {
public:
    Replay(graphics::GraphicsDevice& device, const PipelineCatalog& catalog, const TextureDirectory& textures,
           GlRenderer& renderer, graphics::CommandBuffer& pass, FrameArena& arena, ReplayStats& stats)
        : device_(device),
          catalog_(catalog),
          textures_(textures),
          renderer_(renderer),
          pass_(pass),
          arena_(arena),
          stats_(stats) {}

    void operator()(const cmd::UsePipeline& command) { bind(catalog_.get(command.pipeline)); }

    void operator()(const cmd::SetVertexBuffer& command) {
        vertices_ = upload(command.bytes.data(), command.bytes.size(), graphics::BufferUsage::Vertex);
        pass_.bind_vertex_buffer(0, vertices_);
        vertices_bound_ = true;
    }

    void operator()(const cmd::SetIndexBuffer& command) {
        auto* buffer = upload(command.indices.data(), command.indices.size() * sizeof(uint32_t),
                              graphics::BufferUsage::Index);
        pass_.bind_index_buffer(buffer, graphics::IndexType::Uint32);
    }

    void operator()(const cmd::Draw& command) {
        bind_if_needed(catalog_.get(command.pipeline));
        restore_vertices();
        pass_.draw(command.vertex_count, 1, 0, 0);
        ++stats_.draws;
    }

    void operator()(const cmd::DrawIndexed& command) {
        bind_if_needed(catalog_.get(command.pipeline));
        restore_vertices();
        pass_.draw_indexed(command.index_count, 1, 0, 0, 0);
        ++stats_.draws;
    }

    void operator()(const cmd::ClearColor& command) {
        auto vertices = clear_quad_vertices(command.r, command.g, command.b);
        auto* buffer = upload(vertices.data(), sizeof(vertices), graphics::BufferUsage::Vertex);

        bind(catalog_.clear_pipeline());
        pass_.bind_vertex_buffer(0, buffer);
        vertices_bound_ = false;
        pass_.draw(6, 1, 0, 0);
        ++stats_.draws;
        ++stats_.clears;
    }

    void operator()(const cmd::AttachTexture& command) {
        auto texture = textures_.resolve(command.texture_id);
        if (texture) {
            // The arena keeps the texture alive for the pass even if the directory drops it
            pass_.bind_group(TEXTURE_BIND_GROUP, arena_.keep(std::move(texture))->bind_group.get());
            return;
        }

        BLOCKBRIDGE_LOG_TRACE(GL, "Texture {} unbound, using fallback", command.texture_id);
        pass_.bind_group(TEXTURE_BIND_GROUP, renderer_.fallback_texture().bind_group.get());
        ++stats_.fallback_textures;
    }

    void operator()(const cmd::SetMatrix& command) {
        auto* buffer = upload(glm::value_ptr(command.matrix), MATRIX_UNIFORM_SIZE, graphics::BufferUsage::Uniform);

        graphics::BindGroupDesc desc;
        desc.layout = &catalog_.matrix_layout();
        desc.entries = {graphics::BindGroupEntry{0, buffer, nullptr, nullptr}};
        auto* group = arena_.keep(device_.create_bind_group(desc));

        pass_.bind_group(MATRIX_BIND_GROUP, group);
    }

private:
    graphics::Buffer* upload(const void* data, size_t size, graphics::BufferUsage usage) {
        graphics::BufferDesc desc;
        desc.size = size;
        desc.usage = usage;
        desc.host_visible = true;
        desc.initial_data = data;
        return arena_.keep(device_.create_buffer(desc));
    }

    void bind(const graphics::Pipeline& pipeline) {
        pass_.bind_pipeline(&pipeline);
        bound_ = &pipeline;
        ++stats_.pipeline_binds;
    }

    void bind_if_needed(const graphics::Pipeline& pipeline) {
        if (bound_ != &pipeline) {
            bind(pipeline);
        }
    }

    // A clear borrows slot 0; the recorded vertex buffer goes back before the next draw
    void restore_vertices() {
        if (!vertices_bound_ && vertices_ != nullptr) {
            pass_.bind_vertex_buffer(0, vertices_);
            vertices_bound_ = true;
        }
    }

    graphics::GraphicsDevice& device_;
    const PipelineCatalog& catalog_;
    const TextureDirectory& textures_;
    GlRenderer& renderer_;
    graphics::CommandBuffer& pass_;
    FrameArena& arena_;
    ReplayStats& stats_;
    const graphics::Pipeline* bound_ = nullptr;
    graphics::Buffer* vertices_ = nullptr;
    bool vertices_bound_ = false;
};

}  // namespace

GlRenderer::GlRenderer(graphics::GraphicsDevice& device, const PipelineCatalog& catalog,
                       const TextureDirectory& textures)
    : impl_(std::make_unique<Impl>(device, catalog, textures)) {}

GlRenderer::~GlRenderer() = default;

void GlRenderer::render(const CommandList& commands, graphics::CommandBuffer& pass, FrameArena& arena) {
    stats_ = ReplayStats{};
    stats_.commands = commands.size();

    Replay replay(impl_->device, impl_->catalog, impl_->textures, *this, pass, arena, stats_);
    for (const auto& command : commands) {
        std::visit(replay, command);
    }

    BLOCKBRIDGE_LOG_TRACE(GL, "Replayed {} commands: {} draws, {} pipeline binds, {} fallback textures",
                          stats_.commands, stats_.draws, stats_.pipeline_binds, stats_.fallback_textures);
}

const BindableTexture& GlRenderer::fallback_texture() {
    if (!impl_->fallback) {
        static constexpr uint8_t BLACK_OPAQUE[4] = {0, 0, 0, 255};

        graphics::TextureDesc desc;
        desc.format = graphics::TextureFormat::RGBA8Unorm;
        desc.width = 1;
        desc.height = 1;
        desc.usage = graphics::TextureUsage::Sampled | graphics::TextureUsage::TransferDst;
        desc.initial_data = BLACK_OPAQUE;
        desc.debug_name = "fallback_black";

        impl_->fallback = BindableTexture::create(impl_->device, impl_->catalog.texture_layout(), desc);
        BLOCKBRIDGE_LOG_DEBUG(GL, "Created fallback texture");
    }
    return *impl_->fallback;
}

}  // namespace blockbridge::gl
