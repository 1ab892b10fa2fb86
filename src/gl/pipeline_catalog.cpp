// blockbridge GL Translation
// pipeline_catalog.cpp - Legacy pipeline construction

#include <blockbridge/core/logger.hpp>
#include <blockbridge/gl/legacy_shaders.hpp>
#include <blockbridge/gl/pipeline_catalog.hpp>
#include <blockbridge/graphics/shader.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockbridge::gl {

using core::log_category::GL;

namespace {

struct PipelineSpec {
    const char* name;
    std::string_view vertex_source;
    std::string_view fragment_source;
    std::vector<graphics::VertexAttribute> attributes;
    uint32_t stride;
    bool uses_matrix;
    bool textured;
    std::optional<graphics::BlendState> blend;
};

std::vector<graphics::VertexAttribute> two_attributes(graphics::TextureFormat first, graphics::TextureFormat second,
                                                      uint32_t second_offset) {
    return {graphics::VertexAttribute{0, 0, first, 0}, graphics::VertexAttribute{1, 0, second, second_offset}};
}

PipelineSpec spec_for(LegacyPipeline pipeline) {
    using graphics::TextureFormat;
    switch (pipeline) {
        case LegacyPipeline::PosColUint:
            return {"pos_col_uint",
                    shaders::POS_COL_UINT_VERT,
                    shaders::POS_COL_FRAG,
                    two_attributes(TextureFormat::RGB32Float, TextureFormat::R32Uint, 12),
                    16,
                    true,
                    false,
                    graphics::BlendState::alpha_over()};
        case LegacyPipeline::PosTex:
            return {"pos_tex",
                    shaders::POS_TEX_VERT,
                    shaders::POS_TEX_FRAG,
                    two_attributes(TextureFormat::RGB32Float, TextureFormat::RG32Float, 12),
                    20,
                    true,
                    true,
                    graphics::BlendState::alpha_over()};
        case LegacyPipeline::PosColFloat3:
            return {"pos_col_float3",
                    shaders::POS_COL_FLOAT3_VERT,
                    shaders::POS_COL_FRAG,
                    two_attributes(TextureFormat::RGB32Float, TextureFormat::RGB32Float, 12),
                    24,
                    true,
                    false,
                    std::nullopt};
    }
    throw std::out_of_range("unknown legacy pipeline");
}

PipelineSpec clear_spec() {
    using graphics::TextureFormat;
    return {"clearcolor",
            shaders::CLEAR_COLOR_VERT,
            shaders::CLEAR_COLOR_FRAG,
            two_attributes(TextureFormat::RG32Float, TextureFormat::RGB32Float, 8),
            PipelineCatalog::CLEAR_VERTEX_STRIDE,
            false,
            false,
            std::nullopt};
}

bool has_binding(const std::vector<graphics::ShaderResourceBinding>& resources, uint32_t set, uint32_t binding) {
    return std::any_of(resources.begin(), resources.end(), [set, binding](const graphics::ShaderResourceBinding& r) {
        return r.set == set && r.binding == binding;
    });
}

// Reflected bindings must line up with the layouts the catalog hands the device
void validate_reflection(const PipelineSpec& spec, const graphics::ShaderReflection& vertex,
                         const graphics::ShaderReflection& fragment) {
    if (vertex.inputs.size() != spec.attributes.size()) {
        throw std::runtime_error(fmt::format("{}: vertex shader has {} inputs, layout declares {}", spec.name,
                                             vertex.inputs.size(), spec.attributes.size()));
    }

    if (spec.uses_matrix) {
        auto it = std::find_if(vertex.uniform_buffers.begin(), vertex.uniform_buffers.end(),
                               [](const graphics::ShaderUniformBuffer& ubo) {
                                   return ubo.set == MATRIX_BIND_GROUP && ubo.binding == 0;
                               });
        if (it == vertex.uniform_buffers.end() || it->size != MATRIX_UNIFORM_SIZE) {
            throw std::runtime_error(
                fmt::format("{}: expected a {} byte matrix block at set {} binding 0", spec.name,
                            MATRIX_UNIFORM_SIZE, MATRIX_BIND_GROUP));
        }
    } else if (!vertex.uniform_buffers.empty()) {
        throw std::runtime_error(fmt::format("{}: unexpected uniform block", spec.name));
    }

    if (spec.textured) {
        if (!has_binding(fragment.separate_images, TEXTURE_BIND_GROUP, 0) ||
            !has_binding(fragment.separate_samplers, TEXTURE_BIND_GROUP, 1)) {
            throw std::runtime_error(fmt::format("{}: expected texture at set {} binding 0 and sampler at binding 1",
                                                 spec.name, TEXTURE_BIND_GROUP));
        }
    }
}

}  // namespace

// ============================================================================
// PipelineCatalog Implementation
// ============================================================================

struct PipelineCatalog::Impl {
    graphics::GraphicsDevice& device;
    graphics::ShaderCompiler& compiler;

    std::unique_ptr<graphics::BindGroupLayout> matrix_layout;
    std::unique_ptr<graphics::BindGroupLayout> texture_layout;
    std::vector<std::unique_ptr<graphics::Shader>> shaders;
    std::array<std::unique_ptr<graphics::Pipeline>, LEGACY_PIPELINE_COUNT> pipelines;
    std::unique_ptr<graphics::Pipeline> clear_pipeline;

    Impl(graphics::GraphicsDevice& dev, graphics::ShaderCompiler& comp) : device(dev), compiler(comp) {}

    std::unique_ptr<graphics::BindGroupLayout> create_layout(std::vector<graphics::BindGroupLayoutEntry> entries,
                                                             const char* name) {
        graphics::BindGroupLayoutDesc desc;
        desc.entries = std::move(entries);
        desc.debug_name = name;

        auto layout = device.create_bind_group_layout(desc);
        if (!layout) {
            throw std::runtime_error(fmt::format("failed to create bind group layout '{}'", name));
        }
        return layout;
    }

    graphics::Shader* create_shader(std::string_view source, graphics::ShaderStage stage, const std::string& name,
                                    graphics::ShaderReflection& reflection) {
        graphics::ShaderCompileOptions options;
        options.stage = stage;
        options.entry_point = "main";
        options.debug_name = name;

        auto compiled = compiler.compile_glsl(source, options);
        if (!compiled.success) {
            throw std::runtime_error(fmt::format("failed to compile shader '{}': {}", name, compiled.error_message));
        }
        reflection = std::move(compiled.reflection);

        graphics::ShaderDesc desc;
        desc.stage = stage;
        desc.bytecode = compiled.spirv_bytecode;
        desc.entry_point = options.entry_point;
        desc.debug_name = name;

        auto shader = device.create_shader(desc);
        if (!shader) {
            throw std::runtime_error(fmt::format("failed to create shader '{}'", name));
        }
        shaders.push_back(std::move(shader));
        return shaders.back().get();
    }

    std::unique_ptr<graphics::Pipeline> create_pipeline(const PipelineSpec& spec) {
        graphics::ShaderReflection vertex_reflection;
        graphics::ShaderReflection fragment_reflection;

        graphics::PipelineDesc desc;
        desc.vertex_shader = create_shader(spec.vertex_source, graphics::ShaderStage::Vertex,
                                           std::string(spec.name) + "_vertex", vertex_reflection);
        desc.fragment_shader = create_shader(spec.fragment_source, graphics::ShaderStage::Fragment,
                                             std::string(spec.name) + "_fragment", fragment_reflection);
        validate_reflection(spec, vertex_reflection, fragment_reflection);

        desc.vertex_attributes = spec.attributes;
        desc.vertex_bindings = {graphics::VertexBinding{0, spec.stride, false}};

        if (spec.uses_matrix) {
            desc.bind_group_layouts.push_back(matrix_layout.get());
        }
        if (spec.textured) {
            desc.bind_group_layouts.push_back(texture_layout.get());
        }

        desc.topology = graphics::PrimitiveTopology::TriangleList;

        desc.rasterizer.cull_mode = graphics::CullMode::None;
        desc.rasterizer.front_face = graphics::FrontFace::CounterClockwise;

        // Depth attachment is present but inert
        desc.depth_stencil.depth_test_enable = true;
        desc.depth_stencil.depth_write_enable = false;
        desc.depth_stencil.depth_compare = graphics::CompareOp::Always;

        desc.color_blend.push_back(spec.blend.value_or(graphics::BlendState{}));

        desc.color_formats = {graphics::TextureFormat::BGRA8Unorm};
        desc.depth_format = graphics::TextureFormat::Depth32Float;

        desc.debug_name = spec.name;

        auto pipeline = device.create_pipeline(desc);
        if (!pipeline) {
            throw std::runtime_error(fmt::format("failed to create pipeline '{}'", spec.name));
        }
        return pipeline;
    }
};

PipelineCatalog::PipelineCatalog(graphics::GraphicsDevice& device, graphics::ShaderCompiler& compiler)
    : impl_(std::make_unique<Impl>(device, compiler)) {
    BLOCKBRIDGE_LOG_INFO(GL, "Building legacy pipelines on {} backend", device.get_backend_name());

    impl_->matrix_layout = impl_->create_layout(
        {graphics::BindGroupLayoutEntry{0, graphics::BindingType::UniformBuffer, graphics::ShaderStage::Vertex}},
        "matrix4");
    impl_->texture_layout = impl_->create_layout(
        {graphics::BindGroupLayoutEntry{0, graphics::BindingType::SampledTexture, graphics::ShaderStage::Fragment},
         graphics::BindGroupLayoutEntry{1, graphics::BindingType::Sampler, graphics::ShaderStage::Fragment}},
        "texture");

    for (auto pipeline : {LegacyPipeline::PosColUint, LegacyPipeline::PosTex, LegacyPipeline::PosColFloat3}) {
        impl_->pipelines[static_cast<size_t>(pipeline)] = impl_->create_pipeline(spec_for(pipeline));
    }
    impl_->clear_pipeline = impl_->create_pipeline(clear_spec());

    BLOCKBRIDGE_LOG_INFO(GL, "Created {} legacy pipelines ({} shaders)", LEGACY_PIPELINE_COUNT + 1,
                         impl_->shaders.size());
}

PipelineCatalog::~PipelineCatalog() = default;

const graphics::Pipeline& PipelineCatalog::get(LegacyPipeline pipeline) const {
    auto index = static_cast<size_t>(pipeline);
    if (index >= impl_->pipelines.size()) {
        throw std::out_of_range("unknown legacy pipeline");
    }
    return *impl_->pipelines[index];
}

const graphics::Pipeline& PipelineCatalog::clear_pipeline() const {
    return *impl_->clear_pipeline;
}

const graphics::BindGroupLayout& PipelineCatalog::matrix_layout() const {
    return *impl_->matrix_layout;
}

const graphics::BindGroupLayout& PipelineCatalog::texture_layout() const {
    return *impl_->texture_layout;
}

uint32_t PipelineCatalog::vertex_stride(LegacyPipeline pipeline) {
    return spec_for(pipeline).stride;
}

}  // namespace blockbridge::gl
