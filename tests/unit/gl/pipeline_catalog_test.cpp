// blockbridge GL Translation Tests
// pipeline_catalog_test.cpp - Tests for the legacy pipeline set

#include <gtest/gtest.h>

#include <blockbridge/gl/pipeline_catalog.hpp>

#include "support/recording_device.hpp"

#include <stdexcept>

namespace blockbridge::gl {
namespace {

using graphics::BlendFactor;
using graphics::TextureFormat;

class PipelineCatalogTest : public ::testing::Test {
protected:
    testing::RecordingDevice device_;
    graphics::ShaderCompiler compiler_;
    PipelineCatalog catalog_{device_, compiler_};

    const graphics::PipelineDesc& desc(const char* name) {
        const auto* found = device_.find_pipeline(name);
        EXPECT_NE(found, nullptr) << name;
        static const graphics::PipelineDesc empty;
        return found != nullptr ? *found : empty;
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(PipelineCatalogTest, CreatesFourPipelines) {
    EXPECT_EQ(device_.pipelines.size(), 4u);
    EXPECT_EQ(device_.shader_names.size(), 8u);
    EXPECT_EQ(device_.layout_names, (std::vector<std::string>{"matrix4", "texture"}));
    EXPECT_EQ(compiler_.get_compiled_count(), 8u);
}

TEST_F(PipelineCatalogTest, LookupByLegacyPipeline) {
    const auto* pos_tex = dynamic_cast<const testing::RecordingPipeline*>(&catalog_.get(LegacyPipeline::PosTex));
    const auto* clear = dynamic_cast<const testing::RecordingPipeline*>(&catalog_.clear_pipeline());

    ASSERT_NE(pos_tex, nullptr);
    ASSERT_NE(clear, nullptr);
    EXPECT_EQ(pos_tex->name(), "pos_tex");
    EXPECT_EQ(clear->name(), "clearcolor");
    EXPECT_NE(&catalog_.get(LegacyPipeline::PosColUint), &catalog_.get(LegacyPipeline::PosColFloat3));
}

TEST_F(PipelineCatalogTest, LayoutEntries) {
    const auto& matrix = catalog_.matrix_layout().get_entries();
    ASSERT_EQ(matrix.size(), 1u);
    EXPECT_EQ(matrix[0].binding, 0u);
    EXPECT_EQ(matrix[0].type, graphics::BindingType::UniformBuffer);
    EXPECT_EQ(matrix[0].visibility, graphics::ShaderStage::Vertex);

    const auto& texture = catalog_.texture_layout().get_entries();
    ASSERT_EQ(texture.size(), 2u);
    EXPECT_EQ(texture[0].type, graphics::BindingType::SampledTexture);
    EXPECT_EQ(texture[1].type, graphics::BindingType::Sampler);
    EXPECT_EQ(texture[1].visibility, graphics::ShaderStage::Fragment);
}

// ============================================================================
// Vertex layouts
// ============================================================================

TEST_F(PipelineCatalogTest, VertexStrides) {
    EXPECT_EQ(PipelineCatalog::vertex_stride(LegacyPipeline::PosColUint), 16u);
    EXPECT_EQ(PipelineCatalog::vertex_stride(LegacyPipeline::PosTex), 20u);
    EXPECT_EQ(PipelineCatalog::vertex_stride(LegacyPipeline::PosColFloat3), 24u);
    EXPECT_EQ(PipelineCatalog::CLEAR_VERTEX_STRIDE, 20u);

    ASSERT_EQ(desc("pos_col_float3").vertex_bindings.size(), 1u);
    EXPECT_EQ(desc("pos_col_float3").vertex_bindings[0].stride, 24u);
    EXPECT_EQ(desc("clearcolor").vertex_bindings[0].stride, 20u);
}

TEST_F(PipelineCatalogTest, VertexAttributes) {
    const auto& uint_color = desc("pos_col_uint").vertex_attributes;
    ASSERT_EQ(uint_color.size(), 2u);
    EXPECT_EQ(uint_color[0].format, TextureFormat::RGB32Float);
    EXPECT_EQ(uint_color[1].format, TextureFormat::R32Uint);
    EXPECT_EQ(uint_color[1].offset, 12u);
    EXPECT_EQ(uint_color[1].location, 1u);

    const auto& tex = desc("pos_tex").vertex_attributes;
    ASSERT_EQ(tex.size(), 2u);
    EXPECT_EQ(tex[1].format, TextureFormat::RG32Float);

    const auto& clear = desc("clearcolor").vertex_attributes;
    ASSERT_EQ(clear.size(), 2u);
    EXPECT_EQ(clear[0].format, TextureFormat::RG32Float);
    EXPECT_EQ(clear[1].format, TextureFormat::RGB32Float);
    EXPECT_EQ(clear[1].offset, 8u);
}

// ============================================================================
// Pipeline state
// ============================================================================

TEST_F(PipelineCatalogTest, BindGroupLayouts) {
    EXPECT_EQ(desc("pos_col_uint").bind_group_layouts.size(), 1u);
    EXPECT_EQ(desc("pos_col_float3").bind_group_layouts.size(), 1u);
    EXPECT_TRUE(desc("clearcolor").bind_group_layouts.empty());

    const auto& tex_layouts = desc("pos_tex").bind_group_layouts;
    ASSERT_EQ(tex_layouts.size(), 2u);
    EXPECT_EQ(tex_layouts[MATRIX_BIND_GROUP], &catalog_.matrix_layout());
    EXPECT_EQ(tex_layouts[TEXTURE_BIND_GROUP], &catalog_.texture_layout());
}

TEST_F(PipelineCatalogTest, BlendStates) {
    for (const char* name : {"pos_tex", "pos_col_uint"}) {
        const auto& blend = desc(name).color_blend;
        ASSERT_EQ(blend.size(), 1u) << name;
        EXPECT_TRUE(blend[0].enable) << name;
        EXPECT_EQ(blend[0].src_color, BlendFactor::One) << name;
        EXPECT_EQ(blend[0].dst_color, BlendFactor::OneMinusSrcAlpha) << name;
        EXPECT_EQ(blend[0].src_alpha, BlendFactor::One) << name;
        EXPECT_EQ(blend[0].dst_alpha, BlendFactor::OneMinusSrcAlpha) << name;
    }
    for (const char* name : {"pos_col_float3", "clearcolor"}) {
        const auto& blend = desc(name).color_blend;
        ASSERT_EQ(blend.size(), 1u) << name;
        EXPECT_FALSE(blend[0].enable) << name;
    }
}

TEST_F(PipelineCatalogTest, SharedRasterAndTargetState) {
    for (const auto& pipeline : device_.pipelines) {
        EXPECT_EQ(pipeline.topology, graphics::PrimitiveTopology::TriangleList) << pipeline.debug_name;
        EXPECT_EQ(pipeline.rasterizer.cull_mode, graphics::CullMode::None) << pipeline.debug_name;
        EXPECT_EQ(pipeline.rasterizer.front_face, graphics::FrontFace::CounterClockwise) << pipeline.debug_name;
        EXPECT_TRUE(pipeline.depth_stencil.depth_test_enable) << pipeline.debug_name;
        EXPECT_FALSE(pipeline.depth_stencil.depth_write_enable) << pipeline.debug_name;
        EXPECT_EQ(pipeline.depth_stencil.depth_compare, graphics::CompareOp::Always) << pipeline.debug_name;
        EXPECT_EQ(pipeline.color_formats, (std::vector<TextureFormat>{TextureFormat::BGRA8Unorm}));
        EXPECT_EQ(pipeline.depth_format, TextureFormat::Depth32Float) << pipeline.debug_name;
    }
}

// ============================================================================
// Failure
// ============================================================================

TEST(PipelineCatalogFailureTest, DeviceRefusalThrows) {
    testing::RecordingDevice device;
    device.fail_pipelines = true;
    graphics::ShaderCompiler compiler;

    EXPECT_THROW({ PipelineCatalog catalog(device, compiler); }, std::runtime_error);
}

}  // namespace
}  // namespace blockbridge::gl
