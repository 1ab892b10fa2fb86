// blockbridge Graphics Tests
// shader_compiler_test.cpp - Tests for GLSL compilation and SPIR-V reflection

#include <gtest/gtest.h>

#include <blockbridge/gl/legacy_shaders.hpp>
#include <blockbridge/graphics/shader_compiler.hpp>

#include <algorithm>

namespace blockbridge::graphics {
namespace {

class ShaderCompilerTest : public ::testing::Test {
protected:
    CompiledShader compile(std::string_view source, ShaderStage stage) {
        ShaderCompileOptions options;
        options.stage = stage;
        options.debug_name = "test";
        return compiler_.compile_glsl(source, options);
    }

    ShaderCompiler compiler_;
};

TEST_F(ShaderCompilerTest, CompilesVertexShader) {
    auto result = compile(gl::shaders::POS_COL_FLOAT3_VERT, ShaderStage::Vertex);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_FALSE(result.spirv_bytecode.empty());
    EXPECT_EQ(result.spirv_bytecode.size() % 4, 0u);
    EXPECT_EQ(result.reflection.stage, ShaderStage::Vertex);
    EXPECT_EQ(result.reflection.entry_point, "main");
    EXPECT_EQ(compiler_.get_compiled_count(), 1u);
}

TEST_F(ShaderCompilerTest, ReflectsMatrixBlock) {
    auto result = compile(gl::shaders::POS_TEX_VERT, ShaderStage::Vertex);
    ASSERT_TRUE(result.success) << result.error_message;

    ASSERT_EQ(result.reflection.uniform_buffers.size(), 1u);
    const auto& ubo = result.reflection.uniform_buffers[0];
    EXPECT_EQ(ubo.set, 0u);
    EXPECT_EQ(ubo.binding, 0u);
    EXPECT_EQ(ubo.size, 64u);
    ASSERT_EQ(ubo.members.size(), 1u);
    EXPECT_EQ(ubo.members[0].name, "view_proj");
    EXPECT_EQ(ubo.members[0].type_name, "mat4");

    EXPECT_EQ(result.reflection.inputs.size(), 2u);
}

TEST_F(ShaderCompilerTest, ReflectsSeparateTextureAndSampler) {
    auto result = compile(gl::shaders::POS_TEX_FRAG, ShaderStage::Fragment);
    ASSERT_TRUE(result.success) << result.error_message;

    ASSERT_EQ(result.reflection.separate_images.size(), 1u);
    ASSERT_EQ(result.reflection.separate_samplers.size(), 1u);
    EXPECT_EQ(result.reflection.separate_images[0].set, 1u);
    EXPECT_EQ(result.reflection.separate_images[0].binding, 0u);
    EXPECT_EQ(result.reflection.separate_samplers[0].set, 1u);
    EXPECT_EQ(result.reflection.separate_samplers[0].binding, 1u);
    EXPECT_TRUE(result.reflection.uniform_buffers.empty());
}

TEST_F(ShaderCompilerTest, InputLocations) {
    auto result = compile(gl::shaders::CLEAR_COLOR_VERT, ShaderStage::Vertex);
    ASSERT_TRUE(result.success) << result.error_message;

    std::vector<uint32_t> locations;
    for (const auto& input : result.reflection.inputs) {
        locations.push_back(input.location);
    }
    std::sort(locations.begin(), locations.end());
    EXPECT_EQ(locations, (std::vector<uint32_t>{0, 1}));
}

TEST_F(ShaderCompilerTest, DefinesArePrepended) {
    constexpr std::string_view source = R"(#version 450
layout(location = 0) out vec4 f_color;
void main() {
    f_color = vec4(BRIGHTNESS);
}
)";
    ShaderCompileOptions options;
    options.stage = ShaderStage::Fragment;
    options.defines = {"BRIGHTNESS 0.5"};

    auto result = compiler_.compile_glsl(source, options);
    EXPECT_TRUE(result.success) << result.error_message;
}

TEST_F(ShaderCompilerTest, SyntaxErrorReported) {
    auto result = compile("#version 450\nvoid main() { this is not glsl }\n", ShaderStage::Vertex);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_TRUE(result.spirv_bytecode.empty());
    EXPECT_EQ(compiler_.get_compiled_count(), 0u);
}

TEST_F(ShaderCompilerTest, ReflectRejectsMalformedBytecode) {
    std::vector<uint8_t> garbage = {1, 2, 3};
    EXPECT_FALSE(compiler_.reflect_spirv(garbage, ShaderStage::Vertex).has_value());

    std::vector<uint8_t> empty;
    EXPECT_FALSE(compiler_.reflect_spirv(empty, ShaderStage::Vertex).has_value());
}

TEST_F(ShaderCompilerTest, ReflectCompiledBytecode) {
    auto result = compile(gl::shaders::POS_COL_UINT_VERT, ShaderStage::Vertex);
    ASSERT_TRUE(result.success) << result.error_message;

    auto reflection = compiler_.reflect_spirv(result.spirv_bytecode, ShaderStage::Vertex);
    ASSERT_TRUE(reflection.has_value());
    EXPECT_EQ(reflection->uniform_buffers.size(), 1u);
    EXPECT_EQ(reflection->inputs.size(), 2u);
}

TEST(ShaderStageNameTest, Names) {
    EXPECT_STREQ(shader_stage_name(ShaderStage::Vertex), "Vertex");
    EXPECT_STREQ(shader_stage_name(ShaderStage::Fragment), "Fragment");
}

}  // namespace
}  // namespace blockbridge::graphics
