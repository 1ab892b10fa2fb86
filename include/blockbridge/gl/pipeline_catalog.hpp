// blockbridge GL Translation
// pipeline_catalog.hpp - Fixed set of explicit pipelines emulating legacy GL state

#pragma once

#include "command.hpp"

#include <blockbridge/graphics/device.hpp>
#include <blockbridge/graphics/pipeline.hpp>
#include <blockbridge/graphics/shader_compiler.hpp>

#include <cstdint>
#include <memory>

namespace blockbridge::gl {

// Bind group slots shared by every legacy pipeline layout
inline constexpr uint32_t MATRIX_BIND_GROUP = 0;
inline constexpr uint32_t TEXTURE_BIND_GROUP = 1;

// Size of the matrix uniform block (one column-major mat4)
inline constexpr size_t MATRIX_UNIFORM_SIZE = 64;

// Built once at startup on the render thread. Every pipeline draws triangle lists,
// counter-clockwise, no culling, into BGRA8Unorm color with a Depth32Float attachment.
// Depth testing is enabled with compare Always and writes off, so depth never rejects
// or changes anything.
//
//   pipeline        stride  attributes              layouts            blend
//   pos_col_float3  24      f32x3@0  f32x3@12       [matrix4]          none
//   pos_tex         20      f32x3@0  f32x2@12       [matrix4, texture] over
//   pos_col_uint    16      f32x3@0  u32@12         [matrix4]          over
//   clearcolor      20      f32x2@0  f32x3@8        []                 none
//
// Throws std::runtime_error if a shader fails to compile, its reflected bindings
// disagree with the layouts, or the device refuses an object.
class PipelineCatalog {
public:
    PipelineCatalog(graphics::GraphicsDevice& device, graphics::ShaderCompiler& compiler);
    ~PipelineCatalog();

    // Non-copyable
    PipelineCatalog(const PipelineCatalog&) = delete;
    PipelineCatalog& operator=(const PipelineCatalog&) = delete;

    [[nodiscard]] const graphics::Pipeline& get(LegacyPipeline pipeline) const;
    [[nodiscard]] const graphics::Pipeline& clear_pipeline() const;

    [[nodiscard]] const graphics::BindGroupLayout& matrix_layout() const;
    [[nodiscard]] const graphics::BindGroupLayout& texture_layout() const;

    [[nodiscard]] static uint32_t vertex_stride(LegacyPipeline pipeline);
    static constexpr uint32_t CLEAR_VERTEX_STRIDE = 20;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace blockbridge::gl
