// blockbridge GL Translation
// command.hpp - Recorded legacy GL command vocabulary

#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace blockbridge::gl {

// Pipelines the host can select. Host integers map 0 -> PosColUint,
// 1 -> PosTex, 2 -> PosColFloat3.
enum class LegacyPipeline : uint8_t {
    PosColUint = 0,    // vec3 position + packed RGBA8 color
    PosTex = 1,        // vec3 position + vec2 uv, textured
    PosColFloat3 = 2,  // vec3 position + vec3 color
};

inline constexpr size_t LEGACY_PIPELINE_COUNT = 3;

// Throws std::out_of_range for anything outside 0..2
[[nodiscard]] LegacyPipeline pipeline_from_index(int index);
[[nodiscard]] const char* legacy_pipeline_name(LegacyPipeline pipeline);

// ============================================================================
// Commands
// ============================================================================

namespace cmd {

struct SetMatrix {
    glm::mat4 matrix{1.0f};
};

struct ClearColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

struct UsePipeline {
    LegacyPipeline pipeline = LegacyPipeline::PosColUint;
};

struct SetVertexBuffer {
    std::vector<uint8_t> bytes;
};

struct SetIndexBuffer {
    std::vector<uint32_t> indices;
};

// Draws carry the pipeline selected when they were recorded
struct Draw {
    uint32_t vertex_count = 0;
    LegacyPipeline pipeline = LegacyPipeline::PosColUint;
};

struct DrawIndexed {
    uint32_t index_count = 0;
    LegacyPipeline pipeline = LegacyPipeline::PosColUint;
};

struct AttachTexture {
    int32_t texture_id = 0;
};

}  // namespace cmd

using GlCommand = std::variant<cmd::SetMatrix, cmd::ClearColor, cmd::UsePipeline, cmd::SetVertexBuffer,
                               cmd::SetIndexBuffer, cmd::Draw, cmd::DrawIndexed, cmd::AttachTexture>;

// One frame's worth of commands; immutable once published
using CommandList = std::vector<GlCommand>;
using CommandListPtr = std::shared_ptr<const CommandList>;

// Helper for std::visit with lambdas
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace blockbridge::gl
