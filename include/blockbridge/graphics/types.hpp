// blockbridge Graphics Abstraction Layer
// types.hpp - Common types, enums, and descriptors

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace blockbridge::graphics {

// ============================================================================
// Formats (textures, attachments and vertex attributes)
// ============================================================================

enum class TextureFormat : uint32_t {
    Unknown = 0,

    // 8-bit formats
    R8Unorm,
    RGBA8Unorm,
    RGBA8UnormSrgb,
    BGRA8Unorm,

    // 32-bit formats
    R32Float,
    R32Uint,
    RG32Float,
    RGB32Float,
    RGBA32Float,

    // Depth formats
    Depth32Float,
};

// Size in bytes of one texel or vertex element; 0 for Unknown
[[nodiscard]] constexpr uint32_t format_size(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8Unorm:
            return 1;
        case TextureFormat::RGBA8Unorm:
        case TextureFormat::RGBA8UnormSrgb:
        case TextureFormat::BGRA8Unorm:
        case TextureFormat::R32Float:
        case TextureFormat::R32Uint:
        case TextureFormat::Depth32Float:
            return 4;
        case TextureFormat::RG32Float:
            return 8;
        case TextureFormat::RGB32Float:
            return 12;
        case TextureFormat::RGBA32Float:
            return 16;
        default:
            return 0;
    }
}

// ============================================================================
// Buffer Usage Flags
// ============================================================================

enum class BufferUsage : uint32_t {
    None = 0,
    Vertex = 1 << 0,
    Index = 1 << 1,
    Uniform = 1 << 2,
    TransferDst = 1 << 3,
};

inline BufferUsage operator|(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline BufferUsage operator&(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline bool has_flag(BufferUsage flags, BufferUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

// ============================================================================
// Texture Usage Flags
// ============================================================================

enum class TextureUsage : uint32_t {
    None = 0,
    Sampled = 1 << 0,
    RenderTarget = 1 << 1,
    DepthStencil = 1 << 2,
    TransferDst = 1 << 3,
};

inline TextureUsage operator|(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool has_flag(TextureUsage flags, TextureUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

// ============================================================================
// Shader Stages
// ============================================================================

enum class ShaderStage : uint8_t {
    Vertex,
    Fragment,
};

// ============================================================================
// Rendering State Enums
// ============================================================================

enum class PrimitiveTopology : uint8_t {
    PointList,
    LineList,
    TriangleList,
    TriangleStrip,
};

enum class CullMode : uint8_t {
    None,
    Front,
    Back,
};

enum class FrontFace : uint8_t {
    CounterClockwise,
    Clockwise,
};

enum class CompareOp : uint8_t {
    Never,
    Less,
    Equal,
    LessOrEqual,
    Greater,
    NotEqual,
    GreaterOrEqual,
    Always,
};

enum class BlendFactor : uint8_t {
    Zero,
    One,
    SrcAlpha,
    OneMinusSrcAlpha,
};

enum class BlendOp : uint8_t {
    Add,
    Subtract,
};

enum class IndexType : uint8_t {
    Uint16,
    Uint32,
};

enum class FilterMode : uint8_t {
    Nearest,
    Linear,
};

enum class AddressMode : uint8_t {
    Repeat,
    ClampToEdge,
};

// ============================================================================
// Resource Descriptors
// ============================================================================

struct BufferDesc {
    size_t size = 0;
    BufferUsage usage = BufferUsage::None;
    bool host_visible = false;
    const void* initial_data = nullptr;
    std::string debug_name;
};

struct TextureDesc {
    TextureFormat format = TextureFormat::RGBA8Unorm;
    uint32_t width = 1;
    uint32_t height = 1;
    TextureUsage usage = TextureUsage::Sampled;
    const void* initial_data = nullptr;  // width * height * format_size(format) bytes
    std::string debug_name;
};

struct SamplerDesc {
    FilterMode min_filter = FilterMode::Nearest;
    FilterMode mag_filter = FilterMode::Nearest;
    AddressMode address_u = AddressMode::Repeat;
    AddressMode address_v = AddressMode::Repeat;
    std::string debug_name;
};

struct ShaderDesc {
    ShaderStage stage = ShaderStage::Vertex;
    std::span<const uint8_t> bytecode;
    std::string entry_point = "main";
    std::string debug_name;
};

// ============================================================================
// Bind Groups
// ============================================================================

enum class BindingType : uint8_t {
    UniformBuffer,
    SampledTexture,
    Sampler,
};

struct BindGroupLayoutEntry {
    uint32_t binding = 0;
    BindingType type = BindingType::UniformBuffer;
    ShaderStage visibility = ShaderStage::Vertex;
};

struct BindGroupLayoutDesc {
    std::vector<BindGroupLayoutEntry> entries;
    std::string debug_name;
};

class BindGroupLayout;
class Buffer;
class Sampler;
class Texture;

// Exactly one resource pointer is set, matching the layout entry type
struct BindGroupEntry {
    uint32_t binding = 0;
    const Buffer* buffer = nullptr;
    const Texture* texture = nullptr;
    const Sampler* sampler = nullptr;
};

struct BindGroupDesc {
    const BindGroupLayout* layout = nullptr;
    std::vector<BindGroupEntry> entries;
    std::string debug_name;
};

// ============================================================================
// Vertex Input
// ============================================================================

struct VertexAttribute {
    uint32_t location = 0;
    uint32_t binding = 0;
    TextureFormat format = TextureFormat::Unknown;  // Reuse format enum
    uint32_t offset = 0;
};

struct VertexBinding {
    uint32_t binding = 0;
    uint32_t stride = 0;
    bool per_instance = false;
};

// ============================================================================
// Pipeline State
// ============================================================================

struct RasterizerState {
    CullMode cull_mode = CullMode::Back;
    FrontFace front_face = FrontFace::CounterClockwise;
};

struct DepthStencilState {
    bool depth_test_enable = true;
    bool depth_write_enable = true;
    CompareOp depth_compare = CompareOp::Less;
};

struct BlendState {
    bool enable = false;
    BlendFactor src_color = BlendFactor::One;
    BlendFactor dst_color = BlendFactor::Zero;
    BlendOp color_op = BlendOp::Add;
    BlendFactor src_alpha = BlendFactor::One;
    BlendFactor dst_alpha = BlendFactor::Zero;
    BlendOp alpha_op = BlendOp::Add;
    uint8_t color_write_mask = 0xF;  // RGBA

    // Premultiplied "over" compositing
    static BlendState alpha_over() {
        BlendState state;
        state.enable = true;
        state.src_color = BlendFactor::One;
        state.dst_color = BlendFactor::OneMinusSrcAlpha;
        state.src_alpha = BlendFactor::One;
        state.dst_alpha = BlendFactor::OneMinusSrcAlpha;
        return state;
    }
};

// ============================================================================
// Pipeline Descriptors
// ============================================================================

class Shader;

struct PipelineDesc {
    Shader* vertex_shader = nullptr;
    Shader* fragment_shader = nullptr;
    std::vector<VertexAttribute> vertex_attributes;
    std::vector<VertexBinding> vertex_bindings;
    std::vector<const BindGroupLayout*> bind_group_layouts;  // Index = bind group slot
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    RasterizerState rasterizer;
    DepthStencilState depth_stencil;
    std::vector<BlendState> color_blend;
    std::vector<TextureFormat> color_formats;
    TextureFormat depth_format = TextureFormat::Unknown;
    std::string debug_name;
};

// ============================================================================
// Shader Reflection Types
// ============================================================================

struct ShaderUniformMember {
    std::string name;
    std::string type_name;  // "mat4", "vec3", "float", etc.
    size_t offset = 0;
    size_t size = 0;
};

struct ShaderUniformBuffer {
    std::string name;
    uint32_t set = 0;
    uint32_t binding = 0;
    size_t size = 0;
    std::vector<ShaderUniformMember> members;
};

// Separate image or sampler resource
struct ShaderResourceBinding {
    std::string name;
    uint32_t set = 0;
    uint32_t binding = 0;
};

struct ShaderStageInput {
    std::string name;
    uint32_t location = 0;
};

struct ShaderReflection {
    ShaderStage stage = ShaderStage::Vertex;
    std::string entry_point;
    std::vector<ShaderUniformBuffer> uniform_buffers;
    std::vector<ShaderResourceBinding> separate_images;
    std::vector<ShaderResourceBinding> separate_samplers;
    std::vector<ShaderStageInput> inputs;
    std::vector<ShaderStageInput> outputs;
};

}  // namespace blockbridge::graphics
