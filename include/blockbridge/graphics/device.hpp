// blockbridge Graphics Abstraction Layer
// device.hpp - Graphics device interface

#pragma once

#include "types.hpp"

#include <memory>

namespace blockbridge::graphics {

// Forward declarations
class BindGroup;
class BindGroupLayout;
class Buffer;
class Pipeline;
class Sampler;
class Shader;
class Texture;

// Abstract graphics device class
// The concrete backend is supplied by the host application
class GraphicsDevice {
public:
    virtual ~GraphicsDevice() = default;

    // Non-copyable, non-movable
    GraphicsDevice(const GraphicsDevice&) = delete;
    GraphicsDevice& operator=(const GraphicsDevice&) = delete;
    GraphicsDevice(GraphicsDevice&&) = delete;
    GraphicsDevice& operator=(GraphicsDevice&&) = delete;

    // ========================================================================
    // Resource Creation
    // ========================================================================

    [[nodiscard]] virtual std::unique_ptr<Buffer> create_buffer(const BufferDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Texture> create_texture(const TextureDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Sampler> create_sampler(const SamplerDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Shader> create_shader(const ShaderDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<BindGroupLayout> create_bind_group_layout(
        const BindGroupLayoutDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<BindGroup> create_bind_group(const BindGroupDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Pipeline> create_pipeline(const PipelineDesc& desc) = 0;

    // ========================================================================
    // Device Info
    // ========================================================================

    [[nodiscard]] virtual const char* get_backend_name() const = 0;

protected:
    GraphicsDevice() = default;
};

}  // namespace blockbridge::graphics
