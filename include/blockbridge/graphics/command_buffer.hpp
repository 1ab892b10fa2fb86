// blockbridge Graphics Abstraction Layer
// command_buffer.hpp - Render pass command recording interface

#pragma once

#include "types.hpp"

#include <cstdint>

namespace blockbridge::graphics {

// Forward declarations
class BindGroup;
class Buffer;
class Pipeline;

// Abstract command buffer positioned inside an open render pass
// The host backend owns pass begin/end and submission
class CommandBuffer {
public:
    virtual ~CommandBuffer() = default;

    // Non-copyable
    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

    // ========================================================================
    // Pipeline Binding
    // ========================================================================

    virtual void bind_pipeline(const Pipeline* pipeline) = 0;

    // ========================================================================
    // Resource Binding
    // ========================================================================

    virtual void bind_vertex_buffer(uint32_t slot, const Buffer* buffer, size_t offset = 0) = 0;
    virtual void bind_index_buffer(const Buffer* buffer, IndexType type, size_t offset = 0) = 0;

    // Bind a bind group to a pipeline layout slot
    virtual void bind_group(uint32_t slot, const BindGroup* group) = 0;

    // ========================================================================
    // Draw Commands
    // ========================================================================

    virtual void draw(uint32_t vertex_count, uint32_t instance_count = 1, uint32_t first_vertex = 0,
                      uint32_t first_instance = 0) = 0;

    virtual void draw_indexed(uint32_t index_count, uint32_t instance_count = 1, uint32_t first_index = 0,
                              int32_t vertex_offset = 0, uint32_t first_instance = 0) = 0;

protected:
    CommandBuffer() = default;
};

}  // namespace blockbridge::graphics
