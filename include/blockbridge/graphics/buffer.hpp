// blockbridge Graphics Abstraction Layer
// buffer.hpp - GPU buffer interface

#pragma once

#include "types.hpp"

#include <cstddef>

namespace blockbridge::graphics {

// Abstract GPU buffer class
// Implemented by the host backend
class Buffer {
public:
    virtual ~Buffer() = default;

    // Non-copyable
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    // Properties
    [[nodiscard]] virtual size_t get_size() const = 0;
    [[nodiscard]] virtual BufferUsage get_usage() const = 0;
    [[nodiscard]] virtual bool is_host_visible() const = 0;

protected:
    Buffer() = default;
};

}  // namespace blockbridge::graphics
