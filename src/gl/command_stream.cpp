// blockbridge GL Translation
// command_stream.cpp - CommandStream implementation

#include <blockbridge/gl/command_stream.hpp>

namespace blockbridge::gl {

CommandStream::CommandStream() : current_(std::make_shared<const CommandList>()) {}

void CommandStream::publish(CommandListPtr list) {
    if (!list) {
        list = std::make_shared<const CommandList>();
    }
    current_.store(std::move(list), std::memory_order_release);
    publish_count_.fetch_add(1, std::memory_order_acq_rel);
}

CommandListPtr CommandStream::snapshot() const {
    return current_.load(std::memory_order_acquire);
}

}  // namespace blockbridge::gl
