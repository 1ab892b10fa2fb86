// blockbridge GL Translation
// command_stream.hpp - Cross-thread publication of finished command lists

#pragma once

#include "command.hpp"

#include <atomic>
#include <cstdint>

namespace blockbridge::gl {

// Single writer publishes whole lists; any number of readers take snapshots.
// A reader sees either the previous or the new list, never a partial one.
class CommandStream {
public:
    CommandStream();

    // Non-copyable
    CommandStream(const CommandStream&) = delete;
    CommandStream& operator=(const CommandStream&) = delete;

    // Null lists are replaced by an empty one
    void publish(CommandListPtr list);

    // Never null
    [[nodiscard]] CommandListPtr snapshot() const;

    [[nodiscard]] uint64_t publish_count() const { return publish_count_.load(std::memory_order_acquire); }

private:
    std::atomic<CommandListPtr> current_;
    std::atomic<uint64_t> publish_count_{0};
};

}  // namespace blockbridge::gl
