// blockbridge GL Translation
// command_recorder.hpp - Builds a CommandList from legacy GL calls

#pragma once

#include "command.hpp"

#include <optional>
#include <span>

namespace blockbridge::gl {

// Accumulates commands for one frame. Single-threaded: one recording thread owns it.
// The selected pipeline persists across finish(), matching GL's sticky state.
class CommandRecorder {
public:
    CommandRecorder() = default;

    // Non-copyable
    CommandRecorder(const CommandRecorder&) = delete;
    CommandRecorder& operator=(const CommandRecorder&) = delete;

    void set_matrix(const glm::mat4& matrix);
    void clear_color(float r, float g, float b);

    void use_pipeline(LegacyPipeline pipeline);
    // Host-facing variant; throws std::out_of_range for unknown values
    void use_pipeline(int index);

    void set_vertex_buffer(std::span<const uint8_t> bytes);
    void set_index_buffer(std::span<const uint32_t> indices);

    // Throw std::logic_error if no pipeline has been selected yet
    void draw(uint32_t vertex_count);
    void draw_indexed(uint32_t index_count);

    void attach_texture(int32_t texture_id);

    // Hand over the recorded list and start a new one
    [[nodiscard]] CommandListPtr finish();

    // Drop recorded commands and the selected pipeline
    void reset();

    [[nodiscard]] size_t size() const { return commands_.size(); }
    [[nodiscard]] bool empty() const { return commands_.empty(); }
    [[nodiscard]] std::optional<LegacyPipeline> current_pipeline() const { return pipeline_; }

private:
    LegacyPipeline require_pipeline(const char* operation) const;

    CommandList commands_;
    std::optional<LegacyPipeline> pipeline_;
};

}  // namespace blockbridge::gl
