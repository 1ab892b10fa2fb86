// blockbridge GL Translation
// command_recorder.cpp - CommandRecorder implementation

#include <blockbridge/core/logger.hpp>
#include <blockbridge/gl/command_recorder.hpp>

#include <stdexcept>

namespace blockbridge::gl {

void CommandRecorder::set_matrix(const glm::mat4& matrix) {
    commands_.emplace_back(cmd::SetMatrix{matrix});
}

void CommandRecorder::clear_color(float r, float g, float b) {
    commands_.emplace_back(cmd::ClearColor{r, g, b});
}

void CommandRecorder::use_pipeline(LegacyPipeline pipeline) {
    pipeline_ = pipeline;
    commands_.emplace_back(cmd::UsePipeline{pipeline});
}

void CommandRecorder::use_pipeline(int index) {
    use_pipeline(pipeline_from_index(index));
}

void CommandRecorder::set_vertex_buffer(std::span<const uint8_t> bytes) {
    commands_.emplace_back(cmd::SetVertexBuffer{std::vector<uint8_t>(bytes.begin(), bytes.end())});
}

void CommandRecorder::set_index_buffer(std::span<const uint32_t> indices) {
    commands_.emplace_back(cmd::SetIndexBuffer{std::vector<uint32_t>(indices.begin(), indices.end())});
}

void CommandRecorder::draw(uint32_t vertex_count) {
    commands_.emplace_back(cmd::Draw{vertex_count, require_pipeline("draw")});
}

void CommandRecorder::draw_indexed(uint32_t index_count) {
    commands_.emplace_back(cmd::DrawIndexed{index_count, require_pipeline("draw_indexed")});
}

void CommandRecorder::attach_texture(int32_t texture_id) {
    commands_.emplace_back(cmd::AttachTexture{texture_id});
}

CommandListPtr CommandRecorder::finish() {
    auto list = std::make_shared<const CommandList>(std::move(commands_));
    commands_ = CommandList{};
    BLOCKBRIDGE_LOG_TRACE(core::log_category::GL, "Recorded {} commands", list->size());
    return list;
}

void CommandRecorder::reset() {
    commands_.clear();
    pipeline_.reset();
}

LegacyPipeline CommandRecorder::require_pipeline(const char* operation) const {
    if (!pipeline_) {
        throw std::logic_error(fmt::format("{} recorded before any pipeline was selected", operation));
    }
    return *pipeline_;
}

}  // namespace blockbridge::gl
