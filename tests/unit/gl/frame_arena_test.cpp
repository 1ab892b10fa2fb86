// blockbridge GL Translation Tests
// frame_arena_test.cpp - Tests for FrameArena ownership

#include <gtest/gtest.h>

#include <blockbridge/core/config.hpp>
#include <blockbridge/gl/frame_arena.hpp>
#include <blockbridge/gl/texture_directory.hpp>

#include "support/recording_device.hpp"

#include <stdexcept>

namespace blockbridge::gl {
namespace {

class FrameArenaTest : public ::testing::Test {
protected:
    std::unique_ptr<graphics::Buffer> make_buffer(size_t size) {
        graphics::BufferDesc desc;
        desc.size = size;
        desc.usage = graphics::BufferUsage::Vertex;
        return device_.create_buffer(desc);
    }

    std::unique_ptr<graphics::BindGroupLayout> make_texture_layout() {
        graphics::BindGroupLayoutDesc desc;
        desc.debug_name = "texture";
        return device_.create_bind_group_layout(desc);
    }

    testing::RecordingDevice device_;
    FrameArena arena_{8};
};

TEST_F(FrameArenaTest, StartsEmpty) {
    EXPECT_TRUE(arena_.empty());
    EXPECT_EQ(arena_.stats().buffers, 0u);
    EXPECT_EQ(arena_.stats().buffer_bytes, 0u);
}

TEST_F(FrameArenaTest, KeepBuffersTracksBytes) {
    auto* first = arena_.keep(make_buffer(64));
    auto* second = arena_.keep(make_buffer(120));

    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(first, second);
    EXPECT_EQ(first->get_size(), 64u);
    EXPECT_EQ(arena_.stats().buffers, 2u);
    EXPECT_EQ(arena_.stats().buffer_bytes, 184u);
    EXPECT_FALSE(arena_.empty());
}

TEST_F(FrameArenaTest, KeepBindGroup) {
    auto layout = make_texture_layout();
    graphics::BindGroupDesc desc;
    desc.layout = layout.get();

    auto* group = arena_.keep(device_.create_bind_group(desc));
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->get_layout(), layout.get());
    EXPECT_EQ(arena_.stats().bind_groups, 1u);
}

TEST_F(FrameArenaTest, KeepRetainsSharedTexture) {
    auto layout = make_texture_layout();
    graphics::TextureDesc desc;
    desc.debug_name = "stone";

    auto texture = BindableTexture::create(device_, *layout, desc);
    std::weak_ptr<const BindableTexture> watch = texture;

    const auto* kept = arena_.keep(std::move(texture));
    EXPECT_NE(kept, nullptr);
    EXPECT_FALSE(watch.expired());
    EXPECT_EQ(arena_.stats().textures, 1u);

    arena_.reset();
    EXPECT_TRUE(watch.expired());
}

TEST_F(FrameArenaTest, ReserveComesFromSettings) {
    core::Config config;
    config.set_int(core::config_section::GL, core::config_key::FRAME_ARENA_RESERVE, 48);

    FrameArena arena(core::BridgeSettings::from_config(config));
    EXPECT_GE(arena.buffer_capacity(), 48u);
    EXPECT_TRUE(arena.empty());

    FrameArena defaults(core::BridgeSettings::from_config(core::Config{}));
    EXPECT_GE(defaults.buffer_capacity(), 256u);
}

TEST_F(FrameArenaTest, NullObjectsThrow) {
    EXPECT_THROW(arena_.keep(std::unique_ptr<graphics::Buffer>{}), std::runtime_error);
    EXPECT_THROW(arena_.keep(std::unique_ptr<graphics::BindGroup>{}), std::runtime_error);
    EXPECT_THROW(arena_.keep(std::shared_ptr<const BindableTexture>{}), std::runtime_error);
    EXPECT_TRUE(arena_.empty());
}

TEST_F(FrameArenaTest, ResetReleasesEverything) {
    (void)arena_.keep(make_buffer(16));
    (void)arena_.keep(make_buffer(16));
    arena_.reset();

    EXPECT_TRUE(arena_.empty());
    EXPECT_EQ(arena_.stats().buffers, 0u);
    EXPECT_EQ(arena_.stats().buffer_bytes, 0u);

    // Reusable after reset
    (void)arena_.keep(make_buffer(8));
    EXPECT_EQ(arena_.stats().buffers, 1u);
}

}  // namespace
}  // namespace blockbridge::gl
