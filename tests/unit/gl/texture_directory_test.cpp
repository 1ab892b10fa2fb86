// blockbridge GL Translation Tests
// texture_directory_test.cpp - Tests for TextureDirectory and BindableTexture

#include <gtest/gtest.h>

#include <blockbridge/gl/texture_directory.hpp>

#include "support/recording_device.hpp"

#include <limits>
#include <set>
#include <thread>
#include <vector>

namespace blockbridge::gl {
namespace {

class TextureDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        graphics::BindGroupLayoutDesc desc;
        desc.entries = {
            graphics::BindGroupLayoutEntry{0, graphics::BindingType::SampledTexture, graphics::ShaderStage::Fragment},
            graphics::BindGroupLayoutEntry{1, graphics::BindingType::Sampler, graphics::ShaderStage::Fragment}};
        desc.debug_name = "texture";
        layout_ = device_.create_bind_group_layout(desc);
    }

    std::shared_ptr<const BindableTexture> make_texture(const std::string& name) {
        graphics::TextureDesc desc;
        desc.width = 16;
        desc.height = 16;
        desc.debug_name = name;
        return BindableTexture::create(device_, *layout_, desc);
    }

    testing::RecordingDevice device_;
    std::unique_ptr<graphics::BindGroupLayout> layout_;
    TextureDirectory directory_;
};

// ============================================================================
// BindableTexture
// ============================================================================

TEST_F(TextureDirectoryTest, BindableTextureBindsTextureAndSampler) {
    auto texture = make_texture("grass");

    ASSERT_NE(texture->texture, nullptr);
    ASSERT_NE(texture->sampler, nullptr);
    ASSERT_NE(texture->bind_group, nullptr);
    EXPECT_EQ(texture->bind_group->get_layout(), layout_.get());
    EXPECT_EQ(texture->texture->get_width(), 16u);

    const auto* group = dynamic_cast<const testing::RecordingBindGroup*>(texture->bind_group.get());
    ASSERT_NE(group, nullptr);
    ASSERT_EQ(group->entries().size(), 2u);
    EXPECT_EQ(group->entries()[0].binding, 0u);
    EXPECT_EQ(group->entries()[0].texture, texture->texture.get());
    EXPECT_EQ(group->entries()[1].binding, 1u);
    EXPECT_EQ(group->entries()[1].sampler, texture->sampler.get());
    EXPECT_EQ(group->describe(), "texture:grass");
}

// ============================================================================
// Directory
// ============================================================================

TEST_F(TextureDirectoryTest, AllocateIssuesPositiveDistinctIds) {
    int32_t a = directory_.allocate();
    int32_t b = directory_.allocate();

    EXPECT_GT(a, 0);
    EXPECT_GT(b, 0);
    EXPECT_NE(a, b);
    EXPECT_TRUE(directory_.contains(a));
    EXPECT_EQ(directory_.resolve(a), nullptr);
    EXPECT_EQ(directory_.size(), 2u);
}

TEST_F(TextureDirectoryTest, AllocateSkipsExplicitlyAttachedIds) {
    directory_.attach(1, make_texture("explicit"));
    int32_t id = directory_.allocate();
    EXPECT_NE(id, 1);
    EXPECT_NE(directory_.resolve(1), nullptr);
}

TEST_F(TextureDirectoryTest, AllocateWrapsAtMaxId) {
    constexpr int32_t MAX_ID = std::numeric_limits<int32_t>::max();
    TextureDirectory directory(MAX_ID - 1);

    EXPECT_EQ(directory.allocate(), MAX_ID - 1);
    EXPECT_EQ(directory.allocate(), MAX_ID);
    EXPECT_EQ(directory.allocate(), 1);
    EXPECT_EQ(directory.allocate(), 2);
}

TEST_F(TextureDirectoryTest, AllocateAfterWrapSkipsLiveIds) {
    constexpr int32_t MAX_ID = std::numeric_limits<int32_t>::max();
    TextureDirectory directory(MAX_ID);
    directory.attach(1, make_texture("held"));

    EXPECT_EQ(directory.allocate(), MAX_ID);
    EXPECT_EQ(directory.allocate(), 2);
    EXPECT_NE(directory.resolve(1), nullptr);
}

TEST_F(TextureDirectoryTest, NonPositiveFirstIdStartsAtOne) {
    TextureDirectory directory(0);
    EXPECT_EQ(directory.allocate(), 1);
}

TEST_F(TextureDirectoryTest, AttachAndResolve) {
    int32_t id = directory_.allocate();
    auto texture = make_texture("stone");
    directory_.attach(id, texture);

    EXPECT_EQ(directory_.resolve(id), texture);
}

TEST_F(TextureDirectoryTest, AttachReplaces) {
    int32_t id = directory_.allocate();
    directory_.attach(id, make_texture("old"));
    auto replacement = make_texture("new");
    directory_.attach(id, replacement);

    EXPECT_EQ(directory_.resolve(id), replacement);
    EXPECT_EQ(directory_.size(), 1u);
}

TEST_F(TextureDirectoryTest, DetachKeepsId) {
    int32_t id = directory_.allocate();
    directory_.attach(id, make_texture("stone"));
    directory_.detach(id);

    EXPECT_TRUE(directory_.contains(id));
    EXPECT_EQ(directory_.resolve(id), nullptr);
}

TEST_F(TextureDirectoryTest, RemoveForgetsId) {
    int32_t id = directory_.allocate();
    EXPECT_TRUE(directory_.remove(id));
    EXPECT_FALSE(directory_.contains(id));
    EXPECT_FALSE(directory_.remove(id));
}

TEST_F(TextureDirectoryTest, UnknownIdResolvesToNull) {
    EXPECT_EQ(directory_.resolve(12345), nullptr);
    EXPECT_EQ(directory_.resolve(-1), nullptr);
    EXPECT_FALSE(directory_.contains(0));
}

TEST_F(TextureDirectoryTest, ResolvedTextureOutlivesRemoval) {
    int32_t id = directory_.allocate();
    directory_.attach(id, make_texture("stone"));

    auto held = directory_.resolve(id);
    directory_.remove(id);

    ASSERT_NE(held, nullptr);
    EXPECT_EQ(held->texture->get_width(), 16u);
}

TEST_F(TextureDirectoryTest, ConcurrentAllocateIsUnique) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 100;

    std::vector<std::vector<int32_t>> ids(THREADS);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this, &ids, t]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                ids[t].push_back(directory_.allocate());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<int32_t> unique;
    for (const auto& list : ids) {
        unique.insert(list.begin(), list.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(directory_.size(), static_cast<size_t>(THREADS * PER_THREAD));
}

}  // namespace
}  // namespace blockbridge::gl
