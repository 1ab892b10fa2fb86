// blockbridge GL Translation Tests
// command_stream_test.cpp - Tests for CommandStream publication

#include <gtest/gtest.h>

#include <blockbridge/gl/command_stream.hpp>

#include <atomic>
#include <thread>
#include <vector>

namespace blockbridge::gl {
namespace {

CommandListPtr make_clears(size_t count, float value) {
    auto list = std::make_shared<CommandList>();
    for (size_t i = 0; i < count; ++i) {
        list->emplace_back(cmd::ClearColor{value, value, value});
    }
    return list;
}

TEST(CommandStreamTest, InitialSnapshotIsEmpty) {
    CommandStream stream;
    auto snapshot = stream.snapshot();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_TRUE(snapshot->empty());
    EXPECT_EQ(stream.publish_count(), 0u);
}

TEST(CommandStreamTest, SnapshotReturnsLatestPublish) {
    CommandStream stream;
    stream.publish(make_clears(1, 0.5f));
    stream.publish(make_clears(2, 0.25f));

    auto snapshot = stream.snapshot();
    ASSERT_EQ(snapshot->size(), 2u);
    EXPECT_FLOAT_EQ(std::get<cmd::ClearColor>((*snapshot)[0]).r, 0.25f);
    EXPECT_EQ(stream.publish_count(), 2u);
}

TEST(CommandStreamTest, NullPublishBecomesEmptyList) {
    CommandStream stream;
    stream.publish(make_clears(3, 1.0f));
    stream.publish(nullptr);

    auto snapshot = stream.snapshot();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_TRUE(snapshot->empty());
}

TEST(CommandStreamTest, OldSnapshotSurvivesRepublish) {
    CommandStream stream;
    stream.publish(make_clears(4, 1.0f));
    auto held = stream.snapshot();

    stream.publish(make_clears(1, 0.0f));

    EXPECT_EQ(held->size(), 4u);
    EXPECT_EQ(stream.snapshot()->size(), 1u);
}

TEST(CommandStreamTest, ReadersNeverSeePartialLists) {
    CommandStream stream;
    std::atomic<bool> done{false};
    std::atomic<bool> torn{false};

    // List n holds n clears, all carrying value n
    std::thread writer([&stream, &done]() {
        for (size_t n = 1; n <= 500; ++n) {
            stream.publish(make_clears(n, static_cast<float>(n)));
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&stream, &done, &torn]() {
            while (!done) {
                auto snapshot = stream.snapshot();
                auto expected = static_cast<float>(snapshot->size());
                for (const auto& command : *snapshot) {
                    if (std::get<cmd::ClearColor>(command).r != expected) {
                        torn = true;
                    }
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_FALSE(torn);
    EXPECT_EQ(stream.snapshot()->size(), 500u);
    EXPECT_EQ(stream.publish_count(), 500u);
}

}  // namespace
}  // namespace blockbridge::gl
