#include <gtest/gtest.h>
#include "session/session_registry.h"
#include "core/errors.h"
#include <atomic>
#include <thread>
#include <vector>

class SessionRegistryTest : public ::testing::Test {
protected:
    termdock::BufferStore buffers_;
    termdock::SessionRegistry registry_{buffers_};
    
    termdock::Session create(const std::string& id = {}) {
        termdock::SessionDescriptor descriptor;
        descriptor.id = id;
        return registry_.create(descriptor);
    }
};

TEST_F(SessionRegistryTest, CreateAssignsIdAndDefaults) {
    termdock::SessionDescriptor descriptor;
    descriptor.context_id = "project-a";
    descriptor.dimensions = {120, 40};
    
    auto session = registry_.create(descriptor);
    
    EXPECT_FALSE(session.id.empty());
    EXPECT_EQ(session.name, session.id);
    EXPECT_EQ(session.context_id, "project-a");
    EXPECT_EQ(session.dimensions, (termdock::Dimensions{120, 40}));
    EXPECT_EQ(session.status, termdock::SessionStatus::Running);
    EXPECT_EQ(session.created_at, session.last_accessed);
    EXPECT_TRUE(registry_.has(session.id));
    
    auto buffer = buffers_.get(session.id);
    ASSERT_TRUE(buffer.has_value());
    EXPECT_TRUE(buffer->scrollback.empty());
    EXPECT_EQ(buffer->dimensions, (termdock::Dimensions{120, 40}));
}

TEST_F(SessionRegistryTest, GeneratedIdsAreUnique) {
    auto a = create();
    auto b = create();
    EXPECT_NE(a.id, b.id);
}

TEST_F(SessionRegistryTest, DuplicateIdRejected) {
    create("main");
    EXPECT_THROW(create("main"), termdock::SessionError);
    EXPECT_EQ(registry_.count(), 1u);
}

TEST_F(SessionRegistryTest, EleventhCreateExceedsCapacity) {
    std::vector<std::string> ids;
    for (int i = 0; i < 10; ++i) {
        ids.push_back(create().id);
    }
    EXPECT_EQ(registry_.count(), 10u);
    
    EXPECT_THROW(create(), termdock::CapacityExceededError);
    
    EXPECT_EQ(registry_.count(), 10u);
    for (const auto& id : ids) {
        EXPECT_TRUE(registry_.has(id));
    }
    
    registry_.destroy(ids.front());
    EXPECT_NO_THROW(create());
}

TEST_F(SessionRegistryTest, CapacityMessageNamesLimit) {
    termdock::SessionRegistry small(buffers_, 1);
    small.create({});
    try {
        small.create({});
        FAIL() << "expected CapacityExceededError";
    } catch (const termdock::CapacityExceededError& e) {
        EXPECT_EQ(e.max_sessions(), 1u);
        EXPECT_STREQ(e.what(), "Maximum terminal sessions reached (1)");
    }
}

TEST_F(SessionRegistryTest, UpdateAppliesPartialFields) {
    auto session = create("s1");
    
    termdock::SessionUpdate update;
    update.name = "renamed";
    update.status = termdock::SessionStatus::Stopped;
    registry_.update("s1", update);
    
    auto updated = registry_.get("s1");
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->name, "renamed");
    EXPECT_EQ(updated->status, termdock::SessionStatus::Stopped);
    EXPECT_EQ(updated->dimensions, session.dimensions);
    EXPECT_GE(updated->last_accessed, session.last_accessed);
}

TEST_F(SessionRegistryTest, UnknownIdsRaiseNotFound) {
    EXPECT_FALSE(registry_.get("missing").has_value());
    EXPECT_THROW(registry_.update("missing", {}), termdock::NotFoundError);
    EXPECT_THROW(registry_.destroy("missing"), termdock::NotFoundError);
    EXPECT_THROW(registry_.save_state("missing", termdock::make_buffer_state("missing", {"x"})),
                 termdock::NotFoundError);
    EXPECT_FALSE(registry_.restore_state("missing").has_value());
}

TEST_F(SessionRegistryTest, SaveAndRestoreState) {
    create("s1");
    registry_.save_state("s1", termdock::make_buffer_state("other", {"a", "b"}, {1, 1}));
    
    auto restored = registry_.restore_state("s1");
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->session_id, "s1");
    EXPECT_EQ(restored->scrollback, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(restored->cursor, (termdock::CursorPos{1, 1}));
}

TEST_F(SessionRegistryTest, DestroyCascadesToBuffersAndListeners) {
    create("s1");
    std::vector<std::string> destroyed;
    auto listener = registry_.add_destroy_listener([&destroyed](const std::string& id) {
        destroyed.push_back(id);
    });
    
    registry_.destroy("s1");
    
    EXPECT_FALSE(registry_.has("s1"));
    EXPECT_FALSE(buffers_.get("s1").has_value());
    ASSERT_EQ(destroyed.size(), 1u);
    EXPECT_EQ(destroyed[0], "s1");
    
    registry_.remove_destroy_listener(listener);
    create("s2");
    registry_.destroy("s2");
    EXPECT_EQ(destroyed.size(), 1u);
}

TEST_F(SessionRegistryTest, ClearAllCascades) {
    create("s1");
    create("s2");
    size_t notified = 0;
    registry_.add_destroy_listener([&notified](const std::string&) { ++notified; });
    
    registry_.clear_all();
    
    EXPECT_EQ(registry_.count(), 0u);
    EXPECT_EQ(buffers_.count(), 0u);
    EXPECT_EQ(notified, 2u);
}

TEST_F(SessionRegistryTest, ConcurrentCreateNeverExceedsCap) {
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &rejected]() {
            for (int i = 0; i < 5; ++i) {
                try {
                    registry_.create({});
                } catch (const termdock::CapacityExceededError&) {
                    ++rejected;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    
    EXPECT_EQ(registry_.count(), 10u);
    EXPECT_EQ(rejected.load(), 30);
}

TEST(SessionRegistryPressureTest, CallbackMayQueryRegistry) {
    termdock::BufferStore buffers(termdock::BufferLimits{}, 10);
    termdock::SessionRegistry registry(buffers);
    size_t seen_count = 0;
    size_t seen_all = 0;
    buffers.monitor().set_pressure_callback([&](const termdock::MemoryPressure&) {
        seen_count = registry.count();
        seen_all = registry.all().size();
    });
    
    termdock::SessionDescriptor descriptor;
    descriptor.id = "s1";
    registry.create(descriptor);
    registry.save_state("s1", termdock::make_buffer_state("s1", {"more than ten bytes", "of output"}));
    
    EXPECT_TRUE(buffers.monitor().under_pressure());
    EXPECT_EQ(seen_count, 1u);
    EXPECT_EQ(seen_all, 1u);
    EXPECT_EQ(registry.restore_state("s1")->scrollback.size(), 2u);
}

TEST(SessionRegistryPressureTest, DestroyDuringSaveLeavesNoBuffer) {
    termdock::BufferStore buffers(termdock::BufferLimits{}, 10);
    termdock::SessionRegistry registry(buffers);
    buffers.monitor().set_pressure_callback([&registry](const termdock::MemoryPressure&) {
        registry.destroy("s1");
    });
    
    termdock::SessionDescriptor descriptor;
    descriptor.id = "s1";
    registry.create(descriptor);
    
    EXPECT_THROW(registry.save_state("s1", termdock::make_buffer_state("s1", {"more than ten bytes"})),
                 termdock::NotFoundError);
    EXPECT_FALSE(registry.has("s1"));
    EXPECT_FALSE(buffers.has("s1"));
    EXPECT_EQ(buffers.count(), 0u);
}
