/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include "../../src/object/shared_object_registry.h"

using namespace arbor;

namespace {
    struct Node {};
}

class SharedObjectRegistryTest : public ::testing::Test {
protected:
    SharedObjectRegistry registry;
};

TEST_F(SharedObjectRegistryTest, MirrorsRegistryOperations) {
    ObjectId root = registry.register_object<Node>();
    ObjectId child = registry.register_object<Node>();
    registry.set_object_name(child, "child");
    registry.set_parent(child, root);

    EXPECT_EQ(registry.parent(child), root);
    EXPECT_EQ(registry.children(root), std::vector<ObjectId>{child});
    EXPECT_EQ(registry.object_name(child), "child");
    EXPECT_EQ(registry.find_child_by_name(root, "child"), child);
    EXPECT_EQ(registry.find_child<Node>(root, "child"), child);
    EXPECT_TRUE(registry.is_ancestor_of(root, child));
    EXPECT_EQ(registry.object_count(), 2u);
}

TEST_F(SharedObjectRegistryTest, ErrorsPropagate) {
    ObjectId a = registry.register_object<Node>();
    ObjectId b = registry.register_object<Node>();
    registry.set_parent(b, a);

    try {
        registry.set_parent(a, b);
        FAIL() << "expected CircularParentage";
    } catch (const ObjectError& e) {
        EXPECT_EQ(e.code(), ObjectErrc::CircularParentage);
    }

    registry.destroy(a);
    EXPECT_THROW(registry.object_name(b), ObjectError);
}

TEST_F(SharedObjectRegistryTest, DestroyIfPresent) {
    ObjectId id = registry.register_object<Node>();
    EXPECT_TRUE(registry.destroy_if_present(id));
    EXPECT_FALSE(registry.destroy_if_present(id));
    EXPECT_FALSE(registry.destroy_if_present(ObjectId::invalid()));
}

TEST_F(SharedObjectRegistryTest, PropertyReadsReturnCopies) {
    ObjectId id = registry.register_object<Node>();
    registry.set_dynamic_property(id, "title", std::string("before"));

    boost::optional<std::string> title = registry.dynamic_property<std::string>(id, "title");
    registry.set_dynamic_property(id, "title", std::string("after"));

    ASSERT_TRUE(title);
    EXPECT_EQ(*title, "before");
    EXPECT_EQ(registry.property_value<std::string>(id, "title"), "after");
    EXPECT_FALSE(registry.dynamic_property<int>(id, "title"));
}

TEST_F(SharedObjectRegistryTest, WithWriteIsAtomic) {
    ObjectId parent = registry.register_object<Node>();

    ObjectId child = registry.with_write([parent](ObjectRegistry& r) {
        ObjectId id = r.register_object<Node>();
        r.set_object_name(id, "built");
        r.set_parent(id, parent);
        return id;
    });

    size_t count = registry.with_read([parent](const ObjectRegistry& r) {
        return r.children(parent).size();
    });
    EXPECT_EQ(count, 1u);
    EXPECT_EQ(registry.object_name(child), "built");
}

TEST_F(SharedObjectRegistryTest, ConcurrentRegistration) {
    const int kThreads = 8;
    const int kPerThread = 500;
    ObjectId root = registry.register_object<Node>();

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, root]() {
            for (int i = 0; i < kPerThread; ++i) {
                ObjectId id = registry.register_object<Node>();
                registry.set_parent(id, root);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(registry.children(root).size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(registry.object_count(), static_cast<size_t>(kThreads * kPerThread + 1));
}

TEST_F(SharedObjectRegistryTest, ReadersRunAlongsideWriters) {
    const int kWrites = 1000;
    const int kReadsPerThread = 2000;
    ObjectId root = registry.register_object<Node>();
    std::atomic<int> failures{0};

    std::thread writer([&]() {
        for (int i = 0; i < kWrites; ++i) {
            ObjectId id = registry.register_object<Node>();
            registry.set_parent(id, root);
            if (i % 2 == 0) {
                registry.destroy(id);
            }
        }
    });

    // Readers do a bounded amount of work and yield between reads so the
    // writer always gets the lock
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            for (int i = 0; i < kReadsPerThread; ++i) {
                // Every child of root must resolve and point back at root
                bool ok = registry.with_read([root](const ObjectRegistry& reg) {
                    for (ObjectId child : reg.children(root)) {
                        if (!reg.contains(child) || reg.parent(child) != root) {
                            return false;
                        }
                    }
                    return true;
                });
                if (!ok) {
                    failures.fetch_add(1);
                }
                std::this_thread::yield();
            }
        });
    }

    writer.join();
    for (auto& th : readers) {
        th.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(registry.children(root).size(), static_cast<size_t>(kWrites / 2));
}

TEST_F(SharedObjectRegistryTest, ConcurrentDestroyOfSameSubtree) {
    ObjectId root = registry.register_object<Node>();
    for (int i = 0; i < 100; ++i) {
        ObjectId id = registry.register_object<Node>();
        registry.set_parent(id, root);
    }

    std::atomic<int> destroyed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            if (registry.destroy_if_present(root)) {
                destroyed.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(destroyed.load(), 1);
    EXPECT_EQ(registry.object_count(), 0u);
}
