#include "registry/id_registry.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

class RegistryConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        idreg::RegistryOptions options;
        options.store_path = dir.file("indices.enum");
        registry = std::make_unique<idreg::IdRegistry>(std::move(options));
    }

    TempDir dir;
    std::unique_ptr<idreg::IdRegistry> registry;
};

TEST_F(RegistryConcurrencyTest, ParallelDistinctNamesGetGapFreeIds) {
    const int thread_count = 8;
    const int names_per_thread = 25;

    std::vector<std::vector<idreg::IndexIdPtr>> results(thread_count);
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < names_per_thread; ++i) {
                results[t].push_back(registry->register_name(
                    "t" + std::to_string(t) + "_" + std::to_string(i), std::nullopt));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<int> ids;
    for (const auto& per_thread : results) {
        int previous = 0;
        for (const auto& handle : per_thread) {
            ids.insert(handle->unique_id());
            // Each thread sees its own registrations in order
            EXPECT_GT(handle->unique_id(), previous);
            previous = handle->unique_id();
        }
    }

    const int total = thread_count * names_per_thread;
    ASSERT_EQ(ids.size(), static_cast<size_t>(total));
    EXPECT_EQ(*ids.begin(), 1);
    EXPECT_EQ(*ids.rbegin(), total);
    EXPECT_EQ(registry->persisted_count(), static_cast<size_t>(total));

    // The store agrees with memory
    idreg::EnumStore store(dir.file("indices.enum"));
    auto names = store.load();
    ASSERT_EQ(names.size(), static_cast<size_t>(total));
    for (size_t i = 0; i < names.size(); ++i) {
        EXPECT_EQ(registry->find_by_name(names[i])->unique_id(), i + 1);
    }
}

TEST_F(RegistryConcurrencyTest, ParallelSameNameYieldsOneHandle) {
    const int thread_count = 8;
    std::vector<idreg::IndexIdPtr> handles(thread_count);

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t]() {
            handles[t] = registry->register_name("contended", idreg::Owner{"shared.owner"});
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& handle : handles) {
        EXPECT_EQ(handle.get(), handles[0].get());
    }
    EXPECT_EQ(registry->persisted_count(), 1u);
}

TEST_F(RegistryConcurrencyTest, ReadersRunAlongsideWriters) {
    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};

    std::thread reader([&]() {
        while (!done.load()) {
            for (int id = 1; id <= 50; ++id) {
                auto handle = registry->find_by_id(id);
                if (handle && handle->unique_id() != id) {
                    inconsistent.fetch_add(1);
                }
            }
        }
    });

    for (int i = 0; i < 50; ++i) {
        auto handle = registry->register_name("name" + std::to_string(i), std::nullopt);
        if (i % 2 == 0) {
            registry->unregister(handle);
        }
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_EQ(registry->live_count(), 25u);
    EXPECT_EQ(registry->persisted_count(), 50u);
}
