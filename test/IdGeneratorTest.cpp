#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <set>
#include <thread>
#include <vector>
#include "Accessory.h"
#include "IdGenerator.h"

using namespace hapdb;

TEST(IdGeneratorTest, FirstIdFollowsSeed) {
    SequentialIdGenerator generator;
    EXPECT_EQ(generator.current(), 0u);
    EXPECT_EQ(generator.nextId(), 1u);
    EXPECT_EQ(generator.nextId(), 2u);

    SequentialIdGenerator seeded(100);
    EXPECT_EQ(seeded.nextId(), 101u);
    EXPECT_EQ(seeded.current(), 101u);
}

TEST(IdGeneratorTest, ConcurrentAllocationNeverRepeats) {
    SequentialIdGenerator generator;
    const int threadCount = 8;
    const int perThread = 1000;

    std::vector<std::vector<uint64_t>> results(threadCount);
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([&generator, &results, t, perThread]() {
            for (int i = 0; i < perThread; ++i) {
                results[t].push_back(generator.nextId());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<uint64_t> seen;
    for (const auto& ids : results) {
        // Strictly increasing as observed by each thread
        EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
        seen.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(threadCount * perThread));
    EXPECT_EQ(*seen.rbegin(), static_cast<uint64_t>(threadCount * perThread));
}

TEST(IdGeneratorTest, GlobalGeneratorCanBeSubstituted) {
    auto deterministic = std::make_shared<SequentialIdGenerator>(41);
    IdGenerator::setGlobal(deterministic);

    EXPECT_EQ(IdGenerator::global(), deterministic);
    EXPECT_EQ(IdGenerator::global()->nextId(), 42u);

    IdGenerator::setGlobal(nullptr);
}

TEST(IdGeneratorTest, ReplacedGeneratorStaysValidForHolders) {
    IdGenerator::setGlobal(std::make_shared<SequentialIdGenerator>(7));
    std::shared_ptr<IdGenerator> held = IdGenerator::global();

    IdGenerator::setGlobal(nullptr);

    EXPECT_EQ(held->nextId(), 8u);
    EXPECT_NE(IdGenerator::global(), held);
    IdGenerator::setGlobal(nullptr);
}

TEST(IdGeneratorTest, SwappingWhileAccessoriesAreCreated) {
    IdGenerator::setGlobal(std::make_shared<SequentialIdGenerator>());
    std::atomic<bool> done(false);

    std::thread swapper([&done]() {
        while (!done) {
            IdGenerator::setGlobal(std::make_shared<SequentialIdGenerator>());
            IdGenerator::setGlobal(nullptr);
        }
    });

    std::vector<std::thread> builders;
    std::atomic<int> zeroAids(0);
    for (int t = 0; t < 4; ++t) {
        builders.emplace_back([&zeroAids]() {
            for (int i = 0; i < 500; ++i) {
                Accessory accessory;
                if (accessory.getAid() == 0) {
                    ++zeroAids;
                }
            }
        });
    }
    for (auto& builder : builders) {
        builder.join();
    }
    done = true;
    swapper.join();

    EXPECT_EQ(zeroAids.load(), 0);
    IdGenerator::setGlobal(nullptr);
}
