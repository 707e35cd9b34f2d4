// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-SRE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of SRE (Stateful Record Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#include "runtime/InMemoryStateStore.h"
#include "runtime/StateMachine.h"
#include "runtime/StateMachineBuilder.h"
#include "tests/mocks/TestRecord.h"
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace SRE {

class ConcurrentFireTest : public ::testing::Test {
protected:
    static constexpr int NUM_THREADS = 8;
    static constexpr int NUM_RECORDS = 50;

    void SetUp() override {
        auto registry = std::make_shared<StateMachineRegistry>();
        StateMachineBuilder(*registry, "Order")
            .declareStates({"pending", "paid", "shipped"})
            .declareEvents({"pay", "ship"})
            .hasStates("pending")
            .states({"pending", "paid", "shipped"})
            .event("pay", [](EventBuilder &e) { e.transitionTo("paid", {"pending"}); })
            .event("ship", [](EventBuilder &e) { e.transitionTo("shipped", {"paid"}); });
        registry->freeze();

        store_ = std::make_shared<InMemoryStateStore>();
        machine_ = std::make_shared<StateMachine>(registry, store_);
    }

    SRE::Test::TestRecord createOrder(const std::string &id) {
        SRE::Test::TestRecord order("Order", id);
        machine_->assignInitialState(order);
        store_->createRecord(order);
        order.markPersisted();
        machine_->runInitialStateActions(order);
        return order;
    }

    std::shared_ptr<InMemoryStateStore> store_;
    std::shared_ptr<StateMachine> machine_;
};

TEST_F(ConcurrentFireTest, ExactlyOneWriterWinsPerRecord) {
    SRE::Test::TestRecord original = createOrder("1");

    std::atomic<bool> startFlag{false};
    std::vector<std::future<FireOutcome>> futures;

    // Each thread holds its own copy loaded in "pending"
    for (int i = 0; i < NUM_THREADS; ++i) {
        futures.push_back(std::async(std::launch::async, [this, &startFlag, original]() mutable {
            while (!startFlag.load()) {
                std::this_thread::yield();
            }
            return machine_->fire(original, "pay");
        }));
    }

    startFlag.store(true);

    int applied = 0;
    int conflicts = 0;
    for (auto &future : futures) {
        FireOutcome outcome = future.get();
        if (outcome.isApplied()) {
            ++applied;
        } else if (outcome.isRejected() && outcome.error == ErrorKind::CONCURRENT_TRANSITION_CONFLICT) {
            ++conflicts;
        }
    }

    EXPECT_EQ(1, applied);
    EXPECT_EQ(NUM_THREADS - 1, conflicts);
    EXPECT_EQ("paid", store_->readCurrentState(original));
    EXPECT_EQ(2u, store_->getStateChanges(original).size());
}

TEST_F(ConcurrentFireTest, IndependentRecordsDoNotInterfere) {
    std::vector<SRE::Test::TestRecord> orders;
    for (int i = 0; i < NUM_RECORDS; ++i) {
        orders.push_back(createOrder(std::to_string(i)));
    }

    std::vector<std::thread> threads;
    std::atomic<int> applied{0};
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, &orders, &applied, t]() {
            for (int i = t; i < NUM_RECORDS; i += NUM_THREADS) {
                if (machine_->fire(orders[i], "pay").isApplied()) {
                    applied++;
                }
                if (machine_->fire(orders[i], "ship").isApplied()) {
                    applied++;
                }
            }
        });
    }

    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(2 * NUM_RECORDS, applied.load());
    EXPECT_EQ(static_cast<size_t>(NUM_RECORDS), machine_->countInState("Order", {"shipped"}));
}

}  // namespace SRE
