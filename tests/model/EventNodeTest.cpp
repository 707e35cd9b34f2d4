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

#include "model/EventNode.h"
#include "model/CallbackActions.h"
#include "model/MethodTable.h"
#include "model/Predicates.h"
#include "model/StateNode.h"
#include "tests/mocks/TestRecord.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace SRE {

class EventNodeTest : public ::testing::Test {
protected:
    static std::shared_ptr<const IPredicate> constant(bool value) {
        return makeExpressionPredicate([value](IStatefulRecord &, const CallbackArgs &) { return value; },
                                       value ? "true" : "false");
    }

    MethodTable methods_;
    SRE::Test::TestRecord car_{"Car", "1", "A"};
};

TEST_F(EventNodeTest, FirstMatchingTransitionWins) {
    EventNode event("Car", "go", 1);
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{"A"}, "B",
                                                         Guard::when(constant(false))));
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{"A"}, "C",
                                                         Guard::when(constant(true))));
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{"A"}, "D"));

    auto selected = event.selectTransition(car_, "A", {}, methods_);
    ASSERT_NE(nullptr, selected);
    EXPECT_EQ("C", selected->getToState());
}

TEST_F(EventNodeTest, IneligibleTransitionsAreSkippedWithoutGuardEvaluation) {
    int evaluations = 0;
    EventNode event("Car", "go", 1);
    event.addTransition(std::make_shared<TransitionNode>(
        "go", std::vector<std::string>{"X"}, "B",
        Guard::when(makeExpressionPredicate([&evaluations](IStatefulRecord &, const CallbackArgs &) {
            ++evaluations;
            return true;
        }))));
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{}, "C"));

    auto selected = event.selectTransition(car_, "A", {}, methods_);
    ASSERT_NE(nullptr, selected);
    EXPECT_EQ("C", selected->getToState());
    EXPECT_EQ(0, evaluations);
}

TEST_F(EventNodeTest, NoEligibleTransitionSelectsNothing) {
    EventNode event("Car", "go", 1);
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{"B"}, "C"));

    EXPECT_EQ(nullptr, event.selectTransition(car_, "A", {}, methods_));
    EXPECT_TRUE(event.possibleTransitionsFrom(car_, "A", {}, methods_).empty());
}

TEST_F(EventNodeTest, PossibleTransitionsKeepDefinitionOrder) {
    EventNode event("Car", "go", 1);
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{}, "D"));
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{"A"}, "B",
                                                         Guard::when(constant(false))));
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{"A"}, "C"));

    auto possible = event.possibleTransitionsFrom(car_, "A", {}, methods_);
    ASSERT_EQ(2u, possible.size());
    EXPECT_EQ("D", possible[0]->getToState());
    EXPECT_EQ("C", possible[1]->getToState());
}

TEST_F(EventNodeTest, TransitionOfAnotherEventIsRejected) {
    EventNode event("Car", "go", 1);

    EXPECT_THROW(event.addTransition(std::make_shared<TransitionNode>("stop", std::vector<std::string>{}, "A")),
                 std::invalid_argument);
    EXPECT_THROW(event.addTransition(nullptr), std::invalid_argument);
}

TEST_F(EventNodeTest, OnlyBeforeAndAfterPhasesAccepted) {
    EventNode event("Car", "go", 1);
    ConditionalCallback callback(makeFunctionAction([](IStatefulRecord &, const CallbackArgs &) {}));

    EXPECT_NO_THROW(event.addCallback(CallbackPhase::BEFORE, callback));
    EXPECT_NO_THROW(event.addCallback(CallbackPhase::AFTER, callback));
    EXPECT_THROW(event.addCallback(CallbackPhase::BEFORE_ENTER, callback), std::invalid_argument);
    EXPECT_EQ(1u, event.getCallbacks(CallbackPhase::BEFORE).size());
    EXPECT_EQ(1u, event.getCallbacks(CallbackPhase::AFTER).size());
}

TEST_F(EventNodeTest, StateNodeRejectsEventPhases) {
    StateNode state("Car", "A", 1);
    ConditionalCallback callback(makeFunctionAction([](IStatefulRecord &, const CallbackArgs &) {}));

    EXPECT_THROW(state.addCallback(CallbackPhase::AFTER, callback), std::invalid_argument);
    EXPECT_NO_THROW(state.addCallback(CallbackPhase::AFTER_ENTER, callback));
    EXPECT_TRUE(state.getCallbacks(CallbackPhase::BEFORE_EXIT).empty());
}

TEST_F(EventNodeTest, CloneRebindsOwnerAndIsolatesCallbacks) {
    EventNode event("Vehicle", "go", 1);
    event.addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{}, "A"));

    auto copy = event.cloneFor("Car");
    copy->addCallback(CallbackPhase::AFTER,
                      ConditionalCallback(makeFunctionAction([](IStatefulRecord &, const CallbackArgs &) {})));
    copy->addTransition(std::make_shared<TransitionNode>("go", std::vector<std::string>{}, "B"));

    EXPECT_EQ("Car", copy->getOwnerType());
    EXPECT_EQ(1, copy->getCatalogId());
    EXPECT_EQ(2u, copy->getTransitions().size());
    EXPECT_EQ(1u, event.getTransitions().size());
    EXPECT_TRUE(event.getCallbacks(CallbackPhase::AFTER).empty());
}

TEST_F(EventNodeTest, ConditionalCallbackRunsOnlyWhenGuardPasses) {
    int calls = 0;
    ConditionalCallback skipped(makeFunctionAction([&calls](IStatefulRecord &, const CallbackArgs &) { ++calls; }),
                                Guard::when(constant(false)));
    ConditionalCallback executed(makeFunctionAction([&calls](IStatefulRecord &, const CallbackArgs &) { ++calls; }),
                                 Guard::whenNot(constant(false)));

    EXPECT_FALSE(skipped.run(car_, {}, methods_));
    EXPECT_TRUE(executed.run(car_, {}, methods_));
    EXPECT_EQ(1, calls);
}

}  // namespace SRE
