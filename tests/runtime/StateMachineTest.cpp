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

#include "runtime/StateMachine.h"
#include "common/StateMachineErrors.h"
#include "model/CallbackActions.h"
#include "model/Predicates.h"
#include "runtime/InMemoryStateStore.h"
#include "runtime/StateMachineBuilder.h"
#include "tests/mocks/TestRecord.h"
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace SRE {

class StateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<StateMachineRegistry>();
        store_ = std::make_shared<InMemoryStateStore>();

        StateMachineBuilder(*registry_, "Car")
            .declareStates({"parked", "idling", "first_gear", "stalled"})
            .declareEvents({"ignite", "shift_up", "park", "crash", "repair"})
            .hasStates("parked")
            .states({"parked", "idling", "first_gear", "stalled"})
            .predicate("seatbelt_on",
                       [](IStatefulRecord &record, const CallbackArgs &) {
                           return static_cast<SRE::Test::TestRecord &>(record).seatbeltOn;
                       })
            .event("ignite", [](EventBuilder &e) { e.transitionTo("idling", {"parked", "stalled"}); })
            .event("shift_up",
                   [](EventBuilder &e) {
                       e.transitionTo("first_gear", {"idling"}, Guard::when(makeMethodPredicate("seatbelt_on")));
                   })
            .event("park", [](EventBuilder &e) { e.transitionTo("parked", {"idling", "first_gear"}); })
            .event("crash", [](EventBuilder &e) { e.transitionTo("stalled"); });

        machine_ = std::make_unique<StateMachine>(registry_, store_);
    }

    SRE::Test::TestRecord createCar(const std::string &id) {
        SRE::Test::TestRecord car("Car", id);
        machine_->assignInitialState(car);
        store_->createRecord(car);
        car.markPersisted();
        machine_->runInitialStateActions(car);
        return car;
    }

    std::shared_ptr<StateMachineRegistry> registry_;
    std::shared_ptr<InMemoryStateStore> store_;
    std::unique_ptr<StateMachine> machine_;
};

TEST_F(StateMachineTest, FireAppliesTransition) {
    SRE::Test::TestRecord car = createCar("1");

    FireOutcome outcome = machine_->fire(car, "ignite");

    EXPECT_TRUE(outcome.isApplied());
    EXPECT_EQ("parked", outcome.fromState);
    EXPECT_EQ("idling", outcome.toState);
    EXPECT_EQ("idling", car.getStateName());
    EXPECT_EQ("idling", store_->readCurrentState(car));
    EXPECT_EQ(2u, store_->getStateChanges(car).size());
}

TEST_F(StateMachineTest, FirstMatchingTransitionWins) {
    StateMachineBuilder(*registry_, "Robot")
        .declareStates({"A", "B", "C"})
        .declareEvents({"go"})
        .hasStates("A")
        .states({"A", "B", "C"})
        .event("go", [](EventBuilder &e) {
            e.transitionTo("B", {"A"},
                           Guard::when(makeExpressionPredicate([](IStatefulRecord &, const CallbackArgs &) {
                               return false;
                           })));
            e.transitionTo("C", {"A"},
                           Guard::when(makeExpressionPredicate([](IStatefulRecord &, const CallbackArgs &) {
                               return true;
                           })));
        });

    SRE::Test::TestRecord robot("Robot", "1", "A");
    store_->createRecord(robot);
    robot.markPersisted();

    FireOutcome outcome = machine_->fire(robot, "go");

    ASSERT_TRUE(outcome.isApplied());
    EXPECT_EQ("C", robot.getStateName());
}

TEST_F(StateMachineTest, NoMatchChangesNothing) {
    SRE::Test::TestRecord car = createCar("1");
    size_t historyBefore = store_->getStateChanges(car).size();

    FireOutcome outcome = machine_->fire(car, "shift_up");

    EXPECT_TRUE(outcome.isNoMatch());
    EXPECT_EQ("parked", car.getStateName());
    EXPECT_EQ("parked", store_->readCurrentState(car));
    EXPECT_EQ(historyBefore, store_->getStateChanges(car).size());
}

TEST_F(StateMachineTest, GuardDecidesWithRecordAttributes) {
    SRE::Test::TestRecord car = createCar("1");
    machine_->fire(car, "ignite");

    EXPECT_TRUE(machine_->fire(car, "shift_up").isNoMatch());

    car.seatbeltOn = true;
    EXPECT_TRUE(machine_->fire(car, "shift_up").isApplied());
    EXPECT_EQ("first_gear", car.getStateName());
}

TEST_F(StateMachineTest, InactiveEventIsRejected) {
    SRE::Test::TestRecord car = createCar("1");

    FireOutcome outcome = machine_->fire(car, "repair");

    EXPECT_TRUE(outcome.isRejected());
    EXPECT_EQ(ErrorKind::EVENT_NOT_ACTIVE, outcome.error);
    EXPECT_EQ("parked", car.getStateName());
}

TEST_F(StateMachineTest, InactiveCurrentStateIsRejected) {
    SRE::Test::TestRecord car("Car", "9", "flying");
    store_->createRecord(car);
    car.markPersisted();

    FireOutcome outcome = machine_->fire(car, "ignite");

    EXPECT_TRUE(outcome.isRejected());
    EXPECT_EQ(ErrorKind::STATE_NOT_ACTIVE, outcome.error);
    EXPECT_EQ("flying", store_->readCurrentState(car));
}

TEST_F(StateMachineTest, UnsavedRecordIsRejected) {
    SRE::Test::TestRecord car("Car", "1", "parked");

    FireOutcome outcome = machine_->fire(car, "ignite");

    EXPECT_TRUE(outcome.isRejected());
    EXPECT_EQ(ErrorKind::RECORD_NOT_PERSISTED, outcome.error);
    EXPECT_EQ("parked", car.getStateName());
}

TEST_F(StateMachineTest, RecordWithoutMachineIsRejected) {
    SRE::Test::TestRecord boat("Boat", "1", "docked");
    boat.markPersisted();

    FireOutcome outcome = machine_->fire(boat, "sail");

    EXPECT_TRUE(outcome.isRejected());
    EXPECT_EQ(ErrorKind::MACHINE_NOT_DEFINED, outcome.error);
}

TEST_F(StateMachineTest, StaleRecordIsRejectedAsConflict) {
    SRE::Test::TestRecord car = createCar("1");
    SRE::Test::TestRecord staleCopy = car;

    ASSERT_TRUE(machine_->fire(car, "ignite").isApplied());
    FireOutcome outcome = machine_->fire(staleCopy, "ignite");

    EXPECT_TRUE(outcome.isRejected());
    EXPECT_EQ(ErrorKind::CONCURRENT_TRANSITION_CONFLICT, outcome.error);
    EXPECT_EQ("parked", staleCopy.getStateName());
    EXPECT_EQ(2u, store_->getStateChanges(car).size());
}

TEST_F(StateMachineTest, RecordBehindPersistedStateRunsNoCallbacks) {
    int beforeCalls = 0;
    registry_->extendEvent("Car", "ignite")
        .addCallback(CallbackPhase::BEFORE,
                     ConditionalCallback(makeFunctionAction(
                         [&beforeCalls](IStatefulRecord &, const CallbackArgs &) { ++beforeCalls; })));
    SRE::Test::TestRecord car = createCar("1");
    store_->forceState(car, "stalled");

    FireOutcome outcome = machine_->fire(car, "ignite");

    EXPECT_TRUE(outcome.isRejected());
    EXPECT_EQ(ErrorKind::CONCURRENT_TRANSITION_CONFLICT, outcome.error);
    EXPECT_EQ(0, beforeCalls);
    EXPECT_EQ("parked", car.getStateName());
    EXPECT_EQ("stalled", store_->readCurrentState(car));
}

TEST_F(StateMachineTest, NestedFireOnRolledBackTransitionLeavesNoTrace) {
    FireOutcome nested;
    registry_->extendEvent("Car", "ignite")
        .addCallback(CallbackPhase::AFTER,
                     ConditionalCallback(makeFunctionAction([this, &nested](IStatefulRecord &record,
                                                                            const CallbackArgs &) {
                         SRE::Test::TestRecord copy("Car", record.getRecordId(), "idling");
                         copy.markPersisted();
                         copy.seatbeltOn = true;
                         nested = machine_->fire(copy, "shift_up");
                         throw std::runtime_error("ignition failed");
                     })));
    SRE::Test::TestRecord car = createCar("1");

    EXPECT_THROW(machine_->fire(car, "ignite"), std::runtime_error);

    EXPECT_TRUE(nested.isRejected());
    EXPECT_EQ(ErrorKind::CONCURRENT_TRANSITION_CONFLICT, nested.error);
    EXPECT_EQ("parked", store_->readCurrentState(car));
    EXPECT_EQ("parked", car.getStateName());
    EXPECT_EQ(1u, store_->getStateChanges(car).size());
}

TEST_F(StateMachineTest, StateEnteredAtReadsRecordedTimes) {
    auto ticks = std::make_shared<int>(0);
    auto at = [](int second) { return std::chrono::system_clock::time_point(std::chrono::seconds(second)); };
    StateMachine machine(registry_, store_, [ticks, at]() { return at(++*ticks); });

    SRE::Test::TestRecord car("Car", "1");
    machine.assignInitialState(car);
    store_->createRecord(car);
    car.markPersisted();
    machine.runInitialStateActions(car);

    ASSERT_TRUE(machine.fire(car, "ignite").isApplied());
    ASSERT_TRUE(machine.fire(car, "park").isApplied());
    ASSERT_TRUE(machine.fire(car, "ignite").isApplied());

    EXPECT_EQ((std::vector<std::chrono::system_clock::time_point>{at(1)}),
              machine.stateEnteredAt(car, "parked", Occurrence::FIRST));
    EXPECT_EQ((std::vector<std::chrono::system_clock::time_point>{at(3)}), machine.stateEnteredAt(car, "parked"));
    EXPECT_EQ((std::vector<std::chrono::system_clock::time_point>{at(2), at(4)}),
              machine.stateEnteredAt(car, "idling", Occurrence::ALL));
    EXPECT_TRUE(machine.stateEnteredAt(car, "first_gear").empty());
    EXPECT_THROW(machine.stateEnteredAt(car, "flying"), StateNotActive);
}

TEST_F(StateMachineTest, CallbackExceptionPropagatesAfterRollback) {
    registry_->extendEvent("Car", "ignite")
        .addCallback(CallbackPhase::AFTER,
                     ConditionalCallback(makeFunctionAction(
                         [](IStatefulRecord &, const CallbackArgs &) { throw std::runtime_error("battery dead"); })));
    SRE::Test::TestRecord car = createCar("1");

    EXPECT_THROW(machine_->fire(car, "ignite"), std::runtime_error);
    EXPECT_EQ("parked", car.getStateName());
    EXPECT_EQ("parked", store_->readCurrentState(car));
    EXPECT_EQ(1u, store_->getStateChanges(car).size());
}

TEST_F(StateMachineTest, UndefinedNamedCallbackRaisesMethodNotFound) {
    registry_->extendState("Car", "idling")
        .addCallback(CallbackPhase::BEFORE_ENTER, ConditionalCallback(makeMethodAction("warm_engine")));
    SRE::Test::TestRecord car = createCar("1");

    EXPECT_THROW(machine_->fire(car, "ignite"), MethodNotFound);
    EXPECT_EQ("parked", car.getStateName());
}

TEST_F(StateMachineTest, CallbacksReceiveFireArguments) {
    int receivedGear = 0;
    registry_->defineAction("Car", "after_ignite", [&receivedGear](IStatefulRecord &, const CallbackArgs &args) {
        receivedGear = std::any_cast<int>(args.at(0));
    });
    SRE::Test::TestRecord car = createCar("1");

    machine_->fire(car, "ignite", {std::any(3)});

    EXPECT_EQ(3, receivedGear);
}

TEST_F(StateMachineTest, BootstrapRecordsInitialEntry) {
    StateMachineBuilder(*registry_, "Job")
        .declareStates({"idle", "running"})
        .hasStates("idle")
        .states({"idle", "running"});
    int entered = 0;
    registry_->extendState("Job", "idle")
        .addCallback(CallbackPhase::AFTER_ENTER,
                     ConditionalCallback(makeFunctionAction([&entered](IStatefulRecord &, const CallbackArgs &) {
                         ++entered;
                     })));

    SRE::Test::TestRecord job("Job", "1");
    EXPECT_EQ("idle", machine_->currentState(job));

    machine_->assignInitialState(job);
    EXPECT_EQ("idle", job.getStateName());
    store_->createRecord(job);
    job.markPersisted();

    EXPECT_TRUE(machine_->runInitialStateActions(job));
    EXPECT_FALSE(machine_->runInitialStateActions(job));

    auto changes = store_->getStateChanges(job);
    ASSERT_EQ(1u, changes.size());
    EXPECT_FALSE(changes[0].fromState.has_value());
    EXPECT_FALSE(changes[0].eventName.has_value());
    EXPECT_EQ("idle", changes[0].toState);
    EXPECT_EQ(1, entered);
    EXPECT_TRUE(machine_->isActiveState("Job", "idle"));
}

TEST_F(StateMachineTest, BootstrapUsesInitialStateEvenWithExplicitSlot) {
    int parkedEntered = 0;
    registry_->extendState("Car", "parked")
        .addCallback(CallbackPhase::AFTER_ENTER,
                     ConditionalCallback(makeFunctionAction(
                         [&parkedEntered](IStatefulRecord &, const CallbackArgs &) { ++parkedEntered; })));

    SRE::Test::TestRecord car("Car", "1", "stalled");
    machine_->assignInitialState(car);
    store_->createRecord(car);
    car.markPersisted();

    EXPECT_TRUE(machine_->runInitialStateActions(car));

    auto changes = store_->getStateChanges(car);
    ASSERT_EQ(1u, changes.size());
    EXPECT_TRUE(changes[0].isInitial());
    EXPECT_EQ("parked", changes[0].toState);
    EXPECT_EQ(1, parkedEntered);
    EXPECT_EQ("stalled", car.getStateName());
}

TEST_F(StateMachineTest, AssignInitialStateKeepsExplicitState) {
    SRE::Test::TestRecord car("Car", "1", "stalled");

    machine_->assignInitialState(car);

    EXPECT_EQ("stalled", car.getStateName());
}

TEST_F(StateMachineTest, DynamicInitialStateResolvesPerRecord) {
    MachineOptions options;
    options.initial = InitialStateRule::computed([](const IStatefulRecord &record) {
        return record.getRecordId() == "vip" ? std::string("approved") : std::string("pending");
    });
    StateMachineBuilder(*registry_, "Order")
        .declareStates({"pending", "approved"})
        .hasStates(options)
        .states({"pending", "approved"});

    SRE::Test::TestRecord vip("Order", "vip");
    SRE::Test::TestRecord regular("Order", "42");

    EXPECT_EQ("approved", machine_->initialStateName(vip));
    EXPECT_EQ("pending", machine_->initialStateName(regular));

    machine_->assignInitialState(vip);
    EXPECT_EQ("approved", vip.getStateName());
}

TEST_F(StateMachineTest, InactiveInitialStateIsRejectedAtAssignment) {
    StateMachineBuilder(*registry_, "Ticket").declareStates({"open"}).hasStates("open");
    SRE::Test::TestRecord ticket("Ticket", "1");

    EXPECT_THROW(machine_->assignInitialState(ticket), StateNotActive);
}

TEST_F(StateMachineTest, RunInitialStateActionsRequiresPersistedRecord) {
    SRE::Test::TestRecord car("Car", "1", "parked");

    EXPECT_THROW(machine_->runInitialStateActions(car), RecordNotPersisted);
}

TEST_F(StateMachineTest, Introspection) {
    SRE::Test::TestRecord car = createCar("1");

    EXPECT_TRUE(machine_->isActiveState("Car", "parked"));
    EXPECT_FALSE(machine_->isActiveState("Car", "flying"));
    EXPECT_TRUE(machine_->isActiveEvent("Car", "ignite"));
    EXPECT_FALSE(machine_->isActiveEvent("Car", "repair"));

    EXPECT_EQ((std::vector<std::string>{"idling", "stalled"}), [&]() {
        std::vector<std::string> targets;
        for (const auto &transition : machine_->possibleTransitionsFrom(car, "ignite", "parked")) {
            targets.push_back(transition->getToState());
        }
        for (const auto &transition : machine_->possibleTransitionsFrom(car, "crash", "parked")) {
            targets.push_back(transition->getToState());
        }
        return targets;
    }());

    EXPECT_EQ(std::optional<std::string>("idling"), machine_->nextStateForEvent(car, "ignite"));
    EXPECT_FALSE(machine_->nextStateForEvent(car, "park").has_value());
    EXPECT_TRUE(machine_->nextStatesForEvent(car, "shift_up").empty());
    EXPECT_THROW(machine_->nextStateForEvent(car, "repair"), EventNotActive);
}

TEST_F(StateMachineTest, IntrospectionHasNoSideEffects) {
    int calls = 0;
    registry_->defineAction("Car", "before_ignite", [&calls](IStatefulRecord &, const CallbackArgs &) { ++calls; });
    SRE::Test::TestRecord car = createCar("1");

    machine_->nextStatesForEvent(car, "ignite");

    EXPECT_EQ(0, calls);
    EXPECT_EQ("parked", car.getStateName());
    EXPECT_EQ(1u, store_->getStateChanges(car).size());
}

TEST_F(StateMachineTest, StateQueries) {
    SRE::Test::TestRecord first = createCar("1");
    SRE::Test::TestRecord second = createCar("2");
    createCar("3");
    machine_->fire(first, "ignite");
    machine_->fire(second, "crash");

    EXPECT_TRUE(machine_->isInState(first, "idling"));
    EXPECT_FALSE(machine_->isInState(first, "parked"));
    EXPECT_THROW(machine_->isInState(first, "flying"), StateNotActive);

    EXPECT_EQ(1u, machine_->countInState("Car", {"parked"}));
    EXPECT_EQ(2u, machine_->countInState("Car", {"idling", "stalled"}));
    EXPECT_THROW(machine_->countInState("Car", {"flying"}), StateNotActive);
    EXPECT_THROW(machine_->countInState("Boat", {"docked"}), MachineNotDefined);
}

TEST_F(StateMachineTest, SubclassUsesItsOwnCopy) {
    int subclassCalls = 0;
    StateMachineBuilder(*registry_, "SportsCar")
        .inheritsFrom("Car")
        .onState("idling", CallbackPhase::AFTER_ENTER,
                 ConditionalCallback(makeFunctionAction(
                     [&subclassCalls](IStatefulRecord &, const CallbackArgs &) { ++subclassCalls; })));

    SRE::Test::TestRecord sports("SportsCar", "1");
    machine_->assignInitialState(sports);
    store_->createRecord(sports);
    sports.markPersisted();
    SRE::Test::TestRecord car = createCar("1");

    EXPECT_TRUE(machine_->fire(car, "ignite").isApplied());
    EXPECT_EQ(0, subclassCalls);

    EXPECT_TRUE(machine_->fire(sports, "ignite").isApplied());
    EXPECT_EQ(1, subclassCalls);
}

TEST_F(StateMachineTest, NamedPredicateResolvesAgainstSubclassOverride) {
    StateMachineBuilder(*registry_, "RaceCar")
        .inheritsFrom("Car")
        .predicate("seatbelt_on", [](IStatefulRecord &, const CallbackArgs &) { return true; });

    SRE::Test::TestRecord race("RaceCar", "1", "idling");
    store_->createRecord(race);
    race.markPersisted();

    EXPECT_TRUE(machine_->fire(race, "shift_up").isApplied());
}

}  // namespace SRE
