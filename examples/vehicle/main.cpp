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

#include "common/Logger.h"
#include "model/CallbackActions.h"
#include "model/Predicates.h"
#include "runtime/InMemoryStateStore.h"
#include "runtime/StateMachine.h"
#include "runtime/StateMachineBuilder.h"
#include <iostream>
#include <memory>
#include <string>

namespace {

class Vehicle : public SRE::IStatefulRecord {
public:
    Vehicle(const std::string &type, const std::string &id) : type_(type), id_(id) {}

    const std::string &getRecordType() const override {
        return type_;
    }

    const std::string &getRecordId() const override {
        return id_;
    }

    bool isNewRecord() const override {
        return !saved_;
    }

    const std::string &getStateName() const override {
        return state_;
    }

    void setStateName(const std::string &stateName) override {
        state_ = stateName;
    }

    void save(SRE::InMemoryStateStore &store) {
        store.createRecord(*this);
        saved_ = true;
    }

    bool seatbeltOn = false;

private:
    std::string type_;
    std::string id_;
    std::string state_;
    bool saved_ = false;
};

void defineMachines(SRE::StateMachineRegistry &registry) {
    using namespace SRE;

    // Switch: the minimal two-state machine, no audit trail
    StateMachineBuilder(registry, "Switch")
        .declareStates({"off", "on"})
        .declareEvents({"turn_on", "turn_off"})
        .hasStates("off", false)
        .states({"off", "on"})
        .event("turn_on", [](EventBuilder &e) { e.transitionTo("on", {"off"}); })
        .event("turn_off", [](EventBuilder &e) { e.transitionTo("off", {"on"}); });

    StateMachineBuilder(registry, "Car")
        .declareStates({"parked", "idling", "first_gear", "stalled"})
        .declareEvents({"ignite", "shift_up", "park", "crash", "repair"})
        .hasStates("parked")
        .predicate("seatbelt_on",
                   [](IStatefulRecord &record, const CallbackArgs &) {
                       return static_cast<Vehicle &>(record).seatbeltOn;
                   })
        .action("put_on_seatbelt",
                [](IStatefulRecord &record, const CallbackArgs &) {
                    static_cast<Vehicle &>(record).seatbeltOn = true;
                    std::cout << "  * seatbelt on\n";
                })
        .action("after_crash",
                [](IStatefulRecord &record, const CallbackArgs &) {
                    std::cout << "  * " << record.getRecordId() << " crashed\n";
                })
        .states({"parked", "idling", "stalled"})
        .state("first_gear",
               {{CallbackPhase::BEFORE_ENTER,
                 {ConditionalCallback(makeMethodAction("put_on_seatbelt"),
                                      Guard::whenNot(makeMethodPredicate("seatbelt_on")))}}})
        .event("ignite", [](EventBuilder &e) { e.transitionTo("idling", {"parked", "stalled"}); })
        .event("shift_up", [](EventBuilder &e) { e.transitionTo("first_gear", {"idling"}); })
        .event("park", [](EventBuilder &e) { e.transitionTo("parked", {"idling", "first_gear"}); })
        .event("crash", [](EventBuilder &e) { e.transitionTo("stalled"); })
        .event("repair", [](EventBuilder &e) {
            e.transitionTo("parked", {"stalled"}, Guard::when(makeExpressionPredicate(
                                                      [](IStatefulRecord &, const CallbackArgs &args) {
                                                          return !args.empty() && std::any_cast<bool>(args.front());
                                                      },
                                                      "paid")));
        });

    registry.freeze();
}

void report(const std::string &label, const SRE::FireOutcome &outcome) {
    std::cout << "  " << label << ": ";
    if (outcome.isApplied()) {
        std::cout << outcome.fromState << " -> " << outcome.toState;
    } else if (outcome.isNoMatch()) {
        std::cout << "no transition from " << outcome.fromState;
    } else {
        std::cout << "rejected (" << SRE::errorKindToString(outcome.error) << ")";
    }
    std::cout << "\n";
}

}  // anonymous namespace

int main() {
    SRE::Logger::initialize();
    SRE::Logger::setLevel(SRE::LogLevel::Warn);

    auto registry = std::make_shared<SRE::StateMachineRegistry>();
    defineMachines(*registry);

    auto store = std::make_shared<SRE::InMemoryStateStore>();
    SRE::StateMachine machine(registry, store);

    std::cout << "=== Vehicle Example ===" << "\n\n";

    std::cout << "Switch:" << "\n";
    {
        Vehicle light("Switch", "hall");
        machine.assignInitialState(light);
        light.save(*store);
        machine.runInitialStateActions(light);

        report("turn_on", machine.fire(light, "turn_on"));
        report("turn_on", machine.fire(light, "turn_on"));
        report("turn_off", machine.fire(light, "turn_off"));
        std::cout << "  recorded changes: " << store->getStateChanges(light).size() << "\n";
    }

    std::cout << "\n";

    std::cout << "Car:" << "\n";
    {
        Vehicle car("Car", "herbie");
        std::cout << "  initial: " << machine.currentState(car) << "\n";

        machine.assignInitialState(car);
        car.save(*store);
        machine.runInitialStateActions(car);

        report("shift_up", machine.fire(car, "shift_up"));
        report("ignite", machine.fire(car, "ignite"));

        auto next = machine.nextStateForEvent(car, "shift_up");
        std::cout << "  next for shift_up: " << next.value_or("<none>") << "\n";

        report("shift_up", machine.fire(car, "shift_up"));
        report("crash", machine.fire(car, "crash"));
        report("repair", machine.fire(car, "repair", {std::any(false)}));
        report("repair", machine.fire(car, "repair", {std::any(true)}));
        report("fly", machine.fire(car, "fly"));

        std::cout << "  parked cars: " << machine.countInState("Car", {"parked"}) << "\n";
        std::cout << "  history:" << "\n";
        for (const auto &change : store->getStateChanges(car)) {
            std::cout << "    " << change.fromState.value_or("<none>") << " -> " << change.toState << " ("
                      << change.eventName.value_or("<none>") << ")\n";
        }
    }

    return 0;
}
