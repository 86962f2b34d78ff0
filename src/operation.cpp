// =============================================================================
// operation.cpp - Ledger Overlay + Deferred External Interactions
// =============================================================================

#include "dsc/operation.hpp"

#include <spdlog/spdlog.h>

namespace dsc {

Operation::Operation(Ledger& ledger, std::string name)
    : ledger_(ledger), name_(std::move(name)), txn_(ledger) {}

void Operation::add_interaction(Interaction step) {
    interactions_.push_back(std::move(step));
}

void Operation::add_finalizer(Interaction step) {
    finalizers_.push_back(std::move(step));
}

void Operation::notify(std::function<void(EngineListener&)> event) {
    events_.push_back(std::move(event));
}

void Operation::commit() {
    std::vector<const Interaction*> ordered;
    ordered.reserve(interactions_.size() + finalizers_.size());
    for (const auto& step : interactions_) ordered.push_back(&step);
    for (const auto& step : finalizers_) ordered.push_back(&step);

    std::vector<const Interaction*> executed;
    try {
        for (const Interaction* step : ordered) {
            if (!step->execute()) {
                throw EngineError(step->failure, name_ + ": " + step->description + " failed");
            }
            executed.push_back(step);
        }
    } catch (...) {
        unwind(executed);
        throw;
    }

    ledger_.commit(txn_);
    committed_ = true;
}

void Operation::unwind(const std::vector<const Interaction*>& executed) const {
    for (auto it = executed.rbegin(); it != executed.rend(); ++it) {
        const Interaction& step = **it;
        if (!step.compensate) {
            spdlog::error("{}: cannot undo '{}'", name_, step.description);
            continue;
        }
        try {
            if (!step.compensate()) {
                spdlog::error("{}: compensation of '{}' failed", name_, step.description);
            }
        } catch (const std::exception& e) {
            spdlog::error("{}: compensation of '{}' threw: {}", name_, step.description, e.what());
        }
    }
}

void Operation::publish(EngineListener& listener) const {
    if (!committed_) return;

    for (const LedgerChange& change : txn_.changes()) {
        listener.on_ledger_change(change);
    }
    for (const auto& event : events_) {
        event(listener);
    }
}

} // namespace dsc
