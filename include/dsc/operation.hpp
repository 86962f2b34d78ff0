#ifndef DSC_OPERATION_HPP
#define DSC_OPERATION_HPP

#include <functional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "ledger.hpp"
#include "listener.hpp"

namespace dsc {

// =============================================================================
// Interaction - One Call into an External Collaborator
// =============================================================================

struct Interaction {
    std::string description;
    ErrorKind failure;                  // Raised when execute() returns false
    std::function<bool()> execute;
    std::function<bool()> compensate;   // Empty when the call cannot be undone
};

// =============================================================================
// Operation - All-or-nothing Unit of Work
//
// Ledger mutations accumulate in a LedgerTxn and every solvency check reads
// that overlay. External interactions are queued and only run in commit(),
// after all checks passed: interactions in the order they were added, then
// finalizers. If any of them fails, the ones already executed are
// compensated in reverse order, the overlay is dropped and the failure is
// rethrown. Otherwise the overlay is published to the ledger.
// =============================================================================

class Operation {
public:
    Operation(Ledger& ledger, std::string name);

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    const std::string& name() const { return name_; }

    LedgerTxn& txn() { return txn_; }
    const LedgerView& view() const { return txn_; }

    void add_interaction(Interaction step);
    void add_finalizer(Interaction step);

    // Queued for delivery by publish()
    void notify(std::function<void(EngineListener&)> event);

    // Run interactions and publish the ledger overlay. Throws on failure.
    void commit();
    bool committed() const { return committed_; }

    // Deliver ledger changes and queued events; no-op unless committed
    void publish(EngineListener& listener) const;

private:
    void unwind(const std::vector<const Interaction*>& executed) const;

    Ledger& ledger_;
    std::string name_;
    LedgerTxn txn_;
    std::vector<Interaction> interactions_;
    std::vector<Interaction> finalizers_;
    std::vector<std::function<void(EngineListener&)>> events_;
    bool committed_ = false;
};

} // namespace dsc

#endif // DSC_OPERATION_HPP
