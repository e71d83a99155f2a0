#pragma once

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Types.h"

namespace scheduling {

enum class DecisionError { None, NotFound, NotPending, Stale, DuplicatePending, RepositoryUnavailable };

const char* to_string(DecisionError e);

struct DecisionResult {
    std::string proposal_id;
    DecisionError error = DecisionError::None;
    bool ok() const { return error == DecisionError::None; }
};

struct BatchDecision {
    std::vector<std::string> accepted;
    std::vector<DecisionResult> errors;
};

// Random UUIDv4 from OpenSSL. Throws std::runtime_error if the RNG fails.
std::string generate_proposal_id();

// A caller-owned snapshot of proposals and the committed placement of each
// task. pending -> accepted | rejected | expired; every other state is final.
class ProposalLedger {
public:
    ProposalLedger() = default;
    explicit ProposalLedger(const std::vector<Placement>& committed);

    // Assigns an id when the proposal has none. One pending proposal per task.
    DecisionResult add(RescheduleProposal proposal);

    // Swaps the committed placement if the proposal's original is still the
    // current one and the new slot is free; otherwise the proposal expires
    // and placements stay as they were.
    DecisionResult accept(const std::string& id, std::time_t now);
    DecisionResult reject(const std::string& id, std::time_t now);
    // Each id is decided on its own; failures do not stop the rest.
    BatchDecision accept_batch(const std::vector<std::string>& ids, std::time_t now);
    // Expires every pending proposal that could no longer be applied.
    int expire_stale(std::time_t now);

    // A manual edit, superseding the task's committed placement.
    void commit(const Placement& p);

    const RescheduleProposal* find(const std::string& id) const;
    std::vector<RescheduleProposal> list(std::optional<ProposalStatus> status = std::nullopt) const;
    std::vector<Placement> placements() const;

private:
    bool is_stale(const RescheduleProposal& p) const;

    std::map<std::string, RescheduleProposal> proposals_;
    std::vector<std::string> order_;
    std::map<std::string, Placement> committed_;
};

}
