#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "DbPool.h"
#include "../scheduling/ProposalLedger.h"
#include "../scheduling/Types.h"

namespace db {

// Committed placements (task_schedule) and reschedule proposals
// (pending_reschedules) of a plan. Callbacks run on the application
// io_context. A transport failure or a failed statement arrives as a
// non-zero error_code; proposal outcomes arrive as DecisionResult.
class RescheduleRepository {
public:
    using PlacementsCb = std::function<void(const boost::system::error_code&, std::vector<scheduling::Placement>)>;
    using ProposalsCb = std::function<void(const boost::system::error_code&, std::vector<scheduling::RescheduleProposal>)>;
    using InsertCb = std::function<void(const boost::system::error_code&, scheduling::DecisionResult, std::optional<scheduling::RescheduleProposal>)>;
    using DecisionCb = std::function<void(const boost::system::error_code&, scheduling::DecisionResult)>;

    explicit RescheduleRepository(std::shared_ptr<DbPool> db);

    void async_list_placements(const std::string& plan_id, PlacementsCb cb);
    // Stored as pending; a second pending proposal for the task is
    // DuplicatePending.
    void async_insert_proposal(const std::string& plan_id, const scheduling::RescheduleProposal& p, InsertCb cb);
    void async_list_proposals(const std::string& plan_id, std::optional<scheduling::ProposalStatus> status, ProposalsCb cb);
    // Moves the task_schedule row only while it still matches the original
    // slot and the proposed slot is free; otherwise the proposal expires.
    void async_accept_proposal(const std::string& proposal_id, DecisionCb cb);
    void async_reject_proposal(const std::string& proposal_id, DecisionCb cb);

    static std::vector<scheduling::Placement> placements_from(const DbResult& r);
    static std::vector<scheduling::RescheduleProposal> proposals_from(const DbResult& r);
    // Row of (previous_status, new_status) from an accept/reject statement.
    static scheduling::DecisionResult decision_from(const DbResult& r, const std::string& proposal_id);

private:
    std::shared_ptr<DbPool> db_;
};

}
