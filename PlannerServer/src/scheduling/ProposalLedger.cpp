#include "ProposalLedger.h"
#include "../observability/Logging.h"
#include <openssl/rand.h>
#include <cstdio>
#include <stdexcept>

namespace scheduling {

const char* to_string(DecisionError e) {
    switch (e) {
        case DecisionError::None: return "none";
        case DecisionError::NotFound: return "not_found";
        case DecisionError::NotPending: return "not_pending";
        case DecisionError::Stale: return "proposal_stale";
        case DecisionError::DuplicatePending: return "duplicate_pending";
        case DecisionError::RepositoryUnavailable: return "repository_unavailable";
    }
    return "none";
}

std::string generate_proposal_id() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) throw std::runtime_error("RAND_bytes failed");
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
    char buf[37];
    std::snprintf(buf, sizeof(buf),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
        b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf);
}

ProposalLedger::ProposalLedger(const std::vector<Placement>& committed) {
    for (const auto& p : committed) committed_[p.task_id] = p;
}

DecisionResult ProposalLedger::add(RescheduleProposal proposal) {
    DecisionResult r;
    for (const auto& kv : proposals_) {
        if (kv.second.task_id == proposal.task_id && kv.second.status == ProposalStatus::Pending) {
            r.proposal_id = kv.first;
            r.error = DecisionError::DuplicatePending;
            return r;
        }
    }
    if (proposal.id.empty()) proposal.id = generate_proposal_id();
    if (proposals_.count(proposal.id)) {
        r.proposal_id = proposal.id;
        r.error = DecisionError::DuplicatePending;
        return r;
    }
    proposal.status = ProposalStatus::Pending;
    proposal.reviewed_at.reset();
    r.proposal_id = proposal.id;
    order_.push_back(proposal.id);
    proposals_.emplace(proposal.id, std::move(proposal));
    return r;
}

bool ProposalLedger::is_stale(const RescheduleProposal& p) const {
    auto cur = committed_.find(p.task_id);
    if (cur == committed_.end() || !cur->second.same_slot(p.original)) return true;
    for (const auto& kv : committed_) {
        const Placement& o = kv.second;
        if (kv.first == p.task_id || o.detached || o.date != p.proposed.date) continue;
        if (o.start_minute < p.proposed.end_minute && p.proposed.start_minute < o.end_minute) return true;
    }
    return false;
}

DecisionResult ProposalLedger::accept(const std::string& id, std::time_t now) {
    DecisionResult r;
    r.proposal_id = id;
    auto it = proposals_.find(id);
    if (it == proposals_.end()) { r.error = DecisionError::NotFound; return r; }
    RescheduleProposal& p = it->second;
    if (p.status != ProposalStatus::Pending) { r.error = DecisionError::NotPending; return r; }
    if (is_stale(p)) {
        p.status = ProposalStatus::Expired;
        p.reviewed_at = now;
        r.error = DecisionError::Stale;
        observability::log_info("proposal.stale", {{"proposal_id", id}, {"task_id", p.task_id}});
        return r;
    }
    committed_[p.task_id] = p.proposed;
    p.status = ProposalStatus::Accepted;
    p.reviewed_at = now;
    return r;
}

DecisionResult ProposalLedger::reject(const std::string& id, std::time_t now) {
    DecisionResult r;
    r.proposal_id = id;
    auto it = proposals_.find(id);
    if (it == proposals_.end()) { r.error = DecisionError::NotFound; return r; }
    if (it->second.status != ProposalStatus::Pending) { r.error = DecisionError::NotPending; return r; }
    it->second.status = ProposalStatus::Rejected;
    it->second.reviewed_at = now;
    return r;
}

BatchDecision ProposalLedger::accept_batch(const std::vector<std::string>& ids, std::time_t now) {
    BatchDecision out;
    for (const auto& id : ids) {
        auto r = accept(id, now);
        if (r.ok()) out.accepted.push_back(id);
        else out.errors.push_back(std::move(r));
    }
    return out;
}

int ProposalLedger::expire_stale(std::time_t now) {
    int n = 0;
    for (const auto& id : order_) {
        auto& p = proposals_.at(id);
        if (p.status != ProposalStatus::Pending || !is_stale(p)) continue;
        p.status = ProposalStatus::Expired;
        p.reviewed_at = now;
        ++n;
    }
    return n;
}

void ProposalLedger::commit(const Placement& p) { committed_[p.task_id] = p; }

const RescheduleProposal* ProposalLedger::find(const std::string& id) const {
    auto it = proposals_.find(id);
    return it == proposals_.end() ? nullptr : &it->second;
}

std::vector<RescheduleProposal> ProposalLedger::list(std::optional<ProposalStatus> status) const {
    std::vector<RescheduleProposal> out;
    for (const auto& id : order_) {
        const auto& p = proposals_.at(id);
        if (!status || p.status == *status) out.push_back(p);
    }
    return out;
}

std::vector<Placement> ProposalLedger::placements() const {
    std::vector<Placement> out;
    out.reserve(committed_.size());
    for (const auto& kv : committed_) out.push_back(kv.second);
    return out;
}

}
