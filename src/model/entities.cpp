#include "model/entities.h"
#include <map>

namespace tabbit {

const char* to_string(RoundStatus status) {
    switch (status) {
        case RoundStatus::Pending: return "pending";
        case RoundStatus::Drawn: return "drawn";
        case RoundStatus::InProgress: return "in_progress";
        case RoundStatus::Completed: return "completed";
    }
    return "unknown";
}

std::optional<RoundStatus> round_status_from_string(const std::string& text) {
    if (text == "pending") return RoundStatus::Pending;
    if (text == "drawn") return RoundStatus::Drawn;
    if (text == "in_progress") return RoundStatus::InProgress;
    if (text == "completed") return RoundStatus::Completed;
    return std::nullopt;
}

bool can_transition(RoundStatus from, RoundStatus to) {
    return static_cast<int>(to) == static_cast<int>(from) + 1;
}

std::vector<Id> Panel::members() const {
    std::vector<Id> result;
    result.reserve(size());
    if (chair) result.push_back(*chair);
    result.insert(result.end(), panelists.begin(), panelists.end());
    return result;
}

double TeamResult::effective_speaker_score() const {
    if (speakers.empty()) return speaker_score;
    double total = 0.0;
    for (const auto& s : speakers) {
        total += s.score;
    }
    return total;
}

const Pairing* RoundRecord::find_pairing(Id pairing_id) const {
    for (const auto& p : pairings) {
        if (p.id == pairing_id) return &p;
    }
    return nullptr;
}

std::vector<const Ballot*> counted_ballots(const RoundRecord& record) {
    // Ties on version keep the ballot recorded first
    std::map<Id, const Ballot*> latest;
    for (const auto& ballot : record.ballots) {
        auto it = latest.find(ballot.pairing_id);
        if (it == latest.end() || ballot.version > it->second->version) {
            latest[ballot.pairing_id] = &ballot;
        }
    }

    std::vector<const Ballot*> result;
    result.reserve(latest.size());
    for (const auto& [_, ballot] : latest) {
        result.push_back(ballot);
    }
    return result;
}

}  // namespace tabbit
