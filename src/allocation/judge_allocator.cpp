#include "allocation/judge_allocator.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <set>

namespace tabbit {

const char* to_string(JudgeAllocator::Rejection rejection) {
    switch (rejection) {
        case JudgeAllocator::Rejection::None: return "eligible";
        case JudgeAllocator::Rejection::AlreadyAssigned: return "already assigned";
        case JudgeAllocator::Rejection::JudgedTeam: return "judged a team before";
        case JudgeAllocator::Rejection::SameInstitution: return "same institution";
        case JudgeAllocator::Rejection::DeclaredConflict: return "declared conflict";
        case JudgeAllocator::Rejection::JudgedInstitution: return "judged the institution before";
    }
    return "unknown";
}

JudgeAllocator::JudgeAllocator(const History& history, const Roster& roster, const Config& config)
    : history_(history), roster_(roster), config_(config) {}

JudgeAllocator::Rejection JudgeAllocator::check(const Adjudicator& adj, const std::vector<Id>& teams) const {
    for (Id team_id : teams) {
        auto inst = roster_.institution_of(team_id);

        if (std::find(adj.conflicted_teams.begin(), adj.conflicted_teams.end(), team_id) !=
            adj.conflicted_teams.end()) {
            return Rejection::DeclaredConflict;
        }
        if (inst && std::find(adj.conflicted_institutions.begin(), adj.conflicted_institutions.end(),
                              *inst) != adj.conflicted_institutions.end()) {
            return Rejection::DeclaredConflict;
        }
        if (history_.has_judged(adj.id, team_id)) {
            return Rejection::JudgedTeam;
        }
        // Independent adjudicators carry no institutional affiliation conflict
        if (!adj.independent && inst && adj.institution_id && *inst == *adj.institution_id) {
            return Rejection::SameInstitution;
        }
        if (config_.avoid_judged_institutions && inst && history_.has_judged_institution(adj.id, *inst)) {
            return Rejection::JudgedInstitution;
        }
    }
    return Rejection::None;
}

std::vector<Pairing> JudgeAllocator::allocate(const std::vector<Pairing>& draw,
                                              const std::vector<Adjudicator>& pool) const {
    config_.validate();

    std::set<Id> pool_ids;
    for (const auto& adj : pool) {
        if (!pool_ids.insert(adj.id).second) {
            throw DataIntegrityError("Adjudicator " + std::to_string(adj.id) +
                                     " appears more than once in the pool");
        }
    }

    std::vector<const Adjudicator*> seniority;
    for (const auto& adj : pool) seniority.push_back(&adj);
    std::sort(seniority.begin(), seniority.end(), [](const Adjudicator* a, const Adjudicator* b) {
        if (a->experience != b->experience) return a->experience > b->experience;
        return a->id < b->id;
    });

    std::vector<Pairing> result(draw);
    std::vector<size_t> importance;
    for (size_t i = 0; i < result.size(); ++i) {
        if (result[i].bye) continue;
        for (Id team_id : result[i].team_ids) roster_.team(team_id);
        importance.push_back(i);
    }
    std::stable_sort(importance.begin(), importance.end(), [&](size_t a, size_t b) {
        return result[a].room < result[b].room;
    });

    const size_t panel_size = static_cast<size_t>(config_.panel_size);
    std::set<Id> assigned;
    for (size_t index : importance) {
        auto& pairing = result[index];
        std::vector<Id> members;
        std::map<Rejection, int> rejected;

        for (const Adjudicator* adj : seniority) {
            if (members.size() == panel_size) break;
            Rejection why = assigned.count(adj->id) ? Rejection::AlreadyAssigned
                                                    : check(*adj, pairing.team_ids);
            if (why != Rejection::None) {
                rejected[why]++;
                continue;
            }
            members.push_back(adj->id);
        }

        if (members.size() < panel_size) {
            std::string detail = "needs " + std::to_string(panel_size) + " adjudicators, found " +
                                 std::to_string(members.size()) + " eligible";
            for (const auto& [why, count] : rejected) {
                detail += "; " + std::to_string(count) + " " + to_string(why);
            }
            throw InfeasibleError(Constraint::PanelSize, pairing.room, 0, detail);
        }

        assigned.insert(members.begin(), members.end());
        pairing.panel.chair = members.front();
        pairing.panel.panelists.assign(members.begin() + 1, members.end());
    }

    spdlog::info("Allocated {} panels of {} from a pool of {}",
                 importance.size(), panel_size, pool.size());
    return result;
}

std::vector<Pairing> allocate_panels(const std::vector<Pairing>& draw,
                                     const std::vector<Adjudicator>& pool,
                                     const History& history,
                                     const Roster& roster,
                                     const Config& config) {
    return JudgeAllocator(history, roster, config).allocate(draw, pool);
}

}  // namespace tabbit
