#include "history/history.h"
#include "model/validation.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace tabbit {

std::pair<Id, Id> unordered_pair(Id a, Id b) {
    return {std::min(a, b), std::max(a, b)};
}

bool History::have_met(Id a, Id b) const {
    return met_pairs.count(unordered_pair(a, b)) > 0;
}

bool History::has_met_institution(Id team, Id institution) const {
    return met_institutions.count({team, institution}) > 0;
}

bool History::has_judged(Id adjudicator, Id team) const {
    return judged_teams.count({adjudicator, team}) > 0;
}

bool History::has_judged_institution(Id adjudicator, Id institution) const {
    return judged_institutions.count({adjudicator, institution}) > 0;
}

History compute_history(const Roster& roster, const std::vector<RoundRecord>& rounds) {
    History history;

    for (const auto& record : rounds) {
        if (record.round.status != RoundStatus::Completed) continue;
        validate_completed_round(roster, record);

        for (const auto& pairing : record.pairings) {
            if (pairing.bye) {
                for (Id team_id : pairing.team_ids) {
                    history.bye_teams.insert(team_id);
                }
                continue;
            }

            const auto& teams = pairing.team_ids;
            for (size_t i = 0; i < teams.size(); ++i) {
                for (size_t j = i + 1; j < teams.size(); ++j) {
                    history.met_pairs.insert(unordered_pair(teams[i], teams[j]));
                }
                for (size_t j = 0; j < teams.size(); ++j) {
                    if (i == j) continue;
                    if (auto inst = roster.institution_of(teams[j])) {
                        history.met_institutions.insert({teams[i], *inst});
                    }
                }
            }

            for (Id adj_id : pairing.panel.members()) {
                for (Id team_id : teams) {
                    history.judged_teams.insert({adj_id, team_id});
                    if (auto inst = roster.institution_of(team_id)) {
                        history.judged_institutions.insert({adj_id, *inst});
                    }
                }
            }
        }
    }

    spdlog::debug("History: {} met pairs, {} judged pairs, {} byes",
                  history.met_pairs.size(), history.judged_teams.size(), history.bye_teams.size());
    return history;
}

}  // namespace tabbit
