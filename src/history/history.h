#pragma once
#ifndef TABBIT_HISTORY_H
#define TABBIT_HISTORY_H

#include <set>
#include <utility>
#include <vector>
#include "model/entities.h"
#include "model/roster.h"

namespace tabbit {

// Avoidance and conflict relations derived from Completed rounds. The
// caller owns one History for the duration of a draw computation.
struct History {
    std::set<std::pair<Id, Id>> met_pairs;            // (lower id, higher id)
    std::set<std::pair<Id, Id>> met_institutions;     // (team, opponent institution)
    std::set<std::pair<Id, Id>> judged_teams;         // (adjudicator, team)
    std::set<std::pair<Id, Id>> judged_institutions;  // (adjudicator, institution)
    std::set<Id> bye_teams;

    bool have_met(Id a, Id b) const;
    bool has_met_institution(Id team, Id institution) const;
    bool has_judged(Id adjudicator, Id team) const;
    bool has_judged_institution(Id adjudicator, Id institution) const;
    bool had_bye(Id team) const { return bye_teams.count(team) > 0; }
};

std::pair<Id, Id> unordered_pair(Id a, Id b);

// Only Completed rounds contribute. Throws DataIntegrityError on
// pairings that reference teams or adjudicators outside the roster.
History compute_history(const Roster& roster, const std::vector<RoundRecord>& rounds);

}  // namespace tabbit

#endif  // TABBIT_HISTORY_H
