#pragma once
#ifndef TABBIT_TEST_FIXTURES_H
#define TABBIT_TEST_FIXTURES_H

#include <optional>
#include <string>
#include <vector>
#include "model/entities.h"
#include "model/roster.h"
#include "repository/in_memory_repository.h"

namespace tabbit::fixtures {

// Teams 1..count named "Team <id>"; institutions[i] applies to team i+1
inline std::vector<Team> make_teams(int count, const std::vector<std::optional<Id>>& institutions = {}) {
    std::vector<Team> teams;
    for (int i = 1; i <= count; ++i) {
        Team t;
        t.id = i;
        t.name = "Team " + std::to_string(i);
        if (static_cast<size_t>(i - 1) < institutions.size()) {
            t.institution_id = institutions[static_cast<size_t>(i - 1)];
        }
        teams.push_back(t);
    }
    return teams;
}

inline std::vector<Institution> make_institutions(int count) {
    std::vector<Institution> institutions;
    for (int i = 1; i <= count; ++i) {
        institutions.push_back({100 + i, "Institution " + std::to_string(i)});
    }
    return institutions;
}

inline Adjudicator make_adjudicator(Id id, int experience, std::optional<Id> institution = std::nullopt) {
    Adjudicator a;
    a.id = id;
    a.name = "Adj " + std::to_string(id);
    a.experience = experience;
    a.institution_id = institution;
    return a;
}

// Ranks follow the order of `ids`; everyone on `points`
inline std::vector<Standing> ranked(const std::vector<Id>& ids, int points = 0) {
    std::vector<Standing> standings;
    for (size_t i = 0; i < ids.size(); ++i) {
        standings.push_back({ids[i], static_cast<int>(i + 1), points, 0.0, 0});
    }
    return standings;
}

inline std::vector<Id> iota_ids(int count) {
    std::vector<Id> ids;
    for (int i = 1; i <= count; ++i) ids.push_back(i);
    return ids;
}

// A round with one pairing per entry of `rooms`, pairing ids starting at
// `first_pairing_id`. Single-team rooms are byes.
inline RoundRecord make_round(Id id, int sequence, RoundStatus status,
                              const std::vector<std::vector<Id>>& rooms,
                              Id first_pairing_id = 1) {
    RoundRecord r;
    r.round = {id, sequence, status, "Round " + std::to_string(sequence)};
    int room = 1;
    for (const auto& teams : rooms) {
        Pairing p;
        p.id = first_pairing_id++;
        p.round_id = id;
        p.room = room++;
        p.team_ids = teams;
        p.bye = teams.size() == 1;
        r.pairings.push_back(p);
    }
    return r;
}

inline Ballot win_ballot(Id id, Id pairing_id, Id winner, Id loser,
                         double winner_speaks = 150.0, double loser_speaks = 145.0) {
    Ballot b;
    b.id = id;
    b.pairing_id = pairing_id;
    b.results.push_back({winner, 1, winner_speaks, {}});
    b.results.push_back({loser, 0, loser_speaks, {}});
    return b;
}

// Tournament `id` with `team_count` independent teams, `adj_count`
// adjudicators (experience descending by id) and `round_count` pending rounds
inline TournamentData make_tournament(Id id, int team_count, int adj_count, int round_count) {
    TournamentData data;
    data.tournament = {id, "Open " + std::to_string(id)};
    data.teams = make_teams(team_count);
    for (int i = 1; i <= adj_count; ++i) {
        data.adjudicators.push_back(make_adjudicator(1000 + i, 100 - i));
    }
    for (int s = 1; s <= round_count; ++s) {
        data.rounds.push_back(make_round(id * 100 + s, s, RoundStatus::Pending, {}));
    }
    return data;
}

}  // namespace tabbit::fixtures

#endif  // TABBIT_TEST_FIXTURES_H
