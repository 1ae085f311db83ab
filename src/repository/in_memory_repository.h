#pragma once
#ifndef TABBIT_IN_MEMORY_REPOSITORY_H
#define TABBIT_IN_MEMORY_REPOSITORY_H

#include <map>
#include <shared_mutex>
#include <vector>
#include "repository/repository.h"

namespace tabbit {

struct TournamentData {
    Tournament tournament;
    std::vector<Institution> institutions;
    std::vector<Team> teams;
    std::vector<Debater> debaters;
    std::vector<Adjudicator> adjudicators;
    std::vector<Tag> tags;
    std::vector<RoundRecord> rounds;
};

class InMemoryRepository : public Repository {
public:
    // Validates the roster; throws DataIntegrityError on duplicates or
    // dangling references. Replaces an existing tournament with the same id.
    void add_tournament(TournamentData data);

    std::optional<Tournament> tournament(Id tournament_id) const override;
    Roster roster(Id tournament_id) const override;
    std::vector<RoundRecord> rounds(Id tournament_id) const override;

    bool commit_draw(Id tournament_id, Id round_id, std::vector<Pairing> pairings) override;
    bool transition_round(Id tournament_id, Id round_id, RoundStatus from, RoundStatus to) override;
    void add_ballot(Id tournament_id, Ballot ballot) override;
    void add_motion(Id tournament_id, Motion motion) override;

    size_t tournament_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<Id, TournamentData> tournaments_;
    Id next_pairing_id_ = 1;

    const TournamentData& data(Id tournament_id) const;
    TournamentData& data(Id tournament_id);
    static RoundRecord* find_round(TournamentData& data, Id round_id);
};

}  // namespace tabbit

#endif  // TABBIT_IN_MEMORY_REPOSITORY_H
