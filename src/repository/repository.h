#pragma once
#ifndef TABBIT_REPOSITORY_H
#define TABBIT_REPOSITORY_H

#include <optional>
#include <vector>
#include "model/entities.h"
#include "model/roster.h"

namespace tabbit {

// Storage collaborator keyed by tournament identity. Reads return fully
// materialized copies; nothing is loaded lazily.
class Repository {
public:
    virtual ~Repository() = default;

    virtual std::optional<Tournament> tournament(Id tournament_id) const = 0;

    // Throw DataIntegrityError for an unknown tournament
    virtual Roster roster(Id tournament_id) const = 0;
    virtual std::vector<RoundRecord> rounds(Id tournament_id) const = 0;  // by sequence

    // Stores the pairings and panels of a Pending round and marks it Drawn,
    // all at once. Returns false (storing nothing) if the round is not Pending.
    virtual bool commit_draw(Id tournament_id, Id round_id, std::vector<Pairing> pairings) = 0;

    // Compare-and-set on round status; false if the current status is not `from`.
    // Throws RoundStateError when `from -> to` is not a lifecycle step.
    virtual bool transition_round(Id tournament_id, Id round_id, RoundStatus from, RoundStatus to) = 0;

    // Throws DataIntegrityError for an unknown or bye pairing
    virtual void add_ballot(Id tournament_id, Ballot ballot) = 0;
    virtual void add_motion(Id tournament_id, Motion motion) = 0;
};

}  // namespace tabbit

#endif  // TABBIT_REPOSITORY_H
