#pragma once
#ifndef TABBIT_VALIDATION_H
#define TABBIT_VALIDATION_H

#include "model/entities.h"
#include "model/roster.h"

namespace tabbit {

// Checks the pairings and ballots of one round against the roster:
// every referenced team, adjudicator and debater exists, nobody takes part
// twice, and every ballot scores only teams of its own pairing.
// Throws DataIntegrityError.
void validate_completed_round(const Roster& roster, const RoundRecord& record);

}  // namespace tabbit

#endif  // TABBIT_VALIDATION_H
