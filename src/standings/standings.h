#pragma once
#ifndef TABBIT_STANDINGS_H
#define TABBIT_STANDINGS_H

#include <vector>
#include <optional>
#include <cstdint>
#include "model/entities.h"
#include "model/roster.h"

namespace tabbit {

// Ranks every roster team from the Completed rounds in `rounds`.
// Order: points desc, speaker score desc, then the tie-break key.
// Without a seed the tie-break is team id ascending; with one it is a
// seeded mix of the team id, falling back to team id.
// Throws DataIntegrityError on ballots or pairings that reference unknown
// or misplaced teams, and on duplicate participation within a round.
std::vector<Standing> compute_standings(const Roster& roster,
                                        const std::vector<RoundRecord>& rounds,
                                        std::optional<uint64_t> tie_break_seed = std::nullopt);

// Per-debater speaker totals from counted ballots, highest first.
// With `tag_id` only debaters carrying that tag are listed and ranked;
// an unknown tag is a DataIntegrityError.
std::vector<SpeakerStanding> compute_speaker_tab(const Roster& roster,
                                                 const std::vector<RoundRecord>& rounds,
                                                 std::optional<Id> tag_id = std::nullopt);

// Stable across platforms and standard libraries
uint64_t tie_break_key(Id team_id, uint64_t seed);

}  // namespace tabbit

#endif  // TABBIT_STANDINGS_H
