#pragma once
#ifndef TABBIT_JUDGE_ALLOCATOR_H
#define TABBIT_JUDGE_ALLOCATOR_H

#include <string>
#include <vector>
#include "config/config.h"
#include "history/history.h"
#include "model/entities.h"
#include "model/roster.h"

namespace tabbit {

// Greedy seniority allocation. Rooms are staffed in importance order (room
// 1 first) from the most experienced eligible adjudicators; the chair is
// the most experienced member of each panel. Bye rooms get no panel.
class JudgeAllocator {
public:
    JudgeAllocator(const History& history, const Roster& roster, const Config& config);

    // Returns the draw's pairings with panels filled in.
    // Throws ConfigurationError, DataIntegrityError or InfeasibleError.
    std::vector<Pairing> allocate(const std::vector<Pairing>& draw,
                                  const std::vector<Adjudicator>& pool) const;

    enum class Rejection { None, AlreadyAssigned, JudgedTeam, SameInstitution, DeclaredConflict, JudgedInstitution };

    // Why `adj` may not sit in a room with `teams`, ignoring double-booking
    Rejection check(const Adjudicator& adj, const std::vector<Id>& teams) const;

private:
    const History& history_;
    const Roster& roster_;
    const Config& config_;
};

const char* to_string(JudgeAllocator::Rejection rejection);

std::vector<Pairing> allocate_panels(const std::vector<Pairing>& draw,
                                     const std::vector<Adjudicator>& pool,
                                     const History& history,
                                     const Roster& roster,
                                     const Config& config);

}  // namespace tabbit

#endif  // TABBIT_JUDGE_ALLOCATOR_H
