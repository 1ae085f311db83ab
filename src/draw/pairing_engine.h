#pragma once
#ifndef TABBIT_PAIRING_ENGINE_H
#define TABBIT_PAIRING_ENGINE_H

#include <optional>
#include <vector>
#include "config/config.h"
#include "core/errors.h"
#include "history/history.h"
#include "model/entities.h"
#include "model/roster.h"

namespace tabbit {

struct Draw {
    // Contested rooms first (room 1 is the top room), then byes
    std::vector<Pairing> pairings;
    int swaps = 0;

    const Pairing* room_of(Id team_id) const;
    size_t contested_rooms() const;
};

// Power-pairs one round. Rooms are seeded from the standings, then
// repaired top to bottom by bounded swaps between nearby ranks until no
// room holds a repeat pairing or (when configured) an institution clash.
class PairingEngine {
public:
    PairingEngine(const History& history, const Roster& roster, const Config& config);

    // Throws ConfigurationError, DataIntegrityError or InfeasibleError.
    // Identical inputs always produce an identical draw.
    Draw generate(const std::vector<Standing>& standings) const;

    // First illegal pair in a group of teams, if any
    struct Violation {
        size_t first;   // indices into the checked group
        size_t second;
        Constraint constraint;
    };
    std::optional<Violation> find_violation(const std::vector<Id>& teams) const;

private:
    const History& history_;
    const Roster& roster_;
    const Config& config_;

    std::optional<Constraint> clash(Id a, Id b) const;
    int count_violations(const std::vector<size_t>& room, const std::vector<Id>& order) const;

    std::vector<size_t> pick_byes(const std::vector<Id>& order) const;
    std::vector<std::vector<size_t>> seed_rooms(const std::vector<Id>& order,
                                                const std::vector<int>& points) const;
    bool try_swap(std::vector<std::vector<size_t>>& rooms, size_t current,
                  const std::vector<Id>& order, size_t offender) const;
};

Draw generate_draw(const std::vector<Standing>& standings,
                   const History& history,
                   const Roster& roster,
                   const Config& config);

}  // namespace tabbit

#endif  // TABBIT_PAIRING_ENGINE_H
