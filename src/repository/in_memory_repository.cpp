#include "repository/in_memory_repository.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <set>

namespace tabbit {

void InMemoryRepository::add_tournament(TournamentData data) {
    // Throws on duplicate ids or unknown institutions
    Roster check(data.institutions, data.teams, data.debaters, data.adjudicators, data.tags);
    for (const auto& d : data.debaters) {
        if (!check.find_team(d.team_id)) {
            throw DataIntegrityError("Debater " + std::to_string(d.id) +
                                     " references unknown team " + std::to_string(d.team_id));
        }
    }

    std::sort(data.rounds.begin(), data.rounds.end(), [](const RoundRecord& a, const RoundRecord& b) {
        return a.round.sequence < b.round.sequence;
    });
    std::set<Id> round_ids;
    std::set<int> sequences;
    for (const auto& r : data.rounds) {
        if (!round_ids.insert(r.round.id).second) {
            throw DataIntegrityError("Duplicate round id " + std::to_string(r.round.id));
        }
        if (!sequences.insert(r.round.sequence).second) {
            throw DataIntegrityError("Duplicate round sequence " + std::to_string(r.round.sequence));
        }
    }

    std::unique_lock lock(mutex_);
    for (const auto& r : data.rounds) {
        for (const auto& p : r.pairings) {
            next_pairing_id_ = std::max(next_pairing_id_, p.id + 1);
        }
    }
    spdlog::info("Loaded tournament {} '{}': {} teams, {} adjudicators, {} rounds",
                 data.tournament.id, data.tournament.name, data.teams.size(),
                 data.adjudicators.size(), data.rounds.size());
    Id id = data.tournament.id;
    tournaments_[id] = std::move(data);
}

const TournamentData& InMemoryRepository::data(Id tournament_id) const {
    auto it = tournaments_.find(tournament_id);
    if (it == tournaments_.end()) {
        throw DataIntegrityError("Unknown tournament " + std::to_string(tournament_id));
    }
    return it->second;
}

TournamentData& InMemoryRepository::data(Id tournament_id) {
    auto it = tournaments_.find(tournament_id);
    if (it == tournaments_.end()) {
        throw DataIntegrityError("Unknown tournament " + std::to_string(tournament_id));
    }
    return it->second;
}

RoundRecord* InMemoryRepository::find_round(TournamentData& data, Id round_id) {
    for (auto& r : data.rounds) {
        if (r.round.id == round_id) return &r;
    }
    return nullptr;
}

std::optional<Tournament> InMemoryRepository::tournament(Id tournament_id) const {
    std::shared_lock lock(mutex_);
    auto it = tournaments_.find(tournament_id);
    if (it == tournaments_.end()) return std::nullopt;
    return it->second.tournament;
}

Roster InMemoryRepository::roster(Id tournament_id) const {
    std::shared_lock lock(mutex_);
    const auto& d = data(tournament_id);
    return Roster(d.institutions, d.teams, d.debaters, d.adjudicators, d.tags);
}

std::vector<RoundRecord> InMemoryRepository::rounds(Id tournament_id) const {
    std::shared_lock lock(mutex_);
    return data(tournament_id).rounds;
}

bool InMemoryRepository::commit_draw(Id tournament_id, Id round_id, std::vector<Pairing> pairings) {
    std::unique_lock lock(mutex_);
    RoundRecord* record = find_round(data(tournament_id), round_id);
    if (!record) {
        throw DataIntegrityError("Unknown round " + std::to_string(round_id));
    }
    if (record->round.status != RoundStatus::Pending) {
        return false;
    }

    for (auto& p : pairings) {
        p.id = next_pairing_id_++;
        p.round_id = round_id;
    }
    record->pairings = std::move(pairings);
    record->round.status = RoundStatus::Drawn;
    return true;
}

bool InMemoryRepository::transition_round(Id tournament_id, Id round_id, RoundStatus from, RoundStatus to) {
    if (!can_transition(from, to)) {
        throw RoundStateError(std::string("Illegal round transition ") + to_string(from) + " -> " +
                              to_string(to));
    }
    std::unique_lock lock(mutex_);
    RoundRecord* record = find_round(data(tournament_id), round_id);
    if (!record) {
        throw DataIntegrityError("Unknown round " + std::to_string(round_id));
    }
    if (record->round.status != from) return false;
    record->round.status = to;
    return true;
}

void InMemoryRepository::add_ballot(Id tournament_id, Ballot ballot) {
    std::unique_lock lock(mutex_);
    for (auto& r : data(tournament_id).rounds) {
        const Pairing* pairing = r.find_pairing(ballot.pairing_id);
        if (!pairing) continue;
        if (pairing->bye) {
            throw DataIntegrityError("Ballot " + std::to_string(ballot.id) +
                                     " targets bye pairing " + std::to_string(ballot.pairing_id));
        }
        r.ballots.push_back(std::move(ballot));
        return;
    }
    throw DataIntegrityError("Ballot " + std::to_string(ballot.id) +
                             " references unknown pairing " + std::to_string(ballot.pairing_id));
}

void InMemoryRepository::add_motion(Id tournament_id, Motion motion) {
    std::unique_lock lock(mutex_);
    RoundRecord* record = find_round(data(tournament_id), motion.round_id);
    if (!record) {
        throw DataIntegrityError("Motion " + std::to_string(motion.id) +
                                 " references unknown round " + std::to_string(motion.round_id));
    }
    record->motions.push_back(std::move(motion));
}

size_t InMemoryRepository::tournament_count() const {
    std::shared_lock lock(mutex_);
    return tournaments_.size();
}

}  // namespace tabbit
