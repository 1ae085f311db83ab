#pragma once
#ifndef TABBIT_ENTITIES_H
#define TABBIT_ENTITIES_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace tabbit {

using Id = int64_t;

struct Tournament {
    Id id = 0;
    std::string name;
};

struct Institution {
    Id id = 0;
    std::string name;
};

struct Debater {
    Id id = 0;
    Id team_id = 0;
    std::string name;
};

struct Team {
    Id id = 0;
    std::string name;
    std::optional<Id> institution_id;  // independent teams have none
    std::vector<Id> debater_ids;
};

struct Adjudicator {
    Id id = 0;
    std::string name;
    std::optional<Id> institution_id;
    int experience = 0;  // higher is more senior
    bool independent = false;
    // Registration-time conflicts of interest
    std::vector<Id> conflicted_teams;
    std::vector<Id> conflicted_institutions;
};

enum class RoundStatus { Pending, Drawn, InProgress, Completed };

const char* to_string(RoundStatus status);
std::optional<RoundStatus> round_status_from_string(const std::string& text);

// Pending -> Drawn -> InProgress -> Completed, one step at a time
bool can_transition(RoundStatus from, RoundStatus to);

struct Panel {
    std::optional<Id> chair;
    std::vector<Id> panelists;  // excludes the chair

    size_t size() const { return panelists.size() + (chair ? 1 : 0); }
    std::vector<Id> members() const;
};

struct Pairing {
    Id id = 0;
    Id round_id = 0;
    int room = 0;  // 1-based, room 1 is the top room
    std::vector<Id> team_ids;
    bool bye = false;
    Panel panel;
};

struct SpeakerScore {
    Id debater_id = 0;
    int position = 0;
    double score = 0.0;
};

struct TeamResult {
    Id team_id = 0;
    int points = 0;  // 1/0 for win/loss, or placement points
    double speaker_score = 0.0;
    std::vector<SpeakerScore> speakers;

    // Sum of per-debater points when recorded, else the team total
    double effective_speaker_score() const;
};

struct Ballot {
    Id id = 0;
    Id pairing_id = 0;
    std::optional<Id> adjudicator_id;
    int version = 1;
    std::vector<TeamResult> results;
};

struct Round {
    Id id = 0;
    int sequence = 0;
    RoundStatus status = RoundStatus::Pending;
    std::string name;
};

struct Motion {
    Id id = 0;
    Id round_id = 0;
    std::string text;
    std::optional<std::string> infoslide;
};

// Tournament-scoped label on debaters and adjudicators ("Novice", "ESL")
struct Tag {
    Id id = 0;
    std::string name;
    std::vector<Id> debater_ids;
    std::vector<Id> adjudicator_ids;
};

// A round together with everything recorded against it
struct RoundRecord {
    Round round;
    std::vector<Pairing> pairings;
    std::vector<Ballot> ballots;
    std::vector<Motion> motions;

    const Pairing* find_pairing(Id pairing_id) const;
};

struct Standing {
    Id team_id = 0;
    int rank = 0;  // 1-based, unique
    int points = 0;
    double speaker_score = 0.0;
    int rounds_contested = 0;
};

struct SpeakerStanding {
    Id debater_id = 0;
    Id team_id = 0;
    int rank = 0;
    double total = 0.0;
    int speeches = 0;
};

// Keeps only the highest-version ballot per pairing
std::vector<const Ballot*> counted_ballots(const RoundRecord& record);

}  // namespace tabbit

#endif  // TABBIT_ENTITIES_H
