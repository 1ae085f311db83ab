#pragma once
#ifndef TABBIT_ROSTER_H
#define TABBIT_ROSTER_H

#include <map>
#include <optional>
#include <vector>
#include "model/entities.h"

namespace tabbit {

// Fully materialized registration data for one tournament. Read-only input
// to scheduling; lookups index the vectors built at construction.
class Roster {
public:
    Roster() = default;
    Roster(std::vector<Institution> institutions,
           std::vector<Team> teams,
           std::vector<Debater> debaters = {},
           std::vector<Adjudicator> adjudicators = {},
           std::vector<Tag> tags = {});

    const std::vector<Institution>& institutions() const { return institutions_; }
    const std::vector<Team>& teams() const { return teams_; }
    const std::vector<Debater>& debaters() const { return debaters_; }
    const std::vector<Adjudicator>& adjudicators() const { return adjudicators_; }
    const std::vector<Tag>& tags() const { return tags_; }

    const Team* find_team(Id id) const;
    const Debater* find_debater(Id id) const;
    const Adjudicator* find_adjudicator(Id id) const;
    const Tag* find_tag(Id id) const;
    bool has_institution(Id id) const;

    std::optional<Id> institution_of(Id team_id) const;

    // Throws DataIntegrityError when a team is not in the roster
    const Team& team(Id id) const;

private:
    std::vector<Institution> institutions_;
    std::vector<Team> teams_;
    std::vector<Debater> debaters_;
    std::vector<Adjudicator> adjudicators_;
    std::vector<Tag> tags_;

    std::map<Id, size_t> team_index_;
    std::map<Id, size_t> debater_index_;
    std::map<Id, size_t> adjudicator_index_;
    std::map<Id, size_t> institution_index_;
    std::map<Id, size_t> tag_index_;
};

}  // namespace tabbit

#endif  // TABBIT_ROSTER_H
