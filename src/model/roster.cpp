#include "model/roster.h"
#include "core/errors.h"
#include <utility>

namespace tabbit {

namespace {

template <typename T>
std::map<Id, size_t> build_index(const std::vector<T>& items, const char* kind) {
    std::map<Id, size_t> index;
    for (size_t i = 0; i < items.size(); ++i) {
        if (!index.emplace(items[i].id, i).second) {
            throw DataIntegrityError(std::string("Duplicate ") + kind + " id " +
                                     std::to_string(items[i].id));
        }
    }
    return index;
}

}  // namespace

Roster::Roster(std::vector<Institution> institutions,
               std::vector<Team> teams,
               std::vector<Debater> debaters,
               std::vector<Adjudicator> adjudicators,
               std::vector<Tag> tags)
    : institutions_(std::move(institutions)),
      teams_(std::move(teams)),
      debaters_(std::move(debaters)),
      adjudicators_(std::move(adjudicators)),
      tags_(std::move(tags)) {
    institution_index_ = build_index(institutions_, "institution");
    team_index_ = build_index(teams_, "team");
    debater_index_ = build_index(debaters_, "debater");
    adjudicator_index_ = build_index(adjudicators_, "adjudicator");
    tag_index_ = build_index(tags_, "tag");

    for (const auto& t : teams_) {
        if (t.institution_id && !has_institution(*t.institution_id)) {
            throw DataIntegrityError("Team " + std::to_string(t.id) +
                                     " references unknown institution " +
                                     std::to_string(*t.institution_id));
        }
    }
    for (const auto& a : adjudicators_) {
        if (a.institution_id && !has_institution(*a.institution_id)) {
            throw DataIntegrityError("Adjudicator " + std::to_string(a.id) +
                                     " references unknown institution " +
                                     std::to_string(*a.institution_id));
        }
    }
    for (const auto& tag : tags_) {
        for (Id id : tag.debater_ids) {
            if (!find_debater(id)) {
                throw DataIntegrityError("Tag " + std::to_string(tag.id) +
                                         " references unknown debater " + std::to_string(id));
            }
        }
        for (Id id : tag.adjudicator_ids) {
            if (!find_adjudicator(id)) {
                throw DataIntegrityError("Tag " + std::to_string(tag.id) +
                                         " references unknown adjudicator " + std::to_string(id));
            }
        }
    }
}

const Team* Roster::find_team(Id id) const {
    auto it = team_index_.find(id);
    return it == team_index_.end() ? nullptr : &teams_[it->second];
}

const Debater* Roster::find_debater(Id id) const {
    auto it = debater_index_.find(id);
    return it == debater_index_.end() ? nullptr : &debaters_[it->second];
}

const Adjudicator* Roster::find_adjudicator(Id id) const {
    auto it = adjudicator_index_.find(id);
    return it == adjudicator_index_.end() ? nullptr : &adjudicators_[it->second];
}

const Tag* Roster::find_tag(Id id) const {
    auto it = tag_index_.find(id);
    return it == tag_index_.end() ? nullptr : &tags_[it->second];
}

bool Roster::has_institution(Id id) const {
    return institution_index_.count(id) > 0;
}

std::optional<Id> Roster::institution_of(Id team_id) const {
    const Team* t = find_team(team_id);
    return t ? t->institution_id : std::nullopt;
}

const Team& Roster::team(Id id) const {
    const Team* t = find_team(id);
    if (!t) {
        throw DataIntegrityError("Team " + std::to_string(id) + " is not in the roster");
    }
    return *t;
}

}  // namespace tabbit
