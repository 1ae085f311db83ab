#include "model/validation.h"
#include "core/errors.h"
#include <algorithm>
#include <set>
#include <string>

namespace tabbit {

namespace {

std::string id_str(Id id) { return std::to_string(id); }

}  // namespace

void validate_completed_round(const Roster& roster, const RoundRecord& record) {
    const std::string where = "round " + std::to_string(record.round.sequence);

    std::set<Id> seen_teams;
    std::set<Id> seen_adjudicators;
    for (const auto& pairing : record.pairings) {
        for (Id team_id : pairing.team_ids) {
            if (!roster.find_team(team_id)) {
                throw DataIntegrityError("Pairing " + id_str(pairing.id) + " in " + where +
                                         " references unknown team " + id_str(team_id));
            }
            if (!seen_teams.insert(team_id).second) {
                throw DataIntegrityError("Team " + id_str(team_id) +
                                         " appears in more than one pairing in " + where);
            }
        }
        for (Id adj_id : pairing.panel.members()) {
            if (!roster.find_adjudicator(adj_id)) {
                throw DataIntegrityError("Pairing " + id_str(pairing.id) + " in " + where +
                                         " references unknown adjudicator " + id_str(adj_id));
            }
            if (!seen_adjudicators.insert(adj_id).second) {
                throw DataIntegrityError("Adjudicator " + id_str(adj_id) +
                                         " sits on more than one panel in " + where);
            }
        }
    }

    for (const auto& ballot : record.ballots) {
        const Pairing* pairing = record.find_pairing(ballot.pairing_id);
        if (!pairing) {
            throw DataIntegrityError("Ballot " + id_str(ballot.id) +
                                     " references pairing " + id_str(ballot.pairing_id) +
                                     " which is not in " + where);
        }
        if (pairing->bye) {
            throw DataIntegrityError("Ballot " + id_str(ballot.id) + " targets bye pairing " +
                                     id_str(pairing->id) + " in " + where);
        }

        std::set<Id> ballot_teams;
        for (const auto& result : ballot.results) {
            const Team* team = roster.find_team(result.team_id);
            if (!team) {
                throw DataIntegrityError("Ballot " + id_str(ballot.id) +
                                         " references unknown team " + id_str(result.team_id));
            }
            if (std::find(pairing->team_ids.begin(), pairing->team_ids.end(), result.team_id) ==
                pairing->team_ids.end()) {
                throw DataIntegrityError("Ballot " + id_str(ballot.id) + " scores team " +
                                         id_str(result.team_id) + " which is not in pairing " +
                                         id_str(pairing->id));
            }
            if (!ballot_teams.insert(result.team_id).second) {
                throw DataIntegrityError("Ballot " + id_str(ballot.id) + " scores team " +
                                         id_str(result.team_id) + " twice");
            }
            for (const auto& speech : result.speakers) {
                if (std::find(team->debater_ids.begin(), team->debater_ids.end(),
                              speech.debater_id) == team->debater_ids.end()) {
                    throw DataIntegrityError("Ballot " + id_str(ballot.id) + " credits debater " +
                                             id_str(speech.debater_id) + " to team " +
                                             id_str(team->id) + " they do not belong to");
                }
            }
        }
    }
}

}  // namespace tabbit
