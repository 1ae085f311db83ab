#include "standings/standings.h"
#include "core/errors.h"
#include "model/validation.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <string>

namespace tabbit {

namespace {

struct Tally {
    int points = 0;
    double speaker_score = 0.0;
    int rounds_contested = 0;
};

std::string id_str(Id id) { return std::to_string(id); }

}  // namespace

uint64_t tie_break_key(Id team_id, uint64_t seed) {
    // splitmix64 finalizer
    uint64_t z = seed + 0x9e3779b97f4a7c15ULL * (static_cast<uint64_t>(team_id) + 1);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

std::vector<Standing> compute_standings(const Roster& roster,
                                        const std::vector<RoundRecord>& rounds,
                                        std::optional<uint64_t> tie_break_seed) {
    std::map<Id, Tally> tallies;
    for (const auto& team : roster.teams()) {
        tallies[team.id];
    }

    for (const auto& record : rounds) {
        if (record.round.status != RoundStatus::Completed) continue;
        validate_completed_round(roster, record);

        for (const auto& pairing : record.pairings) {
            if (pairing.bye) continue;
            for (Id team_id : pairing.team_ids) {
                tallies[team_id].rounds_contested++;
            }
        }
        for (const Ballot* ballot : counted_ballots(record)) {
            for (const auto& result : ballot->results) {
                auto& tally = tallies[result.team_id];
                tally.points += result.points;
                tally.speaker_score += result.effective_speaker_score();
            }
        }
    }

    std::vector<Standing> standings;
    standings.reserve(tallies.size());
    for (const auto& [team_id, tally] : tallies) {
        standings.push_back({team_id, 0, tally.points, tally.speaker_score, tally.rounds_contested});
    }

    std::sort(standings.begin(), standings.end(), [&](const Standing& a, const Standing& b) {
        if (a.points != b.points) return a.points > b.points;
        if (a.speaker_score != b.speaker_score) return a.speaker_score > b.speaker_score;
        if (tie_break_seed) {
            uint64_t ka = tie_break_key(a.team_id, *tie_break_seed);
            uint64_t kb = tie_break_key(b.team_id, *tie_break_seed);
            if (ka != kb) return ka < kb;
        }
        return a.team_id < b.team_id;
    });

    for (size_t i = 0; i < standings.size(); ++i) {
        standings[i].rank = static_cast<int>(i + 1);
    }

    spdlog::debug("Computed standings for {} teams over {} rounds", standings.size(), rounds.size());
    return standings;
}

std::vector<SpeakerStanding> compute_speaker_tab(const Roster& roster,
                                                 const std::vector<RoundRecord>& rounds,
                                                 std::optional<Id> tag_id) {
    const Tag* tag = nullptr;
    if (tag_id) {
        tag = roster.find_tag(*tag_id);
        if (!tag) throw DataIntegrityError("Tag " + id_str(*tag_id) + " is not in the roster");
    }

    std::map<Id, SpeakerStanding> totals;
    for (const auto& debater : roster.debaters()) {
        totals[debater.id] = SpeakerStanding{debater.id, debater.team_id, 0, 0.0, 0};
    }

    for (const auto& record : rounds) {
        if (record.round.status != RoundStatus::Completed) continue;
        validate_completed_round(roster, record);

        for (const Ballot* ballot : counted_ballots(record)) {
            for (const auto& result : ballot->results) {
                for (const auto& speech : result.speakers) {
                    auto it = totals.find(speech.debater_id);
                    if (it == totals.end()) {
                        throw DataIntegrityError("Debater " + id_str(speech.debater_id) +
                                                 " is not in the roster");
                    }
                    it->second.total += speech.score;
                    it->second.speeches++;
                }
            }
        }
    }

    std::vector<SpeakerStanding> tab;
    tab.reserve(totals.size());
    for (const auto& [id, entry] : totals) {
        if (tag && std::find(tag->debater_ids.begin(), tag->debater_ids.end(), id) == tag->debater_ids.end()) {
            continue;
        }
        tab.push_back(entry);
    }
    std::sort(tab.begin(), tab.end(), [](const SpeakerStanding& a, const SpeakerStanding& b) {
        if (a.total != b.total) return a.total > b.total;
        return a.debater_id < b.debater_id;
    });
    for (size_t i = 0; i < tab.size(); ++i) {
        tab[i].rank = static_cast<int>(i + 1);
    }
    return tab;
}

}  // namespace tabbit
