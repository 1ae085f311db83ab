#include "service/draw_service.h"
#include "allocation/judge_allocator.h"
#include "core/errors.h"
#include "draw/pairing_engine.h"
#include "history/history.h"
#include "model/validation.h"
#include "standings/standings.h"
#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <memory>
#include <mutex>

namespace tabbit {

namespace {

const Config& validated(const Config& config) {
    config.validate();
    return config;
}

std::string round_label(int sequence) {
    return "round " + std::to_string(sequence);
}

}  // namespace

DrawService::DrawService(Repository& repository, const Config& config)
    : repository_(repository),
      config_(validated(config)),
      pool_(config_.worker_threads) {}

DrawService::~DrawService() {
    pool_.join();
}

Round DrawService::find_round(const std::vector<RoundRecord>& rounds, int sequence) const {
    for (const auto& r : rounds) {
        if (r.round.sequence == sequence) return r.round;
    }
    throw RoundStateError("No " + round_label(sequence) + " in this tournament");
}

RoundDraw DrawService::draw_round(Id tournament_id, int sequence) {
    Round target = find_round(repository_.rounds(tournament_id), sequence);
    auto round_mutex = locks_.get(tournament_id, target.id);
    std::lock_guard guard(*round_mutex);

    // Snapshot taken under the round lock
    const auto rounds = repository_.rounds(tournament_id);
    target = find_round(rounds, sequence);
    if (target.status != RoundStatus::Pending) {
        throw RoundStateError("Cannot draw " + round_label(sequence) + ": it is already " +
                              to_string(target.status));
    }

    std::vector<RoundRecord> prior;
    int expected = 1;
    for (const auto& r : rounds) {
        if (r.round.sequence != expected) {
            throw DataIntegrityError("Round sequence has a gap: expected " + round_label(expected) +
                                     ", found " + round_label(r.round.sequence));
        }
        ++expected;
        if (r.round.sequence == sequence) break;
        if (r.round.status != RoundStatus::Completed) {
            throw RoundStateError("Cannot draw " + round_label(sequence) + ": " +
                                  round_label(r.round.sequence) + " is " + to_string(r.round.status));
        }
        for (const auto& p : r.pairings) {
            size_t want = p.bye ? 1 : static_cast<size_t>(config_.sides_per_room);
            if (p.team_ids.size() != want) {
                throw DataIntegrityError("Pairing " + std::to_string(p.id) + " in " +
                                         round_label(r.round.sequence) + " has " +
                                         std::to_string(p.team_ids.size()) + " teams, expected " +
                                         std::to_string(want));
            }
        }
        prior.push_back(r);
    }

    const Roster roster = repository_.roster(tournament_id);
    auto standings = compute_standings(roster, prior, config_.tie_break_seed);
    const History history = compute_history(roster, prior);
    Draw draw = generate_draw(standings, history, roster, config_);
    auto pairings = allocate_panels(draw.pairings, roster.adjudicators(), history, roster, config_);

    if (!repository_.commit_draw(tournament_id, target.id, pairings)) {
        throw RoundStateError("Cannot commit " + round_label(sequence) + ": it is no longer pending");
    }

    RoundDraw result;
    result.tournament_id = tournament_id;
    result.standings = std::move(standings);
    result.swaps = draw.swaps;
    for (const auto& r : repository_.rounds(tournament_id)) {
        if (r.round.id == target.id) {
            result.round = r.round;
            result.pairings = r.pairings;
            result.motions = r.motions;
        }
    }

    spdlog::info("Tournament {} {} drawn: {} pairings", tournament_id, round_label(sequence),
                 result.pairings.size());
    return result;
}

std::future<RoundDraw> DrawService::draw_round_async(Id tournament_id, int sequence) {
    auto task = std::make_shared<std::packaged_task<RoundDraw()>>(
        [this, tournament_id, sequence] { return draw_round(tournament_id, sequence); });
    auto future = task->get_future();
    boost::asio::post(pool_, [task] { (*task)(); });
    return future;
}

void DrawService::start_round(Id tournament_id, int sequence) {
    Round target = find_round(repository_.rounds(tournament_id), sequence);
    if (!repository_.transition_round(tournament_id, target.id, RoundStatus::Drawn, RoundStatus::InProgress)) {
        throw RoundStateError("Cannot start " + round_label(sequence) + ": it is not drawn");
    }
    spdlog::info("Tournament {} {} started", tournament_id, round_label(sequence));
}

void DrawService::complete_round(Id tournament_id, int sequence) {
    const auto rounds = repository_.rounds(tournament_id);
    const RoundRecord* record = nullptr;
    for (const auto& r : rounds) {
        if (r.round.sequence == sequence) record = &r;
    }
    if (!record) {
        throw RoundStateError("No " + round_label(sequence) + " in this tournament");
    }
    if (record->round.status != RoundStatus::InProgress) {
        throw RoundStateError("Cannot complete " + round_label(sequence) + ": it is " +
                              to_string(record->round.status));
    }

    for (const auto& p : record->pairings) {
        if (p.bye) continue;
        bool has_ballot = std::any_of(record->ballots.begin(), record->ballots.end(),
                                      [&](const Ballot& b) { return b.pairing_id == p.id; });
        if (!has_ballot) {
            throw RoundStateError("Cannot complete " + round_label(sequence) + ": room " +
                                  std::to_string(p.room) + " has no ballot");
        }
    }
    validate_completed_round(repository_.roster(tournament_id), *record);

    if (!repository_.transition_round(tournament_id, record->round.id, RoundStatus::InProgress,
                                      RoundStatus::Completed)) {
        throw RoundStateError("Cannot complete " + round_label(sequence) + ": status changed concurrently");
    }
    spdlog::info("Tournament {} {} completed", tournament_id, round_label(sequence));
}

std::vector<Standing> DrawService::standings(Id tournament_id) const {
    return compute_standings(repository_.roster(tournament_id), repository_.rounds(tournament_id),
                             config_.tie_break_seed);
}

std::vector<SpeakerStanding> DrawService::speaker_tab(Id tournament_id, std::optional<Id> tag_id) const {
    return compute_speaker_tab(repository_.roster(tournament_id), repository_.rounds(tournament_id), tag_id);
}

std::optional<int> DrawService::next_pending_round(Id tournament_id) const {
    for (const auto& r : repository_.rounds(tournament_id)) {
        if (r.round.status == RoundStatus::Pending) return r.round.sequence;
    }
    return std::nullopt;
}

}  // namespace tabbit
