#pragma once
#ifndef TABBIT_DRAW_SERVICE_H
#define TABBIT_DRAW_SERVICE_H

#include <future>
#include <optional>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "config/config.h"
#include "model/entities.h"
#include "repository/repository.h"
#include "service/round_locks.h"

namespace tabbit {

struct RoundDraw {
    Id tournament_id = 0;
    Round round;
    std::vector<Pairing> pairings;  // as committed, panels included
    std::vector<Motion> motions;
    std::vector<Standing> standings;  // the standings the draw was made from
    int swaps = 0;
};

// Drives one round through draw generation and the rest of its lifecycle
// against a Repository. Draws of the same round are serialized; draws of
// different tournaments can run concurrently on the worker pool.
class DrawService {
public:
    DrawService(Repository& repository, const Config& config);
    ~DrawService();

    DrawService(const DrawService&) = delete;
    DrawService& operator=(const DrawService&) = delete;

    // Pending -> Drawn. Requires every earlier round to be Completed.
    // Throws RoundStateError, DataIntegrityError, InfeasibleError.
    RoundDraw draw_round(Id tournament_id, int sequence);
    std::future<RoundDraw> draw_round_async(Id tournament_id, int sequence);

    // Drawn -> InProgress
    void start_round(Id tournament_id, int sequence);
    // InProgress -> Completed; every contested room needs a ballot
    void complete_round(Id tournament_id, int sequence);

    std::vector<Standing> standings(Id tournament_id) const;
    std::vector<SpeakerStanding> speaker_tab(Id tournament_id,
                                             std::optional<Id> tag_id = std::nullopt) const;
    std::optional<int> next_pending_round(Id tournament_id) const;

    const Config& config() const { return config_; }

private:
    Repository& repository_;
    Config config_;
    RoundLocks locks_;
    boost::asio::thread_pool pool_;

    Round find_round(const std::vector<RoundRecord>& rounds, int sequence) const;
};

}  // namespace tabbit

#endif  // TABBIT_DRAW_SERVICE_H
