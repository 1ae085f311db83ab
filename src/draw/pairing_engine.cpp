#include "draw/pairing_engine.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <string>

namespace tabbit {

const Pairing* Draw::room_of(Id team_id) const {
    for (const auto& p : pairings) {
        if (std::find(p.team_ids.begin(), p.team_ids.end(), team_id) != p.team_ids.end()) {
            return &p;
        }
    }
    return nullptr;
}

size_t Draw::contested_rooms() const {
    return static_cast<size_t>(std::count_if(pairings.begin(), pairings.end(),
                                             [](const Pairing& p) { return !p.bye; }));
}

PairingEngine::PairingEngine(const History& history, const Roster& roster, const Config& config)
    : history_(history), roster_(roster), config_(config) {}

std::optional<Constraint> PairingEngine::clash(Id a, Id b) const {
    if (history_.have_met(a, b)) return Constraint::RepeatPairing;
    if (config_.avoid_institution_clash) {
        auto ia = roster_.institution_of(a);
        auto ib = roster_.institution_of(b);
        if (ia && ib && *ia == *ib) return Constraint::InstitutionClash;
    }
    return std::nullopt;
}

std::optional<PairingEngine::Violation> PairingEngine::find_violation(const std::vector<Id>& teams) const {
    for (size_t i = 0; i < teams.size(); ++i) {
        for (size_t j = i + 1; j < teams.size(); ++j) {
            if (auto c = clash(teams[i], teams[j])) {
                return Violation{i, j, *c};
            }
        }
    }
    return std::nullopt;
}

int PairingEngine::count_violations(const std::vector<size_t>& room, const std::vector<Id>& order) const {
    int count = 0;
    for (size_t i = 0; i < room.size(); ++i) {
        for (size_t j = i + 1; j < room.size(); ++j) {
            if (clash(order[room[i]], order[room[j]])) ++count;
        }
    }
    return count;
}

std::vector<size_t> PairingEngine::pick_byes(const std::vector<Id>& order) const {
    const size_t sides = static_cast<size_t>(config_.sides_per_room);
    const size_t remainder = order.size() % sides;
    if (remainder == 0) return {};

    if (config_.bye_policy == ByePolicy::NoBye) {
        throw InfeasibleError(Constraint::TeamCount, 0, 0,
                              std::to_string(order.size()) + " teams cannot be divided into rooms of " +
                              std::to_string(sides) + " and the bye policy is no_bye");
    }

    // Lowest-ranked teams that have not had a bye yet, then anyone from the bottom
    std::vector<size_t> picked;
    for (size_t i = order.size(); i-- > 0 && picked.size() < remainder;) {
        if (!history_.had_bye(order[i])) picked.push_back(i);
    }
    for (size_t i = order.size(); i-- > 0 && picked.size() < remainder;) {
        if (std::find(picked.begin(), picked.end(), i) == picked.end()) picked.push_back(i);
    }
    std::sort(picked.begin(), picked.end());
    return picked;
}

std::vector<std::vector<size_t>> PairingEngine::seed_rooms(const std::vector<Id>& order,
                                                           const std::vector<int>& points) const {
    const size_t sides = static_cast<size_t>(config_.sides_per_room);
    std::vector<std::vector<size_t>> rooms;

    if (config_.pairing_method == PairingMethod::Adjacent) {
        for (size_t i = 0; i < order.size(); i += sides) {
            std::vector<size_t> room;
            for (size_t k = 0; k < sides; ++k) room.push_back(i + k);
            rooms.push_back(std::move(room));
        }
        return rooms;
    }

    // Folded: equal-points brackets, pulling up teams from the bracket below
    // until each bracket fills a whole number of rooms
    std::vector<std::vector<size_t>> brackets;
    for (size_t i = 0; i < order.size(); ++i) {
        bool new_bracket = brackets.empty() ||
                           (points[i] != points[brackets.back().front()] &&
                            brackets.back().size() % sides == 0);
        if (new_bracket) brackets.emplace_back();
        brackets.back().push_back(i);
    }

    for (const auto& bracket : brackets) {
        const size_t room_count = bracket.size() / sides;
        for (size_t t = 0; t < room_count; ++t) {
            std::vector<size_t> room;
            for (size_t k = 0; k < sides; ++k) room.push_back(bracket[t + k * room_count]);
            rooms.push_back(std::move(room));
        }
    }
    return rooms;
}

bool PairingEngine::try_swap(std::vector<std::vector<size_t>>& rooms, size_t current,
                             const std::vector<Id>& order, size_t offender) const {
    std::vector<size_t> room_index(order.size());
    for (size_t r = 0; r < rooms.size(); ++r) {
        for (size_t pos : rooms[r]) room_index[pos] = r;
    }

    struct Candidate {
        size_t position;
        size_t distance;
    };
    std::vector<Candidate> candidates;
    const size_t window = static_cast<size_t>(config_.max_swap_distance);
    for (size_t pos = 0; pos < order.size(); ++pos) {
        if (room_index[pos] == current) continue;
        size_t distance = pos > offender ? pos - offender : offender - pos;
        if (distance <= window) candidates.push_back({pos, distance});
    }
    // Nearest rank first; on equal distance prefer the lower-ranked team
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.position > b.position;
    });

    const int before = count_violations(rooms[current], order);
    for (const auto& c : candidates) {
        const size_t other = room_index[c.position];

        auto moved_here = rooms[current];
        std::replace(moved_here.begin(), moved_here.end(), offender, c.position);
        if (count_violations(moved_here, order) >= before) continue;

        auto moved_there = rooms[other];
        std::replace(moved_there.begin(), moved_there.end(), c.position, offender);
        // Rooms above this one are final and must stay legal
        if (other < current && count_violations(moved_there, order) > 0) continue;

        std::sort(moved_here.begin(), moved_here.end());
        std::sort(moved_there.begin(), moved_there.end());
        rooms[current] = std::move(moved_here);
        rooms[other] = std::move(moved_there);

        spdlog::debug("Swapped team {} (room {}) with team {} (room {})",
                      order[offender], current + 1, order[c.position], other + 1);
        return true;
    }
    return false;
}

Draw PairingEngine::generate(const std::vector<Standing>& standings) const {
    config_.validate();

    std::vector<Standing> ranked(standings);
    std::sort(ranked.begin(), ranked.end(), [](const Standing& a, const Standing& b) {
        if (a.rank != b.rank) return a.rank < b.rank;
        return a.team_id < b.team_id;
    });

    std::set<Id> seen;
    for (const auto& s : ranked) {
        if (!seen.insert(s.team_id).second) {
            throw DataIntegrityError("Team " + std::to_string(s.team_id) +
                                     " appears more than once in the standings");
        }
        roster_.team(s.team_id);
    }

    std::vector<Id> all_teams;
    for (const auto& s : ranked) all_teams.push_back(s.team_id);
    const auto byes = pick_byes(all_teams);

    std::vector<Id> order;
    std::vector<int> ranks;
    std::vector<int> points;
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (std::binary_search(byes.begin(), byes.end(), i)) continue;
        order.push_back(ranked[i].team_id);
        ranks.push_back(ranked[i].rank);
        points.push_back(ranked[i].points);
    }

    auto rooms = seed_rooms(order, points);

    Draw draw;
    for (size_t r = 0; r < rooms.size(); ++r) {
        int attempts = 0;
        while (true) {
            std::vector<Id> teams;
            for (size_t pos : rooms[r]) teams.push_back(order[pos]);
            auto violation = find_violation(teams);
            if (!violation) break;

            const size_t a = rooms[r][violation->first];
            const size_t b = rooms[r][violation->second];
            const size_t lower = std::max(a, b);
            const size_t higher = std::min(a, b);

            bool swapped = attempts < config_.max_swap_attempts &&
                           (try_swap(rooms, r, order, lower) || try_swap(rooms, r, order, higher));
            if (!swapped) {
                std::string reason = violation->constraint == Constraint::RepeatPairing
                                         ? " have already met"
                                         : " share an institution";
                throw InfeasibleError(violation->constraint, static_cast<int>(r + 1), ranks[lower],
                                      "teams " + std::to_string(order[higher]) + " and " +
                                          std::to_string(order[lower]) + reason +
                                          " and no swap within " +
                                          std::to_string(config_.max_swap_distance) +
                                          " ranks resolves it");
            }
            ++attempts;
            ++draw.swaps;
        }
    }

    for (size_t r = 0; r < rooms.size(); ++r) {
        Pairing p;
        p.room = static_cast<int>(r + 1);
        for (size_t pos : rooms[r]) p.team_ids.push_back(order[pos]);
        draw.pairings.push_back(std::move(p));
    }
    for (size_t pos : byes) {
        Pairing p;
        p.room = static_cast<int>(draw.pairings.size() + 1);
        p.team_ids.push_back(ranked[pos].team_id);
        p.bye = true;
        draw.pairings.push_back(std::move(p));
    }

    spdlog::info("Generated draw: {} rooms, {} byes, {} swaps ({} pairing)",
                 rooms.size(), byes.size(), draw.swaps, to_string(config_.pairing_method));
    return draw;
}

Draw generate_draw(const std::vector<Standing>& standings,
                   const History& history,
                   const Roster& roster,
                   const Config& config) {
    return PairingEngine(history, roster, config).generate(standings);
}

}  // namespace tabbit
