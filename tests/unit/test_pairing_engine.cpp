#include <gtest/gtest.h>
#include "core/errors.h"
#include "draw/pairing_engine.h"
#include "history/history.h"
#include "standings/standings.h"
#include "../fixtures.h"
#include <algorithm>
#include <map>
#include <random>

using namespace tabbit;

namespace {

std::vector<std::vector<Id>> rooms_of(const Draw& draw) {
    std::vector<std::vector<Id>> rooms;
    for (const auto& p : draw.pairings) rooms.push_back(p.team_ids);
    return rooms;
}

using Rooms = std::vector<std::vector<Id>>;

}  // namespace

// ========== Power-pairing ==========

TEST(PairingEngineTest, test_first_round_pairs_adjacent_ranks) {
    Roster roster({}, fixtures::make_teams(8));
    Config cfg;
    auto standings = compute_standings(roster, {});
    auto draw = generate_draw(standings, History{}, roster, cfg);

    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 2}, {3, 4}, {5, 6}, {7, 8}}));
    EXPECT_EQ(draw.swaps, 0);
    for (size_t i = 0; i < draw.pairings.size(); ++i) {
        EXPECT_EQ(draw.pairings[i].room, static_cast<int>(i + 1));
        EXPECT_FALSE(draw.pairings[i].bye);
    }
}

TEST(PairingEngineTest, test_four_sided_rooms) {
    Roster roster({}, fixtures::make_teams(8));
    Config cfg;
    cfg.sides_per_room = 4;
    auto draw = generate_draw(fixtures::ranked(fixtures::iota_ids(8)), History{}, roster, cfg);
    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 2, 3, 4}, {5, 6, 7, 8}}));
}

TEST(PairingEngineTest, test_standings_order_not_input_order) {
    Roster roster({}, fixtures::make_teams(4));
    auto standings = fixtures::ranked({4, 3, 2, 1});
    std::reverse(standings.begin(), standings.end());
    auto draw = generate_draw(standings, History{}, roster, Config{});
    EXPECT_EQ(rooms_of(draw), (Rooms{{4, 3}, {2, 1}}));
}

// ========== Repeat avoidance ==========

TEST(PairingEngineTest, test_second_round_repeat_resolved_by_adjacent_swap) {
    Roster roster({}, fixtures::make_teams(8));
    auto round1 = fixtures::make_round(1, 1, RoundStatus::Completed, {{1, 2}, {3, 4}, {5, 6}, {7, 8}});
    auto history = compute_history(roster, {round1});

    auto draw = generate_draw(fixtures::ranked(fixtures::iota_ids(8)), history, roster, Config{});

    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 3}, {2, 4}, {5, 7}, {6, 8}}));
    EXPECT_EQ(draw.swaps, 2);
    for (const auto& p : draw.pairings) {
        EXPECT_FALSE(history.have_met(p.team_ids[0], p.team_ids[1]));
    }
}

TEST(PairingEngineTest, test_bottom_room_swaps_with_room_above) {
    Roster roster({}, fixtures::make_teams(4));
    History history;
    history.met_pairs.insert(unordered_pair(3, 4));

    auto draw = generate_draw(fixtures::ranked(fixtures::iota_ids(4)), history, roster, Config{});
    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 4}, {2, 3}}));
}

TEST(PairingEngineTest, test_unresolvable_repeat_is_infeasible) {
    Roster roster({}, fixtures::make_teams(2));
    History history;
    history.met_pairs.insert(unordered_pair(1, 2));

    try {
        generate_draw(fixtures::ranked({1, 2}), history, roster, Config{});
        FAIL() << "expected InfeasibleError";
    } catch (const InfeasibleError& e) {
        EXPECT_EQ(e.constraint(), Constraint::RepeatPairing);
        EXPECT_EQ(e.room(), 1);
        EXPECT_EQ(e.rank(), 2);
    }
}

TEST(PairingEngineTest, test_swap_window_bounds_the_search) {
    Roster roster({}, fixtures::make_teams(4));
    History history;
    history.met_pairs.insert(unordered_pair(1, 2));

    Config cfg;
    cfg.max_swap_distance = 0;
    EXPECT_THROW(generate_draw(fixtures::ranked(fixtures::iota_ids(4)), history, roster, cfg),
                 InfeasibleError);

    cfg.max_swap_distance = 4;
    cfg.max_swap_attempts = 0;
    EXPECT_THROW(generate_draw(fixtures::ranked(fixtures::iota_ids(4)), history, roster, cfg),
                 InfeasibleError);
}

// ========== Institution clash ==========

TEST(PairingEngineTest, test_institution_clash_avoided_when_configured) {
    Roster roster(fixtures::make_institutions(1),
                  fixtures::make_teams(4, {101, 101, std::nullopt, std::nullopt}));
    Config cfg;
    auto standings = fixtures::ranked(fixtures::iota_ids(4));

    auto avoided = generate_draw(standings, History{}, roster, cfg);
    EXPECT_EQ(rooms_of(avoided), (Rooms{{1, 3}, {2, 4}}));

    cfg.avoid_institution_clash = false;
    auto allowed = generate_draw(standings, History{}, roster, cfg);
    EXPECT_EQ(rooms_of(allowed), (Rooms{{1, 2}, {3, 4}}));
}

TEST(PairingEngineTest, test_same_institution_everywhere_is_infeasible) {
    Roster roster(fixtures::make_institutions(1), fixtures::make_teams(4, {101, 101, 101, 101}));
    try {
        generate_draw(fixtures::ranked(fixtures::iota_ids(4)), History{}, roster, Config{});
        FAIL() << "expected InfeasibleError";
    } catch (const InfeasibleError& e) {
        EXPECT_EQ(e.constraint(), Constraint::InstitutionClash);
        EXPECT_EQ(e.room(), 1);
    }
}

// ========== Byes ==========

TEST(PairingEngineTest, test_nine_teams_lowest_rank_bye) {
    Roster roster({}, fixtures::make_teams(9));
    auto draw = generate_draw(fixtures::ranked(fixtures::iota_ids(9)), History{}, roster, Config{});

    ASSERT_EQ(draw.pairings.size(), 5u);
    EXPECT_EQ(draw.contested_rooms(), 4u);
    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 2}, {3, 4}, {5, 6}, {7, 8}, {9}}));
    EXPECT_TRUE(draw.pairings.back().bye);
    EXPECT_EQ(draw.pairings.back().room, 5);
}

TEST(PairingEngineTest, test_bye_skips_team_that_already_had_one) {
    Roster roster({}, fixtures::make_teams(5));
    History history;
    history.bye_teams.insert(5);

    auto draw = generate_draw(fixtures::ranked(fixtures::iota_ids(5)), history, roster, Config{});
    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 2}, {3, 5}, {4}}));
}

TEST(PairingEngineTest, test_everyone_had_a_bye_falls_back_to_lowest) {
    Roster roster({}, fixtures::make_teams(3));
    History history;
    history.bye_teams = {1, 2, 3};
    auto draw = generate_draw(fixtures::ranked(fixtures::iota_ids(3)), history, roster, Config{});
    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 2}, {3}}));
}

TEST(PairingEngineTest, test_no_bye_policy_rejects_odd_count) {
    Roster roster({}, fixtures::make_teams(9));
    Config cfg;
    cfg.bye_policy = ByePolicy::NoBye;
    try {
        generate_draw(fixtures::ranked(fixtures::iota_ids(9)), History{}, roster, cfg);
        FAIL() << "expected InfeasibleError";
    } catch (const InfeasibleError& e) {
        EXPECT_EQ(e.constraint(), Constraint::TeamCount);
    }
}

TEST(PairingEngineTest, test_empty_standings_empty_draw) {
    Roster roster;
    auto draw = generate_draw({}, History{}, roster, Config{});
    EXPECT_TRUE(draw.pairings.empty());
}

// ========== Folded seeding ==========

TEST(PairingEngineTest, test_folded_pairs_within_brackets) {
    Roster roster({}, fixtures::make_teams(8));
    auto standings = fixtures::ranked(fixtures::iota_ids(8));
    for (auto& s : standings) s.points = s.team_id <= 4 ? 1 : 0;

    Config cfg;
    cfg.pairing_method = PairingMethod::Folded;
    auto draw = generate_draw(standings, History{}, roster, cfg);
    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 3}, {2, 4}, {5, 7}, {6, 8}}));
}

TEST(PairingEngineTest, test_folded_pulls_up_to_fill_bracket) {
    Roster roster({}, fixtures::make_teams(6));
    auto standings = fixtures::ranked(fixtures::iota_ids(6));
    std::map<Id, int> points = {{1, 2}, {2, 1}, {3, 1}, {4, 1}, {5, 0}, {6, 0}};
    for (auto& s : standings) s.points = points[s.team_id];

    Config cfg;
    cfg.pairing_method = PairingMethod::Folded;
    auto draw = generate_draw(standings, History{}, roster, cfg);
    EXPECT_EQ(rooms_of(draw), (Rooms{{1, 2}, {3, 4}, {5, 6}}));
}

// ========== Input validation ==========

TEST(PairingEngineTest, test_invalid_config_rejected_before_drawing) {
    Roster roster({}, fixtures::make_teams(4));
    Config cfg;
    cfg.sides_per_room = 0;
    EXPECT_THROW(generate_draw(fixtures::ranked(fixtures::iota_ids(4)), History{}, roster, cfg),
                 ConfigurationError);
}

TEST(PairingEngineTest, test_duplicate_team_in_standings) {
    Roster roster({}, fixtures::make_teams(4));
    EXPECT_THROW(generate_draw(fixtures::ranked({1, 2, 2, 3}), History{}, roster, Config{}),
                 DataIntegrityError);
}

TEST(PairingEngineTest, test_unknown_team_in_standings) {
    Roster roster({}, fixtures::make_teams(2));
    EXPECT_THROW(generate_draw(fixtures::ranked({1, 9}), History{}, roster, Config{}),
                 DataIntegrityError);
}

// ========== Properties ==========

TEST(PairingEngineTest, test_draw_is_deterministic) {
    Roster roster(fixtures::make_institutions(2),
                  fixtures::make_teams(10, {101, 102, 101, 102, 101, 102, std::nullopt, 101, 102, 101}));
    History history;
    history.met_pairs = {unordered_pair(1, 2), unordered_pair(3, 4), unordered_pair(5, 7)};
    auto standings = fixtures::ranked(fixtures::iota_ids(10));

    auto first = generate_draw(standings, history, roster, Config{});
    for (int i = 0; i < 5; ++i) {
        auto again = generate_draw(standings, history, roster, Config{});
        EXPECT_EQ(rooms_of(again), rooms_of(first));
        EXPECT_EQ(again.swaps, first.swaps);
    }
}

TEST(PairingEngineTest, test_random_histories_never_yield_illegal_rooms) {
    std::mt19937 rng(20261019);
    int feasible = 0;
    for (int trial = 0; trial < 50; ++trial) {
        const int team_count = 6 + trial % 7;
        std::vector<std::optional<Id>> institutions;
        for (int i = 0; i < team_count; ++i) {
            int pick = static_cast<int>(rng() % 4);
            institutions.push_back(pick == 0 ? std::nullopt : std::optional<Id>(100 + pick));
        }
        Roster roster(fixtures::make_institutions(3), fixtures::make_teams(team_count, institutions));

        History history;
        for (Id a = 1; a <= team_count; ++a) {
            for (Id b = a + 1; b <= team_count; ++b) {
                if (rng() % 5 == 0) history.met_pairs.insert(unordered_pair(a, b));
            }
        }

        Config cfg;
        cfg.sides_per_room = trial % 3 == 0 ? 4 : 2;
        auto standings = fixtures::ranked(fixtures::iota_ids(team_count));

        Draw draw;
        try {
            draw = generate_draw(standings, history, roster, cfg);
        } catch (const InfeasibleError&) {
            continue;
        }
        ++feasible;

        std::map<Id, int> appearances;
        PairingEngine engine(history, roster, cfg);
        for (const auto& p : draw.pairings) {
            for (Id t : p.team_ids) appearances[t]++;
            if (p.bye) {
                EXPECT_EQ(p.team_ids.size(), 1u);
                continue;
            }
            EXPECT_EQ(p.team_ids.size(), static_cast<size_t>(cfg.sides_per_room));
            EXPECT_FALSE(engine.find_violation(p.team_ids).has_value())
                << "illegal room " << p.room << " in trial " << trial;
        }
        EXPECT_EQ(appearances.size(), static_cast<size_t>(team_count));
        for (const auto& [team, count] : appearances) {
            EXPECT_EQ(count, 1) << "team " << team << " in trial " << trial;
        }
    }
    EXPECT_GT(feasible, 0);
}
