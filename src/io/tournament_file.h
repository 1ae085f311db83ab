#pragma once
#ifndef TABBIT_TOURNAMENT_FILE_H
#define TABBIT_TOURNAMENT_FILE_H

#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "model/roster.h"
#include "repository/in_memory_repository.h"
#include "service/draw_service.h"

namespace tabbit {

// Line-oriented tournament description:
//   TOURNAMENT <id> "<name>"
//   INSTITUTION <id> "<name>"
//   TEAM <id> "<name>" <institution-id|->
//   DEBATER <id> <team-id> "<name>"
//   ADJUDICATOR <id> "<name>" <institution-id|-> <experience> [independent]
//   CONFLICT <adjudicator-id> TEAM|INSTITUTION <id>
//   ROUND <id> <sequence> <pending|drawn|in_progress|completed> ["<name>"]
//   PAIRING <id> <round-id> <room> <team-id>... [| <chair> <panelist>...]
//   BALLOT <id> <pairing-id> <adjudicator-id|-> <version> <team>:<points>:<speaker>...
//   SPEAKS <ballot-id> <debater-id> <position> <score>
//   MOTION <id> <round-id> "<text>" ["<infoslide>"]
//   TAG <id> "<name>"
//   TAGGED <tag-id> DEBATER|ADJUDICATOR <id>
// A pairing with a single team is a bye. '#' starts a comment.

struct Statement {
    std::string keyword;
    std::vector<std::string> args;
    size_t line = 0;
};

class TournamentFileParser {
public:
    // nullopt for blank and comment-only lines. Throws DataIntegrityError
    // on an unterminated quote.
    std::optional<Statement> parse_line(const std::string& input, size_t line) const;

    // Throws DataIntegrityError naming the offending line
    TournamentData parse(std::istream& in) const;

private:
    void apply(const Statement& stmt, TournamentData& data, bool& has_tournament) const;
};

// Returns the id of the loaded tournament
Id load_tournament_file(const std::string& path, InMemoryRepository& repository);

std::string render_draw(const RoundDraw& draw, const Roster& roster);
std::string render_standings(const std::vector<Standing>& standings, const Roster& roster);
std::string render_speaker_tab(const std::vector<SpeakerStanding>& tab, const Roster& roster);

}  // namespace tabbit

#endif  // TABBIT_TOURNAMENT_FILE_H
