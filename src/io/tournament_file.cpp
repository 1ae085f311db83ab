#include "io/tournament_file.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tabbit {

namespace {

[[noreturn]] void fail(const Statement& stmt, const std::string& msg) {
    throw DataIntegrityError("line " + std::to_string(stmt.line) + " (" + stmt.keyword + "): " + msg);
}

void require_args(const Statement& stmt, size_t count) {
    if (stmt.args.size() < count) {
        fail(stmt, "expected at least " + std::to_string(count) + " arguments, got " +
                       std::to_string(stmt.args.size()));
    }
}

long long to_integer(const Statement& stmt, const std::string& text) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed == text.size()) return value;
    } catch (const std::exception&) {
        // reported below
    }
    fail(stmt, "expected an integer, got '" + text + "'");
}

double to_decimal(const Statement& stmt, const std::string& text) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed == text.size()) return value;
    } catch (const std::exception&) {
        // reported below
    }
    fail(stmt, "expected a number, got '" + text + "'");
}

std::optional<Id> to_optional_id(const Statement& stmt, const std::string& text) {
    if (text == "-") return std::nullopt;
    return to_integer(stmt, text);
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, sep)) parts.push_back(part);
    return parts;
}

template <typename T>
T* find_by_id(std::vector<T>& items, Id id) {
    auto it = std::find_if(items.begin(), items.end(), [id](const T& item) { return item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

Pairing parse_pairing(const Statement& stmt) {
    require_args(stmt, 4);
    Pairing p;
    p.id = to_integer(stmt, stmt.args[0]);
    p.round_id = to_integer(stmt, stmt.args[1]);
    p.room = static_cast<int>(to_integer(stmt, stmt.args[2]));

    size_t i = 3;
    for (; i < stmt.args.size() && stmt.args[i] != "|"; ++i) {
        p.team_ids.push_back(to_integer(stmt, stmt.args[i]));
    }
    if (p.team_ids.empty()) fail(stmt, "pairing has no teams");
    p.bye = p.team_ids.size() == 1;

    if (i < stmt.args.size()) {
        if (i + 1 >= stmt.args.size()) fail(stmt, "'|' must be followed by a chair");
        p.panel.chair = to_integer(stmt, stmt.args[i + 1]);
        for (size_t k = i + 2; k < stmt.args.size(); ++k) {
            p.panel.panelists.push_back(to_integer(stmt, stmt.args[k]));
        }
    }
    return p;
}

Ballot parse_ballot(const Statement& stmt) {
    require_args(stmt, 5);
    Ballot b;
    b.id = to_integer(stmt, stmt.args[0]);
    b.pairing_id = to_integer(stmt, stmt.args[1]);
    b.adjudicator_id = to_optional_id(stmt, stmt.args[2]);
    b.version = static_cast<int>(to_integer(stmt, stmt.args[3]));
    for (size_t i = 4; i < stmt.args.size(); ++i) {
        auto fields = split(stmt.args[i], ':');
        if (fields.size() != 3) fail(stmt, "expected <team>:<points>:<speaker>, got '" + stmt.args[i] + "'");
        TeamResult r;
        r.team_id = to_integer(stmt, fields[0]);
        r.points = static_cast<int>(to_integer(stmt, fields[1]));
        r.speaker_score = to_decimal(stmt, fields[2]);
        b.results.push_back(std::move(r));
    }
    return b;
}

}  // namespace

std::optional<Statement> TournamentFileParser::parse_line(const std::string& input, size_t line) const {
    Statement stmt;
    stmt.line = line;

    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    bool in_quotes = false;
    for (char c : input) {
        if (in_quotes) {
            if (c == '"') {
                in_quotes = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
            in_token = true;
        } else if (c == '#') {
            break;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                tokens.push_back(std::move(current));
                current.clear();
                in_token = false;
            }
        } else {
            current += c;
            in_token = true;
        }
    }
    if (in_quotes) {
        throw DataIntegrityError("line " + std::to_string(line) + ": unterminated quote");
    }
    if (in_token) tokens.push_back(std::move(current));
    if (tokens.empty()) return std::nullopt;

    stmt.keyword = tokens.front();
    std::transform(stmt.keyword.begin(), stmt.keyword.end(), stmt.keyword.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    stmt.args.assign(tokens.begin() + 1, tokens.end());
    return stmt;
}

void TournamentFileParser::apply(const Statement& stmt, TournamentData& data, bool& has_tournament) const {
    const auto& kw = stmt.keyword;

    if (kw == "TOURNAMENT") {
        require_args(stmt, 2);
        if (has_tournament) fail(stmt, "only one tournament per file");
        data.tournament = {to_integer(stmt, stmt.args[0]), stmt.args[1]};
        has_tournament = true;
    } else if (kw == "INSTITUTION") {
        require_args(stmt, 2);
        data.institutions.push_back({to_integer(stmt, stmt.args[0]), stmt.args[1]});
    } else if (kw == "TEAM") {
        require_args(stmt, 3);
        Team t;
        t.id = to_integer(stmt, stmt.args[0]);
        t.name = stmt.args[1];
        t.institution_id = to_optional_id(stmt, stmt.args[2]);
        data.teams.push_back(std::move(t));
    } else if (kw == "DEBATER") {
        require_args(stmt, 3);
        Debater d{to_integer(stmt, stmt.args[0]), to_integer(stmt, stmt.args[1]), stmt.args[2]};
        Team* team = find_by_id(data.teams, d.team_id);
        if (!team) fail(stmt, "unknown team " + std::to_string(d.team_id));
        team->debater_ids.push_back(d.id);
        data.debaters.push_back(std::move(d));
    } else if (kw == "ADJUDICATOR") {
        require_args(stmt, 4);
        Adjudicator a;
        a.id = to_integer(stmt, stmt.args[0]);
        a.name = stmt.args[1];
        a.institution_id = to_optional_id(stmt, stmt.args[2]);
        a.experience = static_cast<int>(to_integer(stmt, stmt.args[3]));
        if (stmt.args.size() > 4) {
            if (stmt.args[4] != "independent") fail(stmt, "unknown flag '" + stmt.args[4] + "'");
            a.independent = true;
        }
        data.adjudicators.push_back(std::move(a));
    } else if (kw == "CONFLICT") {
        require_args(stmt, 3);
        Adjudicator* adj = find_by_id(data.adjudicators, to_integer(stmt, stmt.args[0]));
        if (!adj) fail(stmt, "unknown adjudicator " + stmt.args[0]);
        Id target = to_integer(stmt, stmt.args[2]);
        if (stmt.args[1] == "TEAM") {
            adj->conflicted_teams.push_back(target);
        } else if (stmt.args[1] == "INSTITUTION") {
            adj->conflicted_institutions.push_back(target);
        } else {
            fail(stmt, "expected TEAM or INSTITUTION, got '" + stmt.args[1] + "'");
        }
    } else if (kw == "ROUND") {
        require_args(stmt, 3);
        RoundRecord r;
        r.round.id = to_integer(stmt, stmt.args[0]);
        r.round.sequence = static_cast<int>(to_integer(stmt, stmt.args[1]));
        auto status = round_status_from_string(stmt.args[2]);
        if (!status) fail(stmt, "unknown round status '" + stmt.args[2] + "'");
        r.round.status = *status;
        r.round.name = stmt.args.size() > 3 ? stmt.args[3] : "Round " + stmt.args[1];
        data.rounds.push_back(std::move(r));
    } else if (kw == "PAIRING") {
        Pairing p = parse_pairing(stmt);
        auto it = std::find_if(data.rounds.begin(), data.rounds.end(),
                               [&](const RoundRecord& r) { return r.round.id == p.round_id; });
        if (it == data.rounds.end()) fail(stmt, "unknown round " + std::to_string(p.round_id));
        it->pairings.push_back(std::move(p));
    } else if (kw == "BALLOT") {
        Ballot b = parse_ballot(stmt);
        for (auto& r : data.rounds) {
            if (r.find_pairing(b.pairing_id)) {
                r.ballots.push_back(std::move(b));
                return;
            }
        }
        fail(stmt, "unknown pairing " + std::to_string(b.pairing_id));
    } else if (kw == "SPEAKS") {
        require_args(stmt, 4);
        Id ballot_id = to_integer(stmt, stmt.args[0]);
        SpeakerScore s{to_integer(stmt, stmt.args[1]),
                       static_cast<int>(to_integer(stmt, stmt.args[2])),
                       to_decimal(stmt, stmt.args[3])};
        Debater* debater = find_by_id(data.debaters, s.debater_id);
        if (!debater) fail(stmt, "unknown debater " + std::to_string(s.debater_id));
        for (auto& r : data.rounds) {
            Ballot* ballot = find_by_id(r.ballots, ballot_id);
            if (!ballot) continue;
            for (auto& result : ballot->results) {
                if (result.team_id == debater->team_id) {
                    result.speakers.push_back(s);
                    return;
                }
            }
            fail(stmt, "ballot " + std::to_string(ballot_id) + " has no result for team " +
                           std::to_string(debater->team_id));
        }
        fail(stmt, "unknown ballot " + std::to_string(ballot_id));
    } else if (kw == "MOTION") {
        require_args(stmt, 3);
        Motion m;
        m.id = to_integer(stmt, stmt.args[0]);
        m.round_id = to_integer(stmt, stmt.args[1]);
        m.text = stmt.args[2];
        if (stmt.args.size() > 3) m.infoslide = stmt.args[3];
        RoundRecord* round = nullptr;
        for (auto& r : data.rounds) {
            if (r.round.id == m.round_id) round = &r;
        }
        if (!round) fail(stmt, "unknown round " + std::to_string(m.round_id));
        round->motions.push_back(std::move(m));
    } else if (kw == "TAG") {
        require_args(stmt, 2);
        Tag t;
        t.id = to_integer(stmt, stmt.args[0]);
        t.name = stmt.args[1];
        data.tags.push_back(std::move(t));
    } else if (kw == "TAGGED") {
        require_args(stmt, 3);
        Tag* tag = find_by_id(data.tags, to_integer(stmt, stmt.args[0]));
        if (!tag) fail(stmt, "unknown tag " + stmt.args[0]);
        Id target = to_integer(stmt, stmt.args[2]);
        if (stmt.args[1] == "DEBATER") {
            if (!find_by_id(data.debaters, target)) fail(stmt, "unknown debater " + stmt.args[2]);
            tag->debater_ids.push_back(target);
        } else if (stmt.args[1] == "ADJUDICATOR") {
            if (!find_by_id(data.adjudicators, target)) fail(stmt, "unknown adjudicator " + stmt.args[2]);
            tag->adjudicator_ids.push_back(target);
        } else {
            fail(stmt, "expected DEBATER or ADJUDICATOR, got '" + stmt.args[1] + "'");
        }
    } else {
        fail(stmt, "unknown statement");
    }
}

TournamentData TournamentFileParser::parse(std::istream& in) const {
    TournamentData data;
    bool has_tournament = false;
    std::string text;
    size_t line = 0;
    while (std::getline(in, text)) {
        ++line;
        auto stmt = parse_line(text, line);
        if (!stmt) continue;
        apply(*stmt, data, has_tournament);
    }
    if (!has_tournament) {
        throw DataIntegrityError("tournament file has no TOURNAMENT statement");
    }
    return data;
}

Id load_tournament_file(const std::string& path, InMemoryRepository& repository) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open tournament file: " + path);
    }
    TournamentFileParser parser;
    TournamentData data = parser.parse(file);
    Id id = data.tournament.id;
    repository.add_tournament(std::move(data));
    return id;
}

std::string render_draw(const RoundDraw& draw, const Roster& roster) {
    auto team_name = [&](Id id) {
        const Team* t = roster.find_team(id);
        return t ? t->name : "#" + std::to_string(id);
    };
    auto adj_name = [&](Id id) {
        const Adjudicator* a = roster.find_adjudicator(id);
        return a ? a->name : "#" + std::to_string(id);
    };

    std::ostringstream out;
    out << draw.round.name << " (" << to_string(draw.round.status) << ")\n";
    for (const auto& m : draw.motions) {
        out << "  Motion: " << m.text << "\n";
        if (m.infoslide) out << "    Info: " << *m.infoslide << "\n";
    }
    for (const auto& p : draw.pairings) {
        if (p.bye) {
            out << "  Bye: " << team_name(p.team_ids.front()) << "\n";
            continue;
        }
        out << "  Room " << p.room << ": ";
        for (size_t i = 0; i < p.team_ids.size(); ++i) {
            if (i > 0) out << " vs ";
            out << team_name(p.team_ids[i]);
        }
        if (p.panel.chair) {
            out << " | chair " << adj_name(*p.panel.chair);
            for (Id id : p.panel.panelists) out << ", " << adj_name(id);
        }
        out << "\n";
    }
    return out.str();
}

std::string render_standings(const std::vector<Standing>& standings, const Roster& roster) {
    std::ostringstream out;
    for (const auto& s : standings) {
        const Team* t = roster.find_team(s.team_id);
        out << s.rank << ". " << (t ? t->name : "#" + std::to_string(s.team_id))
            << "  points " << s.points << "  speaks " << s.speaker_score
            << "  rounds " << s.rounds_contested << "\n";
    }
    return out.str();
}

std::string render_speaker_tab(const std::vector<SpeakerStanding>& tab, const Roster& roster) {
    std::ostringstream out;
    for (const auto& s : tab) {
        const Debater* d = roster.find_debater(s.debater_id);
        const Team* t = roster.find_team(s.team_id);
        out << s.rank << ". " << (d ? d->name : "#" + std::to_string(s.debater_id))
            << " (" << (t ? t->name : "#" + std::to_string(s.team_id)) << ")"
            << "  total " << s.total << "  speeches " << s.speeches << "\n";
    }
    return out.str();
}

}  // namespace tabbit
