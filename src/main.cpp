#include "config/config.h"
#include "core/errors.h"
#include "io/tournament_file.h"
#include "repository/in_memory_repository.h"
#include "service/draw_service.h"
#include <spdlog/spdlog.h>
#include <iostream>
#include <optional>
#include <string>

namespace {

void usage() {
    std::cerr << "usage: tabbit draw <tournament-file> [round-sequence]\n"
                 "       tabbit standings <tournament-file>\n"
                 "       tabbit speakers <tournament-file> [tag-id]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage();
        return 2;
    }
    const std::string command = argv[1];
    const std::string path = argv[2];

    try {
        auto& config = tabbit::get_config();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Starting Tabbit ({} pairing, {} sides, panels of {})",
                     tabbit::to_string(config.pairing_method), config.sides_per_room, config.panel_size);

        tabbit::InMemoryRepository repository;
        tabbit::Id tournament_id = tabbit::load_tournament_file(path, repository);
        tabbit::DrawService service(repository, config);

        if (command == "standings") {
            std::cout << tabbit::render_standings(service.standings(tournament_id),
                                                  repository.roster(tournament_id));
            return 0;
        }
        if (command == "speakers") {
            std::optional<tabbit::Id> tag_id;
            if (argc > 3) tag_id = std::stoll(argv[3]);
            std::cout << tabbit::render_speaker_tab(service.speaker_tab(tournament_id, tag_id),
                                                    repository.roster(tournament_id));
            return 0;
        }
        if (command != "draw") {
            usage();
            return 2;
        }

        std::optional<int> sequence;
        if (argc > 3) {
            sequence = std::stoi(argv[3]);
        } else {
            sequence = service.next_pending_round(tournament_id);
        }
        if (!sequence) {
            spdlog::warn("Tournament {} has no pending round", tournament_id);
            return 0;
        }

        auto result = service.draw_round(tournament_id, *sequence);
        std::cout << tabbit::render_draw(result, repository.roster(tournament_id));
        return 0;

    } catch (const tabbit::InfeasibleError& e) {
        spdlog::error("{}", e.what());
        return 3;
    } catch (const tabbit::ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 4;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
