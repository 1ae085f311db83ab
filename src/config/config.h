#pragma once
#ifndef TABBIT_CONFIG_H
#define TABBIT_CONFIG_H

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace tabbit {

enum class ByePolicy { LowestRankBye, NoBye };

// Adjacent: rooms take consecutive ranks (1-2, 3-4, ...).
// Folded: each equal-points bracket is folded (1 v k+1, 2 v k+2, ...).
enum class PairingMethod { Adjacent, Folded };

struct Config {
    static constexpr size_t kMaxWorkerThreads = 256;

    int sides_per_room = 2;
    int panel_size = 1;
    bool avoid_institution_clash = true;
    ByePolicy bye_policy = ByePolicy::LowestRankBye;
    PairingMethod pairing_method = PairingMethod::Adjacent;
    std::optional<uint64_t> tie_break_seed;

    // Swap search bounds for the pairing engine
    int max_swap_distance = 4;  // in rank positions
    int max_swap_attempts = 16;  // per room

    bool avoid_judged_institutions = false;

    size_t worker_threads = 2;
    std::string log_level = "info";

    // Reads TABBIT_* variables; malformed or out of range values keep the default
    static Config from_env();

    // Throws ConfigurationError
    void validate() const;
};

const char* to_string(ByePolicy policy);
const char* to_string(PairingMethod method);

Config& get_config();

}  // namespace tabbit

#endif  // TABBIT_CONFIG_H
