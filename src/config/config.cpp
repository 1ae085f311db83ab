#include "config/config.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace tabbit {

namespace {

template <typename T>
void read_number(const char* name, T& out) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    try {
        size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (consumed != std::string(raw).size()) {
            throw std::invalid_argument("trailing characters");
        }
        bool in_range;
        if constexpr (std::is_unsigned_v<T>) {
            in_range = value >= 0 &&
                       static_cast<unsigned long long>(value) <= std::numeric_limits<T>::max();
        } else {
            in_range = value >= static_cast<long long>(std::numeric_limits<T>::min()) &&
                       value <= static_cast<long long>(std::numeric_limits<T>::max());
        }
        if (!in_range) {
            spdlog::warn("Ignoring out of range {}='{}'", name, raw);
            return;
        }
        out = static_cast<T>(value);
    } catch (const std::exception&) {
        spdlog::warn("Ignoring malformed {}='{}'", name, raw);
    }
}

// Unsigned 64-bit; rejects signs and trailing characters that stoull accepts
std::optional<uint64_t> parse_seed(const std::string& raw) {
    if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw.front()))) return std::nullopt;
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(raw, &consumed);
        if (consumed != raw.size()) return std::nullopt;
        return static_cast<uint64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void read_flag(const char* name, bool& out) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    std::string value(raw);
    if (value == "1" || value == "true" || value == "yes") {
        out = true;
    } else if (value == "0" || value == "false" || value == "no") {
        out = false;
    } else {
        spdlog::warn("Ignoring malformed {}='{}'", name, raw);
    }
}

}  // namespace

Config& get_config() {
    static Config cfg = Config::from_env();
    return cfg;
}

Config Config::from_env() {
    Config cfg;

    read_number("TABBIT_SIDES_PER_ROOM", cfg.sides_per_room);
    read_number("TABBIT_PANEL_SIZE", cfg.panel_size);
    read_flag("TABBIT_AVOID_INSTITUTION_CLASH", cfg.avoid_institution_clash);
    read_flag("TABBIT_AVOID_JUDGED_INSTITUTIONS", cfg.avoid_judged_institutions);
    read_number("TABBIT_MAX_SWAP_DISTANCE", cfg.max_swap_distance);
    read_number("TABBIT_MAX_SWAP_ATTEMPTS", cfg.max_swap_attempts);
    read_number("TABBIT_WORKER_THREADS", cfg.worker_threads);

    if (const char* bye = std::getenv("TABBIT_BYE_POLICY")) {
        std::string value(bye);
        if (value == "lowest_rank_bye") {
            cfg.bye_policy = ByePolicy::LowestRankBye;
        } else if (value == "no_bye") {
            cfg.bye_policy = ByePolicy::NoBye;
        } else {
            spdlog::warn("Ignoring unknown TABBIT_BYE_POLICY='{}'", value);
        }
    }

    if (const char* method = std::getenv("TABBIT_PAIRING_METHOD")) {
        std::string value(method);
        if (value == "adjacent") {
            cfg.pairing_method = PairingMethod::Adjacent;
        } else if (value == "folded") {
            cfg.pairing_method = PairingMethod::Folded;
        } else {
            spdlog::warn("Ignoring unknown TABBIT_PAIRING_METHOD='{}'", value);
        }
    }

    if (const char* seed = std::getenv("TABBIT_TIE_BREAK_SEED")) {
        if (auto parsed = parse_seed(seed)) {
            cfg.tie_break_seed = *parsed;
        } else {
            spdlog::warn("Ignoring malformed TABBIT_TIE_BREAK_SEED='{}'", seed);
        }
    }

    if (const char* level = std::getenv("TABBIT_LOG_LEVEL")) {
        cfg.log_level = level;
    }

    return cfg;
}

void Config::validate() const {
    if (sides_per_room <= 0) {
        throw ConfigurationError("sides_per_room must be positive, got " +
                                 std::to_string(sides_per_room));
    }
    if (panel_size <= 0) {
        throw ConfigurationError("panel_size must be positive, got " +
                                 std::to_string(panel_size));
    }
    if (max_swap_distance < 0) {
        throw ConfigurationError("max_swap_distance must not be negative");
    }
    if (max_swap_attempts < 0) {
        throw ConfigurationError("max_swap_attempts must not be negative");
    }
    if (worker_threads == 0 || worker_threads > kMaxWorkerThreads) {
        throw ConfigurationError("worker_threads must be between 1 and " +
                                 std::to_string(kMaxWorkerThreads) + ", got " +
                                 std::to_string(worker_threads));
    }
}

const char* to_string(ByePolicy policy) {
    return policy == ByePolicy::LowestRankBye ? "lowest_rank_bye" : "no_bye";
}

const char* to_string(PairingMethod method) {
    return method == PairingMethod::Adjacent ? "adjacent" : "folded";
}

}  // namespace tabbit
