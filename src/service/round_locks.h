#pragma once
#ifndef TABBIT_ROUND_LOCKS_H
#define TABBIT_ROUND_LOCKS_H

#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include "model/entities.h"

namespace tabbit {

// One mutex per (tournament, round). Draws of the same round serialize on
// it; draws of different rounds never contend.
class RoundLocks {
public:
    std::shared_ptr<std::mutex> get(Id tournament_id, Id round_id);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<Id, Id>, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace tabbit

#endif  // TABBIT_ROUND_LOCKS_H
