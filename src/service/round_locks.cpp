#include "service/round_locks.h"

namespace tabbit {

std::shared_ptr<std::mutex> RoundLocks::get(Id tournament_id, Id round_id) {
    std::lock_guard lock(mutex_);
    auto& slot = locks_[{tournament_id, round_id}];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

size_t RoundLocks::size() const {
    std::lock_guard lock(mutex_);
    return locks_.size();
}

}  // namespace tabbit
