#include "MessageStore.hpp"

#include <glog/logging.h>
#include <algorithm>
#include <iterator>


bool MessageStore::record(const ProtocolMessage& msg) {
    if (msg.round < oldest_kept_) {
        DVLOG(7) << "late message for pruned round: " << msg;
        return false;
    }

    auto& bucket = rounds_[msg.round].received[index(msg.phase)];
    bucket.insert_or_assign(msg.sender_id, msg);
    return true;
}

std::vector<ProtocolMessage> MessageStore::read(uint32_t round, Phase phase) const {
    std::vector<ProtocolMessage> result;
    auto it = rounds_.find(round);
    if (it == rounds_.end()) {
        return result;
    }

    const auto& bucket = it->second.received[index(phase)];
    result.reserve(bucket.size());
    for (const auto& [sender, msg] : bucket) {
        result.push_back(msg);
    }
    return result;
}

void MessageStore::prune(uint32_t before_round) {
    if (before_round == 0) {
        return;
    }

    oldest_kept_ = std::max(oldest_kept_, before_round - 1);

    // rounds_ is ordered, everything below the bound sits at the front
    auto bound = rounds_.lower_bound(oldest_kept_);
    size_t dropped = std::distance(rounds_.begin(), bound);
    rounds_.erase(rounds_.begin(), bound);

    DVLOG(7) << "pruned " << dropped << " rounds below " << oldest_kept_;
}

bool MessageStore::has_round(uint32_t round) const {
    return rounds_.contains(round);
}

std::vector<uint32_t> MessageStore::rounds() const {
    std::vector<uint32_t> result;
    result.reserve(rounds_.size());
    for (const auto& [round, buffer] : rounds_) {
        result.push_back(round);
    }
    return result;
}
