#include "pose/confirmation_ledger.hpp"

#include <algorithm>

namespace crane {

ConfirmationLedger::ConfirmationLedger(int threshold) : threshold_(threshold) {}

std::vector<int> ConfirmationLedger::update(const std::vector<int>& visible_ids) {
    std::vector<int> ids = visible_ids;
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    uint64_t confirmed_visible = 0;
    for (int id : ids) {
        if (isConfirmed(id)) {
            ++confirmed_visible;
        }
    }
    const uint64_t confirmed_pairs = confirmed_visible > 1U ? confirmed_visible * (confirmed_visible - 1U) / 2U : 0U;

    std::vector<int> usable;
    for (int id : ids) {
        LedgerEntry& e = entries_[id];
        if (!e.confirmed) {
            e.sightings += 1U;
            e.pair_hits += confirmed_visible;
            e.triple_hits += confirmed_pairs;
            if (e.evidence() > static_cast<uint64_t>(std::max(0, threshold_)) && id > last_confirmed_id_) {
                e.confirmed = true;
                last_confirmed_id_ = id;
            }
        }
        if (e.confirmed) {
            usable.push_back(id);
        }
    }
    return usable;
}

bool ConfirmationLedger::isConfirmed(int id) const {
    const auto it = entries_.find(id);
    return it != entries_.end() && it->second.confirmed;
}

const LedgerEntry* ConfirmationLedger::entry(int id) const {
    const auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

void ConfirmationLedger::reset() {
    entries_.clear();
    last_confirmed_id_ = -1;
}

}  // namespace crane
