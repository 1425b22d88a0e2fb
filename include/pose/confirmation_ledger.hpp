#pragma once

#include <cstdint>
#include <map>
#include <vector>

namespace crane {

struct LedgerEntry {
    uint64_t sightings{0};
    uint64_t pair_hits{0};    // frames seen next to a confirmed marker, per confirmed marker
    uint64_t triple_hits{0};  // frames seen next to two confirmed markers, per pair
    bool confirmed{false};

    uint64_t evidence() const { return sightings + pair_hits + triple_hits; }
};

// Promotes marker ids to "confirmed" from co-observation evidence. Ids are
// promoted in increasing order only: an id at or below the last confirmed
// id stays a candidate for the rest of the run.
class ConfirmationLedger {
public:
    explicit ConfirmationLedger(int threshold = 5);

    // Folds one frame of visible ids (already filtered to known markers) and
    // returns the visible ids that are confirmed after this frame, ascending.
    std::vector<int> update(const std::vector<int>& visible_ids);

    bool isConfirmed(int id) const;
    int lastConfirmedId() const { return last_confirmed_id_; }
    const LedgerEntry* entry(int id) const;
    int threshold() const { return threshold_; }
    void setThreshold(int threshold) { threshold_ = threshold; }
    void reset();

private:
    int threshold_;
    int last_confirmed_id_{-1};
    std::map<int, LedgerEntry> entries_;
};

}  // namespace crane
