#include "pose/confirmation_ledger.hpp"

#include <iostream>
#include <vector>

int main() {
    crane::ConfirmationLedger ledger(5);

    // Alone, a marker needs six sightings to pass a threshold of five.
    for (int frame = 1; frame <= 5; ++frame) {
        if (!ledger.update({1}).empty()) {
            std::cerr << "marker 1 confirmed too early at frame " << frame << "\n";
            return 1;
        }
    }
    std::vector<int> usable = ledger.update({1});
    if (usable != std::vector<int>{1} || ledger.lastConfirmedId() != 1) {
        std::cerr << "marker 1 should be confirmed on the sixth sighting\n";
        return 1;
    }

    // Seen next to a confirmed marker, evidence grows twice as fast.
    ledger.update({1, 2});
    ledger.update({2, 1});
    usable = ledger.update({1, 2, 2});
    if (usable != std::vector<int>{1, 2}) {
        std::cerr << "marker 2 should be confirmed on its third co-sighting\n";
        return 1;
    }
    const crane::LedgerEntry* e2 = ledger.entry(2);
    if (e2 == nullptr || e2->sightings != 3U || e2->pair_hits != 3U || e2->triple_hits != 0U) {
        std::cerr << "marker 2 ledger entry mismatch\n";
        return 1;
    }

    // Two confirmed neighbours add pair and triple evidence.
    ledger.update({1, 2, 4});
    usable = ledger.update({1, 2, 4});
    if (usable != std::vector<int>{1, 2, 4}) {
        std::cerr << "marker 4 should be confirmed on its second sighting between two confirmed markers\n";
        return 1;
    }
    const crane::LedgerEntry* e4 = ledger.entry(4);
    if (e4 == nullptr || e4->evidence() != 8U || e4->triple_hits != 2U) {
        std::cerr << "marker 4 evidence mismatch\n";
        return 1;
    }

    // Marker 3 sits below the last confirmed id and stays a candidate.
    for (int frame = 0; frame < 100; ++frame) {
        usable = ledger.update({3, 4});
        if (ledger.isConfirmed(3)) {
            std::cerr << "marker 3 must not be promoted after marker 4\n";
            return 1;
        }
    }
    if (usable != std::vector<int>{4}) {
        std::cerr << "only confirmed markers should be usable\n";
        return 1;
    }

    // Out-of-order start: once 5 is confirmed, 3 never is.
    crane::ConfirmationLedger ordered(5);
    for (int frame = 0; frame < 6; ++frame) {
        ordered.update({5});
    }
    if (!ordered.isConfirmed(5)) {
        std::cerr << "marker 5 should be confirmed\n";
        return 1;
    }
    for (int frame = 0; frame < 50; ++frame) {
        ordered.update({3, 5});
    }
    if (ordered.isConfirmed(3) || ordered.lastConfirmedId() != 5) {
        std::cerr << "marker 3 should never follow marker 5\n";
        return 1;
    }

    crane::ConfirmationLedger instant(0);
    if (instant.update({7}) != std::vector<int>{7}) {
        std::cerr << "threshold 0 should confirm on the first sighting\n";
        return 1;
    }
    instant.reset();
    if (instant.isConfirmed(7) || instant.lastConfirmedId() != -1 || instant.entry(7) != nullptr) {
        std::cerr << "reset should forget every marker\n";
        return 1;
    }

    return 0;
}
