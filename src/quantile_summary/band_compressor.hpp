#pragma once

#include "entry.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

// Band of an entry in the classical GK compression, for p = floor(2 * eps * n).
// The valid range 0 <= delta <= p is split into bands, starting from the right:
//   band_0 := delta = p
//   band_a := p - 2^a - (p mod 2^a) < delta <= p - 2^(a-1) - (p mod 2^(a-1)),  1 <= a <= floor(log2(p)) + 1
// For p = 22: band_0 = {22}, band_1 = (20, 21], band_2 = (16, 20], band_3 = (8, 16], band_4 = (0, 8], band_5 = {0}
inline uint64_t gk_band(uint64_t delta, uint64_t p) {
    if (delta >= p) return 0;

    if (delta == 0) {
        uint64_t log2_p = 0;
        while ((p >> (log2_p + 1)) > 0) log2_p++;
        return log2_p + 1;
    }

    // Terminates at a = floor(log2(p)) at the latest, where the lower bound reaches 0
    uint64_t a = 0;
    while (true) {
        uint64_t step = uint64_t{1} << a;
        uint64_t lower_bound = p - step - (p % step);
        if (delta > lower_bound) return a;
        a++;
    }
}

// Classical GK COMPRESS over a sorted entry sequence.
// Walks right to left; entry i and all of its descendants (the contiguous run of
// lower-band entries on its left) are folded into entry i+1 when the bands allow it
// and the resulting g + delta stays within p. The minimum is never folded.
template <typename T> class BandCompressor {
  public:
    explicit BandCompressor(uint64_t p) : m_p(p) {}

    // Returns the number of entries removed
    size_t compress(std::vector<Entry<T>> &entries) const {
        const size_t size = entries.size();
        if (size < 3) return 0;

        std::vector<uint64_t> bands(size);
        for (size_t i = 0; i < size; ++i) { bands[i] = gk_band(entries[i].delta, m_p); }

        // Kept entries, built from the right
        std::vector<Entry<T>> kept;
        kept.reserve(size);
        kept.push_back(entries[size - 1]);
        uint64_t kept_band = bands[size - 1];

        size_t i = size - 2;
        while (i >= 1) {
            Entry<T> &next = kept.back();

            if (bands[i] > kept_band) {
                kept.push_back(entries[i]);
                kept_band = bands[i];
                --i;
                continue;
            }

            auto [first_descendant, g_star] = _scan_descendants(entries, bands, i);
            if (g_star + next.g + next.delta > m_p) {
                kept.push_back(entries[i]);
                kept_band = bands[i];
                --i;
                continue;
            }

            // Fold [first_descendant, i] into next
            next.g += g_star;
            i = first_descendant - 1;
        }

        kept.push_back(entries[0]);
        std::reverse(kept.begin(), kept.end());

        size_t removed = size - kept.size();
        entries = std::move(kept);
        return removed;
    }

    uint64_t get_p() const { return m_p; }

  private:
    // Descendants of i form a contiguous range ending at i. Index 0 is never a descendant.
    static std::pair<size_t, uint64_t> _scan_descendants(const std::vector<Entry<T>> &entries, const std::vector<uint64_t> &bands, size_t i) {
        size_t j = i;
        uint64_t total_g = entries[i].g;
        while (j > 1 && bands[j - 1] < bands[i]) {
            total_g += entries[j - 1].g;
            --j;
        }
        return {j, total_g};
    }

    uint64_t m_p;
};
