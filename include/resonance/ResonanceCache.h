#pragma once
#include <cstddef>
#include <vector>

#include "core/Lik.h"

// A LIK pair close and color-similar enough to be drawn as a line.
// Indices refer to the particle store at the time of the scan.
struct ResonancePair {
    size_t aIndex;
    size_t bIndex;
    double distance;
    double similarity;
};

// =============================================================================
// ResonanceCache - periodic O(n^2) scan for renderable pairs
//
// The scan only feeds rendering, so it runs every `cadence` frames instead of
// every frame; the previous result is served in between. Population changes
// do not force a rescan: between scans an index may point at a different LIK
// than when it was found, but never past the end of the store (see
// dropOutOfRange).
// =============================================================================
class ResonanceCache {
public:
    explicit ResonanceCache(int cadence = 10);

    // Full scan over i<j. A pair qualifies iff distance <= maxDistance and
    // similarity >= similarityThreshold.
    static std::vector<ResonancePair> recompute(const std::vector<Lik>& liks,
        double maxDistance,
        double similarityThreshold);

    // Rescans when frame is on the cadence, or on the first update after
    // construction or invalidate(). Returns true if a scan ran.
    bool update(const std::vector<Lik>& liks, int frame,
        double maxDistance, double similarityThreshold);

    // Drop the stored pairs; the next update() rescans.
    void invalidate();

    // Drop stored pairs that reference an index >= count. Called after the
    // store shrinks; no rescan.
    void dropOutOfRange(size_t count);

    // Number of scans run since construction.
    size_t getScanCount() const { return scanCount; }

    const std::vector<ResonancePair>& getPairs() const { return pairs; }
    int getCadence() const { return cadence; }
    void setCadence(int frames);

private:
    int cadence;
    bool dirty = true;
    size_t scanCount = 0;
    std::vector<ResonancePair> pairs;
};
