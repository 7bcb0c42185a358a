#include "resonance/ResonanceCache.h"
#include "color/ColorMath.h"
#include "util/Logger.h"

#include <algorithm>
#include <cmath>

ResonanceCache::ResonanceCache(int cadence)
    : cadence(std::max(1, cadence))
{
}

void ResonanceCache::setCadence(int frames) {
    cadence = std::max(1, frames);
}

std::vector<ResonancePair> ResonanceCache::recompute(const std::vector<Lik>& liks,
    double maxDistance,
    double similarityThreshold)
{
    std::vector<ResonancePair> out;
    if (maxDistance < 0.0) return out;

    const double maxDistSq = maxDistance * maxDistance;
    const size_t n = liks.size();

    for (size_t a = 0; a < n; ++a) {
        const Vec3& pa = liks[a].getPosition();
        for (size_t b = a + 1; b < n; ++b) {
            Vec3 d = liks[b].getPosition() - pa;
            double distSq = glm::dot(d, d);
            if (distSq > maxDistSq) continue;

            double similarity = ColorMath::hueSimilarity(liks[a].getHue(), liks[b].getHue());
            if (similarity < similarityThreshold) continue;

            out.push_back(ResonancePair{ a, b, std::sqrt(distSq), similarity });
        }
    }

    return out;
}

bool ResonanceCache::update(const std::vector<Lik>& liks, int frame,
    double maxDistance, double similarityThreshold)
{
    if (!dirty && frame % cadence != 0) {
        return false;
    }

    pairs = recompute(liks, maxDistance, similarityThreshold);
    dirty = false;
    scanCount++;

    Log::resonance("[RESONANCE] frame ", frame, ": ", pairs.size(),
        " pairs among ", liks.size(), " LIKs\n");
    return true;
}

void ResonanceCache::invalidate() {
    pairs.clear();
    dirty = true;
}

void ResonanceCache::dropOutOfRange(size_t count) {
    pairs.erase(std::remove_if(pairs.begin(), pairs.end(),
        [count](const ResonancePair& p) { return p.aIndex >= count || p.bIndex >= count; }),
        pairs.end());
}
