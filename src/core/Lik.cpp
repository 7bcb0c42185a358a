#include "core/Lik.h"
#include "core/RNG.h"
#include "color/ColorMath.h"

#include <algorithm>

// Hue drift across one full lifetime, in degrees.
static constexpr double kLifetimeHueDrift = 36.0;

Lik::Lik(const Vec3& startPos, int birthFrame, double lifespan, double initialHue)
    : position(startPos),
    birthFrame(birthFrame),
    lifespan(lifespan),
    initialHue(ColorMath::wrapHue(initialHue)),
    hue(ColorMath::wrapHue(initialHue))
{
}

void Lik::initialize(int frame, const SimulationConfig& cfg, const Vec3& origin) {
    const double jitter = cfg.spawnJitter;
    position = origin + Vec3(uniformReal(-jitter, jitter),
        uniformReal(-jitter, jitter),
        uniformReal(-jitter, jitter));
    velocity = Vec3(0.0);

    birthFrame = frame;
    lifespan = cfg.maxLikLifespan * uniformReal(0.5, 1.0);
    initialHue = ColorMath::wrapHue(uniformReal(0.0, 360.0));
    hue = initialHue;

    updateColor(frame, cfg.paletteSaturation, cfg.paletteLightness);
}

double Lik::age(int frame) const {
    return static_cast<double>(frame - birthFrame);
}

double Lik::ageFraction(int frame) const {
    return (lifespan > 0.0) ? age(frame) / lifespan : 0.0;
}

void Lik::updateColor(int frame, double saturation, double lightness) {
    hue = ColorMath::wrapHue(initialHue + ageFraction(frame) * kLifetimeHueDrift);
    rgb = ColorMath::hslToRgb(hue, saturation, lightness);
}

double Lik::sizeHint(int frame, double baseSize, double minSize) const {
    double fade = 1.0 - 0.5 * std::clamp(ageFraction(frame), 0.0, 1.0);
    return std::max(minSize, baseSize * fade);
}
