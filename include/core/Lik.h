#pragma once
#include "core/Types.h"
#include "config/SimulationConfig.h"

// One particle of the swarm. Owned by Simulation's particle store; spawned and
// culled by PopulationManager, moved by a SwarmIntegrator.
class Lik {
public:
    Lik() = default;
    Lik(const Vec3& startPos, int birthFrame, double lifespan, double initialHue);

    // Spawn-time setup: jittered position around origin, zero velocity,
    // randomized lifespan and hue, color computed once.
    void initialize(int frame, const SimulationConfig& cfg, const Vec3& origin);

    const Vec3& getPosition() const { return position; }
    void setPosition(const Vec3& pos) { position = pos; }

    const Vec3& getVelocity() const { return velocity; }
    void setVelocity(const Vec3& v) { velocity = v; }

    int getBirthFrame() const { return birthFrame; }
    double getLifespan() const { return lifespan; }
    double getInitialHue() const { return initialHue; }
    double getHue() const { return hue; }
    const Rgb8& getRgb() const { return rgb; }

    // Frames since birth.
    double age(int frame) const;
    // age / lifespan, 0 for a zero lifespan.
    double ageFraction(int frame) const;
    bool isDead(int frame) const { return age(frame) >= lifespan; }

    // Recompute hue (slow drift over the lifetime) and cached RGB.
    void updateColor(int frame, double saturation, double lightness);

    // Point size for the renderer; shrinks to half over the lifetime.
    double sizeHint(int frame, double baseSize, double minSize) const;

private:
    Vec3 position{ 0.0 };
    Vec3 velocity{ 0.0 };

    int birthFrame = 0;
    double lifespan = 1.0;
    double initialHue = 0.0;
    double hue = 0.0;
    Rgb8 rgb;
};
