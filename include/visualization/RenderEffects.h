#pragma once
#include <array>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "core/Types.h"

// Pure per-frame effect math behind the viewer: color composition against
// the background, RGB-shift fringes, wiggled resonance curves and trail fade.
// Kept free of polyscope so it can be tested headless.
namespace RenderEffects {

    // Blend src over dst with one of the compositeOperation modes
    // ("source-over", "lighter", "difference", "multiply", "screen",
    // "overlay", "hard-light"). Unknown modes behave as source-over.
    glm::vec3 compositeColor(const glm::vec3& src, const glm::vec3& dst, const std::string& op);

    // Signed jitter added to the shift amount, oscillating with frame * rate.
    double shiftJitter(double jitter, int frame, double rate);

    // Screen-plane fringe offset (x right, y up). Zero when amount <= 0.
    glm::dvec2 rgbShiftOffset(double amount, double angleDeg, double jitterTerm);

    struct ShiftLayer {
        double sign;          // Multiplier on the fringe offset: +1, 0 or -1
        glm::vec3 mask;       // Per-channel color multiplier
    };

    // "add": red / green / blue channels split along the offset.
    // "subtract": complementary fringes around a full-color center.
    std::array<ShiftLayer, 3> shiftLayers(const std::string& mode);

    // Resonance curve from a to b with samples + 1 points. Interior points
    // wiggle by wiggleFactor * |b - a| and bow toward target by pull.
    std::vector<Vec3> sampleResonanceCurve(const Vec3& a, const Vec3& b, int samples,
                                           double wiggleFactor, double pull,
                                           const Vec3& target, int frame);

    // Weight left on a frame drawn `age` frames ago when every frame is
    // covered by the background at opacity alpha.
    double trailFade(double alpha, int age);

} // namespace RenderEffects
