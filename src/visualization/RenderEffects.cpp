#include "visualization/RenderEffects.h"

#include <algorithm>
#include <cmath>

namespace {

    constexpr double kPi = 3.14159265358979323846;

    float overlayChannel(float base, float blend) {
        return base < 0.5f ? 2.0f * base * blend
                           : 1.0f - 2.0f * (1.0f - base) * (1.0f - blend);
    }

} // anonymous namespace

namespace RenderEffects {

    glm::vec3 compositeColor(const glm::vec3& src, const glm::vec3& dst, const std::string& op) {
        glm::vec3 out = src;

        if (op == "lighter") {
            out = glm::min(src + dst, glm::vec3(1.0f));
        }
        else if (op == "difference") {
            out = glm::abs(src - dst);
        }
        else if (op == "multiply") {
            out = src * dst;
        }
        else if (op == "screen") {
            out = src + dst - src * dst;
        }
        else if (op == "overlay") {
            for (int c = 0; c < 3; c++) out[c] = overlayChannel(dst[c], src[c]);
        }
        else if (op == "hard-light") {
            for (int c = 0; c < 3; c++) out[c] = overlayChannel(src[c], dst[c]);
        }

        return glm::clamp(out, glm::vec3(0.0f), glm::vec3(1.0f));
    }

    double shiftJitter(double jitter, int frame, double rate) {
        return jitter * (std::sin(frame * rate) - 0.5);
    }

    glm::dvec2 rgbShiftOffset(double amount, double angleDeg, double jitterTerm) {
        if (amount <= 0.0) return glm::dvec2(0.0);
        double angle = angleDeg * kPi / 180.0;
        double shift = amount + jitterTerm;
        return glm::dvec2(std::cos(angle) * shift, std::sin(angle) * shift);
    }

    std::array<ShiftLayer, 3> shiftLayers(const std::string& mode) {
        if (mode == "subtract") {
            return { { { 1.0, glm::vec3(0.0f, 1.0f, 1.0f) },
                       { 0.0, glm::vec3(1.0f, 1.0f, 1.0f) },
                       { -1.0, glm::vec3(1.0f, 1.0f, 0.0f) } } };
        }
        return { { { 1.0, glm::vec3(1.0f, 0.0f, 0.0f) },
                   { 0.0, glm::vec3(0.0f, 1.0f, 0.0f) },
                   { -1.0, glm::vec3(0.0f, 0.0f, 1.0f) } } };
    }

    std::vector<Vec3> sampleResonanceCurve(const Vec3& a, const Vec3& b, int samples,
                                           double wiggleFactor, double pull,
                                           const Vec3& target, int frame) {
        samples = std::max(1, samples);

        std::vector<Vec3> pts;
        pts.reserve(samples + 1);
        pts.push_back(a);

        const Vec3 d = b - a;
        const double dist = glm::length(d);

        for (int i = 1; i < samples; i++) {
            double t = static_cast<double>(i) / samples;
            Vec3 mid = a + d * t;

            double amt = std::sin(t * kPi) * wiggleFactor * dist;
            double angle = std::sin(t * 10.0 + frame * 0.1) * 2.0 * kPi;
            mid.x += std::cos(angle) * amt;
            mid.y += std::sin(angle) * amt;
            mid.z += std::cos(frame * 0.05) * amt * 0.1;

            double w = t * (1.0 - t) * pull;
            pts.push_back(mid * (1.0 - w) + target * w);
        }

        // End exactly on b; sin(pi) and t*(1-t) vanish there anyway.
        pts.push_back(b);
        return pts;
    }

    double trailFade(double alpha, int age) {
        if (age <= 0) return 1.0;
        return std::pow(1.0 - std::clamp(alpha, 0.0, 1.0), age);
    }

} // namespace RenderEffects
