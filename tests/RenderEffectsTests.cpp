// tests/RenderEffectsTests.cpp
//
// Composition modes, RGB-shift fringes, resonance curve sampling and trail
// fade used by the viewer.

#include "visualization/RenderEffects.h"
#include "config/ParameterRegistry.h"
#include "core/RNG.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

std::mt19937_64 GLOBAL_RNG;

void reseedRNG(uint64_t seed) {
    GLOBAL_RNG.seed(seed);
}

static const double kPi = 3.14159265358979323846;

static bool near(double a, double b, double tol = 1e-6) {
    return std::fabs(a - b) <= tol;
}

static bool nearColor(const glm::vec3& a, const glm::vec3& b, double tol = 1e-5) {
    return near(a.x, b.x, tol) && near(a.y, b.y, tol) && near(a.z, b.z, tol);
}

static const ParameterDefinition& definitionOf(ParamKey key) {
    for (const auto& def : ParameterRegistry::definitions()) {
        if (def.key == key) return def;
    }
    assert(false && "key not registered");
    return ParameterRegistry::definitions().front();
}

// ============================================================================
//                              TEST CASES
// ============================================================================

static void test_composite_modes() {
    std::cout << "\n[TEST] composite_modes\n";

    const glm::vec3 src(0.6f, 0.3f, 0.2f);
    const glm::vec3 dst(0.4f, 0.5f, 0.8f);

    assert(nearColor(RenderEffects::compositeColor(src, dst, "source-over"), src));
    assert(nearColor(RenderEffects::compositeColor(src, dst, "lighter"), glm::vec3(1.0f, 0.8f, 1.0f)));
    assert(nearColor(RenderEffects::compositeColor(src, dst, "difference"), glm::vec3(0.2f, 0.2f, 0.6f)));
    assert(nearColor(RenderEffects::compositeColor(src, dst, "multiply"), glm::vec3(0.24f, 0.15f, 0.16f)));
    assert(nearColor(RenderEffects::compositeColor(src, dst, "screen"), glm::vec3(0.76f, 0.65f, 0.84f)));
    assert(nearColor(RenderEffects::compositeColor(src, dst, "overlay"), glm::vec3(0.48f, 0.3f, 0.68f)));
    assert(nearColor(RenderEffects::compositeColor(src, dst, "hard-light"), glm::vec3(0.52f, 0.3f, 0.32f)));

    // Unknown modes draw the source unchanged
    assert(nearColor(RenderEffects::compositeColor(src, dst, "dissolve"), src));

    // Additive over black is the identity, as on the default canvas
    assert(nearColor(RenderEffects::compositeColor(src, glm::vec3(0.0f), "lighter"), src));

    std::cout << "  -> OK\n";
}

static void test_every_composite_option_differs() {
    std::cout << "\n[TEST] every_composite_option_differs\n";

    const glm::vec3 src(0.6f, 0.3f, 0.2f);
    const glm::vec3 dst(0.4f, 0.5f, 0.8f);

    const auto& def = definitionOf(ParamKey::CompositeOperation);
    assert(def.options.size() == 7);

    std::vector<glm::vec3> results;
    for (const auto& opt : def.options) {
        results.push_back(RenderEffects::compositeColor(src, dst, opt.value));
    }
    for (size_t i = 0; i < results.size(); i++) {
        for (size_t j = i + 1; j < results.size(); j++) {
            assert(!nearColor(results[i], results[j], 1e-3) && "two modes draw identically");
        }
    }

    std::cout << "  -> OK\n";
}

static void test_shift_offset() {
    std::cout << "\n[TEST] shift_offset\n";

    glm::dvec2 off = RenderEffects::rgbShiftOffset(6.0, 0.0, 0.0);
    assert(near(off.x, 6.0) && near(off.y, 0.0));

    off = RenderEffects::rgbShiftOffset(6.0, 90.0, 0.0);
    assert(near(off.x, 0.0) && near(off.y, 6.0));

    off = RenderEffects::rgbShiftOffset(4.0, 45.0, 1.0);
    assert(near(glm::length(off), 5.0));

    // No amount, no fringe, whatever the jitter says
    off = RenderEffects::rgbShiftOffset(0.0, 30.0, 2.0);
    assert(near(off.x, 0.0) && near(off.y, 0.0));

    // Jitter swings between -1.5 and +0.5 of its amplitude
    assert(near(RenderEffects::shiftJitter(0.2, 0, 0.05), -0.1));
    for (int frame = 0; frame < 500; frame++) {
        double j = RenderEffects::shiftJitter(1.0, frame, 0.1);
        assert(j >= -1.5 - 1e-12 && j <= 0.5 + 1e-12);
    }

    std::cout << "  -> OK\n";
}

static void test_shift_layers() {
    std::cout << "\n[TEST] shift_layers\n";

    auto add = RenderEffects::shiftLayers("add");
    glm::vec3 total(0.0f);
    double signSum = 0.0;
    for (const auto& layer : add) {
        total += layer.mask;
        signSum += layer.sign;
    }
    // The channels split apart and add back to the full color
    assert(nearColor(total, glm::vec3(1.0f)));
    assert(near(signSum, 0.0));

    // Subtractive fringes are the complements of the additive ones
    auto sub = RenderEffects::shiftLayers("subtract");
    for (size_t k = 0; k < sub.size(); k++) {
        assert(near(sub[k].sign, add[k].sign));
        if (sub[k].sign == 0.0) {
            assert(nearColor(sub[k].mask, glm::vec3(1.0f)));
        }
        else {
            assert(nearColor(sub[k].mask, glm::vec3(1.0f) - add[k].mask));
        }
    }

    // Every selectable mode gets its own layering
    const auto& def = definitionOf(ParamKey::RgbShiftMode);
    assert(def.options.size() == 2);
    auto first = RenderEffects::shiftLayers(def.options[0].value);
    auto second = RenderEffects::shiftLayers(def.options[1].value);
    assert(!nearColor(first[0].mask, second[0].mask));

    std::cout << "  -> OK\n";
}

static void test_curve_endpoints_and_count() {
    std::cout << "\n[TEST] curve_endpoints_and_count\n";

    const Vec3 a(10.0, -20.0, 5.0);
    const Vec3 b(110.0, 40.0, -15.0);
    const Vec3 eye(0.0, 0.0, 800.0);

    for (int samples : { 1, 2, 10, 50 }) {
        auto pts = RenderEffects::sampleResonanceCurve(a, b, samples, 0.5, 0.5, eye, 37);
        assert(pts.size() == static_cast<size_t>(samples) + 1);
        assert(pts.front() == a);
        assert(pts.back() == b);
    }

    // Fewer than one sample still draws the straight segment
    auto pts = RenderEffects::sampleResonanceCurve(a, b, 0, 0.5, 0.5, eye, 0);
    assert(pts.size() == 2);

    std::cout << "  -> OK\n";
}

static void test_curve_shape() {
    std::cout << "\n[TEST] curve_shape\n";

    const Vec3 a(0.0, 0.0, 0.0);
    const Vec3 b(100.0, 0.0, 0.0);
    const Vec3 eye(50.0, 0.0, 400.0);
    const int samples = 10;

    // No wiggle and no pull: evenly spaced along the segment
    auto flat = RenderEffects::sampleResonanceCurve(a, b, samples, 0.0, 0.0, eye, 12);
    for (int i = 0; i <= samples; i++) {
        Vec3 expected = a + (b - a) * (static_cast<double>(i) / samples);
        assert(glm::length(flat[i] - expected) < 1e-9);
    }

    // Pull alone bows the midpoint a quarter of the way to the target
    auto pulled = RenderEffects::sampleResonanceCurve(a, b, samples, 0.0, 1.0, eye, 12);
    Vec3 mid = Vec3(50.0, 0.0, 0.0) * 0.75 + eye * 0.25;
    assert(glm::length(pulled[samples / 2] - mid) < 1e-9);

    // Wiggle alone displaces each interior point by sin(pi t) * factor * length in xy
    const double factor = 0.3;
    const int frame = 21;
    auto wiggled = RenderEffects::sampleResonanceCurve(a, b, samples, factor, 0.0, eye, frame);
    for (int i = 1; i < samples; i++) {
        double t = static_cast<double>(i) / samples;
        double amt = std::sin(t * kPi) * factor * 100.0;
        Vec3 d = wiggled[i] - flat[i];
        assert(near(std::hypot(d.x, d.y), amt, 1e-9));
        assert(near(d.z, std::cos(frame * 0.05) * amt * 0.1, 1e-9));
    }

    std::cout << "  -> OK\n";
}

static void test_trail_fade() {
    std::cout << "\n[TEST] trail_fade\n";

    assert(near(RenderEffects::trailFade(0.9, 0), 1.0));
    assert(near(RenderEffects::trailFade(0.9, 1), 0.1));
    assert(near(RenderEffects::trailFade(0.9, 2), 0.01));
    assert(near(RenderEffects::trailFade(0.5, 3), 0.125));

    // Opaque fill leaves nothing behind, a clear one keeps everything
    assert(near(RenderEffects::trailFade(1.0, 1), 0.0));
    assert(near(RenderEffects::trailFade(0.0, 8), 1.0));

    // Older frames never show through more than newer ones
    for (int age = 1; age < 20; age++) {
        assert(RenderEffects::trailFade(0.3, age + 1) <= RenderEffects::trailFade(0.3, age));
    }

    std::cout << "  -> OK\n";
}

int main(int argc, char* argv[]) {
    std::cout << "========================================\n";
    std::cout << "  Render Effects Tests\n";
    std::cout << "========================================\n";

    bool runAll = (argc == 1);
    std::string testName = (argc > 1) ? argv[1] : "";

    if (runAll || testName == "composite") test_composite_modes();
    if (runAll || testName == "options") test_every_composite_option_differs();
    if (runAll || testName == "offset") test_shift_offset();
    if (runAll || testName == "layers") test_shift_layers();
    if (runAll || testName == "endpoints") test_curve_endpoints_and_count();
    if (runAll || testName == "shape") test_curve_shape();
    if (runAll || testName == "trail") test_trail_fade();

    std::cout << "\n========================================\n";
    std::cout << "  All requested tests completed!\n";
    std::cout << "========================================\n";

    return 0;
}
