// tests/ColorMathTests.cpp
//
// Hue wrapping, circular similarity, HSL conversion and hex parsing.

#include "color/ColorMath.h"
#include "core/RNG.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

std::mt19937_64 GLOBAL_RNG;

void reseedRNG(uint64_t seed) {
    GLOBAL_RNG.seed(seed);
}

static bool near(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

// ============================================================================
//                              TEST CASES
// ============================================================================

static void test_wrap_hue() {
    std::cout << "\n[TEST] wrap_hue\n";

    assert(near(ColorMath::wrapHue(0.0), 0.0));
    assert(near(ColorMath::wrapHue(360.0), 0.0));
    assert(near(ColorMath::wrapHue(370.0), 10.0));
    assert(near(ColorMath::wrapHue(-10.0), 350.0));
    assert(near(ColorMath::wrapHue(-720.0), 0.0));

    // Whatever goes in, the result stays in [0, 360)
    reseedRNG(7);
    for (int i = 0; i < 1000; i++) {
        double h = ColorMath::wrapHue(uniformReal(-5000.0, 5000.0));
        assert(h >= 0.0 && h < 360.0);
    }
    assert(ColorMath::wrapHue(-1e-18) < 360.0);

    std::cout << "  -> OK\n";
}

static void test_hue_similarity() {
    std::cout << "\n[TEST] hue_similarity\n";

    assert(near(ColorMath::circularHueDistance(10.0, 350.0), 20.0));
    assert(near(ColorMath::circularHueDistance(0.0, 180.0), 180.0));
    assert(near(ColorMath::hueSimilarity(10.0, 350.0), 1.0 - 20.0 / 180.0));
    assert(near(ColorMath::hueSimilarity(120.0, 120.0), 1.0));
    assert(near(ColorMath::hueSimilarity(0.0, 180.0), 0.0));
    assert(near(ColorMath::hueSimilarity(-30.0, 330.0), 1.0));

    reseedRNG(11);
    for (int i = 0; i < 1000; i++) {
        double a = uniformReal(-720.0, 720.0);
        double b = uniformReal(-720.0, 720.0);
        double s = ColorMath::hueSimilarity(a, b);
        assert(s >= 0.0 && s <= 1.0);
        assert(near(s, ColorMath::hueSimilarity(b, a)));
    }

    std::cout << "  -> OK\n";
}

static void test_hsl_to_rgb() {
    std::cout << "\n[TEST] hsl_to_rgb\n";

    assert((ColorMath::hslToRgb(0.0, 100.0, 50.0) == Rgb8{ 255, 0, 0 }));
    assert((ColorMath::hslToRgb(120.0, 100.0, 50.0) == Rgb8{ 0, 255, 0 }));
    assert((ColorMath::hslToRgb(240.0, 100.0, 50.0) == Rgb8{ 0, 0, 255 }));
    assert((ColorMath::hslToRgb(360.0, 100.0, 50.0) == Rgb8{ 255, 0, 0 }));

    // Zero saturation is grey at the lightness level
    assert((ColorMath::hslToRgb(200.0, 0.0, 0.0) == Rgb8{ 0, 0, 0 }));
    assert((ColorMath::hslToRgb(200.0, 0.0, 100.0) == Rgb8{ 255, 255, 255 }));

    std::cout << "  -> OK\n";
}

static void test_hex_colors() {
    std::cout << "\n[TEST] hex_colors\n";

    assert((ColorMath::hexToRgb("#000000") == Rgb8{ 0, 0, 0 }));
    assert((ColorMath::hexToRgb("#ff8000") == Rgb8{ 255, 128, 0 }));
    assert((ColorMath::hexToRgb("#FFF") == Rgb8{ 255, 255, 255 }));

    assert(ColorMath::isValidHexColor("#a1b2c3"));
    assert(!ColorMath::isValidHexColor("#12345"));
    assert(!ColorMath::isValidHexColor("#gggggg"));
    assert(!ColorMath::isValidHexColor(""));

    bool threw = false;
    try {
        ColorMath::hexToRgb("not a color");
    }
    catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "bad hex must throw");

    glm::vec3 white = ColorMath::rgbToFloat(Rgb8{ 255, 255, 255 });
    assert(near(white.x, 1.0, 1e-6) && near(white.y, 1.0, 1e-6) && near(white.z, 1.0, 1e-6));

    std::cout << "  -> OK\n";
}

int main(int argc, char* argv[]) {
    std::cout << "========================================\n";
    std::cout << "  Color Math Tests\n";
    std::cout << "========================================\n";

    bool runAll = (argc == 1);
    std::string testName = (argc > 1) ? argv[1] : "";

    if (runAll || testName == "wrap") test_wrap_hue();
    if (runAll || testName == "similarity") test_hue_similarity();
    if (runAll || testName == "hsl") test_hsl_to_rgb();
    if (runAll || testName == "hex") test_hex_colors();

    std::cout << "\n========================================\n";
    std::cout << "  All requested tests completed!\n";
    std::cout << "========================================\n";

    return 0;
}
