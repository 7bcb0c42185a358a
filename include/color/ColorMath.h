#pragma once
#include <string>
#include <glm/glm.hpp>
#include "core/Types.h"

// Pure hue/color helpers shared by the physics, the population manager
// and the renderer.
namespace ColorMath {

    // Wrap any angle in degrees into [0, 360).
    double wrapHue(double hue);

    // Shortest angular distance between two hues, in [0, 180].
    double circularHueDistance(double h1, double h2);

    // 1 - circularHueDistance / 180, in [0, 1].
    double hueSimilarity(double h1, double h2);

    // HSL -> RGB. hue in degrees, saturation and lightness in percent.
    Rgb8 hslToRgb(double hue, double saturation, double lightness);

    // "#rrggbb" or "#rgb" -> RGB. Throws std::invalid_argument on bad input.
    Rgb8 hexToRgb(const std::string& hex);

    bool isValidHexColor(const std::string& hex);

    glm::vec3 rgbToFloat(const Rgb8& rgb);

} // namespace ColorMath
