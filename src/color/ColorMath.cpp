#include "color/ColorMath.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace ColorMath {

    double wrapHue(double hue) {
        double h = std::fmod(hue, 360.0);
        if (h < 0.0) h += 360.0;
        // fmod of a tiny negative value can round back up to exactly 360
        if (h >= 360.0) h = 0.0;
        return h;
    }

    double circularHueDistance(double h1, double h2) {
        double delta = std::fabs(wrapHue(h1) - wrapHue(h2));
        return std::min(delta, 360.0 - delta);
    }

    double hueSimilarity(double h1, double h2) {
        return 1.0 - circularHueDistance(h1, h2) / 180.0;
    }

    static double hueToChannel(double p, double q, double t) {
        if (t < 0.0) t += 1.0;
        if (t > 1.0) t -= 1.0;
        if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
        if (t < 1.0 / 2.0) return q;
        if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
        return p;
    }

    static uint8_t toByte(double unit) {
        double v = std::round(std::clamp(unit, 0.0, 1.0) * 255.0);
        return static_cast<uint8_t>(v);
    }

    Rgb8 hslToRgb(double hue, double saturation, double lightness) {
        double h = wrapHue(hue) / 360.0;
        double s = std::clamp(saturation, 0.0, 100.0) / 100.0;
        double l = std::clamp(lightness, 0.0, 100.0) / 100.0;

        if (s == 0.0) {
            uint8_t v = toByte(l);
            return Rgb8{ v, v, v };
        }

        double q = (l < 0.5) ? l * (1.0 + s) : l + s - l * s;
        double p = 2.0 * l - q;

        return Rgb8{
            toByte(hueToChannel(p, q, h + 1.0 / 3.0)),
            toByte(hueToChannel(p, q, h)),
            toByte(hueToChannel(p, q, h - 1.0 / 3.0))
        };
    }

    bool isValidHexColor(const std::string& hex) {
        std::string body = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
        if (body.size() != 3 && body.size() != 6) return false;
        return std::all_of(body.begin(), body.end(), [](unsigned char c) {
            return std::isxdigit(c) != 0;
        });
    }

    Rgb8 hexToRgb(const std::string& hex) {
        if (!isValidHexColor(hex)) {
            throw std::invalid_argument("ColorMath::hexToRgb: invalid hex color '" + hex + "'");
        }

        std::string body = (hex[0] == '#') ? hex.substr(1) : hex;
        if (body.size() == 3) {
            std::string expanded;
            for (char c : body) {
                expanded.push_back(c);
                expanded.push_back(c);
            }
            body = expanded;
        }

        auto channel = [&body](size_t offset) {
            return static_cast<uint8_t>(std::stoi(body.substr(offset, 2), nullptr, 16));
        };
        return Rgb8{ channel(0), channel(2), channel(4) };
    }

    glm::vec3 rgbToFloat(const Rgb8& rgb) {
        return glm::vec3(rgb.r / 255.0f, rgb.g / 255.0f, rgb.b / 255.0f);
    }

} // namespace ColorMath
