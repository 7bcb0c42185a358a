#include "config/ParameterRegistry.h"
#include "color/ColorMath.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>

// ============================================================================
//  Definitions + field bindings (kept CPP-only)
// ============================================================================

namespace {

    using FieldPtr = std::variant<double SimulationConfig::*,
        bool SimulationConfig::*,
        std::string SimulationConfig::*>;

    constexpr size_t kParamCount = static_cast<size_t>(ParamKey::COUNT);

    struct Table {
        std::vector<ParameterDefinition> defs;
        std::array<FieldPtr, kParamCount> fields{};
        std::array<size_t, kParamCount> index{};
        std::unordered_map<std::string, ParamKey> byName;
    };

    ParameterDefinition slider(ParamKey key, const char* name, const char* label,
        const char* section, double minimum, double maximum, double step,
        int precision, bool loopable = true)
    {
        ParameterDefinition d{ key, name, label, section, ControlType::SLIDER };
        d.minimum = minimum;
        d.maximum = maximum;
        d.step = step;
        d.precision = precision;
        d.loopable = loopable;
        return d;
    }

    ParameterDefinition checkbox(ParamKey key, const char* name, const char* label,
        const char* section)
    {
        return ParameterDefinition{ key, name, label, section, ControlType::CHECKBOX };
    }

    ParameterDefinition selectBox(ParamKey key, const char* name, const char* label,
        const char* section, std::vector<ParameterOption> options, bool loopable = true)
    {
        ParameterDefinition d{ key, name, label, section, ControlType::SELECT };
        d.options = std::move(options);
        d.loopable = loopable;
        return d;
    }

    Table buildTable() {
        Table t;
        auto add = [&t](ParameterDefinition def, FieldPtr field) {
            size_t k = static_cast<size_t>(def.key);
            t.index[k] = t.defs.size();
            t.fields[k] = field;
            t.byName[def.name] = def.key;
            t.defs.push_back(std::move(def));
        };

        using C = SimulationConfig;

        // Canvas
        add(ParameterDefinition{ ParamKey::BackgroundColor, "backgroundColor",
            "Background Color", "Canvas", ControlType::COLOR }, &C::backgroundColor);
        add(selectBox(ParamKey::CompositeOperation, "compositeOperation", "Render Mode", "Canvas", {
                { "source-over", "Normal" },
                { "lighter", "Lighter (Additive)" },
                { "difference", "Difference (Invert)" },
                { "multiply", "Multiply (Darker)" },
                { "screen", "Screen (Brighter)" },
                { "overlay", "Overlay" },
                { "hard-light", "Hard Light" } }),
            &C::compositeOperation);

        // Field geometry
        add(slider(ParamKey::MaxLikCount, "maxLikCount", "Max. LIKs",
            "Field Geometry", 50, 1000, 50, 0), &C::maxLikCount);
        add(slider(ParamKey::MinLikCount, "minLikCount", "Min. LIKs",
            "Field Geometry", 10, 500, 10, 0), &C::minLikCount);
        add(slider(ParamKey::MaxLikLifespan, "maxLikLifespan", "Max. Lifespan (Frames)",
            "Field Geometry", 100, 5000, 100, 0), &C::maxLikLifespan);
        add(slider(ParamKey::UniverseRadius, "universeRadius", "Universe Radius",
            "Field Geometry", 100, 2000, 50, 0), &C::universeRadius);

        // Swarm behavior
        add(slider(ParamKey::AttractionStrength, "attractionStrength", "Attraction Strength",
            "Swarm Behavior", 0.0001, 0.01, 0.0001, 4), &C::attractionStrength);
        add(slider(ParamKey::AttractionSimilarityThreshold, "attractionSimilarityThreshold",
            "Color Similarity Threshold", "Swarm Behavior", 0.0, 1.0, 0.01, 2),
            &C::attractionSimilarityThreshold);
        add(slider(ParamKey::RepulsionStrength, "repulsionStrength", "Repulsion Strength",
            "Swarm Behavior", 0.0001, 0.02, 0.0001, 4), &C::repulsionStrength);
        add(slider(ParamKey::BaseMigrationSpeed, "baseMigrationSpeed", "Base Migration Speed",
            "Swarm Behavior", 0.0001, 0.01, 0.0001, 4), &C::baseMigrationSpeed);
        add(slider(ParamKey::PersonalSpaceRadius, "personalSpaceRadius", "Personal Space Radius",
            "Swarm Behavior", 10, 500, 10, 0), &C::personalSpaceRadius);
        add(slider(ParamKey::PersonalSpaceRepulsion, "personalSpaceRepulsion",
            "Personal Space Repulsion", "Swarm Behavior", 0.01, 1.0, 0.01, 2),
            &C::personalSpaceRepulsion);

        // Interaction
        add(slider(ParamKey::GlobalDriftStrength, "globalDriftStrength", "Global Drift Strength",
            "Interaction", 0.0, 0.5, 0.01, 2), &C::globalDriftStrength);
        add(slider(ParamKey::GlobalDriftMomentum, "globalDriftMomentum", "Global Drift Momentum",
            "Interaction", 0.8, 0.999, 0.001, 3), &C::globalDriftMomentum);
        add(slider(ParamKey::AnimationSpeed, "animationSpeed", "Animation Speed",
            "Interaction", 0.1, 5.0, 0.1, 1), &C::animationSpeed);
        add(slider(ParamKey::CameraMovementSpeed, "cameraMovementSpeed", "Camera Speed",
            "Interaction", 1.0, 20.0, 1.0, 1), &C::cameraMovementSpeed);

        // Resonance lines
        add(slider(ParamKey::LineDrawSampleCount, "lineDrawSampleCount", "Line Sample Count",
            "Resonance Lines", 1, 100, 1, 0), &C::lineDrawSampleCount);
        add(slider(ParamKey::ResonanceThickness, "resonanceThickness", "Resonance Thickness",
            "Resonance Lines", 0.1, 5.0, 0.1, 1), &C::resonanceThickness);
        add(slider(ParamKey::MaxLineThicknessChaos, "maxLineThicknessChaos", "Max. Thickness Chaos",
            "Resonance Lines", 0.0, 1.0, 0.01, 2), &C::maxLineThicknessChaos);
        add(slider(ParamKey::ResonanceAlpha, "resonanceAlpha", "Resonance Alpha",
            "Resonance Lines", 0.01, 1.0, 0.01, 2), &C::resonanceAlpha);
        add(slider(ParamKey::MaxResonanceDist, "maxResonanceDist", "Max. Resonance Dist.",
            "Resonance Lines", 50, 1000, 10, 0), &C::maxResonanceDist);
        {
            ParameterDefinition d = slider(ParamKey::ResonanceThreshold, "resonanceThreshold",
                "Resonance Threshold", "Resonance Lines", 0.0, 1.0, 0.01, 2, false);
            d.type = ControlType::HIDDEN;
            add(d, &C::resonanceThreshold);
        }

        // Line distortion
        add(slider(ParamKey::CurveWiggleFactor, "curveWiggleFactor", "Curve Wiggle Factor",
            "Line Distortion", 0.0, 1.0, 0.01, 2), &C::curveWiggleFactor);
        add(slider(ParamKey::PulsationSpeed, "pulsationSpeed", "Pulsation Speed",
            "Line Distortion", 0.01, 1.0, 0.01, 2), &C::pulsationSpeed);
        add(slider(ParamKey::LineTargetPull, "lineTargetPull", "Line Target Pull",
            "Line Distortion", 0.01, 1.0, 0.01, 2), &C::lineTargetPull);

        // Palette
        add(slider(ParamKey::PaletteSaturation, "paletteSaturation", "LIK Saturation",
            "LIK Palette", 0, 100, 1, 0), &C::paletteSaturation);
        add(slider(ParamKey::PaletteLightness, "paletteLightness", "LIK Lightness",
            "LIK Palette", 0, 100, 1, 0), &C::paletteLightness);

        // LIK rendering
        add(checkbox(ParamKey::RenderLiks, "renderLiks", "Render LIKs", "LIK Rendering"),
            &C::renderLiks);
        add(slider(ParamKey::LikBaseSize, "likBaseSize", "LIK Base Size",
            "LIK Rendering", 1.0, 15.0, 0.1, 1), &C::likBaseSize);
        add(slider(ParamKey::MinLikRenderSize, "minLikRenderSize", "Min. Render Size",
            "LIK Rendering", 0.1, 5.0, 0.1, 1), &C::minLikRenderSize);
        add(slider(ParamKey::TrailAlpha, "trailAlpha", "Trail Alpha",
            "LIK Rendering", 0.0, 1.0, 0.01, 2), &C::trailAlpha);

        // RGB shift
        add(checkbox(ParamKey::RgbShiftLiks, "rgbShiftLiks", "RGB Shift on LIKs", "RGB Shift"),
            &C::rgbShiftLiks);
        add(checkbox(ParamKey::RgbShiftLines, "rgbShiftLines", "RGB Shift on Lines", "RGB Shift"),
            &C::rgbShiftLines);
        add(slider(ParamKey::RgbShiftAmount, "rgbShiftAmount", "Shift Amount (px)",
            "RGB Shift", 0.0, 15.0, 0.1, 1), &C::rgbShiftAmount);
        add(slider(ParamKey::RgbShiftAngleDeg, "rgbShiftAngleDeg", "Shift Angle (deg)",
            "RGB Shift", 0, 360, 1, 0), &C::rgbShiftAngleDeg);
        add(slider(ParamKey::RgbShiftJitter, "rgbShiftJitter", "Shift Jitter",
            "RGB Shift", 0.0, 1.0, 0.01, 2), &C::rgbShiftJitter);
        add(selectBox(ParamKey::RgbShiftMode, "rgbShiftMode", "Shift Mode", "RGB Shift", {
                { "add", "Additive" },
                { "subtract", "Subtractive" } }),
            &C::rgbShiftMode);

        // Auto loop. Its own knobs are never looped.
        add(checkbox(ParamKey::AutoLoopEnabled, "autoLoopEnabled", "Auto Loop Enabled", "Auto Loop"),
            &C::autoLoopEnabled);
        add(slider(ParamKey::AutoLoopSpeed, "autoLoopSpeed", "Loop Speed",
            "Auto Loop", 0.1, 5.0, 0.1, 1, false), &C::autoLoopSpeed);
        add(slider(ParamKey::AutoLoopLimes, "autoLoopLimes", "Loop Range (Limes)",
            "Auto Loop", 0.0, 0.5, 0.01, 2, false), &C::autoLoopLimes);
        add(slider(ParamKey::AutoLoopJitter, "autoLoopJitter", "Loop Jitter",
            "Auto Loop", 0.0, 0.5, 0.01, 2, false), &C::autoLoopJitter);

        if (t.defs.size() != kParamCount) {
            throw std::logic_error("ParameterRegistry: every ParamKey needs a definition");
        }
        return t;
    }

    const Table& table() {
        static const Table t = buildTable();
        return t;
    }

    const char* typeName(const ParamValue& v) {
        switch (v.index()) {
        case 0: return "number";
        case 1: return "bool";
        default: return "string";
        }
    }

} // anonymous namespace


// ============================================================================
//  Static metadata
// ============================================================================

ParameterRegistry::ParameterRegistry(SimulationConfig& cfg)
    : cfg(cfg)
{
}

const std::vector<ParameterDefinition>& ParameterRegistry::definitions() {
    return table().defs;
}

const ParameterDefinition& ParameterRegistry::definition(ParamKey key) {
    const Table& t = table();
    size_t k = static_cast<size_t>(key);
    if (k >= kParamCount) {
        throw std::invalid_argument("ParameterRegistry: key out of range");
    }
    return t.defs[t.index[k]];
}

ParamKey ParameterRegistry::keyFromName(const std::string& name) {
    const Table& t = table();
    auto it = t.byName.find(name);
    if (it == t.byName.end()) {
        throw std::invalid_argument("ParameterRegistry: unknown parameter '" + name + "'");
    }
    return it->second;
}

const std::string& ParameterRegistry::keyName(ParamKey key) {
    return definition(key).name;
}

std::vector<std::string> ParameterRegistry::sections() {
    std::vector<std::string> out;
    for (const auto& d : definitions()) {
        if (std::find(out.begin(), out.end(), d.section) == out.end()) {
            out.push_back(d.section);
        }
    }
    return out;
}

std::vector<ParamKey> ParameterRegistry::loopableKeys() {
    std::vector<ParamKey> out;
    for (const auto& d : definitions()) {
        if (d.loopable) out.push_back(d.key);
    }
    return out;
}

// ============================================================================
//  Coercion
// ============================================================================

ParamValue ParameterRegistry::normalized(const ParameterDefinition& def, const ParamValue& value) {
    switch (def.type) {
    case ControlType::CHECKBOX: {
        if (auto b = std::get_if<bool>(&value)) return *b;
        if (auto d = std::get_if<double>(&value)) return *d != 0.0;
        break;
    }
    case ControlType::SELECT: {
        auto s = std::get_if<std::string>(&value);
        if (!s) break;
        for (const auto& opt : def.options) {
            if (opt.value == *s) return *s;
        }
        // Unknown option: fall back to the first declared one.
        return def.options.empty() ? *s : def.options.front().value;
    }
    case ControlType::COLOR: {
        auto s = std::get_if<std::string>(&value);
        if (!s) break;
        if (!ColorMath::isValidHexColor(*s)) {
            throw std::invalid_argument("ParameterRegistry: '" + def.name
                + "' expects a hex color, got '" + *s + "'");
        }
        return *s;
    }
    case ControlType::SLIDER:
    case ControlType::HIDDEN: {
        auto d = std::get_if<double>(&value);
        if (!d) break;
        double numeric = std::isfinite(*d) ? *d : def.minimum;
        numeric = std::clamp(numeric, def.minimum, def.maximum);
        if (def.step > 0.0) {
            // Snap to the slider grid, anchored at the minimum.
            double steps = std::round((numeric - def.minimum) / def.step);
            numeric = std::clamp(def.minimum + steps * def.step, def.minimum, def.maximum);
        }
        return numeric;
    }
    }

    throw std::invalid_argument("ParameterRegistry: '" + def.name
        + "' cannot take a " + typeName(value) + " value");
}

// ============================================================================
//  Access
// ============================================================================

ParamValue ParameterRegistry::get(ParamKey key) const {
    definition(key);  // range check
    const FieldPtr& field = table().fields[static_cast<size_t>(key)];
    return std::visit([this](auto member) -> ParamValue {
        return cfg.*member;
    }, field);
}

double ParameterRegistry::getNumber(ParamKey key) const {
    ParamValue v = get(key);
    if (auto d = std::get_if<double>(&v)) return *d;
    throw std::invalid_argument("ParameterRegistry: '" + keyName(key) + "' is not numeric");
}

bool ParameterRegistry::getBool(ParamKey key) const {
    ParamValue v = get(key);
    if (auto b = std::get_if<bool>(&v)) return *b;
    throw std::invalid_argument("ParameterRegistry: '" + keyName(key) + "' is not a flag");
}

std::string ParameterRegistry::getString(ParamKey key) const {
    ParamValue v = get(key);
    if (auto s = std::get_if<std::string>(&v)) return *s;
    throw std::invalid_argument("ParameterRegistry: '" + keyName(key) + "' is not a string");
}

void ParameterRegistry::set(ParamKey key, const ParamValue& value) {
    const ParameterDefinition& def = definition(key);
    ParamValue coerced = normalized(def, value);
    const FieldPtr& field = table().fields[static_cast<size_t>(key)];

    std::visit([this, &coerced](auto member) {
        using Field = std::decay_t<decltype(cfg.*member)>;
        cfg.*member = std::get<Field>(coerced);
    }, field);
}
