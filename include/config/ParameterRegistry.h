#pragma once
#include <string>
#include <variant>
#include <vector>

#include "config/SimulationConfig.h"

// =============================================================================
// ParameterRegistry - keyed view onto SimulationConfig
//
// The engine reads SimulationConfig fields directly. The control panel and
// the auto-loop need late binding ("set parameter X to value V"), so every
// user-facing field is registered here with its metadata and a typed
// pointer-to-member. set() coerces values into the declared domain before
// they ever reach the engine.
// =============================================================================

enum class ParamKey {
    BackgroundColor,
    CompositeOperation,

    MaxLikCount,
    MinLikCount,
    MaxLikLifespan,
    UniverseRadius,

    AttractionStrength,
    AttractionSimilarityThreshold,
    RepulsionStrength,
    BaseMigrationSpeed,
    PersonalSpaceRadius,
    PersonalSpaceRepulsion,

    GlobalDriftStrength,
    GlobalDriftMomentum,
    AnimationSpeed,
    CameraMovementSpeed,

    LineDrawSampleCount,
    ResonanceThickness,
    MaxLineThicknessChaos,
    ResonanceAlpha,
    MaxResonanceDist,
    ResonanceThreshold,

    CurveWiggleFactor,
    PulsationSpeed,
    LineTargetPull,

    PaletteSaturation,
    PaletteLightness,

    RenderLiks,
    LikBaseSize,
    MinLikRenderSize,
    TrailAlpha,

    RgbShiftLiks,
    RgbShiftLines,
    RgbShiftAmount,
    RgbShiftAngleDeg,
    RgbShiftJitter,
    RgbShiftMode,

    AutoLoopEnabled,
    AutoLoopSpeed,
    AutoLoopLimes,
    AutoLoopJitter,

    COUNT
};

enum class ControlType {
    SLIDER,
    CHECKBOX,
    SELECT,
    COLOR,
    HIDDEN      // numeric, but not shown in the panel
};

using ParamValue = std::variant<double, bool, std::string>;

struct ParameterOption {
    std::string value;
    std::string label;
};

struct ParameterDefinition {
    ParamKey key;
    std::string name;       // stable identifier, e.g. "maxLikCount"
    std::string label;      // panel label
    std::string section;    // panel group
    ControlType type;

    double minimum = 0.0;
    double maximum = 0.0;
    double step = 0.0;
    int precision = 2;

    std::vector<ParameterOption> options;
    bool loopable = false;

    bool isNumeric() const {
        return type == ControlType::SLIDER || type == ControlType::HIDDEN;
    }
};

class ParameterRegistry {
public:
    explicit ParameterRegistry(SimulationConfig& cfg);

    // All definitions, in panel order.
    static const std::vector<ParameterDefinition>& definitions();
    static const ParameterDefinition& definition(ParamKey key);

    // Name <-> key. keyFromName throws std::invalid_argument on unknown names.
    static ParamKey keyFromName(const std::string& name);
    static const std::string& keyName(ParamKey key);

    // Section names in first-appearance order.
    static std::vector<std::string> sections();
    static std::vector<ParamKey> loopableKeys();

    ParamValue get(ParamKey key) const;
    double getNumber(ParamKey key) const;
    bool getBool(ParamKey key) const;
    std::string getString(ParamKey key) const;

    // Coerce and write. Throws std::invalid_argument if the value type
    // cannot represent the parameter (e.g. a string for a slider).
    void set(ParamKey key, const ParamValue& value);
    void set(const std::string& name, const ParamValue& value) {
        set(keyFromName(name), value);
    }

    // Coercion without writing.
    static ParamValue normalized(const ParameterDefinition& def, const ParamValue& value);

    SimulationConfig& getConfig() { return cfg; }
    const SimulationConfig& getConfig() const { return cfg; }

private:
    SimulationConfig& cfg;
};
