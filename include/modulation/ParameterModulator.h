#pragma once
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "config/ParameterRegistry.h"

// Continuous numeric parameter: position bounces between the inset bounds.
struct RangeState {
    double uiMinimum = 0.0;
    double uiMaximum = 0.0;
    double minimum = 0.0;      // inset bounds
    double maximum = 0.0;
    double position = 0.0;
    double direction = 1.0;    // +1 or -1
};

// Enumerated parameter: switches option every interval frames.
struct ChoiceState {
    std::vector<std::string> options;
    int lastSwitchFrame = 0;
};

struct ModulatorEntry {
    ParamKey key;
    double speedMultiplier = 1.0;     // uniform [0.5, 2.0] at creation
    std::variant<RangeState, ChoiceState> state;

    bool isChoice() const { return std::holds_alternative<ChoiceState>(state); }
};

// =============================================================================
// ParameterModulator - the auto-loop
//
// Every enabled parameter owns one entry. update() advances all of them and
// writes through ParameterRegistry::set, so values are coerced to the
// declared bounds like any panel edit. The global autoLoopEnabled flag pauses
// everything without touching entry state.
// =============================================================================
class ParameterModulator {
public:
    explicit ParameterModulator(ParameterRegistry& registry);

    // Create an entry with fresh phase and speed multiplier. Range entries
    // write their starting position immediately; Choice entries keep the
    // current value until their first switch. No-op if already enabled.
    // Throws std::invalid_argument for parameters that are not loopable.
    void enable(ParamKey key, int frame);
    // Remove the entry; the parameter keeps its last written value.
    void disable(ParamKey key);
    // Returns the new enabled state.
    bool toggle(ParamKey key, int frame);
    void disableAll();

    bool isEnabled(ParamKey key) const;
    std::vector<ParamKey> enabledKeys() const;
    const ModulatorEntry* entry(ParamKey key) const;

    // Override the random speed multiplier of an enabled entry.
    void setSpeedMultiplier(ParamKey key, double multiplier);

    // Re-create every enabled entry with new phase and multiplier.
    void randomizeTargets(int frame);

    void update(double dt, int frame);

    // max(10, 120 / (baseSpeed * multiplier)) frames
    static double choiceInterval(double baseSpeed, double multiplier);

    // Inset [min + span*limes, max - span*limes], tightened to the nearest
    // step-grid points inside it when step > 0; the full range if the inset
    // collapses.
    static RangeState insetRange(double uiMinimum, double uiMaximum, double limes,
        double step = 0.0);

private:
    ParameterRegistry& registry;
    std::map<ParamKey, ModulatorEntry> entries;

    ModulatorEntry createEntry(const ParameterDefinition& def, int frame) const;
    void updateRange(ModulatorEntry& entry, RangeState& range, double dt);
    void updateChoice(ModulatorEntry& entry, ChoiceState& choice, int frame);
};
