#include "modulation/ParameterModulator.h"
#include "core/RNG.h"
#include "util/Logger.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

ParameterModulator::ParameterModulator(ParameterRegistry& registry)
    : registry(registry)
{
}

double ParameterModulator::choiceInterval(double baseSpeed, double multiplier) {
    return std::max(10.0, 120.0 / (baseSpeed * multiplier));
}

RangeState ParameterModulator::insetRange(double uiMinimum, double uiMaximum, double limes, double step) {
    RangeState r;
    r.uiMinimum = uiMinimum;
    r.uiMaximum = uiMaximum;

    double span = uiMaximum - uiMinimum;
    r.minimum = uiMinimum + span * limes;
    r.maximum = uiMaximum - span * limes;

    // Pull the bounds inward onto the slider grid, so the registry's step
    // snap can never round a written value past them.
    if (step > 0.0 && r.maximum > r.minimum) {
        const double tol = 1e-9;
        double lo = uiMinimum + std::ceil((r.minimum - uiMinimum) / step - tol) * step;
        double hi = uiMinimum + std::floor((r.maximum - uiMinimum) / step + tol) * step;
        if (hi > lo) {
            r.minimum = lo;
            r.maximum = hi;
        }
    }

    if (r.maximum <= r.minimum) {
        r.minimum = uiMinimum;
        r.maximum = uiMaximum;
    }
    r.position = r.minimum;
    return r;
}

//
// ================================
//        ENTRY LIFECYCLE
// ================================
//
ModulatorEntry ParameterModulator::createEntry(const ParameterDefinition& def, int frame) const {
    ModulatorEntry e{ def.key };
    e.speedMultiplier = uniformReal(0.5, 2.0);

    if (def.type == ControlType::SELECT) {
        ChoiceState c;
        for (const auto& opt : def.options) {
            c.options.push_back(opt.value);
        }
        c.lastSwitchFrame = frame;
        e.state = c;
        return e;
    }

    const SimulationConfig& cfg = registry.getConfig();
    RangeState r = insetRange(def.minimum, def.maximum, cfg.autoLoopLimes, def.step);
    if (r.maximum > r.minimum) {
        r.position = uniformReal(r.minimum, r.maximum);
    }
    r.direction = (uniformReal(0.0, 1.0) < 0.5) ? 1.0 : -1.0;
    e.state = r;
    return e;
}

void ParameterModulator::enable(ParamKey key, int frame) {
    const ParameterDefinition& def = ParameterRegistry::definition(key);
    if (!def.loopable) {
        throw std::invalid_argument("ParameterModulator: '" + def.name + "' cannot be looped");
    }
    if (entries.count(key)) return;

    ModulatorEntry e = createEntry(def, frame);
    if (auto r = std::get_if<RangeState>(&e.state)) {
        registry.set(key, r->position);
    }
    entries.emplace(key, std::move(e));

    Log::modulator("[AUTOLOOP] enabled ", def.name, "\n");
}

void ParameterModulator::disable(ParamKey key) {
    if (entries.erase(key)) {
        Log::modulator("[AUTOLOOP] disabled ", ParameterRegistry::keyName(key), "\n");
    }
}

bool ParameterModulator::toggle(ParamKey key, int frame) {
    if (isEnabled(key)) {
        disable(key);
        return false;
    }
    enable(key, frame);
    return true;
}

void ParameterModulator::disableAll() {
    entries.clear();
}

bool ParameterModulator::isEnabled(ParamKey key) const {
    return entries.count(key) != 0;
}

std::vector<ParamKey> ParameterModulator::enabledKeys() const {
    std::vector<ParamKey> out;
    out.reserve(entries.size());
    for (const auto& [key, e] : entries) {
        out.push_back(key);
    }
    return out;
}

const ModulatorEntry* ParameterModulator::entry(ParamKey key) const {
    auto it = entries.find(key);
    return (it == entries.end()) ? nullptr : &it->second;
}

void ParameterModulator::setSpeedMultiplier(ParamKey key, double multiplier) {
    auto it = entries.find(key);
    if (it == entries.end()) {
        throw std::invalid_argument("ParameterModulator: '"
            + ParameterRegistry::keyName(key) + "' is not enabled");
    }
    it->second.speedMultiplier = multiplier;
}

void ParameterModulator::randomizeTargets(int frame) {
    for (auto& [key, e] : entries) {
        e = createEntry(ParameterRegistry::definition(key), frame);
    }
    Log::modulator("[AUTOLOOP] randomized ", entries.size(), " loop targets\n");
}

//
// ================================
//          PER-STEP UPDATE
// ================================
//
void ParameterModulator::update(double dt, int frame) {
    if (!registry.getConfig().autoLoopEnabled) return;

    for (auto& [key, e] : entries) {
        if (auto r = std::get_if<RangeState>(&e.state)) {
            updateRange(e, *r, dt);
        }
        else if (auto c = std::get_if<ChoiceState>(&e.state)) {
            updateChoice(e, *c, frame);
        }
    }
}

void ParameterModulator::updateRange(ModulatorEntry& e, RangeState& r, double dt) {
    const SimulationConfig& cfg = registry.getConfig();
    const double span = r.uiMaximum - r.uiMinimum;

    // Zero-width range: nothing to animate.
    if (span <= 0.0 || r.maximum <= r.minimum) {
        registry.set(e.key, r.position);
        return;
    }

    r.position += r.direction * cfg.autoLoopSpeed * e.speedMultiplier * dt;

    // Reflect off the inset bounds
    if (r.position > r.maximum) {
        r.position = r.maximum;
        r.direction = -1.0;
    }
    else if (r.position < r.minimum) {
        r.position = r.minimum;
        r.direction = 1.0;
    }

    double value = r.position + uniformReal(-0.5, 0.5) * span * cfg.autoLoopJitter;
    value = std::clamp(value, r.minimum, r.maximum);
    registry.set(e.key, value);
}

void ParameterModulator::updateChoice(ModulatorEntry& e, ChoiceState& c, int frame) {
    if (c.options.empty()) return;

    const double speed = registry.getConfig().autoLoopSpeed;
    if (speed * e.speedMultiplier <= 0.0) return;

    if (frame - c.lastSwitchFrame <= choiceInterval(speed, e.speedMultiplier)) {
        return;
    }

    std::uniform_int_distribution<size_t> pick(0, c.options.size() - 1);
    const std::string current = registry.getString(e.key);

    std::string next = c.options[pick(GLOBAL_RNG)];
    while (c.options.size() > 1 && next == current) {
        next = c.options[pick(GLOBAL_RNG)];
    }

    registry.set(e.key, next);
    c.lastSwitchFrame = frame;

    Log::modulator("[AUTOLOOP] frame ", frame, ": ",
        ParameterRegistry::keyName(e.key), " -> ", next, "\n");
}
