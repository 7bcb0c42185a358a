#include "polyscope/polyscope.h"
#include "polyscope/view.h"
#include "polyscope/curve_network.h"
#include "polyscope/point_cloud.h"

#include "visualization/PolyscopeRenderer.h"
#include "visualization/RenderEffects.h"
#include "color/ColorMath.h"
#include "core/RNG.h"
#include "util/Logger.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

// ============================================================================
//  Local helpers (kept CPP-only)
// ============================================================================

namespace {

    glm::vec3 toRender(const Vec3& p) {
        return glm::vec3(static_cast<float>(p.x), static_cast<float>(p.y), static_cast<float>(p.z));
    }

    std::string toHex(const float rgb[3]) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
            static_cast<int>(std::round(std::clamp(rgb[0], 0.0f, 1.0f) * 255.0f)),
            static_cast<int>(std::round(std::clamp(rgb[1], 0.0f, 1.0f) * 255.0f)),
            static_cast<int>(std::round(std::clamp(rgb[2], 0.0f, 1.0f) * 255.0f)));
        return buf;
    }

    const char* backendNames[] = { "Scalar", "Batched (threaded)" };

} // anonymous namespace


// ============================================================================
//  PolyscopeRenderer implementation
// ============================================================================

PolyscopeRenderer::PolyscopeRenderer(Simulation* sim)
    : sim(sim) {
}

void PolyscopeRenderer::initialize() {
    polyscope::init();
    polyscope::options::buildGui = false;

    polyscope::options::groundPlaneMode = polyscope::GroundPlaneMode::None;

    updateBackground();
    rebuildAllVisuals();

    // Main loop callback
    polyscope::state::userCallback = [this]() {
        auto& config = sim->getConfig();

        // Step the simulation
        double dt = (1.0 / config.frameRate) * config.animationSpeed;
        sim->step(dt);

        // Update visuals
        updateBackground();
        updateLiks();
        updateResonanceLines();

        // UI
        drawUI();
        };
}

void PolyscopeRenderer::renderLoop() {
    polyscope::show();
}

// ============================================================================
//   UI Panel - generated from the parameter registry
// ============================================================================

void PolyscopeRenderer::drawUI() {

    auto& config = sim->getConfig();
    auto& modulator = sim->getModulator();

    ImGui::Begin("LIK Swarm");

    // ------------------------------------------------------------------------
    // STATUS DISPLAY - Always visible
    // ------------------------------------------------------------------------
    ImGui::SeparatorText("Status");

    ImGui::Text("Frame: %d", sim->getFrame());
    ImGui::SameLine(150);
    ImGui::Text("LIKs: %d", (int)sim->getLiks().size());
    ImGui::SameLine(260);
    ImGui::Text("Lines: %d", (int)sim->getResonancePairs().size());

    if (sim->isPaused()) {
        ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.2f, 1.0f), "PAUSED");
    } else {
        ImGui::TextColored(ImVec4(0.2f, 1.0f, 0.2f, 1.0f), "RUNNING");
    }
    ImGui::SameLine();
    ImGui::Text("Auto loop: %d parameters", (int)modulator.enabledKeys().size());

    // ------------------------------------------------------------------------
    // QUICK ACTIONS
    // ------------------------------------------------------------------------
    if (ImGui::Button(sim->isPaused() ? "Resume" : "Pause", ImVec2(100, 0))) {
        sim->togglePause();
    }
    ImGui::SameLine();
    if (ImGui::Button("Randomize All", ImVec2(120, 0))) {
        sim->randomizeAll();
    }
    ImGui::SameLine();
    ImGui::Checkbox("Resonance Lines", &showResonance);

    // ------------------------------------------------------------------------
    // PARAMETER SECTIONS
    // ------------------------------------------------------------------------
    for (const auto& section : ParameterRegistry::sections()) {
        if (ImGui::CollapsingHeader(section.c_str())) {
            ImGui::PushID(section.c_str());
            drawParameterSection(section);

            if (section == "Auto Loop") {
                if (ImGui::Button("Randomize Loop Targets")) {
                    modulator.randomizeTargets(sim->getFrame());
                }
                ImGui::SameLine();
                if (ImGui::Button("Stop All Loops")) {
                    modulator.disableAll();
                }
            }
            ImGui::PopID();
        }
    }

    // ------------------------------------------------------------------------
    // CONSOLE LOGGING
    // ------------------------------------------------------------------------
    if (ImGui::CollapsingHeader("Console Logging")) {
        ImGui::Checkbox("Enable Logging", &Log::enabled);
        if (Log::enabled) {
            ImGui::Checkbox("Population", &Log::showPopulation);
            ImGui::SameLine();
            ImGui::Checkbox("Auto Loop", &Log::showModulator);
            ImGui::Checkbox("Resonance", &Log::showResonance);
            ImGui::SameLine();
            ImGui::Checkbox("Physics", &Log::showPhysics);
        }
    }

    // ------------------------------------------------------------------------
    // SIMULATION CONTROL
    // ------------------------------------------------------------------------
    if (ImGui::CollapsingHeader("Simulation")) {
        int backend = static_cast<int>(config.integratorBackend);
        if (ImGui::Combo("Integrator", &backend, backendNames, IM_ARRAYSIZE(backendNames))) {
            config.integratorBackend = static_cast<IntegratorBackend>(backend);
        }
        if (config.integratorBackend == IntegratorBackend::BATCHED) {
            ImGui::SliderInt("Workers", &config.integratorWorkers, 1, 16);
        }

        int seed = static_cast<int>(config.seed);
        if (ImGui::InputInt("Seed", &seed) && seed >= 0) {
            config.seed = static_cast<uint64_t>(seed);
        }

        if (ImGui::Button("Restart Simulation")) {
            reseedRNG(config.seed);
            sim->reset();
            rebuildAllVisuals();
        }
    }

    ImGui::End();
}

void PolyscopeRenderer::drawParameterSection(const std::string& section) {
    auto& registry = sim->getRegistry();
    auto& modulator = sim->getModulator();

    for (const auto& def : ParameterRegistry::definitions()) {
        if (def.section != section || def.type == ControlType::HIDDEN) continue;

        ImGui::PushID(def.name.c_str());

        if (def.loopable) {
            bool looping = modulator.isEnabled(def.key);
            if (ImGui::Checkbox("##loop", &looping)) {
                modulator.toggle(def.key, sim->getFrame());
            }
            if (ImGui::IsItemHovered()) {
                ImGui::SetTooltip("Auto loop");
            }
            ImGui::SameLine();
        }

        switch (def.type) {
        case ControlType::SLIDER: {
            float v = static_cast<float>(registry.getNumber(def.key));
            std::string fmt = "%." + std::to_string(def.precision) + "f";
            if (ImGui::SliderFloat(def.label.c_str(), &v,
                static_cast<float>(def.minimum), static_cast<float>(def.maximum), fmt.c_str())) {
                registry.set(def.key, static_cast<double>(v));
            }
            break;
        }
        case ControlType::CHECKBOX: {
            bool v = registry.getBool(def.key);
            if (ImGui::Checkbox(def.label.c_str(), &v)) {
                registry.set(def.key, v);
            }
            break;
        }
        case ControlType::SELECT: {
            std::string current = registry.getString(def.key);
            std::string preview = current;
            for (const auto& opt : def.options) {
                if (opt.value == current) preview = opt.label;
            }
            if (ImGui::BeginCombo(def.label.c_str(), preview.c_str())) {
                for (const auto& opt : def.options) {
                    bool selected = (opt.value == current);
                    if (ImGui::Selectable(opt.label.c_str(), selected)) {
                        registry.set(def.key, opt.value);
                    }
                }
                ImGui::EndCombo();
            }
            break;
        }
        case ControlType::COLOR: {
            glm::vec3 c = ColorMath::rgbToFloat(ColorMath::hexToRgb(registry.getString(def.key)));
            float rgb[3] = { c.x, c.y, c.z };
            if (ImGui::ColorEdit3(def.label.c_str(), rgb)) {
                registry.set(def.key, toHex(rgb));
            }
            break;
        }
        case ControlType::HIDDEN:
            break;
        }

        ImGui::PopID();
    }
}

// ============================================================================
//   POSITION + COLOR UPDATES
// ============================================================================

void PolyscopeRenderer::updateBackground() {
    BackgroundRgba bg = sim->backgroundRgba();
    background = ColorMath::rgbToFloat(bg.rgb);
    trailAlpha = bg.alpha;
    polyscope::view::bgColor = { background.x, background.y, background.z, 1.0f };
    polyscope::view::moveScale = sim->getConfig().cameraMovementSpeed / 5.0;
}

glm::vec3 PolyscopeRenderer::fringeOffset(double jitterRate) const {
    const auto& config = sim->getConfig();
    double jitter = RenderEffects::shiftJitter(config.rgbShiftJitter, sim->getFrame(), jitterRate);
    glm::dvec2 off = RenderEffects::rgbShiftOffset(config.rgbShiftAmount, config.rgbShiftAngleDeg, jitter);

    // Screen-plane offset: one slider pixel is a thousandth of the scene scale
    glm::vec3 look, up, right;
    polyscope::view::getCameraFrame(look, up, right);
    float px = polyscope::state::lengthScale * 0.001f;
    return (right * static_cast<float>(off.x) + up * static_cast<float>(off.y)) * px;
}

void PolyscopeRenderer::updateLiks() {
    const auto& config = sim->getConfig();
    const auto& liks = sim->getLiks();
    const int frame = sim->getFrame();

    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> colors;
    std::vector<double> sizes;
    positions.reserve(liks.size());
    colors.reserve(liks.size());
    sizes.reserve(liks.size());

    for (const auto& l : liks) {
        positions.push_back(toRender(l.getPosition()));
        colors.push_back(ColorMath::rgbToFloat(l.getRgb()));
        sizes.push_back(l.sizeHint(frame, config.likBaseSize, config.minLikRenderSize));
    }

    const bool shift = config.renderLiks && config.rgbShiftLiks && config.rgbShiftAmount > 0.0;
    const auto layers = RenderEffects::shiftLayers(config.rgbShiftMode);

    // The unshifted cloud carries the center layer while the fringes are on
    glm::vec3 centerMask(1.0f);
    if (shift) {
        for (const auto& layer : layers) {
            if (layer.sign == 0.0) centerMask = layer.mask;
        }
    }

    std::vector<glm::vec3> drawn(colors.size());
    for (size_t i = 0; i < colors.size(); i++) {
        drawn[i] = RenderEffects::compositeColor(colors[i] * centerMask, background, config.compositeOperation);
    }

    // Point count changes with the population; polyscope needs a re-register.
    if (cloud == nullptr || cloudSize != positions.size()) {
        if (cloud) polyscope::removePointCloud("liks");
        cloud = polyscope::registerPointCloud("liks", positions);
        cloud->setPointRadius(0.002);
        cloudSize = positions.size();
    }
    else {
        cloud->updatePointPositions(positions);
    }

    cloud->addColorQuantity("color", drawn)->setEnabled(true);
    if (!sizes.empty()) {
        cloud->addScalarQuantity("size", sizes);
        cloud->setPointRadiusQuantity("size");
    }
    cloud->setEnabled(config.renderLiks);

    // RGB fringes: one ghost cloud per shifted layer
    for (size_t k = 0; k < layers.size(); k++) {
        std::string name = "liks_fringe_" + std::to_string(k);
        polyscope::removePointCloud(name, false);
        if (!shift || layers[k].sign == 0.0 || positions.empty()) continue;

        glm::vec3 offset = fringeOffset(0.05) * static_cast<float>(layers[k].sign);
        std::vector<glm::vec3> ghostPos(positions.size());
        std::vector<glm::vec3> ghostColor(colors.size());
        for (size_t i = 0; i < positions.size(); i++) {
            ghostPos[i] = positions[i] + offset;
            ghostColor[i] = RenderEffects::compositeColor(colors[i] * layers[k].mask, background,
                                                          config.compositeOperation);
        }

        auto* ghost = polyscope::registerPointCloud(name, ghostPos);
        ghost->setPointRadius(0.002);
        ghost->addColorQuantity("color", ghostColor)->setEnabled(true);
        ghost->addScalarQuantity("size", sizes);
        ghost->setPointRadiusQuantity("size");
    }

    updateTrail(positions, drawn);
}

// Earlier frames stay visible until the background fill has covered them.
void PolyscopeRenderer::updateTrail(const std::vector<glm::vec3>& positions,
                                    const std::vector<glm::vec3>& colors) {
    polyscope::removePointCloud("trail", false);

    std::vector<glm::vec3> trailPos;
    std::vector<glm::vec3> trailColor;

    if (sim->getConfig().renderLiks) {
        for (size_t age = 1; age <= trailHistory.size(); age++) {
            double fade = RenderEffects::trailFade(trailAlpha, static_cast<int>(age));
            if (fade < kMinTrailFade) break;

            const TrailFrame& past = trailHistory[trailHistory.size() - age];
            for (size_t i = 0; i < past.positions.size(); i++) {
                trailPos.push_back(past.positions[i]);
                trailColor.push_back(glm::mix(background, past.colors[i], static_cast<float>(fade)));
            }
        }
    }

    if (!trailPos.empty()) {
        auto* trail = polyscope::registerPointCloud("trail", trailPos);
        trail->setPointRadius(0.0015);
        trail->addColorQuantity("color", trailColor)->setEnabled(true);
    }

    if (!sim->isPaused()) {
        trailHistory.push_back(TrailFrame{ positions, colors });
        while (trailHistory.size() > kTrailDepth) trailHistory.pop_front();
    }
}

// ============================================================================
//   RESONANCE LINE VISUALIZATION
// ============================================================================

void PolyscopeRenderer::updateResonanceLines() {
    const auto& config = sim->getConfig();
    const auto& pairs = sim->getResonancePairs();
    const auto& liks = sim->getLiks();
    const int frame = sim->getFrame();

    if (resonanceNet) {
        polyscope::removeCurveNetwork("resonance");
        resonanceNet = nullptr;
    }
    polyscope::removeCurveNetwork("resonance_fringe", false);

    if (!showResonance || pairs.empty()) {
        return;
    }

    const int samples = std::max(1, static_cast<int>(std::lround(config.lineDrawSampleCount)));
    const glm::vec3 eye = polyscope::view::getCameraWorldPosition();
    const Vec3 target(eye.x, eye.y, eye.z);

    std::vector<glm::vec3> pts;
    std::vector<std::array<size_t, 2>> edges;
    std::vector<glm::vec3> edgeColors;

    for (const auto& p : pairs) {
        if (p.aIndex >= liks.size() || p.bIndex >= liks.size()) continue;

        const Lik& a = liks[p.aIndex];
        const Lik& b = liks[p.bIndex];

        // Blend of the endpoint colors, faded by similarity
        float fade = static_cast<float>(std::clamp(config.resonanceAlpha * p.similarity * 4.0, 0.0, 1.0));
        glm::vec3 c = 0.5f * (ColorMath::rgbToFloat(a.getRgb()) + ColorMath::rgbToFloat(b.getRgb())) * fade;

        std::vector<Vec3> curve = RenderEffects::sampleResonanceCurve(a.getPosition(), b.getPosition(),
            samples, config.curveWiggleFactor, config.lineTargetPull, target, frame);

        size_t base = pts.size();
        for (const auto& q : curve) pts.push_back(toRender(q));
        for (size_t k = 0; k + 1 < curve.size(); k++) {
            edges.push_back({ base + k, base + k + 1 });
            edgeColors.push_back(c);
        }
    }

    if (edges.empty()) return;

    // Pulsating thickness, renderer-side only
    double pulsation = std::sin(frame * config.pulsationSpeed) * config.maxLineThicknessChaos;
    double thickness = std::max(0.1, config.resonanceThickness + pulsation);

    const bool shift = config.rgbShiftLines && config.rgbShiftAmount > 0.0;
    const auto layers = RenderEffects::shiftLayers(config.rgbShiftMode);

    glm::vec3 centerMask(1.0f);
    if (shift) {
        for (const auto& layer : layers) {
            if (layer.sign == 0.0) centerMask = layer.mask;
        }
    }

    std::vector<glm::vec3> drawn(edgeColors.size());
    for (size_t i = 0; i < edgeColors.size(); i++) {
        drawn[i] = RenderEffects::compositeColor(edgeColors[i] * centerMask, background, config.compositeOperation);
    }

    resonanceNet = polyscope::registerCurveNetwork("resonance", pts, edges);
    resonanceNet->setRadius(0.0004 * thickness);
    resonanceNet->addEdgeColorQuantity("color", drawn)->setEnabled(true);

    if (!shift) return;

    // Both shifted layers share one network; copies are appended block-wise
    std::vector<glm::vec3> fringePts;
    std::vector<std::array<size_t, 2>> fringeEdges;
    std::vector<glm::vec3> fringeColors;
    const glm::vec3 offset = fringeOffset(0.1);

    for (const auto& layer : layers) {
        if (layer.sign == 0.0) continue;

        size_t base = fringePts.size();
        glm::vec3 d = offset * static_cast<float>(layer.sign);
        for (const auto& q : pts) fringePts.push_back(q + d);
        for (size_t e = 0; e < edges.size(); e++) {
            fringeEdges.push_back({ base + edges[e][0], base + edges[e][1] });
            fringeColors.push_back(RenderEffects::compositeColor(edgeColors[e] * layer.mask, background,
                                                                 config.compositeOperation));
        }
    }

    auto* fringe = polyscope::registerCurveNetwork("resonance_fringe", fringePts, fringeEdges);
    fringe->setRadius(0.0004 * thickness);
    fringe->addEdgeColorQuantity("color", fringeColors)->setEnabled(true);
}

// ============================================================================
//  Support for Simulation Restart
// ============================================================================

void PolyscopeRenderer::rebuildAllVisuals() {

    if (resonanceNet) {
        polyscope::removeCurveNetwork("resonance");
        resonanceNet = nullptr;
    }
    if (cloud) {
        polyscope::removePointCloud("liks");
        cloud = nullptr;
    }
    cloudSize = 0;
    trailHistory.clear();

    updateLiks();
    updateResonanceLines();
}
