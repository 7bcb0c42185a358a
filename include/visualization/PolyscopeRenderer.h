#pragma once
#include <deque>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "polyscope/polyscope.h"
#include "polyscope/point_cloud.h"
#include "polyscope/curve_network.h"

#include "core/Simulation.h"


class PolyscopeRenderer {
public:
    PolyscopeRenderer(Simulation* sim);
    PolyscopeRenderer() = default;

    // Build all polyscope structures
    void initialize();

    // Block until window closes
    void renderLoop();

    // Rebuild visuals after Simulation restart
    void rebuildAllVisuals();

private:
    Simulation* sim = nullptr;

    polyscope::PointCloud* cloud = nullptr;
    polyscope::CurveNetwork* resonanceNet = nullptr;

    size_t cloudSize = 0;
    bool showResonance = true;

    // Background as last pushed to polyscope, and its per-frame fill opacity
    glm::vec3 background{ 0.0f };
    double trailAlpha = 1.0;

    struct TrailFrame {
        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> colors;
    };
    std::deque<TrailFrame> trailHistory;
    static constexpr size_t kTrailDepth = 6;
    static constexpr double kMinTrailFade = 0.02;

    // === Internal updates ===
    void drawUI();
    void drawParameterSection(const std::string& section);
    void updateLiks();
    void updateTrail(const std::vector<glm::vec3>& positions, const std::vector<glm::vec3>& colors);
    glm::vec3 fringeOffset(double jitterRate) const;
    void updateResonanceLines();
    void updateBackground();
};
