#pragma once

// ============================================================================
// InkSettings - Live-tunable capture and width configuration
// ============================================================================
// All values can be changed while strokes are being captured; the engine
// reads them on every sample. Persisted through QSettings under "ink/".
// ============================================================================

#include <QtGlobal>
#include <optional>

class QSettings;

/**
 * @brief Partial update for the smoothing configuration.
 *
 * Unset fields are left untouched. Mirrors the tuning panel, which sends
 * only the sliders the user moved.
 */
struct SmoothingUpdate {
    std::optional<qreal> spacingFactor;
    std::optional<qreal> speedLow;
    std::optional<qreal> speedHigh;
    std::optional<qreal> minSmooth;
    std::optional<qreal> maxSmooth;
    std::optional<qreal> minWidthScale;
    std::optional<qreal> maxWidthScale;
    std::optional<qreal> curvatureBoost;
};

/**
 * @brief Capture, smoothing and width parameters.
 */
struct InkSettings {
    // ----- Smoothing -----
    bool smoothingEnabled = true;
    qreal resampleSpacing = 0.2;    ///< Emission spacing as a fraction of the base width
    qreal minSmoothing = 0.12;      ///< Filter alpha for slow motion
    qreal maxSmoothing = 0.55;      ///< Filter alpha for fast motion
    qreal speedLow = 0.2;           ///< Speed (units/ms) where alpha starts rising
    qreal speedHigh = 1.6;          ///< Speed where alpha reaches maxSmoothing
    qreal curvatureBoost = 0.5;     ///< How strongly sharp turns reduce smoothing
    qreal velocitySmoothing = 0.45; ///< Blend factor for the velocity estimate

    // ----- Width -----
    qreal minWidthScale = 0.45;
    qreal maxWidthScale = 1.35;
    qreal speedInfluence = 0.02;    ///< Higher = thinner when faster
    qreal headTaperFactor = 2.4;
    qreal tailTaperFactor = 2.8;

    // ----- Geometry -----
    bool angleCulling = false;      ///< Cull redundant nodes when a stroke is sealed

    /// Strokes reaching this many points are sealed (0 = unlimited)
    int maxPointsPerStroke = 100000;

    /**
     * @brief Apply a partial smoothing update with range clamping.
     *
     * spacingFactor also derives minSmoothing/maxSmoothing; explicit
     * minSmooth/maxSmooth in the same update override the derived values.
     */
    void applySmoothing(const SmoothingUpdate& update);

    /**
     * @brief Load values from settings, keeping defaults for missing keys.
     */
    void load(QSettings& settings);

    /**
     * @brief Write all values to settings.
     */
    void save(QSettings& settings) const;

    /**
     * @brief Load from the application settings store ("InkBoard", "App").
     */
    static InkSettings fromAppSettings();
};
