#include "InkSettings.h"

#include <QSettings>

void InkSettings::applySmoothing(const SmoothingUpdate& update)
{
    if (update.spacingFactor) {
        const qreal f = *update.spacingFactor;
        resampleSpacing = qBound<qreal>(0.05, f, 0.8);
        minSmoothing = qBound<qreal>(0.05, f * 0.6, 0.4);
        maxSmoothing = qBound<qreal>(0.2, f * 2.5, 0.8);
    }
    if (update.speedLow) {
        speedLow = qMax<qreal>(0.01, *update.speedLow);
    }
    if (update.speedHigh) {
        speedHigh = qMax<qreal>(speedLow + 0.01, *update.speedHigh);
    }
    if (update.minSmooth) {
        minSmoothing = qBound<qreal>(0.02, *update.minSmooth, 0.8);
    }
    if (update.maxSmooth) {
        maxSmoothing = qMax<qreal>(minSmoothing, qMin<qreal>(0.95, *update.maxSmooth));
    }
    if (update.minWidthScale) {
        minWidthScale = qBound<qreal>(0.1, *update.minWidthScale, 1.5);
    }
    if (update.maxWidthScale) {
        maxWidthScale = qMax<qreal>(minWidthScale, qMin<qreal>(3.0, *update.maxWidthScale));
    }
    if (update.curvatureBoost) {
        curvatureBoost = qBound<qreal>(0.0, *update.curvatureBoost, 1.0);
    }

    // A lowered maxWidthScale can never undercut minWidthScale
    if (maxWidthScale < minWidthScale) {
        maxWidthScale = minWidthScale;
    }
    if (speedHigh <= speedLow) {
        speedHigh = speedLow + 0.01;
    }
}

void InkSettings::load(QSettings& settings)
{
    settings.beginGroup(QStringLiteral("ink"));

    smoothingEnabled = settings.value(QStringLiteral("smoothingEnabled"), smoothingEnabled).toBool();
    angleCulling = settings.value(QStringLiteral("angleCulling"), angleCulling).toBool();
    velocitySmoothing = settings.value(QStringLiteral("velocitySmoothing"), velocitySmoothing).toDouble();
    speedInfluence = settings.value(QStringLiteral("speedInfluence"), speedInfluence).toDouble();
    headTaperFactor = settings.value(QStringLiteral("headTaperFactor"), headTaperFactor).toDouble();
    tailTaperFactor = settings.value(QStringLiteral("tailTaperFactor"), tailTaperFactor).toDouble();
    maxPointsPerStroke = settings.value(QStringLiteral("maxPointsPerStroke"), maxPointsPerStroke).toInt();

    // Route the tunables through the clamping rules
    SmoothingUpdate update;
    if (settings.contains(QStringLiteral("resampleSpacing"))) {
        update.spacingFactor = settings.value(QStringLiteral("resampleSpacing")).toDouble();
    }
    if (settings.contains(QStringLiteral("speedLow"))) {
        update.speedLow = settings.value(QStringLiteral("speedLow")).toDouble();
    }
    if (settings.contains(QStringLiteral("speedHigh"))) {
        update.speedHigh = settings.value(QStringLiteral("speedHigh")).toDouble();
    }
    if (settings.contains(QStringLiteral("minSmoothing"))) {
        update.minSmooth = settings.value(QStringLiteral("minSmoothing")).toDouble();
    }
    if (settings.contains(QStringLiteral("maxSmoothing"))) {
        update.maxSmooth = settings.value(QStringLiteral("maxSmoothing")).toDouble();
    }
    if (settings.contains(QStringLiteral("minWidthScale"))) {
        update.minWidthScale = settings.value(QStringLiteral("minWidthScale")).toDouble();
    }
    if (settings.contains(QStringLiteral("maxWidthScale"))) {
        update.maxWidthScale = settings.value(QStringLiteral("maxWidthScale")).toDouble();
    }
    if (settings.contains(QStringLiteral("curvatureBoost"))) {
        update.curvatureBoost = settings.value(QStringLiteral("curvatureBoost")).toDouble();
    }
    applySmoothing(update);

    settings.endGroup();
}

void InkSettings::save(QSettings& settings) const
{
    settings.beginGroup(QStringLiteral("ink"));
    settings.setValue(QStringLiteral("smoothingEnabled"), smoothingEnabled);
    settings.setValue(QStringLiteral("angleCulling"), angleCulling);
    settings.setValue(QStringLiteral("resampleSpacing"), resampleSpacing);
    settings.setValue(QStringLiteral("minSmoothing"), minSmoothing);
    settings.setValue(QStringLiteral("maxSmoothing"), maxSmoothing);
    settings.setValue(QStringLiteral("speedLow"), speedLow);
    settings.setValue(QStringLiteral("speedHigh"), speedHigh);
    settings.setValue(QStringLiteral("curvatureBoost"), curvatureBoost);
    settings.setValue(QStringLiteral("velocitySmoothing"), velocitySmoothing);
    settings.setValue(QStringLiteral("minWidthScale"), minWidthScale);
    settings.setValue(QStringLiteral("maxWidthScale"), maxWidthScale);
    settings.setValue(QStringLiteral("speedInfluence"), speedInfluence);
    settings.setValue(QStringLiteral("headTaperFactor"), headTaperFactor);
    settings.setValue(QStringLiteral("tailTaperFactor"), tailTaperFactor);
    settings.setValue(QStringLiteral("maxPointsPerStroke"), maxPointsPerStroke);
    settings.endGroup();
}

InkSettings InkSettings::fromAppSettings()
{
    QSettings settings(QStringLiteral("InkBoard"), QStringLiteral("App"));
    InkSettings result;
    result.load(settings);
    return result;
}
