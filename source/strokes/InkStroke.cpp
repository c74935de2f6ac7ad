#include "InkStroke.h"

#include <QLineF>
#include <QRegularExpression>

void InkStroke::expandBounds(const QPointF& pos, qreal pressure)
{
    const qreal r = boundsRadius(pressure);
    const QRectF box(pos.x() - r, pos.y() - r, r * 2, r * 2);
    if (bounds.isNull()) {
        bounds = box;
    } else {
        bounds = bounds.united(box);
    }
}

void InkStroke::updateBoundingBox()
{
    bounds = QRectF();
    if (points.isEmpty()) {
        return;
    }

    qreal minX = 0, minY = 0, maxX = 0, maxY = 0;
    for (int i = 0; i < points.size(); ++i) {
        const InkPoint& pt = points[i];
        const qreal r = boundsRadius(pt.pressure);
        if (i == 0) {
            minX = pt.x() - r;
            minY = pt.y() - r;
            maxX = pt.x() + r;
            maxY = pt.y() + r;
            continue;
        }
        minX = qMin(minX, pt.x() - r);
        minY = qMin(minY, pt.y() - r);
        maxX = qMax(maxX, pt.x() + r);
        maxY = qMax(maxY, pt.y() + r);
    }
    bounds = QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

void InkStroke::recomputeLengths()
{
    qreal length = 0.0;
    for (int i = 0; i < points.size(); ++i) {
        if (i > 0) {
            length += QLineF(points[i - 1].pos, points[i].pos).length();
        }
        points[i].length = length;
    }
    totalLength = length;
}

QColor InkStroke::parseColor(const QString& text)
{
    const QString s = text.trimmed();

    if (s.startsWith(QLatin1Char('#'))) {
        const QString hex = s.mid(1);
        if (hex.size() != 6 && hex.size() != 8) {
            return QColor(Qt::black);
        }
        bool ok = false;
        const uint value = hex.toUInt(&ok, 16);
        if (!ok) {
            return QColor(Qt::black);
        }
        if (hex.size() == 6) {
            return QColor((value >> 16) & 0xFF, (value >> 8) & 0xFF, value & 0xFF);
        }
        // #rrggbbaa (CSS order, not Qt's #aarrggbb)
        return QColor((value >> 24) & 0xFF, (value >> 16) & 0xFF,
                      (value >> 8) & 0xFF, value & 0xFF);
    }

    static const QRegularExpression rgbPattern(
        QStringLiteral("^rgba?\\(\\s*(\\d+)\\s*,\\s*(\\d+)\\s*,\\s*(\\d+)\\s*(?:,\\s*([\\d.]+)\\s*)?\\)$"));
    const QRegularExpressionMatch match = rgbPattern.match(s);
    if (match.hasMatch()) {
        QColor c(qBound(0, match.captured(1).toInt(), 255),
                 qBound(0, match.captured(2).toInt(), 255),
                 qBound(0, match.captured(3).toInt(), 255));
        if (!match.captured(4).isEmpty()) {
            c.setAlphaF(qBound(0.0, match.captured(4).toDouble(), 1.0));
        }
        return c;
    }

    return QColor(Qt::black);
}
