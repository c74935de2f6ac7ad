#pragma once

// ============================================================================
// EraseCompositor - Rasterizes ribbon meshes into tile surfaces
// ============================================================================
// Bake order is fixed: every ink mesh with SourceOver, then every eraser mesh
// with DestinationOut. Erasure therefore always wins over ink on the same
// surface, whatever order the strokes were drawn in.
//
// Pure function of its inputs, safe to call from TileBakeWorker threads.
// ============================================================================

#include <QColor>
#include <QImage>
#include <QPainterPath>
#include <QRectF>
#include <QVector>

class QPainter;

class EraseCompositor {
public:
    /**
     * @brief Union of the mesh triangles as one fillable path.
     *
     * Each triangle is re-oriented counter-clockwise and the path uses
     * Qt::WindingFill, so overlapping triangles never cancel out.
     * Degenerate triangles are skipped.
     */
    static QPainterPath meshToPath(const QVector<float>& mesh);

    /**
     * @brief Color carried by the first vertex of a mesh.
     */
    static QColor meshColor(const QVector<float>& mesh);

    /**
     * @brief Fill a mesh with its own vertex color (SourceOver).
     */
    static void drawMesh(QPainter& painter, const QVector<float>& mesh);

    /**
     * @brief Punch a mesh out of whatever is already painted (DestinationOut).
     */
    static void eraseMesh(QPainter& painter, const QVector<float>& mesh);

    /**
     * @brief Rasterize one world rectangle from scratch.
     * @param worldRect  World area mapped onto the whole image.
     * @param pixelSize  Edge length of the square output in device pixels.
     * @param strokes    Ink meshes, painted first.
     * @param erasers    Eraser meshes, applied after all ink.
     * @return ARGB32_Premultiplied image, transparent where nothing is drawn.
     */
    static QImage bake(const QRectF& worldRect, int pixelSize,
                       const QVector<QVector<float>>& strokes,
                       const QVector<QVector<float>>& erasers);
};
