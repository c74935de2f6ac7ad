#pragma once

// ============================================================================
// MeshBuilder - Variable-width ribbon triangulation
// ============================================================================
// Turns a stroke spine plus per-point widths into a flat triangle list.
// Vertex layout (6 floats): x, y, r, g, b, a  (color in 0..1)
//
// Two interchangeable implementations share this interface:
// - RibbonMeshBuilder:  object-level reference builder (QPointF math)
// - PackedMeshBuilder:  flat float-buffer kernel used by the worker pool
// Both consume the same MeshInput and produce the same vertex layout.
// ============================================================================

#include <QColor>
#include <QRectF>
#include <QVector>
#include <QtMath>
#include <memory>

struct InkStroke;
class StrokeEngine;

/**
 * @brief Immutable snapshot of everything needed to mesh one stroke.
 *
 * Created on the owning thread; safe to hand to a worker by value.
 */
struct MeshInput {
    quint32 strokeId = 0;
    QVector<float> positions;   ///< Interleaved x, y
    QVector<float> widths;      ///< Render width per point
    float rgba[4] = {0.0f, 0.0f, 0.0f, 1.0f};

    int pointCount() const { return widths.size(); }
    bool isValid() const { return positions.size() == widths.size() * 2; }

    /**
     * @brief Snapshot a stroke, evaluating the engine's width function.
     */
    static MeshInput fromStroke(const InkStroke& stroke, const StrokeEngine& engine);
};

class MeshBuilder {
public:
    enum class Kind {
        Reference,  ///< RibbonMeshBuilder
        Packed      ///< PackedMeshBuilder
    };

    static constexpr int FLOATS_PER_VERTEX = 6;
    static constexpr int DISC_SEGMENTS = 24;
    static constexpr qreal MITER_LIMIT = 4.0;
    static constexpr qreal MITER_EPSILON = 1e-4;

    virtual ~MeshBuilder() = default;

    /**
     * @brief Triangulate a stroke.
     * @return Flat vertex buffer; empty for an empty or invalid input.
     *
     * Deterministic: the same input always yields the same buffer.
     */
    virtual QVector<float> build(const MeshInput& input) const = 0;

    virtual Kind kind() const = 0;
    virtual const char* name() const = 0;

    /**
     * @brief Create a builder. Selected once at startup, never per stroke.
     */
    static std::unique_ptr<MeshBuilder> create(Kind kind);

    static int vertexCount(const QVector<float>& mesh) { return mesh.size() / FLOATS_PER_VERTEX; }

    /**
     * @brief Axis-aligned box of every vertex position; null for an empty mesh.
     */
    static QRectF vertexBounds(const QVector<float>& mesh);

    // ----- Tessellation density shared by both implementations -----

    /// Fan steps for a round join sweeping |angle| radians
    static int joinSteps(qreal angle) {
        return qMax(4, static_cast<int>(qCeil(qAbs(angle) / (M_PI / 8.0) - 1e-9)));
    }

    /// Fan steps for a round cap sweeping |angle| radians
    static int capSteps(qreal angle) {
        return qMax(6, static_cast<int>(qCeil(qAbs(angle) / (M_PI / 10.0) - 1e-9)));
    }
};
