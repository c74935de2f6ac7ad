#pragma once

// ============================================================================
// RenderSink - Backend-neutral frame consumer
// ============================================================================
// InkDocument::renderFrame() describes a frame as:
//   beginFrame(viewport)
//   drawTile(coord, image)         for every visible baked tile
//   drawLiveMesh(mesh, erase)      for every in-progress stroke
//   endFrame()
// and never asks which backend it is talking to.
//
// Tiles are placed at coord * TILE_SIZE with their destination pinned to
// TILE_SIZE × TILE_SIZE world units, whatever the image's pixel size.
// ============================================================================

#include "../core/CanvasViewport.h"
#include "../core/SpatialIndex.h"

#include <QColor>
#include <QImage>
#include <QVector>
#include <memory>

class QPainter;

class RenderSink {
public:
    virtual ~RenderSink() = default;

    virtual void beginFrame(const CanvasViewport& viewport) = 0;
    virtual void drawTile(const TileCoord& coord, const QImage& image) = 0;
    virtual void drawLiveMesh(const QVector<float>& mesh, bool erase) = 0;
    virtual void endFrame() = 0;
};

// ============================================================================
// RasterRenderSink - QPainter into a screen-sized QImage
// ============================================================================

class RasterRenderSink : public RenderSink {
public:
    /**
     * @param deviceScale Device pixels per screen unit.
     */
    explicit RasterRenderSink(qreal deviceScale = 1.0);
    ~RasterRenderSink() override;

    /**
     * @brief Color placed under the frame at endFrame(). Transparent by default.
     */
    void setBackground(const QColor& color) { m_background = color; }

    void beginFrame(const CanvasViewport& viewport) override;
    void drawTile(const TileCoord& coord, const QImage& image) override;
    void drawLiveMesh(const QVector<float>& mesh, bool erase) override;
    void endFrame() override;

    /**
     * @brief The last completed frame.
     */
    const QImage& image() const { return m_image; }

private:
    qreal m_deviceScale = 1.0;
    QColor m_background = Qt::transparent;
    QImage m_image;
    std::unique_ptr<QPainter> m_painter;
};

// ============================================================================
// VertexBufferSink - Collects geometry for a GPU-style uploader
// ============================================================================

class VertexBufferSink : public RenderSink {
public:
    struct TileQuad {
        TileCoord coord;
        QRectF worldRect;       ///< Always TILE_SIZE × TILE_SIZE world units
        QImage image;
    };

    void beginFrame(const CanvasViewport& viewport) override;
    void drawTile(const TileCoord& coord, const QImage& image) override;
    void drawLiveMesh(const QVector<float>& mesh, bool erase) override;
    void endFrame() override;

    const QVector<TileQuad>& tiles() const { return m_tiles; }
    const QVector<float>& inkVertices() const { return m_inkVertices; }
    const QVector<float>& eraseVertices() const { return m_eraseVertices; }
    const CanvasViewport& viewport() const { return m_viewport; }
    bool inFrame() const { return m_inFrame; }
    int frameCount() const { return m_frameCount; }

private:
    CanvasViewport m_viewport;
    QVector<TileQuad> m_tiles;
    QVector<float> m_inkVertices;
    QVector<float> m_eraseVertices;
    bool m_inFrame = false;
    int m_frameCount = 0;
};
