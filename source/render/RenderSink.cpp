#include "RenderSink.h"
#include "EraseCompositor.h"

#include <QDebug>
#include <QPainter>
#include <QtMath>

// ============================================================================
// RasterRenderSink
// ============================================================================

RasterRenderSink::RasterRenderSink(qreal deviceScale)
    : m_deviceScale(deviceScale > 0 ? deviceScale : 1.0)
{
}

RasterRenderSink::~RasterRenderSink()
{
    if (m_painter) {
        m_painter->end();
    }
}

void RasterRenderSink::beginFrame(const CanvasViewport& viewport)
{
    if (m_painter) {
        qWarning() << "RasterRenderSink::beginFrame: previous frame was not ended";
        m_painter->end();
        m_painter.reset();
    }

    const int width = qMax(1, qCeil(viewport.screenWidth() * m_deviceScale));
    const int height = qMax(1, qCeil(viewport.screenHeight() * m_deviceScale));
    m_image = QImage(width, height, QImage::Format_ARGB32_Premultiplied);
    m_image.fill(Qt::transparent);

    m_painter = std::make_unique<QPainter>(&m_image);
    m_painter->setRenderHint(QPainter::Antialiasing, true);
    m_painter->setRenderHint(QPainter::SmoothPixmapTransform, true);
    m_painter->setPen(Qt::NoPen);

    QTransform transform;
    transform.scale(m_deviceScale, m_deviceScale);
    m_painter->setTransform(viewport.worldToScreenTransform() * transform);
}

void RasterRenderSink::drawTile(const TileCoord& coord, const QImage& image)
{
    if (!m_painter || image.isNull()) {
        return;
    }
    m_painter->setCompositionMode(QPainter::CompositionMode_SourceOver);
    m_painter->drawImage(coord.worldRect(), image);
}

void RasterRenderSink::drawLiveMesh(const QVector<float>& mesh, bool erase)
{
    if (!m_painter) {
        return;
    }
    if (erase) {
        EraseCompositor::eraseMesh(*m_painter, mesh);
    } else {
        EraseCompositor::drawMesh(*m_painter, mesh);
    }
}

void RasterRenderSink::endFrame()
{
    if (!m_painter) {
        return;
    }
    if (m_background.alpha() > 0) {
        m_painter->resetTransform();
        m_painter->setCompositionMode(QPainter::CompositionMode_DestinationOver);
        m_painter->fillRect(m_image.rect(), m_background);
    }
    m_painter->end();
    m_painter.reset();
}

// ============================================================================
// VertexBufferSink
// ============================================================================

void VertexBufferSink::beginFrame(const CanvasViewport& viewport)
{
    m_viewport = viewport;
    m_tiles.clear();
    m_inkVertices.clear();
    m_eraseVertices.clear();
    m_inFrame = true;
}

void VertexBufferSink::drawTile(const TileCoord& coord, const QImage& image)
{
    if (!m_inFrame) {
        return;
    }
    m_tiles.append(TileQuad{coord, coord.worldRect(), image});
}

void VertexBufferSink::drawLiveMesh(const QVector<float>& mesh, bool erase)
{
    if (!m_inFrame) {
        return;
    }
    if (erase) {
        m_eraseVertices += mesh;
    } else {
        m_inkVertices += mesh;
    }
}

void VertexBufferSink::endFrame()
{
    if (m_inFrame) {
        m_inFrame = false;
        ++m_frameCount;
    }
}
