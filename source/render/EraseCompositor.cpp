#include "EraseCompositor.h"
#include "MeshBuilder.h"

#include <QPainter>
#include <QPolygonF>
#include <QtMath>
#include <utility>

QPainterPath EraseCompositor::meshToPath(const QVector<float>& mesh)
{
    QPainterPath path;
    path.setFillRule(Qt::WindingFill);

    const int stride = MeshBuilder::FLOATS_PER_VERTEX;
    const int triangles = mesh.size() / (stride * 3);
    const float* v = mesh.constData();

    for (int t = 0; t < triangles; ++t) {
        const float* p = v + t * stride * 3;
        QPointF a(p[0], p[1]);
        QPointF b(p[stride], p[stride + 1]);
        QPointF c(p[stride * 2], p[stride * 2 + 1]);

        const qreal area = (b.x() - a.x()) * (c.y() - a.y()) - (b.y() - a.y()) * (c.x() - a.x());
        if (qAbs(area) < 1e-12) {
            continue;
        }
        if (area < 0) {
            std::swap(b, c);
        }

        QPolygonF triangle;
        triangle << a << b << c << a;
        path.addPolygon(triangle);
        path.closeSubpath();
    }
    return path;
}

QColor EraseCompositor::meshColor(const QVector<float>& mesh)
{
    if (mesh.size() < MeshBuilder::FLOATS_PER_VERTEX) {
        return QColor(Qt::transparent);
    }
    return QColor::fromRgbF(qBound(0.0f, mesh[2], 1.0f), qBound(0.0f, mesh[3], 1.0f),
                            qBound(0.0f, mesh[4], 1.0f), qBound(0.0f, mesh[5], 1.0f));
}

void EraseCompositor::drawMesh(QPainter& painter, const QVector<float>& mesh)
{
    if (mesh.isEmpty()) {
        return;
    }
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
    painter.fillPath(meshToPath(mesh), meshColor(mesh));
}

void EraseCompositor::eraseMesh(QPainter& painter, const QVector<float>& mesh)
{
    if (mesh.isEmpty()) {
        return;
    }
    painter.setCompositionMode(QPainter::CompositionMode_DestinationOut);
    painter.fillPath(meshToPath(mesh), QColor(0, 0, 0, 255));
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
}

QImage EraseCompositor::bake(const QRectF& worldRect, int pixelSize,
                             const QVector<QVector<float>>& strokes,
                             const QVector<QVector<float>>& erasers)
{
    if (pixelSize <= 0 || worldRect.isEmpty()) {
        return QImage();
    }

    QImage image(pixelSize, pixelSize, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setPen(Qt::NoPen);
    painter.scale(pixelSize / worldRect.width(), pixelSize / worldRect.height());
    painter.translate(-worldRect.topLeft());

    for (const QVector<float>& mesh : strokes) {
        drawMesh(painter, mesh);
    }
    for (const QVector<float>& mesh : erasers) {
        eraseMesh(painter, mesh);
    }

    painter.end();
    return image;
}
