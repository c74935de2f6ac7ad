#include "MeshBuilder.h"
#include "PackedMeshBuilder.h"
#include "RibbonMeshBuilder.h"
#include "../strokes/InkStroke.h"
#include "../strokes/StrokeEngine.h"

MeshInput MeshInput::fromStroke(const InkStroke& stroke, const StrokeEngine& engine)
{
    MeshInput input;
    input.strokeId = stroke.id;

    const int count = stroke.points.size();
    input.positions.resize(count * 2);
    for (int i = 0; i < count; ++i) {
        input.positions[i * 2] = static_cast<float>(stroke.points[i].x());
        input.positions[i * 2 + 1] = static_cast<float>(stroke.points[i].y());
    }
    input.widths = engine.pointWidths(stroke);

    input.rgba[0] = static_cast<float>(stroke.color.redF());
    input.rgba[1] = static_cast<float>(stroke.color.greenF());
    input.rgba[2] = static_cast<float>(stroke.color.blueF());
    input.rgba[3] = static_cast<float>(stroke.color.alphaF());
    return input;
}

std::unique_ptr<MeshBuilder> MeshBuilder::create(Kind kind)
{
    switch (kind) {
    case Kind::Packed:
        return std::make_unique<PackedMeshBuilder>();
    case Kind::Reference:
        break;
    }
    return std::make_unique<RibbonMeshBuilder>();
}

QRectF MeshBuilder::vertexBounds(const QVector<float>& mesh)
{
    const int count = vertexCount(mesh);
    if (count == 0) {
        return QRectF();
    }

    const float* v = mesh.constData();
    float minX = v[0], maxX = v[0];
    float minY = v[1], maxY = v[1];
    for (int i = 1; i < count; ++i) {
        const float x = v[i * FLOATS_PER_VERTEX];
        const float y = v[i * FLOATS_PER_VERTEX + 1];
        minX = qMin(minX, x);
        maxX = qMax(maxX, x);
        minY = qMin(minY, y);
        maxY = qMax(maxY, y);
    }
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}
