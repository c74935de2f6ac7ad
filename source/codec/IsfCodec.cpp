#include "IsfCodec.h"

#include <QCoreApplication>
#include <QDebug>
#include <QtEndian>
#include <QtMath>
#include <cmath>
#include <limits>

namespace {

enum class VarIntStatus { Ok, Truncated, Overflow };

VarIntStatus readVarInt(const QByteArray& bytes, int& offset, qint64& value)
{
    int pos = offset;
    if (pos < 0 || pos >= bytes.size()) {
        return VarIntStatus::Truncated;
    }

    quint8 byte = static_cast<quint8>(bytes.at(pos++));
    const bool negative = (byte & 0x40) != 0;
    quint64 magnitude = byte & 0x3F;
    int shift = 6;

    while (byte & 0x80) {
        if (pos >= bytes.size()) {
            return VarIntStatus::Truncated;
        }
        byte = static_cast<quint8>(bytes.at(pos++));
        const quint64 group = byte & 0x7F;
        if (shift >= 64 || ((group << shift) >> shift) != group) {
            return VarIntStatus::Overflow;
        }
        magnitude |= group << shift;
        shift += 7;
    }

    if (magnitude > static_cast<quint64>(std::numeric_limits<qint64>::max())) {
        return VarIntStatus::Overflow;
    }

    value = negative ? -static_cast<qint64>(magnitude) : static_cast<qint64>(magnitude);
    offset = pos;
    return VarIntStatus::Ok;
}

// Wrapping add: corrupt streams must not trigger signed overflow
qint64 wrappingAdd(qint64 a, qint64 b)
{
    return static_cast<qint64>(static_cast<quint64>(a) + static_cast<quint64>(b));
}

qint64 wrappingSub(qint64 a, qint64 b)
{
    return static_cast<qint64>(static_cast<quint64>(a) - static_cast<quint64>(b));
}

bool fail(IsfParseError* error, IsfParseError::ParseError code, int offset)
{
    if (error) {
        error->error = code;
        error->offset = offset;
    }
    return false;
}

void appendU32(QByteArray& out, quint32 value)
{
    char buffer[4];
    qToLittleEndian<quint32>(value, buffer);
    out.append(buffer, 4);
}

bool readU32(const QByteArray& bytes, int& offset, quint32& value)
{
    if (offset < 0 || bytes.size() - offset < 4) {
        return false;
    }
    value = qFromLittleEndian<quint32>(bytes.constData() + offset);
    offset += 4;
    return true;
}

// 4-byte length header + descriptor (at least 7 bytes) + four stream lengths
constexpr int MIN_STROKE_SIZE = 4 + 7 + 16;

std::unique_ptr<InkStroke> parseStrokeAt(const QByteArray& bytes, int start,
                                         IsfParseError* error, int* consumed)
{
    int offset = start;
    quint32 declared = 0;
    if (!readU32(bytes, offset, declared)) {
        fail(error, IsfParseError::TruncatedData, offset);
        return nullptr;
    }
    if (declared < static_cast<quint32>(MIN_STROKE_SIZE)) {
        fail(error, IsfParseError::LengthMismatch, start);
        return nullptr;
    }
    if (declared > static_cast<quint32>(bytes.size() - start)) {
        fail(error, IsfParseError::TruncatedData, bytes.size());
        return nullptr;
    }

    const int end = start + static_cast<int>(declared);
    // Bounded view of this stroke; nested reads cannot run past totalLength
    const QByteArray body = QByteArray::fromRawData(bytes.constData(), end);

    StrokeDescriptor descriptor;
    if (!StrokeDescriptor::fromBytes(body, offset, descriptor, error)) {
        return nullptr;
    }

    static const StrokeDescriptor::Flag streamFlags[4] = {
        StrokeDescriptor::HasX, StrokeDescriptor::HasY,
        StrokeDescriptor::HasPressure, StrokeDescriptor::HasTime
    };
    QVector<qreal> streams[4];

    for (int s = 0; s < 4; ++s) {
        quint32 length = 0;
        if (!readU32(body, offset, length)) {
            fail(error, IsfParseError::TruncatedData, offset);
            return nullptr;
        }
        if (length > static_cast<quint32>(end - offset)) {
            fail(error, IsfParseError::TruncatedData, offset);
            return nullptr;
        }
        if (!descriptor.has(streamFlags[s]) && length != 0) {
            fail(error, IsfParseError::LengthMismatch, offset - 4);
            return nullptr;
        }

        IsfParseError streamError;
        if (!PacketCodec::decode(body.mid(offset, static_cast<int>(length)), streams[s], &streamError)) {
            fail(error, streamError.error, offset + streamError.offset);
            return nullptr;
        }
        offset += static_cast<int>(length);
    }

    if (offset != end) {
        fail(error, IsfParseError::LengthMismatch, offset);
        return nullptr;
    }

    const QVector<qreal>& xs = streams[0];
    const QVector<qreal>& ys = streams[1];
    const QVector<qreal>& pressures = streams[2];
    const QVector<qreal>& times = streams[3];
    const int count = xs.size();
    if (ys.size() != count
        || (descriptor.has(StrokeDescriptor::HasPressure) && pressures.size() != count)
        || (descriptor.has(StrokeDescriptor::HasTime) && times.size() != count)) {
        fail(error, IsfParseError::PointCountMismatch, start);
        return nullptr;
    }
    if (count == 0) {
        fail(error, IsfParseError::InvalidPoints, start);
        return nullptr;
    }
    for (int i = 0; i < count; ++i) {
        if (!InkStroke::isWithinWorld(QPointF(xs[i], ys[i]))) {
            fail(error, IsfParseError::InvalidPoints, start);
            return nullptr;
        }
    }

    auto stroke = std::make_unique<InkStroke>();
    stroke->id = descriptor.strokeId;
    stroke->color = descriptor.color;
    stroke->baseWidth = descriptor.width;
    stroke->isEraser = descriptor.has(StrokeDescriptor::IsEraser);
    stroke->points.reserve(count);
    for (int i = 0; i < count; ++i) {
        const qreal pressure = descriptor.has(StrokeDescriptor::HasPressure) ? pressures[i] : 1.0;
        const qreal time = descriptor.has(StrokeDescriptor::HasTime) ? times[i] : 0.0;
        stroke->points.append(InkPoint(QPointF(xs[i], ys[i]), qBound<qreal>(0.0, pressure, 1.0), time));
    }
    stroke->isFinished = true;
    if (count > 0) {
        stroke->createdAt = stroke->points.first().time;
        stroke->updatedAt = stroke->points.last().time;
        stroke->lastFiltered = stroke->points.last().pos;
    }
    stroke->recomputeLengths();
    stroke->updateBoundingBox();

    if (error) {
        error->error = IsfParseError::NoError;
        error->offset = 0;
    }
    if (consumed) {
        *consumed = static_cast<int>(declared);
    }
    return stroke;
}

} // namespace

// ============================================================================
// IsfParseError
// ============================================================================

QString IsfParseError::errorString() const
{
    switch (error) {
    case NoError:
        return QCoreApplication::translate("IsfParseError", "no error occurred");
    case TruncatedData:
        return QCoreApplication::translate("IsfParseError", "unexpected end of ink data");
    case UnsupportedVersion:
        return QCoreApplication::translate("IsfParseError", "unsupported ink format version");
    case InvalidDescriptor:
        return QCoreApplication::translate("IsfParseError", "invalid stroke descriptor");
    case MalformedStream:
        return QCoreApplication::translate("IsfParseError", "malformed packet stream");
    case LengthMismatch:
        return QCoreApplication::translate("IsfParseError", "declared length does not match content");
    case PointCountMismatch:
        return QCoreApplication::translate("IsfParseError", "packet streams have different point counts");
    case InvalidPoints:
        return QCoreApplication::translate("IsfParseError", "stroke has no points or lies outside the canvas");
    case TrailingData:
        return QCoreApplication::translate("IsfParseError", "garbage at the end of the ink data");
    }
    return QCoreApplication::translate("IsfParseError", "unknown error");
}

// ============================================================================
// DeltaDeltaTransform
// ============================================================================

QVector<qint64> DeltaDeltaTransform::encode(const QVector<qint64>& values)
{
    QVector<qint64> encoded;
    encoded.reserve(values.size());
    if (values.isEmpty()) {
        return encoded;
    }

    encoded.append(values[0]);
    if (values.size() == 1) {
        return encoded;
    }

    qint64 lastDelta = wrappingSub(values[1], values[0]);
    encoded.append(lastDelta);
    for (int i = 2; i < values.size(); ++i) {
        const qint64 delta = wrappingSub(values[i], values[i - 1]);
        encoded.append(wrappingSub(delta, lastDelta));
        lastDelta = delta;
    }
    return encoded;
}

QVector<qint64> DeltaDeltaTransform::decode(const QVector<qint64>& encoded)
{
    QVector<qint64> decoded;
    decoded.reserve(encoded.size());
    if (encoded.isEmpty()) {
        return decoded;
    }

    decoded.append(encoded[0]);
    if (encoded.size() == 1) {
        return decoded;
    }

    qint64 lastDelta = encoded[1];
    decoded.append(wrappingAdd(encoded[0], lastDelta));
    for (int i = 2; i < encoded.size(); ++i) {
        lastDelta = wrappingAdd(lastDelta, encoded[i]);
        decoded.append(wrappingAdd(decoded[i - 1], lastDelta));
    }
    return decoded;
}

// ============================================================================
// VarIntCodec
// ============================================================================

void VarIntCodec::encode(qint64 value, QByteArray& out)
{
    const bool negative = value < 0;
    quint64 magnitude = negative ? (~static_cast<quint64>(value) + 1) : static_cast<quint64>(value);

    // First byte: 6 magnitude bits so the sign flag has a bit of its own
    quint8 byte = static_cast<quint8>(magnitude & 0x3F);
    if (negative) {
        byte |= 0x40;
    }
    magnitude >>= 6;

    while (magnitude != 0) {
        out.append(static_cast<char>(byte | 0x80));
        byte = static_cast<quint8>(magnitude & 0x7F);
        magnitude >>= 7;
    }
    out.append(static_cast<char>(byte));
}

QByteArray VarIntCodec::encode(qint64 value)
{
    QByteArray out;
    encode(value, out);
    return out;
}

bool VarIntCodec::decode(const QByteArray& bytes, int& offset, qint64& value)
{
    return readVarInt(bytes, offset, value) == VarIntStatus::Ok;
}

int VarIntCodec::encodedSize(qint64 value)
{
    quint64 magnitude = value < 0 ? (~static_cast<quint64>(value) + 1) : static_cast<quint64>(value);
    int size = 1;
    magnitude >>= 6;
    while (magnitude != 0) {
        ++size;
        magnitude >>= 7;
    }
    return size;
}

// ============================================================================
// PacketCodec
// ============================================================================

qint64 PacketCodec::quantize(qreal value, int precision)
{
    // 2^62 keeps the delta-delta of any two quantized values representable
    constexpr qreal limit = 4611686018427387904.0;

    const qreal scaled = value * std::pow(10.0, qBound(0, precision, MAX_PRECISION));
    if (!std::isfinite(scaled)) {
        return 0;
    }
    return static_cast<qint64>(std::llround(qBound(-limit, scaled, limit)));
}

QByteArray PacketCodec::encode(const QVector<qreal>& values, int precision)
{
    QByteArray out;
    if (values.isEmpty()) {
        return out;
    }

    if (precision < 0 || precision > MAX_PRECISION) {
        qWarning() << "PacketCodec::encode: precision" << precision << "out of range, clamping";
        precision = qBound(0, precision, MAX_PRECISION);
    }

    QVector<qint64> quantized;
    quantized.reserve(values.size());
    for (qreal v : values) {
        quantized.append(quantize(v, precision));
    }

    out.reserve(values.size() * 2 + 8);
    VarIntCodec::encode(values.size(), out);
    out.append(static_cast<char>(precision));
    for (qint64 dd : DeltaDeltaTransform::encode(quantized)) {
        VarIntCodec::encode(dd, out);
    }
    return out;
}

bool PacketCodec::decode(const QByteArray& bytes, QVector<qreal>& values, IsfParseError* error)
{
    values.clear();
    if (bytes.isEmpty()) {
        return true;
    }

    int offset = 0;
    qint64 count = 0;
    switch (readVarInt(bytes, offset, count)) {
    case VarIntStatus::Truncated:
        return fail(error, IsfParseError::TruncatedData, offset);
    case VarIntStatus::Overflow:
        return fail(error, IsfParseError::MalformedStream, offset);
    case VarIntStatus::Ok:
        break;
    }
    // Every value takes at least one byte
    if (count < 0 || count > bytes.size()) {
        return fail(error, IsfParseError::MalformedStream, 0);
    }

    if (offset >= bytes.size()) {
        return fail(error, IsfParseError::TruncatedData, offset);
    }
    const int precision = static_cast<quint8>(bytes.at(offset));
    if (precision > MAX_PRECISION) {
        return fail(error, IsfParseError::MalformedStream, offset);
    }
    ++offset;

    QVector<qint64> encoded;
    encoded.reserve(static_cast<int>(count));
    for (qint64 i = 0; i < count; ++i) {
        qint64 value = 0;
        const int at = offset;
        switch (readVarInt(bytes, offset, value)) {
        case VarIntStatus::Truncated:
            return fail(error, IsfParseError::TruncatedData, at);
        case VarIntStatus::Overflow:
            return fail(error, IsfParseError::MalformedStream, at);
        case VarIntStatus::Ok:
            break;
        }
        encoded.append(value);
    }

    if (offset != bytes.size()) {
        return fail(error, IsfParseError::TrailingData, offset);
    }

    const qreal scale = std::pow(10.0, precision);
    const QVector<qint64> decoded = DeltaDeltaTransform::decode(encoded);
    values.reserve(decoded.size());
    for (qint64 v : decoded) {
        values.append(static_cast<qreal>(v) / scale);
    }
    return true;
}

// ============================================================================
// StrokeDescriptor
// ============================================================================

QByteArray StrokeDescriptor::toBytes() const
{
    QByteArray out;
    out.append(static_cast<char>(version));
    out.append(static_cast<char>(flags));
    VarIntCodec::encode(strokeId, out);
    out.append(static_cast<char>(color.red()));
    out.append(static_cast<char>(color.green()));
    out.append(static_cast<char>(color.blue()));
    VarIntCodec::encode(qRound64(width * 100.0), out);
    return out;
}

bool StrokeDescriptor::fromBytes(const QByteArray& bytes, int& offset, StrokeDescriptor& out,
                                 IsfParseError* error)
{
    int pos = offset;
    if (bytes.size() - pos < 2) {
        return fail(error, IsfParseError::TruncatedData, pos);
    }

    StrokeDescriptor result;
    result.version = static_cast<quint8>(bytes.at(pos++));
    if (result.version != VERSION) {
        return fail(error, IsfParseError::UnsupportedVersion, pos - 1);
    }
    result.flags = static_cast<quint8>(bytes.at(pos++));
    if (!result.has(HasX) || !result.has(HasY)) {
        return fail(error, IsfParseError::InvalidDescriptor, pos - 1);
    }

    qint64 id = 0;
    int at = pos;
    VarIntStatus status = readVarInt(bytes, pos, id);
    if (status != VarIntStatus::Ok) {
        return fail(error, status == VarIntStatus::Truncated ? IsfParseError::TruncatedData
                                                             : IsfParseError::MalformedStream, at);
    }
    if (id < 0 || id > std::numeric_limits<quint32>::max()) {
        return fail(error, IsfParseError::InvalidDescriptor, at);
    }
    result.strokeId = static_cast<quint32>(id);

    if (bytes.size() - pos < 3) {
        return fail(error, IsfParseError::TruncatedData, pos);
    }
    result.color = QColor(static_cast<quint8>(bytes.at(pos)),
                          static_cast<quint8>(bytes.at(pos + 1)),
                          static_cast<quint8>(bytes.at(pos + 2)));
    pos += 3;

    qint64 width = 0;
    at = pos;
    status = readVarInt(bytes, pos, width);
    if (status != VarIntStatus::Ok) {
        return fail(error, status == VarIntStatus::Truncated ? IsfParseError::TruncatedData
                                                             : IsfParseError::MalformedStream, at);
    }
    if (width < 0 || width > qRound64(InkStroke::MAX_BASE_WIDTH * 100.0)) {
        return fail(error, IsfParseError::InvalidDescriptor, at);
    }
    result.width = static_cast<qreal>(width) / 100.0;

    out = result;
    offset = pos;
    return true;
}

// ============================================================================
// IsfSerializer
// ============================================================================

QByteArray IsfSerializer::serialize(const InkStroke& stroke, const IsfOptions& options)
{
    StrokeDescriptor descriptor;
    descriptor.strokeId = stroke.id;
    descriptor.color = stroke.color;
    descriptor.width = stroke.baseWidth;
    descriptor.flags = StrokeDescriptor::HasX | StrokeDescriptor::HasY;
    if (options.includePressure) {
        descriptor.flags |= StrokeDescriptor::HasPressure;
    }
    if (options.includeTime) {
        descriptor.flags |= StrokeDescriptor::HasTime;
    }
    if (stroke.isEraser) {
        descriptor.flags |= StrokeDescriptor::IsEraser;
    }

    const int count = stroke.points.size();
    QVector<qreal> xs, ys, pressures, times;
    xs.reserve(count);
    ys.reserve(count);
    pressures.reserve(count);
    times.reserve(count);
    for (const InkPoint& pt : stroke.points) {
        xs.append(pt.x());
        ys.append(pt.y());
        pressures.append(pt.pressure);
        times.append(pt.time);
    }

    const QByteArray descriptorBytes = descriptor.toBytes();
    const QByteArray streams[4] = {
        PacketCodec::encode(xs, options.precision),
        PacketCodec::encode(ys, options.precision),
        options.includePressure ? PacketCodec::encode(pressures, PRESSURE_PRECISION) : QByteArray(),
        options.includeTime ? PacketCodec::encode(times, TIME_PRECISION) : QByteArray()
    };

    int total = 4 + descriptorBytes.size();
    for (const QByteArray& stream : streams) {
        total += 4 + stream.size();
    }

    QByteArray out;
    out.reserve(total);
    appendU32(out, static_cast<quint32>(total));
    out.append(descriptorBytes);
    for (const QByteArray& stream : streams) {
        appendU32(out, static_cast<quint32>(stream.size()));
        out.append(stream);
    }
    return out;
}

std::unique_ptr<InkStroke> IsfSerializer::deserialize(const QByteArray& bytes, IsfParseError* error,
                                                      int* consumed)
{
    return parseStrokeAt(bytes, 0, error, consumed);
}

QByteArray IsfSerializer::serializeContainer(const QVector<const InkStroke*>& strokes,
                                             const IsfOptions& options)
{
    QByteArray out;
    appendU32(out, static_cast<quint32>(strokes.size()));
    for (const InkStroke* stroke : strokes) {
        out.append(serialize(*stroke, options));
    }
    return out;
}

bool IsfSerializer::deserializeContainer(const QByteArray& bytes,
                                         std::vector<std::unique_ptr<InkStroke>>& out,
                                         IsfParseError* error)
{
    int offset = 0;
    quint32 count = 0;
    if (!readU32(bytes, offset, count)) {
        return fail(error, IsfParseError::TruncatedData, 0);
    }

    std::vector<std::unique_ptr<InkStroke>> decoded;
    decoded.reserve(qMin<quint32>(count, static_cast<quint32>(bytes.size() / MIN_STROKE_SIZE)));

    for (quint32 i = 0; i < count; ++i) {
        int consumed = 0;
        std::unique_ptr<InkStroke> stroke = parseStrokeAt(bytes, offset, error, &consumed);
        if (!stroke) {
            qWarning() << "IsfSerializer::deserializeContainer: stroke" << i << "of" << count
                       << "failed to decode";
            return false;
        }
        decoded.push_back(std::move(stroke));
        offset += consumed;
    }

    if (offset != bytes.size()) {
        return fail(error, IsfParseError::TrailingData, offset);
    }

    if (error) {
        error->error = IsfParseError::NoError;
        error->offset = 0;
    }
    out = std::move(decoded);
    return true;
}

CompressionStats IsfSerializer::compressionStats(const InkStroke& stroke, const IsfOptions& options)
{
    CompressionStats stats;
    stats.strokeCount = 1;
    stats.pointCount = stroke.points.size();
    stats.originalSize = static_cast<qint64>(stats.pointCount) * 16;
    stats.compressedSize = serialize(stroke, options).size();
    stats.compressionRatio = stats.compressedSize > 0
        ? static_cast<qreal>(stats.originalSize) / stats.compressedSize : 0.0;
    stats.bytesPerPoint = stats.pointCount > 0
        ? static_cast<qreal>(stats.compressedSize) / stats.pointCount : 0.0;
    return stats;
}

void CompressionStats::add(const CompressionStats& other)
{
    strokeCount += other.strokeCount;
    pointCount += other.pointCount;
    originalSize += other.originalSize;
    compressedSize += other.compressedSize;
    compressionRatio = compressedSize > 0 ? static_cast<qreal>(originalSize) / compressedSize : 0.0;
    bytesPerPoint = pointCount > 0 ? static_cast<qreal>(compressedSize) / pointCount : 0.0;
}

std::unique_ptr<InkStroke> IsfSerializer::generateTestStroke(int pointCount, quint32 id, qreal startTime)
{
    auto stroke = std::make_unique<InkStroke>();
    stroke->id = id;
    stroke->color = QColor(0xFF, 0x57, 0x33);
    stroke->baseWidth = 5.0;
    stroke->createdAt = startTime;

    const int count = qMax(0, pointCount);
    stroke->points.reserve(count);
    for (int i = 0; i < count; ++i) {
        const qreal t = static_cast<qreal>(i) / count;
        const qreal x = 100.0 + qSin(t * M_PI * 4.0) * 200.0;
        const qreal y = 100.0 + qCos(t * M_PI * 2.0) * 150.0;
        const qreal pressure = 0.5 + 0.5 * qSin(t * M_PI * 3.0);
        stroke->points.append(InkPoint(QPointF(x, y), pressure, startTime + i * 10.0));
    }

    stroke->isFinished = true;
    stroke->updatedAt = count > 0 ? stroke->points.last().time : startTime;
    stroke->recomputeLengths();
    stroke->updateBoundingBox();
    return stroke;
}
