#pragma once

// ============================================================================
// IsfCodec - Ink Serialized Format encoder/decoder
// ============================================================================
// Compact binary persistence for finished strokes:
//
//   Stroke    := u32le totalLength, Descriptor, 4 × (u32le length, Stream)
//                (streams in order x, y, pressure, time; omitted = length 0)
//   Descriptor:= u8 version (1), u8 flags, varint id, u8 r, u8 g, u8 b,
//                varint round(width * 100)
//   Stream    := varint count, u8 precision, count × varint delta-delta
//   Container := u32le strokeCount, strokeCount × Stroke
//
// Lossy: color RGB exact (alpha dropped), width to 1/100,
// point count exact, values within 10^-precision.
//
// Decoding rejects strokes without points, points beyond
// InkStroke::MAX_COORDINATE and widths above InkStroke::MAX_BASE_WIDTH.
// ============================================================================

#include "../strokes/InkStroke.h"

#include <QByteArray>
#include <QString>
#include <QVector>
#include <memory>
#include <vector>

/**
 * @brief Decode error, modelled on QJsonParseError.
 */
struct IsfParseError {
    enum ParseError {
        NoError = 0,
        TruncatedData,          ///< Buffer ends inside a field
        UnsupportedVersion,     ///< Descriptor version is not 1
        InvalidDescriptor,      ///< Missing x/y streams, bad id, width out of range
        MalformedStream,        ///< Bad precision byte or varint overflow
        LengthMismatch,         ///< totalLength or stream lengths disagree with content
        PointCountMismatch,     ///< Streams carry different point counts
        InvalidPoints,          ///< No points, or a point beyond the world limit
        TrailingData            ///< Bytes left over after the last value
    };

    ParseError error = NoError;
    int offset = 0;             ///< Byte offset where the error was detected

    /**
     * @brief Human-readable, translatable description.
     */
    QString errorString() const;
};

// ============================================================================
// Transform and integer coding
// ============================================================================

/**
 * @brief Second-order delta transform.
 *
 * [v0, v1-v0, (v2-v1)-(v1-v0), ...]. Smooth curves turn into streams of
 * small integers.
 */
class DeltaDeltaTransform {
public:
    static QVector<qint64> encode(const QVector<qint64>& values);
    static QVector<qint64> decode(const QVector<qint64>& encoded);
};

/**
 * @brief Signed variable-length integers.
 *
 * First byte: bit 7 continuation, bit 6 sign, bits 0-5 low magnitude.
 * Following bytes: bit 7 continuation, bits 0-6 magnitude (LSB first).
 * Values in [-63, 63] take a single byte.
 */
class VarIntCodec {
public:
    static void encode(qint64 value, QByteArray& out);
    static QByteArray encode(qint64 value);

    /**
     * @brief Decode one value starting at offset.
     * @param offset In: start position. Out: position after the value.
     * @return false on truncation or overflow (offset is left unchanged).
     */
    static bool decode(const QByteArray& bytes, int& offset, qint64& value);

    /**
     * @brief Number of bytes encode() produces for value.
     */
    static int encodedSize(qint64 value);
};

/**
 * @brief A quantized, delta-delta, varint-coded stream of reals.
 */
class PacketCodec {
public:
    /// Largest precision accepted on either side of the codec
    static constexpr int MAX_PRECISION = 9;

    /**
     * @brief Encode values at the given decimal precision.
     * @return Empty array for an empty input.
     */
    static QByteArray encode(const QVector<qreal>& values, int precision);

    /**
     * @brief Decode a stream produced by encode().
     *
     * The whole buffer must be consumed; an empty buffer decodes to no values.
     */
    static bool decode(const QByteArray& bytes, QVector<qreal>& values,
                       IsfParseError* error = nullptr);

    static qint64 quantize(qreal value, int precision);
};

// ============================================================================
// Stroke-level serialization
// ============================================================================

struct StrokeDescriptor {
    static constexpr quint8 VERSION = 1;

    enum Flag : quint8 {
        HasX = 0x01,
        HasY = 0x02,
        HasPressure = 0x04,
        HasTime = 0x08,
        IsEraser = 0x10         ///< Stroke is an erasure (readers may ignore it)
    };

    quint8 version = VERSION;
    quint8 flags = HasX | HasY | HasPressure | HasTime;
    quint32 strokeId = 0;
    QColor color = Qt::black;   ///< Alpha is not persisted
    qreal width = 2.0;

    bool has(Flag flag) const { return (flags & flag) != 0; }

    QByteArray toBytes() const;

    /**
     * @brief Parse a descriptor at offset.
     * @param offset In: start position. Out: position after the descriptor.
     */
    static bool fromBytes(const QByteArray& bytes, int& offset, StrokeDescriptor& out,
                          IsfParseError* error = nullptr);
};

struct IsfOptions {
    int precision = 2;              ///< Decimal places for x/y
    bool includePressure = true;
    bool includeTime = true;
};

struct CompressionStats {
    int pointCount = 0;
    int strokeCount = 0;
    qint64 originalSize = 0;        ///< 16 bytes per point (four 32-bit floats)
    qint64 compressedSize = 0;
    qreal compressionRatio = 0.0;
    qreal bytesPerPoint = 0.0;

    /**
     * @brief Accumulate another stroke (or document) into this total.
     */
    void add(const CompressionStats& other);
};

class IsfSerializer {
public:
    static constexpr int PRESSURE_PRECISION = 3;
    static constexpr int TIME_PRECISION = 0;

    /**
     * @brief Serialize one stroke.
     */
    static QByteArray serialize(const InkStroke& stroke, const IsfOptions& options = IsfOptions());

    /**
     * @brief Deserialize one stroke from the start of bytes.
     * @return The decoded (finished) stroke, or nullptr on error.
     *
     * bytes may hold more data after the stroke; its own totalLength
     * delimits it. Use consumed to learn where the next stroke starts.
     */
    static std::unique_ptr<InkStroke> deserialize(const QByteArray& bytes,
                                                  IsfParseError* error = nullptr,
                                                  int* consumed = nullptr);

    /**
     * @brief Serialize several strokes into one container.
     */
    static QByteArray serializeContainer(const QVector<const InkStroke*>& strokes,
                                         const IsfOptions& options = IsfOptions());

    /**
     * @brief Decode a container. All-or-nothing: on error out is left untouched.
     */
    static bool deserializeContainer(const QByteArray& bytes,
                                     std::vector<std::unique_ptr<InkStroke>>& out,
                                     IsfParseError* error = nullptr);

    static CompressionStats compressionStats(const InkStroke& stroke,
                                             const IsfOptions& options = IsfOptions());

    /**
     * @brief Sinusoidal benchmark stroke (#FF5733, width 5, 10 ms per point).
     */
    static std::unique_ptr<InkStroke> generateTestStroke(int pointCount, quint32 id = 1,
                                                         qreal startTime = 1000.0);
};
