#pragma once

#include <QJsonObject>
#include <QList>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <QSizeF>
#include <QString>

#include <optional>

struct CropRatio {
    int width = 0;
    int height = 0;

    //! Width over height; 0 when either side is not positive.
    double value() const;
    bool isValid() const { return width > 0 && height > 0; }
    QString id() const { return QStringLiteral("%1:%2").arg(width).arg(height); }

    QJsonObject toJson() const;
    static std::optional<CropRatio> fromJson(const QJsonObject& object);
    //! Accepts "w:h"; std::nullopt for anything else.
    static std::optional<CropRatio> fromId(const QString& id);

    bool operator==(const CropRatio& other) const { return width == other.width && height == other.height; }
    bool operator!=(const CropRatio& other) const { return !(*this == other); }
};

enum class CropPreset {
    Freeform,
    Original,
    Square,
    R3_2,
    R4_3,
    R16_9,
    R9_16,
};

namespace pixor::viewer {

QList<CropPreset> allCropPresets();
QString presetKey(CropPreset preset);
std::optional<CropRatio> presetFixedRatio(CropPreset preset);

} // namespace pixor::viewer

class CropAspectOption {
public:
    enum class Kind {
        Freeform,
        Original,
        Fixed,
    };

    CropAspectOption() = default;

    static CropAspectOption freeform() { return CropAspectOption(Kind::Freeform, {}); }
    static CropAspectOption original() { return CropAspectOption(Kind::Original, {}); }
    static CropAspectOption fixed(const CropRatio& ratio) { return CropAspectOption(Kind::Fixed, ratio); }
    static CropAspectOption fromPreset(CropPreset preset);

    Kind kind() const { return m_kind; }
    CropRatio ratio() const { return m_ratio; }

    //! Width over height to enforce for @p imageSize; std::nullopt for freeform or degenerate input.
    std::optional<double> resolvedAspect(const QSizeF& imageSize) const;

    bool operator==(const CropAspectOption& other) const { return m_kind == other.m_kind && m_ratio == other.m_ratio; }
    bool operator!=(const CropAspectOption& other) const { return !(*this == other); }

private:
    CropAspectOption(Kind kind, const CropRatio& ratio)
        : m_kind(kind)
        , m_ratio(ratio)
    {
    }

    Kind m_kind = Kind::Freeform;
    CropRatio m_ratio;
};

namespace pixor::viewer {

//! Largest size with @p aspect (w/h) that fits in @p bounds; empty on invalid input.
QSizeF fitRect(const QSizeF& bounds, double aspect);

//! Rounds @p rect outwards to whole pixels and intersects it with the image; empty when nothing is left.
QRect clampCropRect(const QRectF& rect, const QSize& imageSize);

} // namespace pixor::viewer
