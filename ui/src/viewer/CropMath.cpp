#include "CropMath.hpp"

#include <QStringList>

double CropRatio::value() const
{
    if (!isValid())
        return 0.0;
    return static_cast<double>(width) / static_cast<double>(height);
}

QJsonObject CropRatio::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("width"), width);
    object.insert(QStringLiteral("height"), height);
    return object;
}

std::optional<CropRatio> CropRatio::fromJson(const QJsonObject& object)
{
    CropRatio ratio{object.value(QStringLiteral("width")).toInt(), object.value(QStringLiteral("height")).toInt()};
    if (!ratio.isValid())
        return std::nullopt;
    return ratio;
}

std::optional<CropRatio> CropRatio::fromId(const QString& id)
{
    const QStringList parts = id.trimmed().split(QLatin1Char(':'));
    if (parts.size() != 2)
        return std::nullopt;
    bool okWidth = false;
    bool okHeight = false;
    CropRatio ratio{parts.at(0).trimmed().toInt(&okWidth), parts.at(1).trimmed().toInt(&okHeight)};
    if (!okWidth || !okHeight || !ratio.isValid())
        return std::nullopt;
    return ratio;
}

CropAspectOption CropAspectOption::fromPreset(CropPreset preset)
{
    switch (preset) {
    case CropPreset::Freeform:
        return freeform();
    case CropPreset::Original:
        return original();
    default:
        break;
    }
    if (const auto ratio = pixor::viewer::presetFixedRatio(preset))
        return fixed(*ratio);
    return freeform();
}

std::optional<double> CropAspectOption::resolvedAspect(const QSizeF& imageSize) const
{
    switch (m_kind) {
    case Kind::Freeform:
        return std::nullopt;
    case Kind::Original:
        if (imageSize.width() <= 0 || imageSize.height() <= 0)
            return std::nullopt;
        return imageSize.width() / imageSize.height();
    case Kind::Fixed:
        if (!m_ratio.isValid())
            return std::nullopt;
        return m_ratio.value();
    }
    return std::nullopt;
}

namespace pixor::viewer {

QList<CropPreset> allCropPresets()
{
    return {CropPreset::Freeform, CropPreset::Original, CropPreset::Square, CropPreset::R3_2,
            CropPreset::R4_3,     CropPreset::R16_9,    CropPreset::R9_16};
}

QString presetKey(CropPreset preset)
{
    switch (preset) {
    case CropPreset::Freeform:
        return QStringLiteral("freeform");
    case CropPreset::Original:
        return QStringLiteral("original");
    case CropPreset::Square:
        return QStringLiteral("1:1");
    case CropPreset::R3_2:
        return QStringLiteral("3:2");
    case CropPreset::R4_3:
        return QStringLiteral("4:3");
    case CropPreset::R16_9:
        return QStringLiteral("16:9");
    case CropPreset::R9_16:
        return QStringLiteral("9:16");
    }
    return QStringLiteral("freeform");
}

std::optional<CropRatio> presetFixedRatio(CropPreset preset)
{
    switch (preset) {
    case CropPreset::Square:
        return CropRatio{1, 1};
    case CropPreset::R3_2:
        return CropRatio{3, 2};
    case CropPreset::R4_3:
        return CropRatio{4, 3};
    case CropPreset::R16_9:
        return CropRatio{16, 9};
    case CropPreset::R9_16:
        return CropRatio{9, 16};
    case CropPreset::Freeform:
    case CropPreset::Original:
        break;
    }
    return std::nullopt;
}

QSizeF fitRect(const QSizeF& bounds, double aspect)
{
    if (bounds.width() <= 0 || bounds.height() <= 0 || aspect <= 0)
        return {0, 0};
    qreal width = bounds.width();
    qreal height = width / aspect;
    if (height > bounds.height()) {
        height = bounds.height();
        width = height * aspect;
    }
    return {width, height};
}

QRect clampCropRect(const QRectF& rect, const QSize& imageSize)
{
    if (rect.isEmpty() || imageSize.isEmpty())
        return {};
    const QRect integral = rect.normalized().toAlignedRect();
    const QRect clipped = integral.intersected(QRect(QPoint(0, 0), imageSize));
    if (clipped.isEmpty())
        return {};
    return clipped;
}

} // namespace pixor::viewer
