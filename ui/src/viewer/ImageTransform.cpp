#include "ImageTransform.hpp"

#include <cstdlib>

namespace pixor::viewer {

ImageRotation rotated(ImageRotation rotation, int delta)
{
    const int next = ((degrees(rotation) + delta) % 360 + 360) % 360;
    int snapped = 0;
    int bestDistance = 360;
    for (int candidate : {0, 90, 180, 270, 360}) {
        const int distance = std::abs(candidate - next);
        if (distance < bestDistance) {
            bestDistance = distance;
            snapped = candidate % 360;
        }
    }
    return static_cast<ImageRotation>(snapped);
}

} // namespace pixor::viewer

ImageTransform ImageTransform::rotatedClockwise() const
{
    ImageTransform result = *this;
    result.rotation = pixor::viewer::rotated(rotation, 90);
    return result;
}

ImageTransform ImageTransform::rotatedCounterclockwise() const
{
    ImageTransform result = *this;
    result.rotation = pixor::viewer::rotated(rotation, -90);
    return result;
}

ImageTransform ImageTransform::mirroredHorizontally() const
{
    ImageTransform result = *this;
    result.mirrorH = !mirrorH;
    return result;
}

ImageTransform ImageTransform::mirroredVertically() const
{
    ImageTransform result = *this;
    result.mirrorV = !mirrorV;
    return result;
}

QTransform ImageTransform::toMatrix(qreal scale) const
{
    QTransform matrix;
    matrix.rotate(pixor::viewer::degrees(rotation));
    matrix.scale(mirrorH ? -1.0 : 1.0, mirrorV ? -1.0 : 1.0);
    matrix.scale(scale, scale);
    return matrix;
}

QJsonObject ImageTransform::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("rotation"), pixor::viewer::degrees(rotation));
    object.insert(QStringLiteral("mirrorH"), mirrorH);
    object.insert(QStringLiteral("mirrorV"), mirrorV);
    return object;
}

ImageTransform ImageTransform::fromJson(const QJsonObject& object)
{
    ImageTransform transform;
    transform.rotation = pixor::viewer::rotated(ImageRotation::Deg0, object.value(QStringLiteral("rotation")).toInt());
    transform.mirrorH = object.value(QStringLiteral("mirrorH")).toBool();
    transform.mirrorV = object.value(QStringLiteral("mirrorV")).toBool();
    return transform;
}
