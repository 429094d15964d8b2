#pragma once

#include <QJsonObject>
#include <QMetaType>
#include <QTransform>

enum class ImageRotation {
    Deg0 = 0,
    Deg90 = 90,
    Deg180 = 180,
    Deg270 = 270,
};

namespace pixor::viewer {

//! Adds @p delta degrees, normalises into [0, 360) and snaps to the nearest right angle.
ImageRotation rotated(ImageRotation rotation, int delta);
inline int degrees(ImageRotation rotation) { return static_cast<int>(rotation); }

} // namespace pixor::viewer

struct ImageTransform {
    ImageRotation rotation = ImageRotation::Deg0;
    bool mirrorH = false;
    bool mirrorV = false;

    static ImageTransform identity() { return {}; }

    bool isIdentity() const { return rotation == ImageRotation::Deg0 && !mirrorH && !mirrorV; }
    //! True when width and height swap on screen.
    bool swapsAxes() const { return rotation == ImageRotation::Deg90 || rotation == ImageRotation::Deg270; }

    ImageTransform rotatedClockwise() const;
    ImageTransform rotatedCounterclockwise() const;
    ImageTransform mirroredHorizontally() const;
    ImageTransform mirroredVertically() const;

    //! Linear map about the image centre: scale first, then mirror, then rotate.
    QTransform toMatrix(qreal scale = 1.0) const;

    QJsonObject toJson() const;
    static ImageTransform fromJson(const QJsonObject& object);

    bool operator==(const ImageTransform& other) const
    {
        return rotation == other.rotation && mirrorH == other.mirrorH && mirrorV == other.mirrorV;
    }
    bool operator!=(const ImageTransform& other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(ImageTransform)
