#include "PanZoomMath.hpp"

#include <QTransform>

#include <algorithm>

namespace pixor::viewer::panzoom {

namespace {

bool hasArea(const QSizeF& size)
{
    return size.width() > 0 && size.height() > 0;
}

} // namespace

std::optional<qreal> computeFitScale(const QSizeF& viewSize, const QSizeF& imageSize)
{
    if (!hasArea(viewSize) || !hasArea(imageSize))
        return std::nullopt;
    return std::min(viewSize.width() / imageSize.width(), viewSize.height() / imageSize.height());
}

PanZoomState defaultState()
{
    return {};
}

QPointF maxOffset(const QSizeF& viewSize, const QSizeF& imageSize, qreal baseFitScale, qreal scale)
{
    const qreal displayedWidth = imageSize.width() * baseFitScale * scale;
    const qreal displayedHeight = imageSize.height() * baseFitScale * scale;
    return {std::max<qreal>(0.0, (displayedWidth - viewSize.width()) / 2.0),
            std::max<qreal>(0.0, (displayedHeight - viewSize.height()) / 2.0)};
}

QPointF clampOffset(const QPointF& offset, const QPointF& maxOffset)
{
    return {std::clamp(offset.x(), -maxOffset.x(), maxOffset.x()),
            std::clamp(offset.y(), -maxOffset.y(), maxOffset.y())};
}

qreal clampScale(qreal proposed, qreal minScale, qreal maxScale)
{
    if (proposed < minScale)
        return minScale;
    if (proposed > maxScale)
        return maxScale;
    return proposed;
}

qreal scaleByWheel(qreal current, qreal deltaY, qreal sensitivity, qreal minScale, qreal maxScale)
{
    return clampScale(current * (1.0 + deltaY * sensitivity), minScale, maxScale);
}

qreal scaleByMagnification(qreal last, qreal gestureValue, qreal minScale, qreal maxScale)
{
    return clampScale(last * gestureValue, minScale, maxScale);
}

bool shouldShowMinimap(const QSizeF& viewSize, const QSizeF& imageSize, qreal baseFitScale, qreal scale)
{
    const qreal displayedWidth = imageSize.width() * baseFitScale * scale;
    const qreal displayedHeight = imageSize.height() * baseFitScale * scale;
    return displayedWidth > viewSize.width() + 0.5 || displayedHeight > viewSize.height() + 0.5;
}

QRectF visibleRectInImage(const QSizeF& viewSize, const QSizeF& imageSize, const QPointF& offset, qreal baseFitScale,
                          qreal scale)
{
    if (!hasArea(viewSize) || !hasArea(imageSize))
        return {};
    const qreal displayScale = baseFitScale * scale;
    if (displayScale <= 0)
        return {};

    const qreal vw = viewSize.width();
    const qreal vh = viewSize.height();
    const qreal iw = imageSize.width();
    const qreal ih = imageSize.height();

    const qreal left = (-vw / 2.0 - offset.x()) / displayScale + iw / 2.0;
    const qreal right = (vw / 2.0 - offset.x()) / displayScale + iw / 2.0;
    const qreal top = (-vh / 2.0 - offset.y()) / displayScale + ih / 2.0;
    const qreal bottom = (vh / 2.0 - offset.y()) / displayScale + ih / 2.0;

    const qreal x0 = std::clamp(left, 0.0, iw);
    const qreal x1 = std::clamp(right, 0.0, iw);
    const qreal y0 = std::clamp(top, 0.0, ih);
    const qreal y1 = std::clamp(bottom, 0.0, ih);
    return QRectF(x0, y0, std::max<qreal>(0.0, x1 - x0), std::max<qreal>(0.0, y1 - y0));
}

std::optional<FocusVectors> focusVectors(const QPointF& location, const QSizeF& viewSize, const QPointF& offset,
                                         qreal baseFitScale, qreal scale, const ImageTransform& transform)
{
    if (!hasArea(viewSize))
        return std::nullopt;
    const qreal displayScale = baseFitScale * scale;
    if (displayScale <= 0)
        return std::nullopt;

    const QPointF center(viewSize.width() / 2.0, viewSize.height() / 2.0);
    const QPointF viewVector = location - center;
    const QPointF translated = viewVector - offset;

    bool invertible = false;
    const QTransform inverse = transform.toMatrix(displayScale).inverted(&invertible);
    if (!invertible)
        return std::nullopt;
    return FocusVectors{viewVector, inverse.map(translated)};
}

QPointF offsetKeepingFocus(const QPointF& viewVector, const QPointF& baseVector, qreal baseFitScale,
                           qreal targetScale, const ImageTransform& transform)
{
    const QPointF projected = transform.toMatrix(baseFitScale * targetScale).map(baseVector);
    return viewVector - projected;
}

QRectF visibleRectInOriginalImage(const QSizeF& viewSize, const QSizeF& imageSize, const QPointF& offset,
                                  qreal baseFitScale, qreal scale, const ImageTransform& transform)
{
    if (!hasArea(imageSize))
        return {};

    const QPointF corners[] = {
        {0.0, 0.0},
        {viewSize.width(), 0.0},
        {0.0, viewSize.height()},
        {viewSize.width(), viewSize.height()},
    };

    bool any = false;
    qreal minX = 0, maxX = 0, minY = 0, maxY = 0;
    for (const QPointF& corner : corners) {
        const auto vectors = focusVectors(corner, viewSize, offset, baseFitScale, scale, transform);
        if (!vectors)
            continue;
        const QPointF imagePoint(vectors->baseVector.x() + imageSize.width() / 2.0,
                                 vectors->baseVector.y() + imageSize.height() / 2.0);
        if (!any) {
            minX = maxX = imagePoint.x();
            minY = maxY = imagePoint.y();
            any = true;
            continue;
        }
        minX = std::min(minX, imagePoint.x());
        maxX = std::max(maxX, imagePoint.x());
        minY = std::min(minY, imagePoint.y());
        maxY = std::max(maxY, imagePoint.y());
    }
    if (!any)
        return QRectF(QPointF(0, 0), imageSize);

    minX = std::max<qreal>(0.0, minX);
    maxX = std::min(imageSize.width(), maxX);
    minY = std::max<qreal>(0.0, minY);
    maxY = std::min(imageSize.height(), maxY);
    return QRectF(minX, minY, std::max<qreal>(0.0, maxX - minX), std::max<qreal>(0.0, maxY - minY));
}

} // namespace pixor::viewer::panzoom
