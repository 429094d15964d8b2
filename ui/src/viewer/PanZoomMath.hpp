#pragma once

#include <QPointF>
#include <QRectF>
#include <QSizeF>

#include <optional>

#include "viewer/ImageTransform.hpp"

namespace pixor::viewer::panzoom {

struct PanZoomState {
    qreal scale = 1.0;
    qreal lastScale = 1.0;
    QPointF offset;
    QPointF lastOffset;
};

struct FocusVectors {
    QPointF viewVector;
    QPointF baseVector;
};

//! Scale at which the whole image fits the view; std::nullopt for empty sizes.
std::optional<qreal> computeFitScale(const QSizeF& viewSize, const QSizeF& imageSize);
PanZoomState defaultState();

QPointF maxOffset(const QSizeF& viewSize, const QSizeF& imageSize, qreal baseFitScale, qreal scale);
QPointF clampOffset(const QPointF& offset, const QPointF& maxOffset);
qreal clampScale(qreal proposed, qreal minScale, qreal maxScale);

//! Positive @p deltaY zooms in.
qreal scaleByWheel(qreal current, qreal deltaY, qreal sensitivity, qreal minScale, qreal maxScale);
qreal scaleByMagnification(qreal last, qreal gestureValue, qreal minScale, qreal maxScale);

bool shouldShowMinimap(const QSizeF& viewSize, const QSizeF& imageSize, qreal baseFitScale, qreal scale);

QRectF visibleRectInImage(const QSizeF& viewSize, const QSizeF& imageSize, const QPointF& offset, qreal baseFitScale,
                          qreal scale);

std::optional<FocusVectors> focusVectors(const QPointF& location, const QSizeF& viewSize, const QPointF& offset,
                                         qreal baseFitScale, qreal scale, const ImageTransform& transform);
QPointF offsetKeepingFocus(const QPointF& viewVector, const QPointF& baseVector, qreal baseFitScale,
                           qreal targetScale, const ImageTransform& transform);

//! Part of the unrotated, unmirrored image currently inside the viewport.
QRectF visibleRectInOriginalImage(const QSizeF& viewSize, const QSizeF& imageSize, const QPointF& offset,
                                  qreal baseFitScale, qreal scale, const ImageTransform& transform);

} // namespace pixor::viewer::panzoom
