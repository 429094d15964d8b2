#pragma once

#include <QImage>
#include <QRectF>
#include <QString>

#include <optional>

enum class ImageCropError {
    None,
    CannotOpenSource,
    CannotReadImage,
    InvalidCropRect,
    CannotWrite,
};

/**
 * @brief Crops image files by pixel rectangle and writes the result.
 *
 * Rectangles are expressed in the stored (unrotated) pixel grid of the
 * source; the reader's auto-transform stays off so the crop matches what
 * the viewer's visibleRectInOriginalImage() reports.
 */
class ImageCropper {
public:
    static std::optional<QImage> crop(const QString& sourcePath, const QRectF& cropRect,
                                      ImageCropError* error = nullptr, QString* errorMessage = nullptr);
    //! Format follows the destination suffix; unknown suffixes are written as PNG.
    static bool save(const QImage& image, const QString& destinationPath, ImageCropError* error = nullptr,
                     QString* errorMessage = nullptr);
    static bool cropToFile(const QString& sourcePath, const QRectF& cropRect, const QString& destinationPath,
                           ImageCropError* error = nullptr, QString* errorMessage = nullptr);

    //! "<dir>/<base>_cropped.<ext>", or "_cropped_2", "_cropped_3", ... when taken.
    static QString defaultDestinationPath(const QString& sourcePath);

    static QString errorText(ImageCropError error);
};
