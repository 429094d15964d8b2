#include "ImageCropper.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QImageReader>
#include <QImageWriter>
#include <QLoggingCategory>

#include "viewer/CropMath.hpp"

Q_DECLARE_LOGGING_CATEGORY(lcViewer)

namespace {

void setFailure(ImageCropError code, const QString& detail, ImageCropError* error, QString* errorMessage)
{
    if (error)
        *error = code;
    if (errorMessage) {
        const QString text = ImageCropper::errorText(code);
        *errorMessage = detail.isEmpty() ? text : QStringLiteral("%1 (%2)").arg(text, detail);
    }
}

QByteArray writerFormatFor(const QString& path)
{
    const QByteArray suffix = QFileInfo(path).suffix().toLower().toLatin1();
    if (suffix == "jpg")
        return QByteArrayLiteral("jpeg");
    if (suffix == "tif")
        return QByteArrayLiteral("tiff");
    if (!suffix.isEmpty() && QImageWriter::supportedImageFormats().contains(suffix))
        return suffix;
    return QByteArrayLiteral("png");
}

} // namespace

std::optional<QImage> ImageCropper::crop(const QString& sourcePath, const QRectF& cropRect, ImageCropError* error,
                                         QString* errorMessage)
{
    if (error)
        *error = ImageCropError::None;

    const QFileInfo info(sourcePath);
    if (!info.exists() || !info.isFile() || !info.isReadable()) {
        setFailure(ImageCropError::CannotOpenSource, sourcePath, error, errorMessage);
        return std::nullopt;
    }

    QImageReader reader(sourcePath);
    reader.setAutoTransform(false);
    if (!reader.canRead()) {
        setFailure(ImageCropError::CannotReadImage, reader.errorString(), error, errorMessage);
        return std::nullopt;
    }

    QSize imageSize = reader.size();
    if (!imageSize.isValid()) {
        // Some plugins only know the size after decoding.
        const QImage full = reader.read();
        if (full.isNull()) {
            setFailure(ImageCropError::CannotReadImage, reader.errorString(), error, errorMessage);
            return std::nullopt;
        }
        const QRect rect = pixor::viewer::clampCropRect(cropRect, full.size());
        if (rect.isEmpty()) {
            setFailure(ImageCropError::InvalidCropRect, QString(), error, errorMessage);
            return std::nullopt;
        }
        return full.copy(rect);
    }

    const QRect rect = pixor::viewer::clampCropRect(cropRect, imageSize);
    if (rect.isEmpty()) {
        setFailure(ImageCropError::InvalidCropRect, QString(), error, errorMessage);
        return std::nullopt;
    }

    reader.setClipRect(rect);
    QImage cropped = reader.read();
    if (cropped.isNull()) {
        setFailure(ImageCropError::CannotReadImage, reader.errorString(), error, errorMessage);
        return std::nullopt;
    }
    return cropped;
}

bool ImageCropper::save(const QImage& image, const QString& destinationPath, ImageCropError* error,
                        QString* errorMessage)
{
    if (error)
        *error = ImageCropError::None;
    if (image.isNull()) {
        setFailure(ImageCropError::CannotReadImage, QString(), error, errorMessage);
        return false;
    }

    const QDir dir = QFileInfo(destinationPath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        setFailure(ImageCropError::CannotWrite, dir.absolutePath(), error, errorMessage);
        return false;
    }

    QImageWriter writer(destinationPath, writerFormatFor(destinationPath));
    if (!writer.write(image)) {
        qCWarning(lcViewer) << "Failed to write cropped image" << destinationPath << writer.errorString();
        setFailure(ImageCropError::CannotWrite, writer.errorString(), error, errorMessage);
        return false;
    }
    return true;
}

bool ImageCropper::cropToFile(const QString& sourcePath, const QRectF& cropRect, const QString& destinationPath,
                              ImageCropError* error, QString* errorMessage)
{
    const std::optional<QImage> cropped = crop(sourcePath, cropRect, error, errorMessage);
    if (!cropped)
        return false;
    if (!save(*cropped, destinationPath, error, errorMessage))
        return false;
    qCInfo(lcViewer) << "Cropped" << sourcePath << "to" << destinationPath << cropped->size();
    return true;
}

QString ImageCropper::defaultDestinationPath(const QString& sourcePath)
{
    const QFileInfo info(sourcePath);
    const QDir dir = info.absoluteDir();
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix().isEmpty() ? QStringLiteral("png") : info.suffix();

    QString candidate = dir.filePath(QStringLiteral("%1_cropped.%2").arg(base, suffix));
    int counter = 2;
    while (QFileInfo::exists(candidate)) {
        candidate = dir.filePath(QStringLiteral("%1_cropped_%2.%3").arg(base).arg(counter).arg(suffix));
        ++counter;
    }
    return candidate;
}

QString ImageCropper::errorText(ImageCropError error)
{
    switch (error) {
    case ImageCropError::None:
        return {};
    case ImageCropError::CannotOpenSource:
        return QCoreApplication::translate("ImageCropper", "The source image could not be opened.");
    case ImageCropError::CannotReadImage:
        return QCoreApplication::translate("ImageCropper", "The source image could not be decoded.");
    case ImageCropError::InvalidCropRect:
        return QCoreApplication::translate("ImageCropper", "The crop area lies outside the image.");
    case ImageCropError::CannotWrite:
        return QCoreApplication::translate("ImageCropper", "The cropped image could not be saved.");
    }
    return {};
}
