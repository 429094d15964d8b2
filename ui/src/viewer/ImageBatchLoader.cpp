#include "ImageBatchLoader.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QLoggingCategory>
#include <QSet>
#include <QThreadPool>
#include <QtConcurrent>

#include <algorithm>
#include <utility>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcViewer, "pixor.viewer")

namespace pixor::viewer {

namespace {

void appendImagesIn(const QString& directory, bool recursive, QStringList& collected)
{
    const QDir::Filters filters = QDir::Files | QDir::NoDotAndDotDot;
    QDirIterator it(directory, filters, recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
    while (it.hasNext()) {
        const QString path = it.next();
        const QFileInfo info = it.fileInfo();
        if (info.isHidden() || !info.isFile())
            continue;
        if (isSupportedImage(path))
            collected.append(path);
    }
}

} // namespace

const QStringList& supportedImageExtensions()
{
    static const QStringList extensions = {
        QStringLiteral("jpg"),  QStringLiteral("jpeg"), QStringLiteral("png"), QStringLiteral("gif"),
        QStringLiteral("heic"), QStringLiteral("heif"), QStringLiteral("tiff"), QStringLiteral("tif"),
        QStringLiteral("webp"), QStringLiteral("bmp"),
    };
    return extensions;
}

bool isSupportedImage(const QString& path)
{
    return supportedImageExtensions().contains(QFileInfo(path).suffix().toLower());
}

QStringList resolveImagePaths(const QStringList& inputs, bool recursive)
{
    QStringList collected;
    for (const QString& input : inputs) {
        if (input.trimmed().isEmpty())
            continue;
        const QString normalized = utils::standardizedPath(input);
        const QFileInfo info(normalized);
        if (info.isDir()) {
            appendImagesIn(normalized, recursive, collected);
        } else if (info.isFile()) {
            if (isSupportedImage(normalized))
                collected.append(normalized);
        } else {
            qCDebug(lcViewer) << "Skipping missing input" << normalized;
        }
    }

    QSet<QString> seen;
    QList<std::pair<int, QString>> unique;
    unique.reserve(collected.size());
    for (const QString& path : std::as_const(collected)) {
        const QString key = utils::standardizedPath(path);
        if (seen.contains(key))
            continue;
        seen.insert(key);
        unique.append({static_cast<int>(unique.size()), key});
    }

    std::stable_sort(unique.begin(), unique.end(), [](const auto& lhs, const auto& rhs) {
        const QFileInfo left(lhs.second);
        const QFileInfo right(rhs.second);
        const QString leftDir = left.absolutePath();
        const QString rightDir = right.absolutePath();
        if (leftDir != rightDir)
            return utils::naturalLessThan(leftDir, rightDir);
        const int nameOrder = utils::naturalCompare(left.fileName(), right.fileName());
        if (nameOrder != 0)
            return nameOrder < 0;
        return lhs.first < rhs.first;
    });

    QStringList result;
    result.reserve(unique.size());
    for (const auto& entry : std::as_const(unique))
        result.append(entry.second);
    return result;
}

} // namespace pixor::viewer

ImageBatchLoader::ImageBatchLoader(QObject* parent)
    : QObject(parent)
{
}

ImageBatchLoader::~ImageBatchLoader()
{
    // Outstanding watchers are children of this object; bump the generation so late results are ignored.
    ++m_generation;
}

void ImageBatchLoader::setRecursive(bool recursive)
{
    if (m_recursive == recursive)
        return;
    m_recursive = recursive;
    emit recursiveChanged();
}

void ImageBatchLoader::setThreadPoolForTesting(QThreadPool* pool)
{
    m_threadPool = pool;
}

quint64 ImageBatchLoader::load(const QStringList& inputs)
{
    const quint64 generation = ++m_generation;
    const bool recursive = m_recursive;
    const bool wasBusy = busy();
    ++m_pending;
    if (!wasBusy)
        emit busyChanged();

    qCDebug(lcViewer) << "Resolving" << inputs.size() << "inputs, request" << generation;

    auto* watcher = new QFutureWatcher<QStringList>(this);
    connect(watcher, &QFutureWatcher<QStringList>::finished, this, [this, watcher, generation, inputs]() {
        const QStringList paths = watcher->result();
        watcher->deleteLater();
        --m_pending;
        if (generation == m_generation) {
            qCInfo(lcViewer) << "Resolved" << paths.size() << "images";
            emit loaded(paths, inputs);
        } else {
            qCDebug(lcViewer) << "Dropping stale image list from request" << generation;
        }
        if (!busy())
            emit busyChanged();
    });

    watcher->setFuture(QtConcurrent::run(m_threadPool ? m_threadPool : QThreadPool::globalInstance(),
                                         [inputs, recursive]() {
                                             return pixor::viewer::resolveImagePaths(inputs, recursive);
                                         }));
    return generation;
}

void ImageBatchLoader::cancel()
{
    ++m_generation;
}
