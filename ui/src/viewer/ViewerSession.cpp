#include "ViewerSession.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>
#include <QLoggingCategory>
#include <QSet>

#include <algorithm>

#include "tags/TagRecommendationEngine.hpp"
#include "tags/TagRepository.hpp"
#include "tags/TagSmartFilterStore.hpp"
#include "utils/PathUtils.hpp"
#include "viewer/CropMath.hpp"
#include "viewer/ImageBatchLoader.hpp"
#include "viewer/ImageCropper.hpp"

Q_DECLARE_LOGGING_CATEGORY(lcViewer)

namespace panzoom = pixor::viewer::panzoom;

ViewerSession::ViewerSession(QObject* parent)
    : QObject(parent)
    , m_loader(new ImageBatchLoader(this))
{
    connect(m_loader, &ImageBatchLoader::loaded, this, &ViewerSession::handleBatchLoaded);
    connect(m_loader, &ImageBatchLoader::busyChanged, this, &ViewerSession::loadingChanged);

    m_slideshowTimer.setSingleShot(false);
    connect(&m_slideshowTimer, &QTimer::timeout, this, &ViewerSession::advanceSlideshow);
}

ViewerSession::~ViewerSession() = default;

void ViewerSession::setSettings(ViewerSettings* settings)
{
    if (m_settings == settings)
        return;
    if (m_settings)
        disconnect(m_settings.data(), nullptr, this, nullptr);
    m_settings = settings;
    if (m_settings) {
        connect(m_settings, &ViewerSettings::zoomChanged, this, [this]() {
            const qreal clamped = panzoom::clampScale(m_zoom.scale, prefs().minZoomScale(), prefs().maxZoomScale());
            if (!qFuzzyCompare(clamped, m_zoom.scale))
                applyScale(clamped, std::nullopt);
        });
        connect(m_settings, &ViewerSettings::showMinimapChanged, this, &ViewerSession::zoomChanged);
        connect(m_settings, &ViewerSettings::slideshowChanged, this, [this]() {
            if (m_slideshowTimer.isActive())
                m_slideshowTimer.setInterval(static_cast<int>(prefs().slideshowIntervalSeconds() * 1000.0));
        });
    }
}

ViewerSettings* ViewerSession::settings()
{
    return m_settings ? m_settings.data() : &m_defaultSettings;
}

const ViewerSettings& ViewerSession::prefs() const
{
    return m_settings ? *m_settings : m_defaultSettings;
}

void ViewerSession::setGatekeeper(FeatureGatekeeper* gatekeeper)
{
    m_gatekeeper = gatekeeper;
}

void ViewerSession::setTagRepository(TagRepository* repository)
{
    if (m_tags == repository)
        return;
    disconnect(m_tagsConnection);
    m_tags = repository;
    m_filterEngine.invalidateCache();
    if (m_tags) {
        m_tagsConnection = connect(m_tags, &TagRepository::tagsChanged, this, [this]() {
            if (m_tagFilter.isActive())
                rebuildVisibleImages(QString());
            emit currentTagsChanged();
        });
    }
    emit currentTagsChanged();
}

void ViewerSession::setSmartFilterStore(TagSmartFilterStore* store)
{
    m_smartFilters = store;
}

QString ViewerSession::currentPath() const
{
    if (m_currentIndex < 0 || m_currentIndex >= m_images.size())
        return {};
    return m_images.at(m_currentIndex);
}

bool ViewerSession::loading() const
{
    return m_loader->busy();
}

void ViewerSession::setImages(const QStringList& paths, const QString& preferredPath)
{
    QStringList cleaned;
    cleaned.reserve(paths.size());
    QSet<QString> seen;
    for (const QString& path : paths) {
        const QString standardized = pixor::utils::standardizedPath(path);
        if (standardized.isEmpty() || seen.contains(standardized))
            continue;
        seen.insert(standardized);
        cleaned.append(standardized);
    }

    if (cleaned != m_allImages) {
        m_transforms.clear();
        m_allImages = cleaned;
    }
    rebuildVisibleImages(preferredPath.isEmpty() ? QString() : pixor::utils::standardizedPath(preferredPath));

    if (m_images.size() < 2)
        stopSlideshow();
}

void ViewerSession::rebuildVisibleImages(const QString& preferredPath)
{
    const QString previousPath = currentPath();
    const int previousIndex = m_currentIndex;

    QStringList visible = m_allImages;
    if (m_tags && m_tagFilter.isActive())
        visible = m_filterEngine.filteredPaths(m_tagFilter, m_allImages, m_tags->assignments(), m_tags->version());

    const bool listChanged = visible != m_images;
    m_images = visible;

    int index = -1;
    if (!m_images.isEmpty()) {
        if (!preferredPath.isEmpty())
            index = static_cast<int>(m_images.indexOf(preferredPath));
        if (index < 0 && !previousPath.isEmpty())
            index = static_cast<int>(m_images.indexOf(previousPath));
        if (index < 0)
            index = std::clamp(previousIndex, 0, static_cast<int>(m_images.size()) - 1);
    }

    if (listChanged)
        emit imagesChanged();
    setCurrentIndexInternal(index, previousPath);
}

void ViewerSession::setCurrentIndexInternal(int index, const QString& previousPath)
{
    const int previousIndex = m_currentIndex;
    m_currentIndex = index;
    if (previousIndex == index && previousPath == currentPath())
        return;

    m_zoom = panzoom::defaultState();
    refreshImageSize();
    emit currentIndexChanged();
    emit transformChanged();
    emit zoomChanged();
    emit currentTagsChanged();
}

void ViewerSession::refreshImageSize()
{
    QSize size;
    const QString path = currentPath();
    if (!path.isEmpty()) {
        QImageReader reader(path);
        reader.setAutoTransform(false);
        size = reader.size();
        if (!size.isValid())
            qCDebug(lcViewer) << "Image size unavailable for" << path << reader.errorString();
    }
    if (size == m_imageSize)
        return;
    m_imageSize = size;
    emit imageSizeChanged();
}

void ViewerSession::openPaths(const QStringList& inputs)
{
    QStringList expanded;
    for (const QString& input : inputs) {
        if (!input.trimmed().isEmpty())
            expanded.append(pixor::utils::expandPath(input));
    }
    if (expanded.isEmpty())
        return;
    m_loader->setRecursive(m_recursiveOverride.value_or(prefs().scanRecursively()));
    m_loader->load(expanded);
}

void ViewerSession::openUrls(const QList<QUrl>& urls)
{
    QStringList paths;
    for (const QUrl& url : urls) {
        if (url.isLocalFile())
            paths.append(url.toLocalFile());
        else
            qCDebug(lcViewer) << "Ignoring non-local url" << url;
    }
    openPaths(paths);
}

void ViewerSession::handleBatchLoaded(const QStringList& paths, const QStringList& inputs)
{
    if (paths.isEmpty()) {
        qCInfo(lcViewer) << "No supported images in" << inputs;
        raiseAlert(tr("No images found"),
                   tr("None of the opened items contain a supported image."));
        return;
    }

    // The first file opened explicitly is selected.
    QString preferred;
    for (const QString& input : inputs) {
        if (QFileInfo(input).isFile()) {
            preferred = input;
            break;
        }
    }
    qCDebug(lcViewer) << "Loaded" << paths.size() << "images";
    setImages(paths, preferred);
}

bool ViewerSession::selectIndex(int index)
{
    if (index < 0 || index >= m_images.size())
        return false;
    setCurrentIndexInternal(index, currentPath());
    return true;
}

bool ViewerSession::selectPath(const QString& path)
{
    const int index = static_cast<int>(m_images.indexOf(pixor::utils::standardizedPath(path)));
    return selectIndex(index);
}

bool ViewerSession::navigateNext()
{
    const int count = imageCount();
    if (count < 2 || m_currentIndex < 0)
        return false;
    return selectIndex((m_currentIndex + 1) % count);
}

bool ViewerSession::navigatePrevious()
{
    const int count = imageCount();
    if (count < 2 || m_currentIndex < 0)
        return false;
    return selectIndex((m_currentIndex - 1 + count) % count);
}

ImageTransform ViewerSession::transform() const
{
    return transformFor(currentPath());
}

ImageTransform ViewerSession::transformFor(const QString& path) const
{
    return m_transforms.value(path, ImageTransform::identity());
}

bool ViewerSession::gate(AppFeature feature, UpgradePromptContext context, const std::function<void()>& action)
{
    if (!m_gatekeeper) {
        action();
        return true;
    }
    return m_gatekeeper->perform(feature, context, action);
}

bool ViewerSession::rotateClockwise()
{
    if (currentPath().isEmpty())
        return false;
    return gate(AppFeature::Transform, UpgradePromptContext::Transform,
                [this]() { applyTransform(transform().rotatedClockwise()); });
}

bool ViewerSession::rotateCounterclockwise()
{
    if (currentPath().isEmpty())
        return false;
    return gate(AppFeature::Transform, UpgradePromptContext::Transform,
                [this]() { applyTransform(transform().rotatedCounterclockwise()); });
}

bool ViewerSession::mirrorHorizontal()
{
    if (currentPath().isEmpty())
        return false;
    return gate(AppFeature::Transform, UpgradePromptContext::Transform,
                [this]() { applyTransform(transform().mirroredHorizontally()); });
}

bool ViewerSession::mirrorVertical()
{
    if (currentPath().isEmpty())
        return false;
    return gate(AppFeature::Transform, UpgradePromptContext::Transform,
                [this]() { applyTransform(transform().mirroredVertically()); });
}

bool ViewerSession::resetTransform()
{
    if (currentPath().isEmpty())
        return false;
    return gate(AppFeature::Transform, UpgradePromptContext::Transform,
                [this]() { applyTransform(ImageTransform::identity()); });
}

void ViewerSession::applyTransform(const ImageTransform& transform)
{
    const QString path = currentPath();
    if (transform == transformFor(path))
        return;
    if (transform.isIdentity())
        m_transforms.remove(path);
    else
        m_transforms.insert(path, transform);
    m_zoom = panzoom::defaultState();
    emit transformChanged();
    emit zoomChanged();
}

void ViewerSession::setViewSize(const QSizeF& size)
{
    if (m_viewSize == size)
        return;
    m_viewSize = size;
    clampCurrentOffset();
    emit viewSizeChanged();
    emit zoomChanged();
}

QSizeF ViewerSession::displayedImageSize() const
{
    if (!m_imageSize.isValid())
        return {};
    if (transform().swapsAxes())
        return QSizeF(m_imageSize.height(), m_imageSize.width());
    return QSizeF(m_imageSize);
}

std::optional<qreal> ViewerSession::baseFitScale() const
{
    return panzoom::computeFitScale(m_viewSize, displayedImageSize());
}

bool ViewerSession::minimapVisible() const
{
    if (!prefs().showMinimap())
        return false;
    const auto fit = baseFitScale();
    return fit && panzoom::shouldShowMinimap(m_viewSize, displayedImageSize(), *fit, m_zoom.scale);
}

void ViewerSession::zoomByWheel(qreal deltaY, const QPointF& location)
{
    const qreal target = panzoom::scaleByWheel(m_zoom.scale, deltaY, prefs().zoomSensitivity(),
                                               prefs().minZoomScale(), prefs().maxZoomScale());
    applyScale(target, location);
    m_zoom.lastScale = m_zoom.scale;
    m_zoom.lastOffset = m_zoom.offset;
}

void ViewerSession::beginMagnification()
{
    m_zoom.lastScale = m_zoom.scale;
    m_zoom.lastOffset = m_zoom.offset;
}

void ViewerSession::zoomByMagnification(qreal magnification, const QPointF& location)
{
    const qreal target = panzoom::scaleByMagnification(m_zoom.lastScale, magnification, prefs().minZoomScale(),
                                                       prefs().maxZoomScale());
    applyScale(target, location);
}

void ViewerSession::endMagnification()
{
    m_zoom.lastScale = m_zoom.scale;
    m_zoom.lastOffset = m_zoom.offset;
}

void ViewerSession::applyScale(qreal targetScale, const std::optional<QPointF>& anchor)
{
    const auto fit = baseFitScale();
    if (!fit) {
        m_zoom.scale = targetScale;
        emit zoomChanged();
        return;
    }

    QPointF offset = m_zoom.offset * (m_zoom.scale > 0 ? targetScale / m_zoom.scale : 1.0);
    if (anchor && prefs().zoomAnchorsToPointer()) {
        const auto vectors = panzoom::focusVectors(*anchor, m_viewSize, m_zoom.offset, *fit, m_zoom.scale, transform());
        if (vectors)
            offset = panzoom::offsetKeepingFocus(vectors->viewVector, vectors->baseVector, *fit, targetScale,
                                                 transform());
    }
    m_zoom.scale = targetScale;
    m_zoom.offset = panzoom::clampOffset(offset, panzoom::maxOffset(m_viewSize, displayedImageSize(), *fit, targetScale));
    emit zoomChanged();
}

void ViewerSession::clampCurrentOffset()
{
    const auto fit = baseFitScale();
    if (!fit)
        return;
    m_zoom.offset = panzoom::clampOffset(m_zoom.offset,
                                         panzoom::maxOffset(m_viewSize, displayedImageSize(), *fit, m_zoom.scale));
}

void ViewerSession::panBy(const QPointF& delta)
{
    const auto fit = baseFitScale();
    if (!fit)
        return;
    const QPointF clamped = panzoom::clampOffset(
        m_zoom.offset + delta, panzoom::maxOffset(m_viewSize, displayedImageSize(), *fit, m_zoom.scale));
    if (clamped == m_zoom.offset)
        return;
    m_zoom.offset = clamped;
    m_zoom.lastOffset = clamped;
    emit zoomChanged();
}

void ViewerSession::resetZoom()
{
    m_zoom = panzoom::defaultState();
    emit zoomChanged();
}

QRectF ViewerSession::visibleImageRect() const
{
    if (!m_imageSize.isValid())
        return {};
    const auto fit = baseFitScale();
    if (!fit)
        return QRectF(QPointF(0, 0), QSizeF(m_imageSize));
    return panzoom::visibleRectInOriginalImage(m_viewSize, QSizeF(m_imageSize), m_zoom.offset, *fit, m_zoom.scale,
                                               transform());
}

QString ViewerSession::cropCurrent(const QRectF& rect, const QString& destinationPath)
{
    const QString source = currentPath();
    if (source.isEmpty())
        return {};

    QString saved;
    gate(AppFeature::Crop, UpgradePromptContext::Crop, [&]() {
        const QRect pixels = pixor::viewer::clampCropRect(rect, m_imageSize);
        if (pixels.isEmpty()) {
            raiseAlert(tr("Crop failed"), ImageCropper::errorText(ImageCropError::InvalidCropRect));
            return;
        }
        const QString destination = destinationPath.isEmpty() ? ImageCropper::defaultDestinationPath(source)
                                                              : pixor::utils::expandPath(destinationPath);
        ImageCropError error = ImageCropError::None;
        QString message;
        if (!ImageCropper::cropToFile(source, pixels, destination, &error, &message)) {
            raiseAlert(tr("Crop failed"), message.isEmpty() ? ImageCropper::errorText(error) : message);
            return;
        }
        qCInfo(lcViewer) << "Saved crop of" << source << "to" << destination;
        saved = destination;
        emit cropSaved(destination);
    });
    return saved;
}

bool ViewerSession::deleteCurrent()
{
    const QString path = currentPath();
    if (path.isEmpty())
        return false;
    if (prefs().deleteConfirmationEnabled()) {
        m_pendingDeletion = path;
        emit deletionConfirmationRequested(path);
        return false;
    }
    return deleteImage(path, false);
}

bool ViewerSession::confirmDeletion(bool permanently)
{
    if (m_pendingDeletion.isEmpty())
        return false;
    const QString path = m_pendingDeletion;
    m_pendingDeletion.clear();
    return deleteImage(path, permanently);
}

void ViewerSession::cancelDeletion()
{
    m_pendingDeletion.clear();
}

void ViewerSession::setFileRemoverForTesting(FileRemover remover)
{
    m_fileRemover = std::move(remover);
}

bool ViewerSession::removeFile(const QString& path, bool permanently, QString* errorMessage)
{
    if (m_fileRemover)
        return m_fileRemover(path, permanently, errorMessage);

    QFile file(path);
    if (!permanently) {
        if (file.moveToTrash())
            return true;
        qCInfo(lcViewer) << "Moving" << path << "to the trash failed, removing it:" << file.errorString();
    }
    if (file.remove())
        return true;
    if (errorMessage)
        *errorMessage = tr("Cannot delete %1: %2").arg(QDir::toNativeSeparators(path), file.errorString());
    return false;
}

bool ViewerSession::deleteImage(const QString& path, bool permanently)
{
    QString error;
    if (!removeFile(path, permanently, &error)) {
        qCWarning(lcViewer) << "Failed to delete" << path << error;
        raiseAlert(tr("Delete failed"), error);
        return false;
    }

    const QString previousPath = currentPath();
    const int previousIndex = m_currentIndex;
    m_allImages.removeAll(path);
    m_transforms.remove(path);
    if (m_images.removeAll(path) > 0) {
        emit imagesChanged();
        const int index = m_images.isEmpty() ? -1 : std::min(previousIndex, static_cast<int>(m_images.size()) - 1);
        setCurrentIndexInternal(index, previousPath);
    }
    if (m_images.size() < 2)
        stopSlideshow();

    if (m_tags) {
        QString tagError;
        if (!m_tags->removeImage(path, &tagError))
            qCWarning(lcViewer) << "Failed to drop tags of deleted image" << path << tagError;
    }
    emit imageDeleted(path);
    return true;
}

void ViewerSession::setInfoPanelVisible(bool visible)
{
    if (m_infoPanelVisible == visible)
        return;
    if (!visible) {
        m_infoPanelVisible = false;
        emit infoPanelVisibleChanged();
        return;
    }
    gate(AppFeature::Exif, UpgradePromptContext::Exif, [this]() {
        m_infoPanelVisible = true;
        emit infoPanelVisibleChanged();
    });
}

bool ViewerSession::toggleInfoPanel()
{
    setInfoPanelVisible(!m_infoPanelVisible);
    return m_infoPanelVisible;
}

bool ViewerSession::closeInfoPanel()
{
    if (!m_infoPanelVisible)
        return false;
    setInfoPanelVisible(false);
    return true;
}

bool ViewerSession::startSlideshow()
{
    if (m_slideshowTimer.isActive())
        return true;
    if (imageCount() < 2)
        return false;
    return gate(AppFeature::Slideshow, UpgradePromptContext::Slideshow, [this]() {
        m_slideshowTimer.start(static_cast<int>(prefs().slideshowIntervalSeconds() * 1000.0));
        emit slideshowActiveChanged();
    });
}

void ViewerSession::stopSlideshow()
{
    if (!m_slideshowTimer.isActive())
        return;
    m_slideshowTimer.stop();
    emit slideshowActiveChanged();
}

bool ViewerSession::toggleSlideshow()
{
    if (m_slideshowTimer.isActive()) {
        stopSlideshow();
        return false;
    }
    return startSlideshow();
}

void ViewerSession::advanceSlideshow()
{
    if (imageCount() < 2 || (m_currentIndex == imageCount() - 1 && !prefs().slideshowLoop())) {
        stopSlideshow();
        return;
    }
    navigateNext();
}

QList<TagRecord> ViewerSession::currentTags() const
{
    const QString path = currentPath();
    if (!m_tags || path.isEmpty())
        return {};
    return m_tags->tagsFor(path);
}

QStringList ViewerSession::currentTagNames() const
{
    QStringList names;
    for (const TagRecord& tag : currentTags())
        names.append(tag.name);
    return names;
}

bool ViewerSession::assignTagToCurrent(const QString& name)
{
    const QString path = currentPath();
    if (!m_tags || path.isEmpty() || name.trimmed().isEmpty())
        return false;

    bool assigned = false;
    gate(AppFeature::Tags, UpgradePromptContext::Tags, [&]() {
        QString error;
        const auto tag = m_tags->ensureTag(name, &error);
        if (!tag || !m_tags->assign(tag->id, path, &error)) {
            raiseAlert(tr("Tag not saved"), error);
            return;
        }
        assigned = true;
    });
    return assigned;
}

bool ViewerSession::unassignTagFromCurrent(const QString& name)
{
    const QString path = currentPath();
    if (!m_tags || path.isEmpty())
        return false;

    bool removed = false;
    gate(AppFeature::Tags, UpgradePromptContext::Tags, [&]() {
        const auto tag = m_tags->tagNamed(name);
        if (!tag)
            return;
        QString error;
        if (!m_tags->unassign(tag->id, path, &error)) {
            raiseAlert(tr("Tag not saved"), error);
            return;
        }
        removed = true;
    });
    return removed;
}

QList<TagRecord> ViewerSession::recommendedTagsForCurrent(int limit) const
{
    const QString path = currentPath();
    if (!m_tags || path.isEmpty())
        return {};
    return pixor::tags::recommendedTags(*m_tags, path, m_allImages, limit);
}

void ViewerSession::setTagFilter(const TagFilter& filter)
{
    TagFilter effective = filter;
    if (m_tags) {
        QSet<qint64> available;
        for (const TagRecord& tag : m_tags->allTags())
            available.insert(tag.id);
        effective = TagFilterEngine::prunedFilter(filter, available);
    }
    if (effective == m_tagFilter)
        return;
    m_tagFilter = effective;
    rebuildVisibleImages(QString());
    emit tagFilterChanged();
}

bool ViewerSession::filterByTagNames(const QStringList& names, const QString& modeName)
{
    if (!m_tags)
        return false;
    TagFilter filter;
    filter.mode = pixor::tags::filterModeFromName(modeName).value_or(TagFilterMode::Any);
    for (const QString& name : names) {
        if (const auto tag = m_tags->tagNamed(name))
            filter.tagIds.insert(tag->id);
    }
    if (filter.tagIds.isEmpty())
        return false;
    setTagFilter(filter);
    return true;
}

void ViewerSession::clearTagFilter()
{
    setTagFilter(TagFilter());
}

bool ViewerSession::saveTagFilter(const QString& name)
{
    if (!m_smartFilters || !m_tagFilter.isActive() || name.trimmed().isEmpty())
        return false;

    bool saved = false;
    gate(AppFeature::Tags, UpgradePromptContext::Tags, [&]() {
        QString error;
        const SmartFilterResult result =
            m_smartFilters->saveFilter(pixor::tags::sanitizedFilter(m_tagFilter), name, &error);
        if (result != SmartFilterResult::Ok) {
            if (result != SmartFilterResult::Ignored)
                raiseAlert(tr("Filter not saved"), error);
            return;
        }
        saved = true;
    });
    return saved;
}

bool ViewerSession::applySavedFilter(const QString& id)
{
    if (!m_smartFilters)
        return false;
    const QUuid uuid = QUuid::fromString(id);
    const auto entry = m_smartFilters->filter(uuid);
    if (!entry)
        return false;

    setTagFilter(entry->filter);
    QString error;
    if (!m_smartFilters->promote(uuid, &error))
        qCWarning(lcViewer) << "Cannot move saved filter to the top:" << error;
    return true;
}

void ViewerSession::raiseAlert(const QString& title, const QString& message)
{
    emit alertRaised(AlertContent{title, message});
}
