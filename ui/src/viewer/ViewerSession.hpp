#pragma once

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QRectF>
#include <QSize>
#include <QSizeF>
#include <QStringList>
#include <QTimer>
#include <QUrl>

#include <functional>
#include <optional>

#include "app/AlertContent.hpp"
#include "app/ViewerSettings.hpp"
#include "purchase/FeatureGatekeeper.hpp"
#include "tags/TagFilterEngine.hpp"
#include "tags/TagTypes.hpp"
#include "viewer/ImageTransform.hpp"
#include "viewer/PanZoomMath.hpp"

class ImageBatchLoader;
class TagRepository;
class TagSmartFilterStore;

/**
 * @brief State of one viewer window: image list, selection, per-image
 * transforms, zoom and pan, plus the gated editing actions.
 *
 * Lives on the GUI thread. Directory scanning is delegated to
 * ImageBatchLoader; everything else runs synchronously.
 */
class ViewerSession : public QObject {
    Q_OBJECT
    Q_PROPERTY(QStringList images READ images NOTIFY imagesChanged)
    Q_PROPERTY(int imageCount READ imageCount NOTIFY imagesChanged)
    Q_PROPERTY(int currentIndex READ currentIndex WRITE selectIndex NOTIFY currentIndexChanged)
    Q_PROPERTY(QString currentPath READ currentPath NOTIFY currentIndexChanged)
    Q_PROPERTY(int rotation READ rotationDegrees NOTIFY transformChanged)
    Q_PROPERTY(bool mirroredHorizontally READ mirroredHorizontally NOTIFY transformChanged)
    Q_PROPERTY(bool mirroredVertically READ mirroredVertically NOTIFY transformChanged)
    Q_PROPERTY(double scale READ scale NOTIFY zoomChanged)
    Q_PROPERTY(QPointF offset READ offset NOTIFY zoomChanged)
    Q_PROPERTY(bool minimapVisible READ minimapVisible NOTIFY zoomChanged)
    Q_PROPERTY(QSizeF viewSize READ viewSize WRITE setViewSize NOTIFY viewSizeChanged)
    Q_PROPERTY(QSize imageSize READ imageSize NOTIFY imageSizeChanged)
    Q_PROPERTY(bool infoPanelVisible READ infoPanelVisible WRITE setInfoPanelVisible NOTIFY infoPanelVisibleChanged)
    Q_PROPERTY(bool slideshowActive READ slideshowActive NOTIFY slideshowActiveChanged)
    Q_PROPERTY(bool loading READ loading NOTIFY loadingChanged)
    Q_PROPERTY(QStringList currentTagNames READ currentTagNames NOTIFY currentTagsChanged)
    Q_PROPERTY(bool tagFilterActive READ tagFilterActive NOTIFY tagFilterChanged)

public:
    //! Removes @p path; moves it to the trash unless @p permanently is set.
    using FileRemover = std::function<bool(const QString& path, bool permanently, QString* errorMessage)>;

    explicit ViewerSession(QObject* parent = nullptr);
    ~ViewerSession() override;

    void setSettings(ViewerSettings* settings);
    ViewerSettings* settings();
    void setGatekeeper(FeatureGatekeeper* gatekeeper);
    void setTagRepository(TagRepository* repository);
    void setSmartFilterStore(TagSmartFilterStore* store);
    ImageBatchLoader* loader() const { return m_loader; }

    // Image list and selection
    QStringList images() const { return m_images; }
    QStringList allImages() const { return m_allImages; }
    int imageCount() const { return static_cast<int>(m_images.size()); }
    int currentIndex() const { return m_currentIndex; }
    QString currentPath() const;

    //! Replaces the list. Keeps @p preferredPath selected when present, else the current image, else the index.
    void setImages(const QStringList& paths, const QString& preferredPath = QString());
    Q_INVOKABLE void openPaths(const QStringList& inputs);
    //! Overrides ViewerSettings::scanRecursively() for this session without persisting it.
    void setRecursiveScanOverride(std::optional<bool> recursive) { m_recursiveOverride = recursive; }
    Q_INVOKABLE void openUrls(const QList<QUrl>& urls);

    Q_INVOKABLE bool selectIndex(int index);
    Q_INVOKABLE bool selectPath(const QString& path);
    Q_INVOKABLE bool navigateNext();
    Q_INVOKABLE bool navigatePrevious();

    // Transforms
    ImageTransform transform() const;
    ImageTransform transformFor(const QString& path) const;
    int rotationDegrees() const { return pixor::viewer::degrees(transform().rotation); }
    bool mirroredHorizontally() const { return transform().mirrorH; }
    bool mirroredVertically() const { return transform().mirrorV; }

    Q_INVOKABLE bool rotateClockwise();
    Q_INVOKABLE bool rotateCounterclockwise();
    Q_INVOKABLE bool mirrorHorizontal();
    Q_INVOKABLE bool mirrorVertical();
    Q_INVOKABLE bool resetTransform();

    // Zoom and pan
    double scale() const { return m_zoom.scale; }
    QPointF offset() const { return m_zoom.offset; }
    QSizeF viewSize() const { return m_viewSize; }
    void setViewSize(const QSizeF& size);
    QSize imageSize() const { return m_imageSize; }
    //! Image size after rotation, as laid out on screen.
    QSizeF displayedImageSize() const;
    std::optional<qreal> baseFitScale() const;
    bool minimapVisible() const;

    Q_INVOKABLE void zoomByWheel(qreal deltaY, const QPointF& location);
    Q_INVOKABLE void beginMagnification();
    Q_INVOKABLE void zoomByMagnification(qreal magnification, const QPointF& location);
    Q_INVOKABLE void endMagnification();
    Q_INVOKABLE void panBy(const QPointF& delta);
    Q_INVOKABLE void resetZoom();
    //! Visible part of the current image in stored pixel coordinates.
    Q_INVOKABLE QRectF visibleImageRect() const;

    // Crop
    //! Writes the cropped image; returns the destination path or an empty string.
    Q_INVOKABLE QString cropCurrent(const QRectF& rect, const QString& destinationPath = QString());

    // Deletion
    Q_INVOKABLE bool deleteCurrent();
    Q_INVOKABLE bool confirmDeletion(bool permanently = false);
    Q_INVOKABLE void cancelDeletion();
    QString pendingDeletion() const { return m_pendingDeletion; }
    void setFileRemoverForTesting(FileRemover remover);

    // Info panel
    bool infoPanelVisible() const { return m_infoPanelVisible; }
    void setInfoPanelVisible(bool visible);
    Q_INVOKABLE bool toggleInfoPanel();
    //! Hides the panel; returns false when it was not visible.
    Q_INVOKABLE bool closeInfoPanel();

    // Slideshow
    bool slideshowActive() const { return m_slideshowTimer.isActive(); }
    Q_INVOKABLE bool startSlideshow();
    Q_INVOKABLE void stopSlideshow();
    Q_INVOKABLE bool toggleSlideshow();

    // Tags
    QList<TagRecord> currentTags() const;
    QStringList currentTagNames() const;
    Q_INVOKABLE bool assignTagToCurrent(const QString& name);
    Q_INVOKABLE bool unassignTagFromCurrent(const QString& name);
    QList<TagRecord> recommendedTagsForCurrent(int limit) const;
    TagFilter tagFilter() const { return m_tagFilter; }
    void setTagFilter(const TagFilter& filter);
    bool tagFilterActive() const { return m_tagFilter.isActive(); }
    //! Filters by the named tags; unknown names are skipped. @p modeName is "any", "all" or "exclude".
    Q_INVOKABLE bool filterByTagNames(const QStringList& names, const QString& modeName = QStringLiteral("any"));
    Q_INVOKABLE void clearTagFilter();
    //! Stores the active filter under @p name; failures are reported through alertRaised().
    Q_INVOKABLE bool saveTagFilter(const QString& name);
    //! Makes the saved filter active and moves it to the top of the store.
    Q_INVOKABLE bool applySavedFilter(const QString& id);

    bool loading() const;

signals:
    void imagesChanged();
    void currentIndexChanged();
    void transformChanged();
    void zoomChanged();
    void viewSizeChanged();
    void imageSizeChanged();
    void infoPanelVisibleChanged();
    void slideshowActiveChanged();
    void loadingChanged();
    void currentTagsChanged();
    void tagFilterChanged();
    void deletionConfirmationRequested(const QString& path);
    void imageDeleted(const QString& path);
    void cropSaved(const QString& destinationPath);
    void alertRaised(const AlertContent& alert);

private:
    bool gate(AppFeature feature, UpgradePromptContext context, const std::function<void()>& action);
    void applyTransform(const ImageTransform& transform);
    void applyScale(qreal targetScale, const std::optional<QPointF>& anchor);
    void clampCurrentOffset();
    void setCurrentIndexInternal(int index, const QString& previousPath);
    void refreshImageSize();
    void rebuildVisibleImages(const QString& preferredPath);
    const ViewerSettings& prefs() const;
    bool deleteImage(const QString& path, bool permanently);
    bool removeFile(const QString& path, bool permanently, QString* errorMessage);
    void handleBatchLoaded(const QStringList& paths, const QStringList& inputs);
    void advanceSlideshow();
    void raiseAlert(const QString& title, const QString& message);

    ViewerSettings m_defaultSettings;
    QPointer<ViewerSettings> m_settings;
    QPointer<FeatureGatekeeper> m_gatekeeper;
    QPointer<TagRepository> m_tags;
    QMetaObject::Connection m_tagsConnection;
    QPointer<TagSmartFilterStore> m_smartFilters;
    ImageBatchLoader* m_loader = nullptr;

    QStringList m_allImages;
    QStringList m_images;
    int m_currentIndex = -1;
    QHash<QString, ImageTransform> m_transforms;
    TagFilter m_tagFilter;
    TagFilterEngine m_filterEngine;

    pixor::viewer::panzoom::PanZoomState m_zoom = pixor::viewer::panzoom::defaultState();
    QSizeF m_viewSize;
    QSize m_imageSize;

    std::optional<bool> m_recursiveOverride;
    QString m_pendingDeletion;
    FileRemover m_fileRemover;

    bool m_infoPanelVisible = false;
    QTimer m_slideshowTimer;
};
