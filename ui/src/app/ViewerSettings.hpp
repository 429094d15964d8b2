#pragma once

#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QTimer>

#include "viewer/CropMath.hpp"
#include "viewer/ImageNavigation.hpp"

class ShortcutCatalog;

/**
 * @brief User preferences of the viewer, persisted as a JSON document.
 *
 * Setters clamp their input to the valid range. Every change schedules a
 * debounced save when persistence is enabled; the shortcut bindings are
 * stored alongside when a ShortcutCatalog is attached.
 */
class ViewerSettings : public QObject {
    Q_OBJECT
    Q_PROPERTY(QString navigationMode READ navigationModeName WRITE setNavigationModeName NOTIFY navigationModeChanged)
    Q_PROPERTY(bool deleteConfirmationEnabled READ deleteConfirmationEnabled WRITE setDeleteConfirmationEnabled NOTIFY deleteOptionsChanged)
    Q_PROPERTY(bool deleteBackspaceEnabled READ deleteBackspaceEnabled WRITE setDeleteBackspaceEnabled NOTIFY deleteOptionsChanged)
    Q_PROPERTY(bool deleteForwardEnabled READ deleteForwardEnabled WRITE setDeleteForwardEnabled NOTIFY deleteOptionsChanged)
    Q_PROPERTY(double zoomSensitivity READ zoomSensitivity WRITE setZoomSensitivity NOTIFY zoomChanged)
    Q_PROPERTY(bool zoomAnchorsToPointer READ zoomAnchorsToPointer WRITE setZoomAnchorsToPointer NOTIFY zoomChanged)
    Q_PROPERTY(double minZoomScale READ minZoomScale WRITE setMinZoomScale NOTIFY zoomChanged)
    Q_PROPERTY(double maxZoomScale READ maxZoomScale WRITE setMaxZoomScale NOTIFY zoomChanged)
    Q_PROPERTY(bool showMinimap READ showMinimap WRITE setShowMinimap NOTIFY showMinimapChanged)
    Q_PROPERTY(bool scanRecursively READ scanRecursively WRITE setScanRecursively NOTIFY scanRecursivelyChanged)
    Q_PROPERTY(double slideshowIntervalSeconds READ slideshowIntervalSeconds WRITE setSlideshowIntervalSeconds NOTIFY slideshowChanged)
    Q_PROPERTY(bool slideshowLoop READ slideshowLoop WRITE setSlideshowLoop NOTIFY slideshowChanged)
    Q_PROPERTY(QStringList customCropRatios READ customCropRatioIds NOTIFY customCropRatiosChanged)
    Q_PROPERTY(bool persistenceEnabled READ persistenceEnabled NOTIFY persistenceChanged)
    Q_PROPERTY(QString storagePath READ storagePath NOTIFY persistenceChanged)

public:
    static constexpr double kMinZoomSensitivity = 0.01;
    static constexpr double kMaxZoomSensitivity = 0.1;
    static constexpr double kMinSlideshowSeconds = 1.0;
    static constexpr double kMaxSlideshowSeconds = 10.0;
    static constexpr int kSaveDebounceMs = 500;

    explicit ViewerSettings(QObject* parent = nullptr);
    ~ViewerSettings() override;

    NavigationMode navigationMode() const { return m_navigationMode; }
    QString navigationModeName() const;
    void setNavigationMode(NavigationMode mode);
    void setNavigationModeName(const QString& name);

    bool deleteConfirmationEnabled() const { return m_deleteConfirmationEnabled; }
    void setDeleteConfirmationEnabled(bool enabled);
    bool deleteBackspaceEnabled() const { return m_deleteBackspaceEnabled; }
    void setDeleteBackspaceEnabled(bool enabled);
    bool deleteForwardEnabled() const { return m_deleteForwardEnabled; }
    void setDeleteForwardEnabled(bool enabled);

    double zoomSensitivity() const { return m_zoomSensitivity; }
    void setZoomSensitivity(double value);
    bool zoomAnchorsToPointer() const { return m_zoomAnchorsToPointer; }
    void setZoomAnchorsToPointer(bool enabled);
    double minZoomScale() const { return m_minZoomScale; }
    void setMinZoomScale(double value);
    double maxZoomScale() const { return m_maxZoomScale; }
    void setMaxZoomScale(double value);

    bool showMinimap() const { return m_showMinimap; }
    void setShowMinimap(bool show);
    bool scanRecursively() const { return m_scanRecursively; }
    void setScanRecursively(bool recursive);

    double slideshowIntervalSeconds() const { return m_slideshowIntervalSeconds; }
    void setSlideshowIntervalSeconds(double seconds);
    bool slideshowLoop() const { return m_slideshowLoop; }
    void setSlideshowLoop(bool loop);

    QList<CropRatio> customCropRatios() const { return m_customCropRatios; }
    QStringList customCropRatioIds() const;
    Q_INVOKABLE bool addCustomCropRatio(int width, int height);
    Q_INVOKABLE bool removeCustomCropRatio(const QString& id);

    void setShortcutCatalog(ShortcutCatalog* catalog);
    ShortcutCatalog* shortcutCatalog() const { return m_catalog; }

    //! Problems found in the current values; empty when everything is consistent.
    QStringList validate() const;
    Q_INVOKABLE void resetToDefaults();

    QJsonObject toJson() const;
    void applyJson(const QJsonObject& object);

    bool persistenceEnabled() const { return m_persistenceEnabled; }
    void setPersistenceEnabled(bool enabled);
    QString storagePath() const { return m_storagePath; }
    void setStoragePath(const QString& path);

    bool load(QString* errorMessage = nullptr);
    bool save(QString* errorMessage = nullptr) const;
    //! Writes a pending debounced save right away.
    void flush();
    bool hasPendingSave() const { return m_saveTimer.isActive(); }

signals:
    void navigationModeChanged();
    void deleteOptionsChanged();
    void zoomChanged();
    void showMinimapChanged();
    void scanRecursivelyChanged();
    void slideshowChanged();
    void customCropRatiosChanged();
    void persistenceChanged();
    void settingsChanged();

private:
    void applyNavigationBindings();
    void markChanged();
    void schedulePersist();

    NavigationMode m_navigationMode = NavigationMode::LeftRight;
    bool m_deleteConfirmationEnabled = true;
    bool m_deleteBackspaceEnabled = true;
    bool m_deleteForwardEnabled = true;
    double m_zoomSensitivity = 0.05;
    bool m_zoomAnchorsToPointer = true;
    double m_minZoomScale = 0.1;
    double m_maxZoomScale = 10.0;
    bool m_showMinimap = true;
    bool m_scanRecursively = true;
    double m_slideshowIntervalSeconds = 3.0;
    bool m_slideshowLoop = true;
    QList<CropRatio> m_customCropRatios;

    QPointer<ShortcutCatalog> m_catalog;
    QMetaObject::Connection m_catalogConnection;

    bool m_persistenceEnabled = false;
    bool m_loading = false;
    QString m_storagePath;
    QTimer m_saveTimer;
};
