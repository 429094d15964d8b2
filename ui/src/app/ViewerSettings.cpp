#include "ViewerSettings.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QScopeGuard>

#include <algorithm>
#include <cmath>

#include "shortcuts/ShortcutCatalog.hpp"
#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcSettings, "pixor.settings")

namespace {

constexpr double kZoomStep = 0.1;
constexpr int kSettingsVersion = 1;

bool fuzzyEqual(double lhs, double rhs)
{
    return std::abs(lhs - rhs) < 1e-9;
}

} // namespace

ViewerSettings::ViewerSettings(QObject* parent)
    : QObject(parent)
{
    m_saveTimer.setSingleShot(true);
    m_saveTimer.setInterval(kSaveDebounceMs);
    connect(&m_saveTimer, &QTimer::timeout, this, [this]() {
        QString error;
        if (!save(&error))
            qCWarning(lcSettings) << "Failed to save viewer settings to" << m_storagePath << ":" << error;
    });
}

ViewerSettings::~ViewerSettings()
{
    if (m_saveTimer.isActive()) {
        m_saveTimer.stop();
        QString error;
        if (!save(&error))
            qCWarning(lcSettings) << "Failed to save viewer settings on shutdown:" << error;
    }
}

QString ViewerSettings::navigationModeName() const
{
    return pixor::viewer::navigationModeName(m_navigationMode);
}

void ViewerSettings::setNavigationMode(NavigationMode mode)
{
    if (m_navigationMode == mode)
        return;
    m_navigationMode = mode;
    if (!m_loading)
        applyNavigationBindings();
    emit navigationModeChanged();
    markChanged();
}

void ViewerSettings::applyNavigationBindings()
{
    if (!m_catalog)
        return;
    // The mode's key pair replaces the navigate bindings.
    const pixor::viewer::NavigationKeys keys = pixor::viewer::navigationKeys(m_navigationMode);
    QString error;
    if (!m_catalog->setBindings(ShortcutAction::NavigatePrevious, {KeyCombination(keys.previous)}, &error)
        || !m_catalog->setBindings(ShortcutAction::NavigateNext, {KeyCombination(keys.next)}, &error))
        qCWarning(lcSettings) << "Navigation keys for" << navigationModeName() << "not applied:" << error;
}

void ViewerSettings::setNavigationModeName(const QString& name)
{
    const auto mode = pixor::viewer::navigationModeFromName(name);
    if (!mode) {
        qCWarning(lcSettings) << "Ignoring unknown navigation mode" << name;
        return;
    }
    setNavigationMode(*mode);
}

void ViewerSettings::setDeleteConfirmationEnabled(bool enabled)
{
    if (m_deleteConfirmationEnabled == enabled)
        return;
    m_deleteConfirmationEnabled = enabled;
    emit deleteOptionsChanged();
    markChanged();
}

void ViewerSettings::setDeleteBackspaceEnabled(bool enabled)
{
    if (m_deleteBackspaceEnabled == enabled)
        return;
    m_deleteBackspaceEnabled = enabled;
    emit deleteOptionsChanged();
    markChanged();
}

void ViewerSettings::setDeleteForwardEnabled(bool enabled)
{
    if (m_deleteForwardEnabled == enabled)
        return;
    m_deleteForwardEnabled = enabled;
    emit deleteOptionsChanged();
    markChanged();
}

void ViewerSettings::setZoomSensitivity(double value)
{
    const double clamped = std::clamp(value, kMinZoomSensitivity, kMaxZoomSensitivity);
    if (fuzzyEqual(m_zoomSensitivity, clamped))
        return;
    m_zoomSensitivity = clamped;
    emit zoomChanged();
    markChanged();
}

void ViewerSettings::setZoomAnchorsToPointer(bool enabled)
{
    if (m_zoomAnchorsToPointer == enabled)
        return;
    m_zoomAnchorsToPointer = enabled;
    emit zoomChanged();
    markChanged();
}

void ViewerSettings::setMinZoomScale(double value)
{
    double candidate = value;
    if (!(candidate > 0.0))
        candidate = kZoomStep;
    if (candidate >= m_maxZoomScale)
        candidate = std::max(kZoomStep, m_maxZoomScale - kZoomStep);
    if (fuzzyEqual(m_minZoomScale, candidate))
        return;
    m_minZoomScale = candidate;
    emit zoomChanged();
    markChanged();
}

void ViewerSettings::setMaxZoomScale(double value)
{
    double candidate = value;
    if (!(candidate > m_minZoomScale))
        candidate = m_minZoomScale + kZoomStep;
    if (fuzzyEqual(m_maxZoomScale, candidate))
        return;
    m_maxZoomScale = candidate;
    emit zoomChanged();
    markChanged();
}

void ViewerSettings::setShowMinimap(bool show)
{
    if (m_showMinimap == show)
        return;
    m_showMinimap = show;
    emit showMinimapChanged();
    markChanged();
}

void ViewerSettings::setScanRecursively(bool recursive)
{
    if (m_scanRecursively == recursive)
        return;
    m_scanRecursively = recursive;
    emit scanRecursivelyChanged();
    markChanged();
}

void ViewerSettings::setSlideshowIntervalSeconds(double seconds)
{
    const double clamped = std::clamp(seconds, kMinSlideshowSeconds, kMaxSlideshowSeconds);
    if (fuzzyEqual(m_slideshowIntervalSeconds, clamped))
        return;
    m_slideshowIntervalSeconds = clamped;
    emit slideshowChanged();
    markChanged();
}

void ViewerSettings::setSlideshowLoop(bool loop)
{
    if (m_slideshowLoop == loop)
        return;
    m_slideshowLoop = loop;
    emit slideshowChanged();
    markChanged();
}

QStringList ViewerSettings::customCropRatioIds() const
{
    QStringList ids;
    for (const CropRatio& ratio : m_customCropRatios)
        ids.append(ratio.id());
    return ids;
}

bool ViewerSettings::addCustomCropRatio(int width, int height)
{
    const CropRatio ratio{width, height};
    if (!ratio.isValid() || m_customCropRatios.contains(ratio))
        return false;
    m_customCropRatios.append(ratio);
    emit customCropRatiosChanged();
    markChanged();
    return true;
}

bool ViewerSettings::removeCustomCropRatio(const QString& id)
{
    const auto ratio = CropRatio::fromId(id);
    if (!ratio || !m_customCropRatios.removeOne(*ratio))
        return false;
    emit customCropRatiosChanged();
    markChanged();
    return true;
}

void ViewerSettings::setShortcutCatalog(ShortcutCatalog* catalog)
{
    if (m_catalog == catalog)
        return;
    disconnect(m_catalogConnection);
    m_catalog = catalog;
    if (m_catalog)
        m_catalogConnection = connect(m_catalog, &ShortcutCatalog::bindingsChanged, this, [this]() { markChanged(); });
}

QStringList ViewerSettings::validate() const
{
    QStringList problems;
    if (m_zoomSensitivity < kMinZoomSensitivity || m_zoomSensitivity > kMaxZoomSensitivity)
        problems.append(tr("Zoom sensitivity must lie between %1 and %2").arg(kMinZoomSensitivity).arg(kMaxZoomSensitivity));
    if (!(m_minZoomScale > 0.0))
        problems.append(tr("Minimum zoom must be positive"));
    if (!(m_minZoomScale < m_maxZoomScale))
        problems.append(tr("Minimum zoom must be smaller than maximum zoom"));
    if (m_slideshowIntervalSeconds < kMinSlideshowSeconds || m_slideshowIntervalSeconds > kMaxSlideshowSeconds)
        problems.append(tr("Slideshow interval must lie between %1 and %2 seconds")
                            .arg(kMinSlideshowSeconds)
                            .arg(kMaxSlideshowSeconds));
    for (const CropRatio& ratio : m_customCropRatios) {
        if (!ratio.isValid())
            problems.append(tr("Invalid crop ratio %1").arg(ratio.id()));
    }
    if (m_persistenceEnabled && m_storagePath.isEmpty())
        problems.append(tr("Settings persistence is enabled without a storage path"));
    return problems;
}

void ViewerSettings::resetToDefaults()
{
    const ViewerSettings defaults;
    const bool previousLoading = m_loading;
    m_loading = true;
    // Reset max first so the min clamp works against the default range.
    m_maxZoomScale = defaults.m_maxZoomScale;
    m_minZoomScale = defaults.m_minZoomScale;
    applyJson(defaults.toJson());
    if (m_catalog)
        m_catalog->resetToDefaults();
    m_loading = previousLoading;
    emit zoomChanged();
    markChanged();
}

QJsonObject ViewerSettings::toJson() const
{
    QJsonObject root;
    root.insert(QStringLiteral("version"), kSettingsVersion);
    root.insert(QStringLiteral("navigationMode"), navigationModeName());

    QJsonObject deletion;
    deletion.insert(QStringLiteral("confirm"), m_deleteConfirmationEnabled);
    deletion.insert(QStringLiteral("backspace"), m_deleteBackspaceEnabled);
    deletion.insert(QStringLiteral("forwardDelete"), m_deleteForwardEnabled);
    root.insert(QStringLiteral("delete"), deletion);

    QJsonObject zoom;
    zoom.insert(QStringLiteral("sensitivity"), m_zoomSensitivity);
    zoom.insert(QStringLiteral("anchorsToPointer"), m_zoomAnchorsToPointer);
    zoom.insert(QStringLiteral("min"), m_minZoomScale);
    zoom.insert(QStringLiteral("max"), m_maxZoomScale);
    root.insert(QStringLiteral("zoom"), zoom);

    root.insert(QStringLiteral("showMinimap"), m_showMinimap);
    root.insert(QStringLiteral("scanRecursively"), m_scanRecursively);

    QJsonObject slideshow;
    slideshow.insert(QStringLiteral("intervalSeconds"), m_slideshowIntervalSeconds);
    slideshow.insert(QStringLiteral("loop"), m_slideshowLoop);
    root.insert(QStringLiteral("slideshow"), slideshow);

    QJsonArray ratios;
    for (const CropRatio& ratio : m_customCropRatios)
        ratios.append(ratio.toJson());
    root.insert(QStringLiteral("customCropRatios"), ratios);

    if (m_catalog)
        root.insert(QStringLiteral("shortcuts"), m_catalog->toJson());
    return root;
}

void ViewerSettings::applyJson(const QJsonObject& root)
{
    const bool previousLoading = m_loading;
    m_loading = true;
    const auto restoreLoading = qScopeGuard([this, previousLoading]() { m_loading = previousLoading; });

    if (root.contains(QStringLiteral("navigationMode")))
        setNavigationModeName(root.value(QStringLiteral("navigationMode")).toString());

    const QJsonObject deletion = root.value(QStringLiteral("delete")).toObject();
    setDeleteConfirmationEnabled(deletion.value(QStringLiteral("confirm")).toBool(m_deleteConfirmationEnabled));
    setDeleteBackspaceEnabled(deletion.value(QStringLiteral("backspace")).toBool(m_deleteBackspaceEnabled));
    setDeleteForwardEnabled(deletion.value(QStringLiteral("forwardDelete")).toBool(m_deleteForwardEnabled));

    const QJsonObject zoom = root.value(QStringLiteral("zoom")).toObject();
    setZoomSensitivity(zoom.value(QStringLiteral("sensitivity")).toDouble(m_zoomSensitivity));
    setZoomAnchorsToPointer(zoom.value(QStringLiteral("anchorsToPointer")).toBool(m_zoomAnchorsToPointer));
    const double minZoom = zoom.value(QStringLiteral("min")).toDouble(m_minZoomScale);
    const double maxZoom = zoom.value(QStringLiteral("max")).toDouble(m_maxZoomScale);
    // Widen first so neither clamp fights the other.
    if (maxZoom > m_maxZoomScale) {
        setMaxZoomScale(maxZoom);
        setMinZoomScale(minZoom);
    } else {
        setMinZoomScale(minZoom);
        setMaxZoomScale(maxZoom);
    }

    setShowMinimap(root.value(QStringLiteral("showMinimap")).toBool(m_showMinimap));
    setScanRecursively(root.value(QStringLiteral("scanRecursively")).toBool(m_scanRecursively));

    const QJsonObject slideshow = root.value(QStringLiteral("slideshow")).toObject();
    setSlideshowIntervalSeconds(slideshow.value(QStringLiteral("intervalSeconds")).toDouble(m_slideshowIntervalSeconds));
    setSlideshowLoop(slideshow.value(QStringLiteral("loop")).toBool(m_slideshowLoop));

    if (root.contains(QStringLiteral("customCropRatios"))) {
        QList<CropRatio> ratios;
        for (const QJsonValue& value : root.value(QStringLiteral("customCropRatios")).toArray()) {
            const auto ratio = CropRatio::fromJson(value.toObject());
            if (ratio && !ratios.contains(*ratio))
                ratios.append(*ratio);
        }
        if (ratios != m_customCropRatios) {
            m_customCropRatios = ratios;
            emit customCropRatiosChanged();
        }
    }

    if (m_catalog && root.contains(QStringLiteral("shortcuts"))) {
        QString error;
        if (!m_catalog->loadJson(root.value(QStringLiteral("shortcuts")).toObject(), &error))
            qCWarning(lcSettings) << "Some shortcut bindings were ignored:" << error;
    } else if (root.contains(QStringLiteral("navigationMode"))) {
        applyNavigationBindings();
    }
}

void ViewerSettings::setPersistenceEnabled(bool enabled)
{
    if (m_persistenceEnabled == enabled)
        return;
    m_persistenceEnabled = enabled;
    if (!enabled && m_saveTimer.isActive())
        m_saveTimer.stop();
    emit persistenceChanged();
}

void ViewerSettings::setStoragePath(const QString& path)
{
    const QString expanded = path.trimmed().isEmpty() ? QString() : pixor::utils::expandPath(path.trimmed());
    if (m_storagePath == expanded)
        return;
    m_storagePath = expanded;
    emit persistenceChanged();
}

bool ViewerSettings::load(QString* errorMessage)
{
    if (!m_persistenceEnabled || m_storagePath.isEmpty())
        return true;

    QFile file(m_storagePath);
    if (!file.exists())
        return true;
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qCWarning(lcSettings) << "Unable to read viewer settings" << m_storagePath << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        const QString message = parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                                              : tr("root is not an object");
        if (errorMessage)
            *errorMessage = message;
        qCWarning(lcSettings) << "Viewer settings file is not valid JSON" << m_storagePath << message;
        return false;
    }

    applyJson(document.object());
    qCInfo(lcSettings) << "Loaded viewer settings from" << m_storagePath;
    return true;
}

bool ViewerSettings::save(QString* errorMessage) const
{
    if (m_storagePath.isEmpty()) {
        if (errorMessage)
            *errorMessage = tr("No settings path configured");
        return false;
    }

    const QDir dir = QFileInfo(m_storagePath).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (errorMessage)
            *errorMessage = tr("Cannot create directory %1").arg(dir.absolutePath());
        return false;
    }

    QSaveFile file(m_storagePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (errorMessage)
            *errorMessage = file.errorString();
        return false;
    }
    return true;
}

void ViewerSettings::flush()
{
    if (!m_saveTimer.isActive())
        return;
    m_saveTimer.stop();
    QString error;
    if (!save(&error))
        qCWarning(lcSettings) << "Failed to save viewer settings to" << m_storagePath << ":" << error;
}

void ViewerSettings::markChanged()
{
    if (m_loading)
        return;
    emit settingsChanged();
    schedulePersist();
}

void ViewerSettings::schedulePersist()
{
    if (!m_persistenceEnabled || m_storagePath.isEmpty())
        return;
    m_saveTimer.start();
}
