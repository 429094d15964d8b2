#include "Application.hpp"

#include <QCommandLineOption>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QFileOpenEvent>
#include <QLocale>
#include <QLoggingCategory>
#include <QQmlContext>
#include <QQuickWindow>
#include <QStandardPaths>

#include <optional>

#include "purchase/PurchaseController.hpp"
#include "purchase/ReceiptFileValidator.hpp"
#include "shortcuts/ViewerShortcutHandler.hpp"
#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcApp, "pixor.app")

namespace {

constexpr auto kSettingsPathEnv = QByteArrayLiteral("PIXOR_SETTINGS_PATH");
constexpr auto kSettingsDisableEnv = QByteArrayLiteral("PIXOR_SETTINGS_DISABLE");
constexpr auto kEntitlementPathEnv = QByteArrayLiteral("PIXOR_ENTITLEMENT_PATH");
constexpr auto kTagDatabaseEnv = QByteArrayLiteral("PIXOR_TAG_DATABASE");
constexpr auto kReceiptValidationEnv = QByteArrayLiteral("PIXOR_ENABLE_RECEIPT_VALIDATION");
constexpr auto kReceiptPathEnv = QByteArrayLiteral("PIXOR_RECEIPT_PATH");

using pixor::utils::expandPath;

std::optional<QString> envValue(const QByteArray& key)
{
    if (!qEnvironmentVariableIsSet(key.constData()))
        return std::nullopt;
    return qEnvironmentVariable(key.constData());
}

std::optional<bool> envBool(const QByteArray& key)
{
    const auto valueOpt = envValue(key);
    if (!valueOpt.has_value())
        return std::nullopt;
    const QString normalized = valueOpt->trimmed().toLower();
    if (normalized.isEmpty())
        return std::nullopt;
    if (normalized == QStringLiteral("1") || normalized == QStringLiteral("true") ||
        normalized == QStringLiteral("yes") || normalized == QStringLiteral("on"))
        return true;
    if (normalized == QStringLiteral("0") || normalized == QStringLiteral("false") ||
        normalized == QStringLiteral("no") || normalized == QStringLiteral("off"))
        return false;
    qCWarning(lcApp) << "Invalid value" << *valueOpt << "in" << QString::fromUtf8(key)
                     << "- expected a boolean (true/false).";
    return std::nullopt;
}

//! CLI value, else environment variable, else @p fallbackName inside the application data directory.
QString resolveStoragePath(const QString& cliValue, const QByteArray& envKey, const QString& fallbackName)
{
    QString candidate = cliValue.trimmed();
    if (candidate.isEmpty()) {
        if (const auto envPath = envValue(envKey); envPath.has_value())
            candidate = envPath->trimmed();
    }
    if (!candidate.isEmpty())
        return expandPath(candidate);

    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty())
        base = QDir::current().absoluteFilePath(QStringLiteral("config"));
    return QDir(base).absoluteFilePath(fallbackName);
}

} // namespace

Application::Application(QQmlApplicationEngine& engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_purchaseController(std::make_unique<PurchaseController>(PurchaseConfiguration::loadDefault()))
{
    qRegisterMetaType<AlertContent>("AlertContent");

    m_settings.setShortcutCatalog(&m_catalog);

    m_session.setSettings(&m_settings);
    m_session.setGatekeeper(&m_gatekeeper);
    m_session.setTagRepository(&m_tags);
    m_session.setSmartFilterStore(&m_smartFilters);
    m_imageListModel.setSession(&m_session);

    connect(m_purchaseController.get(), &PurchaseController::stateChanged, &m_gatekeeper,
            &FeatureGatekeeper::setPurchaseState);
    connect(m_purchaseController.get(), &PurchaseController::alertRaised, this, &Application::forwardAlert);
    connect(&m_session, &ViewerSession::alertRaised, this, &Application::forwardAlert);
    connect(&m_gatekeeper, &FeatureGatekeeper::upgradeRequested, this, [this](UpgradePromptContext context) {
        emit upgradePromptRequested(pixor::purchase::upgradeContextName(context));
    });

    installTranslator();
    exposeToQml();

    // Register each window created from QML with the shortcut router.
    connect(&m_engine, &QQmlApplicationEngine::objectCreated, this,
            [this](QObject* object, const QUrl&) { attachWindow(object); });

    if (QCoreApplication::instance())
        QCoreApplication::instance()->installEventFilter(this);
}

Application::~Application()
{
    if (QCoreApplication::instance())
        QCoreApplication::instance()->removeEventFilter(this);
}

QObject* Application::purchaseControllerObject() const
{
    return m_purchaseController.get();
}

void Application::configureParser(QCommandLineParser& parser) const
{
    parser.setApplicationDescription(tr("Pixor image viewer"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({"settings-path", tr("Path of the settings file"), tr("path"), QString()});
    parser.addOption({"disable-settings", tr("Do not read or write the settings file")});
    parser.addOption({"entitlement-path", tr("Path of the entitlement cache"), tr("path"), QString()});
    parser.addOption({"tag-database", tr("Path of the tag database"), tr("path"), QString()});
    parser.addOption({"enable-receipt-validation", tr("Validate purchases against a local receipt file")});
    parser.addOption({"receipt-path", tr("Path of the receipt file"), tr("path"), QString()});
    parser.addOption({"trial-days", tr("Length of the free trial in days"), tr("days"), QString()});
    parser.addOption({"free-feature",
                      tr("Feature usable without purchase (crop, transform, exif, slideshow, tags, generic); repeatable"),
                      tr("feature")});
    parser.addOption({"recursive", tr("Scan opened folders recursively")});
    parser.addOption({"no-recursive", tr("Scan only the top level of opened folders")});
    parser.addPositionalArgument(QStringLiteral("paths"), tr("Images or folders to open"), tr("[paths...]"));
}

bool Application::applyParser(const QCommandLineParser& parser)
{
    bool ok = true;

    m_settingsPath = resolveStoragePath(parser.value("settings-path"), kSettingsPathEnv, QStringLiteral("settings.json"));
    m_settingsPersistenceEnabled = true;
    if (const auto disableEnv = envBool(kSettingsDisableEnv); disableEnv.has_value())
        m_settingsPersistenceEnabled = !disableEnv.value();
    if (parser.isSet("disable-settings"))
        m_settingsPersistenceEnabled = false;

    m_entitlementPath = resolveStoragePath(parser.value("entitlement-path"), kEntitlementPathEnv,
                                           QStringLiteral("entitlements.json"));
    m_tagDatabasePath = resolveStoragePath(parser.value("tag-database"), kTagDatabaseEnv, QStringLiteral("tags.json"));

    m_receiptValidationEnabled = envBool(kReceiptValidationEnv).value_or(false);
    if (parser.isSet("enable-receipt-validation"))
        m_receiptValidationEnabled = true;
    m_receiptPath = resolveStoragePath(parser.value("receipt-path"), kReceiptPathEnv, QStringLiteral("receipt.json"));

    std::optional<int> cliTrialDays;
    const QString trialDaysValue = parser.value("trial-days").trimmed();
    if (!trialDaysValue.isEmpty()) {
        bool parsed = false;
        const int value = trialDaysValue.toInt(&parsed);
        if (parsed && value >= 0) {
            cliTrialDays = value;
        } else {
            qCWarning(lcApp) << "Invalid --trial-days value" << trialDaysValue;
            ok = false;
        }
    }
    PurchaseConfiguration configuration = PurchaseConfiguration::loadDefault();
    // The command line wins over PIXOR_TRIAL_DAYS.
    if (cliTrialDays)
        configuration.trialDurationSeconds = static_cast<qint64>(*cliTrialDays) * 24 * 60 * 60;
    m_purchaseController->setConfiguration(configuration);

    const QStringList freeFeatures = parser.values("free-feature");
    if (!freeFeatures.isEmpty()) {
        QStringList rejected;
        m_gatekeeper.setPolicy(FeatureAccessPolicy::fromNames(freeFeatures, &rejected));
        if (!rejected.isEmpty()) {
            qCWarning(lcApp) << "Unknown features ignored:" << rejected;
            ok = false;
        }
    }

    if (parser.isSet("recursive") && parser.isSet("no-recursive")) {
        qCWarning(lcApp) << "--recursive and --no-recursive are mutually exclusive; using the settings value";
        ok = false;
    } else if (parser.isSet("recursive")) {
        m_session.setRecursiveScanOverride(true);
    } else if (parser.isSet("no-recursive")) {
        m_session.setRecursiveScanOverride(false);
    }

    m_initialPaths.clear();
    for (const QString& argument : parser.positionalArguments()) {
        if (!argument.trimmed().isEmpty())
            m_initialPaths.append(expandPath(argument));
    }

    initializeSettingsStorage();
    return ok;
}

void Application::initializeSettingsStorage()
{
    m_settings.setStoragePath(m_settingsPath);
    if (!m_settingsPersistenceEnabled) {
        qCInfo(lcApp) << "Settings persistence disabled";
        m_settings.setPersistenceEnabled(false);
        return;
    }

    m_settings.setPersistenceEnabled(true);
    QString error;
    if (!m_settings.load(&error))
        qCWarning(lcApp) << "Failed to load settings from" << m_settingsPath << ":" << error;

    const QStringList problems = m_settings.validate();
    for (const QString& problem : problems)
        qCWarning(lcApp) << "Settings:" << problem;
}

void Application::initializeTagStorage()
{
    m_tags.setStoragePath(m_tagDatabasePath);
    QString error;
    if (!m_tags.load(&error)) {
        qCWarning(lcApp) << "Tag database unavailable:" << error;
        forwardAlert(AlertContent{tr("Tags unavailable"), error});
    }

    m_smartFilters.setStoragePath(smartFilterPath());
    error.clear();
    if (!m_smartFilters.load(&error))
        qCWarning(lcApp) << "Saved filters unavailable:" << error;
}

QString Application::smartFilterPath() const
{
    if (m_tagDatabasePath.isEmpty())
        return QString();
    return QFileInfo(m_tagDatabasePath).dir().filePath(QStringLiteral("smart-filters.json"));
}

void Application::initializePurchases()
{
    if (m_entitlementPath.isEmpty())
        m_entitlementPath = resolveStoragePath(QString(), kEntitlementPathEnv, QStringLiteral("entitlements.json"));
    m_purchaseController->setEntitlementStorePath(m_entitlementPath);
    if (m_receiptValidationEnabled) {
        m_purchaseController->setReceiptValidator(std::make_shared<ReceiptFileValidator>(m_receiptPath));
        m_purchaseController->setReceiptValidationEnabled(true);
        qCInfo(lcApp) << "Receipt validation enabled, receipt file" << m_receiptPath;
    }
    m_purchaseController->initialize();
    m_gatekeeper.setPurchaseState(m_purchaseController->state());
}

void Application::start()
{
    if (m_started)
        return;

    initializePurchases();
    initializeTagStorage();

    for (QObject* root : m_engine.rootObjects())
        attachWindow(root);

    if (!m_initialPaths.isEmpty())
        m_session.openPaths(m_initialPaths);
    m_started = true;
}

void Application::stop()
{
    m_session.stopSlideshow();
    m_settings.flush();
    QString error;
    if (!m_tags.storagePath().isEmpty() && !m_tags.save(&error))
        qCWarning(lcApp) << "Failed to save tags on shutdown:" << error;
    m_started = false;
}

void Application::attachWindow(QObject* object)
{
    auto* window = qobject_cast<QQuickWindow*>(object);
    if (!window && object)
        window = object->findChild<QQuickWindow*>();
    if (!window)
        return;
    if (!m_router.tokenFor(window).isNull())
        return;

    auto* handler = new ViewerShortcutHandler(&m_session, &m_catalog, &m_settings, window);
    const QUuid token = m_router.registerWindow(window, handler->routerHandler());
    qCDebug(lcApp) << "Registered window" << window << "for shortcuts" << token;
}

bool Application::eventFilter(QObject* watched, QEvent* event)
{
    if (event && event->type() == QEvent::FileOpen) {
        auto* openEvent = static_cast<QFileOpenEvent*>(event);
        const QString file = openEvent->file().isEmpty() ? openEvent->url().toLocalFile() : openEvent->file();
        if (!file.isEmpty()) {
            qCInfo(lcApp) << "Opening" << file << "on request of the platform";
            m_session.openPaths({file});
            return true;
        }
    }
    return QObject::eventFilter(watched, event);
}

void Application::installTranslator()
{
    if (!QCoreApplication::instance())
        return;
    if (m_translator.load(QLocale(), QStringLiteral("pixor"), QStringLiteral("_"), QStringLiteral(":/i18n"))) {
        QCoreApplication::installTranslator(&m_translator);
        qCDebug(lcApp) << "Installed translation" << m_translator.filePath();
    } else {
        qCDebug(lcApp) << "No translation for locale" << QLocale().name() << "- using source strings";
    }
}

void Application::exposeToQml()
{
    m_engine.rootContext()->setContextProperty(QStringLiteral("appController"), this);
    m_engine.rootContext()->setContextProperty(QStringLiteral("viewerSettings"), &m_settings);
    m_engine.rootContext()->setContextProperty(QStringLiteral("viewerSession"), &m_session);
    m_engine.rootContext()->setContextProperty(QStringLiteral("imageListModel"), &m_imageListModel);
    m_engine.rootContext()->setContextProperty(QStringLiteral("purchaseController"), m_purchaseController.get());
    m_engine.rootContext()->setContextProperty(QStringLiteral("featureGatekeeper"), &m_gatekeeper);
    m_engine.rootContext()->setContextProperty(QStringLiteral("shortcutCatalog"), &m_catalog);
    m_engine.rootContext()->setContextProperty(QStringLiteral("tagRepository"), &m_tags);
    m_engine.rootContext()->setContextProperty(QStringLiteral("smartFilterStore"), &m_smartFilters);
}

void Application::forwardAlert(const AlertContent& alert)
{
    if (alert.isEmpty())
        return;
    qCInfo(lcApp) << "Alert:" << alert.title << alert.message;
    emit alertRaised(alert.title, alert.message);
}
