#pragma once

#include <QCommandLineParser>
#include <QObject>
#include <QPointer>
#include <QQmlApplicationEngine>
#include <QStringList>
#include <QTranslator>

#include <memory>

#include "app/AlertContent.hpp"
#include "app/ViewerSettings.hpp"
#include "models/ImageListModel.hpp"
#include "purchase/FeatureGatekeeper.hpp"
#include "shortcuts/ShortcutCatalog.hpp"
#include "shortcuts/ShortcutRouter.hpp"
#include "tags/TagRepository.hpp"
#include "tags/TagSmartFilterStore.hpp"
#include "viewer/ViewerSession.hpp"

class QQuickWindow;
class PurchaseController;  // forward decl (purchase/PurchaseController.hpp)

class Application : public QObject {
    Q_OBJECT
    Q_PROPERTY(QObject* settings READ settingsObject CONSTANT)
    Q_PROPERTY(QObject* session READ sessionObject CONSTANT)
    Q_PROPERTY(QObject* imageListModel READ imageListModelObject CONSTANT)
    Q_PROPERTY(QObject* purchaseController READ purchaseControllerObject CONSTANT)
    Q_PROPERTY(QObject* gatekeeper READ gatekeeperObject CONSTANT)
    Q_PROPERTY(QObject* shortcutCatalog READ shortcutCatalogObject CONSTANT)
    Q_PROPERTY(QObject* tagRepository READ tagRepositoryObject CONSTANT)
    Q_PROPERTY(QObject* smartFilterStore READ smartFilterStoreObject CONSTANT)

public:
    explicit Application(QQmlApplicationEngine& engine, QObject* parent = nullptr);
    ~Application() override;

    // CLI
    void configureParser(QCommandLineParser& parser) const;
    bool applyParser(const QCommandLineParser& parser);

    void start();
    void stop();

    ViewerSettings* viewerSettings() { return &m_settings; }
    ShortcutCatalog* shortcutCatalog() { return &m_catalog; }
    ShortcutRouter* shortcutRouter() { return &m_router; }
    PurchaseController* purchaseController() const { return m_purchaseController.get(); }
    FeatureGatekeeper* gatekeeper() { return &m_gatekeeper; }
    TagRepository* tagRepository() { return &m_tags; }
    TagSmartFilterStore* smartFilterStore() { return &m_smartFilters; }
    ViewerSession* session() { return &m_session; }
    ImageListModel* imageListModel() { return &m_imageListModel; }

    QObject* settingsObject() const { return const_cast<ViewerSettings*>(&m_settings); }
    QObject* sessionObject() const { return const_cast<ViewerSession*>(&m_session); }
    QObject* imageListModelObject() const { return const_cast<ImageListModel*>(&m_imageListModel); }
    QObject* purchaseControllerObject() const;
    QObject* gatekeeperObject() const { return const_cast<FeatureGatekeeper*>(&m_gatekeeper); }
    QObject* shortcutCatalogObject() const { return const_cast<ShortcutCatalog*>(&m_catalog); }
    QObject* tagRepositoryObject() const { return const_cast<TagRepository*>(&m_tags); }
    QObject* smartFilterStoreObject() const { return const_cast<TagSmartFilterStore*>(&m_smartFilters); }

    QStringList initialPaths() const { return m_initialPaths; }
    QString entitlementPath() const { return m_entitlementPath; }
    QString tagDatabasePath() const { return m_tagDatabasePath; }
    //! Saved tag filters live beside the tag database.
    QString smartFilterPath() const;
    QString receiptPath() const { return m_receiptPath; }
    bool receiptValidationEnabled() const { return m_receiptValidationEnabled; }

    //! Registers @p window with the shortcut router; further calls for the same window are ignored.
    void attachWindow(QObject* object);

signals:
    void alertRaised(const QString& title, const QString& message);
    void upgradePromptRequested(const QString& context);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void exposeToQml();
    void installTranslator();
    void initializeSettingsStorage();
    void initializeTagStorage();
    void initializePurchases();
    void forwardAlert(const AlertContent& alert);

    QQmlApplicationEngine& m_engine;
    QTranslator m_translator;

    ShortcutCatalog m_catalog;
    ViewerSettings m_settings;
    ShortcutRouter m_router;
    FeatureGatekeeper m_gatekeeper;
    TagRepository m_tags;
    TagSmartFilterStore m_smartFilters;
    ViewerSession m_session;
    ImageListModel m_imageListModel;
    std::unique_ptr<PurchaseController> m_purchaseController;

    QStringList m_initialPaths;
    QString m_settingsPath;
    bool m_settingsPersistenceEnabled = true;
    QString m_entitlementPath;
    QString m_tagDatabasePath;
    QString m_receiptPath;
    bool m_receiptValidationEnabled = false;
    bool m_started = false;
};
