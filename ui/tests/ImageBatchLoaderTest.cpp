#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QThreadPool>

#include <memory>

#include "utils/PathUtils.hpp"
#include "viewer/ImageBatchLoader.hpp"

using pixor::viewer::isSupportedImage;
using pixor::viewer::resolveImagePaths;

namespace {

bool touch(const QString& path)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    file.write("x");
    return true;
}

} // namespace

class ImageBatchLoaderTest : public QObject {
    Q_OBJECT

private slots:
    void init();

    void filtersBySuffix();
    void listsDirectoryInNaturalOrder();
    void recursionIsOptIn();
    void deduplicatesAndSkipsMissingInputs();
    void loaderReportsOnWorkerThread();
    void loaderDropsSupersededRequests();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
};

void ImageBatchLoaderTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    for (const QString& name : {QStringLiteral("img10.png"), QStringLiteral("img2.JPG"), QStringLiteral("img1.webp"),
                                QStringLiteral("notes.txt"), QStringLiteral(".hidden.png"),
                                QStringLiteral("nested/deep.png")}) {
        QVERIFY(touch(m_dir->filePath(name)));
    }
}

void ImageBatchLoaderTest::filtersBySuffix()
{
    QVERIFY(isSupportedImage(QStringLiteral("/a/b.HEIC")));
    QVERIFY(isSupportedImage(QStringLiteral("c.tif")));
    QVERIFY(!isSupportedImage(QStringLiteral("c.txt")));
    QVERIFY(!isSupportedImage(QStringLiteral("png")));
}

void ImageBatchLoaderTest::listsDirectoryInNaturalOrder()
{
    const QStringList paths = resolveImagePaths({m_dir->path()}, false);
    const QString root = pixor::utils::standardizedPath(m_dir->path());
    QCOMPARE(paths, (QStringList{root + QStringLiteral("/img1.webp"), root + QStringLiteral("/img2.JPG"),
                                 root + QStringLiteral("/img10.png")}));
}

void ImageBatchLoaderTest::recursionIsOptIn()
{
    const QStringList paths = resolveImagePaths({m_dir->path()}, true);
    QCOMPARE(paths.size(), 4);
    QVERIFY(paths.contains(pixor::utils::standardizedPath(m_dir->filePath(QStringLiteral("nested/deep.png")))));
    for (const QString& path : paths)
        QVERIFY(!QFileInfo(path).fileName().startsWith(QLatin1Char('.')));
}

void ImageBatchLoaderTest::deduplicatesAndSkipsMissingInputs()
{
    const QString file = m_dir->filePath(QStringLiteral("img2.JPG"));
    const QStringList paths = resolveImagePaths(
        {file, m_dir->path() + QStringLiteral("/nested/../img2.JPG"), m_dir->filePath(QStringLiteral("gone.png")),
         m_dir->filePath(QStringLiteral("notes.txt")), QStringLiteral("  ")},
        false);
    QCOMPARE(paths, QStringList{pixor::utils::standardizedPath(file)});
    QVERIFY(resolveImagePaths({}, false).isEmpty());
}

void ImageBatchLoaderTest::loaderReportsOnWorkerThread()
{
    QThreadPool pool;
    ImageBatchLoader loader;
    loader.setThreadPoolForTesting(&pool);
    QSignalSpy loadedSpy(&loader, &ImageBatchLoader::loaded);
    QSignalSpy busySpy(&loader, &ImageBatchLoader::busyChanged);

    loader.setRecursive(true);
    const QStringList inputs{m_dir->path()};
    loader.load(inputs);
    QVERIFY(loader.busy());

    QTRY_COMPARE_WITH_TIMEOUT(loadedSpy.count(), 1, 5000);
    QCOMPARE(loadedSpy.first().at(0).toStringList().size(), 4);
    QCOMPARE(loadedSpy.first().at(1).toStringList(), inputs);
    QVERIFY(!loader.busy());
    QCOMPARE(busySpy.count(), 2);
}

void ImageBatchLoaderTest::loaderDropsSupersededRequests()
{
    QThreadPool pool;
    pool.setMaxThreadCount(1);
    ImageBatchLoader loader;
    loader.setThreadPoolForTesting(&pool);
    QSignalSpy loadedSpy(&loader, &ImageBatchLoader::loaded);

    const quint64 first = loader.load({m_dir->filePath(QStringLiteral("img10.png"))});
    const quint64 second = loader.load({m_dir->filePath(QStringLiteral("img1.webp"))});
    QVERIFY(second > first);

    QTRY_VERIFY_WITH_TIMEOUT(!loader.busy(), 5000);
    QCOMPARE(loadedSpy.count(), 1);
    QCOMPARE(loadedSpy.first().at(0).toStringList(),
             QStringList{pixor::utils::standardizedPath(m_dir->filePath(QStringLiteral("img1.webp")))});

    loader.load({m_dir->path()});
    loader.cancel();
    QTRY_VERIFY_WITH_TIMEOUT(!loader.busy(), 5000);
    QCOMPARE(loadedSpy.count(), 1);
}

QTEST_GUILESS_MAIN(ImageBatchLoaderTest)
#include "ImageBatchLoaderTest.moc"
