#include <QtTest/QtTest>
#include <QSignalSpy>

#include <QFile>
#include <QTemporaryDir>

#include <memory>

#include "tags/TagRepository.hpp"

class TagRepositoryTest : public QObject {
    Q_OBJECT

private slots:
    void init();

    void createRejectsDuplicatesAndBadColours();
    void ensureReusesExistingTag();
    void renameAndRecolour();
    void assignmentsUseStandardizedPaths();
    void deleteTagDropsAssignments();
    void removeImageForgetsAssignments();
    void persistsAcrossInstances();
    void malformedDatabaseIsReported();
    void scopedSummariesAndDirectoryUsage();
    void hexColourNormalization();
    void failedWriteLeavesRepositoryUnchanged();

private:
    QString imagePath(const QString& relative) const { return m_dir->filePath(relative); }

    std::unique_ptr<QTemporaryDir> m_dir;
    QDateTime m_now;
};

void TagRepositoryTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_now = QDateTime(QDate(2024, 4, 1), QTime(9, 0), Qt::UTC);
}

void TagRepositoryTest::createRejectsDuplicatesAndBadColours()
{
    TagRepository repository;
    QSignalSpy changedSpy(&repository, &TagRepository::tagsChanged);

    QString error;
    const auto beach = repository.createTag(QStringLiteral("  Beach "), QStringLiteral("ff8800"), &error);
    QVERIFY2(beach.has_value(), qPrintable(error));
    QCOMPARE(beach->name, QStringLiteral("Beach"));
    QCOMPARE(beach->colorHex, QStringLiteral("#FF8800"));
    QCOMPARE(beach->usageCount, 0);
    QCOMPARE(repository.version(), quint64(1));
    QCOMPARE(changedSpy.count(), 1);

    QVERIFY(!repository.createTag(QStringLiteral("beach"), QString(), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("already exists")));
    QVERIFY(!repository.createTag(QStringLiteral("   "), QString(), &error).has_value());
    QVERIFY(!repository.createTag(QStringLiteral("Sunset"), QStringLiteral("orange"), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("orange")));

    QCOMPARE(repository.allTags().size(), 1);
    QCOMPARE(repository.version(), quint64(1));
}

void TagRepositoryTest::ensureReusesExistingTag()
{
    TagRepository repository;
    const auto created = repository.ensureTag(QStringLiteral("Family"));
    QVERIFY(created.has_value());
    const auto reused = repository.ensureTag(QStringLiteral("FAMILY"));
    QVERIFY(reused.has_value());
    QCOMPARE(reused->id, created->id);
    QCOMPARE(repository.allTags().size(), 1);
    QCOMPARE(repository.tagNamed(QStringLiteral("family"))->id, created->id);
}

void TagRepositoryTest::renameAndRecolour()
{
    TagRepository repository;
    repository.setClockForTesting([this]() { return m_now; });
    const auto first = repository.createTag(QStringLiteral("Cats"));
    const auto second = repository.createTag(QStringLiteral("Dogs"));
    QVERIFY(first && second);

    QString error;
    QVERIFY(!repository.renameTag(first->id, QStringLiteral("dogs"), &error));
    QVERIFY(!repository.renameTag(999, QStringLiteral("Birds"), &error));

    m_now = m_now.addSecs(60);
    QVERIFY(repository.renameTag(first->id, QStringLiteral("Kittens"), &error));
    QCOMPARE(repository.tag(first->id)->name, QStringLiteral("Kittens"));
    QCOMPARE(repository.tag(first->id)->updatedAt, m_now);
    QCOMPARE(repository.tag(first->id)->createdAt, m_now.addSecs(-60));

    const quint64 version = repository.version();
    QVERIFY(repository.renameTag(first->id, QStringLiteral("Kittens")));
    QCOMPARE(repository.version(), version);

    QVERIFY(repository.setTagColor(second->id, QStringLiteral("#00ff0080")));
    QCOMPARE(repository.tag(second->id)->colorHex, QStringLiteral("#00FF0080"));
    QVERIFY(!repository.setTagColor(second->id, QStringLiteral("#12"), &error));
    QVERIFY(repository.setTagColor(second->id, QString()));
    QVERIFY(repository.tag(second->id)->colorHex.isEmpty());
}

void TagRepositoryTest::assignmentsUseStandardizedPaths()
{
    TagRepository repository;
    const auto tag = repository.createTag(QStringLiteral("Trip"));
    QVERIFY(tag.has_value());

    const QString path = imagePath(QStringLiteral("album/photo.jpg"));
    const QString messy = imagePath(QStringLiteral("album/./other/../photo.jpg"));
    QVERIFY(repository.assign(tag->id, messy));
    QVERIFY(repository.assign(tag->id, path));

    QCOMPARE(repository.tagsFor(path).size(), 1);
    QCOMPARE(repository.tagsFor(path).first().usageCount, 1);
    QCOMPARE(repository.tag(tag->id)->usageCount, 1);
    QVERIFY(repository.assignments().contains(path));

    QString error;
    QVERIFY(!repository.assign(42, path, &error));
    QVERIFY(!repository.assign(tag->id, QStringLiteral("  "), &error));

    QVERIFY(repository.unassign(tag->id, messy));
    QVERIFY(repository.tagsFor(path).isEmpty());
    QVERIFY(repository.assignments().isEmpty());

    const quint64 version = repository.version();
    QVERIFY(repository.unassign(tag->id, path));
    QCOMPARE(repository.version(), version);
}

void TagRepositoryTest::deleteTagDropsAssignments()
{
    TagRepository repository;
    const auto keep = repository.createTag(QStringLiteral("Keep"));
    const auto drop = repository.createTag(QStringLiteral("Drop"));
    QVERIFY(keep && drop);

    const QString a = imagePath(QStringLiteral("a.png"));
    const QString b = imagePath(QStringLiteral("b.png"));
    QVERIFY(repository.assign(keep->id, a));
    QVERIFY(repository.assign(drop->id, a));
    QVERIFY(repository.assign(drop->id, b));

    QVERIFY(repository.deleteTag(drop->id));
    QVERIFY(!repository.tag(drop->id).has_value());
    QCOMPARE(repository.tagsFor(a).size(), 1);
    QCOMPARE(repository.tagsFor(a).first().id, keep->id);
    QVERIFY(!repository.assignments().contains(b));
    QVERIFY(!repository.deleteTag(drop->id));
}

void TagRepositoryTest::removeImageForgetsAssignments()
{
    TagRepository repository;
    const auto tag = repository.createTag(QStringLiteral("Gone"));
    QVERIFY(tag.has_value());
    const QString path = imagePath(QStringLiteral("gone.png"));
    QVERIFY(repository.assign(tag->id, path));

    QSignalSpy changedSpy(&repository, &TagRepository::tagsChanged);
    QVERIFY(repository.removeImage(path));
    QVERIFY(repository.removeImage(path));
    QCOMPARE(changedSpy.count(), 1);
    QCOMPARE(repository.tag(tag->id)->usageCount, 0);
}

void TagRepositoryTest::persistsAcrossInstances()
{
    const QString storage = m_dir->filePath(QStringLiteral("db/tags.json"));
    const QString path = imagePath(QStringLiteral("pic.png"));
    qint64 firstId = 0;
    {
        TagRepository repository;
        repository.setStoragePath(storage);
        QVERIFY(repository.load());
        const auto tag = repository.createTag(QStringLiteral("Sea"), QStringLiteral("#0000FF"));
        QVERIFY(tag.has_value());
        firstId = tag->id;
        QVERIFY(repository.assign(tag->id, path));
        const auto removed = repository.createTag(QStringLiteral("Temp"));
        QVERIFY(removed.has_value());
        QVERIFY(repository.deleteTag(removed->id));
    }
    QVERIFY(QFile::exists(storage));

    TagRepository reloaded;
    reloaded.setStoragePath(storage);
    QSignalSpy changedSpy(&reloaded, &TagRepository::tagsChanged);
    QString error;
    QVERIFY2(reloaded.load(&error), qPrintable(error));
    QCOMPARE(changedSpy.count(), 1);

    const QList<TagRecord> tags = reloaded.tagsFor(path);
    QCOMPARE(tags.size(), 1);
    QCOMPARE(tags.first().id, firstId);
    QCOMPARE(tags.first().colorHex, QStringLiteral("#0000FF"));

    // Ids of deleted tags are never handed out again.
    const auto fresh = reloaded.createTag(QStringLiteral("Fresh"));
    QVERIFY(fresh.has_value());
    QCOMPARE(fresh->id, firstId + 2);
}

void TagRepositoryTest::malformedDatabaseIsReported()
{
    const QString storage = m_dir->filePath(QStringLiteral("tags.json"));
    QFile file(storage);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{\"tags\": [");
    file.close();

    TagRepository repository;
    repository.setStoragePath(storage);
    QString error;
    QVERIFY(!repository.load(&error));
    QVERIFY(error.contains(QStringLiteral("Malformed")));
    QVERIFY(repository.allTags().isEmpty());
}

void TagRepositoryTest::scopedSummariesAndDirectoryUsage()
{
    TagRepository repository;
    const auto red = repository.createTag(QStringLiteral("red"));
    const auto blue = repository.createTag(QStringLiteral("Blue"));
    QVERIFY(red && blue);

    const QString one = imagePath(QStringLiteral("set/one.png"));
    const QString two = imagePath(QStringLiteral("set/two.png"));
    const QString elsewhere = imagePath(QStringLiteral("other/three.png"));
    QVERIFY(repository.assign(red->id, one));
    QVERIFY(repository.assign(red->id, two));
    QVERIFY(repository.assign(blue->id, two));
    QVERIFY(repository.assign(blue->id, elsewhere));

    const QList<ScopedTagSummary> scoped = repository.scopedSummaries({one, two, two});
    QCOMPARE(scoped.size(), 2);
    QCOMPARE(scoped.at(0).name, QStringLiteral("Blue"));
    QCOMPARE(scoped.at(0).usageCount, 1);
    QCOMPARE(scoped.at(1).name, QStringLiteral("red"));
    QCOMPARE(scoped.at(1).usageCount, 2);

    const QHash<qint64, int> usage = repository.directoryUsage(imagePath(QStringLiteral("set")));
    QCOMPARE(usage.value(red->id), 2);
    QCOMPARE(usage.value(blue->id), 1);
    QCOMPARE(repository.directoryUsage(imagePath(QStringLiteral("other"))).value(red->id), 0);
}

void TagRepositoryTest::hexColourNormalization()
{
    using pixor::tags::normalizedHexColor;
    QCOMPARE(normalizedHexColor(QStringLiteral(" #abcdef ")), std::optional<QString>(QStringLiteral("#ABCDEF")));
    QCOMPARE(normalizedHexColor(QStringLiteral("11223344")), std::optional<QString>(QStringLiteral("#11223344")));
    QVERIFY(!normalizedHexColor(QStringLiteral("#GGGGGG")).has_value());
    QVERIFY(!normalizedHexColor(QStringLiteral("#1234")).has_value());

    QCOMPARE(pixor::tags::filterModeFromName(QStringLiteral(" Exclude")),
             std::optional<TagFilterMode>(TagFilterMode::Exclude));
    QVERIFY(!pixor::tags::filterModeFromName(QStringLiteral("none")).has_value());
}

void TagRepositoryTest::failedWriteLeavesRepositoryUnchanged()
{
    const QString blocker = m_dir->filePath(QStringLiteral("blocker"));
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("not a directory");
    file.close();

    TagRepository repository;
    const auto kept = repository.createTag(QStringLiteral("Kept"));
    QVERIFY(kept.has_value());
    QVERIFY(repository.assign(kept->id, imagePath(QStringLiteral("a.png"))));

    repository.setStoragePath(blocker + QStringLiteral("/tags.json"));
    QSignalSpy changedSpy(&repository, &TagRepository::tagsChanged);
    const quint64 version = repository.version();

    QString error;
    QVERIFY(!repository.createTag(QStringLiteral("Sky"), QString(), &error).has_value());
    QVERIFY(!error.isEmpty());
    QVERIFY(!repository.tagNamed(QStringLiteral("Sky")).has_value());
    // ensureTag does not pick up the tag that could not be written.
    QVERIFY(!repository.ensureTag(QStringLiteral("Sky")).has_value());

    QVERIFY(!repository.renameTag(kept->id, QStringLiteral("Renamed")));
    QVERIFY(!repository.deleteTag(kept->id));
    QVERIFY(!repository.assign(kept->id, imagePath(QStringLiteral("b.png"))));
    QVERIFY(!repository.removeImage(imagePath(QStringLiteral("a.png"))));

    QCOMPARE(repository.allTags().size(), 1);
    QCOMPARE(repository.allTags().first().name, QStringLiteral("Kept"));
    QCOMPARE(repository.tagsFor(imagePath(QStringLiteral("a.png"))).size(), 1);
    QVERIFY(repository.tagsFor(imagePath(QStringLiteral("b.png"))).isEmpty());
    QCOMPARE(repository.version(), version);
    QCOMPARE(changedSpy.count(), 0);

    // Ids continue from the last written state.
    repository.setStoragePath(m_dir->filePath(QStringLiteral("tags.json")));
    const auto sky = repository.createTag(QStringLiteral("Sky"));
    QVERIFY(sky.has_value());
    QCOMPARE(sky->id, kept->id + 1);
}

QTEST_GUILESS_MAIN(TagRepositoryTest)
#include "TagRepositoryTest.moc"
