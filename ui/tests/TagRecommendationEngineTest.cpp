#include <QtTest/QtTest>

#include "tags/TagRecommendationEngine.hpp"
#include "tags/TagRepository.hpp"

using pixor::tags::RecommendationInput;
using pixor::tags::recommendedTags;

namespace {

TagRecord tagRecord(qint64 id, const QString& name)
{
    TagRecord record;
    record.id = id;
    record.name = name;
    return record;
}

QStringList namesOf(const QList<TagRecord>& tags)
{
    QStringList names;
    for (const TagRecord& tag : tags)
        names.append(tag.name);
    return names;
}

} // namespace

class TagRecommendationEngineTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void siblingsRankFirst();
    void scopedUsageRaisesScore();
    void limitIsHonoured();
    void repositoryOverloadGathersInput();

private:
    RecommendationInput baseInput() const;

    QString m_root;
};

void TagRecommendationEngineTest::initTestCase()
{
    m_root = QDir::cleanPath(QDir::tempPath() + QStringLiteral("/pixor-recommend"));
}

RecommendationInput TagRecommendationEngineTest::baseInput() const
{
    const TagRecord alpha = tagRecord(1, QStringLiteral("alpha"));
    const TagRecord beta = tagRecord(2, QStringLiteral("Beta"));
    const TagRecord gamma = tagRecord(3, QStringLiteral("gamma"));
    const TagRecord delta = tagRecord(4, QStringLiteral("Delta"));

    RecommendationInput input;
    input.imagePath = m_root + QStringLiteral("/album/target.png");
    input.allTags = {delta, gamma, beta, alpha};
    input.assignments.insert(m_root + QStringLiteral("/album/target.png"), {delta});
    input.assignments.insert(m_root + QStringLiteral("/album/a.png"), {alpha});
    input.assignments.insert(m_root + QStringLiteral("/album/b.png"), {alpha, beta});
    input.assignments.insert(m_root + QStringLiteral("/elsewhere/c.png"), {gamma, beta});
    return input;
}

void TagRecommendationEngineTest::siblingsRankFirst()
{
    // alpha and beta come from neighbours; gamma only fills up by name.
    QCOMPARE(namesOf(recommendedTags(baseInput(), 5)),
             (QStringList{QStringLiteral("alpha"), QStringLiteral("Beta"), QStringLiteral("gamma")}));
}

void TagRecommendationEngineTest::scopedUsageRaisesScore()
{
    RecommendationInput input = baseInput();
    // 0.9 * log1p(10) outweighs one sibling occurrence.
    input.scopedSummaries = {ScopedTagSummary{3, QStringLiteral("gamma"), QString(), 10}};
    QCOMPARE(namesOf(recommendedTags(input, 3)),
             (QStringList{QStringLiteral("alpha"), QStringLiteral("gamma"), QStringLiteral("Beta")}));

    input.scopedSummaries = {ScopedTagSummary{4, QStringLiteral("Delta"), QString(), 50}};
    QVERIFY(!namesOf(recommendedTags(input, 5)).contains(QStringLiteral("Delta")));
}

void TagRecommendationEngineTest::limitIsHonoured()
{
    QVERIFY(recommendedTags(baseInput(), 0).isEmpty());
    QCOMPARE(namesOf(recommendedTags(baseInput(), 1)), QStringList{QStringLiteral("alpha")});

    RecommendationInput empty;
    empty.imagePath = m_root + QStringLiteral("/album/target.png");
    empty.allTags = {tagRecord(2, QStringLiteral("b")), tagRecord(1, QStringLiteral("A"))};
    QCOMPARE(namesOf(recommendedTags(empty, 5)), (QStringList{QStringLiteral("A"), QStringLiteral("b")}));
}

void TagRecommendationEngineTest::repositoryOverloadGathersInput()
{
    TagRepository repository;
    const auto alpha = repository.createTag(QStringLiteral("alpha"));
    const auto beta = repository.createTag(QStringLiteral("beta"));
    const auto gamma = repository.createTag(QStringLiteral("gamma"));
    const auto delta = repository.createTag(QStringLiteral("delta"));
    QVERIFY(alpha && beta && gamma && delta);

    const QString target = m_root + QStringLiteral("/album/target.png");
    const QString a = m_root + QStringLiteral("/album/a.png");
    const QString b = m_root + QStringLiteral("/album/b.png");
    QVERIFY(repository.assign(delta->id, target));
    QVERIFY(repository.assign(alpha->id, a));
    QVERIFY(repository.assign(alpha->id, b));
    QVERIFY(repository.assign(beta->id, b));

    const QList<TagRecord> result = pixor::tags::recommendedTags(repository, target, {target, a, b}, 3);
    QCOMPARE(namesOf(result),
             (QStringList{QStringLiteral("alpha"), QStringLiteral("beta"), QStringLiteral("gamma")}));
    QCOMPARE(result.first().usageCount, 2);
}

QTEST_GUILESS_MAIN(TagRecommendationEngineTest)
#include "TagRecommendationEngineTest.moc"
