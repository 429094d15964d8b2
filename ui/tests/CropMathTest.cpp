#include <QtTest/QtTest>

#include "viewer/CropMath.hpp"

using namespace pixor::viewer;

class CropMathTest : public QObject {
    Q_OBJECT

private slots:
    void ratioParsesIdentifiers();
    void ratioJsonRejectsDegenerateValues();
    void presetsResolveAspect();
    void fitRectKeepsAspectInsideBounds();
    void clampCropRectRoundsOutwardAndClips();
    void clampCropRectRejectsEmptyInput();
};

void CropMathTest::ratioParsesIdentifiers()
{
    const auto ratio = CropRatio::fromId(QStringLiteral(" 16 : 9 "));
    QVERIFY(ratio.has_value());
    QCOMPARE(ratio->width, 16);
    QCOMPARE(ratio->height, 9);
    QCOMPARE(ratio->id(), QStringLiteral("16:9"));
    QVERIFY(qFuzzyCompare(ratio->value(), 16.0 / 9.0));

    QVERIFY(!CropRatio::fromId(QStringLiteral("16x9")).has_value());
    QVERIFY(!CropRatio::fromId(QStringLiteral("0:9")).has_value());
    QVERIFY(!CropRatio::fromId(QStringLiteral("a:b")).has_value());
}

void CropMathTest::ratioJsonRejectsDegenerateValues()
{
    const CropRatio ratio{3, 2};
    QCOMPARE(CropRatio::fromJson(ratio.toJson()), std::optional<CropRatio>(ratio));

    QJsonObject broken;
    broken.insert(QStringLiteral("width"), -3);
    broken.insert(QStringLiteral("height"), 2);
    QVERIFY(!CropRatio::fromJson(broken).has_value());
    QCOMPARE(CropRatio{}.value(), 0.0);
}

void CropMathTest::presetsResolveAspect()
{
    QCOMPARE(allCropPresets().size(), 7);
    QCOMPARE(presetKey(CropPreset::R4_3), QStringLiteral("4:3"));
    QVERIFY(!presetFixedRatio(CropPreset::Original).has_value());

    const QSizeF image(400, 200);
    QVERIFY(!CropAspectOption::fromPreset(CropPreset::Freeform).resolvedAspect(image).has_value());
    QCOMPARE(*CropAspectOption::fromPreset(CropPreset::Original).resolvedAspect(image), 2.0);
    QCOMPARE(*CropAspectOption::fromPreset(CropPreset::Square).resolvedAspect(image), 1.0);
    QVERIFY(qFuzzyCompare(*CropAspectOption::fromPreset(CropPreset::R9_16).resolvedAspect(image), 9.0 / 16.0));
    QVERIFY(!CropAspectOption::original().resolvedAspect(QSizeF(0, 100)).has_value());
}

void CropMathTest::fitRectKeepsAspectInsideBounds()
{
    QCOMPARE(fitRect(QSizeF(400, 300), 2.0), QSizeF(400, 200));
    QCOMPARE(fitRect(QSizeF(400, 300), 0.5), QSizeF(150, 300));
    QCOMPARE(fitRect(QSizeF(400, 300), 0.0), QSizeF(0, 0));
    QCOMPARE(fitRect(QSizeF(0, 300), 1.0), QSizeF(0, 0));
}

void CropMathTest::clampCropRectRoundsOutwardAndClips()
{
    const QSize image(100, 80);
    QCOMPARE(clampCropRect(QRectF(10.4, 10.6, 20.2, 20.0), image), QRect(10, 10, 21, 21));
    QCOMPARE(clampCropRect(QRectF(-20, -20, 50, 50), image), QRect(0, 0, 30, 30));
    QCOMPARE(clampCropRect(QRectF(90, 70, 50, 50), image), QRect(90, 70, 10, 10));
    QCOMPARE(clampCropRect(QRectF(0, 0, 100, 80), image), QRect(0, 0, 100, 80));
}

void CropMathTest::clampCropRectRejectsEmptyInput()
{
    const QSize image(100, 80);
    QVERIFY(clampCropRect(QRectF(), image).isEmpty());
    QVERIFY(clampCropRect(QRectF(200, 200, 10, 10), image).isEmpty());
    QVERIFY(clampCropRect(QRectF(0, 0, 10, 10), QSize()).isEmpty());
}

QTEST_GUILESS_MAIN(CropMathTest)
#include "CropMathTest.moc"
