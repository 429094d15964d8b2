#include <QtTest/QtTest>

#include "viewer/ImageTransform.hpp"

using pixor::viewer::rotated;

class ImageTransformTest : public QObject {
    Q_OBJECT

private slots:
    void rotationWrapsAndSnaps();
    void fourClockwiseTurnsAreIdentity();
    void mirrorTogglesAndSwapsAxes();
    void matrixMapsCorners();
    void jsonRestoresTransform();
};

void ImageTransformTest::rotationWrapsAndSnaps()
{
    QCOMPARE(rotated(ImageRotation::Deg0, 90), ImageRotation::Deg90);
    QCOMPARE(rotated(ImageRotation::Deg0, -90), ImageRotation::Deg270);
    QCOMPARE(rotated(ImageRotation::Deg270, 90), ImageRotation::Deg0);
    QCOMPARE(rotated(ImageRotation::Deg90, 720), ImageRotation::Deg90);
    QCOMPARE(rotated(ImageRotation::Deg0, 100), ImageRotation::Deg90);
    QCOMPARE(rotated(ImageRotation::Deg0, 350), ImageRotation::Deg0);
    QCOMPARE(rotated(ImageRotation::Deg0, -10), ImageRotation::Deg0);
}

void ImageTransformTest::fourClockwiseTurnsAreIdentity()
{
    ImageTransform transform = ImageTransform::identity().mirroredHorizontally();
    const ImageTransform start = transform;
    for (int i = 0; i < 4; ++i)
        transform = transform.rotatedClockwise();
    QCOMPARE(transform, start);
    QCOMPARE(ImageTransform().rotatedClockwise().rotatedCounterclockwise(), ImageTransform());
}

void ImageTransformTest::mirrorTogglesAndSwapsAxes()
{
    ImageTransform transform;
    QVERIFY(transform.isIdentity());
    transform = transform.mirroredVertically();
    QVERIFY(transform.mirrorV);
    QVERIFY(!transform.isIdentity());
    QCOMPARE(transform.mirroredVertically(), ImageTransform());

    QVERIFY(!ImageTransform().swapsAxes());
    QVERIFY(ImageTransform().rotatedClockwise().swapsAxes());
    QVERIFY(!ImageTransform().rotatedClockwise().rotatedClockwise().swapsAxes());
}

void ImageTransformTest::matrixMapsCorners()
{
    const QPointF corner(10, 5);

    ImageTransform mirrored;
    mirrored.mirrorH = true;
    QCOMPARE(mirrored.toMatrix().map(corner), QPointF(-10, 5));

    const QPointF turned = ImageTransform().rotatedClockwise().toMatrix(2.0).map(corner);
    QVERIFY(qAbs(turned.x() - -10.0) < 1e-9);
    QVERIFY(qAbs(turned.y() - 20.0) < 1e-9);
}

void ImageTransformTest::jsonRestoresTransform()
{
    ImageTransform transform = ImageTransform().rotatedCounterclockwise().mirroredHorizontally();
    QCOMPARE(ImageTransform::fromJson(transform.toJson()), transform);

    QJsonObject odd;
    odd.insert(QStringLiteral("rotation"), 190);
    QCOMPARE(ImageTransform::fromJson(odd).rotation, ImageRotation::Deg180);
    QCOMPARE(ImageTransform::fromJson(QJsonObject()), ImageTransform());
}

QTEST_GUILESS_MAIN(ImageTransformTest)
#include "ImageTransformTest.moc"
