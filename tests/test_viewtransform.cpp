#include <gtest/gtest.h>
#include "viewtransform.h"

namespace {

void expectNear(const QPointF& actual, const QPointF& expected)
{
    EXPECT_NEAR(actual.x(), expected.x(), 1e-6);
    EXPECT_NEAR(actual.y(), expected.y(), 1e-6);
}

} // namespace

class ViewTransformTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_view.setViewportSize(QSize(800, 600));
        m_view.setImageSize(QSize(400, 100));
    }

    ViewTransform m_view;
};

TEST_F(ViewTransformTest, FitCentersWholeImage)
{
    // Width limited: 800 / 400 = 2, height would allow 6
    EXPECT_DOUBLE_EQ(m_view.fitScale(), 2.0);
    EXPECT_DOUBLE_EQ(m_view.zoom(), 1.0);

    QRectF rect = m_view.imageRect();
    EXPECT_DOUBLE_EQ(rect.width(), 800.0);
    EXPECT_DOUBLE_EQ(rect.height(), 200.0);
    expectNear(rect.topLeft(), QPointF(0, 200));
}

TEST_F(ViewTransformTest, NoImageHasNoScale)
{
    ViewTransform empty;
    empty.setViewportSize(QSize(800, 600));
    EXPECT_DOUBLE_EQ(empty.fitScale(), 0.0);
    EXPECT_FALSE(empty.zoomAt(ViewTransform::WHEEL_ZOOM_IN, QPointF(10, 10)));
    EXPECT_TRUE(empty.boxRect(BoundingBox("village", 0, 0, 1000, 1000)).isNull());
}

TEST_F(ViewTransformTest, ZoomKeepsAnchorFixed)
{
    QPointF anchor(300, 250);
    QPointF before = m_view.mapToImage(anchor);

    ASSERT_TRUE(m_view.zoomAt(ViewTransform::WHEEL_ZOOM_IN, anchor));
    EXPECT_DOUBLE_EQ(m_view.zoom(), 1.1);
    expectNear(m_view.mapToImage(anchor), before);
    expectNear(m_view.mapFromImage(before), anchor);
}

TEST_F(ViewTransformTest, ZoomIsClamped)
{
    for (int i = 0; i < 100; ++i) {
        m_view.zoomAt(ViewTransform::WHEEL_ZOOM_IN, QPointF(400, 300));
    }
    EXPECT_DOUBLE_EQ(m_view.zoom(), ViewTransform::MAX_ZOOM);
    EXPECT_FALSE(m_view.zoomAt(ViewTransform::WHEEL_ZOOM_IN, QPointF(400, 300)));

    for (int i = 0; i < 100; ++i) {
        m_view.zoomAt(ViewTransform::WHEEL_ZOOM_OUT, QPointF(400, 300));
    }
    EXPECT_DOUBLE_EQ(m_view.zoom(), ViewTransform::MIN_ZOOM);
    EXPECT_FALSE(m_view.zoomAt(ViewTransform::WHEEL_ZOOM_OUT, QPointF(400, 300)));
}

TEST_F(ViewTransformTest, PanMovesImage)
{
    QPointF before = m_view.offset();
    m_view.pan(QPointF(ViewTransform::PAN_STEP, -ViewTransform::PAN_STEP));
    expectNear(m_view.offset(), before + QPointF(20, -20));

    m_view.fit();
    expectNear(m_view.offset(), before);
}

TEST_F(ViewTransformTest, ResizeRefits)
{
    m_view.zoomAt(2.0, QPointF(0, 0));
    m_view.setViewportSize(QSize(400, 400));
    EXPECT_DOUBLE_EQ(m_view.zoom(), 1.0);
    EXPECT_DOUBLE_EQ(m_view.fitScale(), 1.0);
    expectNear(m_view.offset(), QPointF(0, 150));
}

TEST_F(ViewTransformTest, BoxRectScalesNormalizedCoordinates)
{
    // [yMin, xMin, yMax, xMax] on the 0-1000 grid
    QRectF rect = m_view.boxRect(BoundingBox("village", 100, 250, 500, 750));

    // Image is 400x100 drawn at scale 2 from (0, 200)
    expectNear(rect.topLeft(), QPointF(250 * 0.4 * 2, 200 + 100 * 0.1 * 2));
    expectNear(rect.bottomRight(), QPointF(750 * 0.4 * 2, 200 + 500 * 0.1 * 2));
}

TEST_F(ViewTransformTest, BoxRectFollowsZoom)
{
    BoundingBox box("ration_card_id", 0, 0, 1000, 1000);
    ASSERT_TRUE(m_view.zoomAt(2.0, QPointF(400, 300)));
    EXPECT_EQ(m_view.boxRect(box), m_view.imageRect());
}
