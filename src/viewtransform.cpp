#include "viewtransform.h"
#include <algorithm>

ViewTransform::ViewTransform()
    : m_zoom(1.0)
{
}

void ViewTransform::setImageSize(const QSize& size)
{
    m_imageSize = size;
    fit();
}

void ViewTransform::setViewportSize(const QSize& size)
{
    m_viewportSize = size;
    fit();
}

double ViewTransform::fitScale() const
{
    if (m_imageSize.isEmpty() || m_viewportSize.isEmpty()) {
        return 0.0;
    }
    double sx = static_cast<double>(m_viewportSize.width()) / m_imageSize.width();
    double sy = static_cast<double>(m_viewportSize.height()) / m_imageSize.height();
    return std::min(sx, sy);
}

void ViewTransform::fit()
{
    m_zoom = 1.0;
    double s = scale();
    m_offset = QPointF((m_viewportSize.width() - m_imageSize.width() * s) / 2.0,
                       (m_viewportSize.height() - m_imageSize.height() * s) / 2.0);
}

bool ViewTransform::zoomAt(double factor, const QPointF& anchor)
{
    if (fitScale() <= 0.0 || factor <= 0.0) {
        return false;
    }

    double newZoom = std::max(MIN_ZOOM, std::min(MAX_ZOOM, m_zoom * factor));
    if (newZoom == m_zoom) {
        return false;
    }

    QPointF imagePoint = mapToImage(anchor);
    m_zoom = newZoom;
    m_offset = anchor - imagePoint * scale();
    return true;
}

void ViewTransform::pan(const QPointF& delta)
{
    m_offset += delta;
}

QRectF ViewTransform::imageRect() const
{
    double s = scale();
    return QRectF(m_offset, QSizeF(m_imageSize.width() * s, m_imageSize.height() * s));
}

QPointF ViewTransform::mapToImage(const QPointF& widgetPoint) const
{
    double s = scale();
    if (s <= 0.0) {
        return QPointF();
    }
    return (widgetPoint - m_offset) / s;
}

QPointF ViewTransform::mapFromImage(const QPointF& imagePoint) const
{
    return m_offset + imagePoint * scale();
}

QRectF ViewTransform::boxRect(const BoundingBox& box) const
{
    if (m_imageSize.isEmpty()) {
        return QRectF();
    }

    double w = m_imageSize.width();
    double h = m_imageSize.height();
    QPointF topLeft = mapFromImage(QPointF(box.xMin * w / BOX_SCALE, box.yMin * h / BOX_SCALE));
    QPointF bottomRight = mapFromImage(QPointF(box.xMax * w / BOX_SCALE, box.yMax * h / BOX_SCALE));
    return QRectF(topLeft, bottomRight).normalized();
}
