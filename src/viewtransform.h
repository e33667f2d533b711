#ifndef VIEWTRANSFORM_H
#define VIEWTRANSFORM_H

#include <QSize>
#include <QPointF>
#include <QRectF>
#include "cardrecord.h"

/**
 * @brief Zoom and pan state of the image view
 *
 * Zoom is relative to the fit-to-viewport scale, so 1.0 always means
 * "whole image visible" regardless of image or window size.
 */
class ViewTransform
{
public:
    static constexpr double MIN_ZOOM = 0.1;
    static constexpr double MAX_ZOOM = 5.0;
    static constexpr double WHEEL_ZOOM_IN = 1.1;
    static constexpr double WHEEL_ZOOM_OUT = 0.9;
    static constexpr double PAN_STEP = 20.0;
    static constexpr int BOX_SCALE = 1000;    // Boxes are normalized to 0..1000

    ViewTransform();

    void setImageSize(const QSize& size);
    void setViewportSize(const QSize& size);
    QSize imageSize() const { return m_imageSize; }
    QSize viewportSize() const { return m_viewportSize; }

    /**
     * Reset to zoom 1.0 with the image centered
     */
    void fit();

    /**
     * Scale at which the whole image fits the viewport
     * @return Pixel scale, 0 if either size is empty
     */
    double fitScale() const;

    double zoom() const { return m_zoom; }

    /**
     * Effective image-to-widget scale
     */
    double scale() const { return fitScale() * m_zoom; }

    /**
     * Multiply the zoom, keeping the image point under anchor in place
     * @param factor Zoom multiplier
     * @param anchor Widget coordinates
     * @return false if the zoom was already at the clamp limit
     */
    bool zoomAt(double factor, const QPointF& anchor);

    /**
     * Move the image by a widget-space delta
     */
    void pan(const QPointF& delta);

    /**
     * Widget position of the image's top-left corner
     */
    QPointF offset() const { return m_offset; }

    /**
     * Image bounds in widget coordinates
     */
    QRectF imageRect() const;

    QPointF mapToImage(const QPointF& widgetPoint) const;
    QPointF mapFromImage(const QPointF& imagePoint) const;

    /**
     * Widget rectangle of a normalized bounding box
     * @param box Box in [0, BOX_SCALE] coordinates
     * @return Rectangle in widget coordinates, null if no image
     */
    QRectF boxRect(const BoundingBox& box) const;

private:
    QSize m_imageSize;
    QSize m_viewportSize;
    double m_zoom;
    QPointF m_offset;
};

#endif // VIEWTRANSFORM_H
