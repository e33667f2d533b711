#ifndef IMAGEVIEWER_H
#define IMAGEVIEWER_H

#include <QWidget>
#include <QImage>
#include <QList>
#include <QPoint>
#include "viewtransform.h"
#include "cardrecord.h"

/**
 * Card image display with wheel zoom, drag pan and a bounding box overlay
 */
class ImageViewer : public QWidget
{
    Q_OBJECT

public:
    explicit ImageViewer(QWidget* parent = nullptr);

    void setImage(const QImage& image);
    void clearImage();
    bool hasImage() const { return !m_image.isNull(); }

    void setBoxes(const QList<BoundingBox>& boxes);
    void setShowBoxes(bool show);
    bool showBoxes() const { return m_showBoxes; }

    void setPlaceholderText(const QString& text);

    /**
     * Move the image by a keyboard pan step
     */
    void panBy(double dx, double dy);

    const ViewTransform& transform() const { return m_transform; }

    QSize minimumSizeHint() const override;
    QSize sizeHint() const override;

public slots:
    void fitToView();

signals:
    void zoomChanged(double zoom);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    QImage m_image;
    QList<BoundingBox> m_boxes;
    ViewTransform m_transform;
    bool m_showBoxes;
    bool m_dragging;
    QPoint m_lastDragPos;
    QString m_placeholder;
};

#endif // IMAGEVIEWER_H
