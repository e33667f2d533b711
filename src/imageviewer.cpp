#include "imageviewer.h"
#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QResizeEvent>

ImageViewer::ImageViewer(QWidget* parent)
    : QWidget(parent)
    , m_showBoxes(true)
    , m_dragging(false)
    , m_placeholder("No image loaded")
{
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    setFocusPolicy(Qt::ClickFocus);
    setAutoFillBackground(false);
}

void ImageViewer::setImage(const QImage& image)
{
    m_image = image;
    m_transform.setViewportSize(size());
    m_transform.setImageSize(m_image.size());
    emit zoomChanged(m_transform.zoom());
    update();
}

void ImageViewer::clearImage()
{
    m_image = QImage();
    m_boxes.clear();
    m_transform.setImageSize(QSize());
    update();
}

void ImageViewer::setBoxes(const QList<BoundingBox>& boxes)
{
    m_boxes = boxes;
    update();
}

void ImageViewer::setShowBoxes(bool show)
{
    m_showBoxes = show;
    update();
}

void ImageViewer::setPlaceholderText(const QString& text)
{
    m_placeholder = text;
    update();
}

void ImageViewer::panBy(double dx, double dy)
{
    if (!hasImage()) {
        return;
    }
    m_transform.pan(QPointF(dx, dy));
    update();
}

void ImageViewer::fitToView()
{
    m_transform.fit();
    emit zoomChanged(m_transform.zoom());
    update();
}

QSize ImageViewer::minimumSizeHint() const
{
    return QSize(320, 240);
}

QSize ImageViewer::sizeHint() const
{
    return QSize(720, 540);
}

void ImageViewer::paintEvent(QPaintEvent* /*event*/)
{
    QPainter painter(this);
    painter.fillRect(rect(), palette().color(QPalette::Base));

    if (m_image.isNull()) {
        painter.setPen(palette().color(QPalette::Disabled, QPalette::Text));
        painter.drawText(rect(), Qt::AlignCenter, m_placeholder);
        return;
    }

    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.drawImage(m_transform.imageRect(), m_image);

    if (!m_showBoxes || m_boxes.isEmpty()) {
        return;
    }

    painter.setRenderHint(QPainter::Antialiasing);
    QFont font = painter.font();
    font.setPointSize(8);
    painter.setFont(font);

    for (const BoundingBox& box : m_boxes) {
        QRectF r = m_transform.boxRect(box);
        if (r.isNull()) {
            continue;
        }
        painter.setPen(QPen(QColor(244, 67, 54), 2));  // Red
        painter.setBrush(QColor(244, 67, 54, 30));
        painter.drawRect(r);

        painter.setPen(QColor(244, 67, 54));
        painter.drawText(r.topLeft() + QPointF(2, -3), box.field);
    }
}

void ImageViewer::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    m_transform.setViewportSize(event->size());
    emit zoomChanged(m_transform.zoom());
}

void ImageViewer::wheelEvent(QWheelEvent* event)
{
    if (!hasImage()) {
        event->ignore();
        return;
    }

    double factor = event->angleDelta().y() > 0 ? ViewTransform::WHEEL_ZOOM_IN
                                                 : ViewTransform::WHEEL_ZOOM_OUT;
#if QT_VERSION >= QT_VERSION_CHECK(5, 14, 0)
    QPointF anchor = event->position();
#else
    QPointF anchor = event->posF();
#endif
    if (m_transform.zoomAt(factor, anchor)) {
        emit zoomChanged(m_transform.zoom());
        update();
    }
    event->accept();
}

void ImageViewer::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && hasImage()) {
        m_dragging = true;
        m_lastDragPos = event->pos();
        setCursor(Qt::ClosedHandCursor);
    }
    QWidget::mousePressEvent(event);
}

void ImageViewer::mouseMoveEvent(QMouseEvent* event)
{
    if (m_dragging) {
        QPoint delta = event->pos() - m_lastDragPos;
        m_lastDragPos = event->pos();
        m_transform.pan(delta);
        update();
    }
    QWidget::mouseMoveEvent(event);
}

void ImageViewer::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_dragging) {
        m_dragging = false;
        unsetCursor();
    }
    QWidget::mouseReleaseEvent(event);
}

void ImageViewer::mouseDoubleClickEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && hasImage()) {
        fitToView();
    }
    QWidget::mouseDoubleClickEvent(event);
}
