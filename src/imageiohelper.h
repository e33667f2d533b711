#ifndef IMAGEIOHELPER_H
#define IMAGEIOHELPER_H

#include <QString>
#include <QFile>
#include <QFileInfo>
#include <QByteArray>
#include <QImage>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>
#include "operationerror.h"

/**
 * Helper functions for card image I/O
 *
 * cv::imread() and cv::imwrite() do not accept Unicode paths on Windows,
 * so files go through Qt's file APIs and cv::imdecode()/cv::imencode().
 */
class ImageIOHelper
{
public:
    enum class Rotation {
        Clockwise,
        CounterClockwise
    };

    /**
     * Write an image to disk with Unicode path support
     * @param filePath Target path, its extension selects the codec
     * @param image Image to save
     * @param params Codec parameters (e.g., JPEG quality)
     * @return true if successful
     */
    static bool imwriteUnicode(const QString& filePath, const cv::Mat& image,
                               const std::vector<int>& params = std::vector<int>())
    {
        if (image.empty()) {
            return false;
        }

        QString suffix = QFileInfo(filePath).suffix().toLower();
        QString ext = suffix.isEmpty() ? QString(".png") : "." + suffix;

        std::vector<uchar> buffer;
        try {
            if (!cv::imencode(ext.toStdString(), image, buffer, params)) {
                return false;
            }
        } catch (const cv::Exception&) {
            return false;
        }

        QFile file(filePath);
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }

        qint64 written = file.write(reinterpret_cast<const char*>(buffer.data()), buffer.size());
        file.close();

        return written == static_cast<qint64>(buffer.size());
    }

    /**
     * Read an image from disk with Unicode path support
     * @param filePath Path to read
     * @param flags OpenCV imread flags
     * @return Decoded image, empty if the file is missing or undecodable
     */
    static cv::Mat imreadUnicode(const QString& filePath, int flags = cv::IMREAD_COLOR)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            return cv::Mat();
        }

        QByteArray fileData = file.readAll();
        file.close();

        if (fileData.isEmpty()) {
            return cv::Mat();
        }

        std::vector<uchar> buffer(fileData.begin(), fileData.end());
        try {
            return cv::imdecode(buffer, flags);
        } catch (const cv::Exception&) {
            return cv::Mat();
        }
    }

    /**
     * Load an image and encode it as PNG for the OCR provider
     * @param filePath Image path
     * @param maxBytes Upper bound on the encoded size, 0 for no limit
     * @param error Output error (NotFound, CorruptData, IOError, or UnrecognizedFormat when too large)
     * @return PNG bytes, empty on failure
     */
    static QByteArray encodeForOcr(const QString& filePath, qint64 maxBytes, OperationError* error = nullptr)
    {
        if (!QFileInfo::exists(filePath)) {
            setOperationError(error, ErrorKind::NotFound, QString("Image not found: %1").arg(filePath));
            return QByteArray();
        }

        cv::Mat image = imreadUnicode(filePath);
        if (image.empty()) {
            setOperationError(error, ErrorKind::CorruptData, QString("Cannot decode image: %1").arg(filePath));
            return QByteArray();
        }

        std::vector<uchar> buffer;
        try {
            if (!cv::imencode(".png", image, buffer)) {
                setOperationError(error, ErrorKind::IOError, QString("Cannot encode image: %1").arg(filePath));
                return QByteArray();
            }
        } catch (const cv::Exception& e) {
            setOperationError(error, ErrorKind::IOError, QString("Cannot encode image: %1").arg(e.what()));
            return QByteArray();
        }

        if (maxBytes > 0 && static_cast<qint64>(buffer.size()) > maxBytes) {
            setOperationError(error, ErrorKind::UnrecognizedFormat,
                              QString("Encoded image is %1 bytes, limit is %2")
                                  .arg(buffer.size()).arg(maxBytes));
            return QByteArray();
        }

        return QByteArray(reinterpret_cast<const char*>(buffer.data()), static_cast<int>(buffer.size()));
    }

    /**
     * Rotate an image file by 90 degrees and write it back in place
     * @param filePath Image path
     * @param rotation Direction
     * @param error Output error
     * @return true if the file on disk was rotated
     */
    static bool rotateFile(const QString& filePath, Rotation rotation, OperationError* error = nullptr)
    {
        cv::Mat image = imreadUnicode(filePath, cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            setOperationError(error, ErrorKind::NotFound, QString("Cannot read image: %1").arg(filePath));
            return false;
        }

        cv::Mat rotated;
        cv::rotate(image, rotated, rotation == Rotation::Clockwise ? cv::ROTATE_90_CLOCKWISE
                                                                   : cv::ROTATE_90_COUNTERCLOCKWISE);

        if (!imwriteUnicode(filePath, rotated)) {
            setOperationError(error, QFileInfo(filePath).isWritable() ? ErrorKind::IOError : ErrorKind::Permission,
                              QString("Cannot write rotated image: %1").arg(filePath));
            return false;
        }
        return true;
    }

    /**
     * Convert a decoded image to a QImage for display
     * @param image BGR, BGRA or grayscale image
     * @return Deep-copied QImage, null if the format is unsupported
     */
    static QImage toQImage(const cv::Mat& image)
    {
        if (image.empty()) {
            return QImage();
        }

        cv::Mat rgb;
        switch (image.channels()) {
            case 1:
                cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB);
                break;
            case 3:
                cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
                break;
            case 4:
                cv::cvtColor(image, rgb, cv::COLOR_BGRA2RGB);
                break;
            default:
                return QImage();
        }
        if (rgb.depth() != CV_8U) {
            rgb.convertTo(rgb, CV_8U);
        }

        QImage view(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
        return view.copy();
    }
};

#endif // IMAGEIOHELPER_H
