/*
 * imageloader.cpp — Asynchronous photo fetching and JPEG normalization
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "imageloader.h"

#include <QBuffer>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>
#include <QImageWriter>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

ImageLoader::~ImageLoader() = default;

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

// Composites every pixel over opaque white.
static QImage flattenOntoWhite(const QImage &image)
{
    QImage argb = image.convertToFormat(QImage::Format_ARGB32);
    QImage flat(argb.size(), QImage::Format_RGB32);
    for (int y = 0; y < argb.height(); ++y) {
        const QRgb *src = reinterpret_cast<const QRgb *>(argb.constScanLine(y));
        QRgb *dst = reinterpret_cast<QRgb *>(flat.scanLine(y));
        for (int x = 0; x < argb.width(); ++x) {
            const int a = qAlpha(src[x]);
            const int inv = 255 - a;
            dst[x] = qRgb((qRed(src[x]) * a + 255 * inv) / 255,
                          (qGreen(src[x]) * a + 255 * inv) / 255,
                          (qBlue(src[x]) * a + 255 * inv) / 255);
        }
    }
    return flat;
}

FetchResult ImageLoader::encodeImage(const QImage &source)
{
    if (source.isNull())
        return FetchResult::failure(QStringLiteral("empty image"));

    QImage image = source.hasAlphaChannel()
        ? flattenOntoWhite(source)
        : source.convertToFormat(QImage::Format_RGB32);

    if (image.width() > kMaxDimension || image.height() > kMaxDimension)
        image = image.scaled(kMaxDimension, kMaxDimension, Qt::KeepAspectRatio,
                             Qt::SmoothTransformation);

    QByteArray jpeg;
    QBuffer buffer(&jpeg);
    if (!buffer.open(QIODevice::WriteOnly))
        return FetchResult::failure(buffer.errorString());

    QImageWriter writer(&buffer, "jpeg");
    writer.setQuality(kJpegQuality);
    writer.setProgressiveScanWrite(false);
    writer.setOptimizedWrite(false);
    if (!writer.write(image))
        return FetchResult::failure(QStringLiteral("JPEG encoding failed: ")
                                    + writer.errorString());

    FetchResult result;
    result.ok = true;
    result.image.jpegData = jpeg;
    result.image.width = image.width();
    result.image.height = image.height();
    return result;
}

FetchResult ImageLoader::encodePayload(const QByteArray &payload)
{
    if (payload.isEmpty())
        return FetchResult::failure(QStringLiteral("empty payload"));

    QBuffer buffer;
    buffer.setData(payload);
    if (!buffer.open(QIODevice::ReadOnly))
        return FetchResult::failure(buffer.errorString());
    QImageReader reader(&buffer);
    reader.setAutoTransform(true);
    const QImage image = reader.read();
    if (image.isNull())
        return FetchResult::failure(QStringLiteral("cannot decode image: ")
                                    + reader.errorString());
    return encodeImage(image);
}

QUrl ImageLoader::urlFromUserInput(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
        return {};
    if (QFileInfo(trimmed).isAbsolute() || QFileInfo::exists(trimmed))
        return QUrl::fromLocalFile(QFileInfo(trimmed).absoluteFilePath());
    return QUrl(trimmed);
}

// ---------------------------------------------------------------------------
// NetworkImageLoader
// ---------------------------------------------------------------------------

NetworkImageLoader::NetworkImageLoader(QObject *parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
{
    m_network->setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
}

NetworkImageLoader::~NetworkImageLoader() = default;

void NetworkImageLoader::fetchLocal(const QString &path, const Callback &callback)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        callback(FetchResult::failure(file.errorString()));
        return;
    }
    callback(encodePayload(file.readAll()));
}

void NetworkImageLoader::fetch(const QUrl &url, Callback callback)
{
    if (!url.isValid() || url.isEmpty()) {
        callback(FetchResult::failure(QStringLiteral("invalid URL")));
        return;
    }

    if (url.isLocalFile() || url.scheme().isEmpty()) {
        fetchLocal(url.isLocalFile() ? url.toLocalFile() : url.toString(), callback);
        return;
    }

    const QString scheme = url.scheme().toLower();
    if (scheme != QLatin1String("http") && scheme != QLatin1String("https")) {
        callback(FetchResult::failure(QStringLiteral("unsupported URL scheme: ") + scheme));
        return;
    }

    QNetworkRequest request(url);
    QNetworkReply *reply = m_network->get(request);
    connect(reply, &QNetworkReply::finished, this, [reply, callback = std::move(callback)]() {
        reply->deleteLater();

        if (reply->error() != QNetworkReply::NoError) {
            callback(FetchResult::failure(reply->errorString()));
            return;
        }
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status >= 400) {
            callback(FetchResult::failure(QStringLiteral("HTTP status %1").arg(status)));
            return;
        }
        callback(encodePayload(reply->readAll()));
    });
}
