/*
 * imageloader.h — Asynchronous photo fetching and JPEG normalization
 *
 * Every fetched payload goes through the same encoder before it reaches
 * the canvas: decoded with QImage, alpha flattened onto white, scaled down
 * to at most kMaxDimension pixels on the longer side and re-encoded as a
 * baseline JPEG.  The PDF embeds the result verbatim (DCTDecode).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_IMAGELOADER_H
#define TICKETREPORT_IMAGELOADER_H

#include <QByteArray>
#include <QImage>
#include <QObject>
#include <QString>
#include <QUrl>

#include <functional>

#include "reportcanvas.h"

class QNetworkAccessManager;

struct FetchResult {
    bool ok = false;
    LoadedImage image;
    QString errorString;

    static FetchResult failure(const QString &message)
    {
        FetchResult r;
        r.errorString = message;
        return r;
    }
};

class ImageLoader
{
public:
    using Callback = std::function<void(const FetchResult &)>;

    static constexpr int kMaxDimension = 2000;
    static constexpr int kJpegQuality = 85;

    virtual ~ImageLoader();

    /// Resolves @p callback exactly once, either synchronously or later
    /// from the event loop.
    virtual void fetch(const QUrl &url, Callback callback) = 0;

    /// Decodes and normalizes an encoded image payload.
    static FetchResult encodePayload(const QByteArray &payload);
    static FetchResult encodeImage(const QImage &image);

    /// Local paths become file: URLs; anything with a scheme is kept.
    static QUrl urlFromUserInput(const QString &text);
};

class NetworkImageLoader : public QObject, public ImageLoader
{
    Q_OBJECT

public:
    explicit NetworkImageLoader(QObject *parent = nullptr);
    ~NetworkImageLoader() override;

    void fetch(const QUrl &url, Callback callback) override;

private:
    void fetchLocal(const QString &path, const Callback &callback);

    QNetworkAccessManager *m_network;
};

#endif // TICKETREPORT_IMAGELOADER_H
