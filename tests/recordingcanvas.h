#ifndef RECORDINGCANVAS_H
#define RECORDINGCANVAS_H

#include <QList>
#include <QObject>
#include <QSet>
#include <QStringList>
#include <QUrl>

#include "imageloader.h"
#include "reportcanvas.h"

// ReportCanvas that records every call instead of drawing.  Text advances
// half the font size per UTF-16 unit so layouts are predictable.
class RecordingCanvas : public ReportCanvas
{
public:
    struct Op {
        enum Kind { Rect, RoundedRect, Line, Text, Image };
        Kind kind = Rect;
        int page = -1;
        QRectF rect;       // text: x, baseline, width, 0
        QString text;
        TextStyle style;
        QColor color;
    };

    explicit RecordingCanvas(const QSizeF &pageSize);

    void setValid(bool valid, const QString &error = QString());

    bool isValid() const override { return m_valid; }
    QString errorString() const override { return m_error; }

    void beginPage() override { ++m_pageCount; }
    int pageCount() const override { return m_pageCount; }
    QSizeF pageSize() const override { return m_pageSize; }

    qreal textWidth(const QString &text, const TextStyle &style) const override;
    qreal ascent(const TextStyle &style) const override { return style.size * 0.8; }
    qreal descent(const TextStyle &style) const override { return style.size * 0.2; }

    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(), qreal strokeWidth = 0) override;
    void drawRoundedRect(const QRectF &rect, qreal radius,
                         const QColor &fill, const QColor &stroke = QColor(),
                         qreal strokeWidth = 0) override;
    void drawLine(const QPointF &p1, const QPointF &p2,
                  const QColor &color, qreal width = 0.5) override;
    void drawText(const QString &text, const TextStyle &style,
                  qreal x, qreal baselineY) override;
    void drawImage(const QRectF &destRect, const LoadedImage &image) override;

    const QList<Op> &ops() const { return m_ops; }
    QList<Op> ops(Op::Kind kind, int page = -1) const;
    QStringList texts(int page = -1) const;
    /// Page of the first text op equal to @p text, or -1.
    int pageOfText(const QString &text) const;

private:
    void record(Op op);

    QSizeF m_pageSize;
    bool m_valid = true;
    QString m_error;
    int m_pageCount = 0;
    QList<Op> m_ops;
};

// ImageLoader with scripted outcomes.  Fails every URL in failingUrls,
// resolves the others with a fixed-size image, either inside fetch() or
// from the event loop.
class ScriptedImageLoader : public QObject, public ImageLoader
{
    Q_OBJECT

public:
    enum Mode { Synchronous, Asynchronous };

    explicit ScriptedImageLoader(Mode mode, QObject *parent = nullptr);

    void fetch(const QUrl &url, Callback callback) override;

    QSet<QString> failingUrls;
    LoadedImage image;

    QStringList requested() const { return m_requested; }
    int maxInFlight() const { return m_maxInFlight; }

private:
    FetchResult resultFor(const QUrl &url) const;

    Mode m_mode;
    QStringList m_requested;
    int m_inFlight = 0;
    int m_maxInFlight = 0;
};

#endif // RECORDINGCANVAS_H
