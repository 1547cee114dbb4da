#include "recordingcanvas.h"

#include <QTimer>

RecordingCanvas::RecordingCanvas(const QSizeF &pageSize)
    : m_pageSize(pageSize)
{
}

void RecordingCanvas::setValid(bool valid, const QString &error)
{
    m_valid = valid;
    m_error = error;
}

qreal RecordingCanvas::textWidth(const QString &text, const TextStyle &style) const
{
    return text.size() * style.size * 0.5;
}

void RecordingCanvas::record(Op op)
{
    op.page = m_pageCount - 1;
    m_ops.append(op);
}

void RecordingCanvas::drawRect(const QRectF &rect, const QColor &fill,
                               const QColor &stroke, qreal)
{
    Op op;
    op.kind = Op::Rect;
    op.rect = rect;
    op.color = fill.isValid() ? fill : stroke;
    record(op);
}

void RecordingCanvas::drawRoundedRect(const QRectF &rect, qreal, const QColor &fill,
                                      const QColor &stroke, qreal)
{
    Op op;
    op.kind = Op::RoundedRect;
    op.rect = rect;
    op.color = fill.isValid() ? fill : stroke;
    record(op);
}

void RecordingCanvas::drawLine(const QPointF &p1, const QPointF &p2,
                               const QColor &color, qreal)
{
    Op op;
    op.kind = Op::Line;
    op.rect = QRectF(p1, p2);
    op.color = color;
    record(op);
}

void RecordingCanvas::drawText(const QString &text, const TextStyle &style,
                               qreal x, qreal baselineY)
{
    Op op;
    op.kind = Op::Text;
    op.rect = QRectF(x, baselineY, textWidth(text, style), 0);
    op.text = text;
    op.style = style;
    op.color = style.color;
    record(op);
}

void RecordingCanvas::drawImage(const QRectF &destRect, const LoadedImage &)
{
    Op op;
    op.kind = Op::Image;
    op.rect = destRect;
    record(op);
}

QList<RecordingCanvas::Op> RecordingCanvas::ops(Op::Kind kind, int page) const
{
    QList<Op> result;
    for (const Op &op : m_ops) {
        if (op.kind == kind && (page < 0 || op.page == page))
            result.append(op);
    }
    return result;
}

QStringList RecordingCanvas::texts(int page) const
{
    QStringList result;
    for (const Op &op : ops(Op::Text, page))
        result.append(op.text);
    return result;
}

int RecordingCanvas::pageOfText(const QString &text) const
{
    for (const Op &op : m_ops) {
        if (op.kind == Op::Text && op.text == text)
            return op.page;
    }
    return -1;
}

// ---------------------------------------------------------------------------

ScriptedImageLoader::ScriptedImageLoader(Mode mode, QObject *parent)
    : QObject(parent)
    , m_mode(mode)
{
    image.jpegData = QByteArrayLiteral("\xff\xd8 scripted \xff\xd9");
    image.width = 400;
    image.height = 300;
}

FetchResult ScriptedImageLoader::resultFor(const QUrl &url) const
{
    if (failingUrls.contains(url.toString()))
        return FetchResult::failure(QStringLiteral("HTTP 404"));
    FetchResult result;
    result.ok = true;
    result.image = image;
    return result;
}

void ScriptedImageLoader::fetch(const QUrl &url, Callback callback)
{
    m_requested.append(url.toString());
    m_maxInFlight = qMax(m_maxInFlight, ++m_inFlight);

    if (m_mode == Synchronous) {
        --m_inFlight;
        callback(resultFor(url));
        return;
    }

    const FetchResult result = resultFor(url);
    QTimer::singleShot(0, this, [this, result, callback]() {
        --m_inFlight;
        callback(result);
    });
}
