// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxprapaintpipeline.h"
#include "qxpracompression.h"
#include "qxpravideodecoder.h"

#include <QtConcurrent/QtConcurrentRun>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFutureWatcher>
#include <QtCore/QHash>
#include <QtCore/QQueue>
#include <QtGui/QImageReader>
#include <QtGui/QPainter>

#include <csetjmp>
#include <cstdio>
#include <functional>
#include <utility>

#include <jpeglib.h>

QT_BEGIN_NAMESPACE

namespace {

struct PaintResult
{
    QImage image;
    QString errorString;
};

struct JpegErrorManager
{
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void jpegErrorExit(j_common_ptr cinfo)
{
    auto *manager = reinterpret_cast<JpegErrorManager *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, manager->message);
    std::longjmp(manager->jump, 1);
}

// Only trivially destructible locals may live in this frame: libjpeg
// reports errors by jumping back to the setjmp below.
bool readJpeg(jpeg_decompress_struct *cinfo, JpegErrorManager *manager,
              const QByteArray *data, QImage *image)
{
    if (setjmp(manager->jump))
        return false;

    jpeg_create_decompress(cinfo);
    jpeg_mem_src(cinfo, reinterpret_cast<unsigned char *>(const_cast<char *>(data->constData())),
                 static_cast<unsigned long>(data->size()));
    jpeg_read_header(cinfo, TRUE);
    cinfo->out_color_space = JCS_RGB;
    jpeg_start_decompress(cinfo);

    *image = QImage(int(cinfo->output_width), int(cinfo->output_height), QImage::Format_RGB888);
    if (image->isNull()) {
        std::snprintf(manager->message, sizeof(manager->message), "cannot allocate %ux%u image",
                      cinfo->output_width, cinfo->output_height);
        return false;
    }
    while (cinfo->output_scanline < cinfo->output_height) {
        JSAMPROW row = image->scanLine(int(cinfo->output_scanline));
        jpeg_read_scanlines(cinfo, &row, 1);
    }
    jpeg_finish_decompress(cinfo);
    return true;
}

QImage decodeJpeg(const QByteArray &data, QString *errorString)
{
    jpeg_decompress_struct cinfo{};
    JpegErrorManager manager{};
    cinfo.err = jpeg_std_error(&manager.pub);
    manager.pub.error_exit = jpegErrorExit;

    QImage image;
    const bool ok = readJpeg(&cinfo, &manager, &data, &image);
    jpeg_destroy_decompress(&cinfo);
    if (!ok) {
        *errorString = u"jpeg: %1"_s.arg(QString::fromLocal8Bit(manager.message));
        return QImage();
    }
    return image;
}

QImage decodeStill(const QByteArray &coding, const QByteArray &data, QString *errorString)
{
    if (coding == "jpeg")
        return decodeJpeg(data, errorString);

    const char *format = coding == "webp" ? "WEBP" : "PNG";
    QImage image;
    if (!image.loadFromData(data, format)) {
        *errorString = u"cannot decode %1 image of %2 bytes"_s.arg(QString::fromLatin1(coding)).arg(data.size());
        return QImage();
    }
    return image;
}

/*!
    \internal
    Decodes raw pixels. The buffer may be deflated or lz4 compressed as
    announced in the options, and the channel order comes from the
    \c rgb_format option.
*/
QImage decodeRgb(const QXpraDrawPacket &packet, QString *errorString)
{
    QByteArray data = packet.data.toByteArray();
    bool ok = true;
    if (packet.options.value(u"zlib"_s).toInt() > 0)
        data = QXpraCompression::inflate(data, &ok, errorString);
    else if (packet.options.value(u"lz4"_s).toInt() > 0)
        data = QXpraCompression::lz4Decompress(data, &ok, errorString);
    if (!ok)
        return QImage();

    QByteArray rgbFormat = packet.options.value(u"rgb_format"_s).toByteArray();
    if (rgbFormat.isEmpty())
        rgbFormat = packet.coding == "rgb24" ? QByteArray("RGB") : QByteArray("RGBX");

    QImage::Format format = QImage::Format_Invalid;
    bool swapped = false;
    if (rgbFormat == "RGBX") {
        format = QImage::Format_RGBX8888;
    } else if (rgbFormat == "RGBA") {
        format = QImage::Format_RGBA8888;
    } else if (rgbFormat == "BGRX") {
        format = QImage::Format_RGBX8888;
        swapped = true;
    } else if (rgbFormat == "BGRA") {
        format = QImage::Format_RGBA8888;
        swapped = true;
    } else if (rgbFormat == "RGB") {
        format = QImage::Format_RGB888;
    } else if (rgbFormat == "BGR") {
        format = QImage::Format_BGR888;
    } else {
        *errorString = u"unsupported rgb format %1"_s.arg(QString::fromLatin1(rgbFormat));
        return QImage();
    }

    const int width = packet.rect.width();
    const int height = packet.rect.height();
    const int bytesPerPixel = rgbFormat.size();
    if (packet.coding == "rgb24" && bytesPerPixel != 3) {
        *errorString = u"rgb24 paint with 4 byte format %1"_s.arg(QString::fromLatin1(rgbFormat));
        return QImage();
    }
    const qint64 rowBytes = qint64(width) * bytesPerPixel;
    const qint64 rowstride = packet.rowstride > 0 ? packet.rowstride : rowBytes;
    if (width <= 0 || height <= 0 || rowstride < rowBytes) {
        *errorString = u"invalid rgb geometry %1x%2 with stride %3"_s.arg(width).arg(height).arg(rowstride);
        return QImage();
    }
    const qint64 required = rowstride * (height - 1) + rowBytes;
    if (data.size() < required) {
        *errorString = u"rgb data too short: %1 bytes for %2x%3, need %4"_s
                               .arg(data.size()).arg(width).arg(height).arg(required);
        return QImage();
    }

    const QImage view(reinterpret_cast<const uchar *>(data.constData()), width, height,
                      qsizetype(rowstride), format);
    // the view borrows data, detach before it goes out of scope
    return swapped ? view.rgbSwapped() : view.copy();
}

bool isRgbCoding(const QByteArray &coding)
{
    return coding == "rgb24" || coding == "rgb32" || coding == "rgb";
}

bool isStillCoding(const QByteArray &coding)
{
    return coding == "png" || coding == "jpeg" || coding == "webp" || coding == "png/P" || coding == "png/L";
}

} // namespace

/*!
    \internal
    \class QXpraPaintPipeline::Private
*/
class QXpraPaintPipeline::Private
{
public:
    struct Pending
    {
        QXpraDrawPacket packet;
        QElapsedTimer received;
    };

    struct Window
    {
        QSize size;
        QImage backing;
        QQueue<Pending> queue;
        bool inFlight = false;
        Pending current;
        QElapsedTimer inFlightSince;
        quint64 token = 0;
        QSharedPointer<QXpraVideoDecoder> decoder;
        QByteArray decoderCoding;
    };

    Private(QXpraPaintPipeline *parent);

    Window &window(qint64 wid);
    QXpraVideoDecoderFactory *factoryFor(const QByteArray &coding) const;
    void abandonStale(qint64 wid, Window &w);
    void startNext(qint64 wid);
    bool start(qint64 wid, Window &w);
    void scroll(qint64 wid, Window &w);
    void finish(qint64 wid, quint64 token, const PaintResult &result);
    void blit(qint64 wid, Window &w, const QRect &rect, const QImage &image);
    void acknowledge(qint64 wid, const Pending &pending, const QString &errorString);
    static void ensureBacking(Window &w, const QRect &rect);

private:
    QXpraPaintPipeline *q;

public:
    int staleThreshold = DefaultStaleThreshold;
    quint64 nextToken = 0;
    QHash<qint64, Window> windows;
    QList<QSharedPointer<QXpraVideoDecoderFactory>> factories;
};

QXpraPaintPipeline::Private::Private(QXpraPaintPipeline *parent)
    : q(parent)
{
}

QXpraPaintPipeline::Private::Window &QXpraPaintPipeline::Private::window(qint64 wid)
{
    auto it = windows.find(wid);
    if (it == windows.end()) {
        qCDebug(lcXpraPaint) << "New paint state for window" << wid;
        it = windows.insert(wid, Window());
    }
    return it.value();
}

QXpraVideoDecoderFactory *QXpraPaintPipeline::Private::factoryFor(const QByteArray &coding) const
{
    for (const auto &factory : factories) {
        if (factory->codings().contains(coding))
            return factory.data();
    }
    return nullptr;
}

/*!
    \internal
    Gives up on a paint that has been in flight longer than the staleness
    threshold. Its late result is ignored and the streaming decoder, which
    may still be in use by it, is dropped.
*/
void QXpraPaintPipeline::Private::abandonStale(qint64 wid, Window &w)
{
    qCWarning(lcXpraPaint) << "Abandoning paint" << w.current.packet.sequence << "for window" << wid
                           << "after" << w.inFlightSince.elapsed() << "ms";
    w.token = ++nextToken;
    w.inFlight = false;
    w.decoder.reset();
    w.decoderCoding.clear();
    const Pending abandoned = w.current;
    acknowledge(wid, abandoned, u"paint timed out"_s);
    emit q->redrawRequested(wid);
}

void QXpraPaintPipeline::Private::startNext(qint64 wid)
{
    // a synchronous paint may emit signals whose receivers remove the window
    while (windows.contains(wid)) {
        Window &w = windows[wid];
        if (w.inFlight || w.queue.isEmpty())
            return;
        w.current = w.queue.dequeue();
        if (start(wid, w))
            return;
    }
}

/*!
    \internal
    Starts the current paint of \a w. Returns true if it is now running in
    the background, false if it already completed.
*/
bool QXpraPaintPipeline::Private::start(qint64 wid, Window &w)
{
    const QXpraDrawPacket packet = w.current.packet;
    const QByteArray coding = packet.coding;

    if (coding == "scroll") {
        scroll(wid, w);
        return false;
    }

    std::function<PaintResult()> job;
    if (isRgbCoding(coding)) {
        job = [packet]() {
            PaintResult result;
            result.image = decodeRgb(packet, &result.errorString);
            return result;
        };
    } else if (isStillCoding(coding)) {
        job = [coding, data = packet.data.toByteArray()]() {
            PaintResult result;
            result.image = decodeStill(coding, data, &result.errorString);
            return result;
        };
    } else if (QXpraVideoDecoderFactory *factory = factoryFor(coding)) {
        const bool reset = packet.options.value(u"frame"_s, -1).toLongLong() == 0;
        bool initialize = false;
        if (reset || !w.decoder || w.decoderCoding != coding) {
            w.decoder.reset(factory->create(coding));
            w.decoderCoding = coding;
            initialize = true;
        }
        if (!w.decoder) {
            w.decoderCoding.clear();
            acknowledge(wid, w.current, u"cannot create %1 decoder"_s.arg(QString::fromLatin1(coding)));
            emit q->redrawRequested(wid);
            return false;
        }
        QSize size = packet.rect.size();
        const QVariantList scaled = packet.options.value(u"scaled_size"_s).toList();
        if (scaled.size() == 2)
            size = QSize(scaled.at(0).toInt(), scaled.at(1).toInt());
        job = [decoder = w.decoder, initialize, coding, size, packet]() {
            PaintResult result;
            if (initialize && !decoder->initialize(coding, size, packet.options, &result.errorString))
                return result;
            result.image = decoder->decode(packet.data.toByteArray(), packet.options, &result.errorString);
            if (result.image.isNull() && result.errorString.isEmpty())
                result.errorString = u"%1 decoder produced no picture"_s.arg(QString::fromLatin1(coding));
            return result;
        };
    } else {
        qCWarning(lcXpraPaint) << "Unsupported coding" << coding << "for window" << wid;
        acknowledge(wid, w.current, u"unsupported coding %1"_s.arg(QString::fromLatin1(coding)));
        emit q->redrawRequested(wid);
        return false;
    }

    w.inFlight = true;
    w.inFlightSince.start();
    w.token = ++nextToken;
    const quint64 token = w.token;

    auto *watcher = new QFutureWatcher<PaintResult>(q);
    connect(watcher, &QFutureWatcher<PaintResult>::finished, q, [this, watcher, wid, token]() {
        watcher->deleteLater();
        finish(wid, token, watcher->result());
    });
    watcher->setFuture(QtConcurrent::run(std::move(job)));
    qCDebug(lcXpraPaint) << "Decoding" << coding << packet.rect << "sequence" << packet.sequence
                         << "for window" << wid;
    return true;
}

/*!
    \internal
    Copies regions of the window's previous frame. Every region is read from
    the frame as it was before this paint, so overlapping moves do not feed
    on each other.
*/
void QXpraPaintPipeline::Private::scroll(qint64 wid, Window &w)
{
    const Pending pending = w.current;
    const QVariantList regions = pending.packet.data.toList();
    if (w.backing.isNull()) {
        acknowledge(wid, pending, u"nothing to scroll"_s);
        emit q->redrawRequested(wid);
        return;
    }
    const QImage previous = w.backing.copy();
    QList<QRect> targets;
    {
        QPainter painter(&w.backing);
        painter.setCompositionMode(QPainter::CompositionMode_Source);
        for (const QVariant &region : regions) {
            const QVariantList r = region.toList();
            if (r.size() < 6) {
                qCWarning(lcXpraPaint) << "Ignoring malformed scroll region" << r;
                continue;
            }
            const QRect source(r.at(0).toInt(), r.at(1).toInt(), r.at(2).toInt(), r.at(3).toInt());
            const QRect target = source.translated(r.at(4).toInt(), r.at(5).toInt());
            painter.drawImage(target, previous, source);
            targets.append(target);
        }
    }
    QList<QImage> tiles;
    for (const QRect &target : std::as_const(targets))
        tiles.append(w.backing.copy(target));
    for (qsizetype i = 0; i < targets.size(); ++i)
        emit q->painted(wid, targets.at(i), tiles.at(i));
    acknowledge(wid, pending, QString());
}

void QXpraPaintPipeline::Private::finish(qint64 wid, quint64 token, const PaintResult &result)
{
    auto it = windows.find(wid);
    if (it == windows.end() || it->token != token || !it->inFlight) {
        qCDebug(lcXpraPaint) << "Discarding late paint result for window" << wid;
        return;
    }
    Window &w = it.value();
    w.inFlight = false;
    const Pending pending = w.current;

    if (!result.errorString.isEmpty()) {
        qCWarning(lcXpraPaint) << "Paint" << pending.packet.sequence << "for window" << wid
                               << "failed:" << result.errorString;
        acknowledge(wid, pending, result.errorString);
        emit q->redrawRequested(wid);
    } else {
        blit(wid, w, pending.packet.rect, result.image);
        acknowledge(wid, pending, QString());
        const QVariant flush = pending.packet.options.value(u"flush"_s);
        if (flush.isValid() && flush.toInt() == 0)
            emit q->redrawRequested(wid);
    }
    startNext(wid);
}

void QXpraPaintPipeline::Private::blit(qint64 wid, Window &w, const QRect &rect, const QImage &image)
{
    ensureBacking(w, rect);
    {
        QPainter painter(&w.backing);
        painter.setCompositionMode(QPainter::CompositionMode_Source);
        painter.drawImage(rect, image);
    }
    emit q->painted(wid, rect, image.size() == rect.size() ? image : w.backing.copy(rect));
}

void QXpraPaintPipeline::Private::acknowledge(qint64 wid, const Pending &pending, const QString &errorString)
{
    const qint64 decodeTime = errorString.isEmpty() ? pending.received.elapsed() : -1;
    emit q->damageSequence(pending.packet.sequence, wid, pending.packet.rect.width(),
                           pending.packet.rect.height(), decodeTime, errorString);
}

void QXpraPaintPipeline::Private::ensureBacking(Window &w, const QRect &rect)
{
    const QSize needed = w.size.expandedTo(QSize(rect.right() + 1, rect.bottom() + 1));
    if (!w.backing.isNull() && w.backing.size() == needed)
        return;
    QImage backing(needed, QImage::Format_ARGB32_Premultiplied);
    backing.fill(Qt::transparent);
    if (!w.backing.isNull()) {
        QPainter painter(&backing);
        painter.setCompositionMode(QPainter::CompositionMode_Source);
        painter.drawImage(0, 0, w.backing);
    }
    w.backing = backing;
}

/*!
    \class QXpraPaintPipeline
    \inmodule QtXpraClient

    \brief The QXpraPaintPipeline class decodes draw packets into per-window
    backing images.

    Draw packets of one window are applied strictly in the order they
    arrive, one at a time. Decoding runs on the global thread pool so the
    receive path never waits for it. Every paint, successful or not, ends
    with a damageSequence() acknowledgement; failures report a decode time
    of -1 together with the error text.

    A paint that has been in flight for longer than staleThreshold() when
    the next draw packet arrives is abandoned.
*/
QXpraPaintPipeline::QXpraPaintPipeline(QObject *parent)
    : QObject(parent)
    , d(new Private(this))
{
}

QXpraPaintPipeline::~QXpraPaintPipeline() = default;

int QXpraPaintPipeline::staleThreshold() const
{
    return d->staleThreshold;
}

void QXpraPaintPipeline::setStaleThreshold(int msecs)
{
    d->staleThreshold = msecs;
}

void QXpraPaintPipeline::registerVideoDecoderFactory(const QSharedPointer<QXpraVideoDecoderFactory> &factory)
{
    if (factory && !d->factories.contains(factory))
        d->factories.append(factory);
}

QByteArrayList QXpraPaintPipeline::supportedEncodings() const
{
    QByteArrayList encodings { "rgb32", "rgb24", "png", "png/P", "png/L", "jpeg" };
    if (QImageReader::supportedImageFormats().contains("webp"))
        encodings << "webp";
    for (const auto &factory : d->factories) {
        const QByteArrayList codings = factory->codings();
        for (const QByteArray &coding : codings) {
            if (!encodings.contains(coding))
                encodings << coding;
        }
    }
    encodings << "scroll";
    return encodings;
}

QByteArrayList QXpraPaintPipeline::rgbFormats()
{
    return { "RGBX", "RGBA", "BGRX", "BGRA", "RGB", "BGR" };
}

void QXpraPaintPipeline::createWindow(qint64 wid, const QSize &size)
{
    Private::Window &w = d->window(wid);
    w.size = size;
    Private::ensureBacking(w, QRect());
}

void QXpraPaintPipeline::resizeWindow(qint64 wid, const QSize &size)
{
    auto it = d->windows.find(wid);
    if (it == d->windows.end())
        return;
    it->size = size;
    if (it->backing.size() == size)
        return;
    QImage backing(size, QImage::Format_ARGB32_Premultiplied);
    backing.fill(Qt::transparent);
    if (!it->backing.isNull()) {
        QPainter painter(&backing);
        painter.setCompositionMode(QPainter::CompositionMode_Source);
        painter.drawImage(0, 0, it->backing);
    }
    it->backing = backing;
}

/*!
    Drops the paint state of \a wid. Queued paints are discarded without
    acknowledgement and a paint still decoding is ignored when it completes.
*/
void QXpraPaintPipeline::removeWindow(qint64 wid)
{
    if (d->windows.remove(wid))
        qCDebug(lcXpraPaint) << "Removed paint state for window" << wid;
}

void QXpraPaintPipeline::reset()
{
    d->windows.clear();
}

bool QXpraPaintPipeline::hasWindow(qint64 wid) const
{
    return d->windows.contains(wid);
}

QImage QXpraPaintPipeline::image(qint64 wid) const
{
    return d->windows.value(wid).backing;
}

int QXpraPaintPipeline::pendingPaints(qint64 wid) const
{
    const auto it = d->windows.constFind(wid);
    return it == d->windows.cend() ? 0 : int(it->queue.size());
}

bool QXpraPaintPipeline::isPainting(qint64 wid) const
{
    const auto it = d->windows.constFind(wid);
    return it != d->windows.cend() && it->inFlight;
}

/*!
    Queues \a packet behind the paints already pending for its window. The
    paint state of a window is created on its first draw packet.
*/
void QXpraPaintPipeline::paint(const QXpraDrawPacket &packet)
{
    Private::Window &w = d->window(packet.wid);
    if (w.inFlight && w.inFlightSince.elapsed() > d->staleThreshold)
        d->abandonStale(packet.wid, w);

    Private::Pending pending;
    pending.packet = packet;
    pending.received.start();
    // abandonStale() emits, the receiver may have removed the window
    d->window(packet.wid).queue.enqueue(pending);
    d->startNext(packet.wid);
}

void QXpraPaintPipeline::endOfStream(qint64 wid)
{
    auto it = d->windows.find(wid);
    if (it == d->windows.end() || !it->decoder)
        return;
    qCDebug(lcXpraPaint) << "End of" << it->decoderCoding << "stream for window" << wid;
    it->decoder.reset();
    it->decoderCoding.clear();
}

QT_END_NAMESPACE
