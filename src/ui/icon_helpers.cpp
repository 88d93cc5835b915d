#include "ui/icon_helpers.h"

#include <QColor>
#include <QDir>
#include <QFile>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QRectF>
#include <QDebug>

#include <functional>

namespace {

QIcon mkIcon(const std::function<void(QPainter&, const QRectF&)>& draw)
{
    QPixmap pm(32, 32);
    pm.fill(Qt::transparent);
    QPainter p(&pm);
    p.setRenderHint(QPainter::Antialiasing);
    QRectF r(6, 6, 20, 20);
    QPen pen(QColor(37, 37, 37));
    pen.setWidthF(2.5);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    p.setPen(pen);
    p.setBrush(Qt::NoBrush);
    draw(p, r);
    p.end();
    return QIcon(pm);
}

} // namespace

QPixmap loadTexture(const QString& textureDir, const QString& filename)
{
    const QString path = QDir(textureDir).filePath(filename);
    if (!QFile::exists(path)) return QPixmap();

    QPixmap pixmap(path);
    if (pixmap.isNull()) {
        qWarning() << "[Textures] failed to load pixmap:" << path;
        return QPixmap();
    }
    return pixmap;
}

QIcon loadTextureIcon(const QString& textureDir, const QString& filename, int size)
{
    QPixmap pixmap = loadTexture(textureDir, filename);
    if (pixmap.isNull()) return QIcon();

    if (pixmap.width() != size || pixmap.height() != size) {
        pixmap = pixmap.scaled(size, size, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }

    QIcon icon;
    icon.addPixmap(pixmap, QIcon::Normal, QIcon::Off);
    icon.addPixmap(pixmap, QIcon::Active, QIcon::Off);
    icon.addPixmap(pixmap, QIcon::Disabled, QIcon::Off);
    return icon;
}

QIcon icoBack()
{
    return mkIcon([](QPainter& p, const QRectF& r) {
        QPainterPath arrow;
        arrow.moveTo(r.center().x() + 2, r.top() + 3);
        arrow.lineTo(r.left() + 4, r.center().y());
        arrow.lineTo(r.center().x() + 2, r.bottom() - 3);
        p.drawPath(arrow);
        p.drawLine(QPointF(r.left() + 4, r.center().y()), QPointF(r.right() - 2, r.center().y()));
    });
}

QIcon icoUp()
{
    return mkIcon([](QPainter& p, const QRectF& r) {
        QPainterPath arrow;
        arrow.moveTo(r.left() + 3, r.center().y() - 2);
        arrow.lineTo(r.center().x(), r.top() + 4);
        arrow.lineTo(r.right() - 3, r.center().y() - 2);
        p.drawPath(arrow);
        p.drawLine(QPointF(r.center().x(), r.top() + 4), QPointF(r.center().x(), r.bottom() - 2));
    });
}

QIcon icoMinimize()
{
    return mkIcon([](QPainter& p, const QRectF& r) {
        p.drawLine(QPointF(r.left() + 3, r.bottom() - 4), QPointF(r.right() - 3, r.bottom() - 4));
    });
}

QIcon icoClose()
{
    return mkIcon([](QPainter& p, const QRectF& r) {
        const QRectF box = r.adjusted(3, 3, -3, -3);
        p.drawLine(box.topLeft(), box.bottomRight());
        p.drawLine(box.bottomLeft(), box.topRight());
    });
}

QIcon icoList()
{
    return mkIcon([](QPainter& p, const QRectF& r) {
        for (int i = 0; i < 3; ++i) {
            const qreal y = r.top() + 4 + i * 6;
            p.drawPoint(QPointF(r.left() + 2, y));
            p.drawLine(QPointF(r.left() + 7, y), QPointF(r.right() - 1, y));
        }
    });
}

QIcon icoGrid()
{
    return mkIcon([](QPainter& p, const QRectF& r) {
        const qreal s = (r.width() - 4) / 2.0;
        p.drawRect(QRectF(r.left(), r.top(), s, s));
        p.drawRect(QRectF(r.left() + s + 4, r.top(), s, s));
        p.drawRect(QRectF(r.left(), r.top() + s + 4, s, s));
        p.drawRect(QRectF(r.left() + s + 4, r.top() + s + 4, s, s));
    });
}
