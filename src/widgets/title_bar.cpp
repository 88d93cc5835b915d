#include "widgets/title_bar.h"
#include "ui/icon_helpers.h"

#include <QFont>
#include <QHBoxLayout>
#include <QLabel>
#include <QLinearGradient>
#include <QMouseEvent>
#include <QPainter>
#include <QPushButton>

TitleBar::TitleBar(const QString& title, const QString& textureDir, QWidget* parent)
    : QWidget(parent)
{
    setFixedHeight(BarHeight);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);

    m_background = loadTexture(textureDir, "titlebar_bg.png");

    auto* layout = new QHBoxLayout(this);
    layout->setContentsMargins(10, 0, 4, 0);
    layout->setSpacing(6);

    m_titleLabel = new QLabel(title, this);
    QFont font;
    font.setPointSize(10);
    font.setBold(true);
    m_titleLabel->setFont(font);
    m_titleLabel->setAlignment(Qt::AlignVCenter | Qt::AlignLeft);
    m_titleLabel->setStyleSheet("QLabel { color: #252525; background: transparent; padding: 2px 8px; }");
    layout->addWidget(m_titleLabel, 1);

    m_minBtn = makeButton(textureDir, "minimize.png", icoMinimize(), tr("Minimize"));
    connect(m_minBtn, &QPushButton::clicked, this, &TitleBar::minimizeRequested);
    layout->addWidget(m_minBtn, 0, Qt::AlignRight);

    m_closeBtn = makeButton(textureDir, "close.png", icoClose(), tr("Close"));
    connect(m_closeBtn, &QPushButton::clicked, this, &TitleBar::closeRequested);
    layout->addWidget(m_closeBtn, 0, Qt::AlignRight);
}

QString TitleBar::title() const
{
    return m_titleLabel->text();
}

QPushButton* TitleBar::makeButton(const QString& textureDir, const QString& file, const QIcon& fallback, const QString& tip)
{
    auto* btn = new QPushButton(this);
    btn->setToolTip(tip);
    btn->setFlat(true);
    btn->setFixedSize(ButtonSize, ButtonSize);
    btn->setCursor(Qt::PointingHandCursor);
    btn->setStyleSheet("QPushButton { background: transparent; border: none; }"
                       "QPushButton:hover { background-color: rgba(255,255,255,0.15); border-radius: 4px; }");
    QIcon icon = loadTextureIcon(textureDir, file, ButtonSize);
    btn->setIcon(icon.isNull() ? fallback : icon);
    btn->setIconSize(QSize(ButtonSize - 8, ButtonSize - 8));
    return btn;
}

void TitleBar::paintEvent(QPaintEvent*)
{
    QPainter painter(this);
    if (!m_background.isNull()) {
        painter.drawPixmap(rect(), m_background.scaled(size(), Qt::IgnoreAspectRatio, Qt::SmoothTransformation));
        return;
    }
    QLinearGradient grad(0, 0, 0, height());
    grad.setColorAt(0.0, QColor(0xc8, 0xc8, 0xc8));
    grad.setColorAt(1.0, QColor(0x8a, 0x8a, 0x8a));
    painter.fillRect(rect(), grad);
}

void TitleBar::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_dragging = true;
        m_dragOffset = event->globalPosition().toPoint() - window()->frameGeometry().topLeft();
        event->accept();
        return;
    }
    QWidget::mousePressEvent(event);
}

void TitleBar::mouseMoveEvent(QMouseEvent* event)
{
    if (m_dragging && (event->buttons() & Qt::LeftButton)) {
        window()->move(event->globalPosition().toPoint() - m_dragOffset);
        event->accept();
        return;
    }
    QWidget::mouseMoveEvent(event);
}

void TitleBar::mouseReleaseEvent(QMouseEvent* event)
{
    m_dragging = false;
    QWidget::mouseReleaseEvent(event);
}
