#pragma once

#include <QIcon>
#include <QPixmap>
#include <QPoint>
#include <QString>
#include <QWidget>

class QLabel;
class QPushButton;

// Custom-painted title bar for the frameless explorer window.
// Dragging with the left button moves the top-level window.
class TitleBar : public QWidget
{
    Q_OBJECT

public:
    static constexpr int BarHeight = 40;
    static constexpr int ButtonSize = 32;

    explicit TitleBar(const QString& title, const QString& textureDir, QWidget* parent = nullptr);

    QString title() const;
    bool hasBackgroundTexture() const { return !m_background.isNull(); }

    QPushButton* minimizeButton() const { return m_minBtn; }
    QPushButton* closeButton() const { return m_closeBtn; }

signals:
    void minimizeRequested();
    void closeRequested();

protected:
    void paintEvent(QPaintEvent*) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    QPushButton* makeButton(const QString& textureDir, const QString& file, const QIcon& fallback, const QString& tip);

    QPixmap m_background;
    QLabel* m_titleLabel = nullptr;
    QPushButton* m_minBtn = nullptr;
    QPushButton* m_closeBtn = nullptr;
    bool m_dragging = false;
    QPoint m_dragOffset;
};
