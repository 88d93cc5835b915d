#pragma once

#include <QIcon>
#include <QPixmap>
#include <QString>

// Texture lookups under the configured texture directory. A missing or
// unreadable file yields a null icon/pixmap so callers can fall back.
QPixmap loadTexture(const QString& textureDir, const QString& filename);
QIcon loadTextureIcon(const QString& textureDir, const QString& filename, int size);

// Painted fallbacks used when no texture is available
QIcon icoBack();
QIcon icoUp();
QIcon icoMinimize();
QIcon icoClose();
QIcon icoList();
QIcon icoGrid();
