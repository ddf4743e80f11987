#pragma once

#include <QGuiApplication>
#include <QMessageBox>
#include <QString>
#include <Qt>
#include <cstdlib>

/// @brief Sets the busy cursor for the lifetime of the scope.
///
/// Used around blocking UI-thread work such as reading and extruding a
/// GeoJSON file. Must live on the UI thread.
struct BusyCursorGuard
{
    BusyCursorGuard()
    {
        QGuiApplication::setOverrideCursor(Qt::BusyCursor);
    }

    ~BusyCursorGuard()
    {
        if (QGuiApplication::overrideCursor())
            QGuiApplication::restoreOverrideCursor();
    }

    BusyCursorGuard(const BusyCursorGuard&)            = delete;
    BusyCursorGuard& operator=(const BusyCursorGuard&) = delete;
};

/// @brief Reports an unrecoverable GPU setup error and exits the process.
///
/// There is no non-3D fallback: without a Vulkan device the viewer has
/// nothing to show.
[[noreturn]] inline void fatalGpuError(QWidget* parent, const QString& title, const QString& text)
{
    QMessageBox::critical(parent, title, text);
    std::exit(EXIT_FAILURE);
}
