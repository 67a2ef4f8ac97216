#pragma once
/**
 * @file theme.h
 * @brief Dark theme style sheets (window, content frame, buttons, status line).
 */

#include <QString>

namespace Theme
{
    enum class StatusTone
    {
        Idle,     ///< grey italic, nothing selected yet
        Ready,    ///< green, target selected / running
        Error     ///< red
    };

    QString windowStyleSheet();
    QString contentFrameStyleSheet();
    QString buttonStyleSheet(bool primary);
    QString statusStyleSheet(StatusTone tone);

    QString titleStyleSheet();
    QString subtitleStyleSheet();
    QString fieldLabelStyleSheet();
}
