#include "theme.h"

namespace
{
const char* kFontFamily = "'Segoe UI', 'Roboto', sans-serif";
const char* kAccent = "#7c4dff";
}

namespace Theme
{
QString windowStyleSheet()
{
    return QStringLiteral(
               "QMainWindow { background-color: #1e1e1e; }"
               "QLabel { color: #e0e0e0; font-family: %1; }"
               "QLineEdit {"
               "  background-color: #2d2d2d;"
               "  border: 1px solid #404040;"
               "  border-radius: 8px;"
               "  color: #ffffff;"
               "  padding: 10px;"
               "  font-size: 13px;"
               "  selection-background-color: %2;"
               "}"
               "QLineEdit:focus { border: 1px solid %2; }")
        .arg(QString::fromLatin1(kFontFamily), QString::fromLatin1(kAccent));
}

QString contentFrameStyleSheet()
{
    return QStringLiteral(
        "QFrame#contentFrame {"
        "  background-color: #252525;"
        "  border-radius: 12px;"
        "  border: 1px solid #333333;"
        "}");
}

QString buttonStyleSheet(bool primary)
{
    const QString base = QStringLiteral(
                             "QPushButton {"
                             "  border-radius: 8px;"
                             "  font-family: %1;"
                             "  font-weight: 600;"
                             "  font-size: 14px;"
                             "  padding: 0 20px;"
                             "}")
                             .arg(QString::fromLatin1(kFontFamily));

    if (primary)
    {
        return base + QStringLiteral(
                   "QPushButton { background-color: %1; color: white; border: none; }"
                   "QPushButton:hover { background-color: #651fff; }"
                   "QPushButton:pressed { background-color: #6200ea; }"
                   "QPushButton:disabled { background-color: #3a3458; color: #8a8a8a; }")
                   .arg(QString::fromLatin1(kAccent));
    }

    return base + QStringLiteral(
               "QPushButton { background-color: #2d2d2d; color: #e0e0e0; border: 1px solid #404040; }"
               "QPushButton:hover { background-color: #3d3d3d; border: 1px solid #505050; }"
               "QPushButton:pressed { background-color: #252525; }");
}

QString statusStyleSheet(StatusTone tone)
{
    switch (tone)
    {
    case StatusTone::Ready: return QStringLiteral("color: #4caf50; font-size: 12px;");
    case StatusTone::Error: return QStringLiteral("color: #ff5252; font-size: 12px;");
    case StatusTone::Idle:
    default:
        return QStringLiteral("color: #666666; font-size: 12px; font-style: italic;");
    }
}

QString titleStyleSheet()
{
    return QStringLiteral("font-size: 24px; font-weight: bold; color: #ffffff;");
}

QString subtitleStyleSheet()
{
    return QStringLiteral("font-size: 14px; color: #aaaaaa;");
}

QString fieldLabelStyleSheet()
{
    return QStringLiteral("font-weight: 600; color: #cccccc;");
}
}
