#include "actionbutton.h"

#include "theme.h"

ActionButton::ActionButton(const QString &text, bool primary, QWidget *parent)
    : QPushButton(text, parent)
    , m_primary(primary)
{
    setCursor(Qt::PointingHandCursor);
    setFixedHeight(45);
    setStyleSheet(Theme::buttonStyleSheet(m_primary));
}
