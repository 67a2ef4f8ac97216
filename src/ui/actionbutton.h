#pragma once
/**
 * @file actionbutton.h
 * @brief Fixed-height themed push button (primary = accent colour).
 */

#include <QPushButton>

class ActionButton : public QPushButton
{
    Q_OBJECT
public:
    explicit ActionButton(const QString& text, bool primary = false, QWidget* parent = nullptr);

    bool isPrimary() const { return m_primary; }

private:
    bool m_primary = false;
};
