#include "utils/ui/ColorSwatchButton.hpp"

#include <QtGui/QAction>
#include <QtWidgets/QColorDialog>
#include <QtWidgets/QMenu>

namespace Utils {

ColorSwatchButton::ColorSwatchButton(QWidget* parent)
    : QToolButton(parent)
    , m_placeholderText(tr("Default"))
{
    setToolButtonStyle(Qt::ToolButtonTextOnly);
    setPopupMode(QToolButton::MenuButtonPopup);
    setMinimumSize(72, 22);

    auto* menu = new QMenu(this);
    QAction* reset = menu->addAction(tr("Use theme default"));
    connect(reset, &QAction::triggered, this, &ColorSwatchButton::resetColor);
    setMenu(menu);

    connect(this, &QToolButton::clicked, this, &ColorSwatchButton::pickColor);
    updateSwatch();
}

void ColorSwatchButton::setColor(const QColor& color)
{
    const QColor next = color.isValid() ? color : QColor();
    if (m_color == next)
        return;
    m_color = next;
    updateSwatch();
    emit colorChanged(m_color);
}

void ColorSwatchButton::resetColor()
{
    setColor(QColor());
}

void ColorSwatchButton::setPlaceholderText(const QString& text)
{
    if (m_placeholderText == text)
        return;
    m_placeholderText = text;
    updateSwatch();
}

void ColorSwatchButton::pickColor()
{
    QColorDialog dialog(m_color.isValid() ? m_color : QColor(Qt::black), this);
    if (dialog.exec() != QDialog::Accepted)
        return;

    const QColor chosen = dialog.selectedColor();
    if (!chosen.isValid())
        return;

    setColor(chosen);
}

void ColorSwatchButton::updateSwatch()
{
    if (!m_color.isValid()) {
        setText(m_placeholderText);
        setStyleSheet(QString());
        return;
    }

    setText(m_color.name(QColor::HexRgb));
    const QColor textColor = m_color.lightnessF() > 0.5 ? QColor(Qt::black) : QColor(Qt::white);
    setStyleSheet(QStringLiteral(
        "QToolButton { background-color: %1; color: %2; border: 1px solid rgba(128,128,128,120); border-radius: 3px; }")
            .arg(m_color.name(QColor::HexRgb), textColor.name(QColor::HexRgb)));
}

} // namespace Utils
