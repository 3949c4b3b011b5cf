#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtGui/QColor>
#include <QtWidgets/QToolButton>

namespace Utils {

// A swatch that picks a colour. An invalid colour means "no override" and
// is shown with the placeholder text instead of a fill.
class UTILS_EXPORT ColorSwatchButton final : public QToolButton
{
    Q_OBJECT
    Q_PROPERTY(QColor color READ color WRITE setColor NOTIFY colorChanged)
    Q_PROPERTY(QString placeholderText READ placeholderText WRITE setPlaceholderText)

public:
    explicit ColorSwatchButton(QWidget* parent = nullptr);

    QColor color() const { return m_color; }
    void setColor(const QColor& color);
    void resetColor();

    QString placeholderText() const { return m_placeholderText; }
    void setPlaceholderText(const QString& text);

signals:
    void colorChanged(const QColor& color);

private slots:
    void pickColor();

private:
    void updateSwatch();

    QColor m_color;
    QString m_placeholderText;
};

} // namespace Utils
