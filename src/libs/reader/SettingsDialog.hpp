// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/ReaderGlobal.hpp"

#include <session/ConfigurationRecord.hpp>

#include <QtWidgets/QDialog>

class QComboBox;
class QFontComboBox;
class QSpinBox;

namespace Utils {
class ColorSwatchButton;
}

namespace Reader {

class READER_EXPORT SettingsDialog final : public QDialog
{
    Q_OBJECT

public:
    SettingsDialog(Session::ThemePreference theme,
                   const Session::FontSettings& font,
                   const Session::RecordLimits& limits,
                   QWidget* parent = nullptr);

    Session::ThemePreference theme() const;
    Session::FontSettings fontSettings() const;

private:
    void restoreDefaults();
    void load(Session::ThemePreference theme, const Session::FontSettings& font);

    Session::RecordLimits m_limits;

    QComboBox* m_theme = nullptr;
    QSpinBox* m_bodySize = nullptr;
    QSpinBox* m_codeSize = nullptr;
    QFontComboBox* m_codeFamily = nullptr;
    QComboBox* m_codeWeight = nullptr;
    Utils::ColorSwatchButton* m_inlineColor = nullptr;
    Utils::ColorSwatchButton* m_blockColor = nullptr;
};

} // namespace Reader
