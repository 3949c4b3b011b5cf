// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/SettingsDialog.hpp"

#include "reader/PreviewStyle.hpp"
#include "reader/Theme.hpp"

#include <utils/ui/ColorSwatchButton.hpp>

#include <QtWidgets/QComboBox>
#include <QtWidgets/QDialogButtonBox>
#include <QtWidgets/QFontComboBox>
#include <QtWidgets/QFormLayout>
#include <QtWidgets/QGroupBox>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QSpinBox>
#include <QtWidgets/QVBoxLayout>

namespace Reader {

namespace {

QSpinBox* makeSizeBox(const Session::RecordLimits& limits, QWidget* parent)
{
    auto* box = new QSpinBox(parent);
    box->setRange(limits.minFontSize, limits.maxFontSize);
    box->setSuffix(QStringLiteral(" px"));
    return box;
}

QFormLayout* makeForm(QGroupBox* group)
{
    auto* form = new QFormLayout(group);
    form->setLabelAlignment(Qt::AlignLeft | Qt::AlignVCenter);
    form->setFormAlignment(Qt::AlignTop | Qt::AlignLeft);
    form->setHorizontalSpacing(12);
    form->setVerticalSpacing(10);
    return form;
}

} // namespace

SettingsDialog::SettingsDialog(Session::ThemePreference theme,
                               const Session::FontSettings& font,
                               const Session::RecordLimits& limits,
                               QWidget* parent)
    : QDialog(parent)
    , m_limits(limits)
{
    setObjectName(QStringLiteral("SettingsDialog"));
    setWindowTitle(tr("Settings"));
    setModal(true);
    setWindowFlag(Qt::WindowContextHelpButtonHint, false);

    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(16, 16, 16, 16);
    root->setSpacing(12);

    auto* appearance = new QGroupBox(tr("Appearance"), this);
    auto* appearanceForm = makeForm(appearance);
    m_theme = new QComboBox(appearance);
    for (const auto pref : {Session::ThemePreference::Light, Session::ThemePreference::Dark,
                            Session::ThemePreference::Auto}) {
        m_theme->addItem(themeDisplayName(pref), QVariant::fromValue(pref));
    }
    appearanceForm->addRow(tr("Theme:"), m_theme);
    m_bodySize = makeSizeBox(m_limits, appearance);
    appearanceForm->addRow(tr("Body font size:"), m_bodySize);
    root->addWidget(appearance);

    auto* code = new QGroupBox(tr("Code"), this);
    auto* codeForm = makeForm(code);
    m_codeSize = makeSizeBox(m_limits, code);
    codeForm->addRow(tr("Font size:"), m_codeSize);

    m_codeFamily = new QFontComboBox(code);
    m_codeFamily->setFontFilters(QFontComboBox::MonospacedFonts);
    m_codeFamily->setEditable(true);
    codeForm->addRow(tr("Font:"), m_codeFamily);

    m_codeWeight = new QComboBox(code);
    m_codeWeight->addItem(tr("Normal"));
    m_codeWeight->addItem(tr("Bold"));
    codeForm->addRow(tr("Font weight:"), m_codeWeight);

    m_inlineColor = new Utils::ColorSwatchButton(code);
    m_inlineColor->setPlaceholderText(tr("Theme default"));
    codeForm->addRow(tr("Inline code colour:"), m_inlineColor);

    m_blockColor = new Utils::ColorSwatchButton(code);
    m_blockColor->setPlaceholderText(tr("Theme default"));
    codeForm->addRow(tr("Code block colour:"), m_blockColor);
    root->addWidget(code);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel
                                             | QDialogButtonBox::RestoreDefaults,
                                         this);
    buttons->setObjectName(QStringLiteral("DialogButtons"));
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(buttons->button(QDialogButtonBox::RestoreDefaults), &QPushButton::clicked,
            this, &SettingsDialog::restoreDefaults);
    root->addWidget(buttons);

    load(theme, font.sanitized(m_limits));
}

void SettingsDialog::load(Session::ThemePreference theme, const Session::FontSettings& font)
{
    m_theme->setCurrentIndex(qMax(0, m_theme->findData(QVariant::fromValue(theme))));
    m_bodySize->setValue(font.bodySize);
    m_codeSize->setValue(font.codeSize);
    const QStringList families = PreviewStyle::fontFamilies(font.codeFamily);
    if (!families.isEmpty())
        m_codeFamily->setCurrentFont(QFont(families.front()));
    m_codeFamily->setEditText(font.codeFamily);
    m_codeWeight->setCurrentIndex(font.codeWeight == Session::CodeFontWeight::Bold ? 1 : 0);
    m_inlineColor->setColor(font.inlineCodeColor);
    m_blockColor->setColor(font.blockCodeColor);
}

void SettingsDialog::restoreDefaults()
{
    const Session::ConfigurationRecord defaults = Session::ConfigurationRecord::defaults();
    load(defaults.theme, defaults.font);
}

Session::ThemePreference SettingsDialog::theme() const
{
    return m_theme->currentData().value<Session::ThemePreference>();
}

Session::FontSettings SettingsDialog::fontSettings() const
{
    Session::FontSettings font;
    font.bodySize = m_bodySize->value();
    font.codeSize = m_codeSize->value();
    font.codeFamily = m_codeFamily->currentText().trimmed();
    font.codeWeight = m_codeWeight->currentIndex() == 1 ? Session::CodeFontWeight::Bold
                                                        : Session::CodeFontWeight::Normal;
    font.inlineCodeColor = m_inlineColor->color();
    font.blockCodeColor = m_blockColor->color();
    return font.sanitized(m_limits);
}

} // namespace Reader
