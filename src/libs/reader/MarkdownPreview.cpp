// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/MarkdownPreview.hpp"

#include "reader/ReaderConstants.hpp"

#include <QtCore/QTimer>
#include <QtGui/QTextDocument>
#include <QtWidgets/QScrollBar>

namespace Reader {

MarkdownPreview::MarkdownPreview(QWidget* parent)
    : QTextBrowser(parent)
{
    setObjectName(Constants::PREVIEW_OBJECT_NAME);
    setOpenExternalLinks(true);
    setOpenLinks(true);
    setFrameShape(QFrame::NoFrame);

    connect(verticalScrollBar(), &QScrollBar::valueChanged, this, [this](int value) {
        if (!m_restoring)
            emit scrollOffsetChanged(value);
    });
}

MarkdownPreview::~MarkdownPreview()
{
    // The browser holds a raw pointer to the document we own.
    setDocument(nullptr);
}

void MarkdownPreview::applyStyle(const PreviewStyle& style)
{
    QPalette p = palette();
    p.setColor(QPalette::Base, style.background);
    p.setColor(QPalette::Text, style.text);
    p.setColor(QPalette::Link, style.link);
    setPalette(p);
    setFont(style.bodyFont);
}

void MarkdownPreview::showDocument(std::unique_ptr<QTextDocument> document, const QString& searchDir, int scrollOffset)
{
    if (!document)
        return;

    m_restoring = true;
    setSearchPaths(searchDir.isEmpty() ? QStringList{} : QStringList{searchDir});
    setDocument(document.get());
    m_document = std::move(document);
    restoreScroll(scrollOffset);
}

void MarkdownPreview::showMessage(const QString& text)
{
    m_restoring = true;
    setDocument(nullptr);
    m_document.reset();
    setPlainText(text);
    m_restoring = false;
}

int MarkdownPreview::scrollOffset() const
{
    return verticalScrollBar()->value();
}

void MarkdownPreview::restoreScroll(int offset)
{
    // Layout finishes on the next event loop turn; the range is not
    // known before then.
    QTimer::singleShot(0, this, [this, offset] {
        verticalScrollBar()->setValue(offset);
        m_restoring = false;
    });
}

} // namespace Reader
