// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/PreviewStyle.hpp"
#include "reader/ReaderGlobal.hpp"

#include <QtWidgets/QTextBrowser>

#include <memory>

class QTextDocument;

namespace Reader {

// Read-only view of a rendered document. Links open externally.
class READER_EXPORT MarkdownPreview final : public QTextBrowser
{
    Q_OBJECT

public:
    explicit MarkdownPreview(QWidget* parent = nullptr);
    ~MarkdownPreview() override;

    void applyStyle(const PreviewStyle& style);

    // Takes ownership of document and scrolls to offset once laid out.
    void showDocument(std::unique_ptr<QTextDocument> document, const QString& searchDir, int scrollOffset);
    void showMessage(const QString& text);

    int scrollOffset() const;
    bool isRestoring() const { return m_restoring; }

signals:
    // User scrolling only; programmatic restores are not reported.
    void scrollOffsetChanged(int offset);

private:
    void restoreScroll(int offset);

    std::unique_ptr<QTextDocument> m_document;
    bool m_restoring = false;
};

} // namespace Reader
