// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/PreviewStyle.hpp"
#include "reader/ReaderGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtGui/QTextBlock>

#include <functional>
#include <memory>
#include <vector>

class QTextDocument;

namespace Reader {

// A fenced code block as laid out in the document. The importer may
// split one fence into several consecutive blocks; first and last
// bound the run.
struct READER_EXPORT CodeBlock final {
    QString language;
    QTextBlock first;
    QTextBlock last;

    QString text() const;
};

// Turns Markdown into a QTextDocument through Qt's own importer, then
// applies a PreviewStyle and any registered code block hooks.
class READER_EXPORT MarkdownRenderer final
{
public:
    using CodeBlockHook = std::function<void(const CodeBlock&)>;

    MarkdownRenderer() = default;

    // Language matching ignores case. A second registration for the same
    // language replaces the first.
    void registerCodeBlockHook(const QString& language, CodeBlockHook hook);
    void unregisterCodeBlockHook(const QString& language);
    bool hasCodeBlockHook(const QString& language) const;

    QString render(const QString& markdown) const;

    std::unique_ptr<QTextDocument> renderDocument(const QString& markdown,
                                                  const PreviewStyle& style,
                                                  const QUrl& baseUrl = {}) const;

    static std::vector<CodeBlock> codeBlocks(const QTextDocument& document);

    static Utils::Result readFile(const QString& path, QString* text);

private:
    std::unique_ptr<QTextDocument> importDocument(const QString& markdown, const QUrl& baseUrl) const;
    void runHooks(const QTextDocument& document) const;

    QHash<QString, CodeBlockHook> m_hooks;
};

} // namespace Reader
