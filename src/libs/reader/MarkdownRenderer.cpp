// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/MarkdownRenderer.hpp"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtGui/QTextCursor>
#include <QtGui/QTextDocument>
#include <QtGui/QTextFormat>

namespace Reader {

namespace {

QString languageKey(const QString& language)
{
    return language.trimmed().toLower();
}

bool isCodeBlock(const QTextBlock& block)
{
    const QTextBlockFormat fmt = block.blockFormat();
    return fmt.hasProperty(QTextFormat::BlockCodeFence)
           || fmt.hasProperty(QTextFormat::BlockCodeLanguage)
           || fmt.nonBreakableLines();
}

QString codeLanguage(const QTextBlock& block)
{
    return block.blockFormat().stringProperty(QTextFormat::BlockCodeLanguage);
}

struct StyledRange {
    int position = 0;
    int length = 0;
    bool anchor = false;
};

} // namespace

QString CodeBlock::text() const
{
    QStringList lines;
    for (QTextBlock b = first; b.isValid(); b = b.next()) {
        lines.push_back(b.text().replace(QChar::LineSeparator, u'\n'));
        if (b == last)
            break;
    }
    return lines.join(u'\n');
}

void MarkdownRenderer::registerCodeBlockHook(const QString& language, CodeBlockHook hook)
{
    const QString key = languageKey(language);
    if (key.isEmpty() || !hook)
        return;
    m_hooks.insert(key, std::move(hook));
}

void MarkdownRenderer::unregisterCodeBlockHook(const QString& language)
{
    m_hooks.remove(languageKey(language));
}

bool MarkdownRenderer::hasCodeBlockHook(const QString& language) const
{
    return m_hooks.contains(languageKey(language));
}

std::vector<CodeBlock> MarkdownRenderer::codeBlocks(const QTextDocument& document)
{
    std::vector<CodeBlock> out;
    for (QTextBlock b = document.begin(); b.isValid(); b = b.next()) {
        if (!isCodeBlock(b))
            continue;

        const QString language = codeLanguage(b);
        if (!out.empty()) {
            CodeBlock& open = out.back();
            if (open.last.next() == b && open.language == language) {
                open.last = b;
                continue;
            }
        }
        out.push_back(CodeBlock{language, b, b});
    }
    return out;
}

std::unique_ptr<QTextDocument> MarkdownRenderer::importDocument(const QString& markdown,
                                                                const QUrl& baseUrl) const
{
    auto doc = std::make_unique<QTextDocument>();
    if (baseUrl.isValid())
        doc->setBaseUrl(baseUrl);
    doc->setMarkdown(markdown, QTextDocument::MarkdownDialectGitHub);
    return doc;
}

void MarkdownRenderer::runHooks(const QTextDocument& document) const
{
    if (m_hooks.isEmpty())
        return;

    for (const CodeBlock& block : codeBlocks(document)) {
        const auto it = m_hooks.constFind(languageKey(block.language));
        if (it != m_hooks.constEnd())
            it.value()(block);
    }
}

QString MarkdownRenderer::render(const QString& markdown) const
{
    const std::unique_ptr<QTextDocument> doc = importDocument(markdown, {});
    runHooks(*doc);
    return doc->toHtml();
}

std::unique_ptr<QTextDocument> MarkdownRenderer::renderDocument(const QString& markdown,
                                                                const PreviewStyle& style,
                                                                const QUrl& baseUrl) const
{
    std::unique_ptr<QTextDocument> doc = importDocument(markdown, baseUrl);
    doc->setDefaultFont(style.bodyFont);

    QTextCharFormat codeChars;
    codeChars.setFont(style.codeFont, QTextCharFormat::FontPropertiesSpecifiedOnly);
    codeChars.setForeground(style.blockCode);

    QTextBlockFormat codeBlockFormat;
    codeBlockFormat.setBackground(style.blockCodeBackground);

    // Formats are collected first; merging while walking fragments would
    // invalidate the iterators.
    std::vector<StyledRange> inlineRanges;
    for (QTextBlock b = doc->begin(); b.isValid(); b = b.next()) {
        if (isCodeBlock(b)) {
            QTextCursor cursor(b);
            cursor.mergeBlockFormat(codeBlockFormat);
            cursor.movePosition(QTextCursor::EndOfBlock, QTextCursor::KeepAnchor);
            cursor.mergeCharFormat(codeChars);
            continue;
        }

        for (auto it = b.begin(); !it.atEnd(); ++it) {
            const QTextFragment fragment = it.fragment();
            if (!fragment.isValid())
                continue;
            const QTextCharFormat fmt = fragment.charFormat();
            if (fmt.isAnchor())
                inlineRanges.push_back({fragment.position(), fragment.length(), true});
            else if (fmt.fontFixedPitch())
                inlineRanges.push_back({fragment.position(), fragment.length(), false});
        }
    }

    QTextCharFormat inlineChars;
    inlineChars.setFont(style.codeFont, QTextCharFormat::FontPropertiesSpecifiedOnly);
    inlineChars.setForeground(style.inlineCode);
    inlineChars.setBackground(style.inlineCodeBackground);

    QTextCharFormat linkChars;
    linkChars.setForeground(style.link);

    for (const StyledRange& range : inlineRanges) {
        QTextCursor cursor(doc.get());
        cursor.setPosition(range.position);
        cursor.setPosition(range.position + range.length, QTextCursor::KeepAnchor);
        cursor.mergeCharFormat(range.anchor ? linkChars : inlineChars);
    }

    runHooks(*doc);
    return doc;
}

Utils::Result MarkdownRenderer::readFile(const QString& path, QString* text)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return Utils::Result::failure(QStringLiteral("Cannot open '%1': %2")
                                          .arg(QFileInfo(path).fileName(), file.errorString()));
    }

    if (text)
        *text = QString::fromUtf8(file.readAll());
    return Utils::Result::success();
}

} // namespace Reader
