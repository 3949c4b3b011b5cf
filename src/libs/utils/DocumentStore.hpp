// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringView>

#include <cstddef>
#include <utility>

namespace Utils {

struct DocumentStoreConfig final {
    QString organizationName;
    QString applicationName;

    // Replaces the platform config location; used by tests and portable installs.
    QString configRootOverride;

    std::size_t maxDocumentBytes = 4u * 1024u * 1024u;   // 4 MiB
};

struct DocumentStorePaths final {
    QString configDir;  // resolved absolute
};

struct DocumentLoadResult final {
    enum class Status : unsigned char {
        Ok,
        NotFound,
        Corrupt
    };

    Status status = Status::NotFound;
    QJsonObject object;
    QString error;
};

// A named-JSON-document store. The policy owns the bytes; the store owns
// size limits and JSON parsing so every backend rejects the same documents.
template <typename PersistencePolicy>
class BasicDocumentStore final {
public:
    using Policy = PersistencePolicy;

    explicit BasicDocumentStore(DocumentStoreConfig config, Policy policy = Policy{})
        : m_config(std::move(config))
        , m_policy(std::move(policy))
        , m_paths(m_policy.resolvePaths(m_config))
    {}

    const DocumentStoreConfig& config() const noexcept { return m_config; }
    const DocumentStorePaths& paths() const noexcept { return m_paths; }
    const Policy& policy() const noexcept { return m_policy; }

    QString documentPath(QStringView name) const
    {
        return m_policy.documentFilePath(m_paths, name);
    }

    DocumentLoadResult load(QStringView name) const
    {
        DocumentLoadResult result;

        QByteArray bytes;
        QString err;
        if (!m_policy.readBytes(m_paths, name, &bytes, &err)) {
            if (err.isEmpty()) {
                result.status = DocumentLoadResult::Status::NotFound;
                return result;
            }
            result.status = DocumentLoadResult::Status::Corrupt;
            result.error = err;
            return result;
        }

        return parseJson(bytes);
    }

    Result save(QStringView name, const QJsonObject& object) const
    {
        QString err;
        if (!m_policy.ensureStorage(m_paths, &err))
            return Result::failure(err.isEmpty() ? QStringLiteral("Failed to ensure storage.") : err);

        const QJsonDocument doc(object);
        const QByteArray bytes = doc.toJson(QJsonDocument::Indented);

        if (static_cast<std::size_t>(bytes.size()) > m_config.maxDocumentBytes) {
            return Result::failure(QStringLiteral("Document '%1' exceeds maxDocumentBytes (limit: %2).")
                                       .arg(name.toString())
                                       .arg(m_config.maxDocumentBytes));
        }

        if (!m_policy.writeBytesAtomic(m_paths, name, bytes, &err))
            return Result::failure(err);
        return Result::success();
    }

private:
    DocumentLoadResult parseJson(const QByteArray& bytes) const
    {
        DocumentLoadResult result;

        if (static_cast<std::size_t>(bytes.size()) > m_config.maxDocumentBytes) {
            result.status = DocumentLoadResult::Status::Corrupt;
            result.error = QStringLiteral("Document exceeds maxDocumentBytes (limit: %1).").arg(m_config.maxDocumentBytes);
            return result;
        }

        QJsonParseError pe{};
        const QJsonDocument doc = QJsonDocument::fromJson(bytes, &pe);
        if (pe.error != QJsonParseError::NoError) {
            result.status = DocumentLoadResult::Status::Corrupt;
            result.error = QStringLiteral("Invalid JSON document: %1 (offset %2).").arg(pe.errorString()).arg(pe.offset);
            return result;
        }
        if (!doc.isObject()) {
            result.status = DocumentLoadResult::Status::Corrupt;
            result.error = QStringLiteral("JSON document root is not an object.");
            return result;
        }

        result.status = DocumentLoadResult::Status::Ok;
        result.object = doc.object();
        return result;
    }

    DocumentStoreConfig m_config;
    Policy m_policy;
    DocumentStorePaths m_paths;
};

} // namespace Utils
