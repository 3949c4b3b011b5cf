// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/ConfigurationRecord.hpp"
#include "session/SessionGlobal.hpp"

#include <utils/DocumentStoreQtPolicy.hpp>
#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Session {

// Reads and writes the configuration record as one JSON document.
// load() never fails the caller: anything unusable degrades to defaults.
class SESSION_EXPORT ConfigStore final
{
public:
    static constexpr int kSchemaVersion = 1;

    explicit ConfigStore(Utils::DocumentStore store, RecordLimits limits = {});

    // Store rooted at the platform config location, or at configRoot when given.
    static Utils::DocumentStore makeDocumentStore(const QString& configRoot = {});

    ConfigurationRecord load() const;
    Utils::Result save(const ConfigurationRecord& record) const;

    QString filePath() const;
    const RecordLimits& limits() const { return m_limits; }

    static QJsonObject toJson(const ConfigurationRecord& record);
    static ConfigurationRecord fromJson(const QJsonObject& object, const RecordLimits& limits);

    // Clamped and de-duplicated copy that is safe to persist.
    static ConfigurationRecord sanitized(const ConfigurationRecord& record, const RecordLimits& limits);

private:
    Utils::DocumentStore m_store;
    RecordLimits m_limits;
};

} // namespace Session
