#pragma once

#include "utils/DocumentStore.hpp"
#include "utils/UtilsGlobal.hpp"

namespace Utils {

class UTILS_EXPORT QtDocumentStorePolicy final {
public:
	DocumentStorePaths resolvePaths(const DocumentStoreConfig& cfg) const;

	QString documentFilePath(const DocumentStorePaths& paths, QStringView name) const;

	bool ensureStorage(const DocumentStorePaths& paths, QString* error) const;

	// Returns false with an empty error when the document does not exist.
	bool readBytes(const DocumentStorePaths& paths, QStringView name, QByteArray* out, QString* error) const;

	bool writeBytesAtomic(const DocumentStorePaths& paths, QStringView name,
						  const QByteArray& bytes, QString* error) const;
};

using DocumentStore = BasicDocumentStore<QtDocumentStorePolicy>;

} // namespace Utils
