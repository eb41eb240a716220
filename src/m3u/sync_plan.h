#pragma once

#include <QList>
#include <QString>
#include <ostream>
#include <string>
#include "tree_builder.h"

namespace m3u
{
    /**
     * Serialises accepted tracks for the external file-sync collaborator:
     *
     *   { "entries": [ { "destination", "source", "existsLocally" } ], "missing": <count> }
     *
     * "missing" counts entries whose source file does not exist locally.
     */
    std::string syncPlanToJson(const QList<SyncEntry>& entries);

    void writeSyncPlan(const QList<SyncEntry>& entries, std::ostream& out);

    // @throws WriteFailure if the file cannot be written
    void writeSyncPlanFile(const QList<SyncEntry>& entries, const QString& filePath);
}
