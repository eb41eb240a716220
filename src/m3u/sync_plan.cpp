#include "sync_plan.h"
#include <log/log_manager.h>
#include <json/json.h>
#include <fstream>
#include <memory>
#include <sstream>

namespace m3u
{
    namespace
    {
        Json::Value toJson(const QList<SyncEntry>& entries)
        {
            Json::Value root(Json::objectValue);
            Json::Value array(Json::arrayValue);
            int missing = 0;
            for (const SyncEntry& entry : entries) {
                Json::Value item(Json::objectValue);
                item["destination"] = entry.destinationPath.toStdString();
                item["source"] = entry.sourcePath.toStdString();
                item["existsLocally"] = entry.existsLocally;
                array.append(item);
                if (!entry.existsLocally) ++missing;
            }
            root["entries"] = array;
            root["missing"] = missing;
            return root;
        }
    }

    void writeSyncPlan(const QList<SyncEntry>& entries, std::ostream& out)
    {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        builder["emitUTF8"] = true;
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(toJson(entries), &out);
        out << '\n';
    }

    std::string syncPlanToJson(const QList<SyncEntry>& entries)
    {
        std::ostringstream out;
        writeSyncPlan(entries, out);
        return out.str();
    }

    void writeSyncPlanFile(const QList<SyncEntry>& entries, const QString& filePath)
    {
        std::ofstream file(filePath.toStdString());
        if (!file.is_open()) {
            LOG_ERROR("Failed to open file for writing: {}", filePath.toStdString());
            throw WriteFailure(filePath, QStringLiteral("cannot open file"));
        }
        writeSyncPlan(entries, file);
        file.close();
        if (file.fail()) {
            LOG_ERROR("Failed to write sync plan: {}", filePath.toStdString());
            throw WriteFailure(filePath, QStringLiteral("write error"));
        }
        LOG_INFO("Sync plan with {} entries saved to: {}", entries.size(), filePath.toStdString());
    }
}
