#pragma once
#include "QueueStore.hpp"

namespace vrpkg {

// Queue persisted as an INI array through QSettings.
class SettingsQueueStore : public QueueStore {
public:
    explicit SettingsQueueStore(QString filePath);

    bool save(const QVector<Job> &jobs, QString &err) override;
    bool load(QVector<Job> &out, QString &err) override;

    const QString &filePath() const { return filePath_; }

private:
    QString filePath_;
};

} // namespace vrpkg
