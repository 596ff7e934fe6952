#include "output_directories.h"

#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QString>

namespace ADP {

adp::Result<void> EnsureOutputDirectories(const std::vector<adp::Task>& tasks)
{
    QSet<QString> created;
    for (const auto& task : tasks) {
        const QString dir = QFileInfo(QString::fromStdString(task.output_path)).absolutePath();
        if (created.contains(dir)) {
            continue;
        }
        if (!QDir().mkpath(dir)) {
            return adp::Error::directory_create_failed(dir.toStdString());
        }
        created.insert(dir);
    }
    return adp::Result<void>();
}

}
