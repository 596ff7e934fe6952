#include "batch_options.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>

namespace ADP {

namespace {

adp::Error wrongType(const QString& path, const char* key, const char* expected)
{
    return adp::Error::invalid_config(QString("%1: '%2' must be %3")
                                          .arg(path, QLatin1String(key), QLatin1String(expected))
                                          .toStdString());
}

// JSON numbers are doubles; integers must have no fractional part
bool readInt(const QJsonValue& value, int& out)
{
    if (!value.isDouble()) {
        return false;
    }
    const double d = value.toDouble();
    if (std::floor(d) != d || d < 0.0 || d > 2147483647.0) {
        return false;
    }
    out = static_cast<int>(d);
    return true;
}

}

adp::ProcessorConfig BatchOptions::processorConfig() const
{
    adp::ProcessorConfig config;
    config.target_sample_rate = sampleRate;
    config.min_duration_seconds = minDuration;
    config.max_duration_seconds = maxDuration;
    return config;
}

adp::Result<void> LoadOptionsFile(const QString& path, BatchOptions& options)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return adp::Error::invalid_config(QString("Cannot read options file %1: %2")
                                              .arg(path, file.errorString())
                                              .toStdString());
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return adp::Error::invalid_config(QString("Options file %1: %2 at offset %3")
                                              .arg(path, parseError.errorString())
                                              .arg(parseError.offset)
                                              .toStdString());
    }
    if (!doc.isObject()) {
        return adp::Error::invalid_config(QString("Options file %1 must hold a JSON object")
                                              .arg(path)
                                              .toStdString());
    }

    // Work on a copy so a bad key leaves options untouched
    BatchOptions updated = options;
    const QJsonObject obj = doc.object();

    if (obj.contains("sample_rate") && !readInt(obj.value("sample_rate"), updated.sampleRate)) {
        return wrongType(path, "sample_rate", "a non-negative integer");
    }
    if (obj.contains("threads") && !readInt(obj.value("threads"), updated.threads)) {
        return wrongType(path, "threads", "a non-negative integer");
    }
    if (obj.contains("min_duration")) {
        const QJsonValue v = obj.value("min_duration");
        if (!v.isDouble()) {
            return wrongType(path, "min_duration", "a number");
        }
        updated.minDuration = v.toDouble();
    }
    if (obj.contains("max_duration")) {
        const QJsonValue v = obj.value("max_duration");
        if (!v.isDouble()) {
            return wrongType(path, "max_duration", "a number");
        }
        updated.maxDuration = v.toDouble();
    }

    options = updated;
    return adp::Result<void>();
}

}
