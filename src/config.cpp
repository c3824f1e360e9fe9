#include "config.hpp"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QStringList>
#include <cmath>

namespace {

const Confirmation kAllConfirmations[] = {
    Confirmation::PartitionOpenReached,
    Confirmation::PartitionCloseReached,
    Confirmation::GateLockedConfirmed,
    Confirmation::GateUnlockedConfirmed,
    Confirmation::GateClosedConfirmed
};

double* slotFor(TimeoutConfig& cfg, Confirmation confirmation) {
    switch (confirmation) {
        case Confirmation::PartitionOpenReached: return &cfg.partitionOpenReached;
        case Confirmation::PartitionCloseReached: return &cfg.partitionCloseReached;
        case Confirmation::GateLockedConfirmed: return &cfg.gateLockedConfirmed;
        case Confirmation::GateUnlockedConfirmed: return &cfg.gateUnlockedConfirmed;
        case Confirmation::GateClosedConfirmed: return &cfg.gateClosedConfirmed;
    }
    return nullptr;
}

// Integer setting within [min, max]; anything else keeps the default.
void readInt(const QJsonObject& json, const char* key, int min, int max, int& target, QStringList& issues) {
    if (!json.contains(key))
        return;
    const QJsonValue value = json.value(key);
    const double number = value.toDouble(-1.0);
    if (!value.isDouble() || number != std::floor(number) || number < min || number > max) {
        qWarning() << "Config:" << key << "must be an integer in" << min << ".." << max
                   << "- keeping" << target;
        issues << QString("%1 must be an integer in %2..%3").arg(key).arg(min).arg(max);
        return;
    }
    target = static_cast<int>(number);
}

void readBool(const QJsonObject& json, const char* key, bool& target, QStringList& issues) {
    if (!json.contains(key))
        return;
    const QJsonValue value = json.value(key);
    if (!value.isBool()) {
        qWarning() << "Config:" << key << "must be true or false - keeping" << target;
        issues << QString("%1 must be true or false").arg(key);
        return;
    }
    target = value.toBool();
}

}  // namespace

double TimeoutConfig::seconds(Confirmation confirmation) const {
    switch (confirmation) {
        case Confirmation::PartitionOpenReached: return partitionOpenReached;
        case Confirmation::PartitionCloseReached: return partitionCloseReached;
        case Confirmation::GateLockedConfirmed: return gateLockedConfirmed;
        case Confirmation::GateUnlockedConfirmed: return gateUnlockedConfirmed;
        case Confirmation::GateClosedConfirmed: return gateClosedConfirmed;
    }
    return 0.0;
}

bool TimeoutConfig::set(Confirmation confirmation, double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0 || seconds > kMaxSeconds)
        return false;
    *slotFor(*this, confirmation) = seconds;
    return true;
}

int TimeoutConfig::applyOverrides(const QJsonObject& overrides, QStringList* issues) {
    int rejected = 0;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        bool known = false;
        for (Confirmation c : kAllConfirmations) {
            if (toString(c) != it.key())
                continue;
            known = true;
            if (!it.value().isDouble() || !set(c, it.value().toDouble())) {
                qWarning() << "Config: invalid timeout" << it.key() << "=" << it.value()
                           << "- keeping default" << seconds(c) << "s";
                if (issues)
                    *issues << QString("timeout %1 must be in (0, %2] seconds").arg(it.key()).arg(kMaxSeconds);
                ++rejected;
            }
        }
        if (!known) {
            qWarning() << "Config: unknown timeout" << it.key() << "ignored";
            if (issues)
                *issues << QString("unknown timeout %1").arg(it.key());
            ++rejected;
        }
    }
    return rejected;
}

ChamberConfig ChamberConfig::fromJson(const QJsonObject& json) {
    ChamberConfig cfg;

    if (json.contains("device_name")) {
        const QString name = json.value("device_name").toString().trimmed();
        if (name.isEmpty()) {
            qWarning() << "Config: device_name must be a non-empty string - keeping" << cfg.deviceName;
            cfg.issues << "device_name must be a non-empty string";
        } else {
            cfg.deviceName = name;
        }
    }

    readInt(json, "cycle_period_ms", 10, 10000, cfg.cyclePeriodMs, cfg.issues);
    readInt(json, "partition_speed", 1, 100000, cfg.partitionSpeed, cfg.issues);
    readInt(json, "product_sensors", 0, 8, cfg.productSensors, cfg.issues);
    readInt(json, "sauce_sensors", 0, 8, cfg.sauceSensors, cfg.issues);
    readBool(json, "lock_feedback", cfg.lockFeedback, cfg.issues);
    readBool(json, "indicator", cfg.indicator, cfg.issues);

    int port = cfg.udpPort;
    readInt(json, "udp_port", 1, 65535, port, cfg.issues);
    cfg.udpPort = static_cast<quint16>(port);

    if (json.contains("timeouts")) {
        if (json.value("timeouts").isObject()) {
            cfg.timeouts.applyOverrides(json.value("timeouts").toObject(), &cfg.issues);
        } else {
            qWarning() << "Config: timeouts must be an object - using defaults";
            cfg.issues << "timeouts must be an object";
        }
    }

    return cfg;
}

ChamberConfig ChamberConfig::fromFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        throw ConfigError("cannot open " + path.toStdString() + ": " + file.errorString().toStdString());

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError)
        throw ConfigError(path.toStdString() + ": " + parseError.errorString().toStdString());
    if (!doc.isObject())
        throw ConfigError(path.toStdString() + ": top level must be an object");

    qInfo() << "Config loaded from" << path;
    return fromJson(doc.object());
}
