#include "BioImport.h"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QMetaType>
#include <cmath>

namespace BioEngine {

QString normalizeImportKey(const QString &key)
{
    QString k = key.toLower();
    k.replace(QLatin1Char('_'), QLatin1Char(' '));
    return k;
}

bool labelMatchesKey(const QString &label, const QString &normalizedKey)
{
    const QString lower = label.toLower();
    if (lower.contains(normalizedKey))
        return true;

    // Первое слово метки ("plastic" для "Plastic shreds")
    const QString firstToken = lower.split(QLatin1Char(' ')).first();
    return normalizedKey.contains(firstToken);
}

bool coerceQuantity(const QVariant &raw, double &out)
{
    double v{0.0};

    switch (raw.userType()) {
    case QMetaType::Double:
    case QMetaType::Float:
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
        v = raw.toDouble();
        break;

    case QMetaType::QString: {
        bool ok{false};
        v = raw.toString().trimmed().toDouble(&ok);
        if (!ok)
            return false;
        break;
    }

    default: // null, bool, массивы, объекты
        return false;
    }

    if (!std::isfinite(v))
        return false;
    out = v;
    return true;
}

bool readTextFile(const QString &path, QString &text, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error)
            *error = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    text = QString::fromUtf8(file.readAll());
    qDebug() << "[BioImport] Read" << text.size() << "chars from" << path;
    return true;
}

bool parseQuantityJson(const QString &text, QVariantMap &out, QString *error)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QString("JSON error at %1: %2")
                         .arg(parseError.offset)
                         .arg(parseError.errorString());
        return false;
    }

    if (!doc.isObject()) {
        if (error)
            *error = "JSON root must be an object of material -> quantity";
        return false;
    }

    out = doc.object().toVariantMap();
    return true;
}

} // namespace BioEngine
