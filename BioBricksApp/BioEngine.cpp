#include "BioEngine.h"
#include <QDebug>
#include <QtGlobal>
#include <cmath>
#include <limits>
#include "BioImport.h"
#include "BioStore.h"

namespace BioEngine {

static const char VALUE_PREFIX[]{"value:"};

// =========================================================
// DEFAULTS & KEYS
// =========================================================

QVector<MaterialEntry> defaultMaterials()
{
    return {
        {"Vegetable peels", 8.0},
        {"Sawdust", 5.0},
        {"Dry leaves", 4.0},
        {"Plastic shreds", 2.0},
        {"Straws / fibers", 1.0},
        {"E-waste", 0.2},
        {"Sand", 0.5},
        {"Other", 0.3},
    };
}

ConversionSettings defaultSettings()
{
    return ConversionSettings{};
}

double ConversionSettings::get(Setting s) const
{
    switch (s) {
    case Setting::BrickMass:
        return brickMass;
    case Setting::BrickVolume:
        return brickVolume;
    case Setting::LandfillArea:
        return landfillArea;
    case Setting::LandfillDepth:
        return landfillDepth;
    }
    return 0.0;
}

void ConversionSettings::set(Setting s, double value)
{
    switch (s) {
    case Setting::BrickMass:
        brickMass = value;
        break;
    case Setting::BrickVolume:
        brickVolume = value;
        break;
    case Setting::LandfillArea:
        landfillArea = value;
        break;
    case Setting::LandfillDepth:
        landfillDepth = value;
        break;
    }
}

QString valueKey(const QString &label)
{
    return QLatin1String(VALUE_PREFIX) + label;
}

QString settingKey(Setting s)
{
    switch (s) {
    case Setting::BrickMass:
        return "brickMass";
    case Setting::BrickVolume:
        return "brickVolume";
    case Setting::LandfillArea:
        return "landfillArea";
    case Setting::LandfillDepth:
        return "landfillDepth";
    }
    return QString();
}

bool settingFromKey(const QString &key, Setting &out)
{
    for (Setting s : allSettings()) {
        if (settingKey(s) == key) {
            out = s;
            return true;
        }
    }
    return false;
}

const QVector<Setting> &allSettings()
{
    static const QVector<Setting> list{Setting::BrickMass,
                                       Setting::BrickVolume,
                                       Setting::LandfillArea,
                                       Setting::LandfillDepth};
    return list;
}

QString resultText(UpdateResult r)
{
    switch (r) {
    case UpdateResult::Ok:
        return "OK";
    case UpdateResult::LabelNotFound:
        return "Unknown material";
    case UpdateResult::UnknownSetting:
        return "Unknown setting";
    case UpdateResult::InvalidValue:
        return "Value must be a positive number";
    }
    return QString();
}

// Количество: конечное число, отрицательное -> 0
static bool sanitizeQuantity(double in, double &out)
{
    if (!std::isfinite(in))
        return false;
    out = in < 0.0 ? 0.0 : in;
    return true;
}

static bool isValidSetting(double v)
{
    return std::isfinite(v) && v > 0.0;
}

// =========================================================
// ENGINE IMPLEMENTATION
// =========================================================

ConversionEngine::ConversionEngine(QObject *parent)
    : ConversionEngine(nullptr, parent)
{}

ConversionEngine::ConversionEngine(Store *store, QObject *parent)
    : QObject(parent)
    , m_materials(defaultMaterials())
    , m_settings(defaultSettings())
    , m_store(store)
{}

int ConversionEngine::indexOf(const QString &label) const
{
    for (int i = 0; i < m_materials.size(); ++i) {
        if (m_materials[i].label == label)
            return i;
    }
    return -1;
}

QStringList ConversionEngine::labels() const
{
    QStringList list{};
    list.reserve(m_materials.size());
    for (const auto &m : m_materials)
        list.append(m.label);
    return list;
}

double ConversionEngine::value(const QString &label) const
{
    int idx = indexOf(label);
    return idx >= 0 ? m_materials[idx].quantity : 0.0;
}

double ConversionEngine::share(const QString &label) const
{
    double total = totalAvailableWaste();
    if (total <= 0.0)
        return 0.0;
    return value(label) / total * 100.0;
}

// ---------------------------------------------------------
// METRICS: total -> bricks -> volume -> area -> percent
// ---------------------------------------------------------
double ConversionEngine::totalAvailableWaste() const
{
    double sum{0.0};
    for (const auto &m : m_materials)
        sum += m.quantity;
    return sum;
}

qint64 ConversionEngine::bricksProducible() const
{
    if (m_settings.brickMass <= 0.0)
        return 0;

    const double bricks = std::floor(totalAvailableWaste() / m_settings.brickMass);
    const double limit = static_cast<double>(std::numeric_limits<qint64>::max());
    if (!std::isfinite(bricks) || bricks >= limit)
        return std::numeric_limits<qint64>::max();
    return static_cast<qint64>(bricks);
}

double ConversionEngine::volumeDiverted() const
{
    return static_cast<double>(bricksProducible()) * m_settings.brickVolume;
}

double ConversionEngine::areaReduced() const
{
    if (m_settings.landfillDepth <= 0.0)
        return 0.0;
    return volumeDiverted() / m_settings.landfillDepth;
}

double ConversionEngine::percentLandfillReduced() const
{
    if (m_settings.landfillArea <= 0.0)
        return 0.0;
    const double percent = areaReduced() / m_settings.landfillArea * 100.0;
    if (std::isnan(percent))
        return 0.0;
    return qBound(0.0, percent, 100.0);
}

// ---------------------------------------------------------
// MUTATIONS
// ---------------------------------------------------------
UpdateResult ConversionEngine::updateValue(const QString &label, double quantity)
{
    int idx = indexOf(label);
    if (idx < 0)
        return UpdateResult::LabelNotFound;

    double v{0.0};
    if (!sanitizeQuantity(quantity, v))
        return UpdateResult::InvalidValue;

    m_materials[idx].quantity = v;
    commit();
    return UpdateResult::Ok;
}

UpdateResult ConversionEngine::updateSetting(Setting s, double value)
{
    if (!isValidSetting(value))
        return UpdateResult::InvalidValue;

    m_settings.set(s, value);
    commit();
    return UpdateResult::Ok;
}

UpdateResult ConversionEngine::updateSetting(const QString &name, double value)
{
    Setting s{};
    if (!settingFromKey(name, s))
        return UpdateResult::UnknownSetting;
    return updateSetting(s, value);
}

int ConversionEngine::setAll(const QMap<QString, double> &values)
{
    int updated{0};
    for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
        int idx = indexOf(it.key());
        double v{0.0};
        if (idx < 0 || !sanitizeQuantity(it.value(), v))
            continue;
        m_materials[idx].quantity = v;
        ++updated;
    }
    commit();
    return updated;
}

void ConversionEngine::resetToDefaults()
{
    // Реестр и настройки заменяются целиком до уведомления
    m_materials = defaultMaterials();
    m_settings = defaultSettings();
    commit();
}

// ---------------------------------------------------------
// IMPORT
// ---------------------------------------------------------
ImportSummary ConversionEngine::importQuantities(const QVariantMap &source)
{
    ImportSummary summary{};

    for (auto it = source.constBegin(); it != source.constEnd(); ++it) {
        const QString key = normalizeImportKey(it.key());

        QVector<int> matched{};
        for (int i = 0; i < m_materials.size(); ++i) {
            if (labelMatchesKey(m_materials[i].label, key))
                matched.append(i);
        }

        if (matched.isEmpty()) {
            ++summary.unmatched;
            continue;
        }

        double raw{0.0}, v{0.0};
        if (!coerceQuantity(it.value(), raw) || !sanitizeQuantity(raw, v)) {
            qDebug() << "[BioEngine] Skipping malformed value for" << it.key();
            ++summary.malformed;
            continue;
        }

        for (int idx : matched)
            m_materials[idx].quantity = v;
        summary.applied += matched.size();
    }

    qDebug() << "[BioEngine] Import:" << summary.applied << "applied," << summary.unmatched
             << "unmatched," << summary.malformed << "malformed";

    commit();
    return summary;
}

bool ConversionEngine::importFile(const QString &path, ImportSummary *summary)
{
    QString text{}, err{};
    QVariantMap source{};

    if (!readTextFile(path, text, &err) || !parseQuantityJson(text, source, &err)) {
        qWarning() << "[BioEngine] Import failed:" << err;
        emit errorOccurred(err);
        return false;
    }

    ImportSummary res = importQuantities(source);
    if (summary)
        *summary = res;
    return true;
}

// ---------------------------------------------------------
// PERSISTENCE
// ---------------------------------------------------------
bool ConversionEngine::save()
{
    if (!m_store || !m_store->isAvailable()) {
        qWarning() << "[BioEngine] Store unavailable, state not saved";
        return false;
    }

    // Каждое поле пишется отдельным ключом
    for (const auto &m : m_materials)
        m_store->write(valueKey(m.label), m.quantity);
    for (Setting s : allSettings())
        m_store->write(settingKey(s), m_settings.get(s));

    if (!m_store->sync()) {
        qWarning() << "[BioEngine] Store write failed";
        return false;
    }
    return true;
}

bool ConversionEngine::load()
{
    if (!m_store || !m_store->isAvailable()) {
        qWarning() << "[BioEngine] Store unavailable, keeping current state";
        return false;
    }

    int restored{0};
    for (auto &m : m_materials) {
        double stored{0.0}, v{0.0};
        if (!m_store->read(valueKey(m.label), stored))
            continue;
        if (!sanitizeQuantity(stored, v)) {
            qWarning() << "[BioEngine] Ignoring stored value for" << m.label;
            continue;
        }
        m.quantity = v;
        ++restored;
    }

    for (Setting s : allSettings()) {
        double stored{0.0};
        if (!m_store->read(settingKey(s), stored))
            continue;
        if (!isValidSetting(stored)) {
            qWarning() << "[BioEngine] Ignoring stored setting" << settingKey(s) << stored;
            continue;
        }
        m_settings.set(s, stored);
        ++restored;
    }

    qDebug() << "[BioEngine] Restored" << restored << "fields from store";
    emit stateChanged();
    return true;
}

void ConversionEngine::commit()
{
    if (m_store && !save())
        emit errorOccurred("Could not save state");
    emit stateChanged();
}

} // namespace BioEngine
