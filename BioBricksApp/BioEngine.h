#pragma once

#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>

namespace BioEngine {

class Store;

// =========================================================
// 1. DATA TYPES
// =========================================================

// Строка реестра: категория отходов и её масса (кг)
struct MaterialEntry
{
    QString label{};
    double quantity{0.0};
};

enum class Setting { BrickMass = 0, BrickVolume, LandfillArea, LandfillDepth };

struct ConversionSettings
{
    double brickMass{2.0};       // кг на один кирпич
    double brickVolume{0.002};   // м^3 на один кирпич
    double landfillArea{1000.0}; // м^2
    double landfillDepth{2.0};   // м

    double get(Setting s) const;
    void set(Setting s, double value);

    bool operator==(const ConversionSettings &o) const
    {
        return brickMass == o.brickMass && brickVolume == o.brickVolume
               && landfillArea == o.landfillArea && landfillDepth == o.landfillDepth;
    }
    bool operator!=(const ConversionSettings &o) const { return !(*this == o); }
};

enum class UpdateResult {
    Ok = 0,
    LabelNotFound,  // метка вне реестра
    UnknownSetting, // имя настройки не распознано
    InvalidValue    // настройка <= 0 или не число
};

struct ImportSummary
{
    int applied{0};   // обновлено записей реестра
    int unmatched{0}; // внешние ключи без совпадений
    int malformed{0}; // значения, не приводимые к числу
};

// Канонические значения по умолчанию
QVector<MaterialEntry> defaultMaterials();
ConversionSettings defaultSettings();

// Ключи хранилища: "value:<Label>" и имена настроек
QString valueKey(const QString &label);
QString settingKey(Setting s);
bool settingFromKey(const QString &key, Setting &out);
const QVector<Setting> &allSettings();

QString resultText(UpdateResult r);

// =========================================================
// 2. ENGINE
// =========================================================
class ConversionEngine : public QObject
{
    Q_OBJECT
public:
    explicit ConversionEngine(QObject *parent = nullptr);
    explicit ConversionEngine(Store *store, QObject *parent = nullptr);

    // Хранилище не принадлежит движку. nullptr = без автосохранения.
    void setStore(Store *store) { m_store = store; }
    Store *store() const { return m_store; }

    // --- Метрики (считаются при каждом чтении) ---
    double totalAvailableWaste() const;
    qint64 bricksProducible() const;
    double volumeDiverted() const;
    double areaReduced() const;
    double percentLandfillReduced() const;

    // --- Реестр ---
    QVector<MaterialEntry> orderedEntries() const { return m_materials; }
    QStringList labels() const;
    bool contains(const QString &label) const { return indexOf(label) >= 0; }
    double value(const QString &label) const;
    double share(const QString &label) const; // % от общей массы

    // --- Настройки ---
    ConversionSettings settings() const { return m_settings; }
    double setting(Setting s) const { return m_settings.get(s); }
    double brickMass() const { return m_settings.brickMass; }
    double brickVolume() const { return m_settings.brickVolume; }
    double landfillArea() const { return m_settings.landfillArea; }
    double landfillDepth() const { return m_settings.landfillDepth; }

    // --- Изменения ---
    UpdateResult updateValue(const QString &label, double quantity);
    UpdateResult updateSetting(Setting s, double value);
    UpdateResult updateSetting(const QString &name, double value);
    int setAll(const QMap<QString, double> &values);
    void resetToDefaults();

    // --- Импорт ---
    ImportSummary importQuantities(const QVariantMap &source);
    bool importFile(const QString &path, ImportSummary *summary = nullptr);

    // --- Persistence (Save/Load) ---
    bool save();
    bool load();

signals:
    void stateChanged();
    void errorOccurred(QString msg);

private:
    QVector<MaterialEntry> m_materials{};
    ConversionSettings m_settings{};
    Store *m_store{nullptr};

    int indexOf(const QString &label) const;

    // Автосохранение + уведомление подписчиков
    void commit();
};

} // namespace BioEngine
