#pragma once

#include <QSettings>
#include <QString>
#include <memory>

namespace BioEngine {

// Плоское хранилище "имя -> число"
class Store
{
public:
    virtual ~Store() = default;

    // false, если ключа нет или значение не число
    virtual bool read(const QString &key, double &value) const = 0;
    virtual void write(const QString &key, double value) = 0;

    // Сброс на диск. false = хранилище недоступно
    virtual bool sync() = 0;
    virtual bool isAvailable() const = 0;
};

// =========================================================
// QSettings backend
// =========================================================
class SettingsStore : public Store
{
public:
    // Нативное расположение (организация/приложение из QCoreApplication)
    SettingsStore();
    // Явный INI файл
    explicit SettingsStore(const QString &fileName);

    bool read(const QString &key, double &value) const override;
    void write(const QString &key, double value) override;
    bool sync() override;
    bool isAvailable() const override;

    QString fileName() const { return m_settings->fileName(); }

private:
    std::unique_ptr<QSettings> m_settings;
};

} // namespace BioEngine
