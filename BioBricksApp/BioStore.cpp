#include "BioStore.h"
#include <QDebug>
#include <QVariant>

namespace BioEngine {

SettingsStore::SettingsStore()
    : m_settings(new QSettings())
{}

SettingsStore::SettingsStore(const QString &fileName)
    : m_settings(new QSettings(fileName, QSettings::IniFormat))
{}

bool SettingsStore::read(const QString &key, double &value) const
{
    if (!m_settings->contains(key))
        return false;

    bool ok{false};
    double v = m_settings->value(key).toDouble(&ok);
    if (!ok) {
        qWarning() << "[BioStore] Not a number under" << key;
        return false;
    }
    value = v;
    return true;
}

void SettingsStore::write(const QString &key, double value)
{
    m_settings->setValue(key, value);
}

bool SettingsStore::sync()
{
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "[BioStore] Sync failed:" << m_settings->fileName()
                   << "status" << m_settings->status();
        return false;
    }
    return true;
}

bool SettingsStore::isAvailable() const
{
    return m_settings->status() == QSettings::NoError;
}

} // namespace BioEngine
