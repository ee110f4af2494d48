#pragma once

#include <QMap>
#include <QString>
#include "BioStore.h"

// Хранилище в памяти для тестов, с управляемыми отказами
class MemoryStore : public BioEngine::Store
{
public:
    bool read(const QString &key, double &value) const override
    {
        if (!values.contains(key))
            return false;
        value = values.value(key);
        return true;
    }

    void write(const QString &key, double value) override { values[key] = value; }

    bool sync() override
    {
        ++syncCount;
        return !failSync;
    }

    bool isAvailable() const override { return available; }

    QMap<QString, double> values{};
    bool available{true};
    bool failSync{false};
    int syncCount{0};
};
