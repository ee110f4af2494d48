#pragma once

#include <QString>
#include <QVariant>
#include <QVariantMap>

namespace BioEngine {

// Путь к встроенному примеру данных (Qt resource)
static const char SAMPLE_DATA_PATH[]{":/data/sample_data.json"};

// "Plastic_Shreds" -> "plastic shreds"
QString normalizeImportKey(const QString &key);

// Нечеткое сравнение метки реестра с нормализованным внешним ключом:
//   метка содержит ключ, ИЛИ ключ содержит первое слово метки.
bool labelMatchesKey(const QString &label, const QString &normalizedKey);

// Числа принимаются как есть, строки парсятся. Остальное -> false.
bool coerceQuantity(const QVariant &raw, double &out);

// Чтение файла/ресурса как UTF-8 текста
bool readTextFile(const QString &path, QString &text, QString *error = nullptr);

// JSON объект "ключ -> число/строка"
bool parseQuantityJson(const QString &text, QVariantMap &out, QString *error = nullptr);

} // namespace BioEngine
