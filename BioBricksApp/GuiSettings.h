#pragma once

#include <QMap>
#include <QWidget>
#include "BioEngine.h"

class QLineEdit;

namespace BioGui {

// Параметры кирпича и полигона
class SettingsWidget : public QWidget
{
    Q_OBJECT
public:
    explicit SettingsWidget(BioEngine::ConversionEngine *engine, QWidget *parent = nullptr);

signals:
    void invalidInput(QString msg);

public slots:
    // Перечитать значения из движка
    void loadFromEngine();

private:
    void commitField(BioEngine::Setting s);

    BioEngine::ConversionEngine *m_engine{nullptr};
    QMap<BioEngine::Setting, QLineEdit *> m_fields{};
};

} // namespace BioGui
