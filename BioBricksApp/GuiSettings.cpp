#include "GuiSettings.h"
#include <QGridLayout>
#include <QLabel>
#include <QLineEdit>

namespace BioGui {
using namespace BioEngine;

SettingsWidget::SettingsWidget(ConversionEngine *engine, QWidget *parent)
    : QWidget(parent)
    , m_engine(engine)
{
    auto *grid = new QGridLayout(this);

    struct FieldDef
    {
        Setting setting;
        const char *caption;
    };
    const FieldDef defs[]{
        {Setting::BrickMass, "Brick mass (kg)"},
        {Setting::BrickVolume, "Brick volume (m³)"},
        {Setting::LandfillArea, "Landfill area (m²)"},
        {Setting::LandfillDepth, "Landfill depth (m)"},
    };

    // Сетка 2x2: подпись над полем
    int n{0};
    for (const auto &d : defs) {
        auto *le = new QLineEdit(this);
        m_fields.insert(d.setting, le);

        const int row = (n / 2) * 2;
        const int col = n % 2;
        grid->addWidget(new QLabel(d.caption, this), row, col);
        grid->addWidget(le, row + 1, col);
        ++n;

        const Setting s = d.setting;
        connect(le, &QLineEdit::editingFinished, this, [this, s]() { commitField(s); });
    }

    connect(m_engine, &ConversionEngine::stateChanged, this, &SettingsWidget::loadFromEngine);
    loadFromEngine();
}

void SettingsWidget::loadFromEngine()
{
    for (auto it = m_fields.begin(); it != m_fields.end(); ++it) {
        // Не перетираем поле, которое пользователь сейчас правит
        if (it.value()->hasFocus() && it.value()->isModified())
            continue;
        it.value()->setText(QString::number(m_engine->setting(it.key())));
        it.value()->setModified(false);
    }
}

void SettingsWidget::commitField(Setting s)
{
    QLineEdit *le = m_fields.value(s);
    if (!le || !le->isModified())
        return;
    le->setModified(false);

    bool ok{false};
    double v = le->text().trimmed().toDouble(&ok);
    if (!ok) {
        emit invalidInput("Enter a valid number");
        le->setText(QString::number(m_engine->setting(s)));
        return;
    }

    UpdateResult res = m_engine->updateSetting(s, v);
    if (res != UpdateResult::Ok) {
        // Движок отклонил значение, возвращаем прежнее
        emit invalidInput(settingKey(s) + ": " + resultText(res));
        le->setText(QString::number(m_engine->setting(s)));
    }
}

} // namespace BioGui
