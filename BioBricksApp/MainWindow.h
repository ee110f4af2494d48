#pragma once

#include <QLabel>
#include <QMainWindow>
#include <QProgressBar>
#include "BioEngine.h"
#include "GuiComposition.h"
#include "GuiSettings.h"
#include "MetricIndicatorWidget.h"

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(BioEngine::ConversionEngine *engine, QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    // Слоты меню / панели
    void onActionLoadSample();
    void onActionImport();
    void onActionReset();

    // Слоты движка
    void onStateChanged();
    void onError(QString msg);
    void onInvalidInput(QString msg);

private:
    void setupUi();
    QWidget *createAnalyticsPanel();
    QWidget *createProcessPanel();
    void reportImport(const BioEngine::ImportSummary &summary, const QString &source);

    BioEngine::ConversionEngine *m_engine{nullptr};

    BioGui::MetricIndicatorWidget *m_totalWaste{nullptr};
    BioGui::MetricIndicatorWidget *m_bricks{nullptr};
    BioGui::MetricIndicatorWidget *m_volume{nullptr};
    BioGui::MetricIndicatorWidget *m_area{nullptr};
    QProgressBar *m_percentBar{nullptr};
    QLabel *m_percentLabel{nullptr};

    BioGui::CompositionWidget *m_compositionWidget{nullptr};
    BioGui::SettingsWidget *m_settingsWidget{nullptr};
};
