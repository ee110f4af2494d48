#include "MainWindow.h"
#include <QApplication>
#include <QFileDialog>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>
#include <QStyle>
#include <QToolBar>
#include <QVBoxLayout>
#include "BioImport.h"

using namespace BioEngine;

MainWindow::MainWindow(ConversionEngine *engine, QWidget *parent)
    : QMainWindow(parent)
    , m_engine(engine)
{
    connect(m_engine, &ConversionEngine::stateChanged, this, &MainWindow::onStateChanged);
    connect(m_engine, &ConversionEngine::errorOccurred, this, &MainWindow::onError);

    setupUi();
    onStateChanged(); // Исходное состояние

    resize(1000, 760);
    setWindowTitle("Smart Bio Bricks");
}

MainWindow::~MainWindow() {}

void MainWindow::setupUi()
{
    // --- Menu Bar ---
    QMenu *fileMenu = menuBar()->addMenu("File");
    QAction *actSample = fileMenu->addAction("Load sample data",
                                             this,
                                             &MainWindow::onActionLoadSample);
    actSample->setIcon(style()->standardIcon(QStyle::SP_DialogOpenButton));
    fileMenu->addAction("Import JSON...", this, &MainWindow::onActionImport, QKeySequence::Open);
    QAction *actReset = fileMenu->addAction("Reset to defaults", this, &MainWindow::onActionReset);
    actReset->setIcon(style()->standardIcon(QStyle::SP_BrowserReload));
    fileMenu->addSeparator();
    fileMenu->addAction("Exit", qApp, &QApplication::quit);

    QToolBar *toolBar = addToolBar("Main");
    toolBar->setMovable(false);
    toolBar->addAction(actSample);
    toolBar->addAction(actReset);

    auto *central = new QWidget(this);
    setCentralWidget(central);
    auto *mainLayout = new QHBoxLayout(central);

    // --- Левая колонка: аналитика, полигон, настройки ---
    auto *leftLayout = new QVBoxLayout();
    leftLayout->addWidget(createAnalyticsPanel());

    auto *settingsBox = new QGroupBox("Brick && Landfill settings", this);
    auto *settingsLayout = new QVBoxLayout(settingsBox);
    m_settingsWidget = new BioGui::SettingsWidget(m_engine, this);
    settingsLayout->addWidget(m_settingsWidget);
    leftLayout->addWidget(settingsBox);

    leftLayout->addWidget(createProcessPanel());
    leftLayout->addStretch();
    mainLayout->addLayout(leftLayout, 1);

    // --- Правая колонка: состав ---
    auto *compositionBox = new QGroupBox("Composition (double-click to edit)", this);
    auto *compositionLayout = new QVBoxLayout(compositionBox);
    m_compositionWidget = new BioGui::CompositionWidget(m_engine, this);
    compositionLayout->addWidget(m_compositionWidget);
    mainLayout->addWidget(compositionBox, 1);

    connect(m_compositionWidget,
            &BioGui::CompositionWidget::invalidInput,
            this,
            &MainWindow::onInvalidInput);
    connect(m_settingsWidget,
            &BioGui::SettingsWidget::invalidInput,
            this,
            &MainWindow::onInvalidInput);
}

QWidget *MainWindow::createAnalyticsPanel()
{
    auto *box = new QGroupBox("Realtime Analytics", this);
    auto *grid = new QGridLayout(box);

    m_totalWaste = new BioGui::MetricIndicatorWidget("Total available waste", "kg", 2, this);
    m_bricks = new BioGui::MetricIndicatorWidget("Bricks producible", "pcs", 0, this);
    m_volume = new BioGui::MetricIndicatorWidget("Volume diverted", "m³", 4, this);
    m_area = new BioGui::MetricIndicatorWidget("Area reduced", "m²", 3, this);

    grid->addWidget(m_totalWaste, 0, 0);
    grid->addWidget(m_bricks, 0, 1);
    grid->addWidget(m_volume, 1, 0);
    grid->addWidget(m_area, 1, 1);

    // Процент уменьшения полигона
    m_percentBar = new QProgressBar(this);
    m_percentBar->setRange(0, 10000); // сотые доли процента
    m_percentBar->setTextVisible(false);
    m_percentLabel = new QLabel(this);

    grid->addWidget(new QLabel("Landfill reduction", this), 2, 0, 1, 2);
    grid->addWidget(m_percentBar, 3, 0, 1, 2);
    grid->addWidget(m_percentLabel, 4, 0, 1, 2);

    return box;
}

QWidget *MainWindow::createProcessPanel()
{
    auto *box = new QGroupBox("Process steps", this);
    auto *layout = new QVBoxLayout(box);

    const char *steps[]{
        "Dehumidifying: removes moisture",
        "Grinding: uniform fine mix",
        "Molding: compact shaping",
        "Drying: set and harden bricks",
    };

    int n{1};
    for (const char *step : steps) {
        auto *lbl = new QLabel(QString("%1. %2").arg(n++).arg(step), this);
        layout->addWidget(lbl);
    }
    return box;
}

void MainWindow::onStateChanged()
{
    m_totalWaste->setValue(m_engine->totalAvailableWaste());
    m_bricks->setText(QString::number(m_engine->bricksProducible()));
    m_volume->setValue(m_engine->volumeDiverted());
    m_area->setValue(m_engine->areaReduced());

    const double percent = m_engine->percentLandfillReduced();
    m_percentBar->setValue(qRound(percent * 100.0));
    m_percentLabel->setText(QString("%1% of landfill area reduced").arg(percent, 0, 'f', 2));
}

void MainWindow::onError(QString msg)
{
    statusBar()->showMessage("Error: " + msg, 5000);
}

void MainWindow::onInvalidInput(QString msg)
{
    statusBar()->showMessage(msg, 3000);
}

void MainWindow::reportImport(const ImportSummary &summary, const QString &source)
{
    QString msg = QString("%1 loaded: %2 updated").arg(source).arg(summary.applied);
    if (summary.unmatched > 0)
        msg += QString(", %1 unknown").arg(summary.unmatched);
    if (summary.malformed > 0)
        msg += QString(", %1 invalid").arg(summary.malformed);
    statusBar()->showMessage(msg, 4000);
}

void MainWindow::onActionLoadSample()
{
    ImportSummary summary{};
    if (m_engine->importFile(SAMPLE_DATA_PATH, &summary))
        reportImport(summary, "Sample data");
}

void MainWindow::onActionImport()
{
    QString fileName = QFileDialog::getOpenFileName(this, "Import Quantities", "", "JSON Files (*.json)");
    if (fileName.isEmpty())
        return;

    ImportSummary summary{};
    if (m_engine->importFile(fileName, &summary)) {
        reportImport(summary, fileName);
    } else {
        QMessageBox::warning(this, "Import", "Could not import " + fileName);
    }
}

void MainWindow::onActionReset()
{
    m_engine->resetToDefaults();
    statusBar()->showMessage("Defaults restored", 3000);
}
