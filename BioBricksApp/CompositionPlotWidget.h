#ifndef COMPOSITIONPLOTWIDGET_H
#define COMPOSITIONPLOTWIDGET_H

#include <QColor>
#include <QVector>
#include "BioEngine.h"
#include "qcustomplot.h"

class CompositionPlotWidget : public QCustomPlot
{
    Q_OBJECT
public:
    explicit CompositionPlotWidget(QWidget *parent = nullptr);

    // Настройка внешнего вида (оси, сетка)
    void setupUi();

    // Перерисовать столбцы. Цвет столбца = его индекс в реестре,
    // поэтому цвета не "прыгают" при изменении значений.
    void setComposition(const QVector<BioEngine::MaterialEntry> &entries, double total);

    static QColor entryColor(int index);
};

#endif // COMPOSITIONPLOTWIDGET_H
