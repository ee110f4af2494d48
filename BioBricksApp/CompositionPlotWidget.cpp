#include "CompositionPlotWidget.h"

CompositionPlotWidget::CompositionPlotWidget(QWidget *parent)
    : QCustomPlot(parent)
{
    setupUi();
}

QColor CompositionPlotWidget::entryColor(int index)
{
    static const QVector<QColor> palette{
        QColor(105, 240, 174), // green
        QColor(255, 171, 64),  // orange
        QColor(68, 138, 255),  // blue
        QColor(255, 64, 129),  // pink
        QColor(255, 255, 0),   // yellow
        QColor(24, 255, 255),  // cyan
        QColor(238, 255, 65),  // lime
    };
    if (index < 0)
        return Qt::gray;
    return palette[index % palette.size()];
}

void CompositionPlotWidget::setupUi()
{
    this->yAxis->setLabel("Quantity [kg]");
    this->xAxis->grid()->setVisible(false);
    this->yAxis->grid()->setVisible(true);

    this->xAxis->setTickLabelRotation(30);
    this->xAxis->setSubTicks(false);
    this->xAxis->setTickLength(0, 4);
}

void CompositionPlotWidget::setComposition(const QVector<BioEngine::MaterialEntry> &entries,
                                           double total)
{
    this->clearPlottables();
    this->clearItems();

    QSharedPointer<QCPAxisTickerText> ticker(new QCPAxisTickerText);
    double maxQty{0.0};

    for (int i = 0; i < entries.size(); ++i) {
        const auto &e = entries[i];
        const double key = i + 1;

        // Отдельный QCPBars на категорию, чтобы у каждой был свой цвет
        auto *bars = new QCPBars(this->xAxis, this->yAxis);
        bars->setName(e.label);
        bars->setWidth(0.6);
        bars->setPen(QPen(entryColor(i).darker(130)));
        bars->setBrush(entryColor(i));
        bars->addData(key, e.quantity);

        ticker->addTick(key, e.label);
        maxQty = qMax(maxQty, e.quantity);

        // Доля в процентах над столбцом (только для ненулевых)
        if (e.quantity > 0 && total > 0) {
            auto *label = new QCPItemText(this);
            label->setPositionAlignment(Qt::AlignHCenter | Qt::AlignBottom);
            label->position->setCoords(key, e.quantity);
            label->setText(QString::number(e.quantity / total * 100.0, 'f', 0) + "%");
        }
    }

    this->xAxis->setTicker(ticker);
    this->xAxis->setRange(0, entries.size() + 1);
    // Запас сверху под подписи
    this->yAxis->setRange(0, maxQty > 0 ? maxQty * 1.2 : 1.0);

    this->replot();
}
