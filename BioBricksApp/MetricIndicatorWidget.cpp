#include "MetricIndicatorWidget.h"
#include <QHBoxLayout>
#include <QLabel>
#include <QVBoxLayout>

namespace BioGui {

MetricIndicatorWidget::MetricIndicatorWidget(const QString &title,
                                             const QString &unit,
                                             int precision,
                                             QWidget *parent)
    : QWidget(parent)
    , m_precision(precision)
{
    QVBoxLayout *mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(0);

    // 1. ШАПКА
    m_headerLabel = new QLabel(title);
    m_headerLabel->setAlignment(Qt::AlignCenter);
    m_headerLabel->setFixedHeight(26);
    m_headerLabel->setStyleSheet(
        "background-color: #00695c;"
        "color: #ffffff;"
        "font-size: 12px;"
        "border: 1px solid #004d40;"
        "border-bottom: none;"
    );
    mainLayout->addWidget(m_headerLabel);

    // 2. ТЕЛО
    QWidget *bodyWidget = new QWidget();
    QHBoxLayout *bodyLayout = new QHBoxLayout(bodyWidget);
    bodyLayout->setContentsMargins(0, 0, 0, 0);
    bodyLayout->setSpacing(0);

        m_indicator = new QLabel();
        m_indicator->setAlignment(Qt::AlignCenter);
        m_indicator->setStyleSheet(
            "QLabel {"
            "   background-color: #001f1f;"
            "   color: #64ffda;"
            "   font-size: 26px;"
            "   font-weight: bold;"
            "   border-left: 1px solid #004d40;"
            "   border-bottom: 1px solid #004d40;"
            "}"
        );
        bodyLayout->addWidget(m_indicator, 1);

        m_unitLabel = new QLabel(unit);
        m_unitLabel->setFixedWidth(50);
        m_unitLabel->setAlignment(Qt::AlignCenter);
        m_unitLabel->setStyleSheet(
            "background-color: #001f1f;"
            "color: #b2dfdb;"
            "font-weight: bold;"
            "border-right: 1px solid #004d40;"
            "border-bottom: 1px solid #004d40;"
        );
        bodyLayout->addWidget(m_unitLabel, 0);

    mainLayout->addWidget(bodyWidget, 1);

    updateDisplay();
}

void MetricIndicatorWidget::setValue(double value) {
    m_currentValue = value;
    updateDisplay();
}

void MetricIndicatorWidget::setPrecision(int precision) {
    if (precision < 0) return;
    m_precision = precision;
    updateDisplay();
}

void MetricIndicatorWidget::setText(const QString &text) {
    m_indicator->setText(text);
}

void MetricIndicatorWidget::updateDisplay() {
    m_indicator->setText(QString::number(m_currentValue, 'f', m_precision));
}

} // namespace BioGui
