#pragma once
#include <QWidget>

class QLabel;

namespace BioGui {

// Плитка "заголовок / значение / единица"
class MetricIndicatorWidget : public QWidget
{
    Q_OBJECT

public:
    explicit MetricIndicatorWidget(const QString &title,
                                   const QString &unit,
                                   int precision = 2,
                                   QWidget *parent = nullptr);

    void setValue(double value);

    // Количество знаков после запятой
    void setPrecision(int precision);

    // Произвольный текст (например счетчик кирпичей без дробной части)
    void setText(const QString &text);

private:
    void updateDisplay();

    QLabel *m_headerLabel{nullptr};
    QLabel *m_indicator{nullptr};
    QLabel *m_unitLabel{nullptr};

    int m_precision{2};
    double m_currentValue{0.0};
};

} // namespace BioGui
