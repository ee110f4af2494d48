#pragma once

#include <QAbstractTableModel>
#include <QStyledItemDelegate>
#include <QTableView>
#include <QWidget>
#include "BioEngine.h"

class CompositionPlotWidget;

namespace BioGui {

class CompositionTableModel : public QAbstractTableModel
{
    Q_OBJECT
public:
    enum Columns {
        Col_Label = 0,
        Col_Quantity, // кг, редактируемая
        Col_Share,    // % от общей массы
        Col_Count
    };

    explicit CompositionTableModel(BioEngine::ConversionEngine *engine, QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    bool setData(const QModelIndex &index, const QVariant &value, int role = Qt::EditRole) override;
    QVariant headerData(int section,
                        Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;

signals:
    void invalidInput(QString msg);

public slots:
    void onStateChanged();

private:
    BioEngine::ConversionEngine *m_engine;
};

// Редактор массы: QLineEdit, разбор текста в setModelData
class QuantityDelegate : public QStyledItemDelegate
{
    Q_OBJECT
public:
    explicit QuantityDelegate(QObject *parent = nullptr);

    QWidget *createEditor(QWidget *parent,
                          const QStyleOptionViewItem &option,
                          const QModelIndex &index) const override;
    void setEditorData(QWidget *editor, const QModelIndex &index) const override;
    void setModelData(QWidget *editor,
                      QAbstractItemModel *model,
                      const QModelIndex &index) const override;
};

class CompositionWidget : public QWidget
{
    Q_OBJECT
public:
    explicit CompositionWidget(BioEngine::ConversionEngine *engine, QWidget *parent = nullptr);

signals:
    void invalidInput(QString msg);

private slots:
    void refreshPlot();

private:
    BioEngine::ConversionEngine *m_engine{nullptr};
    CompositionTableModel *m_model{nullptr};
    QTableView *m_view{nullptr};
    CompositionPlotWidget *m_plot{nullptr};
};

} // namespace BioGui
