#include <QApplication>
#include <QDebug>
#include "BioEngine.h"
#include "BioStore.h"
#include "MainWindow.h"

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    QCoreApplication::setOrganizationName("SmartBioBricks");
    QCoreApplication::setApplicationName("SmartBioBricks");

    // Хранилище и движок живут до конца main()
    BioEngine::SettingsStore store;
    BioEngine::ConversionEngine engine(&store);

    // Нет сохраненных данных / ошибка чтения -> остаются значения по умолчанию
    if (!engine.load())
        qWarning() << "[BioBricks] Starting with defaults, store:" << store.fileName();

    MainWindow w(&engine);
    w.show();

    return a.exec();
}
