#include "mainwindow.h"
#include <QApplication>

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    QApplication::setApplicationName("BionicReaderQt");
    QApplication::setOrganizationName("BionicReaderQt");

    MainWindow w;
    w.show();
    return QApplication::exec();
}
