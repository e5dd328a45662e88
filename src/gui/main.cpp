#include "tabs/ConvertTab.h"
#include "src/utils/Definitions.h"

#include <QApplication>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName(QString::fromStdString(Definitions::APP_TITLE));

    ConvertTab window;
    window.setWindowTitle(QString::fromStdString(Definitions::APP_TITLE));
    window.resize(560, 520);
    window.show();

    return app.exec();
}
