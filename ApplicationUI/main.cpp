#ifdef _WIN32
extern "C" {
// For NVIDIA Optimus
__declspec(dllexport) unsigned long NvOptimusEnablement = 0x00000001;

// For AMD Switchable Graphics
__declspec(dllexport) int AmdPowerXpressRequestHighPerformance = 1;
}
#endif

#include <Config.hpp>
#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QMessageBox>
#include <cstdlib>
#include <exception>
#include <memory>

#include "MainWindow.hpp"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("Parcel3D");

    QCommandLineParser parser;
    parser.setApplicationDescription("Extruded 3D viewer for GeoJSON land parcels.");
    parser.addHelpOption();

    const QCommandLineOption queryOption({"q", "query"},
                                         "Picking backend: cpu or embree.",
                                         "name",
                                         QString::fromUtf8(config::kDefaultSceneQuery));
    const QCommandLineOption highlightOption({"H", "highlight"},
                                             "Parcel ids to highlight, comma separated.",
                                             "ids");
    parser.addOption(queryOption);
    parser.addOption(highlightOption);
    parser.addPositionalArgument("file", "GeoJSON FeatureCollection to open.", "[file]");
    parser.process(app);

    std::unique_ptr<MainWindow> win;
    try
    {
        win = std::make_unique<MainWindow>(parser.value(queryOption).toStdString());
    }
    catch (const std::exception& e)
    {
        QMessageBox::critical(nullptr, "Parcel3D", QString::fromUtf8(e.what()));
        return EXIT_FAILURE;
    }

    if (parser.isSet(highlightOption))
        win->setHighlightText(parser.value(highlightOption));

    const QStringList files = parser.positionalArguments();
    if (!files.isEmpty())
    {
        QString error;
        if (!win->openGeoJson(files.front(), &error))
            qWarning() << "Could not open" << files.front() << ":" << error;
    }

    win->show();
    return app.exec();
}
