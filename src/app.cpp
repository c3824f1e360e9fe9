#include "app.hpp"
#include "command_server.hpp"
#include "heartbeat.hpp"
#include "interlock_controller.hpp"
#include "mainwindow.hpp"
#include "simulated_chamber.hpp"
#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QLoggingCategory>
#include <QThread>
#include <memory>

namespace {

void registerMetaTypes() {
    qRegisterMetaType<InterlockState>();
    qRegisterMetaType<DeviceStatus>();
    qRegisterMetaType<Command>();
    qRegisterMetaType<FaultKind>();
    qRegisterMetaType<CommandResult>();
    qRegisterMetaType<ChamberStatus>();
}

bool wantsHeadless(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (qstrcmp(argv[i], "--headless") == 0)
            return true;
    }
    return false;
}

}  // namespace

int App::run(int argc, char** argv) {
    // QApplication needs a display; the headless daemon must not.
    std::unique_ptr<QCoreApplication> app;
    if (wantsHeadless(argc, argv))
        app.reset(new QCoreApplication(argc, argv));
    else
        app.reset(new QApplication(argc, argv));

    QCoreApplication::setApplicationName("Chamber Interlock");
    QCoreApplication::setOrganizationName("ChamberControlSystem");
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} %{message}");
    registerMetaTypes();

    QCommandLineParser parser;
    parser.setApplicationDescription("Safety interlock controller for a product-transfer chamber");
    parser.addHelpOption();
    QCommandLineOption configOption({"c", "config"}, "Chamber configuration (JSON).", "file");
    QCommandLineOption portOption({"p", "port"}, "UDP command port (overrides config).", "port");
    QCommandLineOption headlessOption("headless", "Run without the operator panel.");
    QCommandLineOption verboseOption({"v", "verbose"}, "Log every cycle decision.");
    parser.addOption(configOption);
    parser.addOption(portOption);
    parser.addOption(headlessOption);
    parser.addOption(verboseOption);
    parser.process(*app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption) ? "*.debug=true" : "*.debug=false");

    ChamberConfig config;
    try {
        if (parser.isSet(configOption))
            config = ChamberConfig::fromFile(parser.value(configOption));
    } catch (const ConfigError& e) {
        qCritical() << "Configuration error:" << e.what();
        return 1;
    }

    if (parser.isSet(portOption)) {
        bool ok = false;
        const uint port = parser.value(portOption).toUInt(&ok);
        if (ok && port > 0 && port <= 65535)
            config.udpPort = static_cast<quint16>(port);
        else
            qWarning() << "Ignoring invalid --port" << parser.value(portOption);
    }

    SteadyClock clock;
    CommandInbox inbox(clock);
    SimulatedChamber simulation(config);

    // Controller and its heartbeat live on the cycle thread; nothing else calls cycle().
    QThread cycleThread;
    cycleThread.setObjectName("interlock-cycle");

    InterlockController* controller = nullptr;
    try {
        controller = new InterlockController(config, simulation.sensorTable(),
                                             simulation.actuatorTable(), inbox, clock);
    } catch (const std::invalid_argument& e) {
        qCritical() << "Cannot build controller:" << e.what();
        return 1;
    }
    auto heartbeat = new Heartbeat();
    controller->moveToThread(&cycleThread);
    heartbeat->moveToThread(&cycleThread);

    QObject::connect(heartbeat, &Heartbeat::tick, heartbeat, [&simulation] { simulation.advance(); });
    QObject::connect(heartbeat, &Heartbeat::tick, controller, &InterlockController::cycle);
    QObject::connect(heartbeat, &Heartbeat::stopped, controller, &InterlockController::shutdown);
    QObject::connect(&cycleThread, &QThread::started, heartbeat,
                     [heartbeat, &config] { heartbeat->start(config.cyclePeriodMs); });
    QObject::connect(&cycleThread, &QThread::finished, controller, &QObject::deleteLater);
    QObject::connect(&cycleThread, &QThread::finished, heartbeat, &QObject::deleteLater);

    CommandServer server(inbox, *controller);
    if (!server.start(config.udpPort))
        qWarning() << "UDP command endpoint disabled";

    std::unique_ptr<MainWindow> window;
    if (!parser.isSet(headlessOption)) {
        window.reset(new MainWindow(inbox, &simulation));
        window->setWindowTitle("Chamber Interlock - " + config.deviceName);
        window->resize(720, 420);
        QObject::connect(controller, &InterlockController::statusUpdated,
                         window.get(), &MainWindow::updateChamberStatus);
        QObject::connect(controller, &InterlockController::faultRaised,
                         window.get(), &MainWindow::showFault);
        QObject::connect(&inbox, &CommandInbox::commandFinished,
                         window.get(), &MainWindow::showCommandResult);
        window->show();
    }

    qInfo() << "Chamber" << config.deviceName << "starting, cycle period" << config.cyclePeriodMs << "ms";
    cycleThread.start();

    const int rc = app->exec();

    QMetaObject::invokeMethod(heartbeat, "stop", Qt::BlockingQueuedConnection);
    cycleThread.quit();
    cycleThread.wait();
    server.stop();
    return rc;
}
