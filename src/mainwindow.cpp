#include "mainwindow.hpp"
#include <QCheckBox>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QStatusBar>
#include <QVBoxLayout>

namespace {

const Command kPanelCommands[] = {
    Command::Initialize,
    Command::BlockForClient,
    Command::UnblockForClient,
    Command::BlockChamber,
    Command::UnblockChamber,
    Command::PartitionUp,
    Command::PartitionDown
};

QString yesNo(bool value) {
    return value ? "yes" : "no";
}

}  // namespace

MainWindow::MainWindow(CommandInbox& inbox, SimulatedChamber* simulation, QWidget* parent)
    : QMainWindow(parent),
      startupPage(new QWidget(this)),
      controlPage(new QWidget(this)),
      stackedWidget(new QStackedWidget(this)),
      inbox(inbox),
      simulation(simulation)
{
    setupStartupPage();
    setupControlPage();

    stackedWidget->addWidget(startupPage);
    stackedWidget->addWidget(controlPage);
    setCentralWidget(stackedWidget);
}

void MainWindow::setupStartupPage() {
    auto layout = new QVBoxLayout();
    auto label = new QLabel("Waiting for the first control cycle...", startupPage);
    label->setAlignment(Qt::AlignCenter);
    layout->addWidget(label);
    startupPage->setLayout(layout);
}

void MainWindow::setupControlPage() {
    auto layout = new QVBoxLayout();

    statusLabel = new QLabel("Device: Uninitialized", controlPage);
    stateLabel = new QLabel("Chamber State: Unknown", controlPage);
    sensorLabel = new QLabel(controlPage);
    statusLabel->setAlignment(Qt::AlignCenter);
    stateLabel->setAlignment(Qt::AlignCenter);
    sensorLabel->setAlignment(Qt::AlignCenter);

    layout->addWidget(statusLabel);
    layout->addWidget(stateLabel);
    layout->addWidget(sensorLabel);

    maintenanceButton = new QPushButton("MAINTENANCE: OFF", controlPage);
    maintenanceButton->setStyleSheet("background-color: green; color: white; font-weight: bold;");
    connect(maintenanceButton, &QPushButton::clicked, this, &MainWindow::onMaintenanceToggled);
    layout->addWidget(maintenanceButton);

    QGridLayout* grid = new QGridLayout();
    int i = 0;
    for (Command command : kPanelCommands) {
        QPushButton* btn = new QPushButton(toString(command), controlPage);
        btn->setStyleSheet("background-color: lightgreen; color: black;");
        connect(btn, &QPushButton::clicked, this, &MainWindow::onCommandButtonPressed);
        commandButtons.append(btn);
        grid->addWidget(btn, i / 3, i % 3);
        ++i;
    }
    layout->addLayout(grid);

    if (simulation) {
        auto simRow = new QHBoxLayout();
        auto openGate = new QPushButton("Client: open gate", controlPage);
        auto closeGate = new QPushButton("Client: close gate", controlPage);
        auto fault = new QPushButton("Inject motor fault", controlPage);
        connect(openGate, &QPushButton::clicked, simulation, [this] { simulation->setGateOpen(true); });
        connect(closeGate, &QPushButton::clicked, simulation, [this] { simulation->setGateOpen(false); });
        connect(fault, &QPushButton::clicked, simulation, &SimulatedChamber::injectMotorFault);
        simRow->addWidget(openGate);
        simRow->addWidget(closeGate);
        simRow->addWidget(fault);
        layout->addLayout(simRow);

        auto presenceRow = new QHBoxLayout();
        auto product = new QCheckBox("Product in chamber", controlPage);
        auto sauce = new QCheckBox("Sauce in chamber", controlPage);
        connect(product, &QCheckBox::toggled, simulation,
                [this](bool present) { simulation->setProductPresent(1, present); });
        connect(sauce, &QCheckBox::toggled, simulation,
                [this](bool present) { simulation->setSaucePresent(1, present); });
        presenceRow->addWidget(product);
        presenceRow->addWidget(sauce);
        layout->addLayout(presenceRow);
    }

    controlPage->setLayout(layout);
}

void MainWindow::switchToControlPage() {
    stackedWidget->setCurrentWidget(controlPage);
}

void MainWindow::submit(Command command) {
    switch (inbox.submit(command)) {
        case CommandInbox::SubmitResult::Accepted:
            statusBar()->showMessage(toString(command) + " submitted");
            break;
        case CommandInbox::SubmitResult::AlreadyPending:
            statusBar()->showMessage(toString(command) + " already in progress");
            break;
        case CommandInbox::SubmitResult::Unknown:
            break;
    }
}

void MainWindow::onMaintenanceToggled() {
    submit(maintenance ? Command::MaintenanceDisable : Command::MaintenanceEnable);
}

void MainWindow::onCommandButtonPressed() {
    QPushButton* senderBtn = qobject_cast<QPushButton*>(sender());
    if (!senderBtn) return;

    const std::optional<Command> command = commandFromName(senderBtn->text());
    if (command)
        submit(*command);
}

void MainWindow::updateChamberStatus(const ChamberStatus& status) {
    maintenance = isMaintenanceState(status.state);
    maintenanceButton->setText(maintenance ? "MAINTENANCE: ON" : "MAINTENANCE: OFF");
    maintenanceButton->setStyleSheet(maintenance
        ? "background-color: red; color: white; font-weight: bold;"
        : "background-color: green; color: white; font-weight: bold;");
    for (auto* b : commandButtons)
        b->setEnabled(!maintenance);

    statusLabel->setText("Device: " + toString(status.status));
    stateLabel->setText("Chamber State: " + toString(status.state));
    sensorLabel->setText(QString("gate open: %1 | partition up: %2 | partition down: %3 | lock: %4 | product: %5 | motor fault: %6")
        .arg(yesNo(status.chamberOpen),
             yesNo(status.partitionUp),
             yesNo(status.partitionDown),
             status.nominalLock ? toString(*status.nominalLock) : QString("-"),
             yesNo(status.productPresent),
             yesNo(status.motorFault)));

    if (stackedWidget->currentWidget() == startupPage)
        switchToControlPage();
}

void MainWindow::showFault(FaultKind kind, const QString& message) {
    statusBar()->showMessage(toString(kind) + ": " + message, 10000);
}

void MainWindow::showCommandResult(const CommandResult& result) {
    statusBar()->showMessage(toString(result.command) + " -> " + toString(result.outcome)
                             + (result.message.isEmpty() ? QString() : ": " + result.message));
}
