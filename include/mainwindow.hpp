/*
* Operator panel: chamber state and sensors, one button per command,
* maintenance toggle and (when simulating) client-side gate controls.
*/

#pragma once
#include <QLabel>
#include <QMainWindow>
#include <QPushButton>
#include <QStackedWidget>
#include <QVector>
#include "command_inbox.hpp"
#include "simulated_chamber.hpp"

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(CommandInbox& inbox, SimulatedChamber* simulation, QWidget* parent = nullptr);

public slots:
    void updateChamberStatus(const ChamberStatus& status);
    void showFault(FaultKind kind, const QString& message);
    void showCommandResult(const CommandResult& result);

private slots:
    void onMaintenanceToggled();
    void onCommandButtonPressed();

private:
    void setupStartupPage();
    void setupControlPage();
    void switchToControlPage();
    void submit(Command command);

    QWidget* startupPage;
    QWidget* controlPage;

    QLabel* statusLabel;
    QLabel* stateLabel;
    QLabel* sensorLabel;
    QPushButton* maintenanceButton;
    QVector<QPushButton*> commandButtons;
    QStackedWidget* stackedWidget;

    CommandInbox& inbox;
    SimulatedChamber* simulation;
    bool maintenance = false;
};
