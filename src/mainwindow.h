#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "appcontext.h"

#include <QLabel>
#include <QList>
#include <QMainWindow>
#include <QUrl>

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const WindowConfig &config, const QUrl &serverUrl, QWidget *parent = nullptr);
    ~MainWindow();

    // With a tray icon present, closing the window only hides it.
    void setHideOnClose(bool hide) { hideOnClose_ = hide; }
    bool hideOnClose() const { return hideOnClose_; }

public slots:
    void showDeepLinks(const QList<QUrl> &urls);

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    void createUi(const QUrl &serverUrl);

    bool hideOnClose_ = false;

    QLabel *serverLabel_;
    QLabel *linkLabel_;
};

#endif // MAINWINDOW_H
