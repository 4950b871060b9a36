#include "mainwindow.h"
#include <QCloseEvent>
#include <QStringList>
#include <QVBoxLayout>

MainWindow::MainWindow(const WindowConfig &config, const QUrl &serverUrl, QWidget *parent)
    : QMainWindow(parent)
{
    createUi(serverUrl);
    setWindowTitle(config.title);
    if (config.size.isValid())
        resize(config.size);
}

MainWindow::~MainWindow()
{
}

void MainWindow::createUi(const QUrl &serverUrl)
{
    QWidget *centralWidget = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout(centralWidget);

    serverLabel_ = new QLabel(QString("Server: %1").arg(serverUrl.toString()), this);
    linkLabel_ = new QLabel("Last link: --", this);

    layout->addWidget(serverLabel_);
    layout->addWidget(linkLabel_);
    layout->addStretch();

    setCentralWidget(centralWidget);
}

void MainWindow::showDeepLinks(const QList<QUrl> &urls)
{
    QStringList text;
    for (const QUrl &url : urls)
        text << url.toString();
    linkLabel_->setText(QString("Last link: %1").arg(text.join(", ")));
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (hideOnClose_) {
        hide();
        event->ignore();
        return;
    }
    QMainWindow::closeEvent(event);
}
