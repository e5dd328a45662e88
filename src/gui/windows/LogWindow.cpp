#include "LogWindow.h"

#include <QVBoxLayout>
#include <QTextEdit>
#include <QCloseEvent>

LogWindow::LogWindow(QWidget *parent)
    : QWidget(parent, Qt::Window) // separate top-level window
{
    setWindowTitle("Conversion Log");
    setGeometry(100, 100, 700, 500);

    QVBoxLayout *mainLayout = new QVBoxLayout(this);

    m_logOutput = new QTextEdit;
    m_logOutput->setReadOnly(true);
    m_logOutput->setStyleSheet("background:#1e1e1e; color:#b9bbbe; border:none; font-family: monospace;");

    mainLayout->addWidget(m_logOutput);
}

void LogWindow::appendLog(const QString &text)
{
    m_logOutput->append(text);
}

void LogWindow::clearLog()
{
    m_logOutput->clear();
}

void LogWindow::closeEvent(QCloseEvent *event)
{
    hide();
    event->ignore();
}
