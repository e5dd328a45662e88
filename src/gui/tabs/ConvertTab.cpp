#include "ConvertTab.h"
#include "windows/LogWindow.h"
#include "src/utils/Definitions.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QButtonGroup>
#include <QLineEdit>
#include <QPushButton>
#include <QCheckBox>
#include <QRadioButton>
#include <QSpinBox>
#include <QLabel>
#include <QMessageBox>
#include <QFileDialog>
#include <QDir>
#include <QFileInfo>
#include <QGraphicsDropShadowEffect>
#include <QDebug>

namespace def = Definitions;
using WebpConvert::ConversionRequest;
using WebpConvert::NamingPolicy;
using WebpConvert::TargetFormat;

ConvertTab::ConvertTab(QWidget *parent)
    : QWidget(parent), m_worker(nullptr), m_logWindow(new LogWindow(this))
{
    setupUi();
    updateOptionStates();
}

ConvertTab::~ConvertTab()
{
    // No cancellation: let a running conversion finish before the widgets go away
    if (m_worker && m_worker->isRunning()) {
        m_worker->wait();
    }
}

void ConvertTab::setupUi()
{
    QVBoxLayout *mainLayout = new QVBoxLayout(this);

    // --- Folders Group ---
    QGroupBox *folderGroup = new QGroupBox("Folders");
    QFormLayout *folderLayout = new QFormLayout(folderGroup);

    QHBoxLayout *hInput = new QHBoxLayout();
    m_inputPath = new QLineEdit();
    QPushButton *btnInput = new QPushButton("Browse...");
    connect(btnInput, &QPushButton::clicked, this, &ConvertTab::browseInput);
    applyShadowEffect(btnInput);
    hInput->addWidget(m_inputPath);
    hInput->addWidget(btnInput);
    folderLayout->addRow("Input Folder:", hInput);

    QHBoxLayout *hOutput = new QHBoxLayout();
    m_outputPath = new QLineEdit();
    m_outputPath->setPlaceholderText("Leave empty to write next to the originals");
    QPushButton *btnOutput = new QPushButton("Browse...");
    connect(btnOutput, &QPushButton::clicked, this, &ConvertTab::browseOutput);
    applyShadowEffect(btnOutput);
    hOutput->addWidget(m_outputPath);
    hOutput->addWidget(btnOutput);
    folderLayout->addRow("Output Folder:", hOutput);

    mainLayout->addWidget(folderGroup);

    // --- Settings Group ---
    QGroupBox *settingsGroup = new QGroupBox("Convert Settings");
    QFormLayout *settingsLayout = new QFormLayout(settingsGroup);

    QVBoxLayout *vFormat = new QVBoxLayout();
    m_pngRadio = new QRadioButton("PNG (preserve transparency)");
    m_jpegRadio = new QRadioButton("JPEG (no transparency)");
    m_pngRadio->setChecked(true);
    QButtonGroup *formatGroup = new QButtonGroup(this);
    formatGroup->addButton(m_pngRadio);
    formatGroup->addButton(m_jpegRadio);
    m_transparencyCheckbox = new QCheckBox("Keep alpha channel");
    m_transparencyCheckbox->setChecked(true);
    vFormat->addWidget(m_pngRadio);
    vFormat->addWidget(m_transparencyCheckbox);
    vFormat->addWidget(m_jpegRadio);
    settingsLayout->addRow("Output Format:", vFormat);

    QVBoxLayout *vNaming = new QVBoxLayout();
    m_sequentialRadio = new QRadioButton(
        QString("Sequential (%1_001, ...)").arg(QString::fromStdString(def::DEFAULT_PREFIX)));
    m_keepNamesRadio = new QRadioButton("Keep original filenames");
    m_sequentialRadio->setChecked(true);
    QButtonGroup *namingGroup = new QButtonGroup(this);
    namingGroup->addButton(m_sequentialRadio);
    namingGroup->addButton(m_keepNamesRadio);
    vNaming->addWidget(m_sequentialRadio);
    vNaming->addWidget(m_keepNamesRadio);
    settingsLayout->addRow("Renaming:", vNaming);

    m_prefix = new QLineEdit(QString::fromStdString(def::DEFAULT_PREFIX));
    m_prefix->setMaximumWidth(160);
    settingsLayout->addRow("Prefix:", m_prefix);

    m_startNumber = new QSpinBox();
    m_startNumber->setRange(0, 999999);
    m_startNumber->setValue(def::DEFAULT_START_NUMBER);
    m_startNumber->setMaximumWidth(100);
    settingsLayout->addRow("Start Number:", m_startNumber);

    m_deleteCheckbox = new QCheckBox("Delete original files after conversion");
    m_deleteCheckbox->setChecked(false);
    settingsLayout->addRow(m_deleteCheckbox);

    connect(m_pngRadio, &QRadioButton::toggled, this, &ConvertTab::updateOptionStates);
    connect(m_sequentialRadio, &QRadioButton::toggled, this, &ConvertTab::updateOptionStates);

    mainLayout->addWidget(settingsGroup);
    mainLayout->addStretch(1);

    // --- Buttons ---
    QHBoxLayout *buttonLayout = new QHBoxLayout();

    m_runButton = new QPushButton("Start Conversion");
    m_runButton->setStyleSheet(R"(
        QPushButton {
            background: qlineargradient(x1:0, y1:0, x2:0, y2:1,
                stop:0 #667eea, stop:1 #764ba2);
            color: white; font-weight: bold; font-size: 16px;
            padding: 12px; border-radius: 8px; min-height: 40px;
        }
        QPushButton:hover { background: qlineargradient(x1:0, y1:0, x2:0, y2:1,
            stop:0 #764ba2, stop:1 #667eea); }
        QPushButton:disabled { background: #555; }
    )");
    applyShadowEffect(m_runButton);
    connect(m_runButton, &QPushButton::clicked, this, &ConvertTab::startConversion);

    m_logButton = new QPushButton("Show Log");
    applyShadowEffect(m_logButton);
    connect(m_logButton, &QPushButton::clicked, this, &ConvertTab::showLog);

    buttonLayout->addWidget(m_runButton, 1);
    buttonLayout->addWidget(m_logButton);
    mainLayout->addLayout(buttonLayout);

    m_statusLabel = new QLabel("");
    m_statusLabel->setAlignment(Qt::AlignCenter);
    m_statusLabel->setStyleSheet("color: #3366cc; padding: 8px;");
    mainLayout->addWidget(m_statusLabel);
}

void ConvertTab::updateOptionStates()
{
    m_transparencyCheckbox->setEnabled(m_pngRadio->isChecked());
    m_prefix->setEnabled(m_sequentialRadio->isChecked());
    m_startNumber->setEnabled(m_sequentialRadio->isChecked());
}

void ConvertTab::browseInput()
{
    QString directory = QFileDialog::getExistingDirectory(this, "Select input folder", QDir::currentPath());
    if (!directory.isEmpty()) {
        m_inputPath->setText(directory);
    }
}

void ConvertTab::browseOutput()
{
    QString start = m_inputPath->text().trimmed().isEmpty() ? QDir::currentPath() : m_inputPath->text().trimmed();
    QString directory = QFileDialog::getExistingDirectory(this, "Select output folder", start);
    if (!directory.isEmpty()) {
        m_outputPath->setText(directory);
    }
}

bool ConvertTab::isValid() const
{
    QString path = m_inputPath->text().trimmed();
    return !path.isEmpty() && QFileInfo(path).isDir();
}

void ConvertTab::setRunning(bool running)
{
    m_runButton->setEnabled(!running);
    m_runButton->setText(running ? "Converting..." : "Start Conversion");
}

ConversionRequest ConvertTab::collect() const
{
    ConversionRequest request;
    request.sourceFolder = m_inputPath->text().trimmed().toStdString();
    request.destinationFolder = m_outputPath->text().trimmed().toStdString();
    request.targetFormat = m_jpegRadio->isChecked() ? TargetFormat::JPEG : TargetFormat::PNG;
    request.preserveTransparency = m_transparencyCheckbox->isChecked();
    request.namingPolicy = m_keepNamesRadio->isChecked() ? NamingPolicy::KEEP_ORIGINAL_NAME
                                                          : NamingPolicy::SEQUENTIAL_NUMBERING;
    request.deleteOriginalsOnSuccess = m_deleteCheckbox->isChecked();

    QString prefix = m_prefix->text().trimmed();
    request.prefix = prefix.isEmpty() ? def::DEFAULT_PREFIX : prefix.toStdString();
    request.startNumber = m_startNumber->value();
    return request;
}

void ConvertTab::startConversion()
{
    if (!isValid()) {
        QMessageBox::warning(this, "Invalid Input", "Please select an existing input folder.");
        return;
    }
    if (m_worker) {
        return;
    }

    ConversionRequest request = collect();

    setRunning(true);
    m_statusLabel->setText("Converting...");
    m_logWindow->clearLog();

    m_worker = new ConversionWorker(request);

    connect(m_worker, &ConversionWorker::logMessage, m_logWindow, &LogWindow::appendLog, Qt::QueuedConnection);
    connect(m_worker, &ConversionWorker::conversionDone, this, &ConvertTab::onConversionDone, Qt::QueuedConnection);
    connect(m_worker, &ConversionWorker::error, this, &ConvertTab::onConversionError, Qt::QueuedConnection);
    connect(m_worker, &QThread::finished, m_worker, &QObject::deleteLater);

    m_worker->start();
}

void ConvertTab::showLog()
{
    m_logWindow->show();
    m_logWindow->raise();
}

void ConvertTab::onConversionDone(int converted, int skipped, int failed, const QString &report)
{
    setRunning(false);
    m_statusLabel->setText(QString("Conversion complete! %1 converted, %2 skipped, %3 failed.")
                               .arg(converted).arg(skipped).arg(failed));
    m_worker = nullptr;

    if (failed > 0) {
        QMessageBox::warning(this, "Conversion finished with errors", report);
    } else {
        QMessageBox::information(this, "Success", report);
    }
}

void ConvertTab::onConversionError(const QString &msg)
{
    setRunning(false);
    m_statusLabel->setText("Conversion failed.");
    m_worker = nullptr;
    qWarning() << "Conversion aborted:" << msg;
    QMessageBox::critical(this, "Error", msg);
}

void ConvertTab::applyShadowEffect(QWidget* widget, const QString& colorHex, int radius, int xOffset, int yOffset)
{
    QGraphicsDropShadowEffect *effect = new QGraphicsDropShadowEffect();
    effect->setColor(QColor(colorHex));
    effect->setBlurRadius(radius);
    effect->setXOffset(xOffset);
    effect->setYOffset(yOffset);
    widget->setGraphicsEffect(effect);
}
