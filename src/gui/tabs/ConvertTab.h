#ifndef CONVERT_TAB_H
#define CONVERT_TAB_H

#include <QWidget>
#include <QPointer>

#include "helpers/ConversionWorker.h"
#include "src/core/ConversionTypes.h"

// Forward declarations for Qt classes
class QLineEdit;
class QPushButton;
class QCheckBox;
class QRadioButton;
class QSpinBox;
class QLabel;
class LogWindow;

class ConvertTab : public QWidget
{
    Q_OBJECT

public:
    explicit ConvertTab(QWidget *parent = nullptr);
    ~ConvertTab();

    /**
     * @brief Snapshot of the form as a request for the engine.
     */
    WebpConvert::ConversionRequest collect() const;

private slots:
    void browseInput();
    void browseOutput();
    void updateOptionStates();

    void startConversion();
    void showLog();

    // Worker result slots
    void onConversionDone(int converted, int skipped, int failed, const QString &report);
    void onConversionError(const QString &msg);

private:
    void setupUi();
    bool isValid() const;
    void setRunning(bool running);
    void applyShadowEffect(QWidget* widget, const QString& colorHex = "#000000", int radius = 8, int xOffset = 0, int yOffset = 3);

    QPointer<ConversionWorker> m_worker;
    LogWindow *m_logWindow;

    // Folders
    QLineEdit *m_inputPath;
    QLineEdit *m_outputPath;

    // Format
    QRadioButton *m_pngRadio;
    QRadioButton *m_jpegRadio;
    QCheckBox *m_transparencyCheckbox;

    // Naming
    QRadioButton *m_sequentialRadio;
    QRadioButton *m_keepNamesRadio;
    QLineEdit *m_prefix;
    QSpinBox *m_startNumber;

    QCheckBox *m_deleteCheckbox;

    // Buttons & Status
    QPushButton *m_runButton;
    QPushButton *m_logButton;
    QLabel *m_statusLabel;
};

#endif // CONVERT_TAB_H
