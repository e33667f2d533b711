#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGroupBox>
#include <QPushButton>
#include <QCheckBox>
#include <QLabel>
#include <QProgressBar>
#include <QTextEdit>
#include <memory>

#include "configmanager.h"
#include "imagesource.h"
#include "imageiohelper.h"
#include "statusreporter.h"
#include "ocrengine.h"

class RecordStore;
class FormBinding;
class OcrCoordinator;
class ImageViewer;
class DataFormWidget;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    /**
     * @param engine OCR provider, Gemini with the loaded configuration if null
     */
    explicit MainWindow(std::unique_ptr<OcrEngine> engine = nullptr, QWidget *parent = nullptr);
    ~MainWindow();

    /**
     * Open a folder of card images, asking about unsaved changes first
     * @param folderPath Folder to open
     * @return true if the folder is now open
     */
    bool openFolder(const QString& folderPath);

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onBrowseClicked();
    void onPreviousClicked();
    void onNextClicked();
    void onRotateLeftClicked();
    void onRotateRightClicked();
    void onOcrClicked();
    void onUpdateDataClicked();
    void onSaveClicked();
    void onShowBoxesToggled(bool checked);

    void onStatusChanged(StatusReporter::State state, const QString& message);
    void onOcrStarted(const QString& fileName);
    void onOcrFinished(const QString& fileName, bool success);
    void onRecordChanged(const QString& fileName);
    void onDirtyStateChanged(bool hasUnsavedChanges);

private:
    void setupUI();
    void setupToolbarSection();
    void setupViewerSection();
    void setupFormSection();
    void setupStatusSection();
    void setupShortcuts();
    void connectSignals();

    void displayCurrent();
    void rotateCurrent(ImageIOHelper::Rotation rotation);
    void updateControlButtons();
    void updateWindowTitle();
    void updatePositionLabel();

    /**
     * Offer to save unsaved changes
     * @return false if the operator cancelled
     */
    bool maybeSaveChanges();

    // UI Components
    QWidget* m_centralWidget;
    QHBoxLayout* m_contentLayout;

    // Toolbar Section
    QGroupBox* m_toolbarGroup;
    QPushButton* m_browseButton;
    QPushButton* m_previousButton;
    QPushButton* m_nextButton;
    QPushButton* m_rotateLeftButton;
    QPushButton* m_rotateRightButton;
    QPushButton* m_ocrButton;
    QPushButton* m_updateDataButton;
    QPushButton* m_saveButton;
    QCheckBox* m_showBoxesCheckBox;
    QLabel* m_positionLabel;

    // Viewer and form
    ImageViewer* m_imageViewer;
    DataFormWidget* m_dataForm;

    // Status Section
    QGroupBox* m_statusGroup;
    QLabel* m_statusLabel;
    QProgressBar* m_ocrProgressBar;
    QTextEdit* m_statusText;

    // Backend components
    std::unique_ptr<ConfigManager> m_configManager;
    AppConfig m_config;
    std::unique_ptr<ImageSource> m_imageSource;
    StatusReporter* m_status;
    RecordStore* m_store;
    FormBinding* m_binding;
    OcrCoordinator* m_ocr;
};

#endif // MAINWINDOW_H
