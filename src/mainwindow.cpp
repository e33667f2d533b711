#include "mainwindow.h"
#include "recordstore.h"
#include "formbinding.h"
#include "ocrcoordinator.h"
#include "geminiocrengine.h"
#include "cardrenamer.h"
#include "imageviewer.h"
#include "dataformwidget.h"
#include <QApplication>
#include <QMessageBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QDir>
#include <QDateTime>
#include <QCloseEvent>
#include <QShortcut>
#include <QKeySequence>
#include <QDebug>
#include <functional>

MainWindow::MainWindow(std::unique_ptr<OcrEngine> engine, QWidget *parent)
    : QMainWindow(parent)
{
    // Initialize backend components
    m_configManager = std::make_unique<ConfigManager>(this);
    m_config = m_configManager->loadConfig();
    m_imageSource = std::make_unique<ImageSource>(m_config.imageExtensions);

    m_status = new StatusReporter(this);
    m_store = new RecordStore(m_config, this);
    m_binding = new FormBinding(m_store, this);
    if (!engine) {
        engine = std::make_unique<GeminiOcrEngine>(m_config);
    }
    m_ocr = new OcrCoordinator(m_store, m_status, std::move(engine), this);

    // Setup UI
    setupUI();
    setupShortcuts();

    // Connect signals
    connectSignals();

    m_showBoxesCheckBox->setChecked(m_configManager->showBoxes());
    m_imageViewer->setShowBoxes(m_showBoxesCheckBox->isChecked());

    QByteArray geometry = m_configManager->windowGeometry();
    if (!geometry.isEmpty()) {
        restoreGeometry(geometry);
    } else {
        resize(1200, 800);
    }

    QString configProblem;
    if (!ConfigManager::validate(m_config, &configProblem)) {
        m_status->report(StatusReporter::State::Error, QString("OCR unavailable: %1").arg(configProblem));
    } else {
        m_status->report(StatusReporter::State::Ready,
                         QString("Ready (OCR model: %1)").arg(m_config.modelName()));
    }

    updateControlButtons();
    updateWindowTitle();
}

MainWindow::~MainWindow()
{
    // Waits for an in-flight OCR request before the store goes away
    delete m_ocr;
    m_ocr = nullptr;
}

void MainWindow::setupUI()
{
    m_centralWidget = new QWidget(this);
    setCentralWidget(m_centralWidget);

    QVBoxLayout* mainVerticalLayout = new QVBoxLayout(m_centralWidget);
    mainVerticalLayout->setSpacing(8);
    mainVerticalLayout->setContentsMargins(12, 12, 12, 12);

    setupToolbarSection();
    mainVerticalLayout->addWidget(m_toolbarGroup);

    // Image on the left, form on the right
    m_contentLayout = new QHBoxLayout();
    m_contentLayout->setSpacing(8);
    setupViewerSection();
    setupFormSection();
    mainVerticalLayout->addLayout(m_contentLayout, 1);

    setupStatusSection();
    mainVerticalLayout->addWidget(m_statusGroup);
}

void MainWindow::setupToolbarSection()
{
    m_toolbarGroup = new QGroupBox("Controls", m_centralWidget);
    QHBoxLayout* layout = new QHBoxLayout(m_toolbarGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(8);

    m_browseButton = new QPushButton("Browse", m_toolbarGroup);
    m_browseButton->setToolTip("Open a folder of card images (Ctrl+O)");
    m_previousButton = new QPushButton("Previous", m_toolbarGroup);
    m_previousButton->setToolTip("Previous image (Left)");
    m_nextButton = new QPushButton("Next", m_toolbarGroup);
    m_nextButton->setToolTip("Next image (Right)");
    m_rotateLeftButton = new QPushButton("Rotate Left", m_toolbarGroup);
    m_rotateLeftButton->setToolTip("Rotate and save counter-clockwise (Ctrl+Left)");
    m_rotateRightButton = new QPushButton("Rotate Right", m_toolbarGroup);
    m_rotateRightButton->setToolTip("Rotate and save clockwise (Ctrl+Right)");
    m_ocrButton = new QPushButton("OCR", m_toolbarGroup);
    m_ocrButton->setToolTip("Extract fields from this card (Ctrl+Return)");
    m_updateDataButton = new QPushButton("Update Data", m_toolbarGroup);
    m_updateDataButton->setToolTip("Rename the image after its Ration Card ID and save (Ctrl+S)");
    m_saveButton = new QPushButton("Save", m_toolbarGroup);
    m_saveButton->setToolTip("Save all records (Ctrl+Shift+S)");

    m_showBoxesCheckBox = new QCheckBox("Show Boxes", m_toolbarGroup);
    m_positionLabel = new QLabel("0 / 0", m_toolbarGroup);
    m_positionLabel->setMinimumWidth(70);
    m_positionLabel->setAlignment(Qt::AlignRight | Qt::AlignVCenter);

    layout->addWidget(m_browseButton);
    layout->addWidget(m_previousButton);
    layout->addWidget(m_nextButton);
    layout->addWidget(m_rotateLeftButton);
    layout->addWidget(m_rotateRightButton);
    layout->addWidget(m_ocrButton);
    layout->addWidget(m_updateDataButton);
    layout->addWidget(m_saveButton);
    layout->addStretch(1);
    layout->addWidget(m_showBoxesCheckBox);
    layout->addWidget(m_positionLabel);
}

void MainWindow::setupViewerSection()
{
    m_imageViewer = new ImageViewer(m_centralWidget);
    m_imageViewer->setPlaceholderText("Browse to a folder of ration card images");
    m_contentLayout->addWidget(m_imageViewer, 3);
}

void MainWindow::setupFormSection()
{
    m_dataForm = new DataFormWidget(m_config.fields, m_centralWidget);
    m_dataForm->setMinimumWidth(320);
    m_dataForm->setFileName(QString());
    m_contentLayout->addWidget(m_dataForm, 1, Qt::AlignTop);
}

void MainWindow::setupStatusSection()
{
    m_statusGroup = new QGroupBox("Status Log", m_centralWidget);
    QVBoxLayout* layout = new QVBoxLayout(m_statusGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(4);

    QHBoxLayout* statusLine = new QHBoxLayout();
    m_statusLabel = new QLabel("Ready", m_statusGroup);
    m_ocrProgressBar = new QProgressBar(m_statusGroup);
    m_ocrProgressBar->setRange(0, 0);  // Indeterminate
    m_ocrProgressBar->setMaximumWidth(200);
    m_ocrProgressBar->setTextVisible(false);
    m_ocrProgressBar->setVisible(false);
    statusLine->addWidget(m_statusLabel, 1);
    statusLine->addWidget(m_ocrProgressBar);

    m_statusText = new QTextEdit(m_statusGroup);
    m_statusText->setMinimumHeight(90);
    m_statusText->setMaximumHeight(130);
    m_statusText->setReadOnly(true);

    layout->addLayout(statusLine);
    layout->addWidget(m_statusText);
}

void MainWindow::setupShortcuts()
{
    struct Binding {
        QKeySequence keys;
        std::function<void()> action;
    };

    const QList<Binding> bindings = {
        { QKeySequence("Left"),        [this]() { onPreviousClicked(); } },
        { QKeySequence("Right"),       [this]() { onNextClicked(); } },
        { QKeySequence("Ctrl+Left"),   [this]() { onRotateLeftClicked(); } },
        { QKeySequence("Ctrl+Right"),  [this]() { onRotateRightClicked(); } },
        { QKeySequence("Ctrl+O"),      [this]() { onBrowseClicked(); } },
        { QKeySequence("Ctrl+Return"), [this]() { onOcrClicked(); } },
        { QKeySequence("Ctrl+S"),      [this]() { onUpdateDataClicked(); } },
        { QKeySequence("Ctrl+Shift+S"), [this]() { onSaveClicked(); } },
        { QKeySequence("Shift+Left"),  [this]() { m_imageViewer->panBy(-ViewTransform::PAN_STEP, 0); } },
        { QKeySequence("Shift+Right"), [this]() { m_imageViewer->panBy(ViewTransform::PAN_STEP, 0); } },
        { QKeySequence("Shift+Up"),    [this]() { m_imageViewer->panBy(0, -ViewTransform::PAN_STEP); } },
        { QKeySequence("Shift+Down"),  [this]() { m_imageViewer->panBy(0, ViewTransform::PAN_STEP); } },
    };

    for (const Binding& binding : bindings) {
        QShortcut* shortcut = new QShortcut(binding.keys, this);
        std::function<void()> action = binding.action;
        connect(shortcut, &QShortcut::activated, this, [action]() { action(); });
    }
}

void MainWindow::connectSignals()
{
    // Toolbar signals
    connect(m_browseButton, &QPushButton::clicked, this, &MainWindow::onBrowseClicked);
    connect(m_previousButton, &QPushButton::clicked, this, &MainWindow::onPreviousClicked);
    connect(m_nextButton, &QPushButton::clicked, this, &MainWindow::onNextClicked);
    connect(m_rotateLeftButton, &QPushButton::clicked, this, &MainWindow::onRotateLeftClicked);
    connect(m_rotateRightButton, &QPushButton::clicked, this, &MainWindow::onRotateRightClicked);
    connect(m_ocrButton, &QPushButton::clicked, this, &MainWindow::onOcrClicked);
    connect(m_updateDataButton, &QPushButton::clicked, this, &MainWindow::onUpdateDataClicked);
    connect(m_saveButton, &QPushButton::clicked, this, &MainWindow::onSaveClicked);
    connect(m_showBoxesCheckBox, &QCheckBox::toggled, this, &MainWindow::onShowBoxesToggled);

    // Form signals
    connect(m_binding, &FormBinding::valuesChanged, m_dataForm, &DataFormWidget::setValues);
    connect(m_binding, &FormBinding::boxesChanged, m_imageViewer, &ImageViewer::setBoxes);
    connect(m_binding, &FormBinding::activeRecordChanged, m_dataForm, &DataFormWidget::setFileName);
    connect(m_dataForm, &DataFormWidget::fieldEdited, m_binding, &FormBinding::editField);

    // Store signals
    connect(m_store, &RecordStore::recordChanged, this, &MainWindow::onRecordChanged);
    connect(m_store, &RecordStore::dirtyStateChanged, this, &MainWindow::onDirtyStateChanged);

    // Status and OCR signals
    connect(m_status, &StatusReporter::statusChanged, this, &MainWindow::onStatusChanged);
    connect(m_ocr, &OcrCoordinator::ocrStarted, this, &MainWindow::onOcrStarted);
    connect(m_ocr, &OcrCoordinator::ocrFinished, this, &MainWindow::onOcrFinished);
}

bool MainWindow::openFolder(const QString& folderPath)
{
    if (m_ocr->isBusy()) {
        m_status->reportError(OperationError(ErrorKind::IOError,
                                             QString("Wait for OCR on %1 to finish before opening another folder")
                                                 .arg(m_ocr->pendingFile())));
        return false;
    }
    if (!maybeSaveChanges()) {
        return false;
    }

    m_status->report(StatusReporter::State::Loading, QString("Opening %1").arg(folderPath));

    OperationError error;
    if (!m_imageSource->open(folderPath, &error)) {
        m_store->clear();
        m_binding->clear();
        m_imageViewer->clearImage();
        m_status->reportError(error);
        updateControlButtons();
        updatePositionLabel();
        updateWindowTitle();
        return false;
    }

    LoadReport report = m_store->loadOrCreate(folderPath, m_imageSource->fileNames());
    if (report.hasNotices()) {
        for (const OperationError& notice : report.notices) {
            m_statusText->append(notice.toString());
        }
    }
    m_configManager->setLastFolder(folderPath);

    displayCurrent();
    m_status->report(StatusReporter::State::Ready, report.summary(m_store->size()));
    updateWindowTitle();
    return true;
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    // The result would be lost with the window, so keep it open
    if (m_ocr->isBusy()) {
        m_status->reportError(OperationError(ErrorKind::IOError,
                                             QString("Wait for OCR on %1 to finish before closing")
                                                 .arg(m_ocr->pendingFile())));
        event->ignore();
        return;
    }
    if (!maybeSaveChanges()) {
        event->ignore();
        return;
    }

    m_configManager->setWindowGeometry(saveGeometry());
    m_configManager->setShowBoxes(m_showBoxesCheckBox->isChecked());
    event->accept();
}

bool MainWindow::maybeSaveChanges()
{
    if (!m_store->hasUnsavedChanges()) {
        return true;
    }

    QMessageBox::StandardButton choice = QMessageBox::warning(this,
        "Unsaved Changes",
        QString("%1 record(s) have unsaved changes. Save them before continuing?").arg(m_store->dirtyCount()),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
        QMessageBox::Save);

    if (choice == QMessageBox::Cancel) {
        return false;
    }
    if (choice == QMessageBox::Discard) {
        m_statusText->append("Discarded unsaved changes");
        return true;
    }

    OperationError error;
    if (!m_store->save(&error)) {
        m_status->reportError(error);
        QMessageBox::critical(this, "Save Failed", error.toString());
        return false;
    }
    m_status->report(StatusReporter::State::Saved, QString("Saved %1 records").arg(m_store->size()));
    return true;
}

// Slot implementations
void MainWindow::onBrowseClicked()
{
    QString start = m_imageSource->folderPath();
    if (start.isEmpty()) {
        start = m_configManager->lastFolder();
    }

    QString dir = QFileDialog::getExistingDirectory(this, "Select Folder of Ration Card Images", start);
    if (!dir.isEmpty()) {
        openFolder(dir);
    }
}

void MainWindow::onPreviousClicked()
{
    if (m_imageSource->previous()) {
        displayCurrent();
    } else if (!m_imageSource->isEmpty()) {
        m_status->report(StatusReporter::State::Ready, "Already at the first image");
    }
}

void MainWindow::onNextClicked()
{
    if (m_imageSource->next()) {
        displayCurrent();
    } else if (!m_imageSource->isEmpty()) {
        m_status->report(StatusReporter::State::Ready, "Already at the last image");
    }
}

void MainWindow::onRotateLeftClicked()
{
    rotateCurrent(ImageIOHelper::Rotation::CounterClockwise);
}

void MainWindow::onRotateRightClicked()
{
    rotateCurrent(ImageIOHelper::Rotation::Clockwise);
}

void MainWindow::rotateCurrent(ImageIOHelper::Rotation rotation)
{
    QString fileName = m_imageSource->currentFileName();
    if (fileName.isEmpty()) {
        return;
    }
    if (m_ocr->isPending(fileName)) {
        m_statusText->append(QString("Cannot rotate %1 while OCR is running on it").arg(fileName));
        return;
    }

    OperationError error;
    if (!ImageIOHelper::rotateFile(m_imageSource->currentFilePath(), rotation, &error)) {
        m_status->reportError(error);
        return;
    }

    m_statusText->append(QString("Rotated %1 %2").arg(fileName,
        rotation == ImageIOHelper::Rotation::Clockwise ? "clockwise" : "counter-clockwise"));
    displayCurrent();
}

void MainWindow::onOcrClicked()
{
    QString fileName = m_imageSource->currentFileName();
    if (fileName.isEmpty()) {
        return;
    }

    switch (m_ocr->request(fileName, m_imageSource->currentFilePath())) {
        case OcrCoordinator::RequestOutcome::Started:
            break;
        case OcrCoordinator::RequestOutcome::AlreadyPending:
            m_statusText->append(QString("OCR already running for %1").arg(fileName));
            break;
        case OcrCoordinator::RequestOutcome::Busy:
            m_statusText->append(QString("OCR is busy with %1, try again when it finishes").arg(m_ocr->pendingFile()));
            break;
        case OcrCoordinator::RequestOutcome::UnknownRecord:
            m_status->reportError(OperationError(ErrorKind::NotFound, QString("No record for %1").arg(fileName)));
            break;
    }
}

void MainWindow::onUpdateDataClicked()
{
    QString fileName = m_imageSource->currentFileName();
    if (fileName.isEmpty()) {
        return;
    }
    if (m_ocr->isPending(fileName)) {
        m_statusText->append(QString("Cannot update %1 while OCR is running on it").arg(fileName));
        return;
    }

    QString newName;
    OperationError error;
    if (!CardRenamer::apply(*m_imageSource, *m_store, fileName, &newName, &error)) {
        m_status->reportError(error);
        displayCurrent();
        return;
    }

    displayCurrent();
    m_status->report(StatusReporter::State::Saved,
                     newName == fileName ? QString("Saved data for %1").arg(fileName)
                                         : QString("Renamed %1 to %2 and saved").arg(fileName, newName));
}

void MainWindow::onSaveClicked()
{
    if (m_imageSource->folderPath().isEmpty()) {
        return;
    }

    OperationError error;
    if (!m_store->save(m_imageSource->folderPath(), &error)) {
        m_status->reportError(error);
        return;
    }
    m_status->report(StatusReporter::State::Saved,
                     QString("Saved %1 records to %2").arg(m_store->size()).arg(m_config.dataFileName));
}

void MainWindow::onShowBoxesToggled(bool checked)
{
    m_imageViewer->setShowBoxes(checked);
}

void MainWindow::onStatusChanged(StatusReporter::State state, const QString& message)
{
    m_statusLabel->setText(message);
    if (state == StatusReporter::State::Error) {
        m_statusLabel->setStyleSheet("color: rgb(244, 67, 54);");
    } else {
        m_statusLabel->setStyleSheet(QString());
    }

    m_statusText->append(QString("[%1] %2: %3")
                             .arg(QDateTime::currentDateTime().toString("HH:mm:ss"),
                                  StatusReporter::stateName(state), message));
}

void MainWindow::onOcrStarted(const QString& /*fileName*/)
{
    m_ocrProgressBar->setVisible(true);
    updateControlButtons();
}

void MainWindow::onOcrFinished(const QString& /*fileName*/, bool /*success*/)
{
    m_ocrProgressBar->setVisible(false);
    updateControlButtons();
}

void MainWindow::onRecordChanged(const QString& fileName)
{
    if (fileName == m_binding->activeFile()) {
        const CardRecord* record = m_store->getRecord(fileName);
        if (record) {
            m_dataForm->setOcrState(record->ocrState);
        }
    }
}

void MainWindow::onDirtyStateChanged(bool /*hasUnsavedChanges*/)
{
    updateWindowTitle();
}

void MainWindow::displayCurrent()
{
    QString fileName = m_imageSource->currentFileName();
    if (fileName.isEmpty()) {
        m_imageViewer->clearImage();
        m_binding->clear();
        m_dataForm->setOcrState(OcrState::NotAttempted);
        updatePositionLabel();
        updateControlButtons();
        return;
    }

    cv::Mat image = ImageIOHelper::imreadUnicode(m_imageSource->currentFilePath());
    if (image.empty()) {
        m_imageViewer->clearImage();
        m_imageViewer->setPlaceholderText(QString("Cannot display %1").arg(fileName));
        m_statusText->append(QString("Failed to load image: %1").arg(fileName));
    } else {
        m_imageViewer->setImage(ImageIOHelper::toQImage(image));
    }

    m_binding->show(fileName);
    const CardRecord* record = m_store->getRecord(fileName);
    m_dataForm->setOcrState(record ? record->ocrState : OcrState::NotAttempted);

    updatePositionLabel();
    updateControlButtons();
}

void MainWindow::updateControlButtons()
{
    bool hasImage = !m_imageSource->isEmpty();
    int index = m_imageSource->currentIndex();
    QString current = m_imageSource->currentFileName();
    bool currentPending = m_ocr->isPending(current);

    m_previousButton->setEnabled(hasImage && index > 0);
    m_nextButton->setEnabled(hasImage && index < m_imageSource->count() - 1);
    m_rotateLeftButton->setEnabled(hasImage && !currentPending);
    m_rotateRightButton->setEnabled(hasImage && !currentPending);
    m_ocrButton->setEnabled(hasImage && !m_ocr->isBusy());
    m_updateDataButton->setEnabled(hasImage && !currentPending);
    m_saveButton->setEnabled(!m_imageSource->folderPath().isEmpty());
}

void MainWindow::updateWindowTitle()
{
    QString title = "Ration Card Processor";
    if (!m_imageSource->folderPath().isEmpty()) {
        title += " - " + QDir(m_imageSource->folderPath()).dirName();
    }
    if (m_store->hasUnsavedChanges()) {
        title += " *";
    }
    setWindowTitle(title);
}

void MainWindow::updatePositionLabel()
{
    if (m_imageSource->isEmpty()) {
        m_positionLabel->setText("0 / 0");
    } else {
        m_positionLabel->setText(QString("%1 / %2").arg(m_imageSource->currentIndex() + 1)
                                                   .arg(m_imageSource->count()));
    }
}
