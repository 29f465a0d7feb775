#include "MainWindow.h"
#include "core/LabelingSession.h"
#include "core/LabelSettings.h"
#include "viewport/AnnotationCanvas.h"

#include <QAction>
#include <QActionGroup>
#include <QCloseEvent>
#include <QComboBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QStatusBar>
#include <QToolBar>
#include <QDebug>

namespace {

constexpr int STATUS_MESSAGE_MS = 4000;

} // namespace

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_session(new LabelingSession(this))
{
    setupUi();

    connect(m_session, &LabelingSession::changed, this, &MainWindow::syncControls);
    connect(m_session, &LabelingSession::imageChanged, this, &MainWindow::onImageChanged);
    connect(m_session, &LabelingSession::annotationRejected, this, &MainWindow::onAnnotationRejected);
    connect(m_session, &LabelingSession::warning, this, &MainWindow::onWarning);
    connect(m_canvas, &AnnotationCanvas::saved, this, [this](int savedCount, int deletedCount) {
        statusBar()->showMessage(tr("Saved %n record(s)", nullptr, savedCount)
                                 + (deletedCount > 0 ? tr(", removed %n empty record(s)", nullptr, deletedCount)
                                                     : QString()),
                                 STATUS_MESSAGE_MS);
    });

    syncControls();
    onImageChanged(-1, 0);
}

MainWindow::~MainWindow() = default;

// ============================================================================
// UI Setup
// ============================================================================

void MainWindow::setupUi()
{
    m_canvas = new AnnotationCanvas(m_session, this);
    setCentralWidget(m_canvas);

    QToolBar* toolbar = addToolBar(tr("Labeling"));
    toolbar->setMovable(false);

    // ----- Folder -----
    QAction* openAction = toolbar->addAction(tr("Open Folder"));
    openAction->setShortcut(QKeySequence::Open);
    connect(openAction, &QAction::triggered, this, &MainWindow::showOpenFolderDialog);

    m_saveAction = toolbar->addAction(tr("Save"));
    m_saveAction->setShortcut(QKeySequence::Save);
    connect(m_saveAction, &QAction::triggered, this, &MainWindow::saveAnnotations);

    toolbar->addSeparator();

    // ----- Navigation -----
    m_prevAction = toolbar->addAction(tr("Previous"));
    connect(m_prevAction, &QAction::triggered, m_session, &LabelingSession::previousImage);
    m_nextAction = toolbar->addAction(tr("Next"));
    connect(m_nextAction, &QAction::triggered, m_session, &LabelingSession::nextImage);
    m_jumpAction = toolbar->addAction(tr("Go To..."));
    m_jumpAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_G));
    connect(m_jumpAction, &QAction::triggered, this, &MainWindow::jumpToImage);

    toolbar->addSeparator();

    // ----- Classes -----
    toolbar->addWidget(new QLabel(tr(" Class: "), toolbar));
    m_classCombo = new QComboBox(toolbar);
    m_classCombo->setMinimumContentsLength(12);
    m_classCombo->setFocusPolicy(Qt::NoFocus);  // keep keyboard shortcuts on the canvas
    toolbar->addWidget(m_classCombo);
    connect(m_classCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onClassSelected);

    QAction* addClassAction = toolbar->addAction(tr("Add Class..."));
    connect(addClassAction, &QAction::triggered, this, &MainWindow::addClass);

    toolbar->addSeparator();

    // ----- Tools -----
    m_toolGroup = new QActionGroup(this);
    m_toolGroup->setExclusive(true);

    auto addTool = [&](const QString& text, ToolType tool) {
        QAction* action = toolbar->addAction(text);
        action->setCheckable(true);
        m_toolGroup->addAction(action);
        connect(action, &QAction::triggered, this, [this, tool]() {
            m_session->setTool(tool);
        });
        return action;
    };
    m_rectangleAction = addTool(tr("Rectangle"), ToolType::Rectangle);
    m_lineAction = addTool(tr("Line"), ToolType::Line);
    m_freehandAction = addTool(tr("Freehand"), ToolType::Freehand);
    m_selectAction = addTool(tr("Select"), ToolType::Select);

    m_clearAction = toolbar->addAction(tr("Clear All"));
    connect(m_clearAction, &QAction::triggered, this, &MainWindow::clearAnnotations);

    toolbar->addSeparator();

    // ----- Zoom -----
    QAction* zoomInAction = toolbar->addAction(tr("Zoom In"));
    zoomInAction->setShortcut(QKeySequence::ZoomIn);
    connect(zoomInAction, &QAction::triggered, m_session, &LabelingSession::zoomIn);

    QAction* zoomOutAction = toolbar->addAction(tr("Zoom Out"));
    zoomOutAction->setShortcut(QKeySequence::ZoomOut);
    connect(zoomOutAction, &QAction::triggered, m_session, &LabelingSession::zoomOut);

    QAction* resetAction = toolbar->addAction(tr("Reset View"));
    connect(resetAction, &QAction::triggered, m_session, &LabelingSession::resetView);

    // ----- Status bar -----
    m_imageLabel = new QLabel(this);
    m_zoomLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_imageLabel);
    statusBar()->addPermanentWidget(m_zoomLabel);

    resize(1100, 800);
}

// ============================================================================
// Commands
// ============================================================================

bool MainWindow::openFolder(const QString& folder)
{
    if (!QFileInfo(folder).isDir()) {
        onWarning(tr("%1 is not a folder").arg(folder));
        return false;
    }
    // A different folder discards the in-memory records
    if (QFileInfo(folder).absoluteFilePath() != m_session->folder() && !m_canvas->maybeSave()) {
        return false;
    }

    const int count = m_session->openFolder(folder);
    LabelSettings::setLastFolder(m_session->folder());
    m_canvas->setFocus();
    return count > 0;
}

void MainWindow::showOpenFolderDialog()
{
    const QString folder = QFileDialog::getExistingDirectory(
        this, tr("Open Image Folder"), LabelSettings::lastFolder());
    if (folder.isEmpty()) {
        return;
    }
    openFolder(folder);
}

void MainWindow::saveAnnotations()
{
    if (m_session->folder().isEmpty()) {
        return;
    }
    m_canvas->saveAnnotations();
}

void MainWindow::jumpToImage()
{
    if (m_session->imageCount() == 0) {
        return;
    }
    bool ok = false;
    const int number = QInputDialog::getInt(
        this, tr("Go To Image"), tr("Image number (1-%1):").arg(m_session->imageCount()),
        m_session->currentIndex() + 1, 1, m_session->imageCount(), 1, &ok);
    if (!ok) {
        return;
    }
    QString err;
    if (!m_session->jumpToImage(number, &err)) {
        onWarning(err);
    }
}

void MainWindow::addClass()
{
    bool ok = false;
    const QString name = QInputDialog::getText(this, tr("Add Class"), tr("Class name:"),
                                               QLineEdit::Normal, QString(), &ok);
    if (!ok) {
        return;
    }

    switch (m_session->addClass(name)) {
        case LabelingSession::AddClassResult::Added:
            statusBar()->showMessage(tr("Added class '%1'").arg(name.trimmed()), STATUS_MESSAGE_MS);
            break;
        case LabelingSession::AddClassResult::Exists:
            statusBar()->showMessage(tr("Class '%1' already exists").arg(name.trimmed()), STATUS_MESSAGE_MS);
            break;
        case LabelingSession::AddClassResult::Empty:
            QMessageBox::warning(this, tr("Add Class"), tr("Class name must not be empty."));
            break;
    }
}

void MainWindow::clearAnnotations()
{
    if (m_session->currentAnnotations().isEmpty()) {
        return;
    }
    const QMessageBox::StandardButton reply = QMessageBox::question(
        this, tr("Clear Annotations"),
        tr("Remove all %n annotation(s) of this image?", nullptr, m_session->currentAnnotations().size()),
        QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    if (reply == QMessageBox::Yes) {
        m_session->clearCurrentAnnotations();
    }
}

// ============================================================================
// Session notifications
// ============================================================================

void MainWindow::onClassSelected(int index)
{
    if (index >= 0) {
        m_session->setCurrentLabel(m_classCombo->itemText(index));
    }
}

void MainWindow::onImageChanged(int index, int count)
{
    if (index < 0) {
        m_imageLabel->setText(count == 0 ? tr("No images") : QString());
    } else {
        m_imageLabel->setText(tr("Image %1 / %2: %3")
                              .arg(index + 1).arg(count).arg(m_session->currentImageId()));
    }
    updateTitle();
}

void MainWindow::onAnnotationRejected(const QString& reason)
{
    statusBar()->showMessage(tr("Annotation not added: %1").arg(reason), STATUS_MESSAGE_MS);
}

void MainWindow::onWarning(const QString& message)
{
    qWarning() << "MainWindow:" << message;
    QMessageBox::warning(this, tr("MaskLabel"), message);
}

void MainWindow::syncControls()
{
    // Class list (may grow through addClass)
    const QStringList classes = m_session->availableClasses();
    QStringList shown;
    for (int i = 0; i < m_classCombo->count(); ++i) {
        shown << m_classCombo->itemText(i);
    }
    {
        const QSignalBlocker blocker(m_classCombo);
        if (shown != classes) {
            m_classCombo->clear();
            m_classCombo->addItems(classes);
        }
        m_classCombo->setCurrentIndex(classes.indexOf(m_session->currentLabel()));
    }

    switch (m_session->tool()) {
        case ToolType::Rectangle: m_rectangleAction->setChecked(true); break;
        case ToolType::Line:      m_lineAction->setChecked(true); break;
        case ToolType::Freehand:  m_freehandAction->setChecked(true); break;
        case ToolType::Select:    m_selectAction->setChecked(true); break;
    }

    const bool hasImage = m_session->hasImage();
    const int count = m_session->imageCount();
    const int index = m_session->currentIndex();
    m_prevAction->setEnabled(hasImage && index > 0);
    m_nextAction->setEnabled(hasImage && index + 1 < count);
    m_jumpAction->setEnabled(count > 0);
    m_clearAction->setEnabled(hasImage && !m_session->currentAnnotations().isEmpty());
    m_saveAction->setEnabled(m_session->isDirty());

    m_zoomLabel->setText(hasImage
        ? tr("Zoom %1%").arg(qRound(m_session->transform().zoomLevel() * 100))
        : QString());

    updateTitle();
}

void MainWindow::updateTitle()
{
    QString title = tr("MaskLabel");
    if (m_session->hasImage()) {
        title = m_session->currentImageId() + QStringLiteral(" - ") + title;
    }
    setWindowTitle(m_session->isDirty() ? QStringLiteral("* ") + title : title);
}

// ============================================================================
// Close
// ============================================================================

void MainWindow::closeEvent(QCloseEvent* event)
{
    if (!m_canvas->maybeSave()) {
        event->ignore();
        return;
    }
    event->accept();
}
