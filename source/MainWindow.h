#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

class AnnotationCanvas;
class LabelingSession;
class QAction;
class QActionGroup;
class QComboBox;
class QLabel;

/**
 * @brief Top-level labeling window.
 *
 * Hosts one AnnotationCanvas over one LabelingSession, with a toolbar for
 * folder, navigation, class, tool and zoom commands and a status bar.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Open @p folder without a file dialog (startup argument).
     */
    bool openFolder(const QString& folder);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void showOpenFolderDialog();
    void saveAnnotations();
    void jumpToImage();
    void addClass();
    void clearAnnotations();
    void onClassSelected(int index);
    void onImageChanged(int index, int count);
    void onAnnotationRejected(const QString& reason);
    void onWarning(const QString& message);
    void syncControls();

private:
    void setupUi();
    void updateTitle();

    LabelingSession* m_session = nullptr;
    AnnotationCanvas* m_canvas = nullptr;

    QComboBox* m_classCombo = nullptr;
    QActionGroup* m_toolGroup = nullptr;
    QAction* m_rectangleAction = nullptr;
    QAction* m_lineAction = nullptr;
    QAction* m_freehandAction = nullptr;
    QAction* m_selectAction = nullptr;
    QAction* m_saveAction = nullptr;
    QAction* m_prevAction = nullptr;
    QAction* m_nextAction = nullptr;
    QAction* m_jumpAction = nullptr;
    QAction* m_clearAction = nullptr;

    QLabel* m_imageLabel = nullptr;
    QLabel* m_zoomLabel = nullptr;
};

#endif // MAINWINDOW_H
