#pragma once

// ============================================================================
// LabelingSession - One labeling session over a folder of images
// ============================================================================
// Owns exactly one ViewTransform, one AnnotationStore and one
// DrawingController. The canvas forwards pointer/wheel/resize input here and
// repaints when changed() is emitted; nothing here paints or shows dialogs.
//
// Records live in <image folder>/json_data/<image base name>.json.
// ============================================================================

#include "AnnotationStore.h"
#include "DrawingController.h"
#include "ToolType.h"
#include "ViewTransform.h"

#include <QObject>
#include <QImage>
#include <QPointF>
#include <QSize>
#include <QStringList>

/**
 * @brief State and behavior of the interactive labeling tool.
 */
class LabelingSession : public QObject {
    Q_OBJECT

public:
    static constexpr qreal ZOOM_BUTTON_FACTOR = 1.20;
    static constexpr qreal ZOOM_WHEEL_FACTOR = 1.04;
    static constexpr qreal HIT_TOLERANCE = 5.0;     ///< View pixels
    static constexpr const char* RECORD_SUBDIR = "json_data";

    enum class AddClassResult {
        Added,
        Empty,      ///< Name was blank
        Exists      ///< Name already in the list (it becomes the current label)
    };

    explicit LabelingSession(QObject* parent = nullptr);

    // =========================================================================
    // Folder and navigation
    // =========================================================================

    /**
     * @brief Open a folder of images.
     *
     * Opening a different folder drops all in-memory records (the caller is
     * expected to have offered a save first). Reopening the same folder
     * refreshes the image list and keeps unsaved work.
     *
     * @return Number of images found.
     */
    int openFolder(const QString& folder);

    /**
     * @brief Show image @p index and load its record if not loaded yet.
     * @return False if the index is out of range or the image cannot be decoded.
     */
    bool loadImage(int index, QString* errorMessage = nullptr);

    bool nextImage();
    bool previousImage();

    /**
     * @brief Jump to a 1-based image number, as typed by the user.
     */
    bool jumpToImage(int number, QString* errorMessage = nullptr);

    int imageCount() const { return m_imageFiles.size(); }
    int currentIndex() const { return m_currentIndex; }
    QString folder() const { return m_folder; }
    QString recordDir() const;

    bool hasImage() const { return !m_image.isNull(); }
    const QImage& currentImage() const { return m_image; }
    QString currentImagePath() const;

    /// @return File name of the current image; the store key for its record.
    QString currentImageId() const;

    // =========================================================================
    // Classes and tools
    // =========================================================================

    QStringList availableClasses() const { return m_classes; }
    void setAvailableClasses(const QStringList& classes);
    AddClassResult addClass(const QString& name);

    QString currentLabel() const { return m_currentLabel; }
    void setCurrentLabel(const QString& label);

    ToolType tool() const { return m_tool; }
    void setTool(ToolType tool);

    // =========================================================================
    // Pointer input (view coordinates)
    // =========================================================================

    /**
     * @brief Left button draws (or picks in Select mode); right button pans.
     */
    void pointerPressed(QPointF pos, Qt::MouseButton button);
    void pointerMoved(QPointF pos, Qt::MouseButtons buttons);
    void pointerReleased(QPointF pos, Qt::MouseButton button);

    /**
     * @brief Zoom by one wheel step per notch at @p pos.
     * @param angleDelta Wheel angle delta; positive zooms in.
     */
    void wheelZoom(int angleDelta, QPointF pos);

    void zoomIn();
    void zoomOut();
    void resetView();

    /**
     * @brief Apply a (debounced) canvas size.
     */
    void canvasResized(QSize size);

    bool isPanning() const { return m_panning; }

    // =========================================================================
    // Annotations
    // =========================================================================

    QVector<Annotation> currentAnnotations() const;

    /**
     * @brief Topmost annotation whose outline passes within @p tolerance of @p viewPt.
     * @return Index in the current image's list, or -1.
     */
    int hitTest(QPointF viewPt, qreal tolerance = HIT_TOLERANCE) const;

    int hoveredIndex() const { return m_hoveredIndex; }

    bool deleteAnnotation(int index);
    bool clearCurrentAnnotations();

    // =========================================================================
    // Persistence
    // =========================================================================

    AnnotationStore::SaveResult save();
    bool isDirty() const { return m_store.isDirty(); }

    // =========================================================================
    // Components
    // =========================================================================

    const ViewTransform& transform() const { return m_transform; }
    const DrawingController& drawing() const { return m_drawing; }
    const AnnotationStore& store() const { return m_store; }

signals:
    /// @brief Any visible state changed; the canvas should repaint.
    void changed();

    /// @brief A different image is shown.
    void imageChanged(int index, int count);

    /// @brief Left click on an annotation in Select mode (confirm, then deleteAnnotation()).
    void annotationClicked(int index);

    /// @brief A finished shape was not stored.
    void annotationRejected(const QString& reason);

    /// @brief Non-fatal problem worth showing to the user.
    void warning(const QString& message);

private:
    void setHovered(int index);

    ViewTransform m_transform;
    AnnotationStore m_store;
    DrawingController m_drawing;

    QString m_folder;
    QStringList m_imageFiles;
    int m_currentIndex = -1;
    QImage m_image;

    QStringList m_classes;
    QString m_currentLabel;
    ToolType m_tool = ToolType::Rectangle;

    int m_hoveredIndex = -1;

    // Pan drag: offset is recomputed from the press position each move
    bool m_panning = false;
    QPointF m_panStartPos;
    QPointF m_panStartOffset;
};
