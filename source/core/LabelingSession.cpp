#include "LabelingSession.h"
#include "LabelSettings.h"
#include "../batch/ImageDiscovery.h"

#include <QDir>
#include <QFileInfo>
#include <QImageReader>
#include <QDebug>

LabelingSession::LabelingSession(QObject* parent)
    : QObject(parent)
    , m_classes(LabelSettings::labelClasses())
{
    if (!m_classes.isEmpty()) {
        m_currentLabel = m_classes.first();
    }
}

// ============================================================================
// Folder and navigation
// ============================================================================

int LabelingSession::openFolder(const QString& folder)
{
    const QString absFolder = QFileInfo(folder).absoluteFilePath();

    if (absFolder != m_folder) {
        // Different folder: records of the old one are discarded
        m_store.reset();
        m_currentIndex = -1;
        m_folder = absFolder;
    }

    m_imageFiles = BatchOps::discoverFiles(m_folder, BatchOps::labelingImageExtensions());

    if (m_imageFiles.isEmpty()) {
        m_currentIndex = -1;
        m_image = QImage();
        m_transform.reset();
        m_drawing.cancel();
        m_hoveredIndex = -1;
        emit warning(tr("No compatible images found in %1").arg(m_folder));
        emit imageChanged(-1, 0);
        emit changed();
        return 0;
    }

    const int index = (m_currentIndex >= 0 && m_currentIndex < m_imageFiles.size())
                      ? m_currentIndex : 0;
    QString err;
    if (!loadImage(index, &err)) {
        emit warning(err);
    }
    return m_imageFiles.size();
}

bool LabelingSession::loadImage(int index, QString* errorMessage)
{
    if (index < 0 || index >= m_imageFiles.size()) {
        if (errorMessage) {
            *errorMessage = tr("Image %1 is out of range").arg(index + 1);
        }
        return false;
    }

    const QString path = m_imageFiles.at(index);
    // Raw pixel frame, no EXIF rotation: records and masks share this size
    QImageReader reader(path);
    reader.setAutoTransform(false);
    QImage image = reader.read();
    if (image.isNull()) {
        if (errorMessage) {
            *errorMessage = tr("Could not load image %1: %2").arg(path, reader.errorString());
        }
        qWarning() << "LabelingSession::loadImage: cannot decode" << path << reader.errorString();
        return false;
    }

    m_drawing.cancel();
    m_panning = false;
    m_hoveredIndex = -1;
    m_currentIndex = index;
    m_image = image;

    QString loadError;
    const QString imageId = currentImageId();
    if (m_store.load(imageId, recordDir(), &loadError) == AnnotationStore::LoadStatus::ParseError) {
        emit warning(tr("Could not load annotations for %1: %2").arg(imageId, loadError));
    }

    m_transform.fitToCanvas(m_transform.canvasSize(), m_image.size());

#ifdef QT_DEBUG
    qDebug() << "LabelingSession::loadImage:" << imageId << m_image.size()
             << m_store.annotations(imageId).size() << "annotations";
#endif

    emit imageChanged(m_currentIndex, m_imageFiles.size());
    emit changed();
    return true;
}

bool LabelingSession::nextImage()
{
    if (m_currentIndex + 1 >= m_imageFiles.size()) {
        return false;
    }
    QString err;
    if (!loadImage(m_currentIndex + 1, &err)) {
        emit warning(err);
        return false;
    }
    return true;
}

bool LabelingSession::previousImage()
{
    if (m_currentIndex <= 0) {
        return false;
    }
    QString err;
    if (!loadImage(m_currentIndex - 1, &err)) {
        emit warning(err);
        return false;
    }
    return true;
}

bool LabelingSession::jumpToImage(int number, QString* errorMessage)
{
    if (m_imageFiles.isEmpty()) {
        if (errorMessage) {
            *errorMessage = tr("Open a folder with images first.");
        }
        return false;
    }
    if (number < 1 || number > m_imageFiles.size()) {
        if (errorMessage) {
            *errorMessage = tr("Enter a number between 1 and %1.").arg(m_imageFiles.size());
        }
        return false;
    }
    return loadImage(number - 1, errorMessage);
}

QString LabelingSession::recordDir() const
{
    if (m_folder.isEmpty()) {
        return QString();
    }
    return QDir(m_folder).filePath(QLatin1String(RECORD_SUBDIR));
}

QString LabelingSession::currentImagePath() const
{
    if (m_currentIndex < 0 || m_currentIndex >= m_imageFiles.size()) {
        return QString();
    }
    return m_imageFiles.at(m_currentIndex);
}

QString LabelingSession::currentImageId() const
{
    const QString path = currentImagePath();
    return path.isEmpty() ? QString() : QFileInfo(path).fileName();
}

// ============================================================================
// Classes and tools
// ============================================================================

void LabelingSession::setAvailableClasses(const QStringList& classes)
{
    m_classes.clear();
    for (const QString& c : classes) {
        const QString name = c.trimmed();
        if (!name.isEmpty() && !m_classes.contains(name)) {
            m_classes << name;
        }
    }
    if (!m_classes.contains(m_currentLabel)) {
        m_currentLabel = m_classes.isEmpty() ? QString() : m_classes.first();
    }
    emit changed();
}

LabelingSession::AddClassResult LabelingSession::addClass(const QString& name)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        return AddClassResult::Empty;
    }
    if (m_classes.contains(trimmed)) {
        m_currentLabel = trimmed;
        emit changed();
        return AddClassResult::Exists;
    }
    m_classes << trimmed;
    m_currentLabel = trimmed;
    LabelSettings::setLabelClasses(m_classes);
    emit changed();
    return AddClassResult::Added;
}

void LabelingSession::setCurrentLabel(const QString& label)
{
    m_currentLabel = label.trimmed();
}

void LabelingSession::setTool(ToolType tool)
{
    if (m_tool == tool) {
        return;
    }
    m_tool = tool;
    m_drawing.cancel();
    m_hoveredIndex = -1;
    emit changed();
}

// ============================================================================
// Pointer input
// ============================================================================

void LabelingSession::pointerPressed(QPointF pos, Qt::MouseButton button)
{
    if (!hasImage()) {
        return;
    }

    if (button == Qt::RightButton) {
        m_drawing.cancel();
        m_panning = true;
        m_panStartPos = pos;
        m_panStartOffset = m_transform.offset();
        emit changed();
        return;
    }
    if (button != Qt::LeftButton || m_panning) {
        return;
    }

    if (m_tool == ToolType::Select) {
        const int hit = hitTest(pos);
        setHovered(hit);
        if (hit >= 0) {
            emit annotationClicked(hit);
        }
        return;
    }

    if (m_drawing.press(m_tool, m_currentLabel, pos)) {
        emit changed();
    }
}

void LabelingSession::pointerMoved(QPointF pos, Qt::MouseButtons buttons)
{
    if (!hasImage()) {
        return;
    }

    if (m_panning) {
        // Target offset from the press position, so clamping never accumulates drift
        const QPointF target = m_panStartOffset + (pos - m_panStartPos);
        if (m_transform.pan(target - m_transform.offset())) {
            emit changed();
        }
        return;
    }

    if (m_drawing.isDrawing() && (buttons & Qt::LeftButton)) {
        m_drawing.move(pos);
        emit changed();
        return;
    }

    if (m_tool == ToolType::Select) {
        setHovered(hitTest(pos));
    }
}

void LabelingSession::pointerReleased(QPointF pos, Qt::MouseButton button)
{
    if (button == Qt::RightButton) {
        if (m_panning) {
            m_panning = false;
            emit changed();
        }
        return;
    }
    if (button != Qt::LeftButton || !m_drawing.isDrawing()) {
        return;
    }

    const DrawingController::Result result = m_drawing.release(pos, m_transform);
    if (!result.committed) {
        emit annotationRejected(DrawingController::rejectionText(result.rejection));
        emit changed();
        return;
    }

    QString reason;
    if (!m_store.append(currentImageId(), result.annotation, m_image.size(), &reason)) {
        emit annotationRejected(reason);
    }
    emit changed();
}

void LabelingSession::wheelZoom(int angleDelta, QPointF pos)
{
    if (angleDelta == 0) {
        return;
    }
    const qreal factor = angleDelta > 0 ? ZOOM_WHEEL_FACTOR : 1.0 / ZOOM_WHEEL_FACTOR;
    if (m_transform.adjustZoom(factor, pos)) {
        emit changed();
    }
}

void LabelingSession::zoomIn()
{
    const QSize canvas = m_transform.canvasSize();
    const QPointF center(canvas.width() / 2.0, canvas.height() / 2.0);
    if (m_transform.adjustZoom(ZOOM_BUTTON_FACTOR, center)) {
        emit changed();
    }
}

void LabelingSession::zoomOut()
{
    const QSize canvas = m_transform.canvasSize();
    const QPointF center(canvas.width() / 2.0, canvas.height() / 2.0);
    if (m_transform.adjustZoom(1.0 / ZOOM_BUTTON_FACTOR, center)) {
        emit changed();
    }
}

void LabelingSession::resetView()
{
    if (m_transform.resetView()) {
        emit changed();
    }
}

void LabelingSession::canvasResized(QSize size)
{
    if (m_transform.onCanvasResize(size)) {
        emit changed();
    }
}

// ============================================================================
// Annotations
// ============================================================================

QVector<Annotation> LabelingSession::currentAnnotations() const
{
    return m_store.annotations(currentImageId());
}

int LabelingSession::hitTest(QPointF viewPt, qreal tolerance) const
{
    if (!hasImage() || !m_transform.isLaidOut()) {
        return -1;
    }

    const QVector<Annotation> anns = currentAnnotations();

    // Topmost first: later annotations are painted over earlier ones
    for (int i = anns.size() - 1; i >= 0; --i) {
        const Annotation& a = anns.at(i);
        QVector<QPointF> viewPts;
        viewPts.reserve(a.points.size());
        for (const QPointF& p : a.points) {
            viewPts.append(m_transform.originalToView(p));
        }
        if (Annotation::outlineDistance(a.type, viewPts, viewPt) <= tolerance) {
            return i;
        }
    }
    return -1;
}

bool LabelingSession::deleteAnnotation(int index)
{
    if (!m_store.deleteAt(currentImageId(), index)) {
        return false;
    }
    m_hoveredIndex = -1;
    emit changed();
    return true;
}

bool LabelingSession::clearCurrentAnnotations()
{
    if (!m_store.clear(currentImageId(), m_image.size())) {
        return false;
    }
    m_hoveredIndex = -1;
    emit changed();
    return true;
}

void LabelingSession::setHovered(int index)
{
    if (m_hoveredIndex != index) {
        m_hoveredIndex = index;
        emit changed();
    }
}

// ============================================================================
// Persistence
// ============================================================================

AnnotationStore::SaveResult LabelingSession::save()
{
    AnnotationStore::SaveResult result;
    if (m_folder.isEmpty()) {
        return result;
    }

    result = m_store.save(recordDir());
    for (const QString& err : result.errors) {
        emit warning(err);
    }
    emit changed();
    return result;
}
