#pragma once

#include <QObject>
#include <QStringList>

class QThreadPool;

namespace pixor::viewer {

//! Lower-case suffixes the viewer accepts.
const QStringList& supportedImageExtensions();
bool isSupportedImage(const QString& path);

/**
 * Resolves files and folders into a de-duplicated, naturally sorted list of
 * image paths. Directories are listed non-recursively unless @p recursive is
 * set; hidden entries are skipped. Runs synchronously on the calling thread.
 */
QStringList resolveImagePaths(const QStringList& inputs, bool recursive);

} // namespace pixor::viewer

/**
 * @brief Runs resolveImagePaths() off the GUI thread.
 *
 * Only the most recent request is reported; results of superseded requests
 * are dropped when they arrive.
 */
class ImageBatchLoader : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool busy READ busy NOTIFY busyChanged)
    Q_PROPERTY(bool recursive READ recursive WRITE setRecursive NOTIFY recursiveChanged)

public:
    explicit ImageBatchLoader(QObject* parent = nullptr);
    ~ImageBatchLoader() override;

    bool busy() const { return m_pending > 0; }
    bool recursive() const { return m_recursive; }
    void setRecursive(bool recursive);

    //! Starts a new request; returns its generation number.
    quint64 load(const QStringList& inputs);
    void cancel();

    void setThreadPoolForTesting(QThreadPool* pool);

signals:
    void loaded(const QStringList& paths, const QStringList& inputs);
    void busyChanged();
    void recursiveChanged();

private:
    QThreadPool* m_threadPool = nullptr;
    quint64 m_generation = 0;
    int m_pending = 0;
    bool m_recursive = false;
};
