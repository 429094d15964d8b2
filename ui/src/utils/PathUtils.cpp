#include "PathUtils.hpp"

#include <QByteArray>
#include <QCollator>
#include <QDir>
#include <QFileInfo>
#include <QUrl>
#include <QtGlobal>

namespace {

bool appendVariable(const QString& name, QString& result)
{
    if (name.isEmpty())
        return false;
    const QByteArray nameBytes = name.toUtf8();
    if (!qEnvironmentVariableIsSet(nameBytes.constData()))
        return false;
    result.append(qEnvironmentVariable(nameBytes.constData()));
    return true;
}

int identifierEnd(const QString& input, int start)
{
    int end = start;
    while (end < input.size()) {
        const QChar candidate = input.at(end);
        if (!candidate.isLetterOrNumber() && candidate != QLatin1Char('_'))
            break;
        ++end;
    }
    return end;
}

const QCollator& naturalCollator()
{
    // QCollator is reentrant only; the batch loader sorts on worker threads.
    thread_local const QCollator collator = [] {
        QCollator c;
        c.setNumericMode(true);
        c.setCaseSensitivity(Qt::CaseInsensitive);
        return c;
    }();
    return collator;
}

} // namespace

namespace pixor::utils {

QString expandEnvironmentPlaceholders(const QString& input)
{
    QString result;
    result.reserve(input.size());

    int index = 0;
    while (index < input.size()) {
        const QChar ch = input.at(index);
        if (ch == QLatin1Char('$') && index + 1 < input.size()) {
            if (input.at(index + 1) == QLatin1Char('{')) {
                const int end = input.indexOf(QLatin1Char('}'), index + 2);
                if (end > index + 2) {
                    if (!appendVariable(input.mid(index + 2, end - index - 2), result))
                        result.append(input.mid(index, end - index + 1));
                    index = end + 1;
                    continue;
                }
            } else {
                const int end = identifierEnd(input, index + 1);
                if (end > index + 1) {
                    if (!appendVariable(input.mid(index + 1, end - index - 1), result))
                        result.append(input.mid(index, end - index));
                    index = end;
                    continue;
                }
            }
        } else if (ch == QLatin1Char('%')) {
            const int end = input.indexOf(QLatin1Char('%'), index + 1);
            if (end > index + 1) {
                if (!appendVariable(input.mid(index + 1, end - index - 1), result))
                    result.append(input.mid(index, end - index + 1));
                index = end + 1;
                continue;
            }
        }

        result.append(ch);
        ++index;
    }

    return result;
}

QString expandPath(const QString& path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty())
        return {};

    QString expanded = expandEnvironmentPlaceholders(trimmed);

    if (expanded.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive)) {
        const QUrl url(expanded);
        if (url.isValid() && url.isLocalFile())
            expanded = url.toLocalFile();
    }

    if (expanded == QStringLiteral("~"))
        expanded = QDir::homePath();
    else if (expanded.startsWith(QStringLiteral("~/")))
        expanded = QDir::homePath() + expanded.mid(1);

    if (QFileInfo(expanded).isRelative())
        expanded = QDir::current().absoluteFilePath(expanded);

    return QDir::cleanPath(expanded);
}

QString standardizedPath(const QString& path)
{
    if (path.isEmpty())
        return {};
    QString local = path;
    if (local.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive))
        local = QUrl(local).toLocalFile();
    return QDir::cleanPath(QFileInfo(local).absoluteFilePath());
}

int naturalCompare(const QString& lhs, const QString& rhs)
{
    const int result = naturalCollator().compare(lhs, rhs);
    if (result != 0)
        return result;
    // Collation can treat distinct strings as equal; keep the order total.
    return QString::compare(lhs, rhs, Qt::CaseSensitive);
}

bool naturalLessThan(const QString& lhs, const QString& rhs)
{
    return naturalCompare(lhs, rhs) < 0;
}

} // namespace pixor::utils
