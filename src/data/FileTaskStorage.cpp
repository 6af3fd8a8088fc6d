#include "slotplanner/data/FileTaskStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

#include "slotplanner/core/Logging.hpp"

namespace slotplanner {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QString withBraces = QStringLiteral("{%1}").arg(value);
    QUuid id(withBraces);
    if (id.isNull()) {
        return QUuid::createUuid();
    }
    return id;
}
} // namespace

FileTaskStorage::FileTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &FileTaskStorage::filePath() const
{
    return m_filePath;
}

const QHash<QUuid, Task> &FileTaskStorage::tasks() const
{
    return m_tasks;
}

const QVector<QUuid> &FileTaskStorage::order() const
{
    return m_order;
}

std::optional<Task> FileTaskStorage::addOrUpdateTask(Task task)
{
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    const auto previous = m_tasks.constFind(task.id);
    const std::optional<Task> replaced =
        previous != m_tasks.constEnd() ? std::optional<Task>(previous.value()) : std::nullopt;
    if (!replaced) {
        m_order.append(task.id);
    }
    m_tasks.insert(task.id, task);
    save();
    if (!m_lastSaveSucceeded) {
        // Keep memory in line with the file.
        if (replaced) {
            m_tasks.insert(task.id, *replaced);
        } else {
            m_tasks.remove(task.id);
            m_order.removeAll(task.id);
        }
        return std::nullopt;
    }
    return task;
}

bool FileTaskStorage::removeTask(const QUuid &id)
{
    const int position = m_order.indexOf(id);
    if (position < 0) {
        return false;
    }
    const Task removed = m_tasks.take(id);
    m_order.remove(position);
    save();
    if (!m_lastSaveSucceeded) {
        m_tasks.insert(id, removed);
        m_order.insert(position, id);
        return false;
    }
    return true;
}

bool FileTaskStorage::lastSaveSucceeded() const
{
    return m_lastSaveSucceeded;
}

void FileTaskStorage::load()
{
    m_tasks.clear();
    m_order.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "Cannot open task file" << m_filePath << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    bool inTodo = false;
    Task currentTask;

    auto finalizeTask = [&]() {
        if (currentTask.id.isNull()) {
            currentTask.id = QUuid::createUuid();
        }
        if (!m_tasks.contains(currentTask.id)) {
            m_order.append(currentTask.id);
        }
        m_tasks.insert(currentTask.id, currentTask);
        currentTask = Task{};
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VTODO")) {
            inTodo = true;
            currentTask = Task{};
            return;
        }
        if (line == QLatin1String("END:VTODO")) {
            if (inTodo) {
                finalizeTask();
            }
            inTodo = false;
            return;
        }
        if (!inTodo) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString value = decodeText(rawValue);

        if (name == QLatin1String("UID")) {
            currentTask.id = parseUid(value);
        } else if (name == QLatin1String("SUMMARY")) {
            currentTask.title = value;
        } else if (name == QLatin1String("DUE")) {
            currentTask.deadline = QDate::fromString(rawValue.left(8), DATE_FORMAT);
        } else if (name == QLatin1String("X-SLOTPLANNER-DURATION")) {
            currentTask.durationMinutes = rawValue.toInt();
        } else if (name == QLatin1String("X-SLOTPLANNER-IMPORTANCE")) {
            if (const auto importance = importanceFromString(value)) {
                currentTask.importance = *importance;
            } else {
                qCWarning(lcStorage) << "Unknown importance" << value << "in" << m_filePath;
            }
        } else if (name == QLatin1String("X-SLOTPLANNER-PRIORITY")) {
            if (const auto priority = priorityFromString(value)) {
                currentTask.priority = *priority;
            } else {
                qCWarning(lcStorage) << "Unknown priority" << value << "in" << m_filePath;
            }
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }
    qCDebug(lcStorage) << "Loaded" << m_tasks.size() << "tasks from" << m_filePath;
}

void FileTaskStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcStorage) << "Cannot create directory for task file" << m_filePath;
        m_lastSaveSucceeded = false;
        return;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "Cannot write task file" << m_filePath << file.errorString();
        m_lastSaveSucceeded = false;
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Slot Planner//EN\n";

    for (const QUuid &id : m_order) {
        const Task task = m_tasks.value(id);
        stream << "BEGIN:VTODO\n";
        stream << "UID:" << prepareUid(task.id) << '\n';
        stream << "SUMMARY:" << encodeText(task.title) << '\n';
        if (task.deadline.isValid()) {
            stream << "DUE;VALUE=DATE:" << task.deadline.toString(DATE_FORMAT) << '\n';
        }
        stream << "X-SLOTPLANNER-DURATION:" << task.durationMinutes << '\n';
        stream << "X-SLOTPLANNER-IMPORTANCE:" << encodeText(importanceToString(task.importance)) << '\n';
        stream << "X-SLOTPLANNER-PRIORITY:" << encodeText(priorityToString(task.priority)) << '\n';
        stream << "END:VTODO\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    m_lastSaveSucceeded = file.commit();
    if (!m_lastSaveSucceeded) {
        qCWarning(lcStorage) << "Failed to commit task file" << m_filePath << file.errorString();
    }
}

QString FileTaskStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileTaskStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch != '\\' || i + 1 == text.size()) {
            decoded.append(ch);
            continue;
        }
        const QChar next = text.at(++i);
        if (next == 'n' || next == 'N') {
            decoded.append('\n');
        } else {
            // "\\", "\," and "\;" stand for the character itself.
            decoded.append(next);
        }
    }
    return decoded;
}

} // namespace data
} // namespace slotplanner
