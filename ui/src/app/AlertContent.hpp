#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>

//! Title and body of a user-facing alert, shared by every controller that reports failures.
struct AlertContent {
    Q_GADGET
    Q_PROPERTY(QString title MEMBER title)
    Q_PROPERTY(QString message MEMBER message)

public:
    QString title;
    QString message;

    bool isEmpty() const { return title.isEmpty() && message.isEmpty(); }
    bool operator==(const AlertContent& other) const { return title == other.title && message == other.message; }
    bool operator!=(const AlertContent& other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(AlertContent)
