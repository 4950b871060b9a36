#ifndef COMMANDTABLE_H
#define COMMANDTABLE_H

#include <QJsonObject>
#include <QJsonValue>
#include <QMap>
#include <QString>
#include <QStringList>
#include <functional>
#include <stdexcept>

class CommandError : public std::runtime_error
{
public:
    explicit CommandError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

// Operations the front-end may invoke by name.
class CommandTable
{
public:
    using Handler = std::function<QJsonValue(const QJsonObject &args)>;

    // Returns false if a command with that name already exists.
    bool add(const QString &name, Handler handler);

    bool contains(const QString &name) const;
    QStringList names() const;
    int size() const { return int(handlers_.size()); }
    bool isEmpty() const { return handlers_.isEmpty(); }

    // Throws CommandError for unknown commands.
    QJsonValue invoke(const QString &name, const QJsonObject &args) const;

private:
    QMap<QString, Handler> handlers_;
};

#endif // COMMANDTABLE_H
