#include "commandtable.h"

bool CommandTable::add(const QString &name, Handler handler)
{
    if (name.isEmpty() || !handler || handlers_.contains(name))
        return false;
    handlers_.insert(name, std::move(handler));
    return true;
}

bool CommandTable::contains(const QString &name) const
{
    return handlers_.contains(name);
}

QStringList CommandTable::names() const
{
    return handlers_.keys();
}

QJsonValue CommandTable::invoke(const QString &name, const QJsonObject &args) const
{
    auto it = handlers_.constFind(name);
    if (it == handlers_.constEnd())
        throw CommandError(QStringLiteral("command %1 not found").arg(name));
    return it.value()(args);
}
