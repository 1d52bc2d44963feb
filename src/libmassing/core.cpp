// =====================================================================
//  src/libmassing/core.cpp -- Library initialization
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "massing/core.h"

#include <QLoggingCategory>
#include <QStringList>
#include <QtGlobal>

namespace massing {

namespace {

bool gInitialized = false;
bool gDebugLoggingEnabled = false;

bool isEnabledFlag(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QLatin1String("1") || normalized == QLatin1String("true") ||
           normalized == QLatin1String("yes") || normalized == QLatin1String("on");
}

QStringList debugCategoriesFromEnvironment()
{
    const QString configured =
        qEnvironmentVariable("MASSING_LOG_DEBUG_CATEGORIES").trimmed();

    QStringList categories;
    for (const QString& token : configured.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty()) {
            categories.append(category);
        }
    }
    categories.removeDuplicates();
    return categories;
}

void applyLoggingRules()
{
    gDebugLoggingEnabled = isEnabledFlag(qEnvironmentVariable("MASSING_LOG_DEBUG"));

    QStringList rules;
    rules << QStringLiteral("massing.*.info=true");
    rules << QStringLiteral("massing.*.warning=true");
    rules << QStringLiteral("massing.*.critical=true");

    if (gDebugLoggingEnabled) {
        rules << QStringLiteral("massing.*.debug=true");
    } else {
        rules << QStringLiteral("massing.*.debug=false");
        for (const QString& category : debugCategoriesFromEnvironment()) {
            rules << QStringLiteral("%1.debug=true").arg(category);
        }
    }

    QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
}

}  // anonymous namespace

const char* version()
{
    return "0.1.0";
}

bool initialize()
{
    if (gInitialized) {
        return true;
    }

    applyLoggingRules();
    gInitialized = true;
    return true;
}

void shutdown()
{
    if (!gInitialized) return;

    QLoggingCategory::setFilterRules(QString());
    gDebugLoggingEnabled = false;
    gInitialized = false;
}

bool debugLoggingEnabled()
{
    return gDebugLoggingEnabled;
}

}  // namespace massing
