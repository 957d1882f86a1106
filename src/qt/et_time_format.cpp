#include <odds_chart/qt/et_time_format.h>

#include <QByteArray>
#include <QDateTime>
#include <QDebug>
#include <QLocale>
#include <QString>
#include <QTimeZone>

#include <cmath>

namespace odds::chart {

namespace {

const QTimeZone& eastern_zone()
{
    static const QTimeZone zone(QByteArrayLiteral("America/New_York"));
    return zone;
}

QDateTime to_eastern(double timestamp)
{
    const qint64 msecs = static_cast<qint64>(std::llround(timestamp * 1000.0));
    const QDateTime utc = QDateTime::fromMSecsSinceEpoch(msecs, QTimeZone::utc());
    const QTimeZone& zone = eastern_zone();
    return zone.isValid() ? utc.toTimeZone(zone) : utc;
}

QString format_eastern(double timestamp, const QString& pattern)
{
    static const QLocale en_us(QLocale::English, QLocale::UnitedStates);
    return en_us.toString(to_eastern(timestamp), pattern);
}

} // anonymous namespace

std::string format_et_time(double timestamp)
{
    return format_eastern(timestamp, QStringLiteral("h:mm ap")).toStdString();
}

std::string format_et_hover_time(double timestamp)
{
    return format_eastern(timestamp, QStringLiteral("MMM d, h:mm AP")).toStdString();
}

Chart_config make_qt_chart_config()
{
    Chart_config cfg = Chart_config::make_default();
    cfg.format_axis_time  = &format_et_time;
    cfg.format_hover_time = &format_et_hover_time;
    cfg.log_debug = [](const std::string& message) {
        qDebug().noquote() << QString::fromStdString(message);
    };
    cfg.log_error = [](const std::string& message) {
        qWarning().noquote() << QString::fromStdString(message);
    };
    return cfg;
}

} // namespace odds::chart
