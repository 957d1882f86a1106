#include <odds_chart/qt/chart_view_state.h>
#include <odds_chart/core/constants.h>

#include <algorithm>
#include <cmath>

namespace odds::chart {

namespace {
constexpr double k_aspect_eps = 1e-12;
}

Chart_view_state::Chart_view_state(QObject* parent)
    : QObject(parent)
{}

Time_scale Chart_view_state::time_scale() const
{
    return m_time_scale;
}

QString Chart_view_state::time_scale_key() const
{
    return QString::fromLatin1(odds::chart::time_scale_key(m_time_scale));
}

double Chart_view_state::chart_aspect_home() const
{
    return m_chart_aspect_home;
}

double Chart_view_state::chart_aspect_detail() const
{
    return m_chart_aspect_detail;
}

void Chart_view_state::set_chart_aspect_home(double v)
{
    if (!std::isfinite(v) || v <= 0.0) {
        return;
    }
    if (std::abs(v - m_chart_aspect_home) <= k_aspect_eps) {
        return;
    }
    m_chart_aspect_home = v;
    emit chart_aspect_changed();
}

void Chart_view_state::set_chart_aspect_detail(double v)
{
    if (!std::isfinite(v) || v <= 0.0) {
        return;
    }
    if (std::abs(v - m_chart_aspect_detail) <= k_aspect_eps) {
        return;
    }
    m_chart_aspect_detail = v;
    emit chart_aspect_changed();
}

QString Chart_view_state::hover_market_id() const
{
    return m_hover_market_id;
}

bool Chart_view_state::hover_active() const
{
    return m_hover_active;
}

double Chart_view_state::hover_x() const
{
    return m_hover_x;
}

void Chart_view_state::set_time_scale(const QString& key)
{
    const QByteArray utf8 = key.toUtf8();
    const auto parsed = parse_time_scale(std::string_view(utf8.constData(), static_cast<std::size_t>(utf8.size())));
    if (!parsed) {
        return;
    }

    // Any scale selection drops the hover, even when the scale stays.
    clear_hover();
    if (*parsed == m_time_scale) {
        return;
    }

    m_time_scale = *parsed;
    emit time_scale_changed();
}

void Chart_view_state::update_hover_from_pointer(
    const QString& market_id,
    double pointer_x,
    double element_width,
    double plot_width,
    double plot_left,
    double plot_right)
{
    if (!std::isfinite(pointer_x) || !std::isfinite(element_width) ||
        !std::isfinite(plot_width) || !std::isfinite(plot_left) || !std::isfinite(plot_right))
    {
        return;
    }
    if (element_width <= 0.0 || plot_width <= 0.0) {
        return;
    }

    const double relative = std::clamp(pointer_x / element_width * plot_width, 0.0, plot_width);
    const double next_x   = std::clamp(relative, plot_left, std::max(plot_left, plot_right));

    if (m_hover_active && m_hover_market_id == market_id &&
        std::abs(next_x - m_hover_x) < constants::k_hover_dead_band)
    {
        return;
    }

    m_hover_market_id = market_id;
    m_hover_x         = next_x;
    m_hover_active    = true;
    emit hover_changed();
}

void Chart_view_state::clear_hover()
{
    if (!m_hover_active && m_hover_market_id.isEmpty()) {
        return;
    }
    m_hover_market_id.clear();
    m_hover_x      = 0.0;
    m_hover_active = false;
    emit hover_changed();
}

view_state_t Chart_view_state::snapshot(Chart_variant variant, double now_seconds) const
{
    view_state_t view;
    view.time_scale          = m_time_scale;
    view.variant             = variant;
    view.chart_aspect_home   = m_chart_aspect_home;
    view.chart_aspect_detail = m_chart_aspect_detail;
    view.now_seconds         = now_seconds;
    if (m_hover_active) {
        view.hover.active_market_id = m_hover_market_id.toStdString();
        view.hover.hover_x          = m_hover_x;
    }
    return view;
}

} // namespace odds::chart
