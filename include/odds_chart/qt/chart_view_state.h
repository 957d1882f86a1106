#pragma once

// odds_chart - Chart View State
// Externally-mutable view state shared by every chart on a page: the
// selected time scale, the two aspect ratios and the pointer hover.
// This QObject lives on the GUI thread; render passes take a snapshot().

#include <odds_chart/core/types.h>

#include <QObject>
#include <QString>

namespace odds::chart {

class Chart_view_state : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString time_scale READ time_scale_key WRITE set_time_scale NOTIFY time_scale_changed)
    Q_PROPERTY(double chart_aspect_home READ chart_aspect_home WRITE set_chart_aspect_home NOTIFY chart_aspect_changed)
    Q_PROPERTY(double chart_aspect_detail READ chart_aspect_detail WRITE set_chart_aspect_detail NOTIFY chart_aspect_changed)
    Q_PROPERTY(QString hover_market_id READ hover_market_id NOTIFY hover_changed)
    Q_PROPERTY(bool hover_active READ hover_active NOTIFY hover_changed)
    Q_PROPERTY(double hover_x READ hover_x NOTIFY hover_changed)

public:
    explicit Chart_view_state(QObject* parent = nullptr);

    Time_scale time_scale() const;
    QString time_scale_key() const;

    double chart_aspect_home() const;
    double chart_aspect_detail() const;
    void set_chart_aspect_home(double v);
    void set_chart_aspect_detail(double v);

    QString hover_market_id() const;
    bool hover_active() const;
    double hover_x() const;

    /// Accepts "1H", "3H", "6H", "12H" and "1D"; anything else is ignored.
    /// A change of scale drops the hover.
    Q_INVOKABLE void set_time_scale(const QString& key);

    Q_INVOKABLE void update_hover_from_pointer(
        const QString& market_id,
        double pointer_x,
        double element_width,
        double plot_width,
        double plot_left,
        double plot_right);

    Q_INVOKABLE void clear_hover();

    view_state_t snapshot(Chart_variant variant, double now_seconds) const;

signals:
    void time_scale_changed();
    void chart_aspect_changed();
    void hover_changed();

private:
    Time_scale m_time_scale          = Time_scale::D1;
    double     m_chart_aspect_home   = 3.2;
    double     m_chart_aspect_detail = 4.2;

    QString m_hover_market_id;
    bool    m_hover_active = false;
    double  m_hover_x      = 0.0;
};

} // namespace odds::chart
