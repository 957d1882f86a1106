#pragma once

// odds_chart - Core Constants
// Generation and layout constants used by the core library.

namespace odds::chart::constants {

// Series generation
constexpr int    k_total_hours          = 24;
constexpr int    k_base_points_per_hour = 12;
constexpr int    k_base_series_count    = k_total_hours * k_base_points_per_hour + 1;
constexpr int    k_seed_modulus         = 97;
constexpr double k_probability_min      = 0.02;
constexpr double k_probability_max      = 0.98;
constexpr double k_default_probability  = 0.5;

constexpr double k_transition_start     = 0.88;
constexpr double k_micro_wave_cycles    = 22.0;
constexpr double k_micro_wave_phase     = 0.117;
constexpr double k_micro_wave_late_t    = 0.8;
constexpr double k_micro_wave_late_amp  = 0.03;
constexpr double k_micro_wave_early_amp = 0.018;

constexpr int    k_jump_every           = 20;
constexpr double k_jump_amp             = 0.18;
constexpr double k_drift_pull           = 0.2;
constexpr int    k_coarse_noise_every   = 4;
constexpr double k_coarse_noise_amp     = 0.03;
constexpr double k_fine_noise_amp       = 0.004;
constexpr int    k_real_step_every      = 3;
constexpr double k_jitter_amp           = 0.0028;

// Plot frame
constexpr double k_chart_height   = 100.0;
constexpr double k_aspect_min     = 1.2;
constexpr double k_aspect_max     = 8.0;
constexpr double k_plot_left      = 2.0;
constexpr double k_plot_inset_y   = 2.5;

// Curve separation
constexpr double k_min_series_separation = 6.2;
constexpr double k_curve_edge_inset      = 0.9;

// Readouts
constexpr double k_readout_edge_inset    = 0.6;
constexpr double k_readout_anchor_lift   = 0.8;
constexpr double k_readout_extra_gap     = 1.4;
constexpr double k_readout_token_lift    = 0.96;
constexpr double k_readout_min_x_inset   = 4.0;
constexpr double k_readout_max_x_inset   = 2.2;

// Decoration trail
constexpr double k_trail_step          = 28.0;
constexpr double k_trail_start_inset   = 0.0;
constexpr double k_trail_end_inset     = 14.0;
constexpr double k_trail_tail_fraction = 0.35;
constexpr double k_trail_lateral       = 1.05;
constexpr double k_trail_tilt_deg      = 9.0;
constexpr double k_trail_min_segment   = 0.001;
constexpr double k_trail_mark_scale    = 0.94;
constexpr double k_trail_mark_width    = 5.2;
constexpr double k_trail_mark_viewbox  = 90.0;
constexpr double k_trail_opacity_live  = 0.68;
constexpr double k_trail_opacity_idle  = 0.54;
constexpr double k_endpoint_skip_r     = 3.5;
constexpr double k_hover_skip_r        = 3.3;

// Hover
constexpr double k_hover_pulse_t        = 0.985;
constexpr double k_hover_endpoint_alpha = 0.4;

// Hover tooltip
constexpr double k_tooltip_anchor_inset = 18.0;
constexpr double k_tooltip_min_width    = 70.0;
constexpr double k_tooltip_max_width    = 178.0;
constexpr double k_tooltip_char_width   = 3.4;
constexpr double k_tooltip_padding      = 18.0;
constexpr double k_tooltip_edge_inset   = 1.2;
constexpr double k_tooltip_height       = 15.8;
constexpr double k_tooltip_top_inset    = 0.25;
constexpr double k_tooltip_baseline     = 2.8;

// Pointer tracking
constexpr double k_hover_dead_band = 0.06;

} // namespace odds::chart::constants
