// odds_chart Snapshot
// Headless render pass: builds the chart geometry for one market and prints
// a summary, optionally writing the geometry as an SVG file.
//
// Usage:
//   ./odds_chart_snapshot [options]
//
// Example:
//   ./odds_chart_snapshot --market mkt-3 --price 0.62 --scale 6H --svg chart.svg

#include <odds_chart/odds_chart.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stack>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* k_version = "1.0.0";
constexpr int k_exit_success = 0;
constexpr int k_exit_invalid_args = 1;
constexpr int k_exit_io_error = 2;

/// Configuration for a snapshot run
struct Snapshot_config {
    std::string market_id = "mkt-3";
    std::optional<double> price;
    bool is_live = false;
    double volume_btc = 0.0;
    std::string scale_key = "1D";
    odds::chart::Chart_variant variant = odds::chart::Chart_variant::DETAIL;
    std::optional<double> aspect;
    std::optional<double> hover_x;
    double now_seconds = 0.0;   // 0 = current time
    std::string svg_path;
    bool profile = false;
    bool quiet = false;
};

void print_version()
{
    std::cout << "odds_chart_snapshot version " << k_version
              << " (odds_chart " << odds::chart::k_version_string << ")\n";
}

void print_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [options]\n"
              << "\n"
              << "Builds the probability chart geometry for one Yes/No market.\n"
              << "\n"
              << "Options:\n"
              << "  --market <id>           Market id, seeds the history (default: mkt-3)\n"
              << "  --price <p>             Yes price in [0, 1] (default: none, 0.5 is used)\n"
              << "  --live                  Mark the market as live\n"
              << "  --volume <btc>          Traded volume shown in the footer (default: 0)\n"
              << "  --scale <key>           1H|3H|6H|12H|1D (default: 1D)\n"
              << "  --variant <name>        home|detail (default: detail)\n"
              << "  --aspect <ratio>        Chart aspect ratio (default: 3.2 home, 4.2 detail)\n"
              << "  --hover-x <x>           Hover cursor in plot units\n"
              << "  --now <unix seconds>    Right edge of the time window (default: now)\n"
              << "  --svg <path>            Write the geometry as SVG\n"
              << "  --profile               Print scope timings\n"
              << "  --quiet                 Suppress the summary\n"
              << "  --version               Show version information\n"
              << "  --help                  Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --market mkt-3 --price 0.62 --scale 6H\n"
              << "  " << program_name << " --variant home --hover-x 120 --svg hover.svg\n";
}

struct Parse_result {
    Snapshot_config config;
    bool success = true;
    std::string error_message;
};

Parse_result parse_args(int argc, char* argv[])
{
    Parse_result result;
    auto& config = result.config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--market" && i + 1 < argc) {
                config.market_id = argv[++i];
            }
            else if (arg == "--price" && i + 1 < argc) {
                config.price = std::stod(argv[++i]);
            }
            else if (arg == "--volume" && i + 1 < argc) {
                config.volume_btc = std::stod(argv[++i]);
            }
            else if (arg == "--live") {
                config.is_live = true;
            }
            else if (arg == "--scale" && i + 1 < argc) {
                config.scale_key = argv[++i];
            }
            else if (arg == "--variant" && i + 1 < argc) {
                std::string name = argv[++i];
                if (name == "home") {
                    config.variant = odds::chart::Chart_variant::HOME;
                }
                else if (name == "detail") {
                    config.variant = odds::chart::Chart_variant::DETAIL;
                }
                else {
                    result.success = false;
                    result.error_message = "Invalid variant '" + name + "'. Use 'home' or 'detail'.";
                    return result;
                }
            }
            else if (arg == "--aspect" && i + 1 < argc) {
                config.aspect = std::stod(argv[++i]);
            }
            else if (arg == "--hover-x" && i + 1 < argc) {
                config.hover_x = std::stod(argv[++i]);
            }
            else if (arg == "--now" && i + 1 < argc) {
                config.now_seconds = std::stod(argv[++i]);
            }
            else if (arg == "--svg" && i + 1 < argc) {
                config.svg_path = argv[++i];
            }
            else if (arg == "--profile") {
                config.profile = true;
            }
            else if (arg == "--quiet") {
                config.quiet = true;
            }
            else if (arg == "--help" || arg == "-h" || arg == "--version" || arg == "-v") {
                // Handled separately in main
            }
            else if (arg.rfind("--", 0) == 0) {
                result.success = false;
                result.error_message = "Unknown option: " + arg;
                return result;
            }
        }
        catch (const std::invalid_argument&) {
            result.success = false;
            result.error_message = "Invalid value for " + arg + ": not a valid number";
            return result;
        }
        catch (const std::out_of_range&) {
            result.success = false;
            result.error_message = "Value out of range for " + arg;
            return result;
        }
    }

    if (config.now_seconds == 0.0) {
        config.now_seconds = std::chrono::duration<double>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    return result;
}

std::string validate_config(const Snapshot_config& config)
{
    if (config.market_id.empty()) {
        return "Market id must not be empty";
    }
    if (config.price && !(*config.price >= 0.0 && *config.price <= 1.0)) {
        return "Price must be between 0.0 and 1.0";
    }
    if (!(config.volume_btc >= 0.0)) {
        return "Volume must not be negative";
    }
    if (!odds::chart::parse_time_scale(config.scale_key)) {
        return "Invalid scale '" + config.scale_key + "'. Use 1H, 3H, 6H, 12H or 1D.";
    }
    if (config.aspect && !(*config.aspect > 0.0)) {
        return "Aspect must be positive";
    }
    if (config.now_seconds < 0.0) {
        return "Time must not be negative";
    }
    return "";
}

/// Aggregating scope timer, printed with --profile.
class Scope_profiler : public odds::chart::Profiler {
public:
    void begin_scope(const char* name) override
    {
        std::string path = m_path.empty() ? std::string(name) : m_path.top() + "/" + name;
        m_path.push(path);
        m_start_times.push(std::chrono::steady_clock::now());
    }

    void end_scope() override
    {
        if (m_start_times.empty()) {
            return;
        }

        const double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - m_start_times.top()).count();
        m_start_times.pop();

        auto& stats = m_stats[m_path.top()];
        stats.calls++;
        stats.total_ms += elapsed_ms;
        m_path.pop();
    }

    void print(std::ostream& os) const
    {
        os << std::left << std::setw(52) << "Section" << " "
           << std::right << std::setw(5) << "Calls" << " "
           << std::setw(10) << "Total ms" << "\n";
        for (const auto& entry : m_stats) {
            os << std::left << std::setw(52) << entry.first << " "
               << std::right << std::setw(5) << entry.second.calls << " "
               << std::setw(10) << std::fixed << std::setprecision(3) << entry.second.total_ms << "\n";
        }
    }

private:
    struct Scope_stats {
        int calls = 0;
        double total_ms = 0.0;
    };

    std::map<std::string, Scope_stats> m_stats;
    std::stack<std::string> m_path;
    std::stack<std::chrono::steady_clock::time_point> m_start_times;
};

// -----------------------------------------------------------------------------
// SVG output
// -----------------------------------------------------------------------------

std::string svg_number(double v)
{
    return odds::chart::format_fixed(v, 2);
}

std::string svg_polyline_points(const std::vector<glm::dvec2>& points)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << svg_number(points[i].x) << ',' << svg_number(points[i].y);
    }
    return oss.str();
}

std::string svg_escape(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        switch (ch) {
            case '&': out += "&amp;";  break;
            case '<': out += "&lt;";   break;
            case '>': out += "&gt;";   break;
            case '"': out += "&quot;"; break;
            default:  out += ch;       break;
        }
    }
    return out;
}

void write_trail(std::ostream& os, const odds::chart::decoration_trail_t& trail, const char* color)
{
    os << "  <g fill=\"" << color << "\" opacity=\"" << svg_number(trail.opacity) << "\">\n";
    for (const auto& mark : trail.marks) {
        os << "    <circle cx=\"" << svg_number(mark.position.x)
           << "\" cy=\"" << svg_number(mark.position.y)
           << "\" r=\"" << svg_number(trail.scale * 2.0)
           << "\" transform=\"rotate(" << svg_number(mark.angle_deg) << ' '
           << svg_number(mark.position.x) << ' ' << svg_number(mark.position.y) << ")\"/>\n";
    }
    os << "  </g>\n";
}

void write_readout(
    std::ostream& os,
    const odds::chart::readout_pair_t& pair,
    const odds::chart::readout_block_t& block,
    const char* label,
    const char* color)
{
    const std::string outline = "\" stroke=\"#020617\" stroke-opacity=\"0.82\" stroke-width=\""
        + svg_number(pair.stroke_width) + "\" paint-order=\"stroke\" fill=\"" + color + "\">";
    os << "  <text x=\"" << svg_number(pair.x) << "\" y=\"" << svg_number(block.label_y)
       << "\" font-size=\"" << svg_number(pair.label_font) << outline << label << "</text>\n";
    os << "  <text x=\"" << svg_number(pair.x) << "\" y=\"" << svg_number(block.pct_y)
       << "\" font-size=\"" << svg_number(pair.pct_font) << outline << block.pct << "%</text>\n";
}

bool write_svg(const std::string& path, const odds::chart::chart_frame_t& frame)
{
    std::ofstream out(path);
    if (!out) {
        return false;
    }

    const auto& vp = frame.viewport;
    const auto& g  = frame.geometry;
    constexpr const char* k_yes_color = "#2f9e6b";
    constexpr const char* k_no_color  = "#d9534f";

    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 "
        << svg_number(vp.width) << ' ' << svg_number(vp.height) << "\">\n";

    for (const auto& line : g.guide_lines) {
        out << "  <line x1=\"" << svg_number(vp.left) << "\" y1=\"" << svg_number(line.y)
            << "\" x2=\"" << svg_number(vp.right) << "\" y2=\"" << svg_number(line.y)
            << "\" stroke=\"#8884\" stroke-width=\"0.2\" stroke-dasharray=\"1 1\"/>\n";
        out << "  <text x=\"" << svg_number(vp.width - 1.0) << "\" y=\"" << svg_number(line.y)
            << "\" font-size=\"4\" text-anchor=\"end\">" << svg_escape(line.text) << "</text>\n";
    }

    if (g.fade_rect) {
        out << "  <rect x=\"" << svg_number(g.fade_rect->x) << "\" y=\"" << svg_number(g.fade_rect->y)
            << "\" width=\"" << svg_number(g.fade_rect->width) << "\" height=\"" << svg_number(g.fade_rect->height)
            << "\" fill=\"#fff\" opacity=\"0.6\"/>\n";
    }

    write_trail(out, g.yes_trail, k_yes_color);
    write_trail(out, g.no_trail, k_no_color);

    out << "  <polyline fill=\"none\" stroke=\"" << k_yes_color << "\" stroke-width=\"0.9\" points=\""
        << svg_polyline_points(g.yes_points) << "\"/>\n";
    out << "  <polyline fill=\"none\" stroke=\"" << k_no_color << "\" stroke-width=\"0.9\" points=\""
        << svg_polyline_points(g.no_points) << "\"/>\n";

    out << "  <g opacity=\"" << svg_number(g.endpoint_opacity) << "\">\n"
        << "    <circle cx=\"" << svg_number(g.yes_end.x) << "\" cy=\"" << svg_number(g.yes_end.y)
        << "\" r=\"1.4\" fill=\"" << k_yes_color << "\"/>\n"
        << "    <circle cx=\"" << svg_number(g.no_end.x) << "\" cy=\"" << svg_number(g.no_end.y)
        << "\" r=\"1.4\" fill=\"" << k_no_color << "\"/>\n"
        << "  </g>\n";

    write_readout(out, g.readouts, g.readouts.no, "NO", k_no_color);
    write_readout(out, g.readouts, g.readouts.yes, "YES", k_yes_color);

    if (g.hover_active) {
        out << "  <line x1=\"" << svg_number(g.hover.x) << "\" y1=\"" << svg_number(vp.top)
            << "\" x2=\"" << svg_number(g.hover.x) << "\" y2=\"" << svg_number(vp.bottom)
            << "\" stroke=\"#555\" stroke-width=\"0.2\"/>\n";
    }
    if (g.hover_time_box) {
        const auto& box = *g.hover_time_box;
        out << "  <rect x=\"" << svg_number(box.x) << "\" y=\"" << svg_number(box.y)
            << "\" width=\"" << svg_number(box.width) << "\" height=\"" << svg_number(box.height)
            << "\" rx=\"1\" fill=\"#222\"/>\n";
        out << "  <text x=\"" << svg_number(box.text_x) << "\" y=\"" << svg_number(box.text_y)
            << "\" font-size=\"" << svg_number(box.font_size)
            << "\" stroke=\"#020617\" stroke-opacity=\"0.45\" stroke-width=\"" << svg_number(box.stroke_width)
            << "\" paint-order=\"stroke\" fill=\"#fff\" text-anchor=\"middle\">"
            << svg_escape(box.text) << "</text>\n";
    }

    for (const auto& label : frame.x_labels) {
        const double x = vp.left + label.fraction * vp.x_span();
        out << "  <text x=\"" << svg_number(x) << "\" y=\"" << svg_number(vp.height)
            << "\" font-size=\"4\" text-anchor=\"middle\">" << svg_escape(label.text) << "</text>\n";
    }

    out << "</svg>\n";
    return static_cast<bool>(out);
}

void print_frame_summary(const Snapshot_config& config, const odds::chart::chart_frame_t& frame, std::ostream& os)
{
    const auto& g = frame.geometry;
    os << "Market:       " << frame.market_id << (config.is_live ? " (live)" : "") << "\n"
       << "Scale:        " << odds::chart::time_scale_key(frame.time_scale) << "\n"
       << "Viewport:     " << svg_number(frame.viewport.width) << "x" << svg_number(frame.viewport.height)
       << " plot [" << svg_number(frame.viewport.left) << ", " << svg_number(frame.viewport.right) << "]\n"
       << "Points:       " << frame.display_series.size() << "\n"
       << "Legend:       Yes " << frame.legend_yes_pct << "% / No " << frame.legend_no_pct << "%\n"
       << "Volume:       " << frame.volume_label << "\n"
       << "Readouts:     yes top " << svg_number(g.readouts.yes.top_y)
       << ", no top " << svg_number(g.readouts.no.top_y) << "\n"
       << "Decorations:  yes " << g.yes_trail.marks.size() << ", no " << g.no_trail.marks.size() << "\n";
    if (g.hover_active) {
        os << "Hover:        x " << svg_number(g.hover.x) << ", t " << odds::chart::format_fixed(g.hover.t, 3)
           << ", value " << odds::chart::format_fixed(g.hover.value, 4) << "\n";
    }
    if (g.hover_time_box) {
        os << "Tooltip:      " << g.hover_time_box->text << "\n";
    }
    os << "X labels:    ";
    for (const auto& label : frame.x_labels) {
        os << " " << label.text;
    }
    os << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return k_exit_success;
        }
        if (arg == "--version" || arg == "-v") {
            print_version();
            return k_exit_success;
        }
    }

    Parse_result parse_result = parse_args(argc, argv);
    if (!parse_result.success) {
        std::cerr << "Error: " << parse_result.error_message << "\n";
        std::cerr << "Use --help for usage information.\n";
        return k_exit_invalid_args;
    }

    const Snapshot_config& config = parse_result.config;
    std::string validation_error = validate_config(config);
    if (!validation_error.empty()) {
        std::cerr << "Error: " << validation_error << "\n";
        return k_exit_invalid_args;
    }

    auto profiler = std::make_shared<Scope_profiler>();

    odds::chart::Chart_config chart_config = odds::chart::Chart_config::make_default();
    chart_config.log_error = [](const std::string& message) {
        std::cerr << message << "\n";
    };
    if (!config.quiet) {
        chart_config.log_debug = [](const std::string& message) {
            std::cerr << message << "\n";
        };
    }
    if (config.profile) {
        chart_config.profiler = profiler;
    }

    odds::chart::Chart_builder builder(chart_config);

    odds::chart::market_t market;
    market.id         = config.market_id;
    market.yes_price  = config.price;
    market.is_live    = config.is_live;
    market.volume_btc = config.volume_btc;

    odds::chart::view_state_t view;
    view.time_scale  = *odds::chart::parse_time_scale(config.scale_key);
    view.variant     = config.variant;
    view.now_seconds = config.now_seconds;
    if (config.aspect) {
        view.chart_aspect_home   = *config.aspect;
        view.chart_aspect_detail = *config.aspect;
    }
    if (config.hover_x) {
        view.hover.active_market_id = market.id;
        view.hover.hover_x          = config.hover_x;
    }

    const odds::chart::chart_frame_t frame = builder.build(market, view);

    if (!config.quiet) {
        print_frame_summary(config, frame, std::cout);
    }
    if (config.profile) {
        std::cout << "\n";
        profiler->print(std::cout);
    }

    if (!config.svg_path.empty()) {
        if (!write_svg(config.svg_path, frame)) {
            std::cerr << "Error writing SVG: " << config.svg_path << "\n";
            return k_exit_io_error;
        }
        if (config.quiet) {
            // In quiet mode, output the path for scripting
            std::cout << config.svg_path << "\n";
        }
    }

    return k_exit_success;
}
