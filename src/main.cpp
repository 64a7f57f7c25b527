/// @file src/main.cpp
/// @brief chassis CLI entry point.
///
/// Usage:
///   chassis lengths <csv>                  Damper length per row
///   chassis rank    <csv> <scope>          Rank by LF/RF/LR/RR/Front/Rear/Overall
///   chassis summary <csv> <center|clip>    Mean lengths per center section or clip
///   chassis lineup  <csv>                  Assign clips to center sections
///   chassis correlate <csv> <attr|corner> <corner>
///                                          Pearson correlation of damper lengths
///   chassis --help                         Print usage

#include "chassis/constants.hpp"
#include "chassis/data_loader.hpp"
#include "chassis/data_writer.hpp"
#include "chassis/engine.hpp"
#include "chassis/errors.hpp"

#include <fmt/core.h>

#include <exception>
#include <stdexcept>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace chassis;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  chassis lengths <csv> [--csv] [options]\n"
        "  chassis rank    <csv> <scope> [--descending] [--csv] [options]\n"
        "  chassis summary <csv> <center|clip> [--by <scope>] [options]\n"
        "  chassis lineup  <csv> [--weights LF,RF,LR,RR] [--maximize] [--pairwise]\n"
        "                  [--drop-excess] [options]\n"
        "  chassis correlate <csv> <upper_x..lower_z|corner> <corner> [options]\n"
        "  chassis --help\n"
        "\n"
        "Options:\n"
        "  --normalize        Replace LCA z by the median of its corner\n"
        "  --global-median    With --normalize, one median over all corners\n"
        "  --track INT,ST     Only rows with these track types\n"
        "  --pivots           Lower point = midpoint of lca_front_* / lca_rear_*\n"
        "  --csv              Write CSV to stdout instead of a table\n"
        "  --verbose          Diagnostics on stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  clip,center_section,corner,upper_x,upper_y,upper_z,"
        "lower_x,lower_y,lower_z,offset,track_type\n"
    );
}

/// Parsed command line.
struct CliOptions {
    std::string              command;
    std::string              csv;
    std::vector<std::string> positional;
    bool                     normalize     = false;
    bool                     global_median = false;
    bool                     descending    = false;
    bool                     maximize      = false;
    bool                     pairwise      = false;
    bool                     drop_excess   = false;
    bool                     pivots        = false;
    bool                     verbose       = false;
    bool                     csv_out       = false;
    std::optional<std::string> track;
    std::optional<std::string> weights;
    std::optional<std::string> by;
};

/// Returns `nullopt` (after printing why) on a malformed command line.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opt;
    opt.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--normalize")          opt.normalize = true;
        else if (arg == "--global-median") opt.global_median = true;
        else if (arg == "--descending")    opt.descending = true;
        else if (arg == "--maximize")      opt.maximize = true;
        else if (arg == "--pairwise")      opt.pairwise = true;
        else if (arg == "--drop-excess")   opt.drop_excess = true;
        else if (arg == "--pivots")        opt.pivots = true;
        else if (arg == "--verbose")       opt.verbose = true;
        else if (arg == "--csv")           opt.csv_out = true;
        else if (arg == "--track") {
            if (!(opt.track = value())) return std::nullopt;
        } else if (arg == "--weights") {
            if (!(opt.weights = value())) return std::nullopt;
        } else if (arg == "--by") {
            if (!(opt.by = value())) return std::nullopt;
        } else if (arg.rfind("--", 0) == 0) {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        } else if (opt.csv.empty()) {
            opt.csv = arg;
        } else {
            opt.positional.push_back(arg);
        }
    }

    if (opt.csv.empty()) {
        fmt::print(stderr, "Error: {} requires a CSV file path\n", opt.command);
        return std::nullopt;
    }
    return opt;
}

/// Track-type filter from "INT,ST"; `nullopt` on an unknown tag.
std::optional<ranking::RowFilter> make_filter(const CliOptions& opt) {
    if (!opt.track) {
        return ranking::RowFilter{};
    }
    std::vector<TrackType> accepted;
    for (const auto& tag : core::DataLoader::split_fields(*opt.track)) {
        const auto t = parse_track_type(tag);
        if (!t) {
            fmt::print(stderr, "Error: unknown track type '{}'\n", tag);
            return std::nullopt;
        }
        accepted.push_back(*t);
    }
    return ranking::track_type_filter(std::move(accepted));
}

/// Load the CSV into a new session. Returns `nullopt` after printing why.
std::optional<core::AnalysisSession> open_session(const CliOptions& opt) {
    const auto mapping = opt.pivots ? core::ColumnMapping::with_lca_pivots()
                                    : core::ColumnMapping{};
    auto loaded = core::DataLoader::load_csv(opt.csv, mapping);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opt.csv);
        return std::nullopt;
    }
    if (!loaded->ok()) {
        for (const auto& col : loaded->missing_columns) {
            fmt::print(stderr, "Error: '{}' has no column '{}'\n", opt.csv, col);
        }
        return std::nullopt;
    }
    if (loaded->rows.empty()) {
        fmt::print(stderr, "Error: no valid rows loaded from '{}'\n", opt.csv);
        return std::nullopt;
    }
    if (loaded->rejected_rows > 0) {
        fmt::print(stderr, "Warning: {} rows rejected (empty id or unknown corner)\n",
                   loaded->rejected_rows);
    }

    core::AnalysisSession session(core::EngineConfig{
        .normalization = {
            .enabled = opt.normalize,
            .scope   = opt.global_median ? geometry::MedianScope::Global
                                         : geometry::MedianScope::PerCorner,
        },
        .verbose = opt.verbose,
    });
    session.load(std::move(loaded->rows));
    return session;
}

std::string fmt_opt(const std::optional<double>& v) {
    return v ? fmt::format("{:.{}f}", *v, constants::LENGTH_PRINT_PRECISION) : std::string("-");
}

const char* track_name(const std::optional<TrackType>& t) {
    return t ? to_string(*t) : "-";
}

// ─── Commands ─────────────────────────────────────────────────────────────────

int run_lengths(core::AnalysisSession& session, const CliOptions& opt) {
    const auto calc = session.calculate();
    for (const auto& e : calc.errors) {
        fmt::print(stderr, "Warning: {}\n", e.to_string());
    }
    if (opt.csv_out) {
        fmt::print("{}", core::DataWriter::results_csv(calc.results));
        return 0;
    }
    fmt::print("{:<4} {:<10} {:<10} {:<6} {:>12} {:>10} {:<8}\n",
               "row", "clip", "section", "corner", "length", "lca_z", "track");
    for (const auto& r : calc.results) {
        fmt::print("{:<4} {:<10} {:<10} {:<6} {:>12.{}f} {:>10.{}f} {:<8}\n",
                   r.row_index, r.clip_id, r.center_section_id, to_string(r.corner),
                   r.length, constants::LENGTH_PRINT_PRECISION,
                   r.lower_z_used, constants::LENGTH_PRINT_PRECISION,
                   track_name(r.track_type));
    }
    return 0;
}

int run_rank(core::AnalysisSession& session, const CliOptions& opt,
             const ranking::RowFilter& filter) {
    if (opt.positional.empty()) {
        fmt::print(stderr, "Error: rank requires a scope\n");
        return 1;
    }
    const auto scope = ranking::parse_scope(opt.positional[0]);
    const auto order = opt.descending ? ranking::SortOrder::Descending
                                      : ranking::SortOrder::Ascending;
    const auto entries = session.rank(scope, order, filter);
    if (opt.csv_out) {
        fmt::print("{}", core::DataWriter::ranking_csv(entries, scope));
        return 0;
    }

    fmt::print("{:<5} {:<10} {:<10} {:>12} {:<8}\n",
               "rank", "clip", "section", ranking::to_string(scope), "track");
    for (const auto& e : entries) {
        fmt::print("{:<5} {:<10} {:<10} {:>12.{}f} {:<8}\n",
                   e.rank, e.clip_id, e.center_section_id,
                   e.value, constants::LENGTH_PRINT_PRECISION, track_name(e.track_type));
    }
    return 0;
}

int run_summary(core::AnalysisSession& session, const CliOptions& opt,
                const ranking::RowFilter& filter) {
    if (opt.positional.empty() ||
        (opt.positional[0] != "center" && opt.positional[0] != "clip")) {
        fmt::print(stderr, "Error: summary requires 'center' or 'clip'\n");
        return 1;
    }
    const auto key = opt.positional[0] == "center" ? ranking::GroupKey::CenterSection
                                                   : ranking::GroupKey::Clip;
    const auto by  = opt.by ? ranking::parse_scope(*opt.by) : ranking::Scope::Overall;
    const auto groups = session.summarize(key, by, ranking::SortOrder::Ascending, filter);

    fmt::print("{:<10} {:>10} {:>10} {:>10} {:>10} {:>10} {:>10} {:>10} {:>5}\n",
               key == ranking::GroupKey::CenterSection ? "section" : "clip",
               "LF", "RF", "LR", "RR", "Front", "Rear", "Overall", "rows");
    for (const auto& g : groups) {
        fmt::print("{:<10} {:>10} {:>10} {:>10} {:>10} {:>10} {:>10} {:>10} {:>5}\n",
                   g.key,
                   fmt_opt(g.mean_length[index(Corner::LF)]),
                   fmt_opt(g.mean_length[index(Corner::RF)]),
                   fmt_opt(g.mean_length[index(Corner::LR)]),
                   fmt_opt(g.mean_length[index(Corner::RR)]),
                   fmt_opt(g.front), fmt_opt(g.rear), fmt_opt(g.overall), g.row_count);
    }
    return 0;
}

int run_lineup(core::AnalysisSession& session, const CliOptions& opt,
               const ranking::RowFilter& filter) {
    core::LineupOptions lo;
    if (opt.weights) {
        const auto parts = core::DataLoader::split_fields(*opt.weights);
        if (parts.size() != CORNER_COUNT) {
            fmt::print(stderr, "Error: --weights needs four values (LF,RF,LR,RR)\n");
            return 1;
        }
        CornerArray<double> w{};
        for (std::size_t i = 0; i < CORNER_COUNT; ++i) {
            w[i] = core::DataLoader::parse_number(parts[i]);
        }
        const auto weights = lineup::CornerWeights::make(w);
        if (!weights) {
            fmt::print(stderr,
                       "Error: weights must be finite, non-negative and not all zero\n");
            return 1;
        }
        lo.weights = *weights;
    }
    lo.direction    = opt.maximize ? lineup::Direction::Maximize : lineup::Direction::Minimize;
    lo.truncation   = opt.drop_excess ? lineup::TruncationPolicy::DropExcess
                                      : lineup::TruncationPolicy::Strict;
    lo.pair_lengths = opt.pairwise;

    const auto prepared = session.prepare_lineup(lo, filter);
    for (const auto& id : prepared.incomplete_clips) {
        fmt::print(stderr, "Warning: clip {} is missing a corner and was left out\n", id);
    }
    const auto result = lineup::LineupOptimizer::optimize(prepared.request);

    fmt::print("{:<10} {:<10} {:>10} {:>10} {:>10} {:>10} {:>12}\n",
               "section", "clip", "LF", "RF", "LR", "RR", "score");
    for (const auto& p : result.pairs) {
        fmt::print("{:<10} {:<10} {:>10} {:>10} {:>10} {:>10} {:>12}\n",
                   p.center_section_id, p.clip_id,
                   fmt_opt(p.lengths[index(Corner::LF)]), fmt_opt(p.lengths[index(Corner::RF)]),
                   fmt_opt(p.lengths[index(Corner::LR)]), fmt_opt(p.lengths[index(Corner::RR)]),
                   fmt_opt(p.score));
    }
    fmt::print("Objective ({}): {}\n", lineup::to_string(result.direction),
               fmt_opt(result.objective));
    for (const auto& id : result.dropped_clips) {
        fmt::print("Dropped clip: {}\n", id);
    }
    for (const auto& id : result.dropped_sections) {
        fmt::print("Dropped center section: {}\n", id);
    }
    return 0;
}

int run_correlate(core::AnalysisSession& session, const CliOptions& opt,
                  const ranking::RowFilter& filter) {
    if (opt.positional.size() != 2) {
        fmt::print(stderr, "Error: correlate requires an attribute or corner, then a corner\n");
        return 1;
    }
    const auto corner = parse_corner(opt.positional[1]);
    if (!corner) {
        fmt::print(stderr, "Error: unknown corner '{}'\n", opt.positional[1]);
        return 1;
    }

    std::optional<double> r;
    if (const auto other = parse_corner(opt.positional[0])) {
        r = session.correlate(*other, *corner, filter);
    } else if (const auto attr = ranking::parse_attribute(opt.positional[0])) {
        r = session.correlate(*attr, *corner, filter);
    } else {
        fmt::print(stderr, "Error: unknown attribute '{}'\n", opt.positional[0]);
        return 1;
    }

    if (r) {
        fmt::print("{} vs {}: {:.3f}\n", opt.positional[1], opt.positional[0], *r);
    } else {
        fmt::print("{} vs {}: undefined (fewer than two points or a constant series)\n",
                   opt.positional[1], opt.positional[0]);
    }
    return 0;
}

int dispatch(const CliOptions& opt) {
    const auto filter = make_filter(opt);
    if (!filter) {
        return 1;
    }
    auto session = open_session(opt);
    if (!session) {
        return 1;
    }

    if (opt.command == "lengths")   return run_lengths(*session, opt);
    if (opt.command == "rank")      return run_rank(*session, opt, *filter);
    if (opt.command == "summary")   return run_summary(*session, opt, *filter);
    if (opt.command == "correlate") return run_correlate(*session, opt, *filter);
    return run_lineup(*session, opt, *filter);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "lengths" && mode != "rank" && mode != "summary" && mode != "lineup" &&
        mode != "correlate") {
        fmt::print(stderr, "Unknown command: {}\n", mode);
        print_usage();
        return 1;
    }

    const auto opt = parse_args(argc, argv);
    if (!opt) {
        return 1;
    }

    try {
        return dispatch(*opt);
    } catch (const chassis::InfeasibleLineupError& e) {
        fmt::print(stderr, "Error: {} (clips: {}, center sections: {}, unmatched: {})\n",
                   e.what(), e.clip_count(), e.section_count(), e.unmatched_count());
    } catch (const chassis::RankingError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
    }
    return 1;
}
