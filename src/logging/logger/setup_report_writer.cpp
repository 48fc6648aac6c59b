#include "setup_report_writer.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace FvgScanner {
namespace Logging {

using namespace FvgScanner::Core;

const char* const SETUP_CSV_HEADER =
    "symbol,direction,lower_bound,upper_bound,width,width_atr,first_index,formation_index,"
    "sweep_pivot_index,sweep_pivot_level,sweep_index,entry_index,entry_time,session,score,"
    "cleanliness_score,size_score,session_score,untouched,rvol_at_formation,vwap_at_entry,"
    "gap_beyond_vwap,bos_index";

namespace {
    template <typename T>
    void write_optional(std::ostream& output_stream, const std::optional<T>& optional_value) {
        if (optional_value) {
            output_stream << optional_value.value();
        }
    }

    std::ofstream open_report(const std::string& report_path) {
        std::ofstream report_stream(report_path, std::ios::trunc);
        if (!report_stream.is_open()) {
            throw std::runtime_error("Cannot open report file for writing: " + report_path);
        }
        return report_stream;
    }

    nlohmann::json optional_to_json(const std::optional<double>& optional_value) {
        return optional_value ? nlohmann::json(optional_value.value()) : nlohmann::json(nullptr);
    }
}

void write_setup_csv_row(std::ostream& output_stream, const Setup& setup) {
    output_stream << std::fixed << std::setprecision(6)
                  << setup.symbol << ','
                  << to_string(setup.gap.direction) << ','
                  << setup.gap.lower_bound << ','
                  << setup.gap.upper_bound << ','
                  << setup.gap.width << ',';
    write_optional(output_stream, setup.gap.width_in_atr);
    output_stream << ','
                  << setup.gap.first_index << ','
                  << setup.gap.formation_index << ','
                  << setup.sweep.pivot_index << ','
                  << setup.sweep.pivot_level << ','
                  << setup.sweep.sweep_index << ','
                  << setup.entry_index << ','
                  << TimeUtils::format_epoch_milliseconds_iso(setup.entry_timestamp_ms) << ','
                  << to_string(setup.session_tag) << ','
                  << std::setprecision(2) << setup.score.composite << ','
                  << setup.score.cleanliness << ',';
    write_optional(output_stream, setup.score.size);
    output_stream << ',' << setup.score.session_quality << ','
                  << (setup.untouched_at_evaluation ? "true" : "false") << ','
                  << std::setprecision(4);
    write_optional(output_stream, setup.rvol_at_formation);
    output_stream << ',' << std::setprecision(6) << setup.vwap_at_entry << ','
                  << (setup.gap_on_trend_side_of_vwap() ? "true" : "false") << ',';
    write_optional(output_stream, setup.structure_break_index);
    output_stream << '\n';
}

SetupReportWriter::SetupReportWriter(const std::string& report_directory) : directory(report_directory) {}

std::string SetupReportWriter::path_for(const std::string& file_name) const {
    return (std::filesystem::path(directory) / file_name).string();
}

void SetupReportWriter::ensure_directory() const {
    if (!directory.empty()) {
        std::filesystem::create_directories(directory);
    }
}

std::string SetupReportWriter::write_symbol_report(const SymbolScanResult& result) const {
    ensure_directory();
    std::string report_path = path_for(result.symbol + "_setups.csv");
    std::ofstream report_stream = open_report(report_path);
    report_stream << SETUP_CSV_HEADER << '\n';
    for (const Setup& setup : result.setups) {
        write_setup_csv_row(report_stream, setup);
    }
    return report_path;
}

std::string SetupReportWriter::write_summary(const std::vector<Setup>& ranked_setups) const {
    ensure_directory();
    std::string report_path = path_for("summary.csv");
    std::ofstream report_stream = open_report(report_path);
    report_stream << "rank," << SETUP_CSV_HEADER << '\n';
    for (size_t rank_position = 0; rank_position < ranked_setups.size(); ++rank_position) {
        report_stream << (rank_position + 1) << ',';
        write_setup_csv_row(report_stream, ranked_setups[rank_position]);
    }
    return report_path;
}

std::string SetupReportWriter::write_run_summary(const std::vector<SymbolScanResult>& results,
                                                 const std::vector<Setup>& ranked_setups,
                                                 const FvgScanner::Config::SystemConfig& config) const {
    nlohmann::json run_summary;
    run_summary["generated_at"] = TimeUtils::get_current_human_readable_time();
    run_summary["settings"] = {
        {"atr_period", config.indicators.atr_period},
        {"atr_mode", FvgScanner::Config::IndicatorConfig::atr_mode_to_string(config.indicators.atr_mode)},
        {"rvol_period", config.indicators.rvol_period},
        {"sweep_lookback_bars", config.structure.sweep_lookback_bars},
        {"entry_evaluation_offset_bars", config.structure.entry_evaluation_offset_bars},
        {"cleanliness_weight", config.scoring.cleanliness_weight},
        {"size_weight", config.scoring.size_weight},
        {"session_weight", config.scoring.session_weight},
        {"atr_ideal_min", config.scoring.atr_ideal_min},
        {"atr_ideal_max", config.scoring.atr_ideal_max}
    };

    nlohmann::json symbol_outcomes = nlohmann::json::array();
    for (const SymbolScanResult& result : results) {
        size_t pending_count = 0;
        size_t rejected_count = 0;
        for (const GapCandidate& candidate : result.candidates) {
            if (candidate.status == GapStatus::PENDING) ++pending_count;
            if (candidate.status == GapStatus::REJECTED) ++rejected_count;
        }

        nlohmann::json outcome = {
            {"symbol", result.symbol},
            {"status", to_string(result.status)},
            {"bars", result.bar_count},
            {"insufficient_history", result.insufficient_history},
            {"gaps", result.candidates.size()},
            {"rejected_gaps", rejected_count},
            {"pending_gaps", pending_count},
            {"setups", result.setups.size()}
        };
        if (!result.succeeded()) {
            outcome["failure_kind"] = to_string(result.failure_kind);
            outcome["failure_reason"] = result.failure_reason;
        }
        symbol_outcomes.push_back(outcome);
    }
    run_summary["symbols"] = symbol_outcomes;

    nlohmann::json top_setups = nlohmann::json::array();
    for (const Setup& setup : ranked_setups) {
        top_setups.push_back({
            {"symbol", setup.symbol},
            {"direction", to_string(setup.gap.direction)},
            {"formation_index", setup.gap.formation_index},
            {"entry_time", TimeUtils::format_epoch_milliseconds_iso(setup.entry_timestamp_ms)},
            {"session", to_string(setup.session_tag)},
            {"score", setup.score.composite},
            {"size_score", optional_to_json(setup.score.size)}
        });
    }
    run_summary["ranked_setups"] = top_setups;

    ensure_directory();
    std::string report_path = path_for("run_summary.json");
    std::ofstream report_stream = open_report(report_path);
    report_stream << run_summary.dump(2) << '\n';
    return report_path;
}

std::vector<std::string> SetupReportWriter::write_all(const std::vector<SymbolScanResult>& results,
                                                      const std::vector<Setup>& ranked_setups,
                                                      const FvgScanner::Config::SystemConfig& config) const {
    std::vector<std::string> written_paths;
    for (const SymbolScanResult& result : results) {
        if (result.succeeded()) {
            written_paths.push_back(write_symbol_report(result));
        }
    }
    written_paths.push_back(write_summary(ranked_setups));
    written_paths.push_back(write_run_summary(results, ranked_setups, config));
    return written_paths;
}

} // namespace Logging
} // namespace FvgScanner
