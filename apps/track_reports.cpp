#include <config/tracker_config.hpp>
#include <filtering/constant_velocity_filter.hpp>
#include <association/gating.hpp>
#include <io/report_reader.hpp>
#include <io/result_writer.hpp>
#include <tracking/tracker.hpp>

#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("input,i", po::value<std::string>()->required(), "Input report file")
        ("format,f", po::value<std::string>()->default_value("json"), "Input format: json (Cartesian reports) or csv (spherical sensor records)")
        ("config,c", po::value<std::string>(), "JSON tracker configuration file")
        ("output,o", po::value<std::string>()->default_value("associations.json"), "Output JSON file with tracks and associations")
        ("innovation", po::value<filtering::InnovationReference>(), "Innovation reference (predicted or prior); overrides the configuration")
        ("clustering", po::value<association::ClusteringPolicy>(), "Clustering policy (nearest or all); overrides the configuration")
        ("log-level", po::value<std::string>()->default_value("info"), "Log level (trace, debug, info, warn, error, off)");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(vm["log-level"].as<std::string>()));

    // Tracker configuration
    config::TrackerConfig tracker_config;
    try {
        if (vm.count("config")) {
            tracker_config = config::load_config(vm["config"].as<std::string>());
        }
        if (vm.count("innovation")) {
            tracker_config.filter.innovation = vm["innovation"].as<filtering::InnovationReference>();
        }
        if (vm.count("clustering")) {
            tracker_config.association.clustering = vm["clustering"].as<association::ClusteringPolicy>();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Read reports
    auto input_file = vm["input"].as<std::string>();
    auto format = vm["format"].as<std::string>();
    common::ReportBatch reports;
    try {
        if (format == "json") {
            reports = io::read_json_reports(input_file);
        } else if (format == "csv") {
            reports = io::read_spherical_csv(input_file);
        } else {
            std::cerr << "Error: unknown input format " << format << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (reports.empty()) {
        std::cout << "No reports found in " << input_file << std::endl;
    }

    // Filter and associate
    tracking::SessionResult result;
    nlohmann::json output_json;
    try {
        tracking::Tracker tracker(tracker_config);
        result = tracker.process(reports);
        output_json = io::results_to_json(result, tracker.tracks(), reports);
        output_json["config"] = config::to_json(tracker.config());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    for (const auto& entry : result.association.associations) {
        const auto& report = reports[entry.report];
        if (entry.track.has_value()) {
            std::cout << "Report " << report.id() << " associated with Track " << *entry.track
                      << ", Probability: " << std::setprecision(6) << entry.probability << std::endl;
        } else {
            std::cout << "Report " << report.id() << " not associated" << std::endl;
        }
    }

    // Write JSON to file
    auto output_file = vm["output"].as<std::string>();
    try {
        io::write_json(output_file, output_json);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Tracks and associations written to " << output_file << std::endl;

    return 0;
}
