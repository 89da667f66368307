#include <noise/gaussian_noise.hpp>
#include <noise/report_simulator.hpp>
#include <io/report_reader.hpp>
#include <io/result_writer.hpp>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <vector>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("targets,n", po::value<int>()->default_value(3), "Number of simulated targets")
        ("reports,r", po::value<int>()->default_value(5), "Reports per target")
        ("timestep,t", po::value<double>()->default_value(5.0), "Time between reports of one target")
        ("target-interval", po::value<double>()->default_value(100.0), "Start time offset between consecutive targets")
        ("spacing", po::value<double>()->default_value(100.0), "Distance along x between consecutive targets")
        ("speed", po::value<double>()->default_value(1.0), "Target speed along y")
        ("sigma-pos", po::value<double>()->default_value(0.5), "Position noise standard deviation")
        ("seed", po::value<std::uint32_t>(), "Random seed (random when omitted)")
        ("output,o", po::value<std::string>()->default_value("reports.json"), "Output JSON file with simulated reports");

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

    // Simulation parameters
    int target_count = vm["targets"].as<int>();
    int reports_per_target = vm["reports"].as<int>();
    double dt = vm["timestep"].as<double>();
    double interval = vm["target-interval"].as<double>();
    double spacing = vm["spacing"].as<double>();
    double speed = vm["speed"].as<double>();
    double sigma_pos = vm["sigma-pos"].as<double>();
    std::optional<std::uint32_t> seed;
    if (vm.count("seed")) {
        seed = vm["seed"].as<std::uint32_t>();
    }

    if (target_count < 0 || reports_per_target < 0) {
        std::cerr << "Error: target and report counts cannot be negative" << std::endl;
        return 1;
    }

    std::vector<noise::SimulatedTarget> targets;
    for (int k = 0; k < target_count; ++k) {
        targets.push_back({
            Eigen::Vector3d(k * spacing, 0.0, 0.0),
            Eigen::Vector3d(0.0, speed, 0.0),
            k * interval
        });
    }

    common::ReportBatch reports;
    try {
        noise::GaussianNoise noise_generator(sigma_pos, seed);
        reports = noise::simulate_reports(targets, reports_per_target, dt, noise_generator);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    nlohmann::json data_json = io::reports_to_json(reports);
    data_json["summary"]["simulation"]["targets"] = target_count;
    data_json["summary"]["simulation"]["reports_per_target"] = reports_per_target;
    data_json["summary"]["simulation"]["timestep"] = dt;
    data_json["summary"]["simulation"]["target_interval"] = interval;
    data_json["summary"]["simulation"]["spacing"] = spacing;
    data_json["summary"]["simulation"]["speed"] = speed;
    data_json["summary"]["simulation"]["noise"]["sigma_pos"] = sigma_pos;

    // Write JSON to file
    auto output_file = vm["output"].as<std::string>();
    try {
        io::write_json(output_file, data_json);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Simulated " << reports.size() << " reports written to " << output_file << std::endl;

    return 0;
}
