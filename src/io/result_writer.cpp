#include "io/result_writer.hpp"
#include "transforms/spherical.hpp"

#include <fstream>
#include <stdexcept>

namespace io {

namespace {

nlohmann::json vector_to_json(const Eigen::VectorXd& v) {
    nlohmann::json array = nlohmann::json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        array.push_back(v(i));
    }
    return array;
}

nlohmann::json matrix_to_json(const Eigen::MatrixXd& m) {
    nlohmann::json rows = nlohmann::json::array();
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        rows.push_back(vector_to_json(m.row(r).transpose()));
    }
    return rows;
}

nlohmann::json estimate_to_json(const common::StateEstimate& estimate) {
    nlohmann::json j;
    j["time"] = estimate.time;
    j["state"] = vector_to_json(estimate.x);
    j["covariance"] = matrix_to_json(estimate.P);
    return j;
}

} // namespace

auto results_to_json(
    const tracking::SessionResult& result,
    const std::vector<tracking::Track>& tracks,
    const common::ReportBatch& reports
) -> nlohmann::json {
    nlohmann::json document;

    auto report_id = [&reports](std::size_t index) { return reports.at(index).id(); };
    auto track_id = [&tracks](std::size_t index) { return tracks.at(index).id(); };

    document["tracks"] = nlohmann::json::array();
    for (const auto& track : tracks) {
        nlohmann::json j = estimate_to_json(track.filter().estimate());
        j["id"] = track.id();
        j["reports"] = track.history().size();

        Eigen::Vector3d spherical = transforms::cartesian_to_spherical(track.position());
        j["spherical"] = {{"range", spherical(0)}, {"azimuth", spherical(1)}, {"elevation", spherical(2)}};
        document["tracks"].push_back(j);
    }

    document["filter_outputs"] = nlohmann::json::array();
    for (const auto& output : result.filter_outputs) {
        nlohmann::json j = estimate_to_json(output.estimate);
        j["track_id"] = output.track_id;
        j["report_id"] = output.report_id;
        j["initialized"] = output.initialized;
        j["updated"] = output.updated;
        document["filter_outputs"].push_back(j);
    }

    const auto& association = result.association;

    document["clusters"] = nlohmann::json::array();
    for (const auto& cluster : association.clusters) {
        nlohmann::json ids = nlohmann::json::array();
        for (std::size_t t : cluster.tracks) {
            ids.push_back(track_id(t));
        }
        document["clusters"].push_back({{"report_id", report_id(cluster.report)}, {"track_ids", ids}});
    }

    document["hypotheses"] = nlohmann::json::array();
    for (const auto& scored : association.hypotheses) {
        nlohmann::json pairs = nlohmann::json::array();
        for (const auto& assignment : scored.hypothesis) {
            nlohmann::json pair;
            pair["track_id"] = track_id(assignment.track);
            pair["report_id"] = assignment.report.has_value() ? nlohmann::json(report_id(*assignment.report)) : nlohmann::json(nullptr);
            pairs.push_back(pair);
        }
        document["hypotheses"].push_back({{"assignments", pairs}, {"probability", scored.probability}});
    }

    document["associations"] = nlohmann::json::array();
    for (const auto& a : association.associations) {
        nlohmann::json j;
        j["report_id"] = report_id(a.report);
        j["track_id"] = a.track.has_value() ? nlohmann::json(track_id(*a.track)) : nlohmann::json(nullptr);
        j["probability"] = a.probability;
        document["associations"].push_back(j);
    }

    document["degenerate"] = association.degenerate;
    return document;
}

void write_json(const std::string& path, const nlohmann::json& document) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open output file " + path);
    }
    out << document.dump(4); // Pretty-print with 4-space indentation
    if (!out) {
        throw std::runtime_error("Failed writing output file " + path);
    }
}

} // namespace io
