#include "vpncheck_engine/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json outcome_to_json(const vpncheck::engine::ClassificationOutcome& outcome) {
    return json{
        {"account", outcome.account},
        {"category", std::string(vpncheck::engine::to_string(outcome.category))},
        {"message", outcome.message},
    };
}

json build_summary(const std::vector<vpncheck::engine::ClassificationOutcome>& outcomes,
                   vpncheck::engine::BatchState final_state) {
    vpncheck::engine::BatchTally tally;
    json accounts = json::array();
    for (const auto& outcome : outcomes) {
        tally.add(outcome);
        accounts.push_back(outcome_to_json(outcome));
    }

    return json{
        {"total", outcomes.size()},
        {"final_state", std::string(vpncheck::engine::to_string(final_state))},
        {"by_category",
         {
             {"Valid", tally.valid},
             {"Invalid", tally.invalid},
             {"Error", tally.error},
         }},
        {"accounts", std::move(accounts)},
    };
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace vpncheck::engine {

void BatchTally::add(const ClassificationOutcome& outcome) noexcept {
    switch (outcome.category) {
        case OutcomeCategory::Valid: ++valid; break;
        case OutcomeCategory::Invalid: ++invalid; break;
        case OutcomeCategory::Error: ++error; break;
    }
}

void ReportWriter::write_text(const std::filesystem::path& destination,
                              const std::vector<ClassificationOutcome>& outcomes) const {
    std::ostringstream oss;
    for (const auto& outcome : outcomes) {
        oss << outcome.account << " - " << to_string(outcome.category) << " - " << outcome.message << '\n';
    }
    write_file(destination, oss.str());
}

void ReportWriter::write_summary(const std::filesystem::path& destination,
                                 const std::vector<ClassificationOutcome>& outcomes,
                                 BatchState final_state) const {
    const json summary = build_summary(outcomes, final_state);
    write_file(destination, summary.dump(2));
}

}  // namespace vpncheck::engine
