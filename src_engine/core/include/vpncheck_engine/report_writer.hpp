#pragma once

#include "account_status.hpp"
#include "batch_worker.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace vpncheck::engine {

/// Running Valid / Invalid / Error counters.
struct BatchTally {
    std::size_t valid{0};
    std::size_t invalid{0};
    std::size_t error{0};

    void add(const ClassificationOutcome& outcome) noexcept;
    [[nodiscard]] std::size_t total() const noexcept { return valid + invalid + error; }
};

/**
 * \brief Emits the results of a batch for operators and scripts.
 *
 * - write_text(): one `<account> - <category> - <message>` line per outcome.
 * - write_summary(): JSON document with totals per category and every outcome.
 *
 * Both overwrite the destination and create missing parent directories.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_text(const std::filesystem::path& destination,
                    const std::vector<ClassificationOutcome>& outcomes) const;

    void write_summary(const std::filesystem::path& destination,
                       const std::vector<ClassificationOutcome>& outcomes,
                       BatchState final_state) const;
};

}  // namespace vpncheck::engine
