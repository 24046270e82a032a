#include "report.hpp"
#include "transfer_orchestrator.hpp"
#include <core/constants.hpp>
#include <chrono>
#include <fmt/format.h>

std::string format_outcome(const std::string& host, const TransferOutcome& outcome) {
    double seconds = std::chrono::duration<double>(outcome.elapsed).count();
    return fmt::format("{:>{}}: {} => {} {}Byte {:.2f} seconds",
                       host, RESULT_HOST_WIDTH, outcome.source, outcome.destination,
                       outcome.bytes, seconds);
}

std::string format_failure(const HostFailure& failure) {
    return fmt::format("{:>{}}: [{}] {}", failure.host, RESULT_HOST_WIDTH,
                       error_kind_name(failure.kind), failure.message);
}

void print_report(const TransferReport& report, std::ostream& out) {
    for (const auto& [host, outcome] : report.outcomes.snapshot()) {
        out << format_outcome(host, outcome) << "\n";
    }
}
