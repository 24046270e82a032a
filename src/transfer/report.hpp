#pragma once

#include <ostream>
#include <string>
#include <core/types.hpp>

struct TransferReport;

// "<host>: <source> => <destination> <bytes>Byte <seconds> seconds",
// host right-aligned to 21 columns, seconds with two decimals.
std::string format_outcome(const std::string& host, const TransferOutcome& outcome);

// "<host>: [<kind>] <message>"
std::string format_failure(const HostFailure& failure);

// One outcome line per host, sorted by host. Failures are reported as they
// happen through the error sink.
void print_report(const TransferReport& report, std::ostream& out);
