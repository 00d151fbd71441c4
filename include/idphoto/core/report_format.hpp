#pragma once

#include <idphoto/core/feedback.hpp>
#include <idphoto/core/validation_report.hpp>
#include <span>
#include <string>

namespace idphoto::core {

/// Ordered text record of a report: a header line
///   timestamp_ms=<t> overall_passed=<bool> face_detected=<bool>
/// followed by one line per outcome in report order
///   validator=<name> passed=<bool> score=<0.000> code=<CODE> severity=<SEV> required=<bool>
[[nodiscard]] std::string format_report(const ValidationReport& report);

/// One line per message in order: "<priority> <CODE> <key>: <text>".
[[nodiscard]] std::string format_guidance(std::span<const GuidanceMessage> messages);

}  // namespace idphoto::core
