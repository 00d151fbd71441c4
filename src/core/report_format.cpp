#include <idphoto/core/report_format.hpp>
#include <iomanip>
#include <sstream>

namespace idphoto::core {

std::string format_report(const ValidationReport& report) {
  std::ostringstream out;
  out << std::boolalpha;
  out << "timestamp_ms=" << report.timestamp().count()
      << " overall_passed=" << report.overall_passed()
      << " face_detected=" << report.face_detected()
      << " mean_score=" << std::fixed << std::setprecision(3) << report.mean_score() << "\n";
  for (const auto& o : report.outcomes()) {
    out << "  validator=" << o.validator_name
        << " passed=" << o.passed
        << " score=" << std::fixed << std::setprecision(3) << o.score
        << " code=" << to_string(o.code)
        << " severity=" << to_string(o.severity)
        << " required=" << o.required << "\n";
  }
  return out.str();
}

std::string format_guidance(std::span<const GuidanceMessage> messages) {
  std::ostringstream out;
  for (const auto& m : messages) {
    out << m.priority << " " << to_string(m.code) << " " << m.key << ": " << m.text << "\n";
  }
  return out.str();
}

}  // namespace idphoto::core
