#include "correction_mode.h"

#include <set>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "../common/errors.h"

namespace Cadence {

CorrectionMode ParseCorrectionMode(const std::string& value) {
	std::vector<std::string> parts = absl::StrSplit(value, absl::ByAnyChar(",+|"), absl::SkipWhitespace());
	std::set<CorrectionMode> selected;
	for (auto& part : parts) {
		std::string name = absl::AsciiStrToLower(absl::StripAsciiWhitespace(part));
		if (name == "none") {
			selected.insert(CorrectionMode::kNone);
		} else if (name == "at_recording") {
			selected.insert(CorrectionMode::kAtRecording);
		} else if (name == "post_hoc") {
			selected.insert(CorrectionMode::kPostHoc);
		} else {
			throw ConfigurationError("unknown correction_mode '" + name +
					"' (expected none, at_recording or post_hoc)");
		}
	}
	if (selected.empty()) {
		throw ConfigurationError("correction_mode is empty");
	}
	if (selected.count(CorrectionMode::kAtRecording) && selected.count(CorrectionMode::kPostHoc)) {
		throw ConfigurationError("correction modes at_recording and post_hoc are mutually exclusive");
	}
	if (selected.size() > 1) {
		throw ConfigurationError("correction_mode '" + value + "' combines none with a correction");
	}
	return *selected.begin();
}

const char* CorrectionModeName(CorrectionMode mode) {
	switch (mode) {
		case CorrectionMode::kNone: return "none";
		case CorrectionMode::kAtRecording: return "at_recording";
		case CorrectionMode::kPostHoc: return "post_hoc";
	}
	return "unknown";
}

}  // namespace Cadence
