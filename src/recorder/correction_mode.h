#pragma once

#include <string>

namespace Cadence {

/**
 * Run-wide coordinated omission correction choice. Exactly one applies per
 * run; applying both would count every phantom sample twice.
 *
 *   mode          raw histogram   corrected histogram
 *   none          yes             -
 *   at_recording  yes             RecordCorrected per sample, during the run
 *   post_hoc      yes             CopyCorrectedForCoordinatedOmission at report
 */
enum class CorrectionMode {
	kNone = 0,
	kAtRecording = 1,
	kPostHoc = 2
};

/**
 * Parses "none", "at_recording" or "post_hoc" (case insensitive).
 * Throws ConfigurationError for unknown names and for lists selecting more
 * than one correction ("at_recording,post_hoc").
 */
CorrectionMode ParseCorrectionMode(const std::string& value);

const char* CorrectionModeName(CorrectionMode mode);

}  // namespace Cadence
