#include <gtest/gtest.h>
#include "../../src/recorder/correction_mode.h"
#include "../../src/common/errors.h"

using namespace Cadence;

TEST(CorrectionModeTest, ParsesSingleModes) {
    EXPECT_EQ(ParseCorrectionMode("none"), CorrectionMode::kNone);
    EXPECT_EQ(ParseCorrectionMode("at_recording"), CorrectionMode::kAtRecording);
    EXPECT_EQ(ParseCorrectionMode("POST_HOC"), CorrectionMode::kPostHoc);
    EXPECT_EQ(ParseCorrectionMode("  post_hoc "), CorrectionMode::kPostHoc);
}

TEST(CorrectionModeTest, RejectsCombinedCorrections) {
    EXPECT_THROW(ParseCorrectionMode("at_recording,post_hoc"), ConfigurationError);
    EXPECT_THROW(ParseCorrectionMode("post_hoc+at_recording"), ConfigurationError);
    EXPECT_THROW(ParseCorrectionMode("none|post_hoc"), ConfigurationError);
}

TEST(CorrectionModeTest, RejectsUnknownAndEmpty) {
    EXPECT_THROW(ParseCorrectionMode("sometimes"), ConfigurationError);
    EXPECT_THROW(ParseCorrectionMode(""), ConfigurationError);
    EXPECT_THROW(ParseCorrectionMode(" , "), ConfigurationError);
}

TEST(CorrectionModeTest, NamesRoundTrip) {
    for (CorrectionMode mode : {CorrectionMode::kNone, CorrectionMode::kAtRecording, CorrectionMode::kPostHoc}) {
        EXPECT_EQ(ParseCorrectionMode(CorrectionModeName(mode)), mode);
    }
}
