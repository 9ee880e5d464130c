#include <gtest/gtest.h>
#include "core/transcript_accumulator.hpp"

using namespace voicestream;
using core::TranscriptAccumulator;
using transport::TranscriptSegment;

namespace {

TranscriptSegment segment(const std::string& text, const std::string& language = "",
                          double start = 0.0, double end = 0.0) {
    TranscriptSegment s;
    s.text = text;
    s.language = language;
    s.startTime = start;
    s.endTime = end;
    return s;
}

} // namespace

TEST(TranscriptAccumulatorTest, JoinsConcludedSegmentsInArrivalOrder) {
    TranscriptAccumulator accumulator("de");

    EXPECT_EQ(accumulator.addConcluded({segment("Guten"), segment("Tag")}), 2u);
    EXPECT_EQ(accumulator.addConcluded({}), 0u);
    EXPECT_EQ(accumulator.addConcluded({segment("zusammen.")}), 1u);

    EXPECT_EQ(accumulator.fullText(), "Guten Tag zusammen.");
    EXPECT_EQ(accumulator.segments().size(), 3u);
}

TEST(TranscriptAccumulatorTest, EmptyAccumulatorHasEmptyText) {
    TranscriptAccumulator accumulator("fr");

    core::Transcript transcript = accumulator.toTranscript();
    EXPECT_EQ(transcript.language, "fr");
    EXPECT_TRUE(transcript.text.empty());
    EXPECT_TRUE(transcript.segments.empty());
    EXPECT_TRUE(transcript.detectedLanguage.empty());
}

TEST(TranscriptAccumulatorTest, FirstTaggedSegmentSetsDetectedLanguage) {
    TranscriptAccumulator accumulator(core::kAutoDetectLanguage);
    EXPECT_EQ(accumulator.language(), "auto");

    accumulator.addConcluded({segment("untagged")});
    EXPECT_EQ(accumulator.language(), "auto");

    accumulator.addConcluded({segment("hello", "en"), segment("hola", "es")});
    accumulator.addConcluded({segment("bonjour", "fr")});

    EXPECT_EQ(accumulator.detectedLanguage(), "en");
    EXPECT_EQ(accumulator.language(), "en");
    EXPECT_EQ(accumulator.requestedLanguage(), "auto");
}

TEST(TranscriptAccumulatorTest, FrozenAccumulatorIgnoresUpdates) {
    TranscriptAccumulator accumulator("en");
    accumulator.addConcluded({segment("done")});
    accumulator.freeze();

    EXPECT_TRUE(accumulator.isFrozen());
    EXPECT_EQ(accumulator.addConcluded({segment("late", "de")}), 0u);
    EXPECT_EQ(accumulator.fullText(), "done");
    EXPECT_TRUE(accumulator.detectedLanguage().empty());
}

TEST(TranscriptAccumulatorTest, TranscriptKeepsSegmentTimings) {
    TranscriptAccumulator accumulator("en");
    accumulator.addConcluded({segment("one", "en", 0.0, 0.5), segment("two", "en", 0.5, 1.25)});

    core::Transcript transcript = accumulator.toTranscript();
    ASSERT_EQ(transcript.segments.size(), 2u);
    EXPECT_DOUBLE_EQ(transcript.segments[1].startTime, 0.5);
    EXPECT_DOUBLE_EQ(transcript.segments[1].endTime, 1.25);
    EXPECT_EQ(transcript.text, "one two");
}

TEST(TranscriptAccumulatorTest, SessionStateNames) {
    EXPECT_EQ(core::sessionStateToString(core::SessionState::RECONNECTING), "reconnecting");
    EXPECT_EQ(core::sessionStateToString(core::SessionState::COMPLETED), "completed");
}
