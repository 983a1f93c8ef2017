#include <gtest/gtest.h>
#include "trial/image_trial_evaluator.hpp"
#include "search/trial_table.hpp"
#include "util/logger.hpp"
#include "test_stubs.hpp"

#include <sstream>

using namespace wrc;
using namespace wrc::stubs;

namespace {

TrialContext makeContext() {
    TrialContext ctx;
    ctx.source = "/img/photo.jpg";
    ctx.input_size = 100000;
    ctx.files = {"/img/photo.png", "/img/photo.webp", "/img/photo-webp.png"};
    return ctx;
}

} // namespace

TEST(TrialTest, EncodesMeasuresDecodesAndScores) {
    std::ostringstream out;
    Logger logger(out);
    StubImageTools tools;
    tools.sizes["/img/photo.webp"] = 42000;
    tools.score = 0.0123;
    ImageTrialEvaluator evaluator(tools, logger);

    TrialContext ctx = makeContext();
    TrialRequest request;
    request.context = &ctx;
    request.quality = 72;

    TrialMeasurement m = evaluator.run(request);

    EXPECT_DOUBLE_EQ(m.score, 0.0123);
    EXPECT_EQ(m.size, 42000u);
    EXPECT_EQ(tools.lossy_qualities, (std::vector<int>{72}));
    EXPECT_EQ(tools.calls, (std::vector<std::string>{"encode", "probe", "decode", "compare"}));
}

TEST(TrialTest, StepFailurePropagatesWithItsKind) {
    std::ostringstream out;
    Logger logger(out);
    StubImageTools tools;
    tools.sizes["/img/photo.webp"] = 42000;
    tools.fail_decode = true;
    ImageTrialEvaluator evaluator(tools, logger);

    TrialContext ctx = makeContext();
    TrialRequest request;
    request.context = &ctx;
    request.quality = 60;

    try {
        evaluator.run(request);
        FAIL() << "expected a decode failure";
    } catch (const RecompressError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DECODE_FAILURE);
    }
}

TEST(TrialTest, MissingContextIsTrialFailure) {
    std::ostringstream out;
    Logger logger(out);
    StubImageTools tools;
    ImageTrialEvaluator evaluator(tools, logger);

    TrialRequest request;
    EXPECT_THROW(evaluator.run(request), RecompressError);
    EXPECT_TRUE(tools.calls.empty());
}

TEST(TrialTest, VerboseLogsEachTrial) {
    std::ostringstream out;
    Logger logger(out);
    logger.setLevel(LogLevel::VERBOSE);
    StubImageTools tools;
    tools.sizes["/img/photo.webp"] = 60000;
    tools.score = 0.01;
    ImageTrialEvaluator evaluator(tools, logger);

    TrialTable history;
    history.record(80, 0.01, 60000);

    TrialContext ctx = makeContext();
    TrialRequest request;
    request.context = &ctx;
    request.quality = 80;
    request.history = &history;
    evaluator.run(request);

    EXPECT_NE(out.str().find("q80: score 0.01, 58.59 KB (visit 2)"), std::string::npos) << out.str();
}

TEST(TrialTest, QuietTrialLogsNothing) {
    std::ostringstream out;
    Logger logger(out);
    logger.setLevel(LogLevel::VERBOSE);
    StubImageTools tools;
    tools.sizes["/img/photo.webp"] = 60000;
    ImageTrialEvaluator evaluator(tools, logger);

    TrialContext ctx = makeContext();
    TrialRequest request;
    request.context = &ctx;
    request.quality = 80;
    request.quiet = true;
    evaluator.run(request);

    EXPECT_TRUE(out.str().empty());
}
