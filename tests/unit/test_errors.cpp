#include <gtest/gtest.h>
#include "sandexec/core/errors.hpp"

using namespace sandexec::core;

TEST(ErrorsTest, StageNames) {
    EXPECT_EQ(ToString(ExecutionStage::RESOLVE), "resolve");
    EXPECT_EQ(ToString(ExecutionStage::ENSURE_IMAGE), "image");
    EXPECT_EQ(ToString(ExecutionStage::CREATE_CONTAINER), "create");
    EXPECT_EQ(ToString(ExecutionStage::START_CONTAINER), "start");
    EXPECT_EQ(ToString(ExecutionStage::WAIT_FOR_EXIT), "wait");
    EXPECT_EQ(ToString(ExecutionStage::COLLECT_LOGS), "logs");
    EXPECT_EQ(ToString(ExecutionStage::REMOVE_CONTAINER), "remove");
}

TEST(ErrorsTest, KindAndCodeNames) {
    EXPECT_EQ(ToString(ErrorKind::INPUT), "input");
    EXPECT_EQ(ToString(ErrorKind::INFRASTRUCTURE), "infrastructure");
    EXPECT_EQ(ToString(ErrorKind::CLEANUP), "cleanup");
    EXPECT_EQ(ToString(InputErrorCode::UNSUPPORTED_LANGUAGE), "unsupported_language");
    EXPECT_EQ(ToString(InputErrorCode::EMPTY_CODE), "empty_code");
}

TEST(ErrorsTest, InfrastructureErrorCarriesStageAndPartialOutput) {
    InfrastructureError error(ExecutionStage::WAIT_FOR_EXIT, "timed out", true, "partial");

    EXPECT_EQ(error.kind(), ErrorKind::INFRASTRUCTURE);
    EXPECT_EQ(error.stage(), ExecutionStage::WAIT_FOR_EXIT);
    EXPECT_TRUE(error.cancelled());
    EXPECT_EQ(error.partial_output(), "partial");
    EXPECT_STREQ(error.what(), "timed out");
}

TEST(ErrorsTest, TaxonomyIsCatchableThroughBase) {
    try {
        throw InputError(InputErrorCode::EMPTY_CODE, "code must not be empty");
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INPUT);
    }

    try {
        throw CleanupError("abc", "remove failed");
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CLEANUP);
    }
}

TEST(ErrorsTest, CancelledIsARuntimeError) {
    try {
        throw OperationCancelledError("deadline", true);
    } catch (const ContainerRuntimeError& e) {
        auto* cancelled = dynamic_cast<const OperationCancelledError*>(&e);
        ASSERT_NE(cancelled, nullptr);
        EXPECT_TRUE(cancelled->deadline_exceeded());
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
