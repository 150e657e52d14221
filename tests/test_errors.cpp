#include "catch.hpp"
#include "youwee/errors.hpp"

#include <string>

TEST_CASE("classifyError maps config failures") {
    youwee::ErrorInfo info = youwee::classifyError("Invalid config JSON.", youwee::ErrorCategory::Config);
    REQUIRE(info.category == youwee::ErrorCategory::Config);
    REQUIRE(info.code == youwee::ErrorCode::ConfigInvalid);
    REQUIRE_FALSE(info.userMessage.empty());

    info = youwee::classifyError("Unsupported log_level 'verbose'.");
    REQUIRE(info.code == youwee::ErrorCode::ConfigUnsupported);
}

TEST_CASE("classifyError maps unknown commands") {
    youwee::ErrorInfo info = youwee::classifyError("Unknown command: drop_everything");
    REQUIRE(info.category == youwee::ErrorCategory::Command);
    REQUIRE(info.code == youwee::ErrorCode::UnknownCommand);
    REQUIRE(std::string(youwee::errorCodeLabel(info.code)) == "UnknownCommand");
}

TEST_CASE("classifyError falls back to the hint or Internal") {
    youwee::ErrorInfo info = youwee::classifyError("something odd", youwee::ErrorCategory::Filesystem);
    REQUIRE(info.category == youwee::ErrorCategory::Filesystem);
    REQUIRE(info.code == youwee::ErrorCode::Unknown);
    REQUIRE(info.userMessage == "Storage error.");

    info = youwee::classifyError("something odd");
    REQUIRE(info.category == youwee::ErrorCategory::Internal);
    REQUIRE(std::string(youwee::errorCategoryLabel(info.category)) == "Internal");
}
