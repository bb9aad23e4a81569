#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <string>

using utils::ErrorCategory;
using utils::ErrorReporter;
using utils::ErrorSeverity;

TEST_CASE("ErrorReporter - pending reports", "[error_reporter]")
{
    ErrorReporter::Clear();

    SECTION("Starts empty after clear")
    {
        REQUIRE(ErrorReporter::PendingCount() == 0);
        REQUIRE_FALSE(ErrorReporter::Latest().has_value());
        REQUIRE(ErrorReporter::TakeAll().empty());
    }

    SECTION("Keeps reports in order and TakeAll empties the queue")
    {
        ErrorReporter::Warn(ErrorCategory::Configuration, "first", "min_length = 0");
        ErrorReporter::Fail(ErrorCategory::Initialization, "second");

        REQUIRE(ErrorReporter::PendingCount() == 2);
        REQUIRE(ErrorReporter::Latest()->message == "second");

        const auto reports = ErrorReporter::TakeAll();
        REQUIRE(reports.size() == 2);
        REQUIRE(reports[0].message == "first");
        REQUIRE(reports[0].details == "min_length = 0");
        REQUIRE(reports[0].severity == ErrorSeverity::Warning);
        REQUIRE(reports[0].category == ErrorCategory::Configuration);
        REQUIRE(reports[1].severity == ErrorSeverity::Error);
        REQUIRE(reports[1].details.empty());

        // YYYY-MM-DD HH:MM:SS
        REQUIRE(reports[1].timestamp.size() == 19);
        REQUIRE(reports[1].timestamp[4] == '-');
        REQUIRE(reports[1].timestamp[13] == ':');

        REQUIRE(ErrorReporter::PendingCount() == 0);
    }

    SECTION("Latest does not consume")
    {
        ErrorReporter::Warn(ErrorCategory::Configuration, "kept");
        REQUIRE(ErrorReporter::Latest()->message == "kept");
        REQUIRE(ErrorReporter::PendingCount() == 1);
    }

    SECTION("Drops the oldest report when full")
    {
        for (std::size_t i = 0; i < ErrorReporter::kMaxPending + 5; ++i)
            ErrorReporter::Warn(ErrorCategory::Configuration, "report " + std::to_string(i));

        const auto reports = ErrorReporter::TakeAll();
        REQUIRE(reports.size() == ErrorReporter::kMaxPending);
        REQUIRE(reports.front().message == "report 5");
        REQUIRE(reports.back().message == "report " + std::to_string(ErrorReporter::kMaxPending + 4));
    }

    ErrorReporter::Clear();
}

TEST_CASE("ErrorReporter - category names", "[error_reporter]")
{
    REQUIRE(std::string(ErrorReporter::CategoryName(ErrorCategory::Initialization)) == "Initialization");
    REQUIRE(std::string(ErrorReporter::CategoryName(ErrorCategory::Configuration)) == "Configuration");
}
