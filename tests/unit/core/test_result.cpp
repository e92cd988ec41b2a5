//
// Created by gregorian-rayne on 10/10/26.
//

#include "ars/result.hpp"
#include "ars/error.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace ars
{
    namespace {
        Result<int> parse_port(const std::string& text) {
            if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
                return Result<int>::failure(Error::parse_error("Not a port", text));
            }
            return Result<int>::success(std::stoi(text));
        }
    }

    TEST(ResultTest, SuccessHoldsValue) {
        const auto result = parse_port("8080");

        ASSERT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_EQ(result.value(), 8080);
        EXPECT_THROW(static_cast<void>(result.error()), std::logic_error);
    }

    TEST(ResultTest, FailureHoldsError) {
        const auto result = parse_port("http");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error(), Error::parse_error("Not a port", "http"));
        EXPECT_THROW(static_cast<void>(result.value()), std::logic_error);
    }

    TEST(ResultTest, MovesValueOut) {
        auto result = Result<std::string>::success("REPORT zdemo.");
        const std::string code = std::move(result).value();

        EXPECT_EQ(code, "REPORT zdemo.");
    }

    TEST(ResultTest, AndThenRunsNextStep) {
        auto chained = Result<std::string>::success("8081").and_then(parse_port);

        ASSERT_TRUE(chained.is_ok());
        EXPECT_EQ(chained.value(), 8081);
    }

    TEST(ResultTest, AndThenCarriesFirstError) {
        int calls = 0;
        auto chained = Result<std::string>::failure(Error::io_error("read failed", "units.json"))
            .and_then([&calls](const std::string& text) {
                ++calls;
                return parse_port(text);
            });

        ASSERT_TRUE(chained.is_err());
        EXPECT_EQ(chained.error().code(), ErrorCode::IoError);
        EXPECT_EQ(calls, 0);
    }

    TEST(VoidResultTest, SuccessAndFailure) {
        const auto ok = Result<void>::success();
        EXPECT_TRUE(ok.is_ok());
        EXPECT_THROW(static_cast<void>(ok.error()), std::logic_error);

        const auto failed = Result<void>::failure(Error::config_error("Port out of range", "server.port"));
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().context().value(), "server.port");
    }

}  // namespace ars
