#include <gtest/gtest.h>
#include "tracedb/core/result.h"
#include "tracedb/core/error.h"
#include <string>
#include <vector>

namespace tracedb {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.cause(), nullptr);
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int>::error("Invalid input");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "Invalid input");
    EXPECT_EQ(result.code(), Error::Code::UNKNOWN);
}

TEST(ResultTest, TypedError) {
    Result<std::string> result(std::make_unique<FieldNotFoundError>("field name:x"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::FIELD_NOT_FOUND);
    EXPECT_EQ(result.error(), "field name:x");
    EXPECT_TRUE(result.value().empty());
}

TEST(ResultTest, AccessingErrorOfOkResultThrows) {
    Result<int> result(1);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, PartialCarriesValueAndError) {
    std::vector<int> values = {1, 3};
    auto result = Result<std::vector<int>>::partial(values, std::make_unique<NotFoundError>("2 missing"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.code(), Error::Code::NOT_FOUND);

    auto clean = Result<std::vector<int>>::partial(values, nullptr);
    EXPECT_TRUE(clean.ok());
}

TEST(ResultTest, TakeErrorLeavesOk) {
    Result<int> result(std::make_unique<InternalError>("boom"));
    auto error = result.take_error();
    ASSERT_TRUE(error != nullptr);
    EXPECT_EQ(error->code(), Error::Code::INTERNAL);
    EXPECT_TRUE(result.ok());
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));
    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, TakeValue) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    std::vector<int> taken = result.take_value();
    EXPECT_EQ(taken.size(), 3u);
}

TEST(ResultVoidTest, OkAndError) {
    Result<void> ok;
    EXPECT_TRUE(ok.ok());

    auto failed = Result<void>::error("failed");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error(), "failed");

    Result<void> typed(std::make_unique<InvalidArgumentError>("bad"));
    EXPECT_EQ(typed.code(), Error::Code::INVALID_ARGUMENT);
}

} // namespace
} // namespace core
} // namespace tracedb
