#include <gtest/gtest.h>
#include "csa/error.hpp"

#include <sstream>

using namespace csa;

TEST(ErrorTest, FactoriesSetCategory) {
    EXPECT_EQ(Error::invalid_argument("x").code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(Error::not_found("x").code(), ErrorCode::NotFound);
    EXPECT_EQ(Error::syntax_error("x").code(), ErrorCode::SyntaxError);
    EXPECT_EQ(Error::io_error("x").code(), ErrorCode::IoError);
    EXPECT_EQ(Error::config_error("x").code(), ErrorCode::ConfigError);
    EXPECT_EQ(Error::analysis_error("x").code(), ErrorCode::AnalysisError);
    EXPECT_EQ(Error::internal_error("x").code(), ErrorCode::InternalError);
}

TEST(ErrorTest, ContextIsOptional) {
    const Error plain = Error::config_error("No parser registered for language");
    EXPECT_FALSE(plain.has_context());
    EXPECT_EQ(plain.to_string(), "[ConfigError] No parser registered for language");

    const Error with = Error::config_error("No parser registered for language", "cobol");
    ASSERT_TRUE(with.has_context());
    EXPECT_EQ(*with.context(), "cobol");
    EXPECT_EQ(with.to_string(), "[ConfigError] No parser registered for language (context: cobol)");
}

TEST(ErrorTest, WithContextAppends) {
    const Error base = Error::io_error("Failed to read file");
    const Error once = base.with_context("a.py");
    const Error twice = once.with_context("while loading config");

    EXPECT_EQ(*once.context(), "a.py");
    EXPECT_EQ(*twice.context(), "a.py; while loading config");
    EXPECT_FALSE(base.has_context());
}

TEST(ErrorTest, Equality) {
    EXPECT_EQ(Error::not_found("File not found", "a.py"), Error::not_found("File not found", "a.py"));
    EXPECT_NE(Error::not_found("File not found", "a.py"), Error::not_found("File not found", "b.py"));
    EXPECT_NE(Error::not_found("File not found"), Error::io_error("File not found"));
}

TEST(ErrorTest, StreamsAsString) {
    std::ostringstream out;
    out << Error::analysis_error("Failed") << " " << ErrorCode::NotFound;
    EXPECT_EQ(out.str(), "[AnalysisError] Failed NotFound");
}
