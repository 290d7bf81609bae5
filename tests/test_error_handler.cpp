#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include <thread>

using namespace ftpsync;

class ErrorHandlerTest : public ::testing::Test {
};

// Connection limit classification
TEST_F(ErrorHandlerTest, TooManyConnectionsMatchesSubstring) {
    EXPECT_TRUE(ErrorHandler::isTooManyConnections("421 Too many connections (8) from this IP"));
    EXPECT_TRUE(ErrorHandler::isTooManyConnections("too many connections"));
}

TEST_F(ErrorHandlerTest, TooManyConnectionsIsCaseInsensitive) {
    EXPECT_TRUE(ErrorHandler::isTooManyConnections("421 TOO MANY CONNECTIONS"));
    EXPECT_TRUE(ErrorHandler::isTooManyConnections("Server says: Too Many Connections, retry"));
}

TEST_F(ErrorHandlerTest, OtherMessagesAreNotTooManyConnections) {
    EXPECT_FALSE(ErrorHandler::isTooManyConnections("530 Login incorrect"));
    EXPECT_FALSE(ErrorHandler::isTooManyConnections("too many files"));
    EXPECT_FALSE(ErrorHandler::isTooManyConnections(""));
}

TEST_F(ErrorHandlerTest, TooManyConnectionsFromException) {
    EXPECT_TRUE(ErrorHandler::isTooManyConnections(
        TooManyConnectionsError("421 Too many connections")));
    EXPECT_FALSE(ErrorHandler::isTooManyConnections(ConnectionError("Connection refused")));
    EXPECT_TRUE(ErrorHandler::isTooManyConnections(
        std::runtime_error("ftplib: too many connections")));
}

// Exception hierarchy
TEST_F(ErrorHandlerTest, TooManyConnectionsIsConnectionError) {
    EXPECT_THROW(throw TooManyConnectionsError("421"), ConnectionError);
    EXPECT_THROW(throw WorkerClosedError(), ConnectionError);
    EXPECT_THROW(throw TransferError("550"), std::runtime_error);
}

TEST_F(ErrorHandlerTest, WorkerClosedMessage) {
    EXPECT_STREQ(WorkerClosedError().what(), "Worker is shutting down");
}

// Exception description
TEST_F(ErrorHandlerTest, DescribeNullError) {
    EXPECT_EQ(ErrorHandler::describe(nullptr), "No error");
}

TEST_F(ErrorHandlerTest, DescribeStandardException) {
    auto error = std::make_exception_ptr(TransferError("550 No such file"));
    EXPECT_EQ(ErrorHandler::describe(error), "550 No such file");
}

TEST_F(ErrorHandlerTest, DescribeForeignException) {
    auto error = std::make_exception_ptr(42);
    EXPECT_EQ(ErrorHandler::describe(error), "Unknown error");
}

// Error context tests
TEST_F(ErrorHandlerTest, ErrorContextNests) {
    EXPECT_EQ(ErrorContext::current(), "");
    {
        ErrorContext outer("command 1");
        EXPECT_EQ(ErrorContext::current(), "command 1");
        {
            ErrorContext inner("dispatch upload");
            EXPECT_EQ(ErrorContext::current(), "command 1 > dispatch upload");
        }
        EXPECT_EQ(ErrorContext::current(), "command 1");
    }
    EXPECT_EQ(ErrorContext::current(), "");
}

TEST_F(ErrorHandlerTest, ErrorContextIsPerThread) {
    ErrorContext context("main");

    std::string seen = "unset";
    std::thread other([&seen]() { seen = ErrorContext::current(); });
    other.join();

    EXPECT_EQ(seen, "");
    EXPECT_EQ(ErrorContext::current(), "main");
}
