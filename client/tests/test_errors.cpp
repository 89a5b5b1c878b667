#include <fmt/core.h>

#include <lest/lest.hpp>
#include <nonstd/expected.hpp>
#include <string>

#include "strata/core/errors/Error.hpp"
#include "strata/core/errors/IoError.hpp"
#include "strata/core/errors/Try.hpp"
#include "strata/core/types/NonZero.hpp"

#define CASE(name) lest_CASE(specification(), name)

extern lest::tests& specification();

struct TestErrorData {
    int64_t offset;
};

template <>
struct sta::ErrorDataToString<TestErrorData> {
    static std::string data_string(const TestErrorData& data)
    {
        return fmt::format("offset={}", data.offset);
    }
};

sta::Expected<int, TestErrorData> failing_seek()
{
    return sta::make_error(sta::ErrorCode::InvalidArgument, TestErrorData{.offset = -1});
}

sta::Expected<float, std::string> failing_read()
{
    return sta::make_error(sta::ErrorCode::TransportFailure, "connection reset");
}

sta::Expected<sta::NonZero<int>> failing_void()
{
    return sta::make_error(sta::ErrorCode::IllegalState);
}

sta::AnyExpected<int> error_aggregate(int selector)
{
    switch (selector) {
        case 1: {
            int v = TRY(failing_seek());
            return v;
        }
        case 2: {
            float v = TRY(failing_read());
            return static_cast<int>(v);
        }
        case 3: {
            sta::NonZero<int> v = TRY(failing_void());
            return v.v;
        }
        default:
            return selector;
    }
}

sta::AnyExpected<size_t> any_read(bool fail)
{
    if (fail) {
        return sta::make_error(sta::ErrorCode::TransportFailure, TestErrorData{.offset = 64});
    }
    return size_t{16};
}

sta::AnyExpected<int64_t> forward_any(bool fail)
{
    size_t n = TRY(any_read(fail));
    return static_cast<int64_t>(n) * 2;
}

CASE(
    "Error with payload"
    "[Errors]")
{
    sta::Error err(sta::ErrorCode::InvalidArgument, TestErrorData{.offset = 123});

    EXPECT(err.code() == sta::ErrorCode::InvalidArgument);
    EXPECT(err.code_str() == std::string{"InvalidArgument"});

    EXPECT(err.data().offset == 123);
    EXPECT(err.message() == "Error InvalidArgument:1. offset=123");
}

CASE(
    "Void error"
    "[Errors]")
{
    sta::Error err(sta::ErrorCode::IllegalState);

    EXPECT(err.code() == sta::ErrorCode::IllegalState);
    EXPECT(err.code_str() == std::string{"IllegalState"});

    EXPECT(err.message() == "Error IllegalState:2");
}

CASE(
    "String error"
    "[Errors]")
{
    sta::Error err(sta::ErrorCode::TransportFailure, "Hello world");

    EXPECT(err.code() == sta::ErrorCode::TransportFailure);
    EXPECT(err.message() == "Error TransportFailure:3. Hello world");

    sta::Error err2(sta::ErrorCode::NotFound, std::string{"no block"});
    EXPECT(err2.message() == "Error NotFound:4. no block");
}

CASE(
    "I/O error renders path and offset"
    "[Errors]")
{
    sta::IoError err(sta::ErrorCode::TransportFailure, sta::IoErrorData{.path = "/data/7", .offset = 42, .sys_errno = 0});

    EXPECT(err.message() == "Error TransportFailure:3. I/O error on /data/7 at offset 42: unexpected end of file");
}

CASE(
    "Any Expected"
    "[Errors]")
{
    sta::AnyExpected<int> any1 = error_aggregate(100);
    EXPECT(*any1 == 100);

    sta::AnyExpected<int> any2 = error_aggregate(1);
    EXPECT_NOT(any2.has_value());

    EXPECT(any2.error().code() == sta::ErrorCode::InvalidArgument);
    EXPECT(any2.error().message() == "Error InvalidArgument:1. offset=-1");

    auto payload = any2.error().downcast<sta::Error<TestErrorData>>();
    EXPECT(payload.has_value());
    EXPECT(payload->get().data().offset == -1);

    EXPECT_NOT(any2.error().downcast<sta::Error<std::string>>().has_value());

    sta::AnyExpected<int> any3 = error_aggregate(2);
    EXPECT(any3.error().code() == sta::ErrorCode::TransportFailure);
    EXPECT(any3.error().message() == "Error TransportFailure:3. connection reset");

    sta::AnyExpected<int> any4 = error_aggregate(3);
    EXPECT(any4.error().code() == sta::ErrorCode::IllegalState);
}

CASE(
    "MUST yields the value"
    "[Errors]")
{
    auto ok = []() -> sta::Expected<int, std::string> { return 7; };

    int v = MUST(ok());
    EXPECT(v == 7);
}

CASE(
    "TRY and MUST on type-erased results"
    "[Errors]")
{
    sta::AnyExpected<int64_t> ok = forward_any(false);
    EXPECT(ok.has_value());
    EXPECT(*ok == 32);

    sta::AnyExpected<int64_t> failed = forward_any(true);
    EXPECT_NOT(failed.has_value());
    EXPECT(failed.error().code() == sta::ErrorCode::TransportFailure);
    EXPECT(failed.error().message() == "Error TransportFailure:3. offset=64");

    size_t n = MUST(any_read(false));
    EXPECT(n == 16u);
}
