#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>

#include "trellis/cancellation.hpp"
#include "trellis/fault-boundary-middleware.hpp"
#include "trellis/handler-error.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/next.hpp"
#include "trellis/pipeline.hpp"
#include "trellis/request-logger-middleware.hpp"
#include "trellis/request-state.hpp"
#include "trellis/security-headers-middleware.hpp"
#include "trellis/state-middleware.hpp"
#include "trellis/timer-middleware.hpp"

namespace trellis {

namespace {

struct DatabaseConfig {
  std::string url;
};

const auto Ok = [](RequestState&) { return http::HttpResponse(http::StatusCodeOK, "ok"); };

struct OuterStamp {
  http::HttpResponse operator()(RequestState& state, const Next& next) const {
    http::HttpResponse response = next(state);
    response.header("X-Outer", "seen");
    return response;
  }
};

}  // namespace

class BuiltinMiddlewareTest : public ::testing::Test {
 protected:
  template <class Handler>
  http::HttpResponse run(const auto& pipeline, const Handler& handler) {
    return pipeline.call(state, Next(handler));
  }

  RequestState state;
};

TEST_F(BuiltinMiddlewareTest, SecurityHeadersAreAdded) {
  auto pipeline = NewPipeline().add(SecurityHeadersMiddleware{}).build();
  http::HttpResponse response = run(pipeline, Ok);
  EXPECT_EQ(response.headerValueOrEmpty(http::XContentTypeOptions), "nosniff");
  EXPECT_EQ(response.headerValueOrEmpty(http::XFrameOptions), "DENY");
  EXPECT_EQ(response.headerValueOrEmpty(http::XXssProtection), "1; mode=block");
}

TEST_F(BuiltinMiddlewareTest, SecurityHeadersKeepDownstreamValues) {
  auto pipeline = NewPipeline().add(SecurityHeadersMiddleware{}).build();
  const auto handler = [](RequestState&) {
    return http::HttpResponse(http::StatusCodeOK).header(http::XFrameOptions, "SAMEORIGIN");
  };
  EXPECT_EQ(run(pipeline, handler).headerValueOrEmpty(http::XFrameOptions), "SAMEORIGIN");
}

TEST_F(BuiltinMiddlewareTest, TimerReportsRuntime) {
  auto pipeline = NewPipeline().add(TimerMiddleware{}).build();
  http::HttpResponse response = run(pipeline, Ok);
  const auto runtime = response.headerValue(http::XRuntimeMicroseconds);
  ASSERT_TRUE(runtime.has_value());
  EXPECT_GE(std::stol(std::string(*runtime)), 0);
}

TEST_F(BuiltinMiddlewareTest, RequestLoggerIsTransparent) {
  state.put(http::HttpRequest(http::Method::GET, "/status"));
  auto pipeline = NewPipeline().add(RequestLoggerMiddleware{log::level::debug}).build();
  http::HttpResponse response = run(pipeline, Ok);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), "ok");
}

TEST_F(BuiltinMiddlewareTest, StateMiddlewarePutsSharedValue) {
  auto pipeline = NewPipeline().add(StateMiddleware<DatabaseConfig>(DatabaseConfig{"postgres://db"})).build();
  const auto handler = [](RequestState& st) {
    return http::HttpResponse(http::StatusCodeOK, st.borrow<DatabaseConfig>().url);
  };
  EXPECT_EQ(run(pipeline, handler).body(), "postgres://db");

  RequestState other;
  const auto otherHandler = [](RequestState& st) {
    st.borrowMut<DatabaseConfig>().url = "changed";
    return http::HttpResponse(http::StatusCodeOK);
  };
  (void)pipeline.call(other, Next(otherHandler));
  // each request gets its own copy
  EXPECT_EQ(state.borrow<DatabaseConfig>().url, "postgres://db");
}

TEST_F(BuiltinMiddlewareTest, FaultBoundaryConvertsFaultsAndKeepsOuterOutbound) {
  auto pipeline = NewPipeline().add(OuterStamp{}).add(FaultBoundaryMiddleware{}).build();
  const auto faulty = [](RequestState&) -> http::HttpResponse { throw std::runtime_error("disk on fire"); };

  http::HttpResponse response = run(pipeline, faulty);
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(response.headerValueOrEmpty("X-Outer"), "seen");
  EXPECT_EQ(response.body().find("disk on fire"), std::string_view::npos);

  auto otherPipeline = NewPipeline().add(OuterStamp{}).add(FaultBoundaryMiddleware{}).build();
  const auto throwsInt = [](RequestState&) -> http::HttpResponse { throw 42; };
  http::HttpResponse intFault = run(otherPipeline, throwsInt);
  EXPECT_EQ(intFault.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(intFault.headerValueOrEmpty("X-Outer"), "seen");
}

TEST_F(BuiltinMiddlewareTest, FaultBoundaryExposesDetailsWhenAsked) {
  auto pipeline = NewPipeline().add(FaultBoundaryMiddleware{true}).build();
  const auto faulty = [](RequestState&) -> http::HttpResponse { throw std::runtime_error("disk on fire"); };
  EXPECT_NE(run(pipeline, faulty).body().find("disk on fire"), std::string_view::npos);
}

TEST_F(BuiltinMiddlewareTest, FaultBoundaryKeepsHandlerErrorStatus) {
  auto pipeline = NewPipeline().add(FaultBoundaryMiddleware{}).build();
  const auto conflict = [](RequestState&) -> http::HttpResponse {
    throw HandlerError(http::StatusCodeConflict, "version mismatch");
  };
  http::HttpResponse response = run(pipeline, conflict);
  EXPECT_EQ(response.status(), http::StatusCodeConflict);
  EXPECT_NE(response.body().find("version mismatch"), std::string_view::npos);
}

TEST_F(BuiltinMiddlewareTest, FaultBoundaryLetsCancellationThrough) {
  std::stop_source source;
  state.put(source.get_token());
  auto pipeline = NewPipeline().add(FaultBoundaryMiddleware{}).build();
  const auto cancelling = [&source](RequestState& st) -> http::HttpResponse {
    source.request_stop();
    ThrowIfCancelled(st);
    return http::HttpResponse(http::StatusCodeOK);
  };
  EXPECT_THROW((void)run(pipeline, cancelling), RequestCancelled);
}

TEST(FaultToResponse, Mapping) {
  EXPECT_EQ(FaultToResponse(std::make_exception_ptr(HandlerError(http::StatusCodeGone, "gone")), false).status(),
            http::StatusCodeGone);
  EXPECT_EQ(FaultToResponse(std::make_exception_ptr(std::logic_error("bug")), false).status(),
            http::StatusCodeInternalServerError);
  EXPECT_EQ(FaultToResponse(std::make_exception_ptr(42), false).status(), http::StatusCodeInternalServerError);
}

}  // namespace trellis
