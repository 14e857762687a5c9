#include "trellis/pipeline.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "trellis/cancellation.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/middleware.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"
#include "trellis/store.hpp"

namespace trellis {

namespace {

using Trace = std::vector<std::string>;

// Records its inbound and outbound phases.
struct Recorder {
  std::string name;
  Trace* trace;

  http::HttpResponse operator()(RequestState& state, const Next& next) const {
    trace->push_back(name + "-enter");
    http::HttpResponse response = next(state);
    trace->push_back(name + "-exit");
    return response;
  }
};

// Answers without invoking the continuation.
struct Blocker {
  Trace* trace;

  http::HttpResponse operator()(RequestState&, const Next&) const {
    trace->push_back("blocker");
    return http::HttpResponse(http::StatusCodeForbidden);
  }
};

struct HeaderStamp {
  std::string value;

  http::HttpResponse operator()(RequestState& state, const Next& next) const {
    http::HttpResponse response = next(state);
    response.addHeader("X-Stamp", value);
    return response;
  }
};

struct CallsTwice {
  http::HttpResponse operator()(RequestState& state, const Next& next) const {
    (void)next(state);
    return next(state);
  }
};

struct CancelsOnEntry {
  std::stop_source* source;

  http::HttpResponse operator()(RequestState& state, const Next& next) const {
    source->request_stop();
    return next(state);
  }
};

struct PutsValue {
  http::HttpResponse operator()(RequestState& state, const Next& next) const {
    state.put(std::string("from middleware"));
    return next(state);
  }
};

struct PipelineStoreTag {};

static_assert(Middleware<Recorder>);
static_assert(Middleware<Blocker>);
static_assert(!Middleware<int>);

struct WrongSignature {
  void operator()(RequestState&) const {}
};
static_assert(!Middleware<WrongSignature>);

}  // namespace

class PipelineTest : public ::testing::Test {
 protected:
  http::HttpResponse run(const auto& pipeline) {
    const auto handler = [this](RequestState&) {
      trace.push_back("handler");
      return http::HttpResponse(http::StatusCodeOK);
    };
    return pipeline.call(state, Next(handler));
  }

  Trace trace;
  RequestState state;
};

TEST_F(PipelineTest, OnionOrder) {
  auto pipeline = NewPipeline().add(Recorder{"A", &trace}).add(Recorder{"B", &trace}).build();
  static_assert(decltype(pipeline)::kNbMiddleware == 2);

  EXPECT_EQ(run(pipeline).status(), http::StatusCodeOK);
  EXPECT_EQ(trace, (Trace{"A-enter", "B-enter", "handler", "B-exit", "A-exit"}));
}

TEST_F(PipelineTest, ShortCircuitSkipsHandlerButKeepsOuterOutbound) {
  auto pipeline = NewPipeline().add(Recorder{"A", &trace}).add(Blocker{&trace}).build();

  EXPECT_EQ(run(pipeline).status(), http::StatusCodeForbidden);
  EXPECT_EQ(trace, (Trace{"A-enter", "blocker", "A-exit"}));
}

TEST_F(PipelineTest, OutboundPhaseIsLifo) {
  auto pipeline = NewPipeline().add(HeaderStamp{"outer"}).add(HeaderStamp{"inner"}).build();

  http::HttpResponse response = run(pipeline);
  auto it = response.headers().begin();
  ASSERT_EQ(response.headers().size(), 2U);
  EXPECT_EQ(it->value, "inner");
  ++it;
  EXPECT_EQ(it->value, "outer");
}

TEST_F(PipelineTest, EmptyPipelineCallsInner) {
  auto pipeline = NewPipeline().build();
  EXPECT_EQ(run(pipeline).status(), http::StatusCodeOK);
  EXPECT_EQ(trace, Trace{"handler"});
}

TEST_F(PipelineTest, StateIsSharedAlongTheChain) {
  auto pipeline = NewPipeline().add(PutsValue{}).build();
  const auto handler = [](RequestState& st) {
    return http::HttpResponse(http::StatusCodeOK, st.borrow<std::string>());
  };
  EXPECT_EQ(pipeline.call(state, Next(handler)).body(), "from middleware");
}

TEST_F(PipelineTest, ContinuationCannotBeInvokedTwice) {
  auto pipeline = NewPipeline().add(CallsTwice{}).build();
  EXPECT_THROW((void)run(pipeline), std::logic_error);
  EXPECT_EQ(trace, Trace{"handler"});
}

TEST_F(PipelineTest, CancellationStopsFurtherStages) {
  std::stop_source source;
  state.put(source.get_token());

  auto pipeline =
      NewPipeline().add(Recorder{"A", &trace}).add(CancelsOnEntry{&source}).add(Recorder{"B", &trace}).build();

  EXPECT_THROW((void)run(pipeline), RequestCancelled);
  // A never resumes its outbound phase once cancellation has been observed
  EXPECT_EQ(trace, Trace{"A-enter"});
}

TEST_F(PipelineTest, CancelledBeforeStartRunsNothing) {
  std::stop_source source;
  source.request_stop();
  state.put(source.get_token());

  auto pipeline = NewPipeline().add(Recorder{"A", &trace}).build();
  EXPECT_THROW((void)run(pipeline), RequestCancelled);
  EXPECT_TRUE(trace.empty());
}

TEST_F(PipelineTest, BuildFromStoreFollowsHandleOrder) {
  auto [s1, handleA] = NewStore<PipelineStoreTag>().add(Recorder{"A", &trace});
  auto [s2, handleB] = std::move(s1).add(Recorder{"B", &trace});
  auto [store, handleC] = std::move(s2).add(Recorder{"C", &trace});

  auto pipeline = BuildPipeline(store, handleC, handleA);
  static_assert(decltype(pipeline)::kNbMiddleware == 2);

  (void)run(pipeline);
  EXPECT_EQ(trace, (Trace{"C-enter", "A-enter", "handler", "A-exit", "C-exit"}));
}

TEST(Next, TracksInvocation) {
  RequestState state;
  const auto inner = [](RequestState&) { return http::HttpResponse(http::StatusCodeNoContent); };
  Next next(inner);
  EXPECT_FALSE(next.invoked());
  EXPECT_EQ(next(state).status(), http::StatusCodeNoContent);
  EXPECT_TRUE(next.invoked());
}

}  // namespace trellis
