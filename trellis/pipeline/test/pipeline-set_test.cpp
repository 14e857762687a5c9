#include "trellis/pipeline-set.hpp"

#include <gtest/gtest.h>

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/next.hpp"
#include "trellis/pipeline-chain.hpp"
#include "trellis/pipeline.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

namespace {

using Trace = std::vector<std::string>;

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

struct Blocker {
  http::HttpResponse operator()(RequestState&, const Next&) const {
    return http::HttpResponse(http::StatusCodeUnauthorized);
  }
};

struct FrontTag {};
struct AdminTag {};

using RecorderPipeline = Pipeline<Recorder>;

using FrontSet = FrozenPipelineSet<FrontTag, RecorderPipeline>;
using AdminSet = FrozenPipelineSet<AdminTag, RecorderPipeline>;
using FrontHandle = ChainHandle<RecorderPipeline, 0, FrontTag>;
using AdminHandle = ChainHandle<RecorderPipeline, 0, AdminTag>;

static_assert(PipelineOf<FrontSet, FrontHandle>);
static_assert(!PipelineOf<FrontSet, AdminHandle>);
static_assert(!PipelineOf<AdminSet, FrontHandle>);
static_assert(!PipelineOf<FrontSet, ChainHandle<RecorderPipeline, 1, FrontTag>>);

static_assert(ChainResolvableIn<FrontSet, EmptyChain>);
static_assert(ChainResolvableIn<FrontSet, PipelineChain<FrontHandle>>);
static_assert(ChainResolvableIn<FrontSet, PipelineChain<FrontHandle, FrontHandle>>);
static_assert(!ChainResolvableIn<FrontSet, PipelineChain<FrontHandle, AdminHandle>>);
static_assert(!ChainResolvableIn<AdminSet, PipelineChain<FrontHandle>>);

}  // namespace

class PipelineSetTest : public ::testing::Test {
 protected:
  http::HttpResponse runChain(const auto& set, const auto& chain) {
    const auto handler = [this](RequestState&) {
      trace.push_back("handler");
      return http::HttpResponse(http::StatusCodeOK);
    };
    return CallChain(set, chain, state, Next(handler));
  }

  Trace trace;
  RequestState state;
};

TEST_F(PipelineSetTest, ChainRunsPipelinesInDeclaredOrder) {
  auto [s1, outer] = NewPipelineSet<FrontTag>().add(NewPipeline().add(Recorder{"outer", &trace}).build());
  auto [s2, inner] = std::move(s1).add(
      NewPipeline().add(Recorder{"inner1", &trace}).add(Recorder{"inner2", &trace}).build());
  const auto set = std::move(s2).finalize();

  EXPECT_EQ(runChain(set, MakeChain(outer, inner)).status(), http::StatusCodeOK);
  EXPECT_EQ(trace, (Trace{"outer-enter", "inner1-enter", "inner2-enter", "handler", "inner2-exit", "inner1-exit",
                          "outer-exit"}));

  trace.clear();
  (void)runChain(set, MakeChain(inner, outer));
  EXPECT_EQ(trace.front(), "inner1-enter");
  EXPECT_EQ(trace.back(), "inner1-exit");
}

TEST_F(PipelineSetTest, EmptyChainRunsHandlerOnly) {
  const auto set = NewPipelineSet<FrontTag>().finalize();
  EXPECT_EQ(runChain(set, EmptyChain{}).status(), http::StatusCodeOK);
  EXPECT_EQ(trace, Trace{"handler"});
}

TEST_F(PipelineSetTest, ShortCircuitInFirstPipelineSkipsTheNextOnes) {
  auto [s1, guard] = NewPipelineSet<AdminTag>().add(NewPipeline().add(Blocker{}).build());
  auto [s2, logging] = std::move(s1).add(NewPipeline().add(Recorder{"logging", &trace}).build());
  const auto set = std::move(s2).finalize();

  EXPECT_EQ(runChain(set, MakeChain(guard, logging)).status(), http::StatusCodeUnauthorized);
  EXPECT_TRUE(trace.empty());
}

TEST_F(PipelineSetTest, FrozenCopiesShareStorage) {
  auto [s1, handle] = NewPipelineSet<FrontTag>().add(NewPipeline().add(Recorder{"only", &trace}).build());
  const auto set = std::move(s1).finalize();
  const auto copy = set;
  EXPECT_EQ(&set.pipeline(handle), &copy.pipeline(handle));
}

TEST_F(PipelineSetTest, ExtendChainAppends) {
  auto [s1, first] = NewPipelineSet<FrontTag>().add(NewPipeline().add(Recorder{"first", &trace}).build());
  auto [s2, second] = std::move(s1).add(NewPipeline().add(Recorder{"second", &trace}).build());
  const auto set = std::move(s2).finalize();

  const auto chain = ExtendChain(MakeChain(first), second);
  static_assert(std::remove_cvref_t<decltype(chain)>::kNbPipelines == 2);
  (void)runChain(set, chain);
  EXPECT_EQ(trace.front(), "first-enter");
  EXPECT_EQ(trace[1], "second-enter");
}

}  // namespace trellis
