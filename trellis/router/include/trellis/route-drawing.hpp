#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/delegating-route.hpp"
#include "trellis/extractor.hpp"
#include "trellis/http-method.hpp"
#include "trellis/path-pattern.hpp"
#include "trellis/pipeline-chain.hpp"
#include "trellis/pipeline-set.hpp"
#include "trellis/route-impl.hpp"
#include "trellis/route-matcher.hpp"
#include "trellis/route.hpp"
#include "trellis/router-builder.hpp"
#include "trellis/router-config.hpp"
#include "trellis/router.hpp"

namespace trellis {

// Pending registration of a single route. Nothing is registered until to() is called.
template <class SetT, class ChainT, class PathE = NoopPathExtractor, class QueryE = NoopQueryStringExtractor>
class SingleRouteBuilder {
 public:
  SingleRouteBuilder(RouterBuilder& builder, std::string pattern, RouteMatcher matcher, SetT pipelines, ChainT chain)
      : _builder(&builder),
        _pattern(std::move(pattern)),
        _matcher(std::move(matcher)),
        _pipelines(std::move(pipelines)),
        _chain(std::move(chain)) {}

  // The path parameters are extracted into a NewPathE put in the request state.
  template <PathExtractor NewPathE>
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT, NewPathE, QueryE> withPathExtractor() && {
    return {*_builder, std::move(_pattern), std::move(_matcher), std::move(_pipelines), std::move(_chain)};
  }

  // The query string parameters are extracted into a NewQueryE put in the request state.
  template <QueryStringExtractor NewQueryE>
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT, PathE, NewQueryE> withQueryStringExtractor() && {
    return {*_builder, std::move(_pattern), std::move(_matcher), std::move(_pipelines), std::move(_chain)};
  }

  [[nodiscard]] SingleRouteBuilder accepting(std::initializer_list<std::string_view> mediaTypes) && {
    _matcher.accepting(mediaTypes);
    return std::move(*this);
  }

  [[nodiscard]] SingleRouteBuilder requiringContentType(std::initializer_list<std::string_view> mediaTypes,
                                                        bool allowMissing = false) && {
    _matcher.requiringContentType(mediaTypes, allowMissing);
    return std::move(*this);
  }

  // Registers the route with 'handler' as terminal stage.
  Route& to(RequestHandler handler) && {
    return _builder->addRoute(_pattern, std::make_unique<RouteImpl<SetT, ChainT, PathE, QueryE>>(
                                            std::move(_matcher), std::move(_pipelines), std::move(_chain),
                                            std::move(handler)));
  }

 private:
  RouterBuilder* _builder;
  std::string _pattern;
  RouteMatcher _matcher;
  SetT _pipelines;
  ChainT _chain;
};

// Mounts a separately built router under a pattern, inside the pipeline chain of the scope it comes from.
template <class SetT, class ChainT>
class DelegateBuilder {
 public:
  DelegateBuilder(RouterBuilder& builder, std::string pattern, SetT pipelines, ChainT chain)
      : _builder(&builder), _pattern(std::move(pattern)), _pipelines(std::move(pipelines)), _chain(std::move(chain)) {}

  Route& toRouter(std::shared_ptr<const Router> subRouter) && {
    if constexpr (ChainT::kNbPipelines == 0) {
      return _builder->delegate(_pattern, std::move(subRouter));
    } else {
      return _builder->addRoute(_pattern, std::make_unique<PipelinedDelegatingRoute<SetT, ChainT>>(
                                              std::move(subRouter), std::move(_pipelines), std::move(_chain)));
    }
  }

 private:
  RouterBuilder* _builder;
  std::string _pattern;
  SetT _pipelines;
  ChainT _chain;
};

// Several routes sharing one pattern, distinguished by verb or header constraints.
template <class SetT, class ChainT>
class AssociatedRouteBuilder {
 public:
  AssociatedRouteBuilder(RouterBuilder& builder, std::string pattern, SetT pipelines, ChainT chain)
      : _builder(&builder), _pattern(std::move(pattern)), _pipelines(std::move(pipelines)), _chain(std::move(chain)) {}

  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> request(http::MethodBmp methods) const {
    return {*_builder, _pattern, RouteMatcher(methods), _pipelines, _chain};
  }

  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> get() const { return request(Bmp(http::Method::GET)); }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> head() const { return request(Bmp(http::Method::HEAD)); }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> getOrHead() const {
    return request(http::Method::GET | http::Method::HEAD);
  }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> post() const { return request(Bmp(http::Method::POST)); }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> put() const { return request(Bmp(http::Method::PUT)); }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> patch() const { return request(Bmp(http::Method::PATCH)); }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> del() const { return request(Bmp(http::Method::DELETE)); }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> options() const { return request(Bmp(http::Method::OPTIONS)); }

 private:
  static constexpr http::MethodBmp Bmp(http::Method method) noexcept { return static_cast<http::MethodBmp>(method); }

  RouterBuilder* _builder;
  std::string _pattern;
  SetT _pipelines;
  ChainT _chain;
};

// Draws routes below a path prefix, all of them running the same pipeline chain unless overridden with
// withPipelineChain.
template <class SetT, class ChainT>
  requires ChainResolvableIn<SetT, ChainT>
class ScopeBuilder {
 public:
  ScopeBuilder(RouterBuilder& builder, std::string prefix, SetT pipelines, ChainT chain)
      : _builder(&builder), _prefix(std::move(prefix)), _pipelines(std::move(pipelines)), _chain(std::move(chain)) {}

  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> request(http::MethodBmp methods, std::string_view pattern) const {
    return {*_builder, JoinPatterns(_prefix, pattern), RouteMatcher(methods), _pipelines, _chain};
  }

  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> get(std::string_view pattern) const {
    return request(Bmp(http::Method::GET), pattern);
  }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> head(std::string_view pattern) const {
    return request(Bmp(http::Method::HEAD), pattern);
  }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> getOrHead(std::string_view pattern) const {
    return request(http::Method::GET | http::Method::HEAD, pattern);
  }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> post(std::string_view pattern) const {
    return request(Bmp(http::Method::POST), pattern);
  }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> put(std::string_view pattern) const {
    return request(Bmp(http::Method::PUT), pattern);
  }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> patch(std::string_view pattern) const {
    return request(Bmp(http::Method::PATCH), pattern);
  }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> del(std::string_view pattern) const {
    return request(Bmp(http::Method::DELETE), pattern);
  }
  [[nodiscard]] SingleRouteBuilder<SetT, ChainT> options(std::string_view pattern) const {
    return request(Bmp(http::Method::OPTIONS), pattern);
  }

  // Draws the routes of 'fn' below 'prefix', relative to this scope.
  template <class Fn>
  void scope(std::string_view prefix, Fn&& fn) const {
    ScopeBuilder nested(*_builder, JoinPatterns(_prefix, prefix), _pipelines, _chain);
    std::forward<Fn>(fn)(nested);
  }

  // Draws the routes of 'fn' in this scope with another pipeline chain, resolved against the same pipeline set.
  template <class OtherChainT, class Fn>
    requires ChainResolvableIn<SetT, OtherChainT>
  void withPipelineChain(OtherChainT chain, Fn&& fn) const {
    ScopeBuilder<SetT, OtherChainT> nested(*_builder, _prefix, _pipelines, std::move(chain));
    std::forward<Fn>(fn)(nested);
  }

  template <class Fn>
  void associate(std::string_view pattern, Fn&& fn) const {
    AssociatedRouteBuilder<SetT, ChainT> assoc(*_builder, JoinPatterns(_prefix, pattern), _pipelines, _chain);
    std::forward<Fn>(fn)(assoc);
  }

  // Mounts a router below 'pattern'. Requests reaching it run the chain of this scope first.
  [[nodiscard]] DelegateBuilder<SetT, ChainT> delegate(std::string_view pattern) const {
    return {*_builder, JoinPatterns(_prefix, pattern), _pipelines, _chain};
  }

  // Mounts a router below 'pattern' outside of any pipeline chain.
  [[nodiscard]] DelegateBuilder<SetT, EmptyChain> delegateWithoutPipelines(std::string_view pattern) const {
    return {*_builder, JoinPatterns(_prefix, pattern), _pipelines, EmptyChain{}};
  }

  [[nodiscard]] std::string_view prefix() const noexcept { return _prefix; }

 private:
  static constexpr http::MethodBmp Bmp(http::Method method) noexcept { return static_cast<http::MethodBmp>(method); }

  RouterBuilder* _builder;
  std::string _prefix;
  SetT _pipelines;
  ChainT _chain;
};

// Builds a frozen router whose routes are drawn by 'fn', receiving the root ScopeBuilder.
// Every route runs 'chain' (resolved against 'pipelines') unless a nested withPipelineChain says otherwise.
template <class SetT, class ChainT, class Fn>
  requires ChainResolvableIn<SetT, ChainT>
[[nodiscard]] std::shared_ptr<const Router> BuildRouter(RouterConfig config, SetT pipelines, ChainT chain, Fn&& fn) {
  RouterBuilder builder(std::move(config));
  ScopeBuilder<SetT, ChainT> root(builder, "/", std::move(pipelines), std::move(chain));
  std::forward<Fn>(fn)(root);
  return std::move(builder).build();
}

struct NoPipelinesTag {};

// Router whose routes run no middleware.
template <class Fn>
[[nodiscard]] std::shared_ptr<const Router> BuildSimpleRouter(RouterConfig config, Fn&& fn) {
  return BuildRouter(std::move(config), NewPipelineSet<NoPipelinesTag>().finalize(), EmptyChain{},
                     std::forward<Fn>(fn));
}

template <class Fn>
[[nodiscard]] std::shared_ptr<const Router> BuildSimpleRouter(Fn&& fn) {
  return BuildSimpleRouter(RouterConfig{}, std::forward<Fn>(fn));
}

}  // namespace trellis
