#include <trellis/trellis.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

using namespace trellis;

// Reads "<METHOD> <target>" lines on stdin, serves each of them through a small service and prints the responses.
//   printf 'GET /hello/world\nPUT /hello/world\nGET /files/a/b\n' | trellis-replay
namespace {

struct DemoTag {};

std::shared_ptr<const Service> BuildDemoService() {
  auto [set, handle] = NewPipelineSet<DemoTag>().add(
      NewPipeline().add(RequestLoggerMiddleware{}).add(TimerMiddleware{}).add(SecurityHeadersMiddleware{}).build());

  auto router = BuildRouter(RouterConfig{}, std::move(set).finalize(), MakeChain(handle), [](auto& route) {
    route.getOrHead("/").to([](RequestState&) { return http::HttpResponse(http::StatusCodeOK, "trellis demo\n"); });
    route.get("/hello/:name").to([](RequestState& state) {
      return http::HttpResponse(http::StatusCodeOK,
                                "Hello " + state.borrow<PathParams>().get<std::string>("name") + "!\n");
    });
    route.get("/add/:a|-?[0-9]+/:b|-?[0-9]+").to([](RequestState& state) {
      const PathParams& params = state.borrow<PathParams>();
      return http::HttpResponse(http::StatusCodeOK,
                                std::to_string(params.get<long>("a") + params.get<long>("b")) + "\n");
    });
    route.get("/files/*path").to([](RequestState& state) {
      std::string body;
      for (const std::string& part : state.borrow<PathParams>().getAll<std::string>("path")) {
        body.append(part).push_back('\n');
      }
      return http::HttpResponse(http::StatusCodeOK, std::move(body));
    });
  });

  Dispatcher dispatcher(ServiceConfig{}.withEchoRequestId());
  dispatcher.addFinalizer(StatusFinalizer(http::StatusCodeNotFound, [](RequestState& state, http::HttpResponse& response) {
    response.body("Nothing at " + std::string(state.borrow<http::HttpRequest>().path()) + "\n");
  }));
  return MakeService(std::move(router), std::move(dispatcher));
}

void Print(const http::HttpResponse& response) {
  std::cout << response.status() << ' ' << response.reason() << '\n';
  for (const auto& [name, value] : response.headers()) {
    std::cout << name << ": " << value << '\n';
  }
  std::cout << '\n' << response.body() << '\n';
}

}  // namespace

int main() {
  try {
    const auto service = BuildDemoService();

    std::string line;
    while (std::getline(std::cin, line)) {
      const std::string_view view(line);
      const auto sep = view.find(' ');
      if (sep == std::string_view::npos) {
        std::cerr << "Expected '<METHOD> <target>', got: " << line << '\n';
        continue;
      }
      const auto method = http::MethodFromStr(view.substr(0, sep));
      if (!method) {
        std::cerr << "Unknown method in: " << line << '\n';
        continue;
      }
      Print(service->handle(http::HttpRequest(*method, view.substr(sep + 1))));
    }
  } catch (const std::exception& e) {
    std::cerr << "Demo service error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
