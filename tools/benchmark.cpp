#include <chrono>
#include <thread>
#include <cstdlib>
#include <string>
#include <vector>
#include <utility>
#include <iostream>
#include <algorithm>

#include <httplib.h>
#include <fmt/format.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

const std::pair<const char*, const char*> kTests[] = {
  {"Basic Math", "print(2 + 2)"},
  {"Loop", "print(sum(range(100)))"},
  {"String Operations", "text = 'Hello World'; print(text.upper())"},
  {"List Comprehension", "squares = [x**2 for x in range(10)]; print(squares[:5])"},
  {"Import Module", "import math; print(math.pi)"},
};

struct Outcome {
  bool success;
  double response_time;
  std::string error;
};

httplib::Headers AuthHeaders(const std::string& token) {
  return {{"Authorization", "Bearer " + token}};
}

bool HealthCheck(httplib::Client& cli, const std::string& token) {
  auto res = cli.Get("/health", AuthHeaders(token));
  return res && res->status == 200;
}

Outcome Execute(httplib::Client& cli, const std::string& token, const std::string& code) {
  auto start = std::chrono::steady_clock::now();
  json body{{"code", code}, {"language", "python"}};
  auto res = cli.Post("/execute", AuthHeaders(token), body.dump(), "application/json");
  double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  if (!res) return {false, elapsed, httplib::to_string(res.error())};
  if (res->status != 200) return {false, elapsed, fmt::format("HTTP {}", res->status)};
  json reply = json::parse(res->body, nullptr, false);
  if (!reply.is_object()) return {false, elapsed, "malformed reply"};
  bool success = reply.value("success", false);
  std::string error;
  if (!success) {
    if (reply.contains("error") && reply["error"].is_string()) {
      error = reply["error"].get<std::string>();
    } else if (reply.contains("stderr") && reply["stderr"].is_string()) {
      error = reply["stderr"].get<std::string>();
    }
  }
  return {success, elapsed, error};
}

} // namespace

int main(int argc, char** argv) {
  argparse::ArgumentParser parser(argc ? argv[0] : "sandpool-bench");
  parser.add_argument("--host")
    .default_value(std::string("http://localhost:8080"))
    .help("Base URL of the server");
  parser.add_argument("--token")
    .help("Auth token (default: $AUTH_TOKEN)");
  parser.add_argument("--iterations")
    .scan<'d', int>().default_value(3)
    .help("Iterations per test");
  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  std::string token;
  if (auto val = parser.present<std::string>("--token")) {
    token = val.value();
  } else if (const char* env = std::getenv("AUTH_TOKEN")) {
    token = env;
  }
  if (token.empty()) {
    fmt::print(stderr, "Error: Need auth token via --token or AUTH_TOKEN env var\n");
    return 1;
  }
  int iterations = parser.get<int>("--iterations");
  std::string host = parser.get<std::string>("--host");
  while (host.size() && host.back() == '/') host.pop_back();

  httplib::Client cli(host);
  cli.set_connection_timeout(std::chrono::seconds(10));
  cli.set_read_timeout(std::chrono::seconds(30));

  fmt::print("Checking API health...\n");
  if (!HealthCheck(cli, token)) {
    fmt::print(stderr, "Error: API health check failed\n");
    return 1;
  }
  fmt::print("API healthy\n\nRunning API benchmark ({} iterations per test)\n\n", iterations);

  std::vector<double> all_times;
  int total = 0, successful = 0;
  for (auto& [name, code] : kTests) {
    fmt::print("Testing: {}\n", name);
    std::vector<double> times;
    for (int i = 0; i < iterations; i++) {
      Outcome outcome = Execute(cli, token, code);
      total++;
      if (outcome.success) {
        successful++;
        times.push_back(outcome.response_time);
        fmt::print("  ok {}: {:.3f}s\n", i + 1, outcome.response_time);
      } else {
        fmt::print("  failed {}: {}\n", i + 1, outcome.error.size() ? outcome.error : "Unknown error");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (times.size()) {
      double sum = 0;
      for (double t : times) sum += t;
      fmt::print("  Average: {:.3f}s\n\n", sum / times.size());
    } else {
      fmt::print("  All failed\n\n");
    }
    all_times.insert(all_times.end(), times.begin(), times.end());
  }

  fmt::print("========================================\nSUMMARY\n========================================\n");
  fmt::print("Tests: {}, Success: {} ({:.1f}%)\n", total, successful,
             total ? successful * 100.0 / total : 0.0);
  if (all_times.size()) {
    double sum = 0;
    for (double t : all_times) sum += t;
    auto [min, max] = std::minmax_element(all_times.begin(), all_times.end());
    fmt::print("Average: {:.3f}s\nRange: {:.3f}s - {:.3f}s\n", sum / all_times.size(), *min, *max);
  }
  return successful == total ? 0 : 1;
}
