#include <lazycombo/combinations.hpp>
#include <lazycombo/generate.hpp>
#include <lazycombo/take.hpp>

#include <boost/program_options.hpp>
#include <spdlog/fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
  // Enumerates seq's combinations repeat times over the same enumerator,
  // printing one combination per line.  pulls is updated by the producer
  // behind seq.
  template <typename Sequence>
  void print_combinations(
      Sequence&& seq, int k, int repeat, const std::size_t& pulls) {
    auto combos = lazycombo::combinations(std::forward<Sequence>(seq), k);
    spdlog::debug("{} elements pulled to prime k = {}", pulls, k);

    for (int pass = 1; pass <= repeat; ++pass) {
      std::size_t emitted = 0;
      for (auto&& combo : combos) {
        spdlog::debug("combination {}: {}", emitted, fmt::join(combo, ", "));
        std::cout << fmt::format("{}\n", fmt::join(combo, " "));
        ++emitted;
      }
      spdlog::info("pass {}: {} combinations emitted, {} elements pulled",
          pass, emitted, pulls);
    }
  }
}

int main(int argc, char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("lazycombo"));

  namespace po = boost::program_options;
  po::options_description desc("Allowed options");
  // clang-format off
  desc.add_options()
    ("help,h", "Print this help message")
    ("size,k", po::value<int>()->default_value(2), "Number of elements in each combination")
    ("naturals,n", po::value<int>(), "Draw from the first N natural numbers instead of the given items")
    ("repeat,r", po::value<int>()->default_value(1), "Traverse the same enumerator this many times")
    ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, err, critical or off")
    ("items", po::value<std::vector<std::string>>()->multitoken(), "Elements to combine");
  // clang-format on

  po::positional_options_description p;
  p.add("items", -1);

  po::variables_map vm;
  try {
    po::store(
        po::command_line_parser(argc, argv).options(desc).positional(p).run(),
        vm);
    po::notify(vm);
  } catch (const po::error& e) {
    spdlog::error("{}", e.what());
    std::cerr << desc << '\n';
    return 1;
  }

  if (vm.count("help")) {
    std::cout << "Usage: " << argv[0] << " [options] [items...]\n"
              << desc << '\n';
    return 0;
  }

  const auto level_name = vm["log-level"].as<std::string>();
  const auto level = spdlog::level::from_str(level_name);
  if (level == spdlog::level::off && level_name != "off") {
    spdlog::error("unknown log level '{}'", level_name);
    return 1;
  }
  spdlog::set_level(level);

  if (vm.count("naturals") && vm.count("items")) {
    spdlog::error("--naturals cannot be combined with positional items");
    return 1;
  }

  const int k = vm["size"].as<int>();
  const int repeat = vm["repeat"].as<int>();
  std::size_t pulls = 0;

  try {
    if (vm.count("naturals")) {
      const int n = vm["naturals"].as<int>();
      spdlog::info("combinations of size {} from the first {} natural numbers",
          k, n);
      auto naturals = lazycombo::generate(
          [&pulls, next = 0L]() mutable -> std::optional<long> {
            ++pulls;
            return next++;
          });
      print_combinations(lazycombo::take(naturals, n), k, repeat, pulls);
    } else {
      std::vector<std::string> items;
      if (vm.count("items")) {
        items = vm["items"].as<std::vector<std::string>>();
      }
      spdlog::info("combinations of size {} from {} items", k, items.size());
      auto producer = lazycombo::generate(
          [&pulls, &items, pos = std::size_t{0}]() mutable
          -> std::optional<std::string> {
            ++pulls;
            if (pos == items.size()) {
              return std::nullopt;
            }
            return items[pos++];
          });
      print_combinations(std::move(producer), k, repeat, pulls);
    }
  } catch (const std::invalid_argument& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
