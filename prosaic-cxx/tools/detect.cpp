// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <prosaic/runtime.hpp>
#include <prosaic/tool.hpp>
#include <prosaic/util/io.hpp>
#include <prosaic/util/log.hpp>
#include <prosaic/util/text.hpp>

#include <cxxopts.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "prosaic/config.hpp"

using namespace prosaic::runtime;
using namespace prosaic::tool;
using namespace prosaic::util;

static std::vector<std::string> list_option(const cxxopts::ParseResult& args, const std::string& name) {
  auto values = args.count(name) ? args[name].as<std::vector<std::string>>() : std::vector<std::string>{};
  for (auto& s : values) {
    trim(s);
  }
  return values;
}

int main(int argc, char **argv) {
  int status = 0;
  try {
    cxxopts::Options options(argv[0], "Prosaic: Detect a hidden payload in text");
    options.add_options()
      ("input",
       "text files to analyze (default: standard input)",
       cxxopts::value<std::vector<std::string>>(),
       "PATH")
      ("g,grammar",
       "weighted grammar file the text was generated from",
       cxxopts::value<std::string>(),
       "FILE")
      ("r,start",
       "start symbol of the grammar",
       cxxopts::value<std::string>()->default_value(Grammar::default_start),
       "NAME")
      ("p,profile",
       "JSON detector profile (marker, slots, excluded)",
       cxxopts::value<std::string>(),
       "FILE")
      ("marker",
       "word marking the carrier sentence (overrides the profile)",
       cxxopts::value<std::string>(),
       "WORD")
      ("slots",
       "ordered payload-bearing symbols (overrides the profile)",
       cxxopts::value<std::vector<std::string>>())
      ("exclude",
       "symbols that never carry payload",
       cxxopts::value<std::vector<std::string>>())
      ("keys",
       "candidate keys to rank against the extracted bits",
       cxxopts::value<std::vector<std::string>>())
      ("keys-file",
       "file of candidate keys, one per line",
       cxxopts::value<std::string>(),
       "FILE")
      ("wordlist",
       "file of candidate messages, one per line (default: built-in list)",
       cxxopts::value<std::string>(),
       "FILE")
      ("json",
       "print the result as JSON",
       cxxopts::value<bool>()->default_value("false"))
      ("log-level",
       "diagnostics level (off, fatal, error, warn, info, debug, trace)",
       cxxopts::value<std::string>()->default_value("warn"),
       "LEVEL")
      ("version", "print version and exit")
      ("help", "print help and exit");

    options.parse_positional({"input"});
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
      pout(options.help());
      exit(0);
    }
    if (args.count("version")) {
      poutf("{} {}", argv[0], PROSAIC_VERSION);
      poutf("log level ceiling: {}", PROSAIC_STRFY(PROSAIC_LOG_LEVEL));
      exit(0);
    }

    std::optional<int> level = parse_log_level(args["log-level"].as<std::string>());
    if (!level) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'log-level'");
    }
    init_logging(*level);

    if (!args.count("grammar")) {
      throw cxxopts::exceptions::parsing("Missing option 'grammar'");
    }

    DetectorProfile profile;
    if (args.count("profile") && !JsonProfileLoader().load(args["profile"].as<std::string>(), profile)) {
      exit(1);
    }
    if (args.count("marker")) {
      profile.marker = args["marker"].as<std::string>();
    }
    if (args.count("slots")) {
      profile.slots = list_option(args, "slots");
    }
    for (const auto& symbol : list_option(args, "exclude")) {
      profile.excluded.insert(symbol);
    }

    GrammarLoader loader;
    std::vector<std::string> keys = list_option(args, "keys");
    if (args.count("keys-file")) {
      auto more = loader.load_entries(args["keys-file"].as<std::string>());
      keys.insert(keys.end(), more.begin(), more.end());
    }
    std::vector<std::string> messages = args.count("wordlist")
        ? loader.load_entries(args["wordlist"].as<std::string>())
        : std::vector<std::string>{};

    Codec codec(loader.load(args["grammar"].as<std::string>()), args["start"].as<std::string>(), Grammar::LenientParse);
    Detector detector(codec.coder(), profile);
    NaturalnessEvaluator evaluator;
    JsonReport report;

    std::vector<std::pair<std::string, std::string>> texts;
    if (args.count("input")) {
      for (const auto& path : args["input"].as<std::vector<std::string>>()) {
        std::optional<std::string> text = read_file(path);
        if (!text) {
          perrf("Failed to open input file {}.", path);
          status = 1;
          continue;
        }
        texts.emplace_back(path, *text);
      }
    } else {
      texts.emplace_back("<stdin>", read_stream(std::cin));
    }

    for (const auto& [name, text] : texts) {
      DetectionResult result = detector.detect(text);
      std::vector<KeyCandidate> ranked;
      if (result.detected && !keys.empty()) {
        ranked = codec.recover(result, keys, messages);
      }

      if (args["json"].as<bool>()) {
        nlohmann::json j = report.toJson(result);
        j["input"] = name;
        j["naturality"] = evaluator.naturality(text);
        j["fingerprint"] = JsonReport::fingerprint(codec.grammar());
        j["keys"] = report.toJson(ranked);
        pout(j.dump(2));
        continue;
      }

      if (!result.detected) {
        poutf("{}: no payload detected", name);
        continue;
      }
      poutf("{}: detected {} bits: {}", name, result.bits.size(), result.bits);
      poutf("  carrier: {}", result.sentence);
      poutf("  naturality: {:.3f}", evaluator.naturality(text));
      for (const SlotMatch& match : result.trace) {
        poutf("  {} = '{}' -> {}{}", match.symbol, match.alternative, match.codeword, match.overlaps ? " (overlapping)" : "");
      }
      for (const KeyCandidate& candidate : ranked) {
        poutf("  key '{}': {} (confidence {:.3f})", candidate.key, candidate.message, candidate.confidence);
      }
    }
  } catch (const cxxopts::exceptions::exception &e) {
    perrf("error parsing options: {}", e.what());
    exit(1);
  } catch (const prosaic::runtime::GrammarError &e) {
    perrf("{}", e.what());
    exit(1);
  } catch (const std::exception &e) {
    perrf("detection failed: {}", e.what());
    exit(1);
  }
  return status;
}
