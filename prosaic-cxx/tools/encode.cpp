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
#include <prosaic/util/random.hpp>
#include <prosaic/util/text.hpp>

#include <cxxopts.hpp>

#include <format>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "prosaic/config.hpp"

using namespace prosaic::runtime;
using namespace prosaic::tool;
using namespace prosaic::util;

static const std::map<std::string, SerializerFn> serializers = {
  {"simple", SimpleSpaceSerializer},
  {"prose", ProseSerializer},
};

int main(int argc, char **argv) {
  try {
    cxxopts::Options options(argv[0], "Prosaic: Encode a secret into a grammar-generated sentence");
    options.add_options()
      ("g,grammar",
       "weighted grammar file",
       cxxopts::value<std::string>(),
       "FILE")
      ("r,start",
       "start symbol of the grammar",
       cxxopts::value<std::string>()->default_value(Grammar::default_start),
       "NAME")
      ("m,message",
       "secret message",
       cxxopts::value<std::string>(),
       "TEXT")
      ("k,key",
       "secret key",
       cxxopts::value<std::string>(),
       "TEXT")
      ("b,bits",
       "length of the payload derived from message and key",
       cxxopts::value<size_t>()->default_value(std::to_string(default_payload_bits)),
       "NUM")
      ("max-bits",
       "embed at most this many payload bits (0: no cap)",
       cxxopts::value<size_t>()->default_value("0"),
       "NUM")
      ("max-attempts",
       "maximum number of derivations tried against the naturalness check",
       cxxopts::value<int>()->default_value(std::to_string(Encoder::default_max_attempts)),
       "NUM")
      ("random-seed",
       "initialize random number generator with fixed seed (not set by default)",
       cxxopts::value<unsigned int>(),
       "NUM")
      ("p,profile",
       "JSON detector profile whose excluded symbols never carry payload",
       cxxopts::value<std::string>(),
       "FILE")
      ("exclude",
       "symbols that never carry payload",
       cxxopts::value<std::vector<std::string>>())
      ("serializer",
       "joining of the generated words (choices: simple, prose)",
       cxxopts::value<std::string>()->default_value("simple"),
       "NAME")
      ("lenient",
       "clamp out-of-range probabilities instead of rejecting the grammar",
       cxxopts::value<bool>()->default_value("false"))
      ("json",
       "print the result as JSON",
       cxxopts::value<bool>()->default_value("false"))
      ("log-level",
       "diagnostics level (off, fatal, error, warn, info, debug, trace)",
       cxxopts::value<std::string>()->default_value("warn"),
       "LEVEL")
      ("version", "print version and exit")
      ("help", "print help and exit")
      ;
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

    for (const char* required : {"grammar", "message", "key"}) {
      if (!args.count(required)) {
        throw cxxopts::exceptions::parsing(std::format("Missing option '{}'", required));
      }
    }

    auto serializer_it = serializers.find(args["serializer"].as<std::string>());
    if (serializer_it == serializers.end()) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'serializer'");
    }

    if (args.count("random-seed")) {
      seed_random(args["random-seed"].as<unsigned int>());
    } else {
      unsigned int seed = seed_random_from_entropy();
      PROSAIC_LOG_DEBUG("random seed {}", seed);
    }

    DetectorProfile profile;
    if (args.count("profile") && !JsonProfileLoader().load(args["profile"].as<std::string>(), profile)) {
      exit(1);
    }
    if (args.count("exclude")) {
      for (auto symbol : args["exclude"].as<std::vector<std::string>>()) {
        trim(symbol);
        profile.excluded.insert(symbol);
      }
    }

    std::string src = GrammarLoader().load(args["grammar"].as<std::string>());
    Grammar grammar(src, args["start"].as<std::string>(),
                    args["lenient"].as<bool>() ? Grammar::LenientParse : Grammar::StrictParse);
    HuffmanCoder coder(grammar);
    Encoder encoder(coder, new DefaultModel(), {}, serializer_it->second, args["max-attempts"].as<int>());
    encoder.exclude(profile.excluded);

    EncodeResult result = encoder.encode(args["message"].as<std::string>(), args["key"].as<std::string>(),
                                         args["bits"].as<size_t>(), args["max-bits"].as<size_t>());

    if (args["json"].as<bool>()) {
      nlohmann::json report = JsonReport().toJson(result);
      report["fingerprint"] = JsonReport::fingerprint(grammar);
      pout(report.dump(2));
    } else {
      pout(result.text);
      perrf("embedded {} of {} bits in {} attempt(s){}", result.bits_embedded, result.payload.size(), result.attempts,
            result.natural ? "" : " (naturalness check failed)");
    }
  } catch (const cxxopts::exceptions::exception &e) {
    perrf("error parsing options: {}", e.what());
    exit(1);
  } catch (const prosaic::runtime::GrammarError &e) {
    perrf("{}", e.what());
    exit(1);
  } catch (const std::exception &e) {
    perrf("encoding failed: {}", e.what());
    exit(1);
  }
}
