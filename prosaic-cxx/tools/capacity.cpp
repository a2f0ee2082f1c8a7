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

#include <cxxopts.hpp>

#include <string>

#include "prosaic/config.hpp"

using namespace prosaic::runtime;
using namespace prosaic::tool;
using namespace prosaic::util;

int main(int argc, char **argv) {
  try {
    cxxopts::Options options(argv[0], "Prosaic: Report the embedding capacity of a grammar");
    options.add_options()
      ("g,grammar",
       "weighted grammar file",
       cxxopts::value<std::string>(),
       "FILE")
      ("r,start",
       "start symbol of the grammar",
       cxxopts::value<std::string>()->default_value(Grammar::default_start),
       "NAME")
      ("lenient",
       "clamp out-of-range probabilities instead of rejecting the grammar",
       cxxopts::value<bool>()->default_value("false"))
      ("json",
       "print the report as JSON",
       cxxopts::value<bool>()->default_value("false"))
      ("version", "print version and exit")
      ("help", "print help and exit");

    options.parse_positional({"grammar"});
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
      pout(options.help());
      exit(0);
    }
    if (args.count("version")) {
      poutf("{} {}", argv[0], PROSAIC_VERSION);
      exit(0);
    }
    if (!args.count("grammar")) {
      throw cxxopts::exceptions::parsing("Missing option 'grammar'");
    }

    Grammar grammar(GrammarLoader().load(args["grammar"].as<std::string>()), args["start"].as<std::string>(),
                    args["lenient"].as<bool>() ? Grammar::LenientParse : Grammar::StrictParse);

    if (args["json"].as<bool>()) {
      pout(JsonReport().capacity(grammar).dump(2));
      exit(0);
    }

    for (const std::string& symbol : grammar.symbols()) {
      unsigned bits = grammar.capacity(symbol);
      if (bits > 0) {
        poutf("{:<24} {:>3} alternatives  {:>2} bit(s)", symbol, grammar.alternatives(symbol).size(), bits);
      }
    }
    poutf("maximum embeddable bits: {}", grammar.capacity());
    poutf("grammar fingerprint: {}", JsonReport::fingerprint(grammar));
  } catch (const cxxopts::exceptions::exception &e) {
    perrf("error parsing options: {}", e.what());
    exit(1);
  } catch (const prosaic::runtime::GrammarError &e) {
    perrf("{}", e.what());
    exit(1);
  }
}
