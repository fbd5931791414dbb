/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <qtils/final_action.hpp>
#include <qtils/read_file.hpp>

#include "app/read_chain_spec_yaml.hpp"
#include "crypto/bls/bls_provider_impl.hpp"
#include "log/logger.hpp"
#include "op_pool/persistence.hpp"
#include "state_processing/operation_verifier_impl.hpp"

namespace {
  namespace po = boost::program_options;

  constexpr std::string_view kLoggingYaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: oppool
        children:
          - name: op_pool
)yaml";

  outcome::result<void> printPool(
      const oppool::op_pool::OperationPool &pool,
      const std::optional<oppool::ChainSpec> &spec) {
    OUTCOME_TRY(persisted,
                oppool::op_pool::PersistedOperationPool::fromOperationPool(
                    pool));

    fmt::println("attestations: {} in {} buckets",
                 pool.numAttestations(),
                 persisted.attestations.size());
    for (auto &bucket : persisted.attestations.data()) {
      auto &data = bucket.attestations.data().front().data;
      fmt::println("  slot {} committee {} source {} target {}: {} entries",
                   data.slot,
                   data.index,
                   data.source,
                   data.target,
                   bucket.attestations.size());
    }
    fmt::println("proposer slashings: {}", pool.numProposerSlashings());
    fmt::println("attester slashings: {}", pool.numAttesterSlashings());
    fmt::println("voluntary exits: {}", pool.numVoluntaryExits());

    if (spec) {
      fmt::println(
          "per block limits: {} attestations, {} proposer slashings, "
          "{} attester slashings, {} voluntary exits",
          spec->max_attestations,
          spec->max_proposer_slashings,
          spec->max_attester_slashings,
          spec->max_voluntary_exits);
    }
    return outcome::success();
  }
}  // namespace

int main(int argc, const char **argv) {
  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  po::options_description options("Operation pool snapshot options");
  // clang-format off
  options.add_options()
      ("help,h", "show help")
      ("snapshot,s", po::value<std::string>(), "Path to persisted operation pool snapshot.")
      ("spec", po::value<std::string>(), "Optional. Path to chain spec yaml.")
      ("log,l", po::value<std::vector<std::string>>(),
       "Sets a custom logging filter.\n"
       "Syntax: <level> or <group>=<level>, e.g. -lop_pool=debug.\n"
       "Log levels: trace, debug, verbose, info, warn, error, critical, off.");
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(options).run(), vm);
    po::notify(vm);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n'
              << "Try run with option '--help' for more information\n";
    return EXIT_FAILURE;
  }

  if (vm.contains("help")) {
    std::cout << options << '\n';
    return EXIT_SUCCESS;
  }
  if (not vm.contains("snapshot")) {
    std::cerr << "Error: option '--snapshot' is required\n"
              << "Try run with option '--help' for more information\n";
    return EXIT_FAILURE;
  }

  auto logsys_res = oppool::log::createLoggingSystem(kLoggingYaml);
  if (logsys_res.has_error()) {
    return EXIT_FAILURE;
  }
  auto logsys = logsys_res.value();
  if (vm.contains("log")) {
    auto tune_res =
        logsys->tuneLoggingSystem(vm["log"].as<std::vector<std::string>>());
    if (tune_res.has_error()) {
      std::cerr << "Invalid option '--log': " << tune_res.error().message()
                << '\n';
      return EXIT_FAILURE;
    }
  }
  auto logger = logsys->getLogger("Main", oppool::log::defaultGroupName);

  std::optional<oppool::ChainSpec> spec;
  if (vm.contains("spec")) {
    auto path = vm["spec"].as<std::string>();
    auto spec_res = oppool::app::readChainSpecYaml(path);
    if (spec_res.has_error()) {
      SL_CRITICAL(logger, "Can't read chain spec {}: {}", path, spec_res.error());
      return EXIT_FAILURE;
    }
    spec = spec_res.value();
  }

  auto path = vm["snapshot"].as<std::string>();
  auto bytes_res = qtils::readBytes(path);
  if (bytes_res.has_error()) {
    SL_CRITICAL(logger, "Can't read snapshot {}: {}", path, bytes_res.error());
    return EXIT_FAILURE;
  }

  auto bls_provider =
      std::make_shared<oppool::crypto::bls::BlsProviderImpl>();
  auto verifier =
      std::make_shared<oppool::state_processing::OperationVerifierImpl>(
          bls_provider);
  auto pool_res = oppool::op_pool::decodeOperationPool(
      bytes_res.value(), logsys, verifier, bls_provider);
  if (pool_res.has_error()) {
    SL_CRITICAL(
        logger, "Can't decode snapshot {}: {}", path, pool_res.error());
    return EXIT_FAILURE;
  }

  auto print_res = printPool(*pool_res.value(), spec);
  if (print_res.has_error()) {
    SL_CRITICAL(logger, "Can't print snapshot {}: {}", path, print_res.error());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
