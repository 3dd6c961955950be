#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/identity/identifier_deriver.hpp"
#include "internal/model/parameter_set.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using mediacache::model::FileCategory;
using mediacache::model::ParameterSet;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mediacachectl <config.yaml|-> source-id <filename>\n"
            << "  mediacachectl <config.yaml|-> derive-id <operation> <params_json> <input_id>...\n"
            << "  mediacachectl <config.yaml|-> register-source <path>\n"
            << "  mediacachectl <config.yaml|-> register <generated|metadata> <operation> <params_json> <path> <input_id>...\n"
            << "  mediacachectl <config.yaml|-> lookup <operation> <params_json> <input_id>...\n"
            << "  mediacachectl <config.yaml|-> resolve <id>\n"
            << "  mediacachectl <config.yaml|-> dependents <id>\n"
            << "  mediacachectl <config.yaml|-> check-changes [source_path]\n"
            << "  mediacachectl <config.yaml|-> rebuild\n"
            << "  mediacachectl <config.yaml|-> integrity [prune]\n"
            << "  mediacachectl <config.yaml|-> cleanup [max_age_days]\n";
}

static std::vector<std::string> Rest(int argc, char** argv, int from) {
  std::vector<std::string> out;
  for (int i = from; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

static const char* DivergenceName(const mediacache::cache::SourceDivergence& divergence) {
  return divergence.kind == mediacache::cache::SourceDivergence::Kind::kMissing ? "missing" : "modified";
}

static void PrintDivergence(const mediacache::cache::SourceDivergence& divergence) {
  std::cout << DivergenceName(divergence) << " " << divergence.source_id << " invalidated=" << divergence.invalidated.size() << "\n";
  for (const auto& id : divergence.invalidated) {
    std::cout << "  " << id << "\n";
  }
}

static int Run(const std::string& config_path, const std::string& cmd, int argc, char** argv) {
  // Pure commands: no registry needed.
  if (cmd == "source-id") {
    if (argc < 4) return 1;
    std::cout << mediacache::identity::SourceId(argv[3]) << "\n";
    return 0;
  }

  if (cmd == "derive-id") {
    if (argc < 6) return 1;
    std::cout << mediacache::identity::DerivedId(Rest(argc, argv, 5), argv[3], ParameterSet::FromJson(argv[4])) << "\n";
    return 0;
  }

  const auto config = config_path == "-" ? mediacache::config::ConfigLoader::LoadDefaults()
                                         : mediacache::config::ConfigLoader::LoadFromYaml(config_path);
  mediacache::observability::InitializeLogging(config);

  auto  deps     = mediacache::factory::BuildRuntime(config);
  auto& service  = *deps.service;
  auto& registry = *deps.registry;

  // ------------------------------------------------------------

  if (cmd == "register-source") {
    if (argc < 4) return 1;
    std::cout << registry.RegisterSource(argv[3]) << "\n";
    service.Save();
    return 0;
  }

  if (cmd == "register") {
    if (argc < 8) return 1;
    const std::string kind       = argv[3];
    const auto        parameters = ParameterSet::FromJson(argv[5]);
    const auto        inputs     = Rest(argc, argv, 7);

    std::string id;
    if (kind == "generated") {
      id = registry.RegisterGenerated(inputs, argv[4], parameters, argv[6]);
    } else if (kind == "metadata") {
      id = registry.RegisterMetadata(inputs, argv[4], parameters, argv[6]);
    } else {
      std::cerr << "unsupported kind: " << kind << "\n";
      return 1;
    }
    std::cout << id << "\n";
    service.Save();
    return 0;
  }

  if (cmd == "lookup") {
    if (argc < 6) return 1;
    const auto outcome = service.LookupOrPlan(Rest(argc, argv, 5), argv[3], ParameterSet::FromJson(argv[4]));
    if (outcome.IsHit()) {
      std::cout << "hit " << outcome.id << " " << outcome.path << "\n";
    } else {
      std::cout << "miss " << outcome.id << " " << mediacache::cache::MissReasonName(outcome.reason) << "\n";
    }
    return 0;
  }

  if (cmd == "resolve") {
    if (argc < 4) return 1;
    std::cout << service.ResolveExisting(argv[3]) << "\n";
    return 0;
  }

  if (cmd == "dependents") {
    if (argc < 4) return 1;
    if (!registry.Contains(argv[3])) {
      throw mediacache::util::NotFound(std::string("unknown id: ") + argv[3]);
    }
    for (const auto& id : registry.DependentsOf(argv[3])) {
      std::cout << id << (registry.IsStale(id) ? " stale" : "") << "\n";
    }
    return 0;
  }

  if (cmd == "check-changes") {
    if (argc >= 4) {
      PrintDivergence(service.InvalidateSinceChange(argv[3]));
    } else {
      for (const auto& divergence : service.CheckSourceChanges()) {
        PrintDivergence(divergence);
      }
    }
    service.Save();
    return 0;
  }

  if (cmd == "rebuild") {
    const auto report = service.Rebuild();
    std::cout << "sources=" << report.registered_sources.size() << " generated=" << report.registered_generated.size()
              << " metadata=" << report.registered_metadata.size() << " already_registered=" << report.already_registered
              << " orphaned=" << report.orphaned.size() << "\n";
    for (const auto& orphan : report.orphaned) {
      std::cout << "  orphaned " << orphan.path << ": " << orphan.reason << "\n";
    }
    service.Save();
    return 0;
  }

  if (cmd == "integrity") {
    const auto report = service.CheckIntegrity();
    for (auto category : {FileCategory::kSource, FileCategory::kGenerated, FileCategory::kMetadata}) {
      for (const auto& id : report.Missing(category)) {
        std::cout << "missing " << mediacache::model::CategoryName(category) << " " << id << "\n";
      }
    }
    if (argc >= 4 && std::string(argv[3]) == "prune") {
      const auto pruned = deps.recovery->PruneMissing(report);
      const auto edges  = deps.recovery->RepairDependencies();
      std::cout << "pruned=" << pruned.size() << " dangling_edges=" << edges << "\n";
      service.Save();
    }
    return report.Clean() ? 0 : 3;
  }

  if (cmd == "cleanup") {
    const auto days    = argc >= 4 ? std::stoul(argv[3]) : config.cache().max_age_days();
    const auto removed = service.CleanupExpired(std::chrono::hours(24 * static_cast<long>(days)));
    for (const auto& id : removed) {
      std::cout << "removed " << id << "\n";
    }
    service.Save();
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    const int rc = Run(config_path, cmd, argc, argv);
    mediacache::observability::ShutdownLogging();
    return rc;
  } catch (const mediacache::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const mediacache::util::Conflict& e) {
    std::cerr << "conflict: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
  }
  mediacache::observability::ShutdownLogging();
  return 2;
}
