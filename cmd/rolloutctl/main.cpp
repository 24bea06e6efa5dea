#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "rollout/manager/v1.hpp"

using namespace rollout::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rolloutctl <addr> upgrade <version> [--strategy=parallel-cutover|sequential-replace] [--dry-run]\n"
            << "                                      [--skip-backup] [--no-verify] [--timeout=<seconds>]\n"
            << "  rolloutctl <addr> rollback [session_id]\n"
            << "  rolloutctl <addr> status [session_id] [--json]\n"
            << "  rolloutctl <addr> abort <session_id>\n"
            << "  rolloutctl <addr> list [--active]\n"
            << "  rolloutctl <addr> prune [keep]\n"
            << "  rolloutctl <addr> backups [store_id]\n";
}

static std::string Stamp(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() == 0 && ts.nanos() == 0) return "-";
  return rollout::util::CompactStamp(rollout::util::FromProto(ts));
}

static void PrintSession(const UpdateSession& session) {
  std::cout << "session=" << session.session_id() << "\n"
            << "target=" << session.deployment_target() << "\n"
            << "strategy=" << rollout::model::StrategyName(session.strategy()) << "\n"
            << "version=" << (session.source_version().empty() ? "(none)" : session.source_version()) << " -> "
            << session.target_version() << "\n"
            << "phase=" << rollout::model::PhaseName(session.phase()) << (session.dry_run() ? " (dry run)" : "") << "\n";
  if (!session.failure_reason().empty()) {
    std::cout << "failure=" << session.failure_reason() << "\n";
  }
  for (const auto& record : session.phase_history()) {
    std::cout << "  " << Stamp(record.started_at()) << " " << Stamp(record.finished_at()) << " "
              << rollout::model::PhaseName(record.phase()) << " " << rollout::model::OutcomeName(record.outcome());
    if (!record.detail().empty()) std::cout << " " << record.detail();
    std::cout << "\n";
  }
}

// 0 completed, 3 rolled back, 4 failed, 5 manual intervention required.
static int PrintOutcome(const UpgradeResponse& resp) {
  PrintSession(resp.session());
  for (const auto& step : resp.plan()) {
    std::cout << "plan: " << step << "\n";
  }
  std::cout << resp.message() << "\n";

  if (resp.manual_intervention_required()) return 5;
  switch (resp.outcome()) {
    case TERMINAL_OUTCOME_COMPLETED:
      return 0;
    case TERMINAL_OUTCOME_ROLLED_BACK:
      return 3;
    default:
      return 4;
  }
}

static bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = UpdateService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "upgrade") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    UpgradeRequest req;
    req.set_target_version(argv[3]);

    for (int i = 4; i < argc; ++i) {
      const std::string arg = argv[i];
      if (StartsWith(arg, "--strategy=")) {
        auto strategy = rollout::model::ParseStrategy(arg.substr(11));
        if (!strategy) {
          std::cerr << "unsupported strategy: " << arg.substr(11) << "\n";
          return 1;
        }
        req.set_strategy(*strategy);
      } else if (arg == "--dry-run") {
        req.set_dry_run(true);
      } else if (arg == "--skip-backup") {
        req.set_skip_backup(true);
      } else if (arg == "--no-verify") {
        req.set_verify_signatures(false);
      } else if (StartsWith(arg, "--timeout=")) {
        req.set_timeout_seconds(static_cast<std::uint32_t>(std::stoul(arg.substr(10))));
      } else {
        std::cerr << "unknown option: " << arg << "\n";
        return 1;
      }
    }

    UpgradeResponse resp;

    auto status = stub->Upgrade(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    return PrintOutcome(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "rollback") {
    RollbackRequest req;
    if (argc >= 4) req.set_session_id(argv[3]);

    UpgradeResponse resp;

    auto status = stub->Rollback(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    return PrintOutcome(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    StatusRequest req;
    bool          json = false;
    for (int i = 3; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--json") {
        json = true;
      } else {
        req.set_session_id(arg);
      }
    }

    StatusResponse resp;

    auto status = stub->Status(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    if (json) {
      std::cout << rollout::util::ToJson(resp) << "\n";
      return 0;
    }

    if (!resp.session().session_id().empty()) {
      PrintSession(resp.session());
    } else {
      std::cout << "no sessions\n";
    }
    for (const auto& unit : resp.units()) {
      std::cout << "unit=" << unit.identity() << " version=" << unit.current_version()
                << " generation=" << unit.generation() << (unit.live() ? " live" : "")
                << (unit.health_status() == HEALTH_HEALTHY ? " healthy" : " not-healthy") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "abort") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    AbortRequest req;
    req.set_session_id(argv[3]);

    AbortResponse resp;

    auto status = stub->Abort(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << (resp.accepted() ? "abort requested" : "session is not running") << "\n";
    return resp.accepted() ? 0 : 4;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListSessionsRequest req;
    req.set_active_only(argc >= 4 && std::string(argv[3]) == "--active");

    ListSessionsResponse resp;

    auto status = stub->ListSessions(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& session : resp.sessions()) {
      std::cout << session.session_id() << " " << Stamp(session.started_at()) << " "
                << rollout::model::PhaseName(session.phase()) << " " << session.source_version() << " -> "
                << session.target_version() << (session.dry_run() ? " (dry run)" : "") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "prune") {
    PruneRequest req;
    if (argc >= 4) req.set_keep(static_cast<std::uint32_t>(std::stoul(argv[3])));

    PruneResponse resp;

    auto status = stub->Prune(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "removed=" << resp.removed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "backups") {
    ListBackupsRequest req;
    if (argc >= 4) req.set_store_id(argv[3]);

    ListBackupsResponse resp;

    auto status = stub->ListBackups(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& backup : resp.backups()) {
      std::cout << backup.backup_id() << " store=" << backup.store_id() << " size=" << backup.size_bytes()
                << " sha256=" << backup.sha256() << " " << backup.location() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
