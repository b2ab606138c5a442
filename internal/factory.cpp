#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/audit/repository_audit_log.hpp"
#include "internal/config/portal_profiles.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/fanout_notification_sink.hpp"
#include "internal/notify/log_notification_sink.hpp"
#include "internal/packaging/document_converter.hpp"
#include "internal/packaging/form_registry.hpp"
#include "internal/packaging/package_assembler.hpp"
#include "internal/portal/portal_factory.hpp"
#include "internal/util/time.hpp"

#if BIDSUB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace bidsub::factory {

using namespace std::chrono_literals;
using bidsub::runtime::config::RuntimeConfig;

namespace {

constexpr auto kDefaultTickInterval = 1000ms;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BIDSUB_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->EnsureSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<packaging::DocumentConverter> BuildConverter(const RuntimeConfig& config) {
  std::vector<bidsub::v1::DocumentFormat> formats;
  for (const auto& name : config.converter().enabled_formats()) {
    auto format = bidsub::config::ParseDocumentFormat(name);
    if (!format) {
      throw std::invalid_argument("unknown document format in converter.enabled_formats: " + name);
    }
    formats.push_back(*format);
  }
  return packaging::DocumentConverter::WithFormats(formats);
}

std::shared_ptr<notify::NotificationSink> BuildNotificationChannels(const RuntimeConfig& config) {
  std::vector<std::shared_ptr<notify::NotificationSink>> sinks;

  const auto& channels = config.notifications().channels();
  if (channels.empty()) {
    sinks.push_back(std::make_shared<notify::LogNotificationSink>());
  }
  for (const auto& channel : channels) {
    if (channel == "log") {
      sinks.push_back(std::make_shared<notify::LogNotificationSink>());
    } else {
      throw std::invalid_argument("unsupported notification channel: " + channel);
    }
  }

  return std::make_shared<notify::FanoutNotificationSink>(std::move(sinks));
}

} // namespace

core::OrchestratorOptions BuildOrchestratorOptions(const bidsub::runtime::config::OrchestratorConfig& config) {
  core::OrchestratorOptions options;
  if (config.max_concurrent_submissions() > 0) {
    options.max_concurrent_submissions = config.max_concurrent_submissions();
  }
  if (config.default_max_retries() > 0) {
    options.default_max_retries = config.default_max_retries();
  }
  if (config.has_deadline_warning_window()) {
    options.deadline_warning_window = util::FromProto(config.deadline_warning_window());
  }
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.rfps       = std::make_shared<rfp::RepositoryRfpLookup>(app.repository);

  auto audit_log = std::make_shared<audit::RepositoryAuditLog>(app.repository);

  // ------------------------------------------------------------------
  // Packaging
  // ------------------------------------------------------------------
  auto converter = BuildConverter(config);
  auto forms     = packaging::FormRegistry::Standard();
  auto assembler = std::make_shared<packaging::PackageAssembler>(converter, forms);

  // ------------------------------------------------------------------
  // Portals
  // ------------------------------------------------------------------
  app.portals = portal::BuildPortalRegistry(config);
  for (const auto& name : app.portals->Names()) {
    const auto format = app.portals->Find(name)->requirements.required_format;
    if (!converter->Supports(format)) {
      throw std::invalid_argument("portal " + name + " requires format " + bidsub::config::DocumentFormatName(format) +
                                  " which is not enabled");
    }
  }

  // ------------------------------------------------------------------
  // Notifications
  // ------------------------------------------------------------------
  app.notifications = std::make_shared<notify::AsyncNotificationSink>(BuildNotificationChannels(config));

  // ------------------------------------------------------------------
  // Orchestrator
  // ------------------------------------------------------------------
  app.orchestrator = std::make_shared<core::SubmissionOrchestrator>(BuildOrchestratorOptions(config.orchestrator()), app.repository,
                                                                    app.rfps, app.portals, assembler, audit_log, app.notifications);
  app.orchestrator->Hydrate();

  auto tick_interval = config.orchestrator().has_tick_interval() ? util::FromProto(config.orchestrator().tick_interval())
                                                                 : std::chrono::milliseconds(kDefaultTickInterval);
  app.ticker = std::make_shared<runtime::QueueTicker>(app.orchestrator, tick_interval);

  return app;
}

} // namespace bidsub::factory
