#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/submission_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/async_notification_sink.hpp"
#include "internal/portal/portal_registry.hpp"
#include "internal/rfp/repository_rfp_lookup.hpp"
#include "internal/runtime/queue_ticker.hpp"

namespace bidsub::factory {

/*
  Application

  Owns all long-lived singletons used by the daemon and the CLI.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<rfp::RepositoryRfpLookup>     rfps;
  std::shared_ptr<portal::PortalRegistry>       portals;
  std::shared_ptr<notify::AsyncNotificationSink> notifications;

  std::shared_ptr<core::SubmissionOrchestrator> orchestrator;
  std::shared_ptr<runtime::QueueTicker>         ticker;
};

core::OrchestratorOptions BuildOrchestratorOptions(const bidsub::runtime::config::OrchestratorConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config and hydrates the
  orchestrator from the job store. Neither workers nor ticker are started.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const bidsub::runtime::config::RuntimeConfig& config);

} // namespace bidsub::factory
