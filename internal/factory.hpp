#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"

namespace assetdb::factory {

/*
  BuildRepository

  Selects the backend named by the config and brings its schema up to
  date. No database section means the in-memory backend.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const assetdb::runtime::config::RuntimeConfig& config);

} // namespace assetdb::factory
