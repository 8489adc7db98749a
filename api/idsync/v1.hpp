#pragma once

#include "config/config.pb.h"

#include "internal/model/entity_type.hpp"
#include "internal/model/record.hpp"
#include "internal/model/result_table.hpp"
#include "internal/model/syncable_content.hpp"
#include "internal/model/value.hpp"

#include "internal/similarity/similarity.hpp"
#include "internal/similarity/text_normalize.hpp"

#include "internal/strategy/stage.hpp"
#include "internal/strategy/stage_runner.hpp"
#include "internal/strategy/strategies.hpp"

#include "internal/engine/sync_engine.hpp"

#include "internal/batch/batch_runner.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/interop/arrow_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace idsync::v1 {
using namespace ::idsync::model;
using namespace ::idsync::engine;
using ::idsync::batch::BatchRunner;
using ::idsync::batch::GroupResult;
using ::idsync::batch::SyncGroup;
using ::idsync::config::ConfigLoader;
using ::idsync::util::ConfigurationError;
using ::idsync::util::MissingColumn;
} // namespace idsync::v1
