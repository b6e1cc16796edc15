#pragma once

/// @file duel.hpp
/// @brief Convenience header pulling in the public duel engine API.

#include "duel/version.hpp"

#include "duel/core/result.hpp"

#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/error_code.hpp"
#include "duel/foundation/game_error.hpp"
#include "duel/foundation/game_logger.hpp"
#include "duel/foundation/game_result.hpp"
#include "duel/foundation/game_serializer.hpp"
#include "duel/foundation/job_scheduler.hpp"
#include "duel/foundation/signal.hpp"
#include "duel/foundation/types.hpp"

#include "duel/game/duel_round.hpp"
#include "duel/game/duel_types.hpp"
#include "duel/game/modifier_resolver.hpp"
#include "duel/game/random_source.hpp"
#include "duel/game/roll_generator.hpp"
#include "duel/game/round_scorer.hpp"
#include "duel/game/style_catalog.hpp"

#include "duel/service/deadline_ticker.hpp"
#include "duel/service/duel_server.hpp"
#include "duel/service/notification_dispatcher.hpp"
#include "duel/service/server_config.hpp"
#include "duel/service/server_types.hpp"
#include "duel/service/stat_provider.hpp"
