/// @file server_config.cpp
/// @brief buildServiceSettings implementation.

#include "duel/service/server_config.hpp"

namespace duel::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameResult<DuelServiceSettings> invalid(const std::string& what) {
    return GameResult<DuelServiceSettings>::err(
        GameError(ErrorCode::InvalidArgument, "invalid configuration: " + what));
}

} // namespace

GameResult<DuelServiceSettings> buildServiceSettings(const foundation::ConfigManager& config) {
    DuelServiceSettings settings;
    auto& rules = settings.server.rules;

    auto styleLock = config.getIfPresent<double>("duel.style_lock_seconds", 10.0);
    if (!styleLock) {
        return GameResult<DuelServiceSettings>::err(styleLock.error());
    }
    auto swingPhase = config.getIfPresent<double>("duel.swing_phase_seconds", 30.0);
    if (!swingPhase) {
        return GameResult<DuelServiceSettings>::err(swingPhase.error());
    }
    if (styleLock.value() <= 0.0 || swingPhase.value() <= 0.0) {
        return invalid("phase durations must be positive");
    }
    rules.timings.styleLock =
        std::chrono::milliseconds(static_cast<int64_t>(styleLock.value() * 1000.0));
    rules.timings.swingPhase =
        std::chrono::milliseconds(static_cast<int64_t>(swingPhase.value() * 1000.0));

    auto maxRounds = config.getIfPresent<int64_t>("duel.max_rounds", 0);
    if (!maxRounds) {
        return GameResult<DuelServiceSettings>::err(maxRounds.error());
    }
    if (maxRounds.value() < 0) {
        return invalid("duel.max_rounds must not be negative");
    }
    rules.maxRounds = static_cast<uint32_t>(maxRounds.value());

    auto barStart = config.getIfPresent<double>("duel.control_bar.start", 50.0);
    if (!barStart) {
        return GameResult<DuelServiceSettings>::err(barStart.error());
    }
    rules.controlBarStart = barStart.value();
    if (!(rules.controlBarStart > kControlBarMin && rules.controlBarStart < kControlBarMax)) {
        return invalid("duel.control_bar.start must lie strictly between 0 and 100");
    }

    auto curve = game::PushCurve::fromConfig(config);
    if (!curve) {
        return GameResult<DuelServiceSettings>::err(curve.error());
    }
    settings.server.pushCurve = curve.value();

    auto tickerHz = config.getIfPresent<int64_t>("duel.ticker_hz", 10);
    if (!tickerHz) {
        return GameResult<DuelServiceSettings>::err(tickerHz.error());
    }
    if (tickerHz.value() <= 0 || tickerHz.value() > 1000) {
        return invalid("duel.ticker_hz must be within 1..1000");
    }
    settings.tickerHz = static_cast<uint32_t>(tickerHz.value());

    auto threads = config.getIfPresent<int64_t>("duel.broadcast_threads", 2);
    if (!threads) {
        return GameResult<DuelServiceSettings>::err(threads.error());
    }
    if (threads.value() <= 0) {
        return invalid("duel.broadcast_threads must be positive");
    }
    settings.broadcastThreads = static_cast<std::size_t>(threads.value());

    return GameResult<DuelServiceSettings>::ok(std::move(settings));
}

} // namespace duel::service
