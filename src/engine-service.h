/**
 * @license
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.

 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.

 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 * @author Volker Böhm
 * @copyright Copyright (c) 2025 Volker Böhm
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "analysis-request.h"
#include "bestmove-request.h"
#include "engine-config.h"
#include "engine-manager.h"
#include "engine-state.h"

class RulesEngine;

/**
 * @brief Entry point for callers that need analyses or moves from the shared engine.
 *
 * Owns the EngineManager; every request runs in the calling thread and is serialized
 * by the session broker. May be called from any number of threads.
 */
class EngineService {
public:
    EngineService(EngineManagerConfig managerConfig, EngineServiceConfig serviceConfig,
        const RulesEngine& rules);

    /**
     * @brief Creates the service with a custom engine connection, e.g. an in-memory engine.
     */
    EngineService(EngineManagerConfig managerConfig, EngineServiceConfig serviceConfig,
        const RulesEngine& rules, EngineConnectionFactory factory);

    void initialize() {
        manager_.initialize();
    }

    void shutdown() {
        manager_.shutdown();
    }

    bool isReady() const {
        return manager_.isReady();
    }

    EngineState getState() const {
        return manager_.getState();
    }

    size_t getQueueDepth() const {
        return manager_.getBroker().getQueueDepth();
    }

    /**
     * @brief Ranked analysis of up to three moves, each tagged with whether it mates.
     * @param depth Search depth, the configured default if not given.
     * @param timeout Overall time limit including the wait for the engine, the configured default if not given.
     * @throws InvalidPositionError, EngineTimeoutError, EngineCrashError, EngineShutdownError,
     *         EngineNotReadyError, EngineBusyRejection
     */
    AnalysisResult requestAnalysis(const std::string& fen, std::optional<int> depth = std::nullopt,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief The engine's move at the given skill level.
     * @throws std::invalid_argument if the skill level is outside [0, 20].
     * @throws EngineTimeoutError, EngineCrashError, EngineShutdownError,
     *         EngineNotReadyError, EngineBusyRejection
     */
    BestMoveResult requestBestMove(const std::string& fen, int skillLevel);

private:
    void checkAccepting() const;

    EngineServiceConfig config_;
    const RulesEngine& rules_;
    EngineManager manager_;
};
