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

#include "engine-service.h"

#include <stdexcept>

#include "engine-errors.h"
#include "logger.h"

EngineService::EngineService(EngineManagerConfig managerConfig, EngineServiceConfig serviceConfig,
    const RulesEngine& rules)
    : config_(std::move(serviceConfig)), rules_(rules), manager_(std::move(managerConfig))
{
}

EngineService::EngineService(EngineManagerConfig managerConfig, EngineServiceConfig serviceConfig,
    const RulesEngine& rules, EngineConnectionFactory factory)
    : config_(std::move(serviceConfig)), rules_(rules), manager_(std::move(managerConfig), std::move(factory))
{
}

void EngineService::checkAccepting() const {
    if (!manager_.isReady()) {
        throw EngineNotReadyError();
    }
    if (config_.maxQueueDepth == 0) {
        return;
    }
    size_t waiting = manager_.getBroker().getQueueDepth();
    if (waiting >= config_.maxQueueDepth) {
        Logger::serviceLogger().log("Rejecting request, " + std::to_string(waiting) + " requests waiting",
            TraceLevel::warning);
        throw EngineBusyRejection(waiting);
    }
}

AnalysisResult EngineService::requestAnalysis(const std::string& fen, std::optional<int> depth,
    std::optional<std::chrono::milliseconds> timeout) {
    checkAccepting();
    AnalysisRequest request(manager_, rules_, fen,
        depth.value_or(config_.analysisDepth), timeout.value_or(config_.analysisTimeout));
    return request.run();
}

BestMoveResult EngineService::requestBestMove(const std::string& fen, int skillLevel) {
    if (skillLevel < BestMoveRequest::MIN_SKILL_LEVEL || skillLevel > BestMoveRequest::MAX_SKILL_LEVEL) {
        throw std::invalid_argument("Invalid skill level " + std::to_string(skillLevel) + ". Must be between "
            + std::to_string(BestMoveRequest::MIN_SKILL_LEVEL) + " and "
            + std::to_string(BestMoveRequest::MAX_SKILL_LEVEL) + ".");
    }
    checkAccepting();
    BestMoveRequest request(manager_, fen, skillLevel);
    return request.run();
}
