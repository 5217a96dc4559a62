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

#include <string>

/**
 * @brief Lifecycle state of the engine subprocess.
 *
 * NotStarted -> Handshaking -> Ready <-> Busy. Every state except NotStarted
 * moves to Crashed when the process exits unexpectedly. Crashed returns to
 * NotStarted only through an explicit initialize().
 */
enum class EngineState {
    NotStarted,
    Handshaking,
    Ready,
    Busy,
    Terminating,
    Crashed
};

inline std::string to_string(EngineState state) {
    switch (state) {
    case EngineState::NotStarted: return "not-started";
    case EngineState::Handshaking: return "handshaking";
    case EngineState::Ready: return "ready";
    case EngineState::Busy: return "busy";
    case EngineState::Terminating: return "terminating";
    case EngineState::Crashed: return "crashed";
    }
    return "unknown";
}
