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

#include <stdexcept>
#include <string>

/**
 * Process exit codes of the engine-broker command line driver.
 */
enum class AppReturnCode {
    NoError = 0,
    GeneralError = 1,
    InvalidParameters = 2,
    EngineError = 10,
    EngineCrashed = 11
};

 /**
  * Represents an application error of the command line driver with an optional hint for the user.
  */
class AppError : public std::runtime_error {
public:

    AppReturnCode getReturnCode() const noexcept { return returnCode; }
    const std::string& getUserHint() const noexcept { return userHint; }

	/**
	 * Creates an AppError with the general error return code.
	 * @param externalText The error message to display to the user.
	 */
    static AppError make(const std::string& externalText) {
        return AppError(AppReturnCode::GeneralError, externalText, {});
    }

	/**
	 * Creates an AppError with a specific return code.
	 * @param returnCode The return code for the application.
	 * @param externalText The error message to display to the user.
	 */
    static AppError make(AppReturnCode returnCode, const std::string& externalText) {
        return AppError(returnCode, externalText, {});
    }

    /**
     * Creates an AppError indicating invalid or missing parameters.
     * @param externalText The error message to display to the user.
     */
    static AppError makeInvalidParameters(const std::string& externalText) {
        return AppError(AppReturnCode::InvalidParameters, externalText,
            "Use --help to display all supported parameters.");
    }

private:

    AppError(AppReturnCode returnCode, const std::string& externalText, const std::string& userHint)
        : std::runtime_error(userHint.empty() ? externalText : externalText + "\nHint: " + userHint),
        returnCode(returnCode),
        userHint(userHint) {
    }
    AppReturnCode returnCode;
    std::string userHint;
};
