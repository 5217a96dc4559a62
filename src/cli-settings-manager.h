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
#include <variant>
#include <unordered_map>
#include <optional>
#include <vector>
#include <set>
#include <iostream>
#include "app-error.h"
#include "string-helper.h"

namespace CliSettings {

    enum class ValueType { String, Int, Bool, PathExists };
    using Value = std::variant<std::string, int, bool>;
    using ValueMap = std::unordered_map<std::string, Value>;

    struct Definition {
        std::string description;
        bool isRequired;
        std::optional<Value> defaultValue;
        ValueType type;
    };

    /**
     * @brief Manages CLI parameters including types, validation and settings files.
     */
    class Manager {
    public:

        /**
         * @brief Registers a setting with its metadata.
         * @param name Parameter name, case-insensitive.
         * @param description Help text for this parameter.
         * @param isRequired True if input is mandatory and must be provided.
         * @param defaultValue Default value if not required.
         * @param type Expected value type and validation mode.
         */
        static void registerSetting(const std::string& name,
            const std::string& description,
            bool isRequired,
            std::optional<Value> defaultValue,
            ValueType type = ValueType::String);

        /**
         * @brief Prepends the settings of a --settingsfile=<file> argument to the arguments.
         *
         * The file contains one key=value pair per line, '#' starts a comment line.
         * Command line arguments follow the file settings and thus override them.
         * @param originalArgs Arguments including the program name.
         * @return Merged argument list, unchanged if there is no settings file.
         */
        static std::vector<std::string> mergeWithSettingsFile(const std::vector<std::string>& originalArgs);

        /**
         * @brief Parses CLI arguments in the format --name=value.
         * @param args Arguments including the program name at index 0.
         * @return false if --help was requested and the help text has been printed.
         * @throws AppError for unknown, malformed or missing required parameters.
         */
        static bool parseCommandLine(const std::vector<std::string>& args);

        /**
         * @brief Retrieves the typed value of a setting.
         * @tparam T Expected type: std::string, int or bool.
         * @param name Name of the parameter.
         * @return Typed value of the parameter.
         */
        template<typename T>
        static T get(const std::string& name) {
            const std::string key = to_lowercase(name);
            const Value* value = nullptr;
            if (auto it = values_.find(key); it != values_.end()) {
                value = &it->second;
            }
            else if (auto def = definitions_.find(key); def != definitions_.end() && def->second.defaultValue) {
                value = &*def->second.defaultValue;
            }
            if (value == nullptr) {
                throw AppError::make("Access to undefined setting: " + name);
            }
            if (!std::holds_alternative<T>(*value)) {
                throw AppError::make("Setting \"" + name + "\" accessed with the wrong type");
            }
            return std::get<T>(*value);
        }

        /**
         * @brief Checks whether a setting was given on the command line or in the settings file.
         */
        static bool isSet(const std::string& name) {
            return given_.contains(to_lowercase(name));
        }

        /**
         * @brief Removes all definitions and values.
         */
        static void clear() {
            values_.clear();
            definitions_.clear();
            given_.clear();
        }

        static void showHelp(std::ostream& out = std::cout);

    private:

        // "--name=value" split at the first '=', the name in lower case
        struct Argument {
            std::string name;
            std::optional<std::string> value;
        };

        /**
         * @return the parts of the argument or std::nullopt if it lacks the "--" prefix.
         */
        static std::optional<Argument> splitArgument(const std::string& raw);

        /**
         * Reads key=value lines and returns them as "--key=value" arguments.
         */
        static std::vector<std::string> readSettingsFile(const std::string& path);

        static void checkDefault(const std::string& name, const Value& value, ValueType type);

        /**
         * @brief Checks required settings and stores the defaults of the missing ones.
         */
        static void completeWithDefaults();

        static Value convert(const std::string& raw, const Argument& arg, const Definition& def);

        static inline ValueMap values_;
        static inline std::unordered_map<std::string, Definition> definitions_;
        static inline std::set<std::string> given_;
    };
}
