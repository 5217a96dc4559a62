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
#include "cli-settings-manager.h"

#include <iomanip>
#include <sstream>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <map>

namespace CliSettings
{
    namespace
    {
        constexpr std::string_view SETTINGS_FILE_OPTION = "--settingsfile=";

        std::string typeName(ValueType type)
        {
            switch (type)
            {
            case ValueType::Int:
                return "int";
            case ValueType::Bool:
                return "bool";
            case ValueType::PathExists:
                return "path";
            case ValueType::String:
                break;
            }
            return "string";
        }

        bool isEmptyString(const Value &value)
        {
            return std::holds_alternative<std::string>(value) && std::get<std::string>(value).empty();
        }
    }

    void Manager::registerSetting(const std::string &name,
                                  const std::string &description,
                                  bool isRequired,
                                  std::optional<Value> defaultValue,
                                  ValueType type)
    {
        if (defaultValue)
        {
            checkDefault(name, *defaultValue, type);
        }
        definitions_[to_lowercase(name)] = {description, isRequired, std::move(defaultValue), type};
    }

    void Manager::checkDefault(const std::string &name, const Value &value, ValueType type)
    {
        bool matches = false;
        switch (type)
        {
        case ValueType::String:
            matches = std::holds_alternative<std::string>(value);
            break;
        case ValueType::Int:
            matches = std::holds_alternative<int>(value);
            break;
        case ValueType::Bool:
            matches = std::holds_alternative<bool>(value);
            break;
        case ValueType::PathExists:
            // no file system check for defaults, only "not given" is allowed
            matches = isEmptyString(value);
            break;
        }
        if (!matches)
        {
            throw AppError::make("Default value for setting \"" + name + "\" does not match its type " +
                                 typeName(type));
        }
    }

    std::vector<std::string> Manager::mergeWithSettingsFile(const std::vector<std::string> &originalArgs)
    {
        if (originalArgs.empty())
        {
            return originalArgs;
        }
        std::vector<std::string> commandLine;
        std::optional<std::string> settingsFile;
        for (size_t i = 1; i < originalArgs.size(); ++i)
        {
            const std::string &arg = originalArgs[i];
            if (!settingsFile && arg.starts_with(SETTINGS_FILE_OPTION))
            {
                settingsFile = arg.substr(SETTINGS_FILE_OPTION.size());
            }
            else if (!arg.starts_with(SETTINGS_FILE_OPTION))
            {
                commandLine.push_back(arg);
            }
        }
        if (!settingsFile)
        {
            return originalArgs;
        }

        std::vector<std::string> merged{originalArgs[0]};
        for (auto &arg : readSettingsFile(*settingsFile))
        {
            merged.push_back(std::move(arg));
        }
        merged.insert(merged.end(), commandLine.begin(), commandLine.end());
        return merged;
    }

    std::vector<std::string> Manager::readSettingsFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file)
        {
            throw AppError::makeInvalidParameters("Failed to open settings file: " + path);
        }
        std::vector<std::string> args;
        std::string line;
        for (int lineNumber = 1; std::getline(file, line); ++lineNumber)
        {
            line = trim(line);
            if (line.empty() || line.starts_with('#'))
            {
                continue;
            }
            auto keyValue = parseKeyValue(line);
            if (!keyValue)
            {
                throw AppError::makeInvalidParameters(path + ":" + std::to_string(lineNumber) + ": \"" + line +
                                                      "\" is not of the form key=value");
            }
            args.push_back("--" + keyValue->first + "=" + keyValue->second);
        }
        return args;
    }

    std::optional<Manager::Argument> Manager::splitArgument(const std::string &raw)
    {
        if (!raw.starts_with("--"))
        {
            return std::nullopt;
        }
        std::string_view body = std::string_view(raw).substr(2);
        auto separator = body.find('=');
        if (separator == std::string_view::npos)
        {
            return Argument{to_lowercase(std::string(body)), std::nullopt};
        }
        return Argument{to_lowercase(std::string(body.substr(0, separator))), std::string(body.substr(separator + 1))};
    }

    bool Manager::parseCommandLine(const std::vector<std::string> &args)
    {
        values_.clear();
        given_.clear();
        for (size_t index = 1; index < args.size(); ++index)
        {
            const std::string &raw = args[index];
            if (raw == "--help")
            {
                showHelp();
                return false;
            }
            auto arg = splitArgument(raw);
            if (!arg)
            {
                throw AppError::makeInvalidParameters("\"" + raw + "\" must start with \"--\"");
            }
            auto def = definitions_.find(arg->name);
            if (def == definitions_.end())
            {
                throw AppError::makeInvalidParameters("\"" + arg->name + "\" is not a valid parameter");
            }
            values_[arg->name] = convert(raw, *arg, def->second);
            given_.insert(arg->name);
        }
        completeWithDefaults();
        return true;
    }

    void Manager::completeWithDefaults()
    {
        for (const auto &[key, def] : definitions_)
        {
            if (given_.contains(key))
            {
                continue;
            }
            if (def.isRequired)
            {
                throw AppError::makeInvalidParameters("Missing required parameter \"--" + key + "\"");
            }
            if (def.defaultValue)
            {
                values_[key] = *def.defaultValue;
            }
        }
    }

    Value Manager::convert(const std::string &raw, const Argument &arg, const Definition &def)
    {
        if (def.type == ValueType::Bool)
        {
            // a bare flag switches the setting on
            const std::string flag = arg.value ? to_lowercase(*arg.value) : "true";
            if (flag == "true" || flag == "1")
            {
                return true;
            }
            if (flag == "false" || flag == "0")
            {
                return false;
            }
            throw AppError::makeInvalidParameters("\"" + raw + "\" is invalid: expected true, false, 1 or 0");
        }
        if (!arg.value)
        {
            throw AppError::makeInvalidParameters("Missing value for \"" + raw + "\"");
        }
        const std::string &text = *arg.value;
        switch (def.type)
        {
        case ValueType::Int:
            if (auto number = parseInteger(text))
            {
                return *number;
            }
            throw AppError::makeInvalidParameters("\"" + raw + "\" is invalid: expected integer");
        case ValueType::PathExists:
            if (!std::filesystem::exists(text))
            {
                throw AppError::makeInvalidParameters("The path in \"" + raw + "\" does not exist");
            }
            return text;
        default:
            return text;
        }
    }

    void Manager::showHelp(std::ostream &out)
    {
        constexpr int NAME_WIDTH = 30;

        // std::map for a stable order
        const std::map<std::string, Definition> sorted(definitions_.begin(), definitions_.end());
        out << "Available options:\n";
        for (const auto &[key, def] : sorted)
        {
            out << std::left << std::setw(NAME_WIDTH) << ("  --" + key + "=<" + typeName(def.type) + ">")
                << def.description;
            if (def.isRequired)
            {
                out << " [required]";
            }
            else if (def.defaultValue && !isEmptyString(*def.defaultValue))
            {
                out << " (default: ";
                std::visit([&out](const auto &value) { out << value; }, *def.defaultValue);
                out << ")";
            }
            out << "\n";
        }
        out << std::left << std::setw(NAME_WIDTH) << "  --settingsfile=<path>"
            << "File with one key=value setting per line\n";
    }
}
